#pragma once

#include "httplib.h"
#include "server/service.hpp"

namespace scriptbox::server {

// Binds every HTTP route to `service`. The service must outlive the server.
void RegisterRoutes(httplib::Server& server, Service& service);

// 200 for success, 400 for caller errors, 500 for failed executions.
int HttpStatusFor(const nlohmann::json& envelope);

}  // namespace scriptbox::server

#include "server/http_server.hpp"

#include <string>

#include "sandbox/execution_result.hpp"
#include "utils/logging.hpp"

namespace scriptbox::server {
namespace {

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(sandbox::DumpJson(body), "application/json");
}

// Empty bodies count as {}; anything else must be a JSON object.
bool ParseBody(const httplib::Request& req, httplib::Response& res, nlohmann::json& body) {
    if (req.body.empty()) {
        body = nlohmann::json::object();
        return true;
    }
    body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        SendJson(res, 400, {
            {"status", "error"},
            {"error", "Request body must be a JSON object"},
            {"error_type", sandbox::ToString(sandbox::ErrorKind::kValidation)}
        });
        return false;
    }
    return true;
}

std::string QueryParam(const httplib::Request& req, const char* key) {
    return req.has_param(key) ? req.get_param_value(key) : std::string();
}

nlohmann::json OptionalString(const std::string& value) {
    return value.empty() ? nlohmann::json(nullptr) : nlohmann::json(value);
}

}  // namespace

int HttpStatusFor(const nlohmann::json& envelope) {
    const auto error_type = envelope.value("error_type", std::string());
    if (error_type.empty() || error_type == "none") {
        return 200;
    }
    if (error_type == sandbox::ToString(sandbox::ErrorKind::kValidation) ||
        error_type == sandbox::ToString(sandbox::ErrorKind::kSecurityViolation)) {
        return 400;
    }
    return 500;
}

void RegisterRoutes(httplib::Server& server, Service& service) {
    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        utils::Log(utils::LogLevel::kInfo, "http", "request",
                   {{"method", req.method}, {"path", req.path}, {"status", std::to_string(res.status)}});
    });
    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& ex) {
            message = ex.what();
        }
        utils::Log(utils::LogLevel::kError, "http", "handler failed",
                   {{"path", req.path}, {"error", message}});
        SendJson(res, 500, {
            {"status", "error"},
            {"error", message},
            {"error_type", sandbox::ToString(sandbox::ErrorKind::kInternal)}
        });
    });

    server.Get("/health", [&service](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, service.Health());
    });

    server.Get("/info", [&service](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, service.Info());
    });

    server.Get("/tools", [&service](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, {{"tools", service.Tools().GetDefinitions()}});
    });

    server.Post(R"(/tools/([A-Za-z0-9_]+))", [&service](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!ParseBody(req, res, body)) {
            return;
        }
        const std::string name = req.matches[1];
        if (!service.Tools().Has(name)) {
            SendJson(res, 404, {{"error", "Unknown tool: " + name}});
            return;
        }
        const auto& arguments = body.contains("arguments") && body["arguments"].is_object()
                                    ? body["arguments"]
                                    : body;
        const auto result = service.Tools().Execute(name, arguments);
        SendJson(res, HttpStatusFor(result), result);
    });

    server.Post("/validate_script", [&service](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!ParseBody(req, res, body)) {
            return;
        }
        const auto script = body.value("script_content", std::string());
        const auto language = body.value("language", std::string("python"));
        SendJson(res, 200, service.Runner().Validate(script, language).ToJson());
    });

    server.Post("/process_task", [&service](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!ParseBody(req, res, body)) {
            return;
        }
        const auto response = service.Tasks().Process(body);
        SendJson(res, response.http_status, response.body);
    });

    server.Get("/scripts", [&service](const httplib::Request& req, httplib::Response& res) {
        const auto category = QueryParam(req, "category");
        const auto source_type = QueryParam(req, "source_type");
        nlohmann::json scripts = nlohmann::json::array();
        for (const auto& entry : service.Registry().List(category, source_type)) {
            scripts.push_back(registry::ToSummaryJson(entry));
        }
        SendJson(res, 200, {
            {"scripts", scripts},
            {"total_count", scripts.size()},
            {"filters_applied", {
                {"category", OptionalString(category)},
                {"source_type", OptionalString(source_type)}
            }}
        });
    });

    server.Get(R"(/scripts/([^/]+)/schema)", [&service](const httplib::Request& req, httplib::Response& res) {
        const auto schema = service.Registry().GetSchema(req.matches[1]);
        SendJson(res, schema.contains("error") ? 404 : 200, schema);
    });

    server.Get(R"(/scripts/([^/]+))", [&service](const httplib::Request& req, httplib::Response& res) {
        const std::string id = req.matches[1];
        const auto entry = service.Registry().Get(id);
        if (!entry) {
            SendJson(res, 404, {{"error", "Script '" + id + "' not found"}});
            return;
        }
        auto details = entry->raw;
        details["id"] = entry->id;
        SendJson(res, 200, details);
    });

    server.Post("/execute", [&service](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!ParseBody(req, res, body)) {
            return;
        }
        const auto script_id = body.value("script_id", std::string());
        if (script_id.empty()) {
            SendJson(res, 400, registry::MakeErrorOutcome(sandbox::ErrorKind::kValidation,
                                                          "script_id is required").ToJson());
            return;
        }
        if (!service.Registry().Get(script_id)) {
            SendJson(res, 404, registry::MakeErrorOutcome(sandbox::ErrorKind::kValidation,
                                                          "Script " + script_id + " not found",
                                                          script_id).ToJson());
            return;
        }
        nlohmann::json input_data = nlohmann::json::object();
        if (body.contains("input_data") && body["input_data"].is_object()) {
            input_data = body["input_data"];
        }
        if (body.contains("context_metadata") && body["context_metadata"].is_object() &&
            !body["context_metadata"].empty()) {
            input_data["context_metadata"] = body["context_metadata"];
        }
        const auto outcome = service.Registry().Execute(script_id, input_data);
        SendJson(res, HttpStatusFor(outcome.ToJson()), outcome.ToJson());
    });

    server.Post("/validate", [&service](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!ParseBody(req, res, body)) {
            return;
        }
        const auto script_id = body.value("script_id", QueryParam(req, "script_id"));
        nlohmann::json input_data = nlohmann::json::object();
        if (body.contains("input_data")) {
            input_data = body["input_data"];
        }
        const auto validation = service.Registry().ValidateInput(script_id, input_data);
        SendJson(res, 200, {{"script_id", script_id}, {"validation", validation.ToJson()}});
    });

    server.Get("/statistics", [&service](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, {
            {"service_info", {
                {"status", "running"},
                {"version", kServiceVersion},
                {"service_name", kServiceName}
            }},
            {"registry_statistics", service.Registry().Statistics()}
        });
    });

    server.Get("/categories", [&service](const httplib::Request&, httplib::Response& res) {
        const auto stats = service.Registry().Statistics();
        nlohmann::json names = nlohmann::json::array();
        for (const auto& item : stats["categories"].items()) {
            names.push_back(item.key());
        }
        SendJson(res, 200, {{"categories", names}, {"category_counts", stats["categories"]}});
    });

    server.Get("/source-types", [&service](const httplib::Request&, httplib::Response& res) {
        const auto stats = service.Registry().Statistics();
        nlohmann::json names = nlohmann::json::array();
        for (const auto& item : stats["source_types"].items()) {
            names.push_back(item.key());
        }
        SendJson(res, 200, {{"source_types", names}, {"source_type_counts", stats["source_types"]}});
    });

    server.Post("/reload", [&service](const httplib::Request&, httplib::Response& res) {
        const bool loaded = service.Registry().Reload();
        SendJson(res, loaded ? 200 : 500, {
            {"status", loaded ? "success" : "error"},
            {"scripts_loaded", service.Registry().Size()}
        });
    });
}

}  // namespace scriptbox::server

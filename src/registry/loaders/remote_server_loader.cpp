#include "registry/loaders/remote_server_loader.hpp"

#include <algorithm>

#include "httplib.h"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace scriptbox::registry {

RemoteServerLoader::RemoteServerLoader(int default_timeout_s)
    : default_timeout_s_(default_timeout_s) {}

ScriptOutcome RemoteServerLoader::LoadAndRun(const ScriptRegistryEntry& entry,
                                             const nlohmann::json& input_data) const {
    const auto& server_url = entry.source_location;
    const auto parsed = utils::ParseUrl(server_url);
    if (!parsed.valid) {
        return MakeErrorOutcome(sandbox::ErrorKind::kSourceFetch,
                                "Remote server connection failed: invalid url " + server_url, entry.id);
    }

    const int timeout_s = std::max(1, entry.raw.contains("timeout") && entry.raw["timeout"].is_number() ? entry.timeout_s : default_timeout_s_);
    const nlohmann::json payload = {
        {"script_id", entry.id},
        {"input_data", input_data},
        {"execution_type", entry.execution_type}
    };

    httplib::Client client(parsed.SchemeHostPort());
    client.set_connection_timeout(timeout_s);
    client.set_read_timeout(timeout_s);
    client.set_write_timeout(timeout_s);

    utils::Log(utils::LogLevel::kInfo, "registry", "remote dispatch",
               {{"script_id", entry.id}, {"url", server_url}});
    auto response = client.Post(parsed.path, sandbox::DumpJson(payload, -1), "application/json");
    if (!response) {
        return MakeErrorOutcome(sandbox::ErrorKind::kSourceFetch,
                                "Remote server connection failed: " + httplib::to_string(response.error()),
                                entry.id);
    }
    if (response->status < 200 || response->status >= 300) {
        auto outcome = MakeErrorOutcome(sandbox::ErrorKind::kSourceFetch,
                                        "Remote server error: " + std::to_string(response->status),
                                        entry.id);
        outcome.result["response_text"] = response->body;
        outcome.execution_metadata["remote_server"] = server_url;
        return outcome;
    }

    auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded()) {
        auto outcome = MakeErrorOutcome(sandbox::ErrorKind::kSourceFetch,
                                        "Remote server returned invalid JSON", entry.id);
        outcome.result["response_text"] = response->body;
        return outcome;
    }

    ScriptOutcome outcome{};
    outcome.success = true;
    outcome.script_id = entry.id;
    if (body.is_object()) {
        outcome.result = std::move(body);
    } else {
        outcome.result["result"] = std::move(body);
    }
    outcome.result["status"] = "success";
    outcome.execution_metadata["remote_server"] = server_url;
    return outcome;
}

}  // namespace scriptbox::registry

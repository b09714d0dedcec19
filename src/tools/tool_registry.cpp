#include "tools/tool_registry.hpp"

#include <utility>

#include "registry/input_validator.hpp"
#include "sandbox/execution_result.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scriptbox::tools {

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    tools_.emplace(std::move(name), std::move(tool));
}

Tool* ToolRegistry::Get(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

nlohmann::json ToolRegistry::GetDefinitions() const {
    auto defs = nlohmann::json::array();
    for (const auto& [name, tool] : tools_) {
        defs.push_back({
            {"name", name},
            {"description", tool->Description()},
            {"inputSchema", tool->ParametersSchema()}
        });
    }
    return defs;
}

nlohmann::json ToolRegistry::Execute(const std::string& name, const nlohmann::json& arguments) const {
    auto tool = Get(name);
    if (!tool) {
        return {{"error", "Unknown tool: " + name}};
    }

    const auto validation = registry::ValidateInput(tool->ParametersSchema(), arguments);
    if (!validation.valid) {
        utils::Log(utils::LogLevel::kWarn, "tool", "invalid arguments",
                   {{"name", name}, {"errors", utils::Join(validation.errors, "; ")}});
        return {
            {"success", false},
            {"error", "Invalid arguments: " + utils::Join(validation.errors, "; ")},
            {"error_type", sandbox::ToString(sandbox::ErrorKind::kValidation)},
            {"tool", name}
        };
    }

    utils::Log(utils::LogLevel::kInfo, "tool", "start", {{"name", name}});
    nlohmann::json result;
    try {
        result = tool->Execute(arguments);
    } catch (const nlohmann::json::exception& ex) {
        result = {
            {"success", false},
            {"error", ex.what()},
            {"error_type", sandbox::ToString(sandbox::ErrorKind::kValidation)},
            {"tool", name}
        };
    } catch (const std::exception& ex) {
        result = {
            {"success", false},
            {"error", ex.what()},
            {"error_type", sandbox::ToString(sandbox::ErrorKind::kInternal)},
            {"tool", name}
        };
    }
    utils::Log(utils::LogLevel::kInfo, "tool", "end",
               {{"name", name}, {"success", result.value("success", false) ? "true" : "false"}});
    return result;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    return names;
}

}  // namespace scriptbox::tools

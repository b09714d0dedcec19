#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "tools/tool.hpp"

namespace scriptbox::tools {

class ToolRegistry {
public:
    void Register(std::unique_ptr<Tool> tool);
    Tool* Get(const std::string& name) const;
    bool Has(const std::string& name) const;
    // [{name, description, inputSchema}]
    nlohmann::json GetDefinitions() const;
    // Arguments are checked against the tool's schema before it runs.
    nlohmann::json Execute(const std::string& name, const nlohmann::json& arguments) const;

    std::vector<std::string> List() const;

private:
    std::map<std::string, std::unique_ptr<Tool>> tools_;
};

}  // namespace scriptbox::tools

#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace scriptbox::tools {

class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    // JSON schema of the argument object.
    virtual nlohmann::json ParametersSchema() const = 0;
    virtual nlohmann::json Execute(const nlohmann::json& arguments) = 0;
};

}  // namespace scriptbox::tools

#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace scriptbox::registry {

struct InputValidation {
    bool valid = true;
    std::vector<std::string> errors;

    nlohmann::json ToJson() const {
        return {{"valid", valid}, {"errors", errors}};
    }
};

// Checks required fields and declared primitive types (number, integer,
// string, boolean, array, object). Collects every violation.
InputValidation ValidateInput(const nlohmann::json& schema, const nlohmann::json& input);

}  // namespace scriptbox::registry

#include "registry/input_validator.hpp"

namespace scriptbox::registry {
namespace {

bool MatchesType(const std::string& expected, const nlohmann::json& value) {
    if (expected == "number") {
        return value.is_number();
    }
    if (expected == "integer") {
        return value.is_number_integer();
    }
    if (expected == "string") {
        return value.is_string();
    }
    if (expected == "boolean") {
        return value.is_boolean();
    }
    if (expected == "array") {
        return value.is_array();
    }
    if (expected == "object") {
        return value.is_object();
    }
    // unknown or absent types are not checked
    return true;
}

std::string Article(const std::string& type) {
    return (type == "array" || type == "object" || type == "integer") ? "an " : "a ";
}

}  // namespace

InputValidation ValidateInput(const nlohmann::json& schema, const nlohmann::json& input) {
    InputValidation validation{};
    if (!input.is_object()) {
        validation.valid = false;
        validation.errors.push_back("Input data must be an object");
        return validation;
    }
    if (!schema.is_object()) {
        return validation;
    }

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& field : schema["required"]) {
            if (field.is_string() && !input.contains(field.get<std::string>())) {
                validation.errors.push_back("Missing required field: " + field.get<std::string>());
            }
        }
    }

    if (schema.contains("properties") && schema["properties"].is_object()) {
        const auto& properties = schema["properties"];
        for (const auto& [field, value] : input.items()) {
            if (!properties.contains(field) || !properties[field].is_object()) {
                continue;
            }
            const auto& property = properties[field];
            if (!property.contains("type") || !property["type"].is_string()) {
                continue;
            }
            const auto expected = property["type"].get<std::string>();
            if (!MatchesType(expected, value)) {
                validation.errors.push_back("Field " + field + " should be " + Article(expected) + expected);
            }
        }
    }

    validation.valid = validation.errors.empty();
    return validation;
}

}  // namespace scriptbox::registry

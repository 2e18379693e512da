#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/draft_errors.hpp"

namespace draftline::protocol {

    enum class ParamType {
        String,
        Integer,
        Number,
        Boolean,
        Array
    };

    inline std::string to_string(const ParamType type) {
        switch (type) {
            case ParamType::String:
                return "string";
            case ParamType::Integer:
                return "integer";
            case ParamType::Number:
                return "number";
            case ParamType::Boolean:
                return "boolean";
            case ParamType::Array:
                return "array";
            default:
                return "unknown";
        }
    }

    // One entry of a tool's input schema
    struct ParamSpec {
        std::string name;
        ParamType type;
        std::string description;
        nlohmann::json default_value = nullptr;  // null means "no default"
        bool required = false;
    };

    // A named, schema-described operation exposed to remote callers
    struct ToolDescriptor {
        std::string name;
        std::string description;
        std::vector<ParamSpec> params;

        const ParamSpec* find_param(const std::string& param_name) const {
            for (const auto& param : params) {
                if (param.name == param_name) {
                    return &param;
                }
            }
            return nullptr;
        }
    };

    // How a transport asks the dispatch core to do something
    struct ToolRequest {
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    // How the dispatch core replies back. On success `payload` holds the
    // fields merged next to "success"; on failure `error` is set.
    struct ToolResult {
        bool success = false;
        nlohmann::json payload = nlohmann::json::object();
        std::optional<core::errors::DraftError> error;
        double duration_ms = 0.0;
    };

} // namespace draftline::protocol

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace wasmbox::protocol {

enum class ParameterType {
    String,
    Number,
    Boolean,
    Array,
    Binary
};

enum class CallingConvention {
    Cli,
    Positional,
    Json
};

enum class FileAccess {
    None,
    Read,
    Write,
    ReadWrite
};

enum class ReturnType {
    String,
    Object
};

struct ParameterDefinition {
    std::string name;
    ParameterType type = ParameterType::String;
    std::string description;
    std::optional<std::vector<nlohmann::json>> enum_values;
    std::optional<nlohmann::json> default_value;
    // Element type for arrays
    std::optional<ParameterType> item_type;
};

struct ExecutionPolicy {
    CallingConvention calling_convention = CallingConvention::Positional;
    FileAccess file_access = FileAccess::None;
    std::optional<std::uint32_t> memory_limit_pages;
    std::optional<std::uint32_t> timeout_ms;
    std::optional<std::string> stdin_param_name;
};

struct ReturnDefinition {
    ReturnType type = ReturnType::String;
    std::string description;
};

// Loaded once and never mutated. Parameters keep their declaration order.
struct ToolManifest {
    std::string name;
    std::string version;
    std::string description;
    std::vector<ParameterDefinition> parameters;
    std::vector<std::string> required;
    ReturnDefinition returns;
    ExecutionPolicy execution;
    std::optional<std::string> category;
    bool pipeable = false;
    std::optional<std::string> author;
    std::optional<std::string> license;
    std::optional<std::string> homepage;

    const ParameterDefinition* find_parameter(const std::string& key) const {
        for (const auto& parameter : parameters) {
            if (parameter.name == key) {
                return &parameter;
            }
        }
        return nullptr;
    }

    bool is_required(const std::string& key) const {
        for (const auto& name : required) {
            if (name == key) {
                return true;
            }
        }
        return false;
    }
};

inline std::string to_string(ParameterType type) {
    switch (type) {
        case ParameterType::String: return "string";
        case ParameterType::Number: return "number";
        case ParameterType::Boolean: return "boolean";
        case ParameterType::Array: return "array";
        case ParameterType::Binary: return "binary";
    }
    return "unknown";
}

inline std::string to_string(CallingConvention convention) {
    switch (convention) {
        case CallingConvention::Cli: return "cli";
        case CallingConvention::Positional: return "positional";
        case CallingConvention::Json: return "json";
    }
    return "unknown";
}

inline std::string to_string(FileAccess access) {
    switch (access) {
        case FileAccess::None: return "none";
        case FileAccess::Read: return "read";
        case FileAccess::Write: return "write";
        case FileAccess::ReadWrite: return "readwrite";
    }
    return "unknown";
}

inline std::string to_string(ReturnType type) {
    switch (type) {
        case ReturnType::String: return "string";
        case ReturnType::Object: return "object";
    }
    return "unknown";
}

}  // namespace wasmbox::protocol

#include "manifest/manifest_codec.hpp"

#include <regex>
#include <unordered_set>
#include <utility>
#include "core/config/limits.hpp"

namespace wasmbox::manifest {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::ordered_json;
using protocol::CallingConvention;
using protocol::FileAccess;
using protocol::ParameterDefinition;
using protocol::ParameterType;
using protocol::ReturnType;
using protocol::ToolManifest;

namespace {

ToolError invalid(const std::string& detail) {
    return ToolError{ErrorCategory::Validation, "Invalid manifest: " + detail,
                     "package_validation_failed"};
}

nlohmann::json to_plain(const ordered_json& value) {
    return nlohmann::json::parse(value.dump());
}

std::optional<ParameterType> parse_parameter_type(const std::string& text) {
    if (text == "string") return ParameterType::String;
    if (text == "number" || text == "integer") return ParameterType::Number;
    if (text == "boolean") return ParameterType::Boolean;
    if (text == "array") return ParameterType::Array;
    if (text == "binary") return ParameterType::Binary;
    return std::nullopt;
}

std::optional<CallingConvention> parse_convention(const std::string& text) {
    if (text == "cli") return CallingConvention::Cli;
    if (text == "positional") return CallingConvention::Positional;
    if (text == "json") return CallingConvention::Json;
    return std::nullopt;
}

std::optional<FileAccess> parse_file_access(const std::string& text) {
    if (text == "none") return FileAccess::None;
    if (text == "read") return FileAccess::Read;
    if (text == "write") return FileAccess::Write;
    if (text == "readwrite") return FileAccess::ReadWrite;
    return std::nullopt;
}

core::errors::Result<std::optional<std::string>> optional_string(
    const ordered_json& document, const char* key) {
    if (!document.contains(key) || document.at(key).is_null()) {
        return std::optional<std::string>{};
    }
    if (!document.at(key).is_string()) {
        return invalid(std::string(key) + " must be a string");
    }
    return std::optional<std::string>{document.at(key).get<std::string>()};
}

core::errors::Result<std::optional<std::uint32_t>> optional_u32(
    const ordered_json& object, const char* key) {
    if (!object.contains(key) || object.at(key).is_null()) {
        return std::optional<std::uint32_t>{};
    }
    const auto& value = object.at(key);
    if (!value.is_number_unsigned() && !value.is_number_integer()) {
        return invalid(std::string("execution.") + key +
                       " must be a non-negative integer");
    }
    if (value.is_number_integer() && value.get<std::int64_t>() < 0) {
        return invalid(std::string("execution.") + key +
                       " must be a non-negative integer");
    }
    const auto raw = value.get<std::uint64_t>();
    if (raw > UINT32_MAX) {
        return invalid(std::string("execution.") + key + " is too large");
    }
    return std::optional<std::uint32_t>{static_cast<std::uint32_t>(raw)};
}

core::errors::Result<ParameterDefinition> parse_parameter(
    const std::string& name, const ordered_json& schema) {
    if (!schema.is_object()) {
        return invalid("parameter '" + name + "' must be an object");
    }
    if (!schema.contains("type") || !schema.at("type").is_string()) {
        return invalid("parameter '" + name + "' is missing a type");
    }

    ParameterDefinition parameter;
    parameter.name = name;
    const auto type = parse_parameter_type(schema.at("type").get<std::string>());
    if (!type.has_value()) {
        return invalid("parameter '" + name + "' has unsupported type '" +
                       schema.at("type").get<std::string>() + "'");
    }
    parameter.type = *type;

    if (schema.contains("description")) {
        if (!schema.at("description").is_string()) {
            return invalid("parameter '" + name + "' description must be a string");
        }
        parameter.description = schema.at("description").get<std::string>();
    }

    if (schema.contains("enum")) {
        const auto& values = schema.at("enum");
        if (!values.is_array() || values.empty()) {
            return invalid("parameter '" + name + "' enum must be a non-empty array");
        }
        std::vector<nlohmann::json> enum_values;
        for (const auto& value : values) {
            enum_values.push_back(to_plain(value));
        }
        parameter.enum_values = std::move(enum_values);
    }

    if (schema.contains("default")) {
        parameter.default_value = to_plain(schema.at("default"));
    }

    if (parameter.type == ParameterType::Array && schema.contains("items")) {
        const auto& items = schema.at("items");
        if (items.is_object() && items.contains("type") &&
            items.at("type").is_string()) {
            parameter.item_type =
                parse_parameter_type(items.at("type").get<std::string>());
        }
    }
    return parameter;
}

ordered_json parameter_to_json(const ParameterDefinition& parameter) {
    ordered_json schema;
    schema["type"] = protocol::to_string(parameter.type);
    if (!parameter.description.empty()) {
        schema["description"] = parameter.description;
    }
    if (parameter.enum_values.has_value()) {
        schema["enum"] = ordered_json::parse(nlohmann::json(*parameter.enum_values).dump());
    }
    if (parameter.default_value.has_value()) {
        schema["default"] = ordered_json::parse(parameter.default_value->dump());
    }
    if (parameter.item_type.has_value()) {
        schema["items"] = {{"type", protocol::to_string(*parameter.item_type)}};
    }
    return schema;
}

}  // namespace

bool is_valid_tool_name(std::string_view name) {
    static const std::regex pattern("^[a-z][a-z0-9]*(?:[_-][a-z0-9]+)*$");
    return std::regex_match(name.begin(), name.end(), pattern);
}

core::errors::Result<ToolManifest> parse_manifest(std::string_view text) {
    const auto document = ordered_json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return ToolError{ErrorCategory::Validation, "Invalid JSON in manifest.json",
                         "package_validation_failed"};
    }
    return parse_manifest_json(document);
}

core::errors::Result<ToolManifest> parse_manifest_json(const ordered_json& document) {
    if (!document.is_object()) {
        return invalid("root must be an object");
    }

    ToolManifest manifest;
    for (const char* key : {"name", "version", "description"}) {
        if (!document.contains(key) || !document.at(key).is_string() ||
            document.at(key).get<std::string>().empty()) {
            return invalid(std::string(key) + " is required");
        }
    }
    manifest.name = document.at("name").get<std::string>();
    manifest.version = document.at("version").get<std::string>();
    manifest.description = document.at("description").get<std::string>();
    if (!is_valid_tool_name(manifest.name)) {
        return invalid("name '" + manifest.name +
                       "' must be lowercase alphanumeric words joined by '-' or '_'");
    }

    if (!document.contains("parameters") || !document.at("parameters").is_object()) {
        return invalid("parameters must be an object schema");
    }
    const auto& parameters = document.at("parameters");
    if (parameters.contains("type") && parameters.at("type") != "object") {
        return invalid("parameters.type must be 'object'");
    }
    if (parameters.contains("properties")) {
        const auto& properties = parameters.at("properties");
        if (!properties.is_object()) {
            return invalid("parameters.properties must be an object");
        }
        for (const auto& [key, schema] : properties.items()) {
            auto parsed = parse_parameter(key, schema);
            if (core::errors::is_error(parsed)) {
                return core::errors::get_error(parsed);
            }
            manifest.parameters.push_back(core::errors::take_value(parsed));
        }
    }
    if (parameters.contains("required")) {
        const auto& required = parameters.at("required");
        if (!required.is_array()) {
            return invalid("parameters.required must be an array");
        }
        for (const auto& entry : required) {
            if (!entry.is_string()) {
                return invalid("parameters.required entries must be strings");
            }
            const auto key = entry.get<std::string>();
            if (manifest.find_parameter(key) == nullptr) {
                return invalid("required parameter '" + key + "' is not declared");
            }
            manifest.required.push_back(key);
        }
    }

    if (document.contains("returns")) {
        const auto& returns = document.at("returns");
        if (!returns.is_object()) {
            return invalid("returns must be an object");
        }
        if (returns.contains("type")) {
            const auto type = returns.at("type").is_string()
                                  ? returns.at("type").get<std::string>()
                                  : std::string();
            if (type == "string") {
                manifest.returns.type = ReturnType::String;
            } else if (type == "object") {
                manifest.returns.type = ReturnType::Object;
            } else {
                return invalid("returns.type must be 'string' or 'object'");
            }
        }
        if (returns.contains("description") && returns.at("description").is_string()) {
            manifest.returns.description = returns.at("description").get<std::string>();
        }
    }

    if (document.contains("execution")) {
        const auto& execution = document.at("execution");
        if (!execution.is_object()) {
            return invalid("execution must be an object");
        }
        if (execution.contains("argStyle")) {
            const auto& style = execution.at("argStyle");
            const auto convention = style.is_string()
                                        ? parse_convention(style.get<std::string>())
                                        : std::nullopt;
            if (!convention.has_value()) {
                return invalid("execution.argStyle must be cli, positional or json");
            }
            manifest.execution.calling_convention = *convention;
        }
        if (execution.contains("fileAccess")) {
            const auto& access = execution.at("fileAccess");
            const auto level = access.is_string()
                                   ? parse_file_access(access.get<std::string>())
                                   : std::nullopt;
            if (!level.has_value()) {
                return invalid(
                    "execution.fileAccess must be none, read, write or readwrite");
            }
            manifest.execution.file_access = *level;
        }

        auto memory = optional_u32(execution, "memoryLimit");
        if (core::errors::is_error(memory)) {
            return core::errors::get_error(memory);
        }
        manifest.execution.memory_limit_pages = core::errors::get_value(memory);

        auto timeout = optional_u32(execution, "timeout");
        if (core::errors::is_error(timeout)) {
            return core::errors::get_error(timeout);
        }
        manifest.execution.timeout_ms = core::errors::get_value(timeout);

        auto stdin_param = optional_string(execution, "stdinParam");
        if (core::errors::is_error(stdin_param)) {
            return core::errors::get_error(stdin_param);
        }
        manifest.execution.stdin_param_name = core::errors::get_value(stdin_param);
        if (manifest.execution.stdin_param_name.has_value() &&
            manifest.find_parameter(*manifest.execution.stdin_param_name) == nullptr) {
            return invalid("execution.stdinParam '" +
                           *manifest.execution.stdin_param_name +
                           "' is not a declared parameter");
        }
    }

    const std::pair<const char*, std::optional<std::string>*> metadata[] = {
        {"category", &manifest.category},
        {"author", &manifest.author},
        {"license", &manifest.license},
        {"homepage", &manifest.homepage}};
    for (const auto& [key, target] : metadata) {
        auto value = optional_string(document, key);
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
        *target = core::errors::get_value(value);
    }

    if (document.contains("pipeable")) {
        if (!document.at("pipeable").is_boolean()) {
            return invalid("pipeable must be a boolean");
        }
        manifest.pipeable = document.at("pipeable").get<bool>();
    }

    return manifest;
}

ordered_json manifest_to_json(const ToolManifest& manifest) {
    ordered_json document;
    document["name"] = manifest.name;
    document["version"] = manifest.version;
    document["description"] = manifest.description;
    if (manifest.category.has_value()) {
        document["category"] = *manifest.category;
    }

    ordered_json properties = ordered_json::object();
    for (const auto& parameter : manifest.parameters) {
        properties[parameter.name] = parameter_to_json(parameter);
    }
    document["parameters"] = {{"type", "object"},
                              {"properties", properties},
                              {"required", manifest.required}};

    document["returns"] = {{"type", protocol::to_string(manifest.returns.type)},
                           {"description", manifest.returns.description}};

    ordered_json execution;
    execution["argStyle"] = protocol::to_string(manifest.execution.calling_convention);
    execution["fileAccess"] = protocol::to_string(manifest.execution.file_access);
    if (manifest.execution.memory_limit_pages.has_value()) {
        execution["memoryLimit"] = *manifest.execution.memory_limit_pages;
    }
    if (manifest.execution.timeout_ms.has_value()) {
        execution["timeout"] = *manifest.execution.timeout_ms;
    }
    if (manifest.execution.stdin_param_name.has_value()) {
        execution["stdinParam"] = *manifest.execution.stdin_param_name;
    }
    document["execution"] = execution;

    if (manifest.pipeable) {
        document["pipeable"] = true;
    }
    if (manifest.author.has_value()) document["author"] = *manifest.author;
    if (manifest.license.has_value()) document["license"] = *manifest.license;
    if (manifest.homepage.has_value()) document["homepage"] = *manifest.homepage;
    return document;
}

ToolManifest create_manifest(std::string name, std::string description,
                             std::vector<ParameterDefinition> parameters,
                             std::vector<std::string> required,
                             protocol::ExecutionPolicy execution) {
    ToolManifest manifest;
    manifest.name = std::move(name);
    manifest.version = "1.0.0";
    manifest.description = std::move(description);
    manifest.parameters = std::move(parameters);
    manifest.required = std::move(required);
    manifest.returns = {ReturnType::String, "The output of the command"};
    if (!execution.timeout_ms.has_value()) {
        execution.timeout_ms = core::config::kDefaultTimeoutMs;
    }
    manifest.execution = std::move(execution);
    return manifest;
}

nlohmann::json to_ai_tool_definition(const ToolManifest& manifest) {
    nlohmann::json properties = nlohmann::json::object();
    for (const auto& parameter : manifest.parameters) {
        nlohmann::json schema;
        switch (parameter.type) {
            case ParameterType::Binary:
                schema["type"] = "string";
                schema["contentEncoding"] = "base64";
                break;
            case ParameterType::Array:
                schema["type"] = "array";
                schema["items"] = {
                    {"type", parameter.item_type.has_value()
                                 ? protocol::to_string(*parameter.item_type)
                                 : "string"}};
                break;
            default:
                schema["type"] = protocol::to_string(parameter.type);
                break;
        }
        if (!parameter.description.empty()) {
            schema["description"] = parameter.description;
        }
        if (parameter.enum_values.has_value()) {
            schema["enum"] = *parameter.enum_values;
        }
        if (parameter.default_value.has_value()) {
            schema["default"] = *parameter.default_value;
        }
        properties[parameter.name] = schema;
    }

    return {{"name", manifest.name},
            {"description", manifest.description},
            {"input_schema",
             {{"type", "object"},
              {"properties", properties},
              {"required", manifest.required}}}};
}

}  // namespace wasmbox::manifest

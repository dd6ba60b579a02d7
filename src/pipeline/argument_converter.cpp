#include "pipeline/argument_converter.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include "core/encoding/base64.hpp"

namespace wasmbox::pipeline {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;
using protocol::CallingConvention;
using protocol::ToolManifest;

namespace {

bool is_present(const json& args, const std::string& key) {
    return args.contains(key) && !args.at(key).is_null();
}

// --key value for every present argument; true is a bare flag, false vanishes.
class CliStrategy : public ArgumentStrategy {
public:
    void apply(const ToolManifest& manifest, const json& args,
               ConvertedArguments& out) const override {
        std::set<std::string> emitted;
        for (const auto& parameter : manifest.parameters) {
            emit(args, parameter.name, out);
            emitted.insert(parameter.name);
        }
        for (const auto& [key, value] : args.items()) {
            if (emitted.count(key) == 0) {
                emit(args, key, out);
            }
        }
    }

private:
    static void emit(const json& args, const std::string& key, ConvertedArguments& out) {
        if (!is_present(args, key)) {
            return;
        }
        const auto& value = args.at(key);
        if (value.is_boolean()) {
            if (value.get<bool>()) {
                out.argv.push_back("--" + key);
            }
            return;
        }
        out.argv.push_back("--" + key);
        out.argv.push_back(coerce_to_string(value));
    }
};

// Required parameters in declared required order, then the rest in schema order.
class PositionalStrategy : public ArgumentStrategy {
public:
    void apply(const ToolManifest& manifest, const json& args,
               ConvertedArguments& out) const override {
        for (const auto& key : manifest.required) {
            if (is_present(args, key)) {
                out.argv.push_back(coerce_to_string(args.at(key)));
            }
        }
        for (const auto& parameter : manifest.parameters) {
            if (!manifest.is_required(parameter.name) && is_present(args, parameter.name)) {
                out.argv.push_back(coerce_to_string(args.at(parameter.name)));
            }
        }
    }
};

// One compact JSON object with keys in schema order, undeclared keys last.
// It goes to stdin unless stdin already carries a declared stdin parameter,
// in which case it trails argv.
class JsonStrategy : public ArgumentStrategy {
public:
    void apply(const ToolManifest& manifest, const json& args,
               ConvertedArguments& out) const override {
        nlohmann::ordered_json object = nlohmann::ordered_json::object();
        for (const auto& parameter : manifest.parameters) {
            if (args.contains(parameter.name)) {
                object[parameter.name] = args.at(parameter.name);
            }
        }
        for (const auto& [key, value] : args.items()) {
            if (manifest.find_parameter(key) == nullptr) {
                object[key] = value;
            }
        }

        if (!manifest.execution.stdin_param_name.has_value()) {
            out.stdin_text = object.dump();
            return;
        }
        if (!object.empty()) {
            out.argv.push_back(object.dump());
        }
    }
};

bool matches_type(const protocol::ParameterType type, const json& value) {
    switch (type) {
        case protocol::ParameterType::String:
        case protocol::ParameterType::Binary:
            return value.is_string();
        case protocol::ParameterType::Number:
            return value.is_number();
        case protocol::ParameterType::Boolean:
            return value.is_boolean();
        case protocol::ParameterType::Array:
            return value.is_array();
    }
    return false;
}

ToolError invalid_value(const std::string& name, const std::string& detail) {
    return ToolError{ErrorCategory::Input,
                     "Invalid value for parameter \"" + name + "\": " + detail,
                     "invalid_argument_value"};
}

std::optional<ToolError> check_value(const protocol::ParameterDefinition& parameter,
                                     const json& value) {
    if (!matches_type(parameter.type, value)) {
        return invalid_value(parameter.name, "expected " + protocol::to_string(parameter.type));
    }
    if (parameter.type == protocol::ParameterType::Array) {
        const auto item_type = parameter.item_type.value_or(protocol::ParameterType::String);
        for (const auto& item : value) {
            if (!matches_type(item_type, item)) {
                return invalid_value(parameter.name,
                                     "expected items of type " + protocol::to_string(item_type));
            }
        }
    }
    if (parameter.enum_values.has_value() && !parameter.enum_values->empty()) {
        const auto& allowed = *parameter.enum_values;
        if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
            std::string listed;
            for (const auto& option : allowed) {
                listed += (listed.empty() ? "" : ", ") + coerce_to_string(option);
            }
            return invalid_value(parameter.name, "expected one of " + listed);
        }
    }
    return std::nullopt;
}

}  // namespace

std::unique_ptr<ArgumentStrategy> make_argument_strategy(
    const CallingConvention convention) {
    switch (convention) {
        case CallingConvention::Cli: return std::make_unique<CliStrategy>();
        case CallingConvention::Positional: return std::make_unique<PositionalStrategy>();
        case CallingConvention::Json: return std::make_unique<JsonStrategy>();
    }
    return nullptr;
}

core::errors::Result<std::optional<std::string>> find_binary_parameter(
    const ToolManifest& manifest) {
    std::vector<std::string> names;
    for (const auto& parameter : manifest.parameters) {
        if (parameter.type == protocol::ParameterType::Binary) {
            names.push_back(parameter.name);
        }
    }
    if (names.size() > 1) {
        std::string joined;
        for (const auto& name : names) {
            joined += (joined.empty() ? "" : ", ") + name;
        }
        return ToolError{ErrorCategory::Configuration,
                         "Tool \"" + manifest.name +
                             "\" declares multiple binary parameters: " + joined,
                         "multiple_binary_parameters",
                         "A manifest may declare at most one binary parameter."};
    }
    if (names.empty()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{names.front()};
}

std::string coerce_to_string(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number_integer()) {
        return value.dump();
    }
    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (std::isfinite(number) && std::floor(number) == number &&
            std::fabs(number) < 1e15) {
            return std::to_string(static_cast<long long>(number));
        }
        return value.dump();
    }
    if (value.is_array()) {
        std::string joined;
        bool first = true;
        for (const auto& item : value) {
            if (!first) {
                joined += ",";
            }
            first = false;
            joined += item.is_null() ? "" : coerce_to_string(item);
        }
        return joined;
    }
    if (value.is_null()) {
        return "null";
    }
    return value.dump();
}

ArgumentConverter::ArgumentConverter(ToolManifest manifest)
    : manifest_(std::move(manifest)),
      strategy_(make_argument_strategy(manifest_.execution.calling_convention)) {}

core::errors::Result<json> resolve_arguments(const ToolManifest& manifest, const json& args) {
    if (!args.is_object() && !args.is_null()) {
        return ToolError{ErrorCategory::Input, "Tool arguments must be a JSON object",
                         "invalid_arguments"};
    }
    json resolved = args.is_object() ? args : json::object();
    for (const auto& parameter : manifest.parameters) {
        if (!is_present(resolved, parameter.name)) {
            if (parameter.default_value.has_value() && !parameter.default_value->is_null()) {
                resolved[parameter.name] = *parameter.default_value;
            }
            continue;
        }
        if (auto error = check_value(parameter, resolved.at(parameter.name))) {
            return *error;
        }
    }
    return resolved;
}

core::errors::Result<ConvertedArguments> ArgumentConverter::convert(const json& args) const {
    if (!strategy_) {
        return ToolError{ErrorCategory::Configuration,
                         "Unknown argStyle: " +
                             protocol::to_string(manifest_.execution.calling_convention),
                         "unknown_calling_convention"};
    }
    auto resolved_arguments = resolve_arguments(manifest_, args);
    if (core::errors::is_error(resolved_arguments)) {
        return core::errors::get_error(resolved_arguments);
    }
    const json resolved = core::errors::take_value(resolved_arguments);

    auto binary_parameter = find_binary_parameter(manifest_);
    if (core::errors::is_error(binary_parameter)) {
        return core::errors::get_error(binary_parameter);
    }
    const auto& binary_name = core::errors::get_value(binary_parameter);
    const auto& stdin_name = manifest_.execution.stdin_param_name;

    ConvertedArguments out;
    out.argv.push_back(manifest_.name);

    json remaining = json::object();
    for (const auto& [key, value] : resolved.items()) {
        if (stdin_name.has_value() && key == *stdin_name) {
            if (!value.is_null()) {
                out.stdin_text = coerce_to_string(value);
            }
            continue;
        }
        if (binary_name.has_value() && key == *binary_name) {
            if (value.is_string()) {
                auto decoded = core::encoding::base64_decode(value.get<std::string>());
                if (core::errors::is_error(decoded)) {
                    auto error = core::errors::get_error(decoded);
                    error.message = "Parameter \"" + key + "\": " + error.message;
                    return error;
                }
                out.stdin_binary = core::errors::take_value(decoded);
            }
            continue;
        }
        remaining[key] = value;
    }

    strategy_->apply(manifest_, remaining, out);
    return out;
}

core::errors::Result<ConvertedArguments> convert_arguments(const ToolManifest& manifest,
                                                           const json& args) {
    return ArgumentConverter(manifest).convert(args);
}

}  // namespace wasmbox::pipeline

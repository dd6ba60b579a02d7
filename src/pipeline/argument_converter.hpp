#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/bytes.hpp"
#include "protocol/manifest.hpp"

namespace wasmbox::pipeline {

struct ConvertedArguments {
    // argv[0] is always the tool name
    std::vector<std::string> argv;
    std::optional<std::string> stdin_text;
    // Decoded binary parameter. Wins over stdin_text at execution time.
    std::optional<protocol::Bytes> stdin_binary;
};

// How one calling convention lays out the ordinary parameters. Parameters
// routed to stdin are already filtered out of `args`.
class ArgumentStrategy {
public:
    virtual ~ArgumentStrategy() = default;
    virtual void apply(const protocol::ToolManifest& manifest, const nlohmann::json& args,
                       ConvertedArguments& out) const = 0;
};

// nullptr for a convention with no strategy
std::unique_ptr<ArgumentStrategy> make_argument_strategy(
    protocol::CallingConvention convention);

// Name of the single binary parameter, if any. Two or more is a
// configuration error.
core::errors::Result<std::optional<std::string>> find_binary_parameter(
    const protocol::ToolManifest& manifest);

// String form used on argv: integers without a fraction, arrays joined by
// commas, objects as compact JSON.
std::string coerce_to_string(const nlohmann::json& value);

// Fills declared defaults for missing or null keys and checks every present
// declared parameter against its type and enum. Undeclared keys pass through.
core::errors::Result<nlohmann::json> resolve_arguments(const protocol::ToolManifest& manifest,
                                                      const nlohmann::json& args);

class ArgumentConverter {
public:
    // The strategy is chosen here, once per manifest.
    explicit ArgumentConverter(protocol::ToolManifest manifest);

    core::errors::Result<ConvertedArguments> convert(const nlohmann::json& args) const;

private:
    protocol::ToolManifest manifest_;
    std::unique_ptr<ArgumentStrategy> strategy_;
};

// One-shot helper
core::errors::Result<ConvertedArguments> convert_arguments(
    const protocol::ToolManifest& manifest, const nlohmann::json& args);

}  // namespace wasmbox::pipeline

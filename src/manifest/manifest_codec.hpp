#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/manifest.hpp"

namespace wasmbox::manifest {

bool is_valid_tool_name(std::string_view name);

// Parses manifest.json text. Invalid JSON and schema violations both come
// back as package_validation_failed errors.
core::errors::Result<protocol::ToolManifest> parse_manifest(std::string_view text);

core::errors::Result<protocol::ToolManifest> parse_manifest_json(
    const nlohmann::ordered_json& document);

nlohmann::ordered_json manifest_to_json(const protocol::ToolManifest& manifest);

// Builder used by the built-in registry: fills version 1.0.0, a string
// return type and the default timeout.
protocol::ToolManifest create_manifest(
    std::string name, std::string description,
    std::vector<protocol::ParameterDefinition> parameters,
    std::vector<std::string> required = {},
    protocol::ExecutionPolicy execution = {});

// Tool definition handed to the AI provider. Binary parameters appear as
// base64 strings.
nlohmann::json to_ai_tool_definition(const protocol::ToolManifest& manifest);

}  // namespace wasmbox::manifest

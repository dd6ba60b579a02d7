#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "manifest/manifest_codec.hpp"

namespace {

using wasmbox::core::errors::ErrorCategory;
using wasmbox::core::errors::get_error;
using wasmbox::core::errors::get_value;
using wasmbox::core::errors::is_error;
using wasmbox::manifest::create_manifest;
using wasmbox::manifest::is_valid_tool_name;
using wasmbox::manifest::manifest_to_json;
using wasmbox::manifest::parse_manifest;
using wasmbox::manifest::parse_manifest_json;
using wasmbox::manifest::to_ai_tool_definition;
using wasmbox::protocol::CallingConvention;
using wasmbox::protocol::FileAccess;
using wasmbox::protocol::ParameterDefinition;
using wasmbox::protocol::ParameterType;

const char* kWcManifest = R"({
  "name": "wc",
  "version": "1.2.0",
  "description": "Count lines, words and bytes",
  "category": "text",
  "pipeable": true,
  "parameters": {
    "type": "object",
    "properties": {
      "input": {"type": "string", "description": "Text to count"},
      "lines": {"type": "boolean"},
      "words": {"type": "boolean", "default": false},
      "mode": {"type": "string", "enum": ["fast", "exact"]}
    },
    "required": ["input"]
  },
  "returns": {"type": "string", "description": "Counts"},
  "execution": {"argStyle": "cli", "stdinParam": "input", "timeout": 5000, "memoryLimit": 256}
})";

TEST(ManifestCodecTest, ParsesFullManifestPreservingOrder) {
    auto result = parse_manifest(kWcManifest);
    ASSERT_FALSE(is_error(result));
    const auto& manifest = get_value(result);

    EXPECT_EQ(manifest.name, "wc");
    EXPECT_EQ(manifest.version, "1.2.0");
    ASSERT_EQ(manifest.parameters.size(), 4u);
    EXPECT_EQ(manifest.parameters[0].name, "input");
    EXPECT_EQ(manifest.parameters[1].name, "lines");
    EXPECT_EQ(manifest.parameters[2].name, "words");
    EXPECT_EQ(manifest.parameters[3].name, "mode");
    EXPECT_EQ(manifest.parameters[1].type, ParameterType::Boolean);
    ASSERT_TRUE(manifest.parameters[3].enum_values.has_value());
    EXPECT_EQ(manifest.parameters[3].enum_values->size(), 2u);
    EXPECT_TRUE(manifest.is_required("input"));
    EXPECT_EQ(manifest.execution.calling_convention, CallingConvention::Cli);
    EXPECT_EQ(manifest.execution.stdin_param_name.value_or(""), "input");
    EXPECT_EQ(manifest.execution.timeout_ms.value_or(0), 5000u);
    EXPECT_EQ(manifest.execution.memory_limit_pages.value_or(0), 256u);
    EXPECT_EQ(manifest.category.value_or(""), "text");
    EXPECT_TRUE(manifest.pipeable);
}

TEST(ManifestCodecTest, AppliesExecutionDefaults) {
    auto result = parse_manifest(
        R"({"name":"echo","version":"1.0.0","description":"Echo","parameters":{"type":"object","properties":{}}})");
    ASSERT_FALSE(is_error(result));
    const auto& manifest = get_value(result);
    EXPECT_EQ(manifest.execution.calling_convention, CallingConvention::Positional);
    EXPECT_EQ(manifest.execution.file_access, FileAccess::None);
    EXPECT_FALSE(manifest.execution.timeout_ms.has_value());
    EXPECT_FALSE(manifest.pipeable);
}

TEST(ManifestCodecTest, RejectsInvalidJson) {
    auto result = parse_manifest("{not json");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).message, "Invalid JSON in manifest.json");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "package_validation_failed");
}

TEST(ManifestCodecTest, RejectsBadToolName) {
    auto result = parse_manifest(
        R"({"name":"Bad Name","version":"1","description":"d","parameters":{}})");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).message.rfind("Invalid manifest: name", 0), 0u);
}

TEST(ManifestCodecTest, RejectsUndeclaredRequiredParameter) {
    auto result = parse_manifest(
        R"({"name":"x","version":"1","description":"d","parameters":{"properties":{},"required":["a"]}})");
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).message.find("'a' is not declared"), std::string::npos);
}

TEST(ManifestCodecTest, RejectsUndeclaredStdinParameter) {
    auto result = parse_manifest(
        R"({"name":"x","version":"1","description":"d","parameters":{"properties":{}},"execution":{"stdinParam":"input"}})");
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).message.find("stdinParam"), std::string::npos);
}

TEST(ManifestCodecTest, RejectsUnknownEnumsAndTypes) {
    EXPECT_TRUE(is_error(parse_manifest(
        R"({"name":"x","version":"1","description":"d","parameters":{},"execution":{"argStyle":"shell"}})")));
    EXPECT_TRUE(is_error(parse_manifest(
        R"({"name":"x","version":"1","description":"d","parameters":{},"execution":{"fileAccess":"all"}})")));
    EXPECT_TRUE(is_error(parse_manifest(
        R"({"name":"x","version":"1","description":"d","parameters":{"properties":{"a":{"type":"object"}}}})")));
    EXPECT_TRUE(is_error(parse_manifest(
        R"({"name":"x","version":"1","description":"d","parameters":{},"returns":{"type":"number"}})")));
    EXPECT_TRUE(is_error(parse_manifest(
        R"({"name":"x","version":"1","description":"d","parameters":{},"execution":{"timeout":-5}})")));
}

TEST(ManifestCodecTest, ValidToolNames) {
    EXPECT_TRUE(is_valid_tool_name("base64"));
    EXPECT_TRUE(is_valid_tool_name("json-format"));
    EXPECT_TRUE(is_valid_tool_name("sha_256"));
    EXPECT_FALSE(is_valid_tool_name("9lives"));
    EXPECT_FALSE(is_valid_tool_name("trailing-"));
    EXPECT_FALSE(is_valid_tool_name("double--dash"));
    EXPECT_FALSE(is_valid_tool_name("Upper"));
    EXPECT_FALSE(is_valid_tool_name(""));
}

TEST(ManifestCodecTest, SerializedManifestParsesBackUnchanged) {
    auto first = parse_manifest(kWcManifest);
    ASSERT_FALSE(is_error(first));

    const auto document = manifest_to_json(get_value(first));
    auto second = parse_manifest_json(document);
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(manifest_to_json(get_value(second)).dump(), document.dump());
}

TEST(ManifestCodecTest, CreateManifestFillsDefaults) {
    ParameterDefinition input;
    input.name = "input";
    const auto manifest = create_manifest("rev", "Reverse text", {input}, {"input"});

    EXPECT_EQ(manifest.version, "1.0.0");
    EXPECT_EQ(manifest.returns.description, "The output of the command");
    EXPECT_EQ(manifest.execution.calling_convention, CallingConvention::Positional);
    EXPECT_EQ(manifest.execution.file_access, FileAccess::None);
    EXPECT_EQ(manifest.execution.timeout_ms.value_or(0), 30000u);
}

TEST(ManifestCodecTest, AiDefinitionRendersBinaryAsBase64String) {
    ParameterDefinition image;
    image.name = "image";
    image.type = ParameterType::Binary;
    image.description = "Input image";
    ParameterDefinition width;
    width.name = "width";
    width.type = ParameterType::Number;
    const auto manifest = create_manifest("resize", "Resize an image", {image, width}, {"image"});

    const auto definition = to_ai_tool_definition(manifest);
    EXPECT_EQ(definition["name"], "resize");
    const auto& schema = definition["input_schema"];
    EXPECT_EQ(schema["type"], "object");
    EXPECT_EQ(schema["properties"]["image"]["type"], "string");
    EXPECT_EQ(schema["properties"]["image"]["contentEncoding"], "base64");
    EXPECT_EQ(schema["properties"]["width"]["type"], "number");
    EXPECT_EQ(schema["required"], nlohmann::json::array({"image"}));
}

}  // namespace

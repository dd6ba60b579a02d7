#include "pipeline/result_formatter.hpp"

#include <vector>
#include "core/encoding/base64.hpp"
#include "core/encoding/utf8.hpp"

namespace wasmbox::pipeline {

using nlohmann::json;

namespace {

bool is_truthy(const json& result, const char* key) {
    if (!result.contains(key)) {
        return false;
    }
    const auto& value = result.at(key);
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        return !value.get<std::string>().empty();
    }
    return !value.is_null();
}

std::string as_display(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

}  // namespace

json format_for_llm(const std::string& tool_name, const protocol::ToolExecutionResult& result,
                    ResultCache& cache) {
    json response;
    response["success"] = result.success;
    response["exitCode"] = result.exit_code;
    response["stderr"] = result.stderr_text;
    if (result.error.has_value()) {
        response["error"] = *result.error;
    }

    const bool binary = result.stdout_binary.has_value() &&
                        !core::encoding::is_valid_utf8(*result.stdout_binary);
    if (binary) {
        const auto& bytes = *result.stdout_binary;
        CachedResultMetadata metadata;
        metadata.byte_size = bytes.size();
        metadata.mime_type = "application/octet-stream";
        response["stdout"] = core::encoding::base64_encode(bytes);
        response["stdoutEncoding"] = "base64";
        response["byteSize"] = bytes.size();
        response["resultId"] = cache.store_binary(tool_name, bytes, metadata);
        return response;
    }

    const std::string stdout_text = result.stdout_binary.has_value()
                                        ? protocol::to_text(*result.stdout_binary)
                                        : result.stdout_text;
    if (stdout_text.size() <= kInlineStdoutLimit) {
        response["stdout"] = stdout_text;
        return response;
    }

    const auto summary = generate_content_summary(stdout_text, tool_name + ".txt");
    CachedResultMetadata metadata;
    metadata.line_count = summary.line_count;
    metadata.byte_size = summary.byte_size;
    metadata.file_type = summary.file_type;

    response["summary"] = summary.summary;
    response["preview"] = summary.preview;
    response["lineCount"] = summary.line_count;
    response["byteSize"] = summary.byte_size;
    response["truncated"] = true;
    response["resultId"] = cache.store(tool_name, stdout_text, metadata);
    return response;
}

std::string format_tool_result_summary(const json& result) {
    std::vector<std::string> lines;

    if (is_truthy(result, "success")) {
        lines.push_back("Status: Success");
    } else if (is_truthy(result, "error")) {
        return "Error: " + as_display(result.at("error"));
    }

    if (is_truthy(result, "path")) {
        lines.push_back("Path: " + as_display(result.at("path")));
    }
    if (is_truthy(result, "summary")) {
        lines.push_back("Summary: " + as_display(result.at("summary")));
    }
    if (result.contains("lineCount") && !result.at("lineCount").is_null()) {
        lines.push_back("Lines: " + as_display(result.at("lineCount")));
    }
    if (result.contains("byteSize") && result.at("byteSize").is_number()) {
        lines.push_back("Size: " + format_byte_size(result.at("byteSize").get<std::size_t>()));
    }
    if (is_truthy(result, "fileType")) {
        lines.push_back("Type: " + as_display(result.at("fileType")));
    }
    if (is_truthy(result, "preview")) {
        lines.push_back("");
        lines.push_back("Preview:");
        lines.push_back(as_display(result.at("preview")));
    }

    std::string joined;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += "\n";
        }
        joined += lines[i];
    }
    return joined;
}

}  // namespace wasmbox::pipeline

#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/encoding/base64.hpp"
#include "pipeline/result_cache.hpp"
#include "pipeline/result_formatter.hpp"

namespace {

using nlohmann::json;
using wasmbox::pipeline::format_for_llm;
using wasmbox::pipeline::format_tool_result_summary;
using wasmbox::pipeline::kInlineStdoutLimit;
using wasmbox::pipeline::ResultCache;
using wasmbox::protocol::Bytes;
using wasmbox::protocol::ToolExecutionResult;

ToolExecutionResult ok_result(const std::string& stdout_text) {
    ToolExecutionResult result;
    result.success = true;
    result.stdout_text = stdout_text;
    return result;
}

TEST(ResultFormatterTest, ShortTextIsInline) {
    ResultCache cache;
    const auto response = format_for_llm("echo", ok_result("hello\n"), cache);

    EXPECT_EQ(response["success"], true);
    EXPECT_EQ(response["exitCode"], 0);
    EXPECT_EQ(response["stdout"], "hello\n");
    EXPECT_FALSE(response.contains("resultId"));
    EXPECT_EQ(cache.stats().size, 0u);
}

TEST(ResultFormatterTest, LongTextIsCachedWithPreview) {
    ResultCache cache;
    std::string text;
    for (int i = 0; text.size() <= kInlineStdoutLimit; ++i) {
        text += "row " + std::to_string(i) + "\n";
    }

    const auto response = format_for_llm("seq", ok_result(text), cache);
    ASSERT_TRUE(response.contains("resultId"));
    EXPECT_FALSE(response.contains("stdout"));
    EXPECT_EQ(response["truncated"], true);
    EXPECT_EQ(response["byteSize"], text.size());
    EXPECT_EQ(response["preview"], "row 0\nrow 1\nrow 2\nrow 3\nrow 4");

    const auto cached = cache.get_content(response["resultId"].get<std::string>());
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(*cached, text);
}

TEST(ResultFormatterTest, BinaryStdoutIsBase64AndCachedExactly) {
    ResultCache cache;
    ToolExecutionResult result = ok_result("\xEF\xBF\xBDPNG");
    const Bytes png{0x89, 0x50, 0x4e, 0x47, 0x0d, 0x0a};
    result.stdout_binary = png;

    const auto response = format_for_llm("convert", result, cache);
    EXPECT_EQ(response["stdoutEncoding"], "base64");
    EXPECT_EQ(response["stdout"], wasmbox::core::encoding::base64_encode(png));
    EXPECT_EQ(response["byteSize"], png.size());

    const auto cached = cache.get(response["resultId"].get<std::string>());
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(cached->is_binary);
    EXPECT_EQ(cached->binary, png);
}

TEST(ResultFormatterTest, FailureCarriesErrorAndStderr) {
    ResultCache cache;
    ToolExecutionResult result;
    result.exit_code = 1;
    result.stderr_text = "Execution timeout";
    result.error = "Execution timeout";

    const auto response = format_for_llm("spin", result, cache);
    EXPECT_EQ(response["success"], false);
    EXPECT_EQ(response["exitCode"], 1);
    EXPECT_EQ(response["error"], "Execution timeout");
    EXPECT_EQ(response["stderr"], "Execution timeout");
}

TEST(ResultSummaryTest, ErrorShortCircuits) {
    EXPECT_EQ(format_tool_result_summary({{"success", false}, {"error", "Permission denied"}}),
              "Error: Permission denied");
}

TEST(ResultSummaryTest, ListsAvailableFields) {
    const json result = {{"success", true},
                         {"path", "src/a.ts"},
                         {"summary", "TypeScript, 3 lines, 20 bytes"},
                         {"lineCount", 3},
                         {"byteSize", 2048},
                         {"fileType", "TypeScript"},
                         {"preview", "a\nb"}};
    EXPECT_EQ(format_tool_result_summary(result),
              "Status: Success\n"
              "Path: src/a.ts\n"
              "Summary: TypeScript, 3 lines, 20 bytes\n"
              "Lines: 3\n"
              "Size: 2.0 KB\n"
              "Type: TypeScript\n"
              "\n"
              "Preview:\n"
              "a\nb");
}

}  // namespace

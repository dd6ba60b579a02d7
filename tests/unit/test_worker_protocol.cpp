#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/worker_protocol.hpp"

namespace {

using nlohmann::json;
using wasmbox::core::errors::get_error;
using wasmbox::core::errors::get_value;
using wasmbox::core::errors::is_error;
using wasmbox::protocol::Bytes;
using wasmbox::protocol::encode_frame;
using wasmbox::protocol::ExecutionResult;
using wasmbox::protocol::FrameDecoder;
using wasmbox::protocol::request_from_json;
using wasmbox::protocol::request_to_json;
using wasmbox::protocol::response_from_json;
using wasmbox::protocol::response_to_json;
using wasmbox::protocol::ResponseType;
using wasmbox::protocol::WorkerRequest;
using wasmbox::protocol::WorkerResponse;

TEST(WorkerProtocolTest, RequestCarriesBinariesAsByteStrings) {
    WorkerRequest request;
    request.id = "wasm-1-abc";
    request.wasm_binary = {0x00, 0x61, 0x73, 0x6d};
    request.args = {"tool", "--flag"};
    request.options.timeout_ms = 2500;
    request.options.stdin_binary = Bytes{0xff, 0x00};
    request.options.files["docs/a.txt"] = Bytes{'h', 'i'};

    const auto message = request_to_json(request);
    EXPECT_EQ(message["type"], "execute");
    EXPECT_TRUE(message["wasmBinary"].is_binary());
    EXPECT_TRUE(message["options"]["stdinBinary"].is_binary());
    EXPECT_TRUE(message["options"]["files"]["docs/a.txt"].is_binary());

    auto parsed = request_from_json(message);
    ASSERT_FALSE(is_error(parsed));
    const auto& back = get_value(parsed);
    EXPECT_EQ(back.id, request.id);
    EXPECT_EQ(back.wasm_binary, request.wasm_binary);
    EXPECT_EQ(back.args, request.args);
    EXPECT_EQ(back.options.timeout_ms, 2500u);
    EXPECT_EQ(back.options.stdin_binary.value_or(Bytes{}), (Bytes{0xff, 0x00}));
    EXPECT_EQ(back.options.files.at("docs/a.txt"), (Bytes{'h', 'i'}));
}

TEST(WorkerProtocolTest, RequestClampsTimeoutAndMemory) {
    json message = {{"type", "execute"},
                    {"id", "x"},
                    {"wasmBinary", json::binary({0x00})},
                    {"options", {{"timeout", 5u}, {"memoryPages", 999999u}}}};
    auto parsed = request_from_json(message);
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).options.timeout_ms, 100u);
    EXPECT_EQ(get_value(parsed).options.memory_pages, 4096u);
}

TEST(WorkerProtocolTest, RejectsMalformedRequests) {
    EXPECT_TRUE(is_error(request_from_json(json{{"type", "run"}, {"id", "x"}})));
    EXPECT_TRUE(is_error(request_from_json(json{{"type", "execute"}, {"id", "x"}})));
    auto bad_args = request_from_json(json{{"type", "execute"},
                                           {"id", "x"},
                                           {"wasmBinary", json::binary({0x00})},
                                           {"args", {1, 2}}});
    ASSERT_TRUE(is_error(bad_args));
    EXPECT_EQ(get_error(bad_args).code, "protocol_error");
}

TEST(WorkerProtocolTest, ResponseKeepsBinaryStdout) {
    WorkerResponse response;
    response.type = ResponseType::Result;
    response.id = "wasm-2";
    ExecutionResult result;
    result.exit_code = 3;
    result.stdout_text = "\xEF\xBF\xBD";
    result.stdout_binary = Bytes{0x89};
    result.stderr_text = "warn";
    response.result = result;

    auto parsed = response_from_json(response_to_json(response));
    ASSERT_FALSE(is_error(parsed));
    const auto& back = get_value(parsed);
    EXPECT_EQ(back.type, ResponseType::Result);
    ASSERT_TRUE(back.result.has_value());
    EXPECT_EQ(back.result->exit_code, 3);
    EXPECT_EQ(back.result->stdout_binary.value_or(Bytes{}), Bytes{0x89});
    EXPECT_EQ(back.result->stderr_text, "warn");
}

TEST(WorkerProtocolTest, ParsesErrorAndProgressResponses) {
    auto error = response_from_json(json{{"type", "error"}, {"id", "a"}, {"error", "boom"}});
    ASSERT_FALSE(is_error(error));
    EXPECT_EQ(get_value(error).type, ResponseType::Error);
    EXPECT_EQ(get_value(error).error.value_or(""), "boom");

    auto progress = response_from_json(json{{"type", "progress"}, {"id", "a"}, {"progress", "50%"}});
    ASSERT_FALSE(is_error(progress));
    EXPECT_EQ(get_value(progress).type, ResponseType::Progress);

    EXPECT_TRUE(is_error(response_from_json(json{{"type", "done"}, {"id", "a"}})));
}

TEST(FrameDecoderTest, ReassemblesSplitFramesInOrder) {
    const auto first = encode_frame(json{{"n", 1}});
    const auto second = encode_frame(json{{"n", 2}, {"blob", json::binary({1, 2, 3})}});
    Bytes stream = first;
    stream.insert(stream.end(), second.begin(), second.end());

    FrameDecoder decoder;
    std::vector<json> messages;
    for (const auto byte : stream) {
        decoder.append(&byte, 1);
        while (auto message = decoder.next()) {
            ASSERT_FALSE(is_error(*message));
            messages.push_back(get_value(*message));
        }
    }

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0]["n"], 1);
    EXPECT_EQ(messages[1]["n"], 2);
    EXPECT_TRUE(messages[1]["blob"].is_binary());
    EXPECT_EQ(decoder.buffered(), 0u);
}

TEST(FrameDecoderTest, RejectsOversizedAndCorruptFrames) {
    FrameDecoder oversized;
    const Bytes huge_header{0xff, 0xff, 0xff, 0xff};
    oversized.append(huge_header.data(), huge_header.size());
    auto too_big = oversized.next();
    ASSERT_TRUE(too_big.has_value());
    EXPECT_TRUE(is_error(*too_big));

    FrameDecoder corrupt;
    const Bytes bad{0x00, 0x00, 0x00, 0x02, 0xff, 0xff};
    corrupt.append(bad.data(), bad.size());
    auto garbage = corrupt.next();
    ASSERT_TRUE(garbage.has_value());
    EXPECT_TRUE(is_error(*garbage));
}

}  // namespace

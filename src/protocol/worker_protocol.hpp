#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/bytes.hpp"
#include "protocol/execution_contract.hpp"

// Messages between WorkerManager and the sandbox executable. Each message is
// one frame: a 4-byte big-endian length, then CBOR. Binary payloads travel as
// CBOR byte strings.
namespace wasmbox::protocol {

constexpr std::uint32_t kMaxFrameBytes = 96u * 1024 * 1024;

struct WorkerRequest {
    std::string id;
    Bytes wasm_binary;
    std::vector<std::string> args;
    ExecutionOptions options;
};

enum class ResponseType {
    Result,
    Error,
    Progress
};

struct WorkerResponse {
    ResponseType type = ResponseType::Result;
    std::string id;
    std::optional<ExecutionResult> result;
    std::optional<std::string> error;
    std::optional<std::string> progress;
};

nlohmann::json request_to_json(const WorkerRequest& request);
core::errors::Result<WorkerRequest> request_from_json(const nlohmann::json& message);

nlohmann::json response_to_json(const WorkerResponse& response);
core::errors::Result<WorkerResponse> response_from_json(const nlohmann::json& message);

std::string to_string(ResponseType type);

Bytes encode_frame(const nlohmann::json& message);

// Accumulates bytes from a stream and yields complete messages in order.
class FrameDecoder {
public:
    void append(const std::uint8_t* data, std::size_t size);

    // nullopt while the next frame is incomplete
    std::optional<core::errors::Result<nlohmann::json>> next();

    std::size_t buffered() const { return buffer_.size() - offset_; }

private:
    Bytes buffer_;
    std::size_t offset_ = 0;
};

}  // namespace wasmbox::protocol

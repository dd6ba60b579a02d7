#include "protocol/worker_protocol.hpp"

#include <utility>

namespace wasmbox::protocol {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

ToolError malformed(const std::string& detail) {
    return ToolError{ErrorCategory::Execution, "Malformed worker message: " + detail,
                     "protocol_error"};
}

json binary(const Bytes& bytes) {
    return json::binary(bytes);
}

Bytes bytes_of(const json& value) {
    const auto& container = value.get_binary();
    return Bytes(container.begin(), container.end());
}

}  // namespace

std::string to_string(const ResponseType type) {
    switch (type) {
        case ResponseType::Result: return "result";
        case ResponseType::Error: return "error";
        case ResponseType::Progress: return "progress";
    }
    return "unknown";
}

json request_to_json(const WorkerRequest& request) {
    json options;
    options["timeout"] = request.options.timeout_ms;
    options["memoryPages"] = request.options.memory_pages;
    if (request.options.stdin_text.has_value()) {
        options["stdin"] = *request.options.stdin_text;
    }
    if (request.options.stdin_binary.has_value()) {
        options["stdinBinary"] = binary(*request.options.stdin_binary);
    }
    json files = json::object();
    for (const auto& [path, contents] : request.options.files) {
        files[path] = binary(contents);
    }
    options["files"] = files;

    json message;
    message["type"] = "execute";
    message["id"] = request.id;
    message["wasmBinary"] = binary(request.wasm_binary);
    message["args"] = request.args;
    message["options"] = options;
    return message;
}

core::errors::Result<WorkerRequest> request_from_json(const json& message) {
    if (!message.is_object() || message.value("type", "") != "execute") {
        return malformed("expected an execute request");
    }
    if (!message.contains("id") || !message.at("id").is_string()) {
        return malformed("request id missing");
    }
    if (!message.contains("wasmBinary") || !message.at("wasmBinary").is_binary()) {
        return malformed("wasmBinary must be a byte string");
    }

    WorkerRequest request;
    request.id = message.at("id").get<std::string>();
    request.wasm_binary = bytes_of(message.at("wasmBinary"));
    if (message.contains("args")) {
        if (!message.at("args").is_array()) {
            return malformed("args must be an array");
        }
        for (const auto& arg : message.at("args")) {
            if (!arg.is_string()) {
                return malformed("args entries must be strings");
            }
            request.args.push_back(arg.get<std::string>());
        }
    }

    if (message.contains("options") && message.at("options").is_object()) {
        const auto& options = message.at("options");
        request.options.timeout_ms = clamp_timeout_ms(
            options.contains("timeout") && options.at("timeout").is_number_unsigned()
                ? std::optional<std::uint32_t>(options.at("timeout").get<std::uint32_t>())
                : std::nullopt);
        request.options.memory_pages = clamp_memory_pages(
            options.contains("memoryPages") && options.at("memoryPages").is_number_unsigned()
                ? std::optional<std::uint32_t>(options.at("memoryPages").get<std::uint32_t>())
                : std::nullopt);
        if (options.contains("stdin") && options.at("stdin").is_string()) {
            request.options.stdin_text = options.at("stdin").get<std::string>();
        }
        if (options.contains("stdinBinary") && options.at("stdinBinary").is_binary()) {
            request.options.stdin_binary = bytes_of(options.at("stdinBinary"));
        }
        if (options.contains("files") && options.at("files").is_object()) {
            for (const auto& [path, contents] : options.at("files").items()) {
                if (!contents.is_binary()) {
                    return malformed("file contents must be byte strings");
                }
                request.options.files[path] = bytes_of(contents);
            }
        }
    }
    return request;
}

json response_to_json(const WorkerResponse& response) {
    json message;
    message["type"] = to_string(response.type);
    message["id"] = response.id;
    if (response.result.has_value()) {
        const auto& result = *response.result;
        json payload;
        payload["exitCode"] = result.exit_code;
        payload["stdout"] = result.stdout_text;
        payload["stderr"] = result.stderr_text;
        if (result.stdout_binary.has_value()) {
            payload["stdoutBinary"] = binary(*result.stdout_binary);
        }
        if (result.error.has_value()) {
            payload["error"] = *result.error;
        }
        message["result"] = payload;
    }
    if (response.error.has_value()) {
        message["error"] = *response.error;
    }
    if (response.progress.has_value()) {
        message["progress"] = *response.progress;
    }
    return message;
}

core::errors::Result<WorkerResponse> response_from_json(const json& message) {
    if (!message.is_object()) {
        return malformed("response must be a map");
    }
    if (!message.contains("id") || !message.at("id").is_string()) {
        return malformed("response id missing");
    }

    WorkerResponse response;
    response.id = message.at("id").get<std::string>();
    const std::string type = message.value("type", "");
    if (type == "result") {
        response.type = ResponseType::Result;
    } else if (type == "error") {
        response.type = ResponseType::Error;
    } else if (type == "progress") {
        response.type = ResponseType::Progress;
    } else {
        return malformed("unknown response type '" + type + "'");
    }

    if (message.contains("result") && message.at("result").is_object()) {
        const auto& payload = message.at("result");
        ExecutionResult result;
        result.exit_code = payload.value("exitCode", 1);
        result.stdout_text = payload.value("stdout", "");
        result.stderr_text = payload.value("stderr", "");
        if (payload.contains("stdoutBinary") && payload.at("stdoutBinary").is_binary()) {
            result.stdout_binary = bytes_of(payload.at("stdoutBinary"));
        }
        if (payload.contains("error") && payload.at("error").is_string()) {
            result.error = payload.at("error").get<std::string>();
        }
        response.result = std::move(result);
    }
    if (message.contains("error") && message.at("error").is_string()) {
        response.error = message.at("error").get<std::string>();
    }
    if (message.contains("progress") && message.at("progress").is_string()) {
        response.progress = message.at("progress").get<std::string>();
    }
    return response;
}

Bytes encode_frame(const json& message) {
    const Bytes payload = json::to_cbor(message);
    const auto size = static_cast<std::uint32_t>(payload.size());
    Bytes frame;
    frame.reserve(payload.size() + 4);
    frame.push_back(static_cast<std::uint8_t>(size >> 24));
    frame.push_back(static_cast<std::uint8_t>(size >> 16));
    frame.push_back(static_cast<std::uint8_t>(size >> 8));
    frame.push_back(static_cast<std::uint8_t>(size));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

void FrameDecoder::append(const std::uint8_t* data, const std::size_t size) {
    if (offset_ > 0 && offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    }
    buffer_.insert(buffer_.end(), data, data + size);
}

std::optional<core::errors::Result<json>> FrameDecoder::next() {
    if (buffered() < 4) {
        return std::nullopt;
    }
    const std::uint8_t* head = buffer_.data() + offset_;
    const std::uint32_t length = (static_cast<std::uint32_t>(head[0]) << 24) |
                                 (static_cast<std::uint32_t>(head[1]) << 16) |
                                 (static_cast<std::uint32_t>(head[2]) << 8) |
                                 static_cast<std::uint32_t>(head[3]);
    if (length > kMaxFrameBytes) {
        return core::errors::Result<json>(malformed("frame exceeds size limit"));
    }
    if (buffered() < 4 + static_cast<std::size_t>(length)) {
        return std::nullopt;
    }

    const auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(offset_ + 4);
    const auto end = begin + static_cast<std::ptrdiff_t>(length);
    offset_ += 4 + length;
    json message = json::from_cbor(begin, end, true, false);
    if (message.is_discarded()) {
        return core::errors::Result<json>(malformed("invalid CBOR payload"));
    }
    return core::errors::Result<json>(std::move(message));
}

}  // namespace wasmbox::protocol

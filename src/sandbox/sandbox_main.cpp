#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/worker_protocol.hpp"
#include "runtime/wasi_host.hpp"
#include "sandbox/worker_process.hpp"
#include "vfs/memory_file_system.hpp"
#include "vfs/virtual_file_system.hpp"

// Isolate entry point: one request in on fd 0, one response out on fd 1,
// then exit. The parent kills this process on timeout or cancellation.

namespace {

using wasmbox::protocol::ResponseType;
using wasmbox::protocol::WorkerResponse;

bool send_response(const WorkerResponse& response) {
    const auto frame =
        wasmbox::protocol::encode_frame(wasmbox::protocol::response_to_json(response));
    return wasmbox::sandbox::write_all(STDOUT_FILENO, frame.data(), frame.size());
}

wasmbox::core::errors::Result<wasmbox::protocol::WorkerRequest> receive_request() {
    using wasmbox::core::errors::ErrorCategory;
    using wasmbox::core::errors::ToolError;

    std::uint8_t header[4];
    if (!wasmbox::sandbox::read_exact(STDIN_FILENO, header, sizeof(header))) {
        return ToolError{ErrorCategory::Execution, "Channel closed before a request arrived",
                         "protocol_error"};
    }
    const std::uint32_t length = (static_cast<std::uint32_t>(header[0]) << 24) |
                                 (static_cast<std::uint32_t>(header[1]) << 16) |
                                 (static_cast<std::uint32_t>(header[2]) << 8) |
                                 static_cast<std::uint32_t>(header[3]);
    if (length > wasmbox::protocol::kMaxFrameBytes) {
        return ToolError{ErrorCategory::Execution, "Request frame exceeds size limit",
                         "protocol_error"};
    }

    wasmbox::protocol::FrameDecoder decoder;
    decoder.append(header, sizeof(header));
    wasmbox::protocol::Bytes payload(length);
    if (!wasmbox::sandbox::read_exact(STDIN_FILENO, payload.data(), payload.size())) {
        return ToolError{ErrorCategory::Execution, "Channel closed mid-request",
                         "protocol_error"};
    }
    decoder.append(payload.data(), payload.size());

    auto message = decoder.next();
    if (!message.has_value()) {
        return ToolError{ErrorCategory::Execution, "Incomplete request frame",
                         "protocol_error"};
    }
    if (wasmbox::core::errors::is_error(*message)) {
        return wasmbox::core::errors::get_error(*message);
    }
    return wasmbox::protocol::request_from_json(wasmbox::core::errors::get_value(*message));
}

}  // namespace

int main() {
    auto received = receive_request();
    if (wasmbox::core::errors::is_error(received)) {
        LOG_ERROR("Sandbox rejected request [" +
                  wasmbox::core::errors::get_error(received).code +
                  "]: " + wasmbox::core::errors::get_error(received).message);
        return 2;
    }
    auto request = wasmbox::core::errors::take_value(received);
    wasmbox::core::logging::Logger::get().set_request_id(request.id);

    WorkerResponse response;
    response.id = request.id;
    try {
        // Only the files shipped in the request are visible, read-only
        auto files = std::make_shared<wasmbox::vfs::MemoryFileSystem>(request.options.files);
        const auto access = request.options.files.empty()
                                ? wasmbox::protocol::FileAccess::None
                                : wasmbox::protocol::FileAccess::Read;
        wasmbox::vfs::VirtualFileSystem vfs(access, files);

        wasmbox::runtime::HostSettings settings;
        settings.interrupt_on_timeout = false;
        settings.enforce_memory_limit = true;
        wasmbox::runtime::WasiHost host(settings);

        response.type = ResponseType::Result;
        response.result = host.execute(request.wasm_binary, request.args, request.options, vfs);
    } catch (const std::exception& e) {
        response.type = ResponseType::Error;
        response.result.reset();
        response.error = e.what();
    }

    if (!send_response(response)) {
        LOG_ERROR("Sandbox could not deliver its response");
        return 3;
    }
    return 0;
}

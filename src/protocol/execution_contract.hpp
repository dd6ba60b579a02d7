#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "core/config/limits.hpp"
#include "protocol/bytes.hpp"

namespace wasmbox::protocol {

struct ExecutionOptions {
    std::uint32_t timeout_ms = core::config::kDefaultTimeoutMs;
    std::uint32_t memory_pages = core::config::kMemoryPagesDefault;
    std::optional<std::string> stdin_text;
    // Wins over stdin_text when both are set
    std::optional<Bytes> stdin_binary;
    // Pre-loaded virtual files, path -> contents
    std::map<std::string, Bytes> files;
};

struct ExecutionResult {
    int exit_code = 0;
    std::string stdout_text;
    // Exact bytes whenever stdout is not valid UTF-8
    std::optional<Bytes> stdout_binary;
    std::string stderr_text;
    std::optional<std::string> error;
};

// What the wider application sees from ToolManager::execute_tool.
struct ToolExecutionResult {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::optional<std::string> error;
    std::optional<Bytes> stdout_binary;
    double duration_ms = 0.0;
};

inline std::uint32_t clamp_timeout_ms(std::optional<std::uint32_t> requested) {
    if (!requested.has_value()) {
        return core::config::kDefaultTimeoutMs;
    }
    return std::clamp(*requested, core::config::kMinTimeoutMs,
                      core::config::kMaxTimeoutMs);
}

inline std::uint32_t clamp_memory_pages(std::optional<std::uint32_t> requested) {
    if (!requested.has_value() || *requested == 0) {
        return core::config::kMemoryPagesDefault;
    }
    return std::min(*requested, core::config::kMaxMemoryPages);
}

}  // namespace wasmbox::protocol

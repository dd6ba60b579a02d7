#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <sys/types.h>
#include "core/errors/tool_errors.hpp"
#include "protocol/bytes.hpp"
#include "protocol/worker_protocol.hpp"

namespace wasmbox::sandbox {

struct WorkerProcess {
    pid_t pid = -1;
    // Parent end of the socket pair; the child sees its end as fds 0 and 1
    int channel_fd = -1;
};

// Starts one sandbox executable with an empty environment. stderr is
// inherited so the child's log lines reach the parent's stderr.
core::errors::Result<WorkerProcess> spawn_worker(const std::filesystem::path& executable);

void set_nonblocking(int fd);

enum class ChannelState {
    Open,
    Closed
};

// Non-blocking: moves whatever is readable into the decoder.
ChannelState drain_channel(int fd, protocol::FrameDecoder& decoder);

// Non-blocking: writes from frame[offset..] and advances offset.
ChannelState flush_channel(int fd, const protocol::Bytes& frame, std::size_t& offset);

// Blocking helpers for the sandbox side of the channel.
bool read_exact(int fd, std::uint8_t* data, std::size_t size);
bool write_all(int fd, const std::uint8_t* data, std::size_t size);

std::string describe_exit_status(int status);

}  // namespace wasmbox::sandbox

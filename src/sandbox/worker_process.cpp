#include "sandbox/worker_process.hpp"

#include <cerrno>
#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wasmbox::sandbox {

using core::errors::ErrorCategory;
using core::errors::ToolError;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

core::errors::Result<WorkerProcess> spawn_worker(const std::filesystem::path& executable) {
    if (access(executable.c_str(), X_OK) != 0) {
        return ToolError{ErrorCategory::Internal,
                         "Sandbox executable is not available: " + executable.string(),
                         "worker_unavailable"};
    }

    int channel[2] = {-1, -1};
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, channel) != 0) {
        return ToolError{ErrorCategory::Internal, "Failed to create worker channel.",
                         "channel_creation_failed"};
    }

    // Built before fork: the child may only make async-signal-safe calls
    const std::string program = executable.string();
    char* const child_argv[] = {const_cast<char*>(program.c_str()), nullptr};
    char* const child_env[] = {nullptr};
    const pid_t parent = getpid();
    const pid_t pid = fork();
    if (pid < 0) {
        static_cast<void>(close(channel[0]));
        static_cast<void>(close(channel[1]));
        return ToolError{ErrorCategory::Internal, "Failed to fork worker process.",
                         "fork_failed"};
    }

    if (pid == 0) {
        // Die with the parent so an abandoned isolate never outlives it
        static_cast<void>(prctl(PR_SET_PDEATHSIG, SIGKILL));
        if (getppid() != parent) {
            _exit(126);
        }
        static_cast<void>(dup2(channel[1], STDIN_FILENO));
        static_cast<void>(dup2(channel[1], STDOUT_FILENO));
        static_cast<void>(close(channel[0]));
        static_cast<void>(close(channel[1]));
        execve(program.c_str(), child_argv, child_env);
        _exit(127);
    }

    static_cast<void>(close(channel[1]));
    set_nonblocking(channel[0]);
    return WorkerProcess{pid, channel[0]};
}

ChannelState drain_channel(const int fd, protocol::FrameDecoder& decoder) {
    std::uint8_t buffer[16384];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            decoder.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return ChannelState::Closed;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return ChannelState::Open;
        }
        return ChannelState::Closed;
    }
}

ChannelState flush_channel(const int fd, const protocol::Bytes& frame, std::size_t& offset) {
    while (offset < frame.size()) {
        const ssize_t n = send(fd, frame.data() + offset, frame.size() - offset, MSG_NOSIGNAL);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return ChannelState::Open;
        }
        return ChannelState::Closed;
    }
    return ChannelState::Open;
}

bool read_exact(const int fd, std::uint8_t* data, const std::size_t size) {
    std::size_t done = 0;
    while (done < size) {
        const ssize_t n = read(fd, data + done, size - done);
        if (n > 0) {
            done += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
    return true;
}

bool write_all(const int fd, const std::uint8_t* data, const std::size_t size) {
    std::size_t done = 0;
    while (done < size) {
        const ssize_t n = send(fd, data + done, size - done, MSG_NOSIGNAL);
        if (n > 0) {
            done += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
    return true;
}

std::string describe_exit_status(const int status) {
    if (WIFEXITED(status)) {
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "stopped unexpectedly";
}

}  // namespace wasmbox::sandbox

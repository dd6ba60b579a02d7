#include "sandbox/worker_manager.hpp"

#include <cerrno>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"

namespace wasmbox::sandbox {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

// Peeks at a finished child without reaping it, so its pid stays reserved
// until the monitor's final waitpid.
std::string peek_exit_reason(const pid_t pid) {
    siginfo_t info{};
    if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0 ||
        info.si_pid != pid) {
        return "closed its channel";
    }
    if (info.si_code == CLD_EXITED) {
        return "exited with code " + std::to_string(info.si_status);
    }
    return "killed by signal " + std::to_string(info.si_status);
}

}  // namespace

WorkerManager::WorkerManager(std::filesystem::path worker_executable)
    : worker_executable_(std::move(worker_executable)) {}

WorkerManager::~WorkerManager() {
    cancel_all();

    std::unordered_map<std::string, std::thread> monitors;
    {
        std::lock_guard<std::mutex> lock(monitors_mutex_);
        monitors.swap(monitors_);
        finished_monitors_.clear();
    }
    for (auto& [id, thread] : monitors) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool WorkerManager::is_available() const {
    return !worker_executable_.empty() && access(worker_executable_.c_str(), X_OK) == 0;
}

core::errors::Result<WorkerExecution> WorkerManager::execute(
    protocol::Bytes wasm_binary, std::vector<std::string> args,
    protocol::ExecutionOptions options) {
    join_finished_monitors();

    auto spawned = spawn_worker(worker_executable_);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    const WorkerProcess process = core::errors::get_value(spawned);

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(options.timeout_ms);
    protocol::WorkerRequest request;
    request.id = core::config::generate_request_id();
    request.wasm_binary = std::move(wasm_binary);
    request.args = std::move(args);
    request.options = std::move(options);
    protocol::Bytes frame = protocol::encode_frame(protocol::request_to_json(request));

    PendingExecution entry;
    entry.worker_pid = process.pid;
    entry.deadline = deadline;
    WorkerExecution execution{request.id, entry.promise.get_future()};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.emplace(request.id, std::move(entry));
    }
    LOG_DEBUG("Spawned sandbox pid " + std::to_string(process.pid) + " for " + request.id);

    {
        std::lock_guard<std::mutex> lock(monitors_mutex_);
        monitors_.emplace(request.id,
                          std::thread(&WorkerManager::monitor, this, request.id, process,
                                      std::move(frame), deadline));
    }
    return execution;
}

bool WorkerManager::settle(const std::string& id, ExecutionOutcome outcome) {
    std::promise<ExecutionOutcome> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        promise = std::move(it->second.promise);
        static_cast<void>(kill(it->second.worker_pid, SIGKILL));
        pending_.erase(it);
    }
    promise.set_value(std::move(outcome));
    return true;
}

bool WorkerManager::is_pending(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) > 0;
}

bool WorkerManager::cancel(const std::string& id) {
    const bool cancelled = settle(
        id, ToolError{ErrorCategory::Cancelled, "Cancelled by user", "execution_cancelled"});
    if (cancelled) {
        LOG_INFO("Cancelled execution " + id);
    }
    return cancelled;
}

void WorkerManager::cancel_all() {
    for (const auto& id : running_ids()) {
        if (settle(id, ToolError{ErrorCategory::Cancelled, "All executions cancelled",
                                 "execution_cancelled"})) {
            LOG_INFO("Cancelled execution " + id);
        }
    }
}

bool WorkerManager::handle_response(const protocol::WorkerResponse& response) {
    if (!is_pending(response.id)) {
        LOG_WARN("Ignoring response for unknown execution: " + response.id);
        return false;
    }

    switch (response.type) {
        case protocol::ResponseType::Progress:
            LOG_DEBUG("Progress from " + response.id + ": " +
                      response.progress.value_or(""));
            return false;
        case protocol::ResponseType::Result:
            if (!response.result.has_value()) {
                return settle(response.id, ToolError{ErrorCategory::Execution,
                                                     "No result in response", "worker_error"});
            }
            return settle(response.id, *response.result);
        case protocol::ResponseType::Error:
            return settle(response.id,
                          ToolError{ErrorCategory::Execution,
                                    "Worker error: " +
                                        response.error.value_or("unknown failure"),
                                    "worker_error"});
    }
    return false;
}

std::size_t WorkerManager::running_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::vector<std::string> WorkerManager::running_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(pending_.size());
    for (const auto& [id, entry] : pending_) {
        ids.push_back(id);
    }
    return ids;
}

void WorkerManager::monitor(std::string id, WorkerProcess process, protocol::Bytes frame,
                            const std::chrono::steady_clock::time_point deadline) {
    protocol::FrameDecoder decoder;
    std::size_t written = 0;
    bool channel_open = true;

    while (is_pending(id)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            if (settle(id, ToolError{ErrorCategory::Timeout, "Execution timeout",
                                     "execution_timeout"})) {
                LOG_WARN("Execution " + id + " timed out; sandbox killed");
            }
            break;
        }

        pollfd pfd{};
        pfd.fd = process.channel_fd;
        pfd.events = static_cast<short>(POLLIN | (written < frame.size() ? POLLOUT : 0));
        static_cast<void>(poll(&pfd, 1, 50));

        if (written < frame.size() &&
            flush_channel(process.channel_fd, frame, written) == ChannelState::Closed) {
            channel_open = false;
        }
        if (drain_channel(process.channel_fd, decoder) == ChannelState::Closed) {
            channel_open = false;
        }

        while (auto message = decoder.next()) {
            if (core::errors::is_error(*message)) {
                settle(id, ToolError{ErrorCategory::Execution,
                                     "Worker error: " +
                                         core::errors::get_error(*message).message,
                                     "worker_error"});
                channel_open = false;
                break;
            }
            auto parsed = protocol::response_from_json(core::errors::get_value(*message));
            if (core::errors::is_error(parsed)) {
                settle(id, ToolError{ErrorCategory::Execution,
                                     "Worker error: " +
                                         core::errors::get_error(parsed).message,
                                     "worker_error"});
                channel_open = false;
                break;
            }
            handle_response(core::errors::get_value(parsed));
        }

        if (!channel_open) {
            if (is_pending(id)) {
                const std::string reason = peek_exit_reason(process.pid);
                settle(id, ToolError{ErrorCategory::Execution,
                                     "Worker error: sandbox " + reason +
                                         " without a result",
                                     "worker_error"});
            }
            break;
        }
    }

    static_cast<void>(close(process.channel_fd));
    static_cast<void>(kill(process.pid, SIGKILL));
    int status = 0;
    while (waitpid(process.pid, &status, 0) < 0 && errno == EINTR) {
    }
    LOG_DEBUG("Sandbox for " + id + " " + describe_exit_status(status));

    std::lock_guard<std::mutex> lock(monitors_mutex_);
    finished_monitors_.push_back(id);
}

void WorkerManager::join_finished_monitors() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(monitors_mutex_);
        for (const auto& id : finished_monitors_) {
            auto it = monitors_.find(id);
            if (it != monitors_.end()) {
                finished.push_back(std::move(it->second));
                monitors_.erase(it);
            }
        }
        finished_monitors_.clear();
    }
    for (auto& thread : finished) {
        thread.join();
    }
}

}  // namespace wasmbox::sandbox

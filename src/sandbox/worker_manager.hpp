#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <sys/types.h>
#include "core/errors/tool_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/worker_protocol.hpp"
#include "sandbox/worker_process.hpp"

namespace wasmbox::sandbox {

using ExecutionOutcome = core::errors::Result<protocol::ExecutionResult>;

struct WorkerExecution {
    std::string id;
    // Becomes ready exactly once: with a result, or with a ToolError for
    // timeout, cancellation and worker faults.
    std::future<ExecutionOutcome> outcome;
};

// One fresh sandbox process per call, no pooling. A monitor thread per call
// writes the request, reads the response and enforces the deadline.
// Whoever removes a pending entry settles it; nobody else can.
class WorkerManager {
public:
    explicit WorkerManager(std::filesystem::path worker_executable);
    ~WorkerManager();

    WorkerManager(const WorkerManager&) = delete;
    WorkerManager& operator=(const WorkerManager&) = delete;

    bool is_available() const;

    core::errors::Result<WorkerExecution> execute(protocol::Bytes wasm_binary,
                                                  std::vector<std::string> args,
                                                  protocol::ExecutionOptions options);

    // Unknown or already settled ids are a no-op returning false.
    bool cancel(const std::string& id);
    void cancel_all();

    // Entry point for every decoded response. Responses for ids that are no
    // longer pending are logged and dropped. Returns true if it settled a call.
    bool handle_response(const protocol::WorkerResponse& response);

    std::size_t running_count() const;
    std::vector<std::string> running_ids() const;

private:
    struct PendingExecution {
        std::promise<ExecutionOutcome> promise;
        pid_t worker_pid = -1;
        std::chrono::steady_clock::time_point deadline;
    };

    bool settle(const std::string& id, ExecutionOutcome outcome);
    bool is_pending(const std::string& id) const;
    void monitor(std::string id, WorkerProcess process, protocol::Bytes frame,
                 std::chrono::steady_clock::time_point deadline);
    void join_finished_monitors();

    std::filesystem::path worker_executable_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PendingExecution> pending_;

    std::mutex monitors_mutex_;
    std::unordered_map<std::string, std::thread> monitors_;
    std::vector<std::string> finished_monitors_;
};

}  // namespace wasmbox::sandbox

#pragma once

#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/execution_contract.hpp"
#include "session/execution_journal.hpp"
#include "tools/tool_adapter.hpp"
#include "tools/tool_store.hpp"

namespace wasmbox::sandbox {
class WorkerManager;
}

namespace wasmbox::tools {

// Asked once per call, before anything runs. Owned by the caller's UI layer.
using PermissionPredicate =
    std::function<std::future<bool>(const std::string& tool_name, const nlohmann::json& args)>;

struct ToolManagerOptions {
    // Real directory bridged into tools that declare file access. Without it
    // such tools see no filesystem at all.
    std::optional<std::filesystem::path> workspace_root;
    // Isolate executable. Missing or not executable means in-process only.
    std::optional<std::filesystem::path> worker_executable;
    // Run everything in-process even when the isolate is available.
    bool force_in_process = false;
};

struct PipeStep {
    std::string tool;
    nlohmann::json args = nlohmann::json::object();
};

class ToolManager {
public:
    ToolManager(std::shared_ptr<ToolStore> store, ToolManagerOptions options = {});
    ~ToolManager();

    ToolManager(const ToolManager&) = delete;
    ToolManager& operator=(const ToolManager&) = delete;

    void register_adapter(std::shared_ptr<ToolAdapter> adapter);
    void set_journal(std::shared_ptr<session::ExecutionJournal> journal);

    // Always becomes ready with a result; failures of any kind are failed
    // results, never exceptions. A null predicate allows everything.
    std::future<protocol::ToolExecutionResult> execute_tool(
        const std::string& name, nlohmann::json args, PermissionPredicate permission = {});

    // Feeds each step's stdout into the next step's stdin parameter. Stops at
    // the first failed step and returns its result.
    std::future<protocol::ToolExecutionResult> execute_pipe(
        std::vector<PipeStep> steps, PermissionPredicate permission = {});

    // Definitions of every adapter and enabled stored tool, by name.
    nlohmann::json ai_tool_definitions() const;

    bool isolate_available() const;
    void cancel_all();

private:
    protocol::ToolExecutionResult run(const std::string& name, const nlohmann::json& args,
                                      const PermissionPredicate& permission);
    protocol::ToolExecutionResult run_pipe(const std::vector<PipeStep>& steps,
                                           const PermissionPredicate& permission);
    protocol::ToolExecutionResult run_stored(const StoredTool& tool, const nlohmann::json& args,
                                             session::ExecutionPath& path);
    void journal(const std::string& request_id, const std::string& tool,
                 session::ExecutionPath path, const protocol::ToolExecutionResult& result);
    std::shared_ptr<ToolAdapter> find_adapter(const std::string& name) const;
    std::optional<protocol::ToolManifest> find_manifest(const std::string& name) const;

    std::shared_ptr<ToolStore> store_;
    ToolManagerOptions options_;
    std::unique_ptr<sandbox::WorkerManager> workers_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ToolAdapter>> adapters_;
    std::shared_ptr<session::ExecutionJournal> journal_;
};

// Failed result carrying `message` as both stderr and error.
protocol::ToolExecutionResult failed_result(const std::string& message, std::string stderr_text = "");

}  // namespace wasmbox::tools

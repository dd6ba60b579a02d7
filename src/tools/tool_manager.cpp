#include "tools/tool_manager.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "manifest/manifest_codec.hpp"
#include "pipeline/argument_converter.hpp"
#include "runtime/wasi_host.hpp"
#include "sandbox/worker_manager.hpp"
#include "vfs/local_file_system.hpp"
#include "vfs/virtual_file_system.hpp"

namespace wasmbox::tools {

using nlohmann::json;
using protocol::ToolExecutionResult;
using session::ExecutionPath;

namespace {

double elapsed_ms(const std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
        .count();
}

ToolExecutionResult from_execution(protocol::ExecutionResult result) {
    ToolExecutionResult out;
    out.success = result.exit_code == 0;
    out.exit_code = result.exit_code;
    out.stdout_text = std::move(result.stdout_text);
    out.stderr_text = std::move(result.stderr_text);
    out.stdout_binary = std::move(result.stdout_binary);
    out.error = std::move(result.error);
    return out;
}

}  // namespace

ToolExecutionResult failed_result(const std::string& message, std::string stderr_text) {
    ToolExecutionResult result;
    result.success = false;
    result.exit_code = 1;
    result.stderr_text = std::move(stderr_text);
    result.error = message;
    return result;
}

ToolManager::ToolManager(std::shared_ptr<ToolStore> store, ToolManagerOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
    if (options_.worker_executable.has_value()) {
        workers_ = std::make_unique<sandbox::WorkerManager>(*options_.worker_executable);
        if (!workers_->is_available()) {
            LOG_WARN("Sandbox executable unavailable, running tools in-process: " +
                     options_.worker_executable->string());
        }
    }
}

ToolManager::~ToolManager() {
    cancel_all();
}

void ToolManager::register_adapter(std::shared_ptr<ToolAdapter> adapter) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto name = adapter->manifest().name;
    adapters_[name] = std::move(adapter);
    LOG_DEBUG("Registered adapter " + name);
}

void ToolManager::set_journal(std::shared_ptr<session::ExecutionJournal> journal) {
    std::lock_guard<std::mutex> lock(mutex_);
    journal_ = std::move(journal);
}

bool ToolManager::isolate_available() const {
    return workers_ && workers_->is_available();
}

void ToolManager::cancel_all() {
    if (workers_) {
        workers_->cancel_all();
    }
}

std::future<ToolExecutionResult> ToolManager::execute_tool(const std::string& name, json args,
                                                           PermissionPredicate permission) {
    return std::async(std::launch::async,
                      [this, name, args = std::move(args), permission = std::move(permission)] {
                          return run(name, args, permission);
                      });
}

std::future<ToolExecutionResult> ToolManager::execute_pipe(std::vector<PipeStep> steps,
                                                           PermissionPredicate permission) {
    return std::async(std::launch::async,
                      [this, steps = std::move(steps), permission = std::move(permission)] {
                          return run_pipe(steps, permission);
                      });
}

std::shared_ptr<ToolAdapter> ToolManager::find_adapter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = adapters_.find(name);
    return it == adapters_.end() ? nullptr : it->second;
}

std::optional<protocol::ToolManifest> ToolManager::find_manifest(const std::string& name) const {
    if (const auto adapter = find_adapter(name)) {
        return adapter->manifest();
    }
    const auto stored = store_->find_by_name(name);
    if (!stored.has_value() || !stored->enabled) {
        return std::nullopt;
    }
    return stored->manifest;
}

ToolExecutionResult ToolManager::run(const std::string& name, const json& args,
                                     const PermissionPredicate& permission) {
    const auto start = std::chrono::steady_clock::now();
    const std::string request_id = core::config::generate_request_id();

    const auto adapter = find_adapter(name);
    std::optional<StoredTool> stored;
    if (!adapter) {
        stored = store_->find_by_name(name);
        if (!stored.has_value() || !stored->enabled) {
            auto result = failed_result("Tool not found: " + name);
            journal(request_id, name, ExecutionPath::None, result);
            return result;
        }
    }

    if (permission) {
        bool allowed = false;
        try {
            allowed = permission(name, args).get();
        } catch (const std::exception& e) {
            LOG_WARN("Permission check for " + name + " failed: " + e.what());
        }
        if (!allowed) {
            auto result = failed_result("Permission denied");
            journal(request_id, name, ExecutionPath::None, result);
            return result;
        }
    }

    ExecutionPath path = ExecutionPath::None;
    ToolExecutionResult result;
    if (adapter) {
        path = ExecutionPath::Adapter;
        try {
            result = adapter->execute(args);
        } catch (const std::exception& e) {
            result = failed_result(e.what(), e.what());
        }
    } else {
        result = run_stored(*stored, args, path);
    }

    result.duration_ms = elapsed_ms(start);
    journal(request_id, name, path, result);
    return result;
}

ToolExecutionResult ToolManager::run_stored(const StoredTool& tool, const json& args,
                                            ExecutionPath& path) {
    const auto& manifest = tool.manifest;

    auto converted = pipeline::convert_arguments(manifest, args);
    if (core::errors::is_error(converted)) {
        const auto& error = core::errors::get_error(converted);
        LOG_ERROR("Argument conversion for " + manifest.name + " failed: " + error.message);
        return failed_result(error.message, error.message);
    }
    auto arguments = core::errors::take_value(converted);

    protocol::ExecutionOptions options;
    options.timeout_ms = protocol::clamp_timeout_ms(manifest.execution.timeout_ms);
    options.memory_pages = protocol::clamp_memory_pages(manifest.execution.memory_limit_pages);
    options.stdin_text = std::move(arguments.stdin_text);
    options.stdin_binary = std::move(arguments.stdin_binary);

    const bool wants_files = manifest.execution.file_access != protocol::FileAccess::None &&
                             options_.workspace_root.has_value();
    if (options_.force_in_process || wants_files || !isolate_available()) {
        path = ExecutionPath::InProcess;
        std::shared_ptr<vfs::FileSystem> backend;
        if (options_.workspace_root.has_value()) {
            backend = std::make_shared<vfs::LocalFileSystem>(*options_.workspace_root);
        }
        vfs::VirtualFileSystem vfs(manifest.execution.file_access, backend);
        const runtime::WasiHost host;
        return from_execution(host.execute(*tool.wasm_binary, arguments.argv, options, vfs));
    }

    path = ExecutionPath::Worker;
    auto started = workers_->execute(*tool.wasm_binary, std::move(arguments.argv),
                                     std::move(options));
    if (core::errors::is_error(started)) {
        const auto& error = core::errors::get_error(started);
        return failed_result(error.message, error.message);
    }
    auto execution = core::errors::take_value(started);
    auto outcome = execution.outcome.get();
    if (core::errors::is_error(outcome)) {
        const auto& error = core::errors::get_error(outcome);
        return failed_result(error.message, error.message);
    }
    return from_execution(core::errors::take_value(outcome));
}

ToolExecutionResult ToolManager::run_pipe(const std::vector<PipeStep>& steps,
                                          const PermissionPredicate& permission) {
    if (steps.empty()) {
        return failed_result("Pipe requires at least one step");
    }

    ToolExecutionResult previous;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        const auto& step = steps[i];
        json args = step.args.is_object() ? step.args : json::object();

        if (i > 0) {
            const auto manifest = find_manifest(step.tool);
            if (!manifest.has_value()) {
                return failed_result("Tool not found: " + step.tool);
            }
            if (!manifest->pipeable || !manifest->execution.stdin_param_name.has_value()) {
                return failed_result("Tool " + step.tool + " cannot receive piped input");
            }
            args[*manifest->execution.stdin_param_name] = previous.stdout_text;
        }

        auto result = run(step.tool, args, permission);
        if (!result.success) {
            const std::string reason = result.error.has_value()
                                           ? *result.error
                                           : "exit code " + std::to_string(result.exit_code);
            result.error = "Pipe step " + std::to_string(i + 1) + " (" + step.tool +
                           ") failed: " + reason;
            return result;
        }
        previous = std::move(result);
    }
    return previous;
}

json ToolManager::ai_tool_definitions() const {
    json definitions = json::array();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, adapter] : adapters_) {
            definitions.push_back(manifest::to_ai_tool_definition(adapter->manifest()));
        }
    }
    for (const auto& tool : store_->enabled()) {
        if (!find_adapter(tool.manifest.name)) {
            definitions.push_back(manifest::to_ai_tool_definition(tool.manifest));
        }
    }
    return definitions;
}

void ToolManager::journal(const std::string& request_id, const std::string& tool,
                          const ExecutionPath path, const ToolExecutionResult& result) {
    std::shared_ptr<session::ExecutionJournal> journal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        journal = journal_;
    }
    if (!journal) {
        return;
    }

    session::JournalEntry entry;
    entry.request_id = request_id;
    entry.tool = tool;
    entry.path = path;
    entry.success = result.success;
    entry.exit_code = result.exit_code;
    entry.duration_ms = result.duration_ms;
    entry.error = result.error;

    const auto recorded = journal->record(entry);
    if (core::errors::is_error(recorded)) {
        LOG_WARN("Unable to journal execution " + request_id + ": " +
                 core::errors::get_error(recorded).message);
    }
}

}  // namespace wasmbox::tools

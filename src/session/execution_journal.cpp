#include "session/execution_journal.hpp"

#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/request_id.hpp"

namespace wasmbox::session {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

std::string to_string(const ExecutionPath path) {
    switch (path) {
        case ExecutionPath::Adapter: return "adapter";
        case ExecutionPath::InProcess: return "in_process";
        case ExecutionPath::Worker: return "worker";
        case ExecutionPath::None: return "none";
    }
    return "unknown";
}

ExecutionJournal::ExecutionJournal(std::filesystem::path workspace_root,
                                   std::filesystem::path journal_subdir)
    : workspace_root_(std::move(workspace_root)),
      journal_subdir_(std::move(journal_subdir)) {}

core::errors::Result<std::filesystem::path> ExecutionJournal::journal_path() const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root_, ec) || ec) {
        return ToolError{ErrorCategory::Input,
                         "Workspace root does not exist: " + workspace_root_.string(),
                         "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return ToolError{ErrorCategory::Input,
                         "Workspace root is not a directory: " + workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return ToolError{ErrorCategory::Input,
                         "Unable to resolve workspace root: " + workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    const auto journal_dir = canonical_root / journal_subdir_;
    std::filesystem::create_directories(journal_dir, ec);
    if (ec) {
        return ToolError{ErrorCategory::Internal,
                         "Unable to create journal directory: " + journal_dir.string(),
                         "journal_dir_create_failed"};
    }
    return journal_dir / "executions.jsonl";
}

core::errors::Result<std::filesystem::path> ExecutionJournal::record(const JournalEntry& entry) {
    json event;
    event["ts_unix_ms"] = core::config::now_unix_ms();
    event["event"] = entry.event;
    event["request_id"] = entry.request_id;
    event["tool"] = entry.tool;
    event["path"] = to_string(entry.path);
    event["success"] = entry.success;
    event["exit_code"] = entry.exit_code;
    event["duration_ms"] = entry.duration_ms;
    event["error"] = entry.error.has_value() ? entry.error.value() : "";

    std::lock_guard<std::mutex> lock(mutex_);
    auto path_result = journal_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return ToolError{ErrorCategory::Internal, "Unable to open journal file: " + path.string(),
                         "journal_open_failed"};
    }

    out << event.dump() << "\n";
    if (!out.good()) {
        return ToolError{ErrorCategory::Internal,
                         "Unable to write journal event: " + path.string(),
                         "journal_write_failed"};
    }
    return path;
}

}  // namespace wasmbox::session

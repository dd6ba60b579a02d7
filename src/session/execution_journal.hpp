#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/tool_errors.hpp"

namespace wasmbox::session {

enum class ExecutionPath {
    Adapter,
    InProcess,
    Worker,
    None  // rejected before dispatch
};

std::string to_string(ExecutionPath path);

struct JournalEntry {
    std::string event = "execution";
    std::string request_id;
    std::string tool;
    ExecutionPath path = ExecutionPath::None;
    bool success = false;
    int exit_code = 0;
    double duration_ms = 0.0;
    std::optional<std::string> error;
};

// Append-only JSONL record of tool executions, one line per call.
class ExecutionJournal {
public:
    explicit ExecutionJournal(std::filesystem::path workspace_root,
                              std::filesystem::path journal_subdir = ".wasmbox");

    core::errors::Result<std::filesystem::path> record(const JournalEntry& entry);

    core::errors::Result<std::filesystem::path> journal_path() const;

private:
    std::filesystem::path workspace_root_;
    std::filesystem::path journal_subdir_;
    std::mutex mutex_;
};

}  // namespace wasmbox::session

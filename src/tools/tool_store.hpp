#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/tool_errors.hpp"
#include "manifest/package_loader.hpp"
#include "protocol/bytes.hpp"
#include "protocol/manifest.hpp"

namespace wasmbox::tools {

enum class ToolSource {
    Builtin,
    User
};

std::string to_string(ToolSource source);

struct StoredTool {
    std::string id;
    protocol::ToolManifest manifest;
    // Shared so a running call keeps its bytes alive across uninstall
    std::shared_ptr<const protocol::Bytes> wasm_binary;
    ToolSource source = ToolSource::User;
    bool enabled = true;
    std::int64_t installed_at_ms = 0;
    std::int64_t updated_at_ms = 0;
};

// One entry of the built-in registry file.
struct BuiltinToolConfig {
    std::string name;
    std::string category;
    std::string wasm_url;
    bool enabled_by_default = true;
    protocol::ToolManifest manifest;
};

// Resolves a registry wasmUrl to raw bytes.
using BinaryFetcher = std::function<core::errors::Result<protocol::Bytes>(const std::string&)>;

// Reads a JSON array of {name, category, wasmUrl, enabledByDefault, manifest}.
core::errors::Result<std::vector<BuiltinToolConfig>> load_builtin_registry(
    const std::filesystem::path& registry_file);

// Fetches wasmUrl relative to base_directory. Absolute URLs and ".." are refused.
BinaryFetcher make_directory_fetcher(std::filesystem::path base_directory);

// The active tool set. At most one tool per name. Thread-safe.
//
// A store built with a workspace root writes every change through to
// <workspace>/.wasmbox/tools.json and reads it back with load(). A change
// that cannot be written is rolled back and reported.
class ToolStore {
public:
    ToolStore() = default;
    explicit ToolStore(std::filesystem::path workspace_root,
                       std::filesystem::path registry_subdir = ".wasmbox");

    // Replaces the in-memory set with the persisted one. A missing registry
    // file is an empty store. Returns how many tools were read.
    core::errors::Result<std::size_t> load();

    core::errors::Result<std::filesystem::path> registry_path() const;
    bool is_persistent() const { return workspace_root_.has_value(); }

    core::errors::Result<StoredTool> install(manifest::LoadedPackage package);
    core::errors::Result<std::string> uninstall(const std::string& id);
    core::errors::Result<StoredTool> set_enabled(const std::string& id, bool enabled);

    std::optional<StoredTool> find_by_name(const std::string& name) const;
    std::optional<StoredTool> find_by_id(const std::string& id) const;
    std::vector<StoredTool> all() const;
    std::vector<StoredTool> enabled() const;
    std::size_t size() const;

    // Registers missing built-ins and re-syncs the manifest of present ones.
    // Per-tool failures are logged and skipped. Returns how many were newly
    // registered.
    std::size_t bootstrap_builtins(const std::vector<BuiltinToolConfig>& registry,
                                   const BinaryFetcher& fetcher);

private:
    std::vector<StoredTool> sorted_locked(bool enabled_only) const;
    core::errors::Result<std::filesystem::path> persist_locked() const;

    std::optional<std::filesystem::path> workspace_root_;
    std::filesystem::path registry_subdir_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoredTool> tools_;
};

}  // namespace wasmbox::tools

#include "tools/tool_store.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/request_id.hpp"
#include "core/encoding/base64.hpp"
#include "core/logging/logger.hpp"
#include "manifest/manifest_codec.hpp"

namespace wasmbox::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

ToolError registry_error(const std::string& message) {
    return ToolError{ErrorCategory::Configuration, message, "invalid_builtin_registry"};
}

ToolError not_found(const std::string& id) {
    return ToolError{ErrorCategory::Input, "Tool not found: " + id, "tool_not_found"};
}

ToolError tool_registry_error(const std::string& message) {
    return ToolError{ErrorCategory::Configuration, message, "invalid_tool_registry"};
}

nlohmann::ordered_json stored_tool_to_json(const StoredTool& tool) {
    nlohmann::ordered_json entry;
    entry["id"] = tool.id;
    entry["source"] = to_string(tool.source);
    entry["enabled"] = tool.enabled;
    entry["installedAt"] = tool.installed_at_ms;
    entry["updatedAt"] = tool.updated_at_ms;
    entry["manifest"] = manifest::manifest_to_json(tool.manifest);
    entry["wasm"] = core::encoding::base64_encode(*tool.wasm_binary);
    return entry;
}

core::errors::Result<StoredTool> stored_tool_from_json(const nlohmann::ordered_json& entry) {
    if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string() ||
        !entry.contains("manifest") || !entry.contains("wasm") || !entry["wasm"].is_string()) {
        return tool_registry_error("Tool registry entries need id, manifest and wasm");
    }

    StoredTool tool;
    tool.id = entry["id"].get<std::string>();
    auto manifest = manifest::parse_manifest_json(entry["manifest"]);
    if (core::errors::is_error(manifest)) {
        return tool_registry_error("Stored tool " + tool.id + ": " +
                                   core::errors::get_error(manifest).message);
    }
    tool.manifest = core::errors::take_value(manifest);

    auto binary = core::encoding::base64_decode(entry["wasm"].get<std::string>());
    if (core::errors::is_error(binary)) {
        return tool_registry_error("Stored tool " + tool.id + " has an unreadable binary");
    }
    tool.wasm_binary = std::make_shared<const protocol::Bytes>(core::errors::take_value(binary));

    const auto source = entry.value("source", std::string("user"));
    tool.source = source == "builtin" ? ToolSource::Builtin : ToolSource::User;
    tool.enabled = entry.value("enabled", true);
    tool.installed_at_ms = entry.value("installedAt", std::int64_t{0});
    tool.updated_at_ms = entry.value("updatedAt", tool.installed_at_ms);
    return tool;
}

}  // namespace

std::string to_string(const ToolSource source) {
    switch (source) {
        case ToolSource::Builtin: return "builtin";
        case ToolSource::User: return "user";
    }
    return "unknown";
}

core::errors::Result<std::vector<BuiltinToolConfig>> load_builtin_registry(
    const std::filesystem::path& registry_file) {
    std::ifstream in(registry_file);
    if (!in.is_open()) {
        return ToolError{ErrorCategory::Configuration,
                         "Unable to open built-in registry: " + registry_file.string(),
                         "registry_open_failed"};
    }

    const auto document = nlohmann::ordered_json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return registry_error("Invalid JSON in built-in registry: " + registry_file.string());
    }
    if (!document.is_array()) {
        return registry_error("Built-in registry must be a JSON array");
    }

    std::vector<BuiltinToolConfig> configs;
    for (const auto& entry : document) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string() ||
            !entry.contains("wasmUrl") || !entry["wasmUrl"].is_string() ||
            !entry.contains("manifest")) {
            return registry_error(
                "Built-in registry entries need name, wasmUrl and manifest");
        }

        BuiltinToolConfig config;
        config.name = entry["name"].get<std::string>();
        config.wasm_url = entry["wasmUrl"].get<std::string>();
        if (entry.contains("category") && entry["category"].is_string()) {
            config.category = entry["category"].get<std::string>();
        }
        if (entry.contains("enabledByDefault") && entry["enabledByDefault"].is_boolean()) {
            config.enabled_by_default = entry["enabledByDefault"].get<bool>();
        }

        auto manifest = manifest::parse_manifest_json(entry["manifest"]);
        if (core::errors::is_error(manifest)) {
            auto error = core::errors::get_error(manifest);
            error.message = "Built-in tool " + config.name + ": " + error.message;
            return error;
        }
        config.manifest = core::errors::take_value(manifest);
        if (config.manifest.name != config.name) {
            return registry_error("Built-in tool " + config.name +
                                  " declares manifest name " + config.manifest.name);
        }
        configs.push_back(std::move(config));
    }
    return configs;
}

BinaryFetcher make_directory_fetcher(std::filesystem::path base_directory) {
    return [base = std::move(base_directory)](
               const std::string& url) -> core::errors::Result<protocol::Bytes> {
        const std::filesystem::path relative(url);
        const bool escapes = std::any_of(relative.begin(), relative.end(),
                                         [](const auto& part) { return part.string() == ".."; });
        if (relative.is_absolute() || url.find("://") != std::string::npos || escapes) {
            return ToolError{ErrorCategory::Policy,
                             "Built-in binaries must be same-origin relative paths: " + url,
                             "path_outside_workspace"};
        }

        const auto path = base / relative;
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            return ToolError{ErrorCategory::Input, "Failed to fetch built-in binary: " + url,
                             "fetch_failed"};
        }
        return protocol::Bytes(std::istreambuf_iterator<char>(in),
                               std::istreambuf_iterator<char>());
    };
}

ToolStore::ToolStore(std::filesystem::path workspace_root,
                     std::filesystem::path registry_subdir)
    : workspace_root_(std::move(workspace_root)),
      registry_subdir_(std::move(registry_subdir)) {}

core::errors::Result<std::filesystem::path> ToolStore::registry_path() const {
    if (!workspace_root_.has_value()) {
        return ToolError{ErrorCategory::Configuration, "Tool store has no workspace",
                         "invalid_workspace_root"};
    }
    const auto& root = *workspace_root_;
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return ToolError{ErrorCategory::Input,
                         "Workspace root is not a directory: " + root.string(),
                         "invalid_workspace_root"};
    }
    const auto canonical_root = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return ToolError{ErrorCategory::Input,
                         "Unable to resolve workspace root: " + root.string(),
                         "invalid_workspace_root"};
    }
    return canonical_root / registry_subdir_ / "tools.json";
}

core::errors::Result<std::size_t> ToolStore::load() {
    auto path_result = registry_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::unordered_map<std::string, StoredTool> loaded;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream in(path);
        if (!in.is_open()) {
            return ToolError{ErrorCategory::Internal,
                             "Unable to open tool registry: " + path.string(),
                             "registry_open_failed"};
        }
        const auto document = nlohmann::ordered_json::parse(in, nullptr, false);
        if (document.is_discarded() || !document.is_object() || !document.contains("tools") ||
            !document["tools"].is_array()) {
            return tool_registry_error("Invalid tool registry: " + path.string());
        }
        for (const auto& entry : document["tools"]) {
            auto tool = stored_tool_from_json(entry);
            if (core::errors::is_error(tool)) {
                return core::errors::get_error(tool);
            }
            auto stored = core::errors::take_value(tool);
            const auto name = stored.manifest.name;
            if (!loaded.emplace(name, std::move(stored)).second) {
                return tool_registry_error("Tool registry lists \"" + name + "\" twice");
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tools_ = std::move(loaded);
    LOG_DEBUG("Loaded " + std::to_string(tools_.size()) + " tools from " + path.string());
    return tools_.size();
}

core::errors::Result<std::filesystem::path> ToolStore::persist_locked() const {
    auto path_result = registry_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return ToolError{ErrorCategory::Internal,
                         "Unable to create registry directory: " + path.parent_path().string(),
                         "registry_dir_create_failed"};
    }

    nlohmann::ordered_json tools = nlohmann::ordered_json::array();
    for (const auto& tool : sorted_locked(false)) {
        tools.push_back(stored_tool_to_json(tool));
    }
    nlohmann::ordered_json document;
    document["version"] = 1;
    document["tools"] = std::move(tools);

    // Written beside the target and renamed so a reader never sees half a file
    auto staging = path;
    staging += ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out.is_open()) {
            return ToolError{ErrorCategory::Internal,
                             "Unable to open tool registry: " + staging.string(),
                             "registry_write_failed"};
        }
        out << document.dump(2) << '\n';
        if (!out) {
            return ToolError{ErrorCategory::Internal,
                             "Unable to write tool registry: " + staging.string(),
                             "registry_write_failed"};
        }
    }
    std::filesystem::rename(staging, path, ec);
    if (ec) {
        std::filesystem::remove(staging, ec);
        return ToolError{ErrorCategory::Internal,
                         "Unable to replace tool registry: " + path.string(),
                         "registry_write_failed"};
    }
    return path;
}

core::errors::Result<StoredTool> ToolStore::install(manifest::LoadedPackage package) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string name = package.manifest.name;
    if (tools_.count(name) > 0) {
        return ToolError{ErrorCategory::Validation,
                         "Tool \"" + name +
                             "\" is already installed. Uninstall it first to reinstall.",
                         "tool_already_installed"};
    }

    const auto now = core::config::now_unix_ms();
    StoredTool tool;
    tool.id = core::config::generate_uuid();
    tool.manifest = std::move(package.manifest);
    tool.wasm_binary = std::make_shared<const protocol::Bytes>(std::move(package.wasm_binary));
    tool.source = ToolSource::User;
    tool.enabled = true;
    tool.installed_at_ms = now;
    tool.updated_at_ms = now;

    tools_.emplace(name, tool);
    if (is_persistent()) {
        auto persisted = persist_locked();
        if (core::errors::is_error(persisted)) {
            tools_.erase(name);
            return core::errors::get_error(persisted);
        }
    }
    LOG_INFO("Installed tool " + name + " as " + tool.id);
    return tool;
}

core::errors::Result<std::string> ToolStore::uninstall(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::find_if(tools_.begin(), tools_.end(),
                                 [&](const auto& entry) { return entry.second.id == id; });
    if (it == tools_.end()) {
        return not_found(id);
    }
    if (it->second.source == ToolSource::Builtin) {
        return ToolError{ErrorCategory::Policy,
                         "Cannot uninstall built-in tools. You can disable them instead.",
                         "builtin_uninstall_refused"};
    }

    std::string name = it->first;
    StoredTool removed = std::move(it->second);
    tools_.erase(it);
    if (is_persistent()) {
        auto persisted = persist_locked();
        if (core::errors::is_error(persisted)) {
            tools_.emplace(name, std::move(removed));
            return core::errors::get_error(persisted);
        }
    }
    LOG_INFO("Uninstalled tool " + name);
    return name;
}

core::errors::Result<StoredTool> ToolStore::set_enabled(const std::string& id,
                                                        const bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, tool] : tools_) {
        if (tool.id == id) {
            const StoredTool previous = tool;
            tool.enabled = enabled;
            tool.updated_at_ms = core::config::now_unix_ms();
            if (is_persistent()) {
                auto persisted = persist_locked();
                if (core::errors::is_error(persisted)) {
                    tool = previous;
                    return core::errors::get_error(persisted);
                }
            }
            LOG_DEBUG((enabled ? "Enabled tool " : "Disabled tool ") + name);
            return tool;
        }
    }
    return not_found(id);
}

std::optional<StoredTool> ToolStore::find_by_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tools_.find(name);
    if (it == tools_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<StoredTool> ToolStore::find_by_id(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, tool] : tools_) {
        if (tool.id == id) {
            return tool;
        }
    }
    return std::nullopt;
}

std::vector<StoredTool> ToolStore::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_locked(false);
}

std::vector<StoredTool> ToolStore::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_locked(true);
}

std::size_t ToolStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

std::vector<StoredTool> ToolStore::sorted_locked(const bool enabled_only) const {
    std::vector<StoredTool> out;
    for (const auto& [name, tool] : tools_) {
        if (!enabled_only || tool.enabled) {
            out.push_back(tool);
        }
    }
    std::sort(out.begin(), out.end(), [](const StoredTool& a, const StoredTool& b) {
        return a.manifest.name < b.manifest.name;
    });
    return out;
}

std::size_t ToolStore::bootstrap_builtins(const std::vector<BuiltinToolConfig>& registry,
                                          const BinaryFetcher& fetcher) {
    std::size_t loaded = 0;
    bool changed = false;
    for (const auto& config : registry) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = tools_.find(config.manifest.name);
            if (it != tools_.end()) {
                if (it->second.source == ToolSource::Builtin) {
                    it->second.manifest = config.manifest;
                    it->second.updated_at_ms = core::config::now_unix_ms();
                    changed = true;
                    LOG_DEBUG("Re-synced manifest for built-in tool " + config.name);
                }
                continue;
            }
        }

        auto fetched = fetcher(config.wasm_url);
        if (core::errors::is_error(fetched)) {
            LOG_WARN("Failed to load built-in tool " + config.name + ": " +
                     core::errors::get_error(fetched).message);
            continue;
        }
        auto binary = manifest::validate_wasm_binary(core::errors::take_value(fetched));
        if (core::errors::is_error(binary)) {
            LOG_WARN("Invalid WASM binary for built-in tool: " + config.name);
            continue;
        }

        const auto now = core::config::now_unix_ms();
        StoredTool tool;
        tool.id = "builtin-" + config.name;
        tool.manifest = config.manifest;
        tool.wasm_binary =
            std::make_shared<const protocol::Bytes>(core::errors::take_value(binary));
        tool.source = ToolSource::Builtin;
        tool.enabled = config.enabled_by_default;
        tool.installed_at_ms = now;
        tool.updated_at_ms = now;

        std::lock_guard<std::mutex> lock(mutex_);
        if (tools_.emplace(config.manifest.name, std::move(tool)).second) {
            ++loaded;
            changed = true;
        }
    }
    if (changed && is_persistent()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto persisted = persist_locked();
        if (core::errors::is_error(persisted)) {
            LOG_WARN("Built-in tools were not persisted: " +
                     core::errors::get_error(persisted).message);
        }
    }
    LOG_INFO("Loaded " + std::to_string(loaded) + " built-in tools");
    return loaded;
}

}  // namespace wasmbox::tools

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include "core/errors/tool_errors.hpp"
#include "protocol/manifest.hpp"

namespace wasmbox::policy {

enum class AccessIntent {
    Read,
    Write
};

class PolicyGuard {
public:
    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    // none forbids everything, read forbids writes, write forbids reads.
    core::errors::Result<AccessIntent> check_file_access(
        protocol::FileAccess granted, AccessIntent intent) const;

    // Strips the leading slash, drops "." segments and lets ".." pop one
    // accumulated segment. ".." at the root is absorbed.
    static std::string normalize_virtual_path(std::string_view path);

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
};

}  // namespace wasmbox::policy

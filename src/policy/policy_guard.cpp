#include "policy/policy_guard.hpp"

#include <system_error>
#include <vector>

namespace wasmbox::policy {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using protocol::FileAccess;

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return ToolError{ErrorCategory::Input,
                         "Workspace root does not exist: " + workspace_root.string(),
                         "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return ToolError{ErrorCategory::Input,
                         "Workspace root is not a directory: " + workspace_root.string(),
                         "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return ToolError{ErrorCategory::Input,
                         "Unable to resolve workspace root: " + workspace_root.string(),
                         "invalid_workspace_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    // weakly_canonical follows symlinks, so a link pointing outside is caught here
    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ToolError{ErrorCategory::Input,
                         "Unable to resolve target path: " + target_path.string(),
                         "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return ToolError{ErrorCategory::Policy,
                         "Path escapes workspace root: " + canonical_candidate.string(),
                         "path_outside_workspace"};
    }

    return canonical_candidate;
}

core::errors::Result<AccessIntent> PolicyGuard::check_file_access(
    const FileAccess granted, const AccessIntent intent) const {
    if (granted == FileAccess::None) {
        return ToolError{ErrorCategory::Policy,
                         "File system access is not allowed for this tool",
                         "file_access_denied"};
    }
    if (intent == AccessIntent::Write && granted == FileAccess::Read) {
        return ToolError{ErrorCategory::Policy,
                         "Write access is not allowed for this tool",
                         "file_access_denied"};
    }
    if (intent == AccessIntent::Read && granted == FileAccess::Write) {
        return ToolError{ErrorCategory::Policy,
                         "Read access is not allowed for this tool",
                         "file_access_denied"};
    }
    return intent;
}

std::string PolicyGuard::normalize_virtual_path(std::string_view path) {
    std::vector<std::string_view> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        const auto end = path.find('/', start);
        const auto segment = path.substr(
            start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }

    std::string normalized;
    for (const auto& segment : segments) {
        if (!normalized.empty()) {
            normalized += '/';
        }
        normalized.append(segment.data(), segment.size());
    }
    return normalized;
}

}  // namespace wasmbox::policy

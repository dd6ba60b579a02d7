#include "vfs/memory_file_system.hpp"

#include <set>
#include "policy/policy_guard.hpp"

namespace wasmbox::vfs {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

ToolError not_found(const std::string& path) {
    return ToolError{ErrorCategory::Input, "File not found: /" + path, "file_not_found"};
}

}  // namespace

MemoryFileSystem::MemoryFileSystem(const std::map<std::string, protocol::Bytes>& files) {
    for (const auto& [path, contents] : files) {
        files_[policy::PolicyGuard::normalize_virtual_path(path)] = contents;
    }
}

bool MemoryFileSystem::is_directory(const std::string& path) const {
    if (path.empty()) {
        return true;
    }
    const std::string prefix = path + "/";
    const auto it = files_.lower_bound(prefix);
    return it != files_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

core::errors::Result<protocol::Bytes> MemoryFileSystem::read_file(const std::string& path) {
    const auto it = files_.find(path);
    if (it == files_.end()) {
        if (is_directory(path)) {
            return ToolError{ErrorCategory::Input, "Is a directory: /" + path,
                             "is_directory"};
        }
        return not_found(path);
    }
    return it->second;
}

core::errors::Result<std::size_t> MemoryFileSystem::write_file(
    const std::string& path, const protocol::Bytes& data) {
    if (path.empty() || is_directory(path)) {
        return ToolError{ErrorCategory::Input, "Is a directory: /" + path,
                         "is_directory"};
    }
    files_[path] = data;
    return data.size();
}

core::errors::Result<FileStat> MemoryFileSystem::stat(const std::string& path) {
    FileStat info;
    const auto it = files_.find(path);
    if (it != files_.end()) {
        info.is_file = true;
        info.size = it->second.size();
        return info;
    }
    if (is_directory(path)) {
        info.is_directory = true;
        return info;
    }
    return not_found(path);
}

bool MemoryFileSystem::exists(const std::string& path) {
    return files_.count(path) > 0 || is_directory(path);
}

core::errors::Result<std::vector<std::string>> MemoryFileSystem::readdir(
    const std::string& path) {
    if (!is_directory(path)) {
        return files_.count(path) > 0
                   ? ToolError{ErrorCategory::Input, "Not a directory: /" + path,
                               "not_directory"}
                   : not_found(path);
    }

    const std::string prefix = path.empty() ? std::string() : path + "/";
    std::set<std::string> children;
    for (auto it = files_.lower_bound(prefix); it != files_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        const auto rest = it->first.substr(prefix.size());
        children.insert(rest.substr(0, rest.find('/')));
    }
    return std::vector<std::string>(children.begin(), children.end());
}

}  // namespace wasmbox::vfs

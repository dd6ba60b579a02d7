#include "vfs/local_file_system.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>
#include <sys/stat.h>

namespace wasmbox::vfs {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

ToolError not_found(const std::string& path) {
    return ToolError{ErrorCategory::Input, "File not found: /" + path, "file_not_found"};
}

}  // namespace

LocalFileSystem::LocalFileSystem(std::filesystem::path workspace_root)
    : workspace_root_(std::move(workspace_root)) {}

core::errors::Result<std::filesystem::path> LocalFileSystem::resolve(
    const std::string& path) const {
    return guard_.validate_path_in_workspace(workspace_root_, path);
}

core::errors::Result<protocol::Bytes> LocalFileSystem::read_file(const std::string& path) {
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& target = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(target, ec)) {
        return ToolError{ErrorCategory::Input, "Is a directory: /" + path, "is_directory"};
    }
    std::ifstream in(target, std::ios::binary);
    if (!in.is_open()) {
        return not_found(path);
    }
    protocol::Bytes bytes((std::istreambuf_iterator<char>(in)),
                          std::istreambuf_iterator<char>());
    return bytes;
}

core::errors::Result<std::size_t> LocalFileSystem::write_file(
    const std::string& path, const protocol::Bytes& data) {
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& target = core::errors::get_value(resolved);

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return ToolError{ErrorCategory::Execution,
                         "Unable to create directory for /" + path, "file_write_failed"};
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ToolError{ErrorCategory::Execution, "Unable to open /" + path + " for writing",
                         "file_write_failed"};
    }
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out.good()) {
        return ToolError{ErrorCategory::Execution, "Unable to write /" + path,
                         "file_write_failed"};
    }
    return data.size();
}

core::errors::Result<FileStat> LocalFileSystem::stat(const std::string& path) {
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }

    struct stat raw {};
    if (::stat(core::errors::get_value(resolved).c_str(), &raw) != 0) {
        return not_found(path);
    }
    FileStat info;
    info.is_file = S_ISREG(raw.st_mode);
    info.is_directory = S_ISDIR(raw.st_mode);
    info.size = info.is_file ? static_cast<std::uint64_t>(raw.st_size) : 0;
    info.modified_time_ms = static_cast<std::int64_t>(raw.st_mtim.tv_sec) * 1000 +
                            raw.st_mtim.tv_nsec / 1000000;
    return info;
}

bool LocalFileSystem::exists(const std::string& path) {
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(core::errors::get_value(resolved), ec) && !ec;
}

core::errors::Result<std::vector<std::string>> LocalFileSystem::readdir(
    const std::string& path) {
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& target = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_directory(target, ec) || ec) {
        return std::filesystem::exists(target, ec)
                   ? ToolError{ErrorCategory::Input, "Not a directory: /" + path,
                               "not_directory"}
                   : not_found(path);
    }

    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(target, ec)) {
        names.push_back(entry.path().filename().string());
    }
    if (ec) {
        return ToolError{ErrorCategory::Execution, "Unable to list /" + path,
                         "file_read_failed"};
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace wasmbox::vfs

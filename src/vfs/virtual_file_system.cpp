#include "vfs/virtual_file_system.hpp"

#include <algorithm>
#include <utility>
#include "core/encoding/utf8.hpp"

namespace wasmbox::vfs {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using policy::AccessIntent;

namespace {

ToolError bad_descriptor(const int fd) {
    return ToolError{ErrorCategory::Input, "Bad file descriptor: " + std::to_string(fd),
                     "bad_descriptor"};
}

}  // namespace

VirtualFileSystem::VirtualFileSystem(protocol::FileAccess access,
                                     std::shared_ptr<FileSystem> backend)
    : access_(access), backend_(std::move(backend)) {}

void VirtualFileSystem::set_stdin(std::string_view text) {
    stdin_buffer_.assign(text.begin(), text.end());
    stdin_cursor_ = 0;
}

void VirtualFileSystem::set_stdin(protocol::Bytes bytes) {
    stdin_buffer_ = std::move(bytes);
    stdin_cursor_ = 0;
}

protocol::Bytes VirtualFileSystem::read_stdin(const std::size_t max_bytes) {
    const std::size_t available = stdin_buffer_.size() - stdin_cursor_;
    const std::size_t count = std::min(max_bytes, available);
    const auto begin = stdin_buffer_.begin() + static_cast<std::ptrdiff_t>(stdin_cursor_);
    protocol::Bytes chunk(begin, begin + static_cast<std::ptrdiff_t>(count));
    stdin_cursor_ += count;
    return chunk;
}

std::size_t VirtualFileSystem::write_stdout(const std::uint8_t* data,
                                            const std::size_t size) {
    stdout_chunks_.emplace_back(data, data + size);
    return size;
}

std::size_t VirtualFileSystem::write_stderr(const std::uint8_t* data,
                                            const std::size_t size) {
    stderr_chunks_.emplace_back(data, data + size);
    return size;
}

protocol::Bytes VirtualFileSystem::concat(const std::vector<protocol::Bytes>& chunks) {
    std::size_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size();
    }
    protocol::Bytes out;
    out.reserve(total);
    for (const auto& chunk : chunks) {
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    return out;
}

std::string VirtualFileSystem::get_stdout() const {
    return core::encoding::decode_utf8_lossy(concat(stdout_chunks_));
}

std::string VirtualFileSystem::get_stderr() const {
    return core::encoding::decode_utf8_lossy(concat(stderr_chunks_));
}

protocol::Bytes VirtualFileSystem::get_stdout_binary() const {
    return concat(stdout_chunks_);
}

protocol::Bytes VirtualFileSystem::get_stderr_binary() const {
    return concat(stderr_chunks_);
}

void VirtualFileSystem::reset() {
    stdin_buffer_.clear();
    stdin_cursor_ = 0;
    stdout_chunks_.clear();
    stderr_chunks_.clear();
    open_files_.clear();
    next_fd_ = kFirstFileDescriptor;
}

core::errors::Result<std::string> VirtualFileSystem::prepare(
    std::string_view path, const AccessIntent intent) const {
    auto allowed = guard_.check_file_access(access_, intent);
    if (core::errors::is_error(allowed)) {
        return core::errors::get_error(allowed);
    }
    if (!backend_) {
        return ToolError{ErrorCategory::Policy, "No file system is attached to this execution",
                         "file_access_denied"};
    }
    return policy::PolicyGuard::normalize_virtual_path(path);
}

core::errors::Result<protocol::Bytes> VirtualFileSystem::read_file(std::string_view path) {
    auto normalized = prepare(path, AccessIntent::Read);
    if (core::errors::is_error(normalized)) {
        return core::errors::get_error(normalized);
    }
    return backend_->read_file(core::errors::get_value(normalized));
}

core::errors::Result<std::string> VirtualFileSystem::read_file_as_string(
    std::string_view path) {
    auto bytes = read_file(path);
    if (core::errors::is_error(bytes)) {
        return core::errors::get_error(bytes);
    }
    return core::encoding::decode_utf8_lossy(core::errors::get_value(bytes));
}

core::errors::Result<std::size_t> VirtualFileSystem::write_file(
    std::string_view path, const protocol::Bytes& data) {
    auto normalized = prepare(path, AccessIntent::Write);
    if (core::errors::is_error(normalized)) {
        return core::errors::get_error(normalized);
    }
    return backend_->write_file(core::errors::get_value(normalized), data);
}

core::errors::Result<FileStat> VirtualFileSystem::stat(std::string_view path) {
    auto normalized = prepare(path, AccessIntent::Read);
    if (core::errors::is_error(normalized)) {
        return core::errors::get_error(normalized);
    }
    return backend_->stat(core::errors::get_value(normalized));
}

bool VirtualFileSystem::exists(std::string_view path) {
    auto normalized = prepare(path, AccessIntent::Read);
    if (core::errors::is_error(normalized)) {
        return false;
    }
    return backend_->exists(core::errors::get_value(normalized));
}

core::errors::Result<std::vector<std::string>> VirtualFileSystem::readdir(
    std::string_view path) {
    auto normalized = prepare(path, AccessIntent::Read);
    if (core::errors::is_error(normalized)) {
        return core::errors::get_error(normalized);
    }
    return backend_->readdir(core::errors::get_value(normalized));
}

core::errors::Result<int> VirtualFileSystem::open_file(std::string_view path,
                                                       const OpenMode mode) {
    OpenFile entry;
    entry.mode = mode;

    if (mode == OpenMode::Directory) {
        // A directory handle anchors whichever access the tool holds, so a
        // write-only tool checks it as a write.
        const auto intent = access_ == protocol::FileAccess::Write ? AccessIntent::Write
                                                                   : AccessIntent::Read;
        auto normalized = prepare(path, intent);
        if (core::errors::is_error(normalized)) {
            return core::errors::get_error(normalized);
        }
        entry.path = core::errors::take_value(normalized);
        auto info = backend_->stat(entry.path);
        if (core::errors::is_error(info)) {
            return core::errors::get_error(info);
        }
        if (!core::errors::get_value(info).is_directory) {
            return ToolError{ErrorCategory::Input, "Not a directory: /" + entry.path,
                             "not_directory"};
        }
    } else if (mode == OpenMode::Read) {
        auto contents = read_file(path);
        if (core::errors::is_error(contents)) {
            return core::errors::get_error(contents);
        }
        entry.path = policy::PolicyGuard::normalize_virtual_path(path);
        entry.contents = core::errors::take_value(contents);
    } else {
        auto normalized = prepare(path, AccessIntent::Write);
        if (core::errors::is_error(normalized)) {
            return core::errors::get_error(normalized);
        }
        entry.path = core::errors::get_value(normalized);
    }

    const int fd = next_fd_++;
    open_files_[fd] = std::move(entry);
    return fd;
}

void VirtualFileSystem::close_file(const int fd) {
    if (fd < kFirstFileDescriptor) {
        return;
    }
    open_files_.erase(fd);
}

bool VirtualFileSystem::is_valid_fd(const int fd) const {
    return (fd >= 0 && fd < kFirstFileDescriptor) || open_files_.count(fd) > 0;
}

std::optional<std::string> VirtualFileSystem::fd_path(const int fd) const {
    const auto it = open_files_.find(fd);
    if (it == open_files_.end()) {
        return std::nullopt;
    }
    return it->second.path;
}

const OpenFile* VirtualFileSystem::open_file_entry(const int fd) const {
    const auto it = open_files_.find(fd);
    return it == open_files_.end() ? nullptr : &it->second;
}

core::errors::Result<protocol::Bytes> VirtualFileSystem::read_open_file(
    const int fd, const std::size_t max_bytes) {
    const auto it = open_files_.find(fd);
    if (it == open_files_.end() || it->second.mode != OpenMode::Read) {
        return bad_descriptor(fd);
    }
    auto& file = it->second;
    if (file.cursor >= file.contents.size()) {
        return protocol::Bytes{};
    }
    const std::size_t available =
        file.contents.size() - static_cast<std::size_t>(file.cursor);
    const std::size_t count = std::min(max_bytes, available);
    const auto begin = file.contents.begin() + static_cast<std::ptrdiff_t>(file.cursor);
    protocol::Bytes chunk(begin, begin + static_cast<std::ptrdiff_t>(count));
    file.cursor += count;
    return chunk;
}

core::errors::Result<std::uint64_t> VirtualFileSystem::seek(const int fd,
                                                            const std::int64_t offset,
                                                            const Whence whence) {
    const auto it = open_files_.find(fd);
    if (it == open_files_.end() || it->second.mode == OpenMode::Directory) {
        return bad_descriptor(fd);
    }
    auto& file = it->second;
    std::int64_t base = 0;
    switch (whence) {
        case Whence::Set: base = 0; break;
        case Whence::Current: base = static_cast<std::int64_t>(file.cursor); break;
        case Whence::End: base = static_cast<std::int64_t>(file.contents.size()); break;
    }
    const std::int64_t target = base + offset;
    if (target < 0) {
        return ToolError{ErrorCategory::Input, "Seek before start of file",
                         "invalid_argument"};
    }
    file.cursor = static_cast<std::uint64_t>(target);
    return file.cursor;
}

}  // namespace wasmbox::vfs

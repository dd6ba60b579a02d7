#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "core/errors/tool_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/bytes.hpp"
#include "protocol/manifest.hpp"
#include "vfs/file_system.hpp"

namespace wasmbox::vfs {

enum class OpenMode {
    Read,
    Write,
    Directory
};

enum class Whence {
    Set,
    Current,
    End
};

struct OpenFile {
    std::string path;
    OpenMode mode = OpenMode::Read;
    std::uint64_t cursor = 0;
    // Snapshot taken at open time for Read mode
    protocol::Bytes contents;
};

// The I/O surface of exactly one execution: standard streams plus a
// policy-gated view of a FileSystem backend. Never shared between calls.
class VirtualFileSystem {
public:
    static constexpr int kFirstFileDescriptor = 3;

    explicit VirtualFileSystem(protocol::FileAccess access = protocol::FileAccess::None,
                               std::shared_ptr<FileSystem> backend = nullptr);

    // Standard streams
    void set_stdin(std::string_view text);
    void set_stdin(protocol::Bytes bytes);
    protocol::Bytes read_stdin(std::size_t max_bytes);
    std::size_t write_stdout(const std::uint8_t* data, std::size_t size);
    std::size_t write_stderr(const std::uint8_t* data, std::size_t size);
    std::string get_stdout() const;
    std::string get_stderr() const;
    protocol::Bytes get_stdout_binary() const;
    protocol::Bytes get_stderr_binary() const;
    void reset();

    // Policy-gated file operations
    core::errors::Result<protocol::Bytes> read_file(std::string_view path);
    core::errors::Result<std::string> read_file_as_string(std::string_view path);
    core::errors::Result<std::size_t> write_file(std::string_view path,
                                                 const protocol::Bytes& data);
    core::errors::Result<FileStat> stat(std::string_view path);
    bool exists(std::string_view path);
    core::errors::Result<std::vector<std::string>> readdir(std::string_view path);

    // Descriptor table, fds >= 3
    core::errors::Result<int> open_file(std::string_view path, OpenMode mode);
    void close_file(int fd);
    bool is_valid_fd(int fd) const;
    std::optional<std::string> fd_path(int fd) const;
    const OpenFile* open_file_entry(int fd) const;
    core::errors::Result<protocol::Bytes> read_open_file(int fd, std::size_t max_bytes);
    core::errors::Result<std::uint64_t> seek(int fd, std::int64_t offset, Whence whence);

    protocol::FileAccess access() const { return access_; }
    bool has_backend() const { return backend_ != nullptr; }

private:
    core::errors::Result<std::string> prepare(std::string_view path,
                                              policy::AccessIntent intent) const;
    static protocol::Bytes concat(const std::vector<protocol::Bytes>& chunks);

    protocol::FileAccess access_;
    std::shared_ptr<FileSystem> backend_;
    policy::PolicyGuard guard_;

    protocol::Bytes stdin_buffer_;
    std::size_t stdin_cursor_ = 0;
    std::vector<protocol::Bytes> stdout_chunks_;
    std::vector<protocol::Bytes> stderr_chunks_;

    std::map<int, OpenFile> open_files_;
    int next_fd_ = kFirstFileDescriptor;
};

}  // namespace wasmbox::vfs

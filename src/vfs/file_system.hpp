#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"
#include "protocol/bytes.hpp"

namespace wasmbox::vfs {

struct FileStat {
    std::uint64_t size = 0;
    bool is_file = false;
    bool is_directory = false;
    std::int64_t modified_time_ms = 0;
};

// Storage behind a VirtualFileSystem. Paths arrive normalized and relative to
// the backend root; the empty path is the root itself. Access policy is the
// caller's job. Implementations do no locking of their own.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual core::errors::Result<protocol::Bytes> read_file(const std::string& path) = 0;
    virtual core::errors::Result<std::size_t> write_file(const std::string& path,
                                                         const protocol::Bytes& data) = 0;
    virtual core::errors::Result<FileStat> stat(const std::string& path) = 0;
    virtual bool exists(const std::string& path) = 0;
    // Direct children names, sorted
    virtual core::errors::Result<std::vector<std::string>> readdir(
        const std::string& path) = 0;
};

}  // namespace wasmbox::vfs

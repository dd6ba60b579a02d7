#pragma once

#include <map>
#include <string>
#include "vfs/file_system.hpp"

namespace wasmbox::vfs {

// Flat path -> bytes map. Directories exist implicitly as path prefixes.
class MemoryFileSystem : public FileSystem {
public:
    MemoryFileSystem() = default;
    explicit MemoryFileSystem(const std::map<std::string, protocol::Bytes>& files);

    core::errors::Result<protocol::Bytes> read_file(const std::string& path) override;
    core::errors::Result<std::size_t> write_file(const std::string& path,
                                                 const protocol::Bytes& data) override;
    core::errors::Result<FileStat> stat(const std::string& path) override;
    bool exists(const std::string& path) override;
    core::errors::Result<std::vector<std::string>> readdir(const std::string& path) override;

private:
    bool is_directory(const std::string& path) const;

    std::map<std::string, protocol::Bytes> files_;
};

}  // namespace wasmbox::vfs

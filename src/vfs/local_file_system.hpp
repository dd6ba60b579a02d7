#pragma once

#include <filesystem>
#include <string>
#include "policy/policy_guard.hpp"
#include "vfs/file_system.hpp"

namespace wasmbox::vfs {

// Real-filesystem bridge for the in-process host, confined to one workspace
// directory. Every path goes through PolicyGuard before it is touched.
class LocalFileSystem : public FileSystem {
public:
    explicit LocalFileSystem(std::filesystem::path workspace_root);

    core::errors::Result<protocol::Bytes> read_file(const std::string& path) override;
    core::errors::Result<std::size_t> write_file(const std::string& path,
                                                 const protocol::Bytes& data) override;
    core::errors::Result<FileStat> stat(const std::string& path) override;
    bool exists(const std::string& path) override;
    core::errors::Result<std::vector<std::string>> readdir(const std::string& path) override;

    const std::filesystem::path& workspace_root() const { return workspace_root_; }

private:
    core::errors::Result<std::filesystem::path> resolve(const std::string& path) const;

    std::filesystem::path workspace_root_;
    policy::PolicyGuard guard_;
};

}  // namespace wasmbox::vfs

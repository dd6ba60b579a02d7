#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"
#include "runtime/guest_memory.hpp"
#include "vfs/virtual_file_system.hpp"

namespace wasmbox::runtime {

// Per-execution state behind the WASI preview1 imports. Every import takes
// the guest memory view first, then its wasm arguments, and returns a WASI
// errno. Guest pointers arrive as i32 and are reinterpreted as u32 offsets.
class WasiContext {
public:
    WasiContext(std::vector<std::string> argv, vfs::VirtualFileSystem& vfs);

    // Process
    void proc_exit(std::int32_t code);
    bool exited() const { return exit_code_.has_value(); }
    int exit_code() const { return exit_code_.value_or(0); }

    // Set by the import wrapper when a host call faults
    void record_fault(const std::string& message);
    const std::optional<std::string>& fault() const { return fault_; }

    std::int32_t args_get(GuestMemory& memory, std::int32_t argv_ptr, std::int32_t buf_ptr);
    std::int32_t args_sizes_get(GuestMemory& memory, std::int32_t argc_ptr,
                                std::int32_t buf_size_ptr);
    std::int32_t environ_get(GuestMemory& memory, std::int32_t environ_ptr,
                             std::int32_t buf_ptr);
    std::int32_t environ_sizes_get(GuestMemory& memory, std::int32_t count_ptr,
                                   std::int32_t buf_size_ptr);

    std::int32_t clock_res_get(GuestMemory& memory, std::int32_t clock_id,
                               std::int32_t resolution_ptr);
    std::int32_t clock_time_get(GuestMemory& memory, std::int32_t clock_id,
                                std::int64_t precision, std::int32_t time_ptr);
    std::int32_t random_get(GuestMemory& memory, std::int32_t buf_ptr, std::int32_t buf_len);

    // Descriptors
    std::int32_t fd_read(GuestMemory& memory, std::int32_t fd, std::int32_t iovs_ptr,
                         std::int32_t iovs_len, std::int32_t nread_ptr);
    std::int32_t fd_write(GuestMemory& memory, std::int32_t fd, std::int32_t iovs_ptr,
                          std::int32_t iovs_len, std::int32_t nwritten_ptr);
    std::int32_t fd_close(GuestMemory& memory, std::int32_t fd);
    std::int32_t fd_seek(GuestMemory& memory, std::int32_t fd, std::int64_t offset,
                         std::int32_t whence, std::int32_t new_offset_ptr);
    std::int32_t fd_tell(GuestMemory& memory, std::int32_t fd, std::int32_t offset_ptr);
    std::int32_t fd_fdstat_get(GuestMemory& memory, std::int32_t fd, std::int32_t stat_ptr);
    std::int32_t fd_filestat_get(GuestMemory& memory, std::int32_t fd, std::int32_t stat_ptr);
    std::int32_t fd_prestat_get(GuestMemory& memory, std::int32_t fd, std::int32_t prestat_ptr);
    std::int32_t fd_prestat_dir_name(GuestMemory& memory, std::int32_t fd,
                                     std::int32_t path_ptr, std::int32_t path_len);
    // fd_advise / fd_datasync / fd_sync: accepted as no-ops on live descriptors
    std::int32_t fd_noop(GuestMemory& memory, std::int32_t fd);

    // Paths
    std::int32_t path_open(GuestMemory& memory, std::int32_t dir_fd, std::int32_t dir_flags,
                           std::int32_t path_ptr, std::int32_t path_len,
                           std::int32_t oflags, std::int64_t rights_base,
                           std::int64_t rights_inheriting, std::int32_t fd_flags,
                           std::int32_t fd_out_ptr);
    std::int32_t path_filestat_get(GuestMemory& memory, std::int32_t dir_fd,
                                   std::int32_t flags, std::int32_t path_ptr,
                                   std::int32_t path_len, std::int32_t stat_ptr);

    std::optional<int> preopen_fd() const { return preopen_fd_; }

private:
    std::optional<std::string> resolve_under(std::int32_t dir_fd,
                                             const std::string& relative) const;
    static std::int32_t to_errno(const core::errors::ToolError& error);
    static void write_filestat(GuestMemory& memory, std::uint32_t offset,
                               std::uint8_t filetype, std::uint64_t size,
                               std::int64_t modified_ms);

    std::vector<std::string> argv_;
    vfs::VirtualFileSystem& vfs_;
    std::optional<int> preopen_fd_;
    std::optional<int> exit_code_;
    std::optional<std::string> fault_;
};

}  // namespace wasmbox::runtime

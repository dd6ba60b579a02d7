#include "runtime/wasi_context.hpp"

#include <chrono>
#include <ctime>
#include <utility>
#include <openssl/rand.h>
#include "core/logging/logger.hpp"
#include "runtime/wasi_abi.hpp"

namespace wasmbox::runtime {

namespace {

std::uint32_t offset_of(const std::int32_t guest_pointer) {
    return static_cast<std::uint32_t>(guest_pointer);
}

std::uint64_t nanoseconds_since(const std::chrono::nanoseconds value) {
    return static_cast<std::uint64_t>(value.count());
}

std::uint64_t cpu_time_ns(const clockid_t clock) {
    timespec ts{};
    if (clock_gettime(clock, &ts) != 0) {
        return 0;
    }
    return static_cast<std::uint64_t>(ts.tv_sec) * 1000000000ull +
           static_cast<std::uint64_t>(ts.tv_nsec);
}

}  // namespace

WasiContext::WasiContext(std::vector<std::string> argv, vfs::VirtualFileSystem& vfs)
    : argv_(std::move(argv)), vfs_(vfs) {
    if (vfs_.access() == protocol::FileAccess::None || !vfs_.has_backend()) {
        return;
    }
    auto opened = vfs_.open_file("/", vfs::OpenMode::Directory);
    if (core::errors::is_error(opened)) {
        LOG_WARN("Preopen of / failed: " + core::errors::get_error(opened).message);
        return;
    }
    preopen_fd_ = core::errors::get_value(opened);
}

void WasiContext::proc_exit(const std::int32_t code) {
    exit_code_ = code;
}

void WasiContext::record_fault(const std::string& message) {
    if (!fault_.has_value()) {
        fault_ = message;
    }
}

std::int32_t WasiContext::to_errno(const core::errors::ToolError& error) {
    if (error.code == "file_access_denied" || error.code == "path_outside_workspace") {
        return wasi::kErrnoAcces;
    }
    if (error.code == "file_not_found") return wasi::kErrnoNoent;
    if (error.code == "is_directory") return wasi::kErrnoIsdir;
    if (error.code == "not_directory") return wasi::kErrnoNotdir;
    if (error.code == "bad_descriptor") return wasi::kErrnoBadf;
    if (error.code == "invalid_argument") return wasi::kErrnoInval;
    return wasi::kErrnoIo;
}

void WasiContext::write_filestat(GuestMemory& memory, const std::uint32_t offset,
                                 const std::uint8_t filetype, const std::uint64_t size,
                                 const std::int64_t modified_ms) {
    memory.fill_zero(offset, wasi::kFilestatSize);
    memory.write_u8(offset + 16, filetype);
    memory.write_u64(offset + 24, 1);
    memory.write_u64(offset + 32, size);
    const auto ns = static_cast<std::uint64_t>(modified_ms) * 1000000ull;
    memory.write_u64(offset + 40, ns);
    memory.write_u64(offset + 48, ns);
    memory.write_u64(offset + 56, ns);
}

// Arguments: a u32 pointer per entry, strings laid out back to back with NULs.
std::int32_t WasiContext::args_get(GuestMemory& memory, const std::int32_t argv_ptr,
                                   const std::int32_t buf_ptr) {
    std::uint32_t slot = offset_of(argv_ptr);
    std::uint32_t cursor = offset_of(buf_ptr);
    for (const auto& arg : argv_) {
        memory.write_u32(slot, cursor);
        slot += 4;
        memory.write_bytes(cursor, arg.data(), static_cast<std::uint32_t>(arg.size()));
        memory.write_u8(cursor + static_cast<std::uint32_t>(arg.size()), 0);
        cursor += static_cast<std::uint32_t>(arg.size()) + 1;
    }
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::args_sizes_get(GuestMemory& memory, const std::int32_t argc_ptr,
                                         const std::int32_t buf_size_ptr) {
    std::uint32_t total = 0;
    for (const auto& arg : argv_) {
        total += static_cast<std::uint32_t>(arg.size()) + 1;
    }
    memory.write_u32(offset_of(argc_ptr), static_cast<std::uint32_t>(argv_.size()));
    memory.write_u32(offset_of(buf_size_ptr), total);
    return wasi::kErrnoSuccess;
}

// No environment is ever exposed to a tool.
std::int32_t WasiContext::environ_get(GuestMemory&, std::int32_t, std::int32_t) {
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::environ_sizes_get(GuestMemory& memory, const std::int32_t count_ptr,
                                            const std::int32_t buf_size_ptr) {
    memory.write_u32(offset_of(count_ptr), 0);
    memory.write_u32(offset_of(buf_size_ptr), 0);
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::clock_res_get(GuestMemory& memory, const std::int32_t clock_id,
                                        const std::int32_t resolution_ptr) {
    if (clock_id < wasi::kClockRealtime || clock_id > wasi::kClockThreadCputime) {
        return wasi::kErrnoInval;
    }
    memory.write_u64(offset_of(resolution_ptr), 1000);
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::clock_time_get(GuestMemory& memory, const std::int32_t clock_id,
                                         std::int64_t, const std::int32_t time_ptr) {
    std::uint64_t now = 0;
    switch (clock_id) {
        case wasi::kClockRealtime:
            now = nanoseconds_since(std::chrono::system_clock::now().time_since_epoch());
            break;
        case wasi::kClockMonotonic:
            now = nanoseconds_since(std::chrono::steady_clock::now().time_since_epoch());
            break;
        case wasi::kClockProcessCputime:
            now = cpu_time_ns(CLOCK_PROCESS_CPUTIME_ID);
            break;
        case wasi::kClockThreadCputime:
            now = cpu_time_ns(CLOCK_THREAD_CPUTIME_ID);
            break;
        default:
            return wasi::kErrnoInval;
    }
    memory.write_u64(offset_of(time_ptr), now);
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::random_get(GuestMemory& memory, const std::int32_t buf_ptr,
                                     const std::int32_t buf_len) {
    const auto length = offset_of(buf_len);
    if (length == 0) {
        return wasi::kErrnoSuccess;
    }
    std::uint8_t* target = memory.at(offset_of(buf_ptr), length);
    if (RAND_bytes(target, static_cast<int>(length)) != 1) {
        return wasi::kErrnoIo;
    }
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::fd_read(GuestMemory& memory, const std::int32_t fd,
                                  const std::int32_t iovs_ptr, const std::int32_t iovs_len,
                                  const std::int32_t nread_ptr) {
    const bool from_stdin = fd == 0;
    if (!from_stdin) {
        const auto* entry = vfs_.open_file_entry(fd);
        if (entry == nullptr || entry->mode != vfs::OpenMode::Read) {
            return wasi::kErrnoBadf;
        }
    }

    std::uint32_t total = 0;
    for (std::uint32_t i = 0; i < offset_of(iovs_len); ++i) {
        const std::uint32_t iov = offset_of(iovs_ptr) + i * wasi::kIovecSize;
        const std::uint32_t buf = memory.read_u32(iov);
        const std::uint32_t len = memory.read_u32(iov + 4);
        std::uint8_t* target = memory.at(buf, len);

        protocol::Bytes chunk;
        if (from_stdin) {
            chunk = vfs_.read_stdin(len);
        } else {
            auto read = vfs_.read_open_file(fd, len);
            if (core::errors::is_error(read)) {
                return to_errno(core::errors::get_error(read));
            }
            chunk = core::errors::take_value(read);
        }
        if (!chunk.empty()) {
            std::memcpy(target, chunk.data(), chunk.size());
        }
        total += static_cast<std::uint32_t>(chunk.size());
        if (chunk.size() < len) {
            break;
        }
    }
    memory.write_u32(offset_of(nread_ptr), total);
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::fd_write(GuestMemory& memory, const std::int32_t fd,
                                   const std::int32_t iovs_ptr, const std::int32_t iovs_len,
                                   const std::int32_t nwritten_ptr) {
    if (fd != 1 && fd != 2) {
        return wasi::kErrnoBadf;
    }

    std::uint32_t total = 0;
    for (std::uint32_t i = 0; i < offset_of(iovs_len); ++i) {
        const std::uint32_t iov = offset_of(iovs_ptr) + i * wasi::kIovecSize;
        const std::uint32_t buf = memory.read_u32(iov);
        const std::uint32_t len = memory.read_u32(iov + 4);
        const std::uint8_t* source = memory.at(buf, len);
        total += static_cast<std::uint32_t>(fd == 1 ? vfs_.write_stdout(source, len)
                                                    : vfs_.write_stderr(source, len));
    }
    memory.write_u32(offset_of(nwritten_ptr), total);
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::fd_close(GuestMemory&, const std::int32_t fd) {
    if (!vfs_.is_valid_fd(fd)) {
        return wasi::kErrnoBadf;
    }
    vfs_.close_file(fd);
    if (preopen_fd_.has_value() && *preopen_fd_ == fd) {
        preopen_fd_.reset();
    }
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::fd_seek(GuestMemory& memory, const std::int32_t fd,
                                  const std::int64_t offset, const std::int32_t whence,
                                  const std::int32_t new_offset_ptr) {
    if (fd >= 0 && fd < vfs::VirtualFileSystem::kFirstFileDescriptor) {
        return wasi::kErrnoSpipe;
    }
    vfs::Whence mode = vfs::Whence::Set;
    switch (whence) {
        case wasi::kWhenceSet: mode = vfs::Whence::Set; break;
        case wasi::kWhenceCur: mode = vfs::Whence::Current; break;
        case wasi::kWhenceEnd: mode = vfs::Whence::End; break;
        default: return wasi::kErrnoInval;
    }
    auto position = vfs_.seek(fd, offset, mode);
    if (core::errors::is_error(position)) {
        return to_errno(core::errors::get_error(position));
    }
    memory.write_u64(offset_of(new_offset_ptr), core::errors::get_value(position));
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::fd_tell(GuestMemory& memory, const std::int32_t fd,
                                  const std::int32_t offset_ptr) {
    if (fd >= 0 && fd < vfs::VirtualFileSystem::kFirstFileDescriptor) {
        return wasi::kErrnoSpipe;
    }
    const auto* entry = vfs_.open_file_entry(fd);
    if (entry == nullptr || entry->mode == vfs::OpenMode::Directory) {
        return wasi::kErrnoBadf;
    }
    memory.write_u64(offset_of(offset_ptr), entry->cursor);
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::fd_fdstat_get(GuestMemory& memory, const std::int32_t fd,
                                        const std::int32_t stat_ptr) {
    std::uint8_t filetype = wasi::kFiletypeUnknown;
    std::uint64_t rights = 0;
    std::uint64_t inheriting = 0;
    if (fd == 0) {
        filetype = wasi::kFiletypeCharacterDevice;
        rights = wasi::kRightFdRead;
    } else if (fd == 1 || fd == 2) {
        filetype = wasi::kFiletypeCharacterDevice;
        rights = wasi::kRightFdWrite;
    } else {
        const auto* entry = vfs_.open_file_entry(fd);
        if (entry == nullptr) {
            return wasi::kErrnoBadf;
        }
        if (entry->mode == vfs::OpenMode::Directory) {
            filetype = wasi::kFiletypeDirectory;
            rights = wasi::kRightsDirectory;
            inheriting = wasi::kRightsRegularFile | wasi::kRightsDirectory;
        } else {
            filetype = wasi::kFiletypeRegularFile;
            rights = wasi::kRightsRegularFile;
        }
    }

    const std::uint32_t base = offset_of(stat_ptr);
    memory.fill_zero(base, wasi::kFdstatSize);
    memory.write_u8(base, filetype);
    memory.write_u16(base + 2, 0);
    memory.write_u64(base + 8, rights);
    memory.write_u64(base + 16, inheriting);
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::fd_filestat_get(GuestMemory& memory, const std::int32_t fd,
                                          const std::int32_t stat_ptr) {
    if (fd >= 0 && fd < vfs::VirtualFileSystem::kFirstFileDescriptor) {
        write_filestat(memory, offset_of(stat_ptr), wasi::kFiletypeCharacterDevice, 0, 0);
        return wasi::kErrnoSuccess;
    }
    const auto* entry = vfs_.open_file_entry(fd);
    if (entry == nullptr) {
        return wasi::kErrnoBadf;
    }
    if (entry->mode == vfs::OpenMode::Directory) {
        write_filestat(memory, offset_of(stat_ptr), wasi::kFiletypeDirectory, 0, 0);
    } else {
        write_filestat(memory, offset_of(stat_ptr), wasi::kFiletypeRegularFile,
                       entry->contents.size(), 0);
    }
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::fd_prestat_get(GuestMemory& memory, const std::int32_t fd,
                                         const std::int32_t prestat_ptr) {
    if (!preopen_fd_.has_value() || *preopen_fd_ != fd) {
        return wasi::kErrnoBadf;
    }
    const std::uint32_t base = offset_of(prestat_ptr);
    memory.fill_zero(base, wasi::kPrestatSize);
    memory.write_u8(base, wasi::kPreopenTypeDir);
    memory.write_u32(base + 4, 1);
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::fd_prestat_dir_name(GuestMemory& memory, const std::int32_t fd,
                                              const std::int32_t path_ptr,
                                              const std::int32_t path_len) {
    if (!preopen_fd_.has_value() || *preopen_fd_ != fd) {
        return wasi::kErrnoBadf;
    }
    if (offset_of(path_len) < 1) {
        return wasi::kErrnoInval;
    }
    memory.write_u8(offset_of(path_ptr), '/');
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::fd_noop(GuestMemory&, const std::int32_t fd) {
    return vfs_.is_valid_fd(fd) ? wasi::kErrnoSuccess : wasi::kErrnoBadf;
}

std::optional<std::string> WasiContext::resolve_under(const std::int32_t dir_fd,
                                                      const std::string& relative) const {
    const auto* dir = vfs_.open_file_entry(dir_fd);
    if (dir == nullptr || dir->mode != vfs::OpenMode::Directory) {
        return std::nullopt;
    }
    return dir->path.empty() ? relative : dir->path + "/" + relative;
}

std::int32_t WasiContext::path_open(GuestMemory& memory, const std::int32_t dir_fd,
                                    std::int32_t, const std::int32_t path_ptr,
                                    const std::int32_t path_len, const std::int32_t oflags,
                                    const std::int64_t rights_base, std::int64_t,
                                    std::int32_t, const std::int32_t fd_out_ptr) {
    const auto relative = memory.read_string(offset_of(path_ptr), offset_of(path_len));
    const auto path = resolve_under(dir_fd, relative);
    if (!path.has_value()) {
        return wasi::kErrnoBadf;
    }

    vfs::OpenMode mode = vfs::OpenMode::Read;
    if ((oflags & wasi::kOflagDirectory) != 0) {
        mode = vfs::OpenMode::Directory;
    } else if ((oflags & (wasi::kOflagCreat | wasi::kOflagTrunc)) != 0 ||
               (static_cast<std::uint64_t>(rights_base) & wasi::kRightFdWrite) != 0) {
        mode = vfs::OpenMode::Write;
    }

    auto opened = vfs_.open_file(*path, mode);
    if (core::errors::is_error(opened)) {
        return to_errno(core::errors::get_error(opened));
    }
    memory.write_u32(offset_of(fd_out_ptr),
                     static_cast<std::uint32_t>(core::errors::get_value(opened)));
    return wasi::kErrnoSuccess;
}

std::int32_t WasiContext::path_filestat_get(GuestMemory& memory, const std::int32_t dir_fd,
                                            std::int32_t, const std::int32_t path_ptr,
                                            const std::int32_t path_len,
                                            const std::int32_t stat_ptr) {
    const auto relative = memory.read_string(offset_of(path_ptr), offset_of(path_len));
    const auto path = resolve_under(dir_fd, relative);
    if (!path.has_value()) {
        return wasi::kErrnoBadf;
    }
    auto info = vfs_.stat(*path);
    if (core::errors::is_error(info)) {
        return to_errno(core::errors::get_error(info));
    }
    const auto& stat = core::errors::get_value(info);
    write_filestat(memory, offset_of(stat_ptr),
                   stat.is_directory ? wasi::kFiletypeDirectory : wasi::kFiletypeRegularFile,
                   stat.size, stat.modified_time_ms);
    return wasi::kErrnoSuccess;
}

}  // namespace wasmbox::runtime

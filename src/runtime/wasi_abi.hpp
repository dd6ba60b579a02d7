#pragma once

#include <cstdint>

// WASI preview1 ABI values used by the host.
namespace wasmbox::runtime::wasi {

constexpr const char* kModuleName = "wasi_snapshot_preview1";

// errno
constexpr std::int32_t kErrnoSuccess = 0;
constexpr std::int32_t kErrnoAcces = 2;
constexpr std::int32_t kErrnoBadf = 8;
constexpr std::int32_t kErrnoFault = 21;
constexpr std::int32_t kErrnoInval = 28;
constexpr std::int32_t kErrnoIo = 29;
constexpr std::int32_t kErrnoIsdir = 31;
constexpr std::int32_t kErrnoNoent = 44;
constexpr std::int32_t kErrnoNosys = 52;
constexpr std::int32_t kErrnoNotdir = 54;
constexpr std::int32_t kErrnoPerm = 63;
constexpr std::int32_t kErrnoSpipe = 70;
constexpr std::int32_t kErrnoNotcapable = 76;

// filetype
constexpr std::uint8_t kFiletypeUnknown = 0;
constexpr std::uint8_t kFiletypeCharacterDevice = 2;
constexpr std::uint8_t kFiletypeDirectory = 3;
constexpr std::uint8_t kFiletypeRegularFile = 4;

// rights
constexpr std::uint64_t kRightFdDatasync = 1ull << 0;
constexpr std::uint64_t kRightFdRead = 1ull << 1;
constexpr std::uint64_t kRightFdSeek = 1ull << 2;
constexpr std::uint64_t kRightFdSync = 1ull << 4;
constexpr std::uint64_t kRightFdTell = 1ull << 5;
constexpr std::uint64_t kRightFdWrite = 1ull << 6;
constexpr std::uint64_t kRightFdAdvise = 1ull << 7;
constexpr std::uint64_t kRightPathOpen = 1ull << 13;
constexpr std::uint64_t kRightFdReaddir = 1ull << 14;
constexpr std::uint64_t kRightPathFilestatGet = 1ull << 18;
constexpr std::uint64_t kRightFdFilestatGet = 1ull << 21;

constexpr std::uint64_t kRightsRegularFile = kRightFdDatasync | kRightFdRead |
                                             kRightFdSeek | kRightFdSync |
                                             kRightFdTell | kRightFdAdvise |
                                             kRightFdFilestatGet;
constexpr std::uint64_t kRightsDirectory = kRightPathOpen | kRightFdReaddir |
                                           kRightPathFilestatGet |
                                           kRightFdFilestatGet;

// oflags
constexpr std::int32_t kOflagCreat = 1 << 0;
constexpr std::int32_t kOflagDirectory = 1 << 1;
constexpr std::int32_t kOflagExcl = 1 << 2;
constexpr std::int32_t kOflagTrunc = 1 << 3;

// whence
constexpr std::int32_t kWhenceSet = 0;
constexpr std::int32_t kWhenceCur = 1;
constexpr std::int32_t kWhenceEnd = 2;

// clockid
constexpr std::int32_t kClockRealtime = 0;
constexpr std::int32_t kClockMonotonic = 1;
constexpr std::int32_t kClockProcessCputime = 2;
constexpr std::int32_t kClockThreadCputime = 3;

constexpr std::uint8_t kPreopenTypeDir = 0;

// Struct sizes
constexpr std::uint32_t kIovecSize = 8;
constexpr std::uint32_t kFdstatSize = 24;
constexpr std::uint32_t kFilestatSize = 64;
constexpr std::uint32_t kPrestatSize = 8;

}  // namespace wasmbox::runtime::wasi

#pragma once
#include <cstddef>
#include <cstdint>

namespace wasmbox::core::config {

// Wall-clock bounds, milliseconds
constexpr std::uint32_t kDefaultTimeoutMs = 30000;
constexpr std::uint32_t kMinTimeoutMs = 100;
constexpr std::uint32_t kMaxTimeoutMs = 300000;

// Linear memory, 64 KiB pages
constexpr std::uint32_t kWasmPageSize = 65536;
constexpr std::uint32_t kMemoryPagesDefault = 512;   // 32 MB
constexpr std::uint32_t kMemoryPagesText = 512;      // 32 MB
constexpr std::uint32_t kMemoryPagesImage = 2048;    // 128 MB
constexpr std::uint32_t kMemoryPagesMedia = 4096;    // 256 MB
constexpr std::uint32_t kMaxMemoryPages = kMemoryPagesMedia;

// Package contract
constexpr std::uint64_t kMaxArchiveBytes = 50ull * 1024 * 1024;
constexpr std::size_t kMaxArchiveEntries = 100;
constexpr std::uint64_t kMaxWasmBytes = 20ull * 1024 * 1024;

// Result cache
constexpr std::size_t kResultCacheMaxEntries = 100;
constexpr std::int64_t kResultCacheMaxAgeMs = 30 * 60 * 1000;

}  // namespace wasmbox::core::config

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"
#include "protocol/bytes.hpp"
#include "protocol/manifest.hpp"

namespace wasmbox::manifest {

// One archive member as listed by the unpacker.
struct PackageEntry {
    std::string name;
    protocol::Bytes contents;
    bool is_directory = false;
};

struct LoadedPackage {
    protocol::ToolManifest manifest;
    protocol::Bytes wasm_binary;
};

bool has_wasm_magic(const protocol::Bytes& bytes);

// Size ceiling and magic number check shared by packages and built-in fetches.
core::errors::Result<protocol::Bytes> validate_wasm_binary(protocol::Bytes bytes);

// Applies every package rule to an already listed archive. Nothing is
// registered here; callers install only a successful result.
core::errors::Result<LoadedPackage> validate_package(
    const std::vector<PackageEntry>& entries, std::uint64_t archive_size);

// Same contract over an extracted package directory.
core::errors::Result<LoadedPackage> load_package_directory(
    const std::filesystem::path& root);

}  // namespace wasmbox::manifest

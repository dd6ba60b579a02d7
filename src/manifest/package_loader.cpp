#include "manifest/package_loader.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include "core/config/limits.hpp"
#include "manifest/manifest_codec.hpp"

namespace wasmbox::manifest {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

ToolError rejected(const std::string& message) {
    return ToolError{ErrorCategory::Validation, message, "package_validation_failed"};
}

std::string base_name(const std::string& entry_name) {
    const auto slash = entry_name.find_last_of('/');
    return slash == std::string::npos ? entry_name : entry_name.substr(slash + 1);
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool escapes_root(const std::string& entry_name) {
    if (entry_name.empty()) {
        return false;
    }
    if (entry_name.front() == '/' || entry_name.front() == '\\') {
        return true;
    }
    if (entry_name.size() > 1 && entry_name[1] == ':') {
        return true;
    }
    std::size_t start = 0;
    while (start <= entry_name.size()) {
        const auto end = entry_name.find_first_of("/\\", start);
        const auto segment = entry_name.substr(
            start, end == std::string::npos ? std::string::npos : end - start);
        if (segment == "..") {
            return true;
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return false;
}

core::errors::Result<protocol::Bytes> read_all(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return ToolError{ErrorCategory::Input, "Unable to open file: " + path.string(),
                         "file_open_failed"};
    }
    protocol::Bytes bytes((std::istreambuf_iterator<char>(in)),
                          std::istreambuf_iterator<char>());
    return bytes;
}

}  // namespace

bool has_wasm_magic(const protocol::Bytes& bytes) {
    return bytes.size() >= 4 && bytes[0] == 0x00 && bytes[1] == 0x61 &&
           bytes[2] == 0x73 && bytes[3] == 0x6d;
}

core::errors::Result<protocol::Bytes> validate_wasm_binary(protocol::Bytes bytes) {
    if (bytes.size() > core::config::kMaxWasmBytes) {
        return rejected("WASM binary exceeds maximum size of 20 MB");
    }
    if (!has_wasm_magic(bytes)) {
        return rejected("Invalid WASM binary (bad magic number)");
    }
    return bytes;
}

core::errors::Result<LoadedPackage> validate_package(
    const std::vector<PackageEntry>& entries, const std::uint64_t archive_size) {
    if (archive_size > core::config::kMaxArchiveBytes) {
        return rejected("Package exceeds maximum size of 50 MB");
    }
    if (entries.size() > core::config::kMaxArchiveEntries) {
        return rejected("Package contains too many files (maximum " +
                        std::to_string(core::config::kMaxArchiveEntries) + ")");
    }

    const PackageEntry* manifest_entry = nullptr;
    const PackageEntry* wasm_entry = nullptr;
    for (const auto& entry : entries) {
        if (escapes_root(entry.name)) {
            return rejected("Package entry escapes the package root: " + entry.name);
        }
        if (entry.is_directory) {
            continue;
        }
        if (base_name(entry.name) == "manifest.json") {
            if (manifest_entry != nullptr) {
                return rejected("Package contains more than one manifest.json");
            }
            manifest_entry = &entry;
        } else if (ends_with(entry.name, ".wasm")) {
            if (wasm_entry != nullptr) {
                return rejected("Package contains more than one .wasm binary");
            }
            wasm_entry = &entry;
        }
    }
    if (manifest_entry == nullptr) {
        return rejected("Package is missing manifest.json");
    }
    if (wasm_entry == nullptr) {
        return rejected("Package is missing a .wasm binary");
    }

    const std::string manifest_text(manifest_entry->contents.begin(),
                                    manifest_entry->contents.end());
    auto manifest = parse_manifest(manifest_text);
    if (core::errors::is_error(manifest)) {
        return core::errors::get_error(manifest);
    }

    auto binary = validate_wasm_binary(wasm_entry->contents);
    if (core::errors::is_error(binary)) {
        return core::errors::get_error(binary);
    }

    return LoadedPackage{core::errors::take_value(manifest),
                         core::errors::take_value(binary)};
}

core::errors::Result<LoadedPackage> load_package_directory(
    const std::filesystem::path& root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return ToolError{ErrorCategory::Input,
                         "Package directory does not exist: " + root.string(),
                         "invalid_package_path"};
    }

    std::vector<PackageEntry> entries;
    std::uint64_t total_size = 0;
    std::filesystem::recursive_directory_iterator it(root, ec);
    if (ec) {
        return ToolError{ErrorCategory::Input,
                         "Unable to list package directory: " + root.string(),
                         "invalid_package_path"};
    }
    for (const auto& item : it) {
        if (entries.size() > core::config::kMaxArchiveEntries) {
            break;
        }
        PackageEntry entry;
        entry.name = std::filesystem::relative(item.path(), root, ec).generic_string();
        if (ec) {
            return ToolError{ErrorCategory::Input,
                             "Unable to resolve package entry: " + item.path().string(),
                             "invalid_package_path"};
        }
        entry.is_directory = item.is_directory(ec);
        if (!entry.is_directory) {
            const auto name = item.path().filename().string();
            if (name == "manifest.json" || ends_with(name, ".wasm")) {
                auto contents = read_all(item.path());
                if (core::errors::is_error(contents)) {
                    return core::errors::get_error(contents);
                }
                entry.contents = core::errors::take_value(contents);
            }
            total_size += item.file_size(ec);
        }
        entries.push_back(std::move(entry));
    }

    return validate_package(entries, total_size);
}

}  // namespace wasmbox::manifest

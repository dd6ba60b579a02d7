#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/request_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "manifest/package_loader.hpp"
#include "protocol/bytes.hpp"

namespace {

using wasmbox::core::errors::ErrorCategory;
using wasmbox::core::errors::get_error;
using wasmbox::core::errors::get_value;
using wasmbox::core::errors::is_error;
using wasmbox::manifest::has_wasm_magic;
using wasmbox::manifest::load_package_directory;
using wasmbox::manifest::PackageEntry;
using wasmbox::manifest::validate_package;
using wasmbox::manifest::validate_wasm_binary;
using wasmbox::protocol::Bytes;
using wasmbox::protocol::to_bytes;

const char* kManifest =
    R"({"name":"echo","version":"1.0.0","description":"Echo input","parameters":{"type":"object","properties":{"text":{"type":"string"}},"required":["text"]}})";

Bytes minimal_wasm() {
    return Bytes{0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00};
}

PackageEntry file(const std::string& name, Bytes contents) {
    return PackageEntry{name, std::move(contents), false};
}

std::vector<PackageEntry> good_entries() {
    return {file("echo/manifest.json", to_bytes(kManifest)),
            file("echo/bin/echo.wasm", minimal_wasm()),
            file("echo/README.md", to_bytes("ignored"))};
}

std::string rejection(const std::vector<PackageEntry>& entries, std::uint64_t size = 1024) {
    auto result = validate_package(entries, size);
    if (!is_error(result)) {
        return "";
    }
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "package_validation_failed");
    return get_error(result).message;
}

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_package_" + wasmbox::core::config::generate_request_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_bytes(const std::filesystem::path& path, const Bytes& bytes) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
}

TEST(PackageLoaderTest, AcceptsWellFormedPackageAtAnyDepth) {
    auto result = validate_package(good_entries(), 2048);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).manifest.name, "echo");
    EXPECT_EQ(get_value(result).wasm_binary, minimal_wasm());
}

TEST(PackageLoaderTest, RejectsOversizeArchive) {
    EXPECT_EQ(rejection(good_entries(), 50ull * 1024 * 1024 + 1),
              "Package exceeds maximum size of 50 MB");
}

TEST(PackageLoaderTest, RejectsTooManyEntries) {
    auto entries = good_entries();
    for (int i = 0; i < 100; ++i) {
        entries.push_back(file("pad/" + std::to_string(i) + ".txt", to_bytes("x")));
    }
    EXPECT_EQ(rejection(entries), "Package contains too many files (maximum 100)");
}

TEST(PackageLoaderTest, RejectsPathTraversal) {
    auto entries = good_entries();
    entries.push_back(file("echo/../../etc/passwd", to_bytes("x")));
    EXPECT_EQ(rejection(entries), "Package entry escapes the package root: echo/../../etc/passwd");

    auto absolute = good_entries();
    absolute.push_back(file("/tmp/evil", to_bytes("x")));
    EXPECT_NE(rejection(absolute).find("escapes the package root"), std::string::npos);
}

TEST(PackageLoaderTest, RejectsMissingOrDuplicateMembers) {
    EXPECT_EQ(rejection({file("a.wasm", minimal_wasm())}), "Package is missing manifest.json");
    EXPECT_EQ(rejection({file("manifest.json", to_bytes(kManifest))}),
              "Package is missing a .wasm binary");

    auto two_manifests = good_entries();
    two_manifests.push_back(file("other/manifest.json", to_bytes(kManifest)));
    EXPECT_EQ(rejection(two_manifests), "Package contains more than one manifest.json");

    auto two_binaries = good_entries();
    two_binaries.push_back(file("second.wasm", minimal_wasm()));
    EXPECT_EQ(rejection(two_binaries), "Package contains more than one .wasm binary");
}

TEST(PackageLoaderTest, RejectsBadManifest) {
    EXPECT_EQ(rejection({file("manifest.json", to_bytes("{")), file("a.wasm", minimal_wasm())}),
              "Invalid JSON in manifest.json");
    const auto message = rejection(
        {file("manifest.json", to_bytes(R"({"name":"x"})")), file("a.wasm", minimal_wasm())});
    EXPECT_EQ(message.rfind("Invalid manifest: ", 0), 0u);
}

TEST(PackageLoaderTest, RejectsBadBinary) {
    EXPECT_EQ(rejection({file("manifest.json", to_bytes(kManifest)),
                         file("a.wasm", to_bytes("MZ\x90\x00"))}),
              "Invalid WASM binary (bad magic number)");

    Bytes huge(20 * 1024 * 1024 + 1, 0);
    huge[1] = 0x61;
    huge[2] = 0x73;
    huge[3] = 0x6d;
    auto result = validate_wasm_binary(huge);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).message, "WASM binary exceeds maximum size of 20 MB");
}

TEST(PackageLoaderTest, MagicNumberCheck) {
    EXPECT_TRUE(has_wasm_magic(minimal_wasm()));
    EXPECT_FALSE(has_wasm_magic(Bytes{0x00, 0x61, 0x73}));
    EXPECT_FALSE(has_wasm_magic(Bytes{0x7f, 'E', 'L', 'F'}));
}

TEST(PackageLoaderTest, LoadsExtractedDirectory) {
    TempWorkspace workspace;
    write_bytes(workspace.root() / "echo/manifest.json", to_bytes(kManifest));
    write_bytes(workspace.root() / "echo/echo.wasm", minimal_wasm());
    write_bytes(workspace.root() / "LICENSE", to_bytes("MIT"));

    auto result = load_package_directory(workspace.root());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).manifest.name, "echo");
    EXPECT_EQ(get_value(result).wasm_binary.size(), 8u);
}

TEST(PackageLoaderTest, MissingDirectoryIsInputError) {
    auto result = load_package_directory(std::filesystem::current_path() /
                                         "__missing_package_dir__");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_package_path");
}

}  // namespace

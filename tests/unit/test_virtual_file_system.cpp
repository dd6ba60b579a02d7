#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/request_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "protocol/bytes.hpp"
#include "vfs/local_file_system.hpp"
#include "vfs/memory_file_system.hpp"
#include "vfs/virtual_file_system.hpp"

namespace {

using wasmbox::core::errors::get_error;
using wasmbox::core::errors::get_value;
using wasmbox::core::errors::is_error;
using wasmbox::protocol::Bytes;
using wasmbox::protocol::FileAccess;
using wasmbox::protocol::to_bytes;
using wasmbox::vfs::LocalFileSystem;
using wasmbox::vfs::MemoryFileSystem;
using wasmbox::vfs::OpenMode;
using wasmbox::vfs::VirtualFileSystem;
using wasmbox::vfs::Whence;

std::shared_ptr<MemoryFileSystem> sample_files() {
    return std::make_shared<MemoryFileSystem>(std::map<std::string, Bytes>{
        {"/docs/readme.txt", to_bytes("hello")},
        {"docs/nested/deep.txt", to_bytes("deep")},
        {"data.bin", Bytes{0x00, 0xff, 0x10}},
    });
}

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_vfs_" + wasmbox::core::config::generate_request_id());
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

TEST(VirtualFileSystemTest, StdinRoundTripsTextThenSignalsEof) {
    VirtualFileSystem vfs;
    vfs.set_stdin(std::string("Hello, World!"));

    const auto chunk = vfs.read_stdin(13);
    EXPECT_EQ(std::string(chunk.begin(), chunk.end()), "Hello, World!");
    EXPECT_TRUE(vfs.read_stdin(13).empty());
}

TEST(VirtualFileSystemTest, StdinKeepsBinaryBytesExactly) {
    VirtualFileSystem vfs;
    const Bytes payload{0x00, 0xc3, 0x28, 0xff, 0xfe, 0x0a};
    vfs.set_stdin(payload);

    EXPECT_EQ(vfs.read_stdin(payload.size()), payload);
    EXPECT_TRUE(vfs.read_stdin(1).empty());
}

TEST(VirtualFileSystemTest, StdinReadsInChunksAndResetsOnSet) {
    VirtualFileSystem vfs;
    vfs.set_stdin(std::string("abcdef"));
    EXPECT_EQ(vfs.read_stdin(4), to_bytes("abcd"));
    EXPECT_EQ(vfs.read_stdin(4), to_bytes("ef"));

    vfs.set_stdin(std::string("xyz"));
    EXPECT_EQ(vfs.read_stdin(10), to_bytes("xyz"));
}

TEST(VirtualFileSystemTest, WritesCopyCallerBuffer) {
    VirtualFileSystem vfs;
    std::vector<std::uint8_t> buffer{'a', 'b', 'c'};
    EXPECT_EQ(vfs.write_stdout(buffer.data(), buffer.size()), 3u);
    buffer[0] = 'z';
    const std::string tail = "\n";
    vfs.write_stdout(reinterpret_cast<const std::uint8_t*>(tail.data()), tail.size());

    EXPECT_EQ(vfs.get_stdout(), "abc\n");
}

TEST(VirtualFileSystemTest, BinaryAccessorIsExactAndTextIsLossy) {
    VirtualFileSystem vfs;
    const Bytes png_header{0x89, 0x50, 0x4e, 0x47};
    vfs.write_stdout(png_header.data(), png_header.size());

    EXPECT_EQ(vfs.get_stdout_binary(), png_header);
    EXPECT_EQ(vfs.get_stdout(), "\xEF\xBF\xBDPNG");
}

TEST(VirtualFileSystemTest, ResetClearsEveryStream) {
    VirtualFileSystem vfs(FileAccess::Read, sample_files());
    vfs.set_stdin(std::string("input"));
    const std::string text = "out";
    vfs.write_stdout(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    vfs.write_stderr(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    auto fd = vfs.open_file("docs/readme.txt", OpenMode::Read);
    ASSERT_FALSE(is_error(fd));

    vfs.reset();

    EXPECT_TRUE(vfs.get_stdout().empty());
    EXPECT_TRUE(vfs.get_stderr().empty());
    EXPECT_TRUE(vfs.get_stdout_binary().empty());
    EXPECT_TRUE(vfs.get_stderr_binary().empty());
    EXPECT_TRUE(vfs.read_stdin(16).empty());
    EXPECT_FALSE(vfs.is_valid_fd(get_value(fd)));
}

TEST(VirtualFileSystemTest, NonePolicyForbidsAllFileOperations) {
    VirtualFileSystem vfs(FileAccess::None, sample_files());

    auto read = vfs.read_file("docs/readme.txt");
    ASSERT_TRUE(is_error(read));
    EXPECT_EQ(get_error(read).code, "file_access_denied");
    EXPECT_TRUE(is_error(vfs.write_file("x.txt", to_bytes("x"))));
    EXPECT_TRUE(is_error(vfs.readdir("/")));
    EXPECT_FALSE(vfs.exists("docs/readme.txt"));
}

TEST(VirtualFileSystemTest, ReadPolicyNeverGrantsWrites) {
    VirtualFileSystem vfs(FileAccess::Read, sample_files());

    auto read = vfs.read_file_as_string("/docs/readme.txt");
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read), "hello");

    auto write = vfs.write_file("docs/readme.txt", to_bytes("changed"));
    ASSERT_TRUE(is_error(write));
    EXPECT_EQ(get_error(write).message, "Write access is not allowed for this tool");

    auto write_fd = vfs.open_file("new.txt", OpenMode::Write);
    EXPECT_TRUE(is_error(write_fd));
}

TEST(VirtualFileSystemTest, WritePolicyNeverGrantsReads) {
    VirtualFileSystem vfs(FileAccess::Write, sample_files());

    EXPECT_FALSE(is_error(vfs.write_file("out/result.txt", to_bytes("done"))));
    auto read = vfs.read_file("out/result.txt");
    ASSERT_TRUE(is_error(read));
    EXPECT_EQ(get_error(read).message, "Read access is not allowed for this tool");
}

TEST(VirtualFileSystemTest, MissingBackendDeniesAccess) {
    VirtualFileSystem vfs(FileAccess::ReadWrite);
    EXPECT_FALSE(vfs.has_backend());

    auto read = vfs.read_file("a.txt");
    ASSERT_TRUE(is_error(read));
    EXPECT_EQ(get_error(read).code, "file_access_denied");
}

TEST(VirtualFileSystemTest, TraversalIsAbsorbedAtRoot) {
    VirtualFileSystem vfs(FileAccess::Read, sample_files());

    auto read = vfs.read_file_as_string("../../docs/./nested/../readme.txt");
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read), "hello");
}

TEST(VirtualFileSystemTest, StatAndReaddirSeeImplicitDirectories) {
    VirtualFileSystem vfs(FileAccess::Read, sample_files());

    auto info = vfs.stat("docs");
    ASSERT_FALSE(is_error(info));
    EXPECT_TRUE(get_value(info).is_directory);

    auto file_info = vfs.stat("data.bin");
    ASSERT_FALSE(is_error(file_info));
    EXPECT_TRUE(get_value(file_info).is_file);
    EXPECT_EQ(get_value(file_info).size, 3u);

    auto entries = vfs.readdir("/docs");
    ASSERT_FALSE(is_error(entries));
    EXPECT_EQ(get_value(entries), (std::vector<std::string>{"nested", "readme.txt"}));

    auto missing = vfs.stat("nope.txt");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "file_not_found");
}

TEST(VirtualFileSystemTest, DescriptorsStartAboveStandardStreams) {
    VirtualFileSystem vfs(FileAccess::Read, sample_files());

    auto first = vfs.open_file("docs/readme.txt", OpenMode::Read);
    auto second = vfs.open_file("data.bin", OpenMode::Read);
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(first), 3);
    EXPECT_EQ(get_value(second), 4);
    EXPECT_EQ(vfs.fd_path(4).value_or(""), "data.bin");
}

TEST(VirtualFileSystemTest, StandardStreamsCannotBeClosed) {
    VirtualFileSystem vfs;
    for (int fd = 0; fd < 3; ++fd) {
        vfs.close_file(fd);
        EXPECT_TRUE(vfs.is_valid_fd(fd));
    }
}

TEST(VirtualFileSystemTest, OpenFileReadsAndSeeks) {
    VirtualFileSystem vfs(FileAccess::Read, sample_files());
    auto fd_result = vfs.open_file("docs/readme.txt", OpenMode::Read);
    ASSERT_FALSE(is_error(fd_result));
    const int fd = get_value(fd_result);

    auto head = vfs.read_open_file(fd, 2);
    ASSERT_FALSE(is_error(head));
    EXPECT_EQ(get_value(head), to_bytes("he"));

    auto pos = vfs.seek(fd, -2, Whence::End);
    ASSERT_FALSE(is_error(pos));
    EXPECT_EQ(get_value(pos), 3u);
    EXPECT_EQ(get_value(vfs.read_open_file(fd, 10)), to_bytes("lo"));
    EXPECT_TRUE(get_value(vfs.read_open_file(fd, 10)).empty());

    vfs.close_file(fd);
    EXPECT_FALSE(vfs.is_valid_fd(fd));
    auto closed = vfs.read_open_file(fd, 1);
    ASSERT_TRUE(is_error(closed));
    EXPECT_EQ(get_error(closed).code, "bad_descriptor");
}

TEST(VirtualFileSystemTest, DirectoryOpenRequiresAccess) {
    VirtualFileSystem denied(FileAccess::None, sample_files());
    EXPECT_TRUE(is_error(denied.open_file("/", OpenMode::Directory)));

    VirtualFileSystem allowed(FileAccess::Read, sample_files());
    auto fd = allowed.open_file("/", OpenMode::Directory);
    ASSERT_FALSE(is_error(fd));
    EXPECT_EQ(allowed.open_file_entry(get_value(fd))->mode, OpenMode::Directory);
}

TEST(VirtualFileSystemTest, DirectoryOpenGoesThroughPolicyAndBackendChecks) {
    VirtualFileSystem detached(FileAccess::Read);
    auto no_backend = detached.open_file("/", OpenMode::Directory);
    ASSERT_TRUE(is_error(no_backend));
    EXPECT_EQ(get_error(no_backend).code, "file_access_denied");

    VirtualFileSystem write_only(FileAccess::Write, sample_files());
    auto anchor = write_only.open_file("/docs/../docs", OpenMode::Directory);
    ASSERT_FALSE(is_error(anchor));
    EXPECT_EQ(*write_only.fd_path(get_value(anchor)), "docs");
    EXPECT_TRUE(is_error(write_only.read_file("docs/readme.txt")));

    auto file_as_dir = write_only.open_file("data.bin", OpenMode::Directory);
    ASSERT_TRUE(is_error(file_as_dir));
    EXPECT_EQ(get_error(file_as_dir).code, "not_directory");
}

TEST(LocalFileSystemTest, BridgesWorkspaceFiles) {
    TempWorkspace workspace;
    auto backend = std::make_shared<LocalFileSystem>(workspace.root());
    VirtualFileSystem vfs(FileAccess::ReadWrite, backend);

    ASSERT_FALSE(is_error(vfs.write_file("out/note.txt", to_bytes("saved"))));
    EXPECT_TRUE(std::filesystem::exists(workspace.root() / "out/note.txt"));

    auto read = vfs.read_file_as_string("/out/note.txt");
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read), "saved");

    auto entries = vfs.readdir("out");
    ASSERT_FALSE(is_error(entries));
    EXPECT_EQ(get_value(entries), std::vector<std::string>{"note.txt"});
}

TEST(LocalFileSystemTest, TraversalStaysInsideWorkspace) {
    TempWorkspace workspace;
    auto backend = std::make_shared<LocalFileSystem>(workspace.root());
    VirtualFileSystem vfs(FileAccess::ReadWrite, backend);

    ASSERT_FALSE(is_error(vfs.write_file("../../escape.txt", to_bytes("x"))));
    EXPECT_TRUE(std::filesystem::exists(workspace.root() / "escape.txt"));
    EXPECT_FALSE(std::filesystem::exists(workspace.root().parent_path() / "escape.txt"));
}

}  // namespace

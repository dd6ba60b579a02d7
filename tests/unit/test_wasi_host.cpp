#include <map>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "protocol/bytes.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/wasi_host.hpp"
#include "vfs/memory_file_system.hpp"
#include "vfs/virtual_file_system.hpp"
#include "wat_fixtures.hpp"

namespace {

using wasmbox::protocol::Bytes;
using wasmbox::protocol::ExecutionOptions;
using wasmbox::protocol::ExecutionResult;
using wasmbox::protocol::FileAccess;
using wasmbox::protocol::to_bytes;
using wasmbox::runtime::WasiHost;
using wasmbox::testing::compile_wat;
using wasmbox::vfs::MemoryFileSystem;
using wasmbox::vfs::VirtualFileSystem;

ExecutionResult run_wat(const std::string& wat, const std::vector<std::string>& argv = {"tool"},
                        ExecutionOptions options = {}) {
    const WasiHost host;
    VirtualFileSystem vfs;
    return host.execute(compile_wat(wat), argv, options, vfs);
}

// Calls one import with fixed arguments and exits with the errno it returned.
std::string errno_of_import(const std::string& name, const std::string& params,
                        const std::string& args) {
    return R"((module
  (import "wasi_snapshot_preview1" ")" + name + R"(" (func $target (param )" + params +
           R"() (result i32)))
  (import "wasi_snapshot_preview1" "proc_exit" (func $exit (param i32)))
  (memory (export "memory") 1)
  (func (export "_start")
    (call $exit (call $target )" + args + R"()))))";
}

TEST(WasiHostTest, HelloWorldWritesStdoutAndExitsZero) {
    const auto result = run_wat(wasmbox::testing::kHelloWat);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_FALSE(result.stdout_binary.has_value());
    EXPECT_EQ(result.stderr_text, "");
    EXPECT_FALSE(result.error.has_value());
}

TEST(WasiHostTest, CatEchoesStdinAcrossSeveralReads) {
    ExecutionOptions options;
    options.stdin_text = std::string(200, 'x') + "\nend";

    const auto result = run_wat(wasmbox::testing::kCatWat, {"cat"}, options);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, *options.stdin_text);
}

TEST(WasiHostTest, BinaryStdinWinsOverText) {
    ExecutionOptions options;
    options.stdin_text = "ignored";
    options.stdin_binary = to_bytes("bytes win");

    const auto result = run_wat(wasmbox::testing::kCatWat, {"cat"}, options);

    EXPECT_EQ(result.stdout_text, "bytes win");
}

TEST(WasiHostTest, ProcExitCodeBecomesExitCode) {
    const auto result = run_wat(R"((module
  (import "wasi_snapshot_preview1" "proc_exit" (func $exit (param i32)))
  (memory (export "memory") 1)
  (func (export "_start") (call $exit (i32.const 3)) (unreachable)))
)");

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stderr_text, "");
}

TEST(WasiHostTest, ArgsAreNulTerminatedBackToBack) {
    const auto result = run_wat(R"((module
  (import "wasi_snapshot_preview1" "args_sizes_get"
    (func $sizes (param i32 i32) (result i32)))
  (import "wasi_snapshot_preview1" "args_get"
    (func $args (param i32 i32) (result i32)))
  (import "wasi_snapshot_preview1" "fd_write"
    (func $fd_write (param i32 i32 i32 i32) (result i32)))
  (memory (export "memory") 1)
  (func (export "_start")
    (drop (call $sizes (i32.const 0) (i32.const 4)))
    (drop (call $args (i32.const 100) (i32.const 200)))
    (i32.store (i32.const 16) (i32.const 200))
    (i32.store (i32.const 20) (i32.load (i32.const 4)))
    (drop (call $fd_write (i32.const 1) (i32.const 16) (i32.const 1) (i32.const 24)))))
)",
                                {"wc", "-l", "in put"});

    ASSERT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, std::string("wc\0-l\0in put\0", 13));
}

TEST(WasiHostTest, SocketCallsAreRefusedWithPerm) {
    const auto result =
        run_wat(errno_of_import("sock_shutdown", "i32 i32", "(i32.const 3) (i32.const 0)"));

    EXPECT_EQ(result.exit_code, 63);
}

TEST(WasiHostTest, UnsupportedPathMutationReturnsNosys) {
    const auto result = run_wat(errno_of_import("path_create_directory", "i32 i32 i32",
                                            "(i32.const 3) (i32.const 0) (i32.const 0)"));

    EXPECT_EQ(result.exit_code, 52);
}

TEST(WasiHostTest, WriteToUnknownDescriptorReturnsBadf) {
    const auto result =
        run_wat(errno_of_import("fd_write", "i32 i32 i32 i32",
                            "(i32.const 9) (i32.const 0) (i32.const 0) (i32.const 0)"));

    EXPECT_EQ(result.exit_code, 8);
}

TEST(WasiHostTest, OutOfBoundsPointerFailsTheRunOnStderr) {
    const auto result =
        run_wat(errno_of_import("fd_write", "i32 i32 i32 i32",
                            "(i32.const 1) (i32.const 1048576) (i32.const 1) (i32.const 0)"));

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.stderr_text.rfind("Error: ", 0), 0u);
    EXPECT_NE(result.stderr_text.find("out of bounds"), std::string::npos);
}

TEST(WasiHostTest, MissingStartExportIsReported) {
    const auto result = run_wat(R"((module (memory (export "memory") 1)))");

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_text.find("does not export _start"), std::string::npos);
}

TEST(WasiHostTest, MissingMemoryExportIsReported) {
    const auto result = run_wat(R"((module (func (export "_start"))))");

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_text.find("does not export memory"), std::string::npos);
}

TEST(WasiHostTest, InvalidBinaryFailsToCompile) {
    const WasiHost host;
    VirtualFileSystem vfs;

    const auto result = host.execute(Bytes{0x00, 0x61, 0x73}, {"tool"}, {}, vfs);

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_text.find("Failed to compile WASM module"), std::string::npos);
}

TEST(WasiHostTest, RunawayGuestIsInterruptedAtTimeout) {
    ExecutionOptions options;
    options.timeout_ms = 200;

    const auto result = run_wat(wasmbox::testing::kSpinWat, {"spin"}, options);

    EXPECT_EQ(result.exit_code, 1);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Tool execution timed out after 200ms");
    EXPECT_NE(result.stderr_text.find("timed out after 200ms"), std::string::npos);
}

TEST(WasiHostTest, NonUtf8StdoutIsKeptAsExactBytes) {
    const auto result = run_wat(R"((module
  (import "wasi_snapshot_preview1" "fd_write"
    (func $fd_write (param i32 i32 i32 i32) (result i32)))
  (memory (export "memory") 1)
  (data (i32.const 8) "\89PNG\00\ff")
  (func (export "_start")
    (i32.store (i32.const 0) (i32.const 8))
    (i32.store (i32.const 4) (i32.const 6))
    (drop (call $fd_write (i32.const 1) (i32.const 0) (i32.const 1) (i32.const 20)))))
)");

    ASSERT_EQ(result.exit_code, 0);
    ASSERT_TRUE(result.stdout_binary.has_value());
    EXPECT_EQ(*result.stdout_binary, (Bytes{0x89, 'P', 'N', 'G', 0x00, 0xff}));
}

const char* kReadFileWat = R"((module
  (import "wasi_snapshot_preview1" "path_open"
    (func $path_open (param i32 i32 i32 i32 i32 i64 i64 i32 i32) (result i32)))
  (import "wasi_snapshot_preview1" "fd_read"
    (func $fd_read (param i32 i32 i32 i32) (result i32)))
  (import "wasi_snapshot_preview1" "fd_write"
    (func $fd_write (param i32 i32 i32 i32) (result i32)))
  (import "wasi_snapshot_preview1" "proc_exit" (func $exit (param i32)))
  (memory (export "memory") 1)
  (data (i32.const 300) "notes.txt")
  (func (export "_start")
    (local $errno i32)
    (local.set $errno
      (call $path_open (i32.const 3) (i32.const 0) (i32.const 300) (i32.const 9)
                       (i32.const 0) (i64.const 2) (i64.const 0) (i32.const 0)
                       (i32.const 40)))
    (if (local.get $errno) (then (call $exit (local.get $errno))))
    (i32.store (i32.const 0) (i32.const 100))
    (i32.store (i32.const 4) (i32.const 128))
    (drop (call $fd_read (i32.load (i32.const 40)) (i32.const 0) (i32.const 1) (i32.const 20)))
    (i32.store (i32.const 4) (i32.load (i32.const 20)))
    (drop (call $fd_write (i32.const 1) (i32.const 0) (i32.const 1) (i32.const 24)))))
)";

TEST(WasiHostTest, PreopenedRootServesFilesUnderReadPolicy) {
    const WasiHost host;
    auto backend = std::make_shared<MemoryFileSystem>(
        std::map<std::string, Bytes>{{"notes.txt", to_bytes("from the vfs")}});
    VirtualFileSystem vfs(FileAccess::Read, backend);

    const auto result = host.execute(compile_wat(kReadFileWat), {"reader"}, {}, vfs);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "from the vfs");
}

TEST(WasiHostTest, NoFileAccessMeansNoPreopen) {
    const WasiHost host;
    auto backend = std::make_shared<MemoryFileSystem>(
        std::map<std::string, Bytes>{{"notes.txt", to_bytes("secret")}});
    VirtualFileSystem vfs(FileAccess::None, backend);

    const auto result = host.execute(compile_wat(kReadFileWat), {"reader"}, {}, vfs);

    EXPECT_EQ(result.exit_code, 8);
    EXPECT_EQ(result.stdout_text, "");
}

TEST(WasiHostTest, MissingFileMapsToNoent) {
    const WasiHost host;
    auto backend = std::make_shared<MemoryFileSystem>();
    VirtualFileSystem vfs(FileAccess::Read, backend);

    const auto result = host.execute(compile_wat(kReadFileWat), {"reader"}, {}, vfs);

    EXPECT_EQ(result.exit_code, 44);
}

}  // namespace

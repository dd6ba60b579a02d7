#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/request_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using wasmbox::core::errors::get_error;
using wasmbox::core::errors::get_value;
using wasmbox::core::errors::is_error;
using wasmbox::policy::AccessIntent;
using wasmbox::policy::PolicyGuard;
using wasmbox::protocol::FileAccess;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_policy_guard_" + wasmbox::core::config::generate_request_id());
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(PolicyGuardTest, AllowsPathInsideWorkspace) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.txt", "ok");

    PolicyGuard guard;
    auto result =
        guard.validate_path_in_workspace(workspace.root(), "sub/sample.txt");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.txt");
}

TEST(PolicyGuardTest, RejectsPathOutsideWorkspace) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() / "outside.txt";
    write_file(outside, "outside");

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), outside);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");

    std::error_code ec;
    std::filesystem::remove(outside, ec);
}

TEST(PolicyGuardTest, RejectsInvalidWorkspaceRoot) {
    PolicyGuard guard;
    const auto missing_root =
        std::filesystem::current_path() /
        ("__missing_workspace_root__" + wasmbox::core::config::generate_request_id());
    std::error_code ec;
    std::filesystem::remove_all(missing_root, ec);
    auto result = guard.validate_path_in_workspace(missing_root, "a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_workspace_root");
}

TEST(PolicyGuardTest, NoneForbidsEverything) {
    PolicyGuard guard;
    auto read = guard.check_file_access(FileAccess::None, AccessIntent::Read);
    auto write = guard.check_file_access(FileAccess::None, AccessIntent::Write);
    ASSERT_TRUE(is_error(read));
    ASSERT_TRUE(is_error(write));
    EXPECT_EQ(get_error(read).code, "file_access_denied");
    EXPECT_EQ(get_error(read).message, "File system access is not allowed for this tool");
}

TEST(PolicyGuardTest, ReadPolicyForbidsWrites) {
    PolicyGuard guard;
    EXPECT_FALSE(is_error(guard.check_file_access(FileAccess::Read, AccessIntent::Read)));
    auto write = guard.check_file_access(FileAccess::Read, AccessIntent::Write);
    ASSERT_TRUE(is_error(write));
    EXPECT_EQ(get_error(write).message, "Write access is not allowed for this tool");
}

TEST(PolicyGuardTest, WritePolicyForbidsReads) {
    PolicyGuard guard;
    EXPECT_FALSE(is_error(guard.check_file_access(FileAccess::Write, AccessIntent::Write)));
    auto read = guard.check_file_access(FileAccess::Write, AccessIntent::Read);
    ASSERT_TRUE(is_error(read));
    EXPECT_EQ(get_error(read).message, "Read access is not allowed for this tool");
}

TEST(PolicyGuardTest, ReadWriteAllowsBoth) {
    PolicyGuard guard;
    EXPECT_FALSE(is_error(guard.check_file_access(FileAccess::ReadWrite, AccessIntent::Read)));
    EXPECT_FALSE(is_error(guard.check_file_access(FileAccess::ReadWrite, AccessIntent::Write)));
}

TEST(PolicyGuardTest, NormalizesVirtualPaths) {
    EXPECT_EQ(PolicyGuard::normalize_virtual_path("/a/./b"), "a/b");
    EXPECT_EQ(PolicyGuard::normalize_virtual_path("a/b/../c"), "a/c");
    EXPECT_EQ(PolicyGuard::normalize_virtual_path("../../etc/passwd"), "etc/passwd");
    EXPECT_EQ(PolicyGuard::normalize_virtual_path("/"), "");
    EXPECT_EQ(PolicyGuard::normalize_virtual_path("a//b/"), "a/b");
}

}  // namespace

#include <gtest/gtest.h>

#include "janitor/containment_guard.hpp"
#include "testing.hpp"

#include <filesystem>

namespace janitor {
namespace {

namespace fs = std::filesystem;

TEST(ContainmentGuardTest, AcceptsRootAndDescendants) {
    testutil::UploadsFixtureDir dir;
    EXPECT_TRUE(IsContained(dir.Uploads(), dir.Uploads()));
    EXPECT_TRUE(IsContained(dir.Uploads() / "a.jpg", dir.Uploads()));
    EXPECT_TRUE(IsContained(dir.Uploads() / "not" / "yet" / "there.png", dir.Uploads()));
    EXPECT_TRUE(IsContained(dir.Uploads() / "x" / ".." / "a.jpg", dir.Uploads()));
}

TEST(ContainmentGuardTest, RejectsTraversal) {
    testutil::UploadsFixtureDir dir;
    EXPECT_FALSE(IsContained(dir.Uploads() / ".." / "secret.txt", dir.Uploads()));
    EXPECT_FALSE(IsContained(dir.Uploads() / "a" / ".." / ".." / "secret.txt", dir.Uploads()));
    EXPECT_FALSE(IsContained("/etc/passwd", dir.Uploads()));
}

TEST(ContainmentGuardTest, RejectsSiblingWithSharedPrefix) {
    testutil::UploadsFixtureDir dir;
    EXPECT_FALSE(IsContained(dir.Base() / "data" / "uploads2" / "a.jpg", dir.Uploads()));
}

TEST(ContainmentGuardTest, RootWithTrailingSeparator) {
    testutil::UploadsFixtureDir dir;
    const fs::path root = dir.Uploads().string() + "/";
    EXPECT_TRUE(IsContained(dir.Uploads() / "a.jpg", root));
    EXPECT_FALSE(IsContained(dir.Secret(), root));
}

TEST(ContainmentGuardTest, FollowsSymlinkThatLeavesRoot) {
    testutil::UploadsFixtureDir dir;
    fs::create_directory_symlink(dir.Base() / "data", dir.Uploads() / "escape");
    EXPECT_FALSE(IsContained(dir.Uploads() / "escape" / "secret.txt", dir.Uploads()));
}

TEST(ContainmentGuardTest, SymlinkedRootIsCanonicalizedToo) {
    testutil::UploadsFixtureDir dir;
    const fs::path link = dir.Base() / "uploads-link";
    fs::create_directory_symlink(dir.Uploads(), link);
    EXPECT_TRUE(IsContained(link / "a.jpg", link));
    EXPECT_FALSE(IsContained(link / ".." / "secret.txt", link));
    // Same file, but spelled outside the root: both readings must agree.
    EXPECT_FALSE(IsContained(dir.Uploads() / "a.jpg", link));
}

TEST(ContainmentGuardTest, SymlinkThenDotDotMustStayInsideLexically) {
    testutil::UploadsFixtureDir dir;
    fs::create_directories(dir.Uploads() / "inner" / "deep");
    fs::create_directory_symlink(dir.Uploads() / "inner" / "deep", dir.Uploads() / "link");

    // Canonically <root>/secret.txt, lexically <root>/../secret.txt.
    EXPECT_FALSE(IsContained(dir.Uploads() / "link" / ".." / ".." / "secret.txt", dir.Uploads()));
    EXPECT_TRUE(IsContained(dir.Uploads() / "link" / ".." / "x.jpg", dir.Uploads()));
}

TEST(ContainmentGuardTest, CanonicalPathFoldsDotSegments) {
    testutil::UploadsFixtureDir dir;
    const auto canon = CanonicalPath(dir.Uploads() / "." / "a" / ".." / "b.jpg");
    ASSERT_TRUE(canon.has_value());
    EXPECT_EQ(canon->filename().string(), "b.jpg");
    EXPECT_EQ(canon->parent_path().filename().string(), "uploads");
}

} // namespace
} // namespace janitor

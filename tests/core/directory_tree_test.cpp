#include "../test_config.h"

#include "sandfs/core/file_system.hpp"
#include "sandfs/core/logger.hpp"

#include <memory>

namespace sandfs::Test {

class DirectoryTreeTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        Logger::instance().set_level(LogLevel::NONE);
        fs = std::make_unique<SandboxedFileSystem>(root.path());
    }

    TempDir root;
    TempDir outside;
    std::unique_ptr<SandboxedFileSystem> fs;
};

TEST_F(DirectoryTreeTest, NestedScenario)
{
    ASSERT_TRUE(fs->make_directory("a/b").success());
    ASSERT_TRUE(fs->write_file("a/b/f.txt", "hello").success());

    auto r = fs->get_directory_tree("/");
    ASSERT_TRUE(r.success()) << r.error;

    const DirectoryTree& tree = r.value;
    ASSERT_EQ(tree.size(), 3u);
    EXPECT_EQ(tree.at("/"), "a (directory)");
    EXPECT_EQ(tree.at("/a"), "b (directory)");
    EXPECT_EQ(tree.at("/a/b"), "f.txt");
}

TEST_F(DirectoryTreeTest, FilesComeBeforeDirectories)
{
    ASSERT_TRUE(fs->make_directory("zdir").success());
    ASSERT_TRUE(fs->make_directory("adir").success());
    ASSERT_TRUE(fs->write_file("b.txt", "").success());
    ASSERT_TRUE(fs->write_file("a.txt", "").success());
    ASSERT_TRUE(fs->write_file("zdir/inner.txt", "").success());

    auto r = fs->get_directory_tree("");
    ASSERT_TRUE(r.success());
    EXPECT_EQ(r.path, "/");
    EXPECT_EQ(r.value.at("/"), "a.txt\nb.txt\nadir (directory)\nzdir (directory)");
    EXPECT_EQ(r.value.at("/adir"), "");
    EXPECT_EQ(r.value.at("/zdir"), "inner.txt");
}

TEST_F(DirectoryTreeTest, EmptyRoot)
{
    auto r = fs->get_directory_tree(".");
    ASSERT_TRUE(r.success());
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value.at("/"), "");
}

TEST_F(DirectoryTreeTest, StartsFromCurrentDirectory)
{
    ASSERT_TRUE(fs->make_directory("a/b").success());
    ASSERT_TRUE(fs->write_file("top.txt", "").success());
    ASSERT_TRUE(fs->change_directory("a").success());

    auto r = fs->get_directory_tree(".");
    ASSERT_TRUE(r.success());
    EXPECT_EQ(r.path, "/a");
    EXPECT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value.at("/a"), "b (directory)");
    EXPECT_EQ(r.value.count("/"), 0u);
}

TEST_F(DirectoryTreeTest, Failures)
{
    ASSERT_TRUE(fs->write_file("file.txt", "x").success());

    auto missing = fs->get_directory_tree("nope");
    EXPECT_EQ(missing.status, FsStatus::NOT_FOUND);
    EXPECT_TRUE(missing.value.empty());

    auto file = fs->get_directory_tree("file.txt");
    EXPECT_EQ(file.status, FsStatus::WRONG_TYPE);

    auto denied = fs->get_directory_tree("../..");
    EXPECT_EQ(denied.status, FsStatus::DENIED);
    EXPECT_EQ(denied.path, "../..");
}

TEST_F(DirectoryTreeTest, SymlinkCycleTerminates)
{
    ASSERT_TRUE(fs->make_directory("a").success());
    ASSERT_EQ(symlink("..", (root / "a/loop").c_str()), 0);

    auto r = fs->get_directory_tree("/");
    ASSERT_TRUE(r.success());
    EXPECT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value.at("/a"), "loop (directory)");
    EXPECT_EQ(r.value.count("/a/loop"), 0u);
}

TEST_F(DirectoryTreeTest, SelfReferencingLinkTerminates)
{
    ASSERT_EQ(symlink(".", (root / "self").c_str()), 0);

    auto r = fs->get_directory_tree("/");
    ASSERT_TRUE(r.success());
    EXPECT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value.at("/"), "self (directory)");
}

TEST_F(DirectoryTreeTest, LinksOutsideRootAreListedButNotFollowed)
{
    ASSERT_TRUE(mkdir((outside / "private").c_str(), 0700) == 0);
    write_raw(outside / "private/secret.txt", "secret");
    ASSERT_EQ(symlink(outside.path().c_str(), (root / "out").c_str()), 0);

    auto r = fs->get_directory_tree("/");
    ASSERT_TRUE(r.success());
    // The escaping target is never inspected, so the link is a plain entry
    EXPECT_EQ(r.value.at("/"), "out");
    EXPECT_EQ(r.value.count("/out"), 0u);
    EXPECT_EQ(r.value.count("/out/private"), 0u);

    for (const auto& entry : r.value) {
        EXPECT_EQ(entry.second.find("secret.txt"), std::string::npos);
    }
}

TEST_F(DirectoryTreeTest, LinksInsideRootAreFollowedOnce)
{
    ASSERT_TRUE(fs->make_directory("real").success());
    ASSERT_TRUE(fs->write_file("real/data.txt", "").success());
    ASSERT_EQ(symlink("real", (root / "link").c_str()), 0);

    auto r = fs->get_directory_tree("/");
    ASSERT_TRUE(r.success());
    EXPECT_EQ(r.value.at("/"), "link (directory)\nreal (directory)");

    // The shared target is walked under whichever name comes first
    ASSERT_EQ(r.value.count("/link"), 1u);
    EXPECT_EQ(r.value.at("/link"), "data.txt");
    EXPECT_EQ(r.value.count("/real"), 0u);
}

TEST_F(DirectoryTreeTest, DepthLimit)
{
    FsOptions options;
    options.max_tree_depth = 2;
    SandboxedFileSystem shallow(root.path(), options);

    ASSERT_TRUE(shallow.make_directory("d1/d2/d3/d4").success());

    auto r = shallow.get_directory_tree("/");
    ASSERT_TRUE(r.success());
    EXPECT_EQ(r.value.size(), 3u);
    EXPECT_EQ(r.value.at("/d1/d2"), "d3 (directory)");
    EXPECT_EQ(r.value.count("/d1/d2/d3"), 0u);
}

TEST_F(DirectoryTreeTest, UnreadableSubdirectoryIsSkipped)
{
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission bits are not enforced for root";
    }

    ASSERT_TRUE(fs->make_directory("locked").success());
    ASSERT_TRUE(fs->make_directory("open").success());
    ASSERT_EQ(chmod((root / "locked").c_str(), 0), 0);

    auto r = fs->get_directory_tree("/");
    chmod((root / "locked").c_str(), 0700);

    ASSERT_TRUE(r.success());
    EXPECT_EQ(r.value.count("/locked"), 0u);
    EXPECT_EQ(r.value.count("/open"), 1u);
}

} // namespace sandfs::Test

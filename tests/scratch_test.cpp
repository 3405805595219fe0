#include <gtest/gtest.h>

#include <fstream>

#include "scratch.hpp"
#include "test_support.hpp"

using namespace cog_converter;
using cog_converter::testing::TempDir;

TEST(ScratchTest, AllocateCreatesRootAndUniquePaths) {
    TempDir dir;
    ScratchManager manager(dir / "nested" / "scratch");

    std::error_code ec;
    auto a = manager.allocate(".tif", ec);
    auto b = manager.allocate(".tif", ec);
    ASSERT_TRUE(a && b) << ec.message();

    EXPECT_TRUE(std::filesystem::is_directory(dir / "nested" / "scratch"));
    EXPECT_NE(a->path(), b->path());
    EXPECT_EQ(a->path().parent_path(), manager.root());
    EXPECT_EQ(a->path().extension(), ".tif");
    EXPECT_EQ(a->path().filename().string().rfind("cog_", 0), 0u);
    EXPECT_EQ(a->state(), ScratchState::Created);
    EXPECT_EQ(manager.allocated(), 2u);
    EXPECT_EQ(manager.outstanding(), 2u);
}

TEST(ScratchTest, ReleaseRemovesFileExactlyOnce) {
    TempDir dir;
    ScratchManager manager(dir.path());

    std::error_code ec;
    auto resource = manager.allocate(".bin", ec);
    ASSERT_TRUE(resource);
    resource->mark_in_use();
    EXPECT_EQ(resource->state(), ScratchState::InUse);
    std::ofstream(resource->path()) << "data";

    resource->release();
    resource->release();
    EXPECT_EQ(resource->state(), ScratchState::Released);
    EXPECT_FALSE(std::filesystem::exists(resource->path()));
    EXPECT_EQ(manager.released(), 1u);
    EXPECT_EQ(manager.outstanding(), 0u);
    EXPECT_EQ(manager.removal_failures(), 0u);
}

TEST(ScratchTest, DestructorReleases) {
    TempDir dir;
    ScratchManager manager(dir.path());
    std::filesystem::path path;
    {
        std::error_code ec;
        auto resource = manager.allocate(".tif", ec);
        ASSERT_TRUE(resource);
        path = resource->path();
        std::ofstream(path) << "data";
    }
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_EQ(manager.released(), 1u);
    EXPECT_EQ(manager.outstanding(), 0u);
}

TEST(ScratchTest, ReleasingUnwrittenPathIsNotAFailure) {
    TempDir dir;
    ScratchManager manager(dir.path());
    std::error_code ec;
    auto resource = manager.allocate(".tif", ec);
    ASSERT_TRUE(resource);
    resource->release();
    EXPECT_EQ(manager.removal_failures(), 0u);
    EXPECT_EQ(manager.outstanding(), 0u);
}

TEST(ScratchTest, MoveTransfersOwnership) {
    TempDir dir;
    ScratchManager manager(dir.path());
    std::error_code ec;
    auto resource = manager.allocate(".tif", ec);
    ASSERT_TRUE(resource);

    ScratchResource moved = std::move(*resource);
    EXPECT_TRUE(resource->empty());
    EXPECT_FALSE(moved.empty());
    EXPECT_EQ(moved.state(), ScratchState::Created);

    resource->release();
    EXPECT_EQ(manager.released(), 0u);

    moved.release();
    EXPECT_EQ(manager.released(), 1u);
}

TEST(ScratchTest, DefaultResourceIsEmpty) {
    ScratchResource resource;
    EXPECT_TRUE(resource.empty());
    EXPECT_EQ(resource.state(), ScratchState::Released);
    resource.release();
}

TEST(ScratchTest, StateNames) {
    EXPECT_STREQ(to_string(ScratchState::Created), "Created");
    EXPECT_STREQ(to_string(ScratchState::InUse), "InUse");
    EXPECT_STREQ(to_string(ScratchState::Released), "Released");
}

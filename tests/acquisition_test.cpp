#include <gtest/gtest.h>

#include "acquisition.hpp"
#include "errors.hpp"
#include "file_object_store.hpp"
#include "test_support.hpp"

using namespace cog_converter;
using cog_converter::testing::read_file_bytes;
using cog_converter::testing::TempDir;
using cog_converter::testing::TestImage;
using cog_converter::testing::write_file_bytes;
using cog_converter::testing::write_test_geotiff;

namespace fs = std::filesystem;

class AcquisitionTest : public ::testing::Test {
   protected:
    void SetUp() override {
        fs::create_directories(dir_ / "store" / "bucket" / "dir");
        image_.bands = 3;
        image_.rgb = true;
        image_.tiled = true;
        image_.nodata = 0.0;
        ASSERT_TRUE(write_test_geotiff(dir_ / "store" / "bucket" / "dir" / "a.tif", image_));
        retry_.max_attempts = 1;
    }

    TempDir dir_;
    TestImage image_;
    FilesystemObjectStore store_{dir_ / "store"};
    ScratchManager scratch_{dir_ / "scratch"};
    RetryPolicy retry_;
    AcquisitionStrategy acquisition_{store_, scratch_, retry_};
};

TEST_F(AcquisitionTest, PreloadAndStreamAgree) {
    std::error_code ec;
    auto preloaded = acquisition_.acquire("bucket", "dir/a.tif", AcquisitionMode::Preload, ec);
    ASSERT_TRUE(preloaded) << ec.message();
    EXPECT_FALSE(preloaded->scratch.empty());
    EXPECT_EQ(preloaded->scratch.path().extension(), ".tif");
    EXPECT_TRUE(fs::exists(preloaded->scratch.path()));
    EXPECT_EQ(scratch_.outstanding(), 1u);

    auto streamed = acquisition_.acquire("bucket", "dir/a.tif", AcquisitionMode::Stream, ec);
    ASSERT_TRUE(streamed) << ec.message();
    EXPECT_TRUE(streamed->scratch.empty());
    EXPECT_EQ(scratch_.allocated(), 1u);

    const RasterDataset& a = *preloaded->dataset;
    const RasterDataset& b = *streamed->dataset;
    EXPECT_EQ(a.width(), b.width());
    EXPECT_EQ(a.height(), b.height());
    EXPECT_EQ(a.sample_types(), b.sample_types());
    EXPECT_EQ(a.nodata(), b.nodata());
    EXPECT_EQ(a.georeference().epsg, b.georeference().epsg);

    auto a_pixels = a.read(ec);
    auto b_pixels = b.read(ec);
    ASSERT_TRUE(a_pixels && b_pixels);
    EXPECT_EQ(a_pixels->data, b_pixels->data);

    const fs::path scratch_path = preloaded->scratch.path();
    preloaded.reset();
    EXPECT_FALSE(fs::exists(scratch_path));
    EXPECT_EQ(scratch_.outstanding(), 0u);
}

TEST_F(AcquisitionTest, MissingKeyIsNotFoundAndReleasesScratch) {
    std::error_code ec;
    EXPECT_FALSE(acquisition_.acquire("bucket", "dir/none.tif", AcquisitionMode::Preload, ec));
    EXPECT_EQ(ec, CogErrc::not_found);
    EXPECT_EQ(scratch_.outstanding(), 0u);

    ec.clear();
    EXPECT_FALSE(acquisition_.acquire("bucket", "dir/none.tif", AcquisitionMode::Stream, ec));
    EXPECT_EQ(ec, CogErrc::not_found);
}

TEST_F(AcquisitionTest, PreloadOfNonTiffReleasesScratch) {
    write_file_bytes(dir_ / "store" / "bucket" / "text.tif", "hello");
    std::error_code ec;
    EXPECT_FALSE(acquisition_.acquire("bucket", "text.tif", AcquisitionMode::Preload, ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);
    EXPECT_EQ(scratch_.allocated(), 1u);
    EXPECT_EQ(scratch_.outstanding(), 0u);
}

TEST_F(AcquisitionTest, LocalPath) {
    std::error_code ec;
    auto acquired =
        acquisition_.open(LocalPath{dir_ / "store" / "bucket" / "dir" / "a.tif"}, ec);
    ASSERT_TRUE(acquired) << ec.message();
    EXPECT_TRUE(acquired->scratch.empty());
    EXPECT_EQ(acquired->dataset->band_count(), 3);
}

TEST_F(AcquisitionTest, MissingLocalPathFailsWithoutAllocation) {
    std::error_code ec;
    EXPECT_FALSE(acquisition_.open(LocalPath{dir_ / "none.tif"}, ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);

    ec.clear();
    EXPECT_FALSE(acquisition_.open(LocalPath{dir_.path()}, ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);
    EXPECT_EQ(scratch_.allocated(), 0u);
}

TEST_F(AcquisitionTest, InMemoryBytesAreSpilledToScratch) {
    auto bytes = read_file_bytes(dir_ / "store" / "bucket" / "dir" / "a.tif");
    std::error_code ec;
    auto acquired = acquisition_.open(InMemoryBytes{bytes, "upload.tiff"}, ec);
    ASSERT_TRUE(acquired) << ec.message();
    EXPECT_FALSE(acquired->scratch.empty());
    EXPECT_EQ(acquired->scratch.path().extension(), ".tiff");
    EXPECT_EQ(acquired->dataset->width(), image_.width);

    acquired.reset();
    EXPECT_EQ(scratch_.outstanding(), 0u);
}

TEST_F(AcquisitionTest, EmptyBytesFailWithoutAllocation) {
    std::error_code ec;
    EXPECT_FALSE(acquisition_.open(InMemoryBytes{{}, "empty.tif"}, ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);
    EXPECT_EQ(scratch_.allocated(), 0u);
}

TEST_F(AcquisitionTest, GarbageBytesReleaseScratch) {
    const std::string garbage = "garbage";
    std::error_code ec;
    EXPECT_FALSE(acquisition_.open(
        InMemoryBytes{std::vector<std::uint8_t>(garbage.begin(), garbage.end()), "g.tif"}, ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);
    EXPECT_EQ(scratch_.allocated(), 1u);
    EXPECT_EQ(scratch_.outstanding(), 0u);
}

TEST_F(AcquisitionTest, OpenHandle) {
    std::error_code ec;
    auto dataset = RasterDataset::open(dir_ / "store" / "bucket" / "dir" / "a.tif", ec);
    ASSERT_TRUE(dataset) << ec.message();

    auto acquired = acquisition_.open(OpenRemoteHandle{dataset}, ec);
    ASSERT_TRUE(acquired) << ec.message();
    EXPECT_EQ(acquired->dataset, dataset);
    EXPECT_TRUE(acquired->scratch.empty());

    ec.clear();
    EXPECT_FALSE(acquisition_.open(OpenRemoteHandle{nullptr}, ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);
}

TEST(AcquisitionModeTest, Names) {
    EXPECT_STREQ(to_string(AcquisitionMode::Preload), "preload");
    EXPECT_STREQ(to_string(AcquisitionMode::Stream), "stream");
}

#include <gtest/gtest.h>

#include <algorithm>

#include "converter.hpp"
#include "errors.hpp"
#include "file_object_store.hpp"
#include "test_support.hpp"

using namespace cog_converter;
using cog_converter::testing::read_file_bytes;
using cog_converter::testing::TempDir;
using cog_converter::testing::TestImage;
using cog_converter::testing::write_test_geotiff;

namespace fs = std::filesystem;

class CogConverterTest : public ::testing::Test {
   protected:
    void SetUp() override { ASSERT_TRUE(write_test_geotiff(source_, TestImage{})); }

    std::optional<fs::path> convert(CogConverter::Config config, SourceSpecifier source,
                                    std::error_code& ec) {
        CogConverter converter(std::move(config), acquisition_, engine_);
        return converter.run(std::move(source), ec);
    }

    TempDir dir_;
    fs::path source_ = dir_ / "dem.tif";
    FilesystemObjectStore store_{dir_.path()};
    ScratchManager scratch_{dir_ / "scratch"};
    AcquisitionStrategy acquisition_{store_, scratch_, RetryPolicy{}};
    GdalCogEngine engine_;
};

TEST_F(CogConverterTest, DefaultOutputIsBesideSource) {
    std::error_code ec;
    const auto output = convert({}, LocalPath{source_}, ec);
    ASSERT_TRUE(output) << ec.message();
    EXPECT_EQ(*output, fs::absolute(dir_ / "dem_COG_deflate.tif"));
    EXPECT_TRUE(fs::exists(*output));
    EXPECT_TRUE(validate_cog(*output).valid);
}

TEST_F(CogConverterTest, ProfileFollowsFlags) {
    CogConverter::Config config;
    config.flags.compress = true;
    std::error_code ec;
    const auto output = convert(config, LocalPath{source_}, ec);
    const auto& compressions = supported_compressions();
    if (std::find(compressions.begin(), compressions.end(), "JPEG") == compressions.end()) {
        EXPECT_FALSE(output);
        return;
    }
    ASSERT_TRUE(output) << ec.message();
    EXPECT_EQ(output->filename(), "dem_COG_jpeg.tif");
}

TEST_F(CogConverterTest, ExplicitOutputPath) {
    CogConverter::Config config;
    config.flags.is_dem = true;
    config.output_path = dir_ / "out" / "result.tif";
    fs::create_directories(dir_ / "out");

    std::error_code ec;
    const auto output = convert(config, LocalPath{source_}, ec);
    ASSERT_TRUE(output) << ec.message();
    EXPECT_EQ(*output, dir_ / "out" / "result.tif");
    EXPECT_TRUE(validate_cog(*output).valid);
}

TEST_F(CogConverterTest, InMemoryBytesWriteBesideScratch) {
    std::error_code ec;
    const auto output =
        convert({}, InMemoryBytes{read_file_bytes(source_), "upload.tif"}, ec);
    ASSERT_TRUE(output) << ec.message();
    EXPECT_EQ(output->parent_path(), dir_ / "scratch");
    EXPECT_TRUE(fs::exists(*output));
    // 入力の一時ファイルは解放済み
    EXPECT_EQ(scratch_.outstanding(), 0u);
}

TEST_F(CogConverterTest, HandleRequiresOutputPath) {
    std::error_code ec;
    auto dataset = RasterDataset::open(source_, ec);
    ASSERT_TRUE(dataset) << ec.message();

    EXPECT_FALSE(convert({}, OpenRemoteHandle{dataset}, ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);

    CogConverter::Config config;
    config.output_path = dir_ / "handle.tif";
    ec.clear();
    const auto output = convert(config, OpenRemoteHandle{dataset}, ec);
    ASSERT_TRUE(output) << ec.message();
    EXPECT_TRUE(validate_cog(*output).valid);
}

TEST_F(CogConverterTest, MissingInputFails) {
    std::error_code ec;
    EXPECT_FALSE(convert({}, LocalPath{dir_ / "none.tif"}, ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);
    EXPECT_EQ(scratch_.allocated(), 0u);
}

#include <gtest/gtest.h>

#include "profile_selector.hpp"

using namespace cog_converter;

namespace {

ClassificationFlags dem_flags(bool smooth = false) {
    ClassificationFlags flags;
    flags.is_dem = true;
    flags.smooth_dem = smooth;
    return flags;
}

}  // namespace

TEST(ProfileSelectorTest, FloatDemUsesFloatingPointPredictor) {
    const auto profile = select_profile(dem_flags(), {SampleType::Float32});
    EXPECT_EQ(profile.id, "deflate");
    EXPECT_EQ(profile.options.at("compress"), "DEFLATE");
    EXPECT_EQ(profile.options.at("predictor"), "3");
    EXPECT_EQ(profile.options.at("resampling"), "bilinear");
}

TEST(ProfileSelectorTest, IntegerDemUsesHorizontalPredictor) {
    EXPECT_EQ(select_profile(dem_flags(), {SampleType::Int16}).options.at("predictor"), "2");
    // 浮動小数点と整数が混在する場合も水平差分
    EXPECT_EQ(select_profile(dem_flags(), {SampleType::Float32, SampleType::UInt8})
                  .options.at("predictor"),
              "2");
}

TEST(ProfileSelectorTest, DemWithoutBandsUsesHorizontalPredictor) {
    EXPECT_EQ(select_profile(dem_flags(), {}).options.at("predictor"), "2");
}

TEST(ProfileSelectorTest, SmoothDemUsesCubicResampling) {
    EXPECT_EQ(select_profile(dem_flags(true), {SampleType::Float64}).options.at("resampling"),
              "cubic");
}

TEST(ProfileSelectorTest, CompressSelectsJpeg) {
    ClassificationFlags flags;
    flags.compress = true;
    // バンド数が3以上でもWebPにはしない
    const auto profile =
        select_profile(flags, {SampleType::UInt8, SampleType::UInt8, SampleType::UInt8});
    EXPECT_EQ(profile.id, "jpeg");
    EXPECT_EQ(profile.options.at("compress"), "JPEG");
    EXPECT_EQ(profile.options.at("quality"), "85");
    EXPECT_EQ(profile.options.count("predictor"), 0u);
}

TEST(ProfileSelectorTest, DefaultIsBaselineDeflate) {
    const auto profile = select_profile(ClassificationFlags{}, {SampleType::UInt16});
    auto expected = baseline_options();
    expected["compress"] = "DEFLATE";
    EXPECT_EQ(profile.id, "deflate");
    EXPECT_EQ(profile.options, expected);
}

TEST(ProfileSelectorTest, DemTakesPrecedenceOverCompress) {
    ClassificationFlags flags = dem_flags();
    flags.compress = true;
    EXPECT_EQ(select_profile_id(flags), "deflate");
    EXPECT_EQ(select_profile(flags, {SampleType::Float32}).id, "deflate");
}

TEST(ProfileSelectorTest, BaselineOptions) {
    const auto options = baseline_options();
    EXPECT_EQ(options.at("blocksize"), "256");
    EXPECT_EQ(options.at("zlevel"), "9");
    EXPECT_EQ(options.at("bigtiff"), "IF_NEEDED");
    EXPECT_EQ(options.at("num_threads"), "ALL_CPUS");
}

TEST(ProfileSelectorTest, EveryCallReturnsFreshOptions) {
    auto first = select_profile(ClassificationFlags{}, {SampleType::UInt8});
    first.options["zlevel"] = "1";
    first.options["extra"] = "x";

    const auto second = select_profile(ClassificationFlags{}, {SampleType::UInt8});
    EXPECT_EQ(second.options.at("zlevel"), "9");
    EXPECT_EQ(second.options.count("extra"), 0u);
    EXPECT_EQ(baseline_options().at("zlevel"), "9");
}

TEST(ProfileSelectorTest, OverridesAreMergedLast) {
    const auto profile =
        select_profile(dem_flags(), {SampleType::Float32}, {{"predictor", "2"}, {"zlevel", "6"}});
    EXPECT_EQ(profile.options.at("predictor"), "2");
    EXPECT_EQ(profile.options.at("zlevel"), "6");
    EXPECT_EQ(profile.options.at("resampling"), "bilinear");
}

TEST(ProfileSelectorTest, DemIgnoresNearestResamplingOverride) {
    const OptionMap overrides{{"resampling", "nearest"}, {"overview_resampling", "NEAREST"}};
    const auto profile = select_profile(dem_flags(), {SampleType::Float32}, overrides);
    EXPECT_EQ(profile.options.at("resampling"), "bilinear");
    EXPECT_EQ(profile.options.count("overview_resampling"), 0u);

    std::string reason;
    EXPECT_FALSE(check_profile_overrides(dem_flags(), overrides, reason));
    EXPECT_NE(reason.find("overview_resampling=NEAREST"), std::string::npos);
    // DEM以外では最近傍を使える
    EXPECT_TRUE(check_profile_overrides(ClassificationFlags{}, overrides, reason));
    EXPECT_EQ(select_profile(ClassificationFlags{}, {SampleType::UInt8}, overrides)
                  .options.at("resampling"),
              "nearest");
}

TEST(ProfileSelectorTest, DemIgnoresLossyCompressOverride) {
    const OptionMap overrides{{"compress", "JPEG"}};
    const auto profile = select_profile(dem_flags(), {SampleType::Int16}, overrides);
    EXPECT_EQ(profile.id, "deflate");
    EXPECT_EQ(profile.options.at("compress"), "DEFLATE");
    EXPECT_EQ(select_profile_id(dem_flags(), overrides), "deflate");

    std::string reason;
    EXPECT_FALSE(check_profile_overrides(dem_flags(), overrides, reason));
    // 可逆圧縮への変更はDEMでも受け付ける
    EXPECT_TRUE(check_profile_overrides(dem_flags(), {{"compress", "ZSTD"}}, reason));
    EXPECT_EQ(select_profile(dem_flags(), {SampleType::Int16}, {{"compress", "ZSTD"}}).id,
              "zstd");
}

TEST(ProfileSelectorTest, CompressOverrideRenamesProfile) {
    const OptionMap overrides{{"compress", "JPEG"}};
    const auto profile = select_profile(ClassificationFlags{}, {SampleType::UInt8}, overrides);
    EXPECT_EQ(profile.id, "jpeg");
    EXPECT_EQ(profile.options.at("compress"), "JPEG");
    EXPECT_EQ(profile.options.at("quality"), "85");
    EXPECT_EQ(select_profile_id(ClassificationFlags{}, overrides), profile.id);
    EXPECT_EQ(destination_key("a/b.tif", profile.id), "a/b_COG_jpeg.tif");

    // 小文字の値も同じIDになる
    EXPECT_EQ(select_profile_id(ClassificationFlags{}, {{"compress", "zstd"}}), "zstd");
    // カタログにないコーデックは小文字にした値
    EXPECT_EQ(select_profile_id(ClassificationFlags{}, {{"compress", "LERC"}}), "lerc");
}

TEST(ProfileSelectorTest, KnownProfilesHaveOptions) {
    for (const auto& id : known_profiles()) {
        const auto options = profile_options(id);
        ASSERT_TRUE(options.has_value()) << id;
        EXPECT_EQ(options->count("compress"), 1u) << id;
    }
    EXPECT_FALSE(profile_options("gif").has_value());
}

TEST(DestinationKeyTest, KeepsDirectoryAndExtension) {
    EXPECT_EQ(destination_key("a/b.tif", "jpeg"), "a/b_COG_jpeg.tif");
    EXPECT_EQ(destination_key("wsl/site/ortho.tiff", "deflate"),
              "wsl/site/ortho_COG_deflate.tiff");
}

TEST(DestinationKeyTest, UsesOnlyLastSuffix) {
    EXPECT_EQ(destination_key("x/scene.v2.tif", "deflate"), "x/scene.v2_COG_deflate.tif");
}

TEST(DestinationKeyTest, NamesWithoutSuffix) {
    EXPECT_EQ(destination_key("noext", "deflate"), "noext_COG_deflate");
    EXPECT_EQ(destination_key(".hidden", "deflate"), ".hidden_COG_deflate");
    EXPECT_EQ(destination_key("dir.d/file", "jpeg"), "dir.d/file_COG_jpeg");
    EXPECT_EQ(destination_key("trailing.", "jpeg"), "trailing._COG_jpeg");
}

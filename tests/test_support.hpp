#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "log_sink.hpp"
#include "raster.hpp"
#include "sample_type.hpp"

namespace cog_converter::testing {

// テストごとの一時ディレクトリ。デストラクタで削除する
class TempDir {
   public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

   private:
    std::filesystem::path path_;
};

// テスト用GeoTIFFの形状
struct TestImage {
    std::uint32_t width = 64;
    std::uint32_t height = 48;
    int bands = 1;
    SampleType type = SampleType::UInt8;
    bool tiled = false;
    std::uint32_t tile_size = 16;
    std::uint32_t rows_per_strip = 8;
    bool separate_planes = false;
    bool rgb = false;
    bool alpha = false;
    std::optional<double> nodata;
    // 0ならジオリファレンスなし
    int epsg = 2056;
    bool geographic = false;
    double origin_x = 2600000.0;
    double origin_y = 1200000.0;
    double pixel_size = 0.5;
};

// 画素ごとの決定的な値（nodata指定時は左上4x4がnodata）
double pattern_value(const TestImage& image, std::uint32_t x, std::uint32_t y, int band);

Raster pattern_raster(const TestImage& image);

bool write_test_geotiff(const std::filesystem::path& path, const TestImage& image);

std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path& path);

void write_file_bytes(const std::filesystem::path& path, const std::string& content);

// 出力されたログを保持するシンク
class RecordingLogSink : public LogSink {
   public:
    void write(LogLevel level, std::string_view message) override;

    std::size_t count(LogLevel level) const;
    bool contains(const std::string& fragment) const;

   private:
    mutable std::mutex mutex_;
    std::vector<std::pair<LogLevel, std::string>> entries_;
};

}  // namespace cog_converter::testing

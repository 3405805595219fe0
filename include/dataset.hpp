#pragma once

#include <gdal.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "raster.hpp"
#include "sample_type.hpp"

namespace cog_converter {

// ソースから読み取ったジオリファレンス情報
struct GeoReference {
    // [x_origin, pixel_width, 0, y_origin, 0, -pixel_height]
    std::optional<std::array<double, 6>> geo_transform;
    std::string crs_wkt;
    // CRSから同定したEPSGコード（不明なら0）
    int epsg = 0;

    bool empty() const { return crs_wkt.empty() && !geo_transform; }
};

// 下流（プロファイル選択・変換）が使うデータセットハンドル
// ローカルパスからでも、GDALの仮想ファイルシステム上のURLからでも同じ型になる
class RasterDataset {
   public:
    ~RasterDataset();

    RasterDataset(const RasterDataset&) = delete;
    RasterDataset& operator=(const RasterDataset&) = delete;

    // ローカルファイルを開く。存在しない、またはラスターとして読めない場合はInvalidInput
    [[nodiscard]] static std::shared_ptr<RasterDataset> open(const std::filesystem::path& path,
                                                             std::error_code& ec);

    // GDALが開けるURL（/vsis3/... など）を部分読み込みで開く（全体をダウンロードしない）
    // 仮想ファイルシステムのエラーはNotFound/AccessDenied/StorageIOFailureに、
    // ラスターとして解釈できない場合はInvalidInputになる
    [[nodiscard]] static std::shared_ptr<RasterDataset> open_url(const std::string& url,
                                                                 std::error_code& ec);

    const std::string& name() const;
    int band_count() const;
    const std::vector<SampleType>& sample_types() const;
    std::uint32_t width() const;
    std::uint32_t height() const;
    // カラーインタープリテーションがアルファのバンドを持つか
    bool has_alpha() const;
    // データセット全体に共通のマスクバンドを持つか
    bool has_mask() const;
    std::optional<double> nodata() const;
    const GeoReference& georeference() const;

    GDALDatasetH handle() const;

    // 指定範囲をピクセルインターリーブで読み込む
    [[nodiscard]] std::optional<Raster> read_window(std::uint32_t x, std::uint32_t y,
                                                    std::uint32_t width, std::uint32_t height,
                                                    std::error_code& ec) const;

    // 画像全体を読み込む（小さな画像とテスト用）
    [[nodiscard]] std::optional<Raster> read(std::error_code& ec) const {
        return read_window(0, 0, width(), height(), ec);
    }

   private:
    class Impl;
    explicit RasterDataset(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> pImpl;
};

}  // namespace cog_converter

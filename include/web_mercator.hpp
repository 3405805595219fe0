#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <system_error>

#include "dataset.hpp"

namespace cog_converter {

// EPSG:3857の範囲（赤道半周長）
inline constexpr double kWebMercatorHalfExtent = 20037508.342789244;
inline constexpr int kWebMercatorEpsg = 3857;
inline constexpr int kMaxWebMercatorZoom = 24;

// ズームレベルzでのピクセルサイズ（メートル）
double web_mercator_resolution(int zoom, int tile_size);

// 指定解像度に最も近いズームレベル
int web_mercator_zoom_for_resolution(double resolution, int tile_size);

// GoogleMapsCompatibleタイルグリッド上でソースが占める範囲
struct WebMercatorGrid {
    int zoom = 0;
    // [min_x, min_y, max_x, max_y]（EPSG:3857、タイル境界に揃えたもの）
    std::array<double, 4> bounds{};
    std::uint32_t width = 0;
    std::uint32_t height = 0;
};

// ソースの境界をEPSG:3857へ変換し、ネイティブ解像度に最も近いズームのグリッドを求める
// CRSまたはジオトランスフォームがなければInvalidInput、変換できなければTranscodeFailure
[[nodiscard]] std::optional<WebMercatorGrid> plan_web_mercator_grid(const GeoReference& geo,
                                                                    std::uint32_t width,
                                                                    std::uint32_t height,
                                                                    int tile_size,
                                                                    std::error_code& ec);

}  // namespace cog_converter

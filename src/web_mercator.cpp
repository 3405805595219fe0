#include "web_mercator.hpp"

#include <proj.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "errors.hpp"

namespace cog_converter {

namespace {

constexpr const char* kWebMercatorCrs = "EPSG:3857";
// 境界の各辺で変換する点の数
constexpr int kEdgeSamples = 21;

// PROJコンテキストと変換の組（PJはスレッド間で共有できない）
class ProjTransform {
   public:
    ProjTransform(const std::string& src_crs, const std::string& dst_crs) {
        ctx_ = proj_context_create();
        if (!ctx_) {
            return;
        }
        PJ* transform = proj_create_crs_to_crs(ctx_, src_crs.c_str(), dst_crs.c_str(), nullptr);
        if (!transform) {
            return;
        }
        // 正規化された変換を取得（東向き・北向き軸順序）
        PJ* normalized = proj_normalize_for_visualization(ctx_, transform);
        if (normalized) {
            proj_destroy(transform);
            transform = normalized;
        }
        pj_ = transform;
    }

    ~ProjTransform() {
        if (pj_) proj_destroy(pj_);
        if (ctx_) proj_context_destroy(ctx_);
    }

    ProjTransform(const ProjTransform&) = delete;
    ProjTransform& operator=(const ProjTransform&) = delete;

    bool valid() const { return pj_ != nullptr; }

    bool forward(double x, double y, double& ox, double& oy) const {
        return apply(PJ_FWD, x, y, ox, oy);
    }

   private:
    bool apply(PJ_DIRECTION direction, double x, double y, double& ox, double& oy) const {
        const PJ_COORD out = proj_trans(pj_, direction, proj_coord(x, y, 0, 0));
        if (!std::isfinite(out.xy.x) || !std::isfinite(out.xy.y)) {
            return false;
        }
        ox = out.xy.x;
        oy = out.xy.y;
        return true;
    }

    PJ_CONTEXT* ctx_ = nullptr;
    PJ* pj_ = nullptr;
};

}  // namespace

double web_mercator_resolution(int zoom, int tile_size) {
    return 2.0 * kWebMercatorHalfExtent / (static_cast<double>(tile_size) * std::ldexp(1.0, zoom));
}

int web_mercator_zoom_for_resolution(double resolution, int tile_size) {
    if (!(resolution > 0.0)) {
        return 0;
    }
    const double zoom = std::log2(2.0 * kWebMercatorHalfExtent / (tile_size * resolution));
    return std::clamp(static_cast<int>(std::lround(zoom)), 0, kMaxWebMercatorZoom);
}

std::optional<WebMercatorGrid> plan_web_mercator_grid(const GeoReference& geo,
                                                      std::uint32_t width, std::uint32_t height,
                                                      int tile_size, std::error_code& ec) {
    if (!geo.geo_transform || (geo.epsg <= 0 && geo.crs_wkt.empty()) || width == 0 ||
        height == 0 || tile_size <= 0) {
        ec = make_error_code(CogErrc::invalid_input);
        return std::nullopt;
    }
    const auto& gt = *geo.geo_transform;
    const std::string src_crs = geo.epsg > 0 ? "EPSG:" + std::to_string(geo.epsg) : geo.crs_wkt;

    ProjTransform transform(src_crs, kWebMercatorCrs);
    if (!transform.valid()) {
        ec = make_error_code(CogErrc::transcode_failure);
        return std::nullopt;
    }

    // ソース画像の境界を変換してバウンディングボックスを計算
    double min_x = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double min_y = std::numeric_limits<double>::max();
    double max_y = std::numeric_limits<double>::lowest();
    auto add_point = [&](double col, double row) {
        const double x = gt[0] + col * gt[1] + row * gt[2];
        const double y = gt[3] + col * gt[4] + row * gt[5];
        double mx = 0.0;
        double my = 0.0;
        if (transform.forward(x, y, mx, my)) {
            min_x = std::min(min_x, mx);
            max_x = std::max(max_x, mx);
            min_y = std::min(min_y, my);
            max_y = std::max(max_y, my);
        }
    };
    for (int i = 0; i < kEdgeSamples; ++i) {
        const double t = static_cast<double>(i) / (kEdgeSamples - 1);
        add_point(t * width, 0.0);
        add_point(t * width, height);
        add_point(0.0, t * height);
        add_point(width, t * height);
    }
    if (min_x >= max_x || min_y >= max_y) {
        ec = make_error_code(CogErrc::transcode_failure);
        return std::nullopt;
    }
    min_x = std::max(min_x, -kWebMercatorHalfExtent);
    max_x = std::min(max_x, kWebMercatorHalfExtent);
    min_y = std::max(min_y, -kWebMercatorHalfExtent);
    max_y = std::min(max_y, kWebMercatorHalfExtent);

    // 面積を保つネイティブ解像度からズームを決める
    const double native_resolution =
        std::sqrt((max_x - min_x) * (max_y - min_y) / (static_cast<double>(width) * height));
    WebMercatorGrid grid;
    grid.zoom = web_mercator_zoom_for_resolution(native_resolution, tile_size);
    const double resolution = web_mercator_resolution(grid.zoom, tile_size);
    const double tile_span = resolution * tile_size;

    // タイルグリッドに揃える（原点は左上）
    const auto tile_x0 = static_cast<long long>(std::floor((min_x + kWebMercatorHalfExtent) / tile_span));
    const auto tile_x1 = static_cast<long long>(std::ceil((max_x + kWebMercatorHalfExtent) / tile_span));
    const auto tile_y0 = static_cast<long long>(std::floor((kWebMercatorHalfExtent - max_y) / tile_span));
    const auto tile_y1 = static_cast<long long>(std::ceil((kWebMercatorHalfExtent - min_y) / tile_span));
    const long long tiles_x = std::max<long long>(1, tile_x1 - tile_x0);
    const long long tiles_y = std::max<long long>(1, tile_y1 - tile_y0);

    grid.bounds = {-kWebMercatorHalfExtent + tile_x0 * tile_span,
                   kWebMercatorHalfExtent - (tile_y0 + tiles_y) * tile_span,
                   -kWebMercatorHalfExtent + (tile_x0 + tiles_x) * tile_span,
                   kWebMercatorHalfExtent - tile_y0 * tile_span};
    grid.width = static_cast<std::uint32_t>(tiles_x * tile_size);
    grid.height = static_cast<std::uint32_t>(tiles_y * tile_size);
    return grid;
}

}  // namespace cog_converter

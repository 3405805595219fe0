#include "dataset.hpp"

#include <cpl_vsi.h>
#include <proj.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include "errors.hpp"
#include "gdal_env.hpp"

namespace cog_converter {

namespace {

SampleType to_sample_type(GDALDataType type) {
    switch (type) {
        case GDT_Byte:
            return SampleType::UInt8;
        case GDT_Int8:
            return SampleType::Int8;
        case GDT_UInt16:
            return SampleType::UInt16;
        case GDT_Int16:
            return SampleType::Int16;
        case GDT_UInt32:
            return SampleType::UInt32;
        case GDT_Int32:
            return SampleType::Int32;
        case GDT_Float32:
            return SampleType::Float32;
        case GDT_Float64:
            return SampleType::Float64;
        default:
            return SampleType::Unknown;
    }
}

GDALDataType to_gdal_type(SampleType type) {
    switch (type) {
        case SampleType::UInt8:
            return GDT_Byte;
        case SampleType::Int8:
            return GDT_Int8;
        case SampleType::UInt16:
            return GDT_UInt16;
        case SampleType::Int16:
            return GDT_Int16;
        case SampleType::UInt32:
            return GDT_UInt32;
        case SampleType::Int32:
            return GDT_Int32;
        case SampleType::Float32:
            return GDT_Float32;
        case SampleType::Float64:
            return GDT_Float64;
        case SampleType::Unknown:
            break;
    }
    return GDT_Unknown;
}

// WKTからEPSGコードを同定する（ルートのIDを優先し、なければproj_identify）
int identify_epsg(const std::string& wkt) {
    if (wkt.empty()) {
        return 0;
    }
    PJ_CONTEXT* ctx = proj_context_create();
    if (!ctx) {
        return 0;
    }
    int epsg = 0;
    PJ* crs = proj_create(ctx, wkt.c_str());
    if (crs) {
        const char* auth = proj_get_id_auth_name(crs, 0);
        const char* code = proj_get_id_code(crs, 0);
        if (auth && code && std::strcmp(auth, "EPSG") == 0) {
            epsg = std::atoi(code);
        } else {
            int* confidence = nullptr;
            PJ_OBJ_LIST* candidates = proj_identify(ctx, crs, "EPSG", nullptr, &confidence);
            if (candidates && proj_list_get_count(candidates) > 0 && confidence &&
                confidence[0] >= 90) {
                PJ* best = proj_list_get(ctx, candidates, 0);
                if (best) {
                    const char* best_code = proj_get_id_code(best, 0);
                    if (best_code) {
                        epsg = std::atoi(best_code);
                    }
                    proj_destroy(best);
                }
            }
            proj_int_list_destroy(confidence);
            proj_list_destroy(candidates);
        }
        proj_destroy(crs);
    }
    proj_context_destroy(ctx);
    return epsg;
}

}  // namespace

class RasterDataset::Impl {
   public:
    ~Impl() {
        if (dataset) {
            GDALClose(dataset);
        }
    }

    std::string name;
    GDALDatasetH dataset = nullptr;
    // GDALデータセットはスレッドセーフではない
    mutable std::mutex mutex;

    std::uint32_t width = 0;
    std::uint32_t height = 0;
    bool alpha = false;
    bool mask = false;
    std::vector<SampleType> sample_types;
    std::optional<double> nodata;
    GeoReference geo;

    [[nodiscard]] bool load_metadata(std::error_code& ec);
};

bool RasterDataset::Impl::load_metadata(std::error_code& ec) {
    const int bands = GDALGetRasterCount(dataset);
    width = static_cast<std::uint32_t>(GDALGetRasterXSize(dataset));
    height = static_cast<std::uint32_t>(GDALGetRasterYSize(dataset));
    if (bands <= 0 || width == 0 || height == 0) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }

    for (int i = 1; i <= bands; ++i) {
        GDALRasterBandH band = GDALGetRasterBand(dataset, i);
        sample_types.push_back(to_sample_type(GDALGetRasterDataType(band)));
        if (GDALGetRasterColorInterpretation(band) == GCI_AlphaBand) {
            alpha = true;
        }
    }

    GDALRasterBandH first = GDALGetRasterBand(dataset, 1);
    int has_nodata = FALSE;
    const double value = GDALGetRasterNoDataValue(first, &has_nodata);
    if (has_nodata) {
        nodata = value;
    }
    const int mask_flags = GDALGetMaskFlags(first);
    mask = (mask_flags & GMF_PER_DATASET) != 0 && (mask_flags & (GMF_ALPHA | GMF_NODATA)) == 0;

    std::array<double, 6> gt{};
    if (GDALGetGeoTransform(dataset, gt.data()) == CE_None) {
        geo.geo_transform = gt;
    }
    const char* wkt = GDALGetProjectionRef(dataset);
    if (wkt && *wkt) {
        geo.crs_wkt = wkt;
        geo.epsg = identify_epsg(geo.crs_wkt);
    }
    return true;
}

RasterDataset::RasterDataset(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

RasterDataset::~RasterDataset() = default;

std::shared_ptr<RasterDataset> RasterDataset::open(const std::filesystem::path& path,
                                                   std::error_code& ec) {
    std::error_code exists_ec;
    if (!std::filesystem::is_regular_file(path, exists_ec)) {
        ec = make_error_code(CogErrc::invalid_input);
        return nullptr;
    }

    ensure_gdal_registered();
    GdalErrorCollector errors;

    auto impl = std::make_unique<Impl>();
    impl->name = path.string();
    impl->dataset = GDALOpenEx(impl->name.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr,
                               nullptr, nullptr);
    if (!impl->dataset) {
        ec = make_error_code(CogErrc::invalid_input);
        return nullptr;
    }
    if (!impl->load_metadata(ec)) {
        return nullptr;
    }
    return std::shared_ptr<RasterDataset>(new RasterDataset(std::move(impl)));
}

std::shared_ptr<RasterDataset> RasterDataset::open_url(const std::string& url,
                                                       std::error_code& ec) {
    if (url.empty()) {
        ec = make_error_code(CogErrc::invalid_input);
        return nullptr;
    }

    ensure_gdal_registered();
    GdalErrorCollector errors;
    VSIErrorReset();

    auto impl = std::make_unique<Impl>();
    impl->name = url;
    impl->dataset = GDALOpenEx(impl->name.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr,
                               nullptr, nullptr);
    if (!impl->dataset) {
        // 読み込み自体の失敗か、ラスターとして解釈できないか
        const std::error_code vsi_ec = map_vsi_error(VSIGetLastErrorNo());
        ec = vsi_ec ? vsi_ec : make_error_code(CogErrc::invalid_input);
        return nullptr;
    }
    if (!impl->load_metadata(ec)) {
        return nullptr;
    }
    return std::shared_ptr<RasterDataset>(new RasterDataset(std::move(impl)));
}

const std::string& RasterDataset::name() const { return pImpl->name; }

int RasterDataset::band_count() const { return static_cast<int>(pImpl->sample_types.size()); }

const std::vector<SampleType>& RasterDataset::sample_types() const {
    return pImpl->sample_types;
}

std::uint32_t RasterDataset::width() const { return pImpl->width; }

std::uint32_t RasterDataset::height() const { return pImpl->height; }

bool RasterDataset::has_alpha() const { return pImpl->alpha; }

bool RasterDataset::has_mask() const { return pImpl->mask; }

std::optional<double> RasterDataset::nodata() const { return pImpl->nodata; }

const GeoReference& RasterDataset::georeference() const { return pImpl->geo; }

GDALDatasetH RasterDataset::handle() const { return pImpl->dataset; }

std::optional<Raster> RasterDataset::read_window(std::uint32_t x, std::uint32_t y,
                                                 std::uint32_t width, std::uint32_t height,
                                                 std::error_code& ec) const {
    const auto& types = pImpl->sample_types;
    const SampleType type = types.front();
    const bool uniform = std::all_of(types.begin(), types.end(),
                                     [type](SampleType t) { return t == type; });
    if (type == SampleType::Unknown || !uniform || width == 0 || height == 0 ||
        x + width > pImpl->width || y + height > pImpl->height) {
        ec = make_error_code(CogErrc::invalid_input);
        return std::nullopt;
    }

    Raster raster(width, height, static_cast<int>(types.size()), type);

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    GdalErrorCollector errors;
    VSIErrorReset();
    const CPLErr err = GDALDatasetRasterIO(
        pImpl->dataset, GF_Read, static_cast<int>(x), static_cast<int>(y),
        static_cast<int>(width), static_cast<int>(height), raster.data.data(),
        static_cast<int>(width), static_cast<int>(height), to_gdal_type(type), raster.bands,
        nullptr, static_cast<int>(raster.pixel_bytes()), static_cast<int>(raster.row_bytes()),
        static_cast<int>(raster.sample_bytes()));
    if (err != CE_None) {
        const std::error_code vsi_ec = map_vsi_error(VSIGetLastErrorNo());
        ec = vsi_ec ? vsi_ec : make_error_code(CogErrc::invalid_input);
        return std::nullopt;
    }
    return raster;
}

}  // namespace cog_converter

#pragma once

#include <memory>

#include <tiffio.h>

namespace cog_converter {

// GDAL独自タグ
constexpr ttag_t kTiffTagGdalMetadata = 42112;
constexpr ttag_t kTiffTagGdalNodata = 42113;

// GDAL_METADATA / GDAL_NODATA タグを libtiff に登録（何度呼んでもよい）
void register_gdal_tags();

struct TiffCloser {
    void operator()(TIFF* tif) const;
};

// XTIFFCloseで閉じるTIFFハンドル
using TiffHandle = std::unique_ptr<TIFF, TiffCloser>;

}  // namespace cog_converter

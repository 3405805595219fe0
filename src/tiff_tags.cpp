#include "tiff_tags.hpp"

#include <xtiffio.h>

#include <mutex>

namespace cog_converter {

static const TIFFFieldInfo gdal_field_info[] = {
    {kTiffTagGdalMetadata, -1, -1, TIFF_ASCII, FIELD_CUSTOM, TRUE, FALSE,
     const_cast<char*>("GDALMetadata")},
    {kTiffTagGdalNodata, -1, -1, TIFF_ASCII, FIELD_CUSTOM, TRUE, FALSE,
     const_cast<char*>("GDALNoDataValue")}};

static TIFFExtendProc parent_extender = nullptr;

static void gdal_tiff_extender(TIFF* tif) {
    TIFFMergeFieldInfo(tif, gdal_field_info, sizeof(gdal_field_info) / sizeof(gdal_field_info[0]));
    if (parent_extender) {
        (*parent_extender)(tif);
    }
}

void register_gdal_tags() {
    static std::once_flag registered;
    std::call_once(registered, [] { parent_extender = TIFFSetTagExtender(gdal_tiff_extender); });
}

void TiffCloser::operator()(TIFF* tif) const {
    if (tif) {
        XTIFFClose(tif);
    }
}

}  // namespace cog_converter

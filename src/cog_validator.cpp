#include "cog_validator.hpp"

#include <tiffio.h>
#include <xtiffio.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <optional>
#include <string>

#include "tiff_tags.hpp"

namespace cog_converter {

namespace {

// オーバービューなしで許容する最大サイズ
constexpr std::uint32_t kMaxSizeWithoutOverviews = 512;

struct IfdInfo {
    int index = 0;
    std::uint64_t offset = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    bool tiled = false;
    bool mask = false;
    // 最初のタイルデータのオフセット（データなしならnullopt）
    std::optional<std::uint64_t> data_offset;
};

constexpr const char kGhostPrefix[] = "GDAL_STRUCTURAL_METADATA_SIZE=";
// "GDAL_STRUCTURAL_METADATA_SIZE=XXXXXX bytes\n"
constexpr std::size_t kGhostHeaderLength = 43;

struct Header {
    bool bigtiff = false;
    std::uint64_t first_ifd = 0;
    // ヘッダー直後のGDAL構造メタデータ（ゴースト領域）の終端。なければヘッダーの終端
    std::uint64_t metadata_end = 0;
};

template <typename T>
T read_value(const unsigned char* p, bool little_endian) {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        const std::size_t shift = little_endian ? i : sizeof(T) - 1 - i;
        value |= static_cast<T>(static_cast<T>(p[i]) << (8 * shift));
    }
    return value;
}

std::optional<Header> read_header(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    unsigned char buf[16] = {};
    if (!file.read(reinterpret_cast<char*>(buf), sizeof(buf)) && file.gcount() < 8) {
        return std::nullopt;
    }

    bool little_endian = false;
    if (buf[0] == 'I' && buf[1] == 'I') {
        little_endian = true;
    } else if (!(buf[0] == 'M' && buf[1] == 'M')) {
        return std::nullopt;
    }

    Header header;
    const auto version = read_value<std::uint16_t>(buf + 2, little_endian);
    if (version == 42) {
        header.first_ifd = read_value<std::uint32_t>(buf + 4, little_endian);
    } else if (version == 43 && file.gcount() >= 16) {
        header.bigtiff = true;
        header.first_ifd = read_value<std::uint64_t>(buf + 8, little_endian);
    } else {
        return std::nullopt;
    }

    const std::uint64_t header_end = header.bigtiff ? 16 : 8;
    header.metadata_end = header_end;
    file.clear();
    file.seekg(static_cast<std::streamoff>(header_end));
    char ghost[kGhostHeaderLength] = {};
    if (file.read(ghost, sizeof(ghost)) &&
        std::strncmp(ghost, kGhostPrefix, sizeof(kGhostPrefix) - 1) == 0) {
        const std::string size_text(ghost + sizeof(kGhostPrefix) - 1, 6);
        char* end = nullptr;
        const unsigned long size = std::strtoul(size_text.c_str(), &end, 10);
        if (end == size_text.c_str() + size_text.size()) {
            header.metadata_end = header_end + kGhostHeaderLength + size;
        }
    }
    return header;
}

IfdInfo read_ifd(TIFF* tif, int index) {
    IfdInfo info;
    info.index = index;
    info.offset = TIFFCurrentDirOffset(tif);
    TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &info.width);
    TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &info.height);
    info.tiled = TIFFIsTiled(tif) != 0;

    std::uint32_t subfile_type = 0;
    if (TIFFGetField(tif, TIFFTAG_SUBFILETYPE, &subfile_type)) {
        info.mask = (subfile_type & FILETYPE_MASK) != 0;
    }

    const std::uint32_t count = TIFFNumberOfStrips(tif);
    std::uint64_t first = std::numeric_limits<std::uint64_t>::max();
    for (std::uint32_t i = 0; i < count; ++i) {
        const std::uint64_t offset = TIFFGetStrileOffset(tif, i);
        if (offset != 0 && TIFFGetStrileByteCount(tif, i) != 0) {
            first = std::min(first, offset);
        }
    }
    if (first != std::numeric_limits<std::uint64_t>::max()) {
        info.data_offset = first;
    }
    return info;
}

std::string level_name(const IfdInfo& ifd) {
    return std::string(ifd.mask ? "マスクIFD " : "IFD ") + std::to_string(ifd.index);
}

}  // namespace

ValidationReport validate_cog(const std::filesystem::path& path) {
    ValidationReport report;

    const auto header = read_header(path);
    if (!header) {
        report.errors.push_back("TIFFファイルではありません");
        return report;
    }

    register_gdal_tags();
    TiffHandle tif(XTIFFOpen(path.string().c_str(), "r"));
    if (!tif) {
        report.errors.push_back("TIFFとして開けません");
        return report;
    }

    std::vector<IfdInfo> ifds;
    int index = 0;
    do {
        ifds.push_back(read_ifd(tif.get(), index++));
    } while (TIFFReadDirectory(tif.get()));

    // ゴースト領域の後ろはワード境界に揃えられることがある
    const std::uint64_t expected_first = header->metadata_end;
    if (header->first_ifd != expected_first &&
        header->first_ifd != expected_first + (expected_first & 1)) {
        report.errors.push_back("メインIFDがファイル先頭（オフセット" +
                                std::to_string(expected_first) + "）にありません");
    }

    const IfdInfo& main_ifd = ifds.front();
    if (!main_ifd.tiled) {
        report.errors.push_back("メイン画像がタイル化されていません");
    }

    // マスク以外の解像度レベル（メイン、オーバービューの順）
    std::vector<const IfdInfo*> levels;
    for (const auto& ifd : ifds) {
        if (!ifd.mask) {
            levels.push_back(&ifd);
        }
    }

    for (std::size_t i = 1; i < levels.size(); ++i) {
        const IfdInfo& prev = *levels[i - 1];
        const IfdInfo& ovr = *levels[i];
        if (!ovr.tiled) {
            report.errors.push_back("オーバービュー " + level_name(ovr) +
                                    " がタイル化されていません");
        }
        const bool smaller = ovr.width <= prev.width && ovr.height <= prev.height &&
                             (ovr.width < prev.width || ovr.height < prev.height);
        if (!smaller) {
            report.errors.push_back("オーバービュー " + level_name(ovr) + " が " +
                                    level_name(prev) + " より小さくありません");
        }
    }

    for (std::size_t i = 1; i < ifds.size(); ++i) {
        if (ifds[i].offset <= ifds[i - 1].offset) {
            report.errors.push_back(level_name(ifds[i]) + " のオフセットが " +
                                    level_name(ifds[i - 1]) + " より前にあります");
        }
    }

    for (const auto& ifd : ifds) {
        if (ifd.data_offset && *ifd.data_offset < ifd.offset) {
            report.errors.push_back(level_name(ifd) + " のタイルデータがIFDより前にあります");
        }
    }

    // 小さいレベルのデータほどファイルの前方に置かれている必要がある
    for (std::size_t i = 1; i < levels.size(); ++i) {
        const IfdInfo& larger = *levels[i - 1];
        const IfdInfo& smaller = *levels[i];
        if (larger.data_offset && smaller.data_offset &&
            *larger.data_offset < *smaller.data_offset) {
            report.errors.push_back(level_name(larger) + " のデータが " + level_name(smaller) +
                                    " のデータより前にあります");
        }
    }

    if (levels.size() == 1 &&
        (main_ifd.width > kMaxSizeWithoutOverviews || main_ifd.height > kMaxSizeWithoutOverviews)) {
        report.warnings.push_back("512ピクセルを超える画像にオーバービューがありません");
    }

    report.valid = report.errors.empty();
    return report;
}

}  // namespace cog_converter

#include "cog_engine.hpp"

#include <cpl_conv.h>
#include <cpl_string.h>
#include <gdal_utils.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <set>
#include <string>
#include <utility>

#include "errors.hpp"
#include "gdal_env.hpp"
#include "web_mercator.hpp"

namespace cog_converter {

namespace {

constexpr const char* kCogDriver = "COG";
constexpr int kDefaultBlockSize = 256;

// エンジンが解釈するオプション名（小文字）
const std::set<std::string>& known_option_keys() {
    static const std::set<std::string> keys = {
        "compress",    "blocksize",   "blockxsize",          "blockysize",
        "zlevel",      "zstd_level",  "lzma_preset",         "level",
        "quality",     "predictor",   "bigtiff",             "resampling",
        "overview_resampling",        "warp_resampling",     "num_threads",
    };
    return keys;
}

const std::set<std::string>& resampling_methods() {
    static const std::set<std::string> methods = {"NEAREST", "BILINEAR", "CUBIC", "CUBICSPLINE",
                                                  "LANCZOS", "AVERAGE",  "RMS",   "MODE"};
    return methods;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

const std::string* find_option(const OptionMap& options, const std::string& key) {
    const auto it = options.find(key);
    return it == options.end() ? nullptr : &it->second;
}

bool parse_int(const std::string& text, int& out) {
    try {
        std::size_t pos = 0;
        const int value = std::stoi(text, &pos);
        if (pos != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool supports_predictor(const std::string& compress) {
    return compress == "DEFLATE" || compress == "LZW" || compress == "ZSTD" ||
           compress == "LZMA";
}

// 1/2/3 とCOGドライバの名前の両方を受け付ける
bool parse_predictor(const std::string& text, std::string& out) {
    const std::string value = to_upper(text);
    if (value == "1" || value == "NO" || value == "NONE") {
        out = "NO";
    } else if (value == "2" || value == "YES" || value == "STANDARD") {
        out = "STANDARD";
    } else if (value == "3" || value == "FLOATING_POINT") {
        out = "FLOATING_POINT";
    } else {
        return false;
    }
    return true;
}

// 圧縮方式ごとのレベル指定（levelがあれば優先）
const std::string* level_option(const OptionMap& options, const std::string& compress) {
    if (const auto* level = find_option(options, "level")) {
        return level;
    }
    if (compress == "DEFLATE") return find_option(options, "zlevel");
    if (compress == "ZSTD") return find_option(options, "zstd_level");
    if (compress == "LZMA") return find_option(options, "lzma_preset");
    return nullptr;
}

// <Option name='COMPRESS' ...> 内の <Value>X</Value> を取り出す
std::vector<std::string> parse_compress_values(const std::string& option_list) {
    std::vector<std::string> values;
    const auto start = option_list.find("name='COMPRESS'");
    if (start == std::string::npos) {
        return values;
    }
    const auto end = option_list.find("</Option>", start);
    std::size_t pos = start;
    while (true) {
        pos = option_list.find("<Value", pos);
        if (pos == std::string::npos || pos >= end) {
            break;
        }
        const auto open = option_list.find('>', pos);
        const auto close = option_list.find("</Value>", open);
        if (open == std::string::npos || close == std::string::npos) {
            break;
        }
        values.push_back(to_upper(option_list.substr(open + 1, close - open - 1)));
        pos = close;
    }
    return values;
}

}  // namespace

const std::vector<std::string>& supported_compressions() {
    static std::vector<std::string> values;
    static std::once_flag loaded;
    std::call_once(loaded, [] {
        ensure_gdal_registered();
        GDALDriverH driver = GDALGetDriverByName(kCogDriver);
        if (!driver) {
            return;
        }
        const char* list = GDALGetMetadataItem(driver, GDAL_DMD_CREATIONOPTIONLIST, nullptr);
        if (list) {
            values = parse_compress_values(list);
        }
    });
    return values;
}

std::vector<std::string> supported_profiles() {
    const auto& compressions = supported_compressions();
    std::vector<std::string> profiles;
    for (const auto& id : known_profiles()) {
        const auto options = profile_options(id);
        if (options && std::find(compressions.begin(), compressions.end(),
                                 options->at("compress")) != compressions.end()) {
            profiles.push_back(id);
        }
    }
    return profiles;
}

bool build_creation_options(const OptionMap& options, const EngineConfig& config,
                            const std::vector<SampleType>& sample_types, bool has_alpha,
                            bool web_optimized, std::vector<std::string>& creation_options,
                            std::string& reason) {
    creation_options.clear();
    auto add = [&](const std::string& key, const std::string& value) {
        creation_options.push_back(key + "=" + value);
    };

    const bool all_byte =
        !sample_types.empty() &&
        std::all_of(sample_types.begin(), sample_types.end(),
                    [](SampleType type) { return type == SampleType::UInt8; });
    const bool all_float =
        !sample_types.empty() &&
        std::all_of(sample_types.begin(), sample_types.end(),
                    [](SampleType type) { return is_floating_point(type); });
    const int bands = static_cast<int>(sample_types.size());

    std::string compress = "DEFLATE";
    if (const auto* value = find_option(options, "compress")) {
        compress = to_upper(*value);
    }
    const auto& compressions = supported_compressions();
    if (std::find(compressions.begin(), compressions.end(), compress) == compressions.end()) {
        reason = "COGドライバが対応していない圧縮方式: " + compress;
        return false;
    }
    add("COMPRESS", compress);

    if (compress == "JPEG") {
        // 4バンドはアルファをマスクに変換して3バンドで書き出される
        const bool rgba = bands == 4 && has_alpha;
        if (!all_byte || (bands != 1 && bands != 3 && !rgba)) {
            reason = "JPEGは8bitの1バンド、3バンドまたはRGBAのみ対応しています";
            return false;
        }
    } else if (compress == "WEBP") {
        if (!all_byte || (bands != 3 && bands != 4)) {
            reason = "WebPは8bitの3バンドまたは4バンドのみ対応しています";
            return false;
        }
    }

    int block_size = kDefaultBlockSize;
    const auto* block = find_option(options, "blocksize");
    const auto* block_x = find_option(options, "blockxsize");
    const auto* block_y = find_option(options, "blockysize");
    if (block_x || block_y) {
        // COGのタイルは正方形
        if (!block_x || !block_y || *block_x != *block_y || (block && *block != *block_x)) {
            reason = "COGのタイルは正方形である必要があります";
            return false;
        }
        block = block_x;
    }
    if (block && (!parse_int(*block, block_size) || block_size <= 0 || block_size % 16 != 0)) {
        reason = "タイルサイズは16の倍数である必要があります";
        return false;
    }
    add("BLOCKSIZE", std::to_string(block_size));

    if (const auto* level = level_option(options, compress)) {
        int value = 0;
        if (!parse_int(*level, value)) {
            reason = "圧縮レベルが整数ではありません: " + *level;
            return false;
        }
        if (compress == "DEFLATE" || compress == "ZSTD" || compress == "LZMA") {
            add("LEVEL", std::to_string(value));
        }
    }

    if (const auto* quality = find_option(options, "quality")) {
        int value = 0;
        if (!parse_int(*quality, value) || value < 1 || value > 100) {
            reason = "qualityは1から100の範囲で指定してください";
            return false;
        }
        if (compress == "JPEG" || compress == "WEBP") {
            add("QUALITY", std::to_string(value));
        }
    }

    if (const auto* predictor = find_option(options, "predictor")) {
        std::string value;
        if (!parse_predictor(*predictor, value)) {
            reason = "predictorは1, 2, 3のいずれかです";
            return false;
        }
        if (value == "FLOATING_POINT" && !all_float) {
            reason = "predictor=3は浮動小数点データのみ指定できます";
            return false;
        }
        if (supports_predictor(compress)) {
            add("PREDICTOR", value);
        }
    }

    if (const auto* bigtiff = find_option(options, "bigtiff")) {
        const std::string value = to_upper(*bigtiff);
        if (value != "YES" && value != "NO" && value != "IF_NEEDED" && value != "IF_SAFER") {
            reason = "bigtiffの値が不正です: " + *bigtiff;
            return false;
        }
        add("BIGTIFF", value);
    }

    for (const char* key : {"resampling", "overview_resampling", "warp_resampling"}) {
        const auto* method = find_option(options, key);
        if (!method) {
            continue;
        }
        const std::string value = to_upper(*method);
        if (resampling_methods().count(value) == 0) {
            reason = std::string("未対応のリサンプリング方式: ") + key + "=" + *method;
            return false;
        }
        add(to_upper(key), value);
    }

    std::string threads = "ALL_CPUS";
    if (config.num_threads > 0) {
        threads = std::to_string(config.num_threads);
    } else if (const auto* value = find_option(options, "num_threads")) {
        int count = 0;
        if (to_upper(*value) != "ALL_CPUS" && (!parse_int(*value, count) || count <= 0)) {
            reason = "num_threadsの値が不正です: " + *value;
            return false;
        }
        threads = to_upper(*value);
    }
    add("NUM_THREADS", threads);

    if (web_optimized) {
        add("TILING_SCHEME", "GoogleMapsCompatible");
    }
    return true;
}

GdalCogEngine::GdalCogEngine(Logger logger) : logger_(std::move(logger)) {}

ValidationReport GdalCogEngine::validate(const std::filesystem::path& path) {
    return validate_cog(path);
}

bool GdalCogEngine::translate(const RasterDataset& source,
                              const std::filesystem::path& destination,
                              const EncodingProfile& profile, const TranslateOptions& options,
                              const EngineConfig& config, std::error_code& ec) {
    auto fail = [&](const std::string& message) {
        logger_.error(source.name() + ": " + message);
        ec = make_error_code(CogErrc::transcode_failure);
        return false;
    };

    ensure_gdal_registered();

    for (const auto& [key, value] : profile.options) {
        if (known_option_keys().count(key) == 0) {
            logger_.warn(source.name() + ": 未知のオプションを無視します: " + key + "=" + value);
        }
    }

    std::vector<std::string> creation_options;
    std::string reason;
    if (!build_creation_options(profile.options, config, source.sample_types(),
                                source.has_alpha(), options.web_optimized, creation_options,
                                reason)) {
        return fail(reason);
    }

    if (options.web_optimized) {
        // CRSとジオトランスフォームがなければGDALに渡す前に失敗させる
        int block_size = kDefaultBlockSize;
        for (const auto& option : creation_options) {
            if (option.rfind("BLOCKSIZE=", 0) == 0) {
                block_size = std::stoi(option.substr(10));
            }
        }
        std::error_code grid_ec;
        const auto grid = plan_web_mercator_grid(source.georeference(), source.width(),
                                                 source.height(), block_size, grid_ec);
        if (!grid) {
            return fail("EPSG:3857のタイルグリッドを求められません (" + grid_ec.message() + ")");
        }
        logger_.debug(source.name() + ": EPSG:3857 ズーム " + std::to_string(grid->zoom) +
                      " (" + std::to_string(grid->width) + "x" + std::to_string(grid->height) +
                      ")");
    }

    char** args = nullptr;
    args = CSLAddString(args, "-of");
    args = CSLAddString(args, kCogDriver);
    for (const auto& option : creation_options) {
        args = CSLAddString(args, "-co");
        args = CSLAddString(args, option.c_str());
    }
    GDALTranslateOptions* translate_options = GDALTranslateOptionsNew(args, nullptr);
    CSLDestroy(args);
    if (!translate_options) {
        return fail("GDALTranslateのオプションを作成できません");
    }

    const std::string overview_block_size = std::to_string(config.overview_block_size);
    CPLConfigOptionSetter overview_block(
        "GDAL_TIFF_OVR_BLOCKSIZE", overview_block_size.c_str(), false);
    CPLConfigOptionSetter internal_mask("GDAL_TIFF_INTERNAL_MASK",
                                        config.internal_mask ? "YES" : "NO", false);

    GdalErrorCollector errors;
    int usage_error = FALSE;
    GDALDatasetH output = GDALTranslate(destination.string().c_str(), source.handle(),
                                        translate_options, &usage_error);
    GDALTranslateOptionsFree(translate_options);

    bool closed = true;
    if (output) {
        closed = GDALClose(output) == CE_None;
    }
    for (const auto& warning : errors.warnings()) {
        logger_.warn(source.name() + ": " + warning);
    }
    if (!output || usage_error || !closed) {
        const std::string detail = errors.summary();
        return fail("COGの書き出しに失敗しました" + (detail.empty() ? "" : " (" + detail + ")"));
    }

    logger_.debug(destination.string() + ": " + profile.id + " で書き出しました");
    return true;
}

}  // namespace cog_converter

#include "profile_selector.hpp"

#include <algorithm>
#include <cctype>

namespace cog_converter {

namespace {

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_lossy_codec(const std::string& compress) {
    const std::string codec = to_upper(compress);
    return codec == "JPEG" || codec == "WEBP" || codec == "JXL";
}

// DEMジョブで無視する上書き
bool rejected_for_dem(const std::string& key, const std::string& value) {
    if (key == "compress") {
        return is_lossy_codec(value);
    }
    if (key == "resampling" || key == "overview_resampling" || key == "warp_resampling") {
        return to_lower(value) == "nearest";
    }
    return false;
}

OptionMap effective_overrides(const ClassificationFlags& flags, const OptionMap& overrides) {
    if (!flags.is_dem) {
        return overrides;
    }
    OptionMap effective;
    for (const auto& [key, value] : overrides) {
        if (!rejected_for_dem(key, value)) {
            effective.emplace(key, value);
        }
    }
    return effective;
}

}  // namespace

OptionMap baseline_options() {
    return OptionMap{
        {"blocksize", "256"},
        {"zlevel", "9"},
        {"bigtiff", "IF_NEEDED"},
        {"num_threads", "ALL_CPUS"},
    };
}

const std::vector<std::string>& known_profiles() {
    static const std::vector<std::string> profiles = {"deflate", "jpeg", "webp", "zstd",
                                                      "lzw",     "lzma", "raw"};
    return profiles;
}

std::optional<OptionMap> profile_options(const std::string& profile_id) {
    if (profile_id == "deflate") {
        return OptionMap{{"compress", "DEFLATE"}};
    }
    if (profile_id == "jpeg") {
        return OptionMap{{"compress", "JPEG"}, {"quality", std::to_string(kLossyQuality)}};
    }
    if (profile_id == "webp") {
        return OptionMap{{"compress", "WEBP"}, {"quality", "75"}};
    }
    if (profile_id == "zstd") {
        return OptionMap{{"compress", "ZSTD"}};
    }
    if (profile_id == "lzw") {
        return OptionMap{{"compress", "LZW"}};
    }
    if (profile_id == "lzma") {
        return OptionMap{{"compress", "LZMA"}};
    }
    if (profile_id == "raw") {
        return OptionMap{{"compress", "NONE"}};
    }
    return std::nullopt;
}

std::string profile_id_for_codec(const std::string& compress) {
    const std::string codec = to_upper(compress);
    for (const auto& id : known_profiles()) {
        const auto options = profile_options(id);
        if (options && options->at("compress") == codec) {
            return id;
        }
    }
    return to_lower(compress);
}

bool check_profile_overrides(const ClassificationFlags& flags, const OptionMap& overrides,
                             std::string& reason) {
    if (!flags.is_dem) {
        return true;
    }
    for (const auto& [key, value] : overrides) {
        if (rejected_for_dem(key, value)) {
            reason = "DEMでは " + key + "=" + value + " は使えません";
            return false;
        }
    }
    return true;
}

std::string select_profile_id(const ClassificationFlags& flags, const OptionMap& overrides) {
    const OptionMap effective = effective_overrides(flags, overrides);
    const auto compress = effective.find("compress");
    if (compress != effective.end() && !compress->second.empty()) {
        return profile_id_for_codec(compress->second);
    }
    if (flags.is_dem) {
        return kLosslessProfile;
    }
    if (flags.compress) {
        // バンド数3以上でWebPを選ぶ案は、アルファ/マスク付きでハングする報告があるため採用しない
        return kLossyProfile;
    }
    return kLosslessProfile;
}

EncodingProfile select_profile(const ClassificationFlags& flags,
                               const std::vector<SampleType>& sample_types,
                               const OptionMap& overrides) {
    const OptionMap effective = effective_overrides(flags, overrides);

    EncodingProfile profile;
    profile.id = select_profile_id(flags, effective);
    profile.options = baseline_options();

    const auto specific = profile_options(profile.id);
    if (specific) {
        for (const auto& [key, value] : *specific) {
            profile.options[key] = value;
        }
    }

    if (flags.is_dem) {
        // 浮動小数点の標高に水平差分(2)は使えない
        const bool all_float =
            !sample_types.empty() &&
            std::all_of(sample_types.begin(), sample_types.end(),
                        [](SampleType type) { return is_floating_point(type); });
        profile.options["predictor"] = all_float ? "3" : "2";
        // 最近傍はオーバービューに格子状のアーティファクトが出るため使わない
        profile.options["resampling"] = flags.smooth_dem ? "cubic" : "bilinear";
    }

    for (const auto& [key, value] : effective) {
        profile.options[key] = value;
    }

    return profile;
}

std::string destination_key(const std::string& source_key, const std::string& profile_id) {
    const auto slash = source_key.rfind('/');
    const std::string directory =
        slash == std::string::npos ? std::string() : source_key.substr(0, slash + 1);
    const std::string name =
        slash == std::string::npos ? source_key : source_key.substr(slash + 1);

    std::string stem = name;
    std::string extension;
    const auto dot = name.rfind('.');
    if (dot != std::string::npos && dot > 0 && dot + 1 < name.size()) {
        stem = name.substr(0, dot);
        extension = name.substr(dot);
    }

    return directory + stem + "_COG_" + profile_id + extension;
}

}  // namespace cog_converter

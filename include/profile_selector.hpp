#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sample_type.hpp"

namespace cog_converter {

// データ分類フラグ
struct ClassificationFlags {
    bool is_dem = false;
    bool compress = false;
    bool smooth_dem = false;
    bool web_optimized = false;
};

using OptionMap = std::map<std::string, std::string>;

// プロファイルIDとオプション。生成後は変更しない
struct EncodingProfile {
    std::string id;
    OptionMap options;
};

// 可逆プロファイル（DEMおよび既定）
inline constexpr const char* kLosslessProfile = "deflate";
// 非可逆プロファイル（compress指定時）
inline constexpr const char* kLossyProfile = "jpeg";
inline constexpr int kLossyQuality = 85;

// 基本オプション（256x256タイル、zlevel 9、必要時BigTIFF、全CPU）。呼び出し毎に新しいマップを返す
OptionMap baseline_options();

// 既知のプロファイルIDの一覧
const std::vector<std::string>& known_profiles();

// プロファイル固有のオプション（圧縮方式など）。未知のIDはnullopt
std::optional<OptionMap> profile_options(const std::string& profile_id);

// compress値に対応するカタログのプロファイルID（カタログにない場合は小文字にした値）
std::string profile_id_for_codec(const std::string& compress);

// 上書きがDEMの制約（可逆圧縮、最近傍以外の補間）に反していないか確認する
[[nodiscard]] bool check_profile_overrides(const ClassificationFlags& flags,
                                           const OptionMap& overrides, std::string& reason);

// フラグと上書きだけで決まるプロファイルID（DEMがcompressより優先）
// 上書きでcompressを変えた場合は、実際に使うコーデックのIDになる
std::string select_profile_id(const ClassificationFlags& flags, const OptionMap& overrides = {});

// フラグとサンプル型からプロファイルを決定する。副作用なし
// overridesは最後にマージされる。DEMでは不可逆圧縮と最近傍補間の上書きを無視する
EncodingProfile select_profile(const ClassificationFlags& flags,
                               const std::vector<SampleType>& sample_types,
                               const OptionMap& overrides = {});

// "<stem>_COG_<profile><ext>" をソースキーと同じディレクトリに配置したキー
std::string destination_key(const std::string& source_key, const std::string& profile_id);

}  // namespace cog_converter

#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "cog_validator.hpp"
#include "dataset.hpp"
#include "log_sink.hpp"
#include "profile_selector.hpp"

namespace cog_converter {

// エンジン全体の設定
struct EngineConfig {
    int num_threads = 0;  // 0は全CPU
    // マスクを外部.mskではなくTIFF内部に持たせる（GDAL_TIFF_INTERNAL_MASK）
    bool internal_mask = true;
    // オーバービューのタイルサイズ（GDAL_TIFF_OVR_BLOCKSIZE）
    int overview_block_size = 128;
};

struct TranslateOptions {
    // EPSG:3857のタイルグリッドに再投影する
    bool web_optimized = false;
};

// ラスター変換エンジンの抽象インターフェース
class TranscodeEngine {
   public:
    virtual ~TranscodeEngine() = default;

    [[nodiscard]] virtual bool translate(const RasterDataset& source,
                                         const std::filesystem::path& destination,
                                         const EncodingProfile& profile,
                                         const TranslateOptions& options,
                                         const EngineConfig& config, std::error_code& ec) = 0;

    virtual ValidationReport validate(const std::filesystem::path& path) = 0;
};

// GDALのCOGドライバで書き出すエンジン
// 読み込み・リサンプリング・圧縮はGDALがブロック単位で行う
class GdalCogEngine : public TranscodeEngine {
   public:
    explicit GdalCogEngine(Logger logger = Logger());

    [[nodiscard]] bool translate(const RasterDataset& source,
                                 const std::filesystem::path& destination,
                                 const EncodingProfile& profile, const TranslateOptions& options,
                                 const EngineConfig& config, std::error_code& ec) override;

    ValidationReport validate(const std::filesystem::path& path) override;

   private:
    Logger logger_;
};

// プロファイルのオプションをCOGドライバの作成オプション（KEY=VALUE）に変換する
// 不正な値やソースと両立しない組み合わせはfalseを返し、reasonに理由を入れる
[[nodiscard]] bool build_creation_options(const OptionMap& options, const EngineConfig& config,
                                          const std::vector<SampleType>& sample_types,
                                          bool has_alpha, bool web_optimized,
                                          std::vector<std::string>& creation_options,
                                          std::string& reason);

// COGドライバが受け付けるCOMPRESSの値
const std::vector<std::string>& supported_compressions();

// COGドライバで書き出せるプロファイル
std::vector<std::string> supported_profiles();

}  // namespace cog_converter

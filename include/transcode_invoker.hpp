#pragma once

#include <filesystem>
#include <system_error>

#include "cog_engine.hpp"
#include "dataset.hpp"
#include "log_sink.hpp"
#include "profile_selector.hpp"

namespace cog_converter {

// エンジンで変換し、構造検証に通った成果物だけを残す
// 失敗時は成果物を削除しTranscodeFailureを返す
class TranscodeInvoker {
   public:
    explicit TranscodeInvoker(TranscodeEngine& engine, Logger logger = Logger());

    [[nodiscard]] bool run(const RasterDataset& source, const std::filesystem::path& destination,
                           const EncodingProfile& profile, const TranslateOptions& options,
                           const EngineConfig& config, std::error_code& ec);

   private:
    void discard(const std::filesystem::path& destination) const;

    TranscodeEngine& engine_;
    Logger logger_;
};

}  // namespace cog_converter

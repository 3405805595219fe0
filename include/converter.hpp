#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include "acquisition.hpp"
#include "cog_engine.hpp"
#include "log_sink.hpp"
#include "profile_selector.hpp"

namespace cog_converter {

// 単一のソースをCOGに変換する（バケットを介さない）
class CogConverter {
   public:
    struct Config {
        ClassificationFlags flags;
        OptionMap profile_overrides;
        EngineConfig engine;
        // 未指定の場合はソースと同じディレクトリに "<stem>_COG_<profile><ext>"
        std::optional<std::filesystem::path> output_path;
    };

    CogConverter(Config config, AcquisitionStrategy& acquisition, TranscodeEngine& engine,
                 Logger logger = Logger());

    // 検証済みの成果物のパスを返す
    [[nodiscard]] std::optional<std::filesystem::path> run(SourceSpecifier source,
                                                           std::error_code& ec);

   private:
    std::optional<std::filesystem::path> output_path_for(const SourceSpecifier& source,
                                                         const AcquiredDataset& acquired,
                                                         const std::string& profile_id) const;

    Config config_;
    AcquisitionStrategy& acquisition_;
    TranscodeEngine& engine_;
    Logger logger_;
};

}  // namespace cog_converter

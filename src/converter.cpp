#include "converter.hpp"

#include <utility>

#include "errors.hpp"
#include "transcode_invoker.hpp"

namespace cog_converter {

CogConverter::CogConverter(Config config, AcquisitionStrategy& acquisition,
                           TranscodeEngine& engine, Logger logger)
    : config_(std::move(config)),
      acquisition_(acquisition),
      engine_(engine),
      logger_(std::move(logger)) {}

std::optional<std::filesystem::path> CogConverter::output_path_for(
    const SourceSpecifier& source, const AcquiredDataset& acquired,
    const std::string& profile_id) const {
    if (config_.output_path) {
        return config_.output_path;
    }

    std::filesystem::path base;
    if (const auto* local = std::get_if<LocalPath>(&source)) {
        base = std::filesystem::absolute(local->path);
    } else if (!acquired.scratch.empty()) {
        // メモリ上のデータは一時ファイルの隣に出力する
        base = acquired.scratch.path();
    } else {
        return std::nullopt;
    }

    return base.parent_path() /
           destination_key(base.filename().string(), profile_id);
}

std::optional<std::filesystem::path> CogConverter::run(SourceSpecifier source,
                                                       std::error_code& ec) {
    auto acquired = acquisition_.open(source, ec);
    if (!acquired) {
        logger_.error("入力を開けません (" + ec.message() + ")");
        return std::nullopt;
    }
    const RasterDataset& dataset = *acquired->dataset;

    const EncodingProfile profile =
        select_profile(config_.flags, dataset.sample_types(), config_.profile_overrides);

    const auto output_path = output_path_for(source, *acquired, profile.id);
    if (!output_path) {
        ec = make_error_code(CogErrc::invalid_input);
        logger_.error("出力先を決められません: " + dataset.name());
        return std::nullopt;
    }

    logger_.info("COGを作成中: " + dataset.name() + " -> " + output_path->string() +
                 " (プロファイル: " + profile.id + ")");

    TranscodeInvoker invoker(engine_, logger_);
    TranslateOptions options;
    options.web_optimized = config_.flags.web_optimized;
    if (!invoker.run(dataset, *output_path, profile, options, config_.engine, ec)) {
        logger_.error("COGの作成に失敗しました: " + output_path->string());
        return std::nullopt;
    }

    return output_path;
}

}  // namespace cog_converter

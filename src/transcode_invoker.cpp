#include "transcode_invoker.hpp"

#include <exception>
#include <utility>

#include "errors.hpp"

namespace cog_converter {

TranscodeInvoker::TranscodeInvoker(TranscodeEngine& engine, Logger logger)
    : engine_(engine), logger_(std::move(logger)) {}

bool TranscodeInvoker::run(const RasterDataset& source, const std::filesystem::path& destination,
                           const EncodingProfile& profile, const TranslateOptions& options,
                           const EngineConfig& config, std::error_code& ec) {
    std::error_code engine_ec;
    bool translated = false;
    try {
        translated = engine_.translate(source, destination, profile, options, config, engine_ec);
    } catch (const std::exception& e) {
        logger_.error(source.name() + ": 変換中に例外が発生しました: " + e.what());
        translated = false;
    }
    if (!translated) {
        discard(destination);
        ec = make_error_code(CogErrc::transcode_failure);
        return false;
    }

    const ValidationReport report = engine_.validate(destination);
    for (const auto& warning : report.warnings) {
        logger_.warn(destination.filename().string() + ": " + warning);
    }
    if (!report.valid) {
        for (const auto& error : report.errors) {
            logger_.error(destination.filename().string() + ": " + error);
        }
        discard(destination);
        ec = make_error_code(CogErrc::transcode_failure);
        return false;
    }

    return true;
}

void TranscodeInvoker::discard(const std::filesystem::path& destination) const {
    std::error_code fs_ec;
    std::filesystem::remove(destination, fs_ec);
    if (fs_ec) {
        logger_.warn("成果物を削除できません: " + destination.string() + " (" + fs_ec.message() +
                     ")");
    }
}

}  // namespace cog_converter

#include "acquisition.hpp"

#include <fstream>
#include <type_traits>
#include <utility>

#include "errors.hpp"

namespace cog_converter {

namespace {

// 一時ファイルの拡張子はキーの拡張子に合わせる
std::string scratch_suffix(const std::string& key) {
    const auto extension = std::filesystem::path(key).extension().string();
    return extension.empty() ? ".tif" : extension;
}

}  // namespace

const char* to_string(AcquisitionMode mode) {
    switch (mode) {
        case AcquisitionMode::Preload:
            return "preload";
        case AcquisitionMode::Stream:
            return "stream";
    }
    return "";
}

AcquisitionStrategy::AcquisitionStrategy(ObjectStore& store, ScratchManager& scratch,
                                         RetryPolicy retry, Logger logger)
    : store_(store), scratch_(scratch), retry_(retry), logger_(std::move(logger)) {}

std::optional<AcquiredDataset> AcquisitionStrategy::acquire(const std::string& bucket,
                                                            const std::string& key,
                                                            AcquisitionMode mode,
                                                            std::error_code& ec) {
    switch (mode) {
        case AcquisitionMode::Preload:
            return preload(bucket, key, ec);
        case AcquisitionMode::Stream:
            return stream(bucket, key, ec);
    }
    ec = make_error_code(CogErrc::invalid_input);
    return std::nullopt;
}

std::optional<AcquiredDataset> AcquisitionStrategy::preload(const std::string& bucket,
                                                            const std::string& key,
                                                            std::error_code& ec) {
    auto scratch = scratch_.allocate(scratch_suffix(key), ec);
    if (!scratch) {
        return std::nullopt;
    }
    scratch->mark_in_use();

    const auto& local_path = scratch->path();
    const bool downloaded = with_retry(
        retry_, logger_, "ダウンロード " + bucket + "/" + key,
        [&](std::error_code& op_ec) { return store_.download(bucket, key, local_path, op_ec); },
        ec);
    if (!downloaded) {
        return std::nullopt;
    }
    logger_.debug("ダウンロード完了: " + key + " -> " + local_path.string());

    auto dataset = RasterDataset::open(local_path, ec);
    if (!dataset) {
        return std::nullopt;
    }
    return AcquiredDataset{std::move(*scratch), std::move(dataset)};
}

std::optional<AcquiredDataset> AcquisitionStrategy::stream(const std::string& bucket,
                                                           const std::string& key,
                                                           std::error_code& ec) {
    const std::string url = store_.object_url(bucket, key);

    std::shared_ptr<RasterDataset> dataset;
    const bool opened = with_retry(
        retry_, logger_, "オープン " + url,
        [&](std::error_code& op_ec) {
            dataset = store_.open_remote_stream(url, op_ec);
            return dataset != nullptr;
        },
        ec);
    if (!opened) {
        return std::nullopt;
    }
    return AcquiredDataset{ScratchResource(), std::move(dataset)};
}

std::optional<AcquiredDataset> AcquisitionStrategy::open(SourceSpecifier source,
                                                         std::error_code& ec) {
    return std::visit(
        [&](auto&& alternative) -> std::optional<AcquiredDataset> {
            using T = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<T, LocalPath>) {
                return open_local(alternative, ec);
            } else if constexpr (std::is_same_v<T, InMemoryBytes>) {
                return open_bytes(alternative, ec);
            } else {
                return open_handle(alternative, ec);
            }
        },
        source);
}

std::optional<AcquiredDataset> AcquisitionStrategy::open_local(const LocalPath& source,
                                                               std::error_code& ec) {
    std::error_code fs_ec;
    if (!std::filesystem::is_regular_file(source.path, fs_ec)) {
        ec = make_error_code(CogErrc::invalid_input);
        return std::nullopt;
    }

    auto dataset = RasterDataset::open(source.path, ec);
    if (!dataset) {
        return std::nullopt;
    }
    return AcquiredDataset{ScratchResource(), std::move(dataset)};
}

std::optional<AcquiredDataset> AcquisitionStrategy::open_bytes(const InMemoryBytes& source,
                                                               std::error_code& ec) {
    if (source.bytes.empty()) {
        ec = make_error_code(CogErrc::invalid_input);
        return std::nullopt;
    }

    auto scratch = scratch_.allocate(scratch_suffix(source.name), ec);
    if (!scratch) {
        return std::nullopt;
    }
    scratch->mark_in_use();

    {
        std::ofstream out(scratch->path(), std::ios::binary);
        out.write(reinterpret_cast<const char*>(source.bytes.data()),
                  static_cast<std::streamsize>(source.bytes.size()));
        if (!out) {
            ec = make_error_code(CogErrc::storage_io_failure);
            return std::nullopt;
        }
    }

    auto dataset = RasterDataset::open(scratch->path(), ec);
    if (!dataset) {
        return std::nullopt;
    }
    return AcquiredDataset{std::move(*scratch), std::move(dataset)};
}

std::optional<AcquiredDataset> AcquisitionStrategy::open_handle(const OpenRemoteHandle& source,
                                                                std::error_code& ec) {
    if (!source.dataset) {
        ec = make_error_code(CogErrc::invalid_input);
        return std::nullopt;
    }
    return AcquiredDataset{ScratchResource(), source.dataset};
}

}  // namespace cog_converter

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#include "dataset.hpp"
#include "log_sink.hpp"
#include "object_store.hpp"
#include "retry.hpp"
#include "scratch.hpp"

namespace cog_converter {

// 取得方式。サイズで自動選択はせず、常に明示的に指定する
enum class AcquisitionMode {
    Preload,  // ローカルにダウンロードしてから開く（目安: 4〜8GBまで）
    Stream,   // 部分読み込みでリモートのまま開く
};

const char* to_string(AcquisitionMode mode);

struct LocalPath {
    std::filesystem::path path;
};

struct InMemoryBytes {
    std::vector<std::uint8_t> bytes;
    std::string name;
};

struct OpenRemoteHandle {
    std::shared_ptr<RasterDataset> dataset;
};

using SourceSpecifier = std::variant<LocalPath, InMemoryBytes, OpenRemoteHandle>;

// 開いたデータセットと、それが使う一時ファイル（ない場合は空）
// datasetはscratchより先に破棄される
struct AcquiredDataset {
    ScratchResource scratch;
    std::shared_ptr<RasterDataset> dataset;
};

class AcquisitionStrategy {
   public:
    AcquisitionStrategy(ObjectStore& store, ScratchManager& scratch, RetryPolicy retry,
                        Logger logger = Logger());

    // バケット上のオブジェクトを指定の方式で開く
    [[nodiscard]] std::optional<AcquiredDataset> acquire(const std::string& bucket,
                                                         const std::string& key,
                                                         AcquisitionMode mode,
                                                         std::error_code& ec);

    // ローカルパス、メモリ上のバイト列、既に開いたハンドルのいずれかを開く
    [[nodiscard]] std::optional<AcquiredDataset> open(SourceSpecifier source,
                                                      std::error_code& ec);

   private:
    std::optional<AcquiredDataset> preload(const std::string& bucket, const std::string& key,
                                           std::error_code& ec);
    std::optional<AcquiredDataset> stream(const std::string& bucket, const std::string& key,
                                          std::error_code& ec);

    std::optional<AcquiredDataset> open_local(const LocalPath& source, std::error_code& ec);
    std::optional<AcquiredDataset> open_bytes(const InMemoryBytes& source, std::error_code& ec);
    std::optional<AcquiredDataset> open_handle(const OpenRemoteHandle& source,
                                               std::error_code& ec);

    ObjectStore& store_;
    ScratchManager& scratch_;
    RetryPolicy retry_;
    Logger logger_;
};

}  // namespace cog_converter

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include "object_store.hpp"

namespace cog_converter {

// ルート配下のディレクトリをバケットとして扱うオブジェクトストア
// （s3fsなどでマウントしたバケットを想定）。URLは file://<絶対パス>
class FilesystemObjectStore : public ObjectStore {
   public:
    explicit FilesystemObjectStore(std::filesystem::path root);

    [[nodiscard]] bool exists(const std::string& bucket, const std::string& key,
                              std::error_code& ec) override;

    [[nodiscard]] bool copy(const std::string& src_bucket, const std::string& src_key,
                            const std::string& dst_bucket, const std::string& dst_key,
                            std::error_code& ec) override;

    [[nodiscard]] bool download(const std::string& bucket, const std::string& key,
                                const std::filesystem::path& local_path,
                                std::error_code& ec) override;

    [[nodiscard]] bool upload(const std::string& bucket, const std::string& key,
                              const std::filesystem::path& local_path,
                              std::error_code& ec) override;

    std::string object_url(const std::string& bucket, const std::string& key) const override;

    [[nodiscard]] std::shared_ptr<RasterDataset> open_remote_stream(
        const std::string& url, std::error_code& ec) override;

    [[nodiscard]] bool set_public_read_policy(const std::string& bucket,
                                              std::error_code& ec) override;

    // <root>/.cors/<bucket>.xml にCORS設定を書き出す
    [[nodiscard]] bool set_cors_allow_all(const std::string& bucket,
                                          std::error_code& ec) override;

    [[nodiscard]] bool ensure_bucket(const std::string& bucket, std::error_code& ec) override;

    const std::filesystem::path& root() const { return root_; }

   private:
    // ".."や絶対パスを含むキーはnullopt
    std::optional<std::filesystem::path> object_path(const std::string& bucket,
                                                     const std::string& key) const;

    // 一時ファイルに書いてからrenameで置き換える
    [[nodiscard]] static bool atomic_copy(const std::filesystem::path& from,
                                          const std::filesystem::path& to, std::error_code& ec);

    std::filesystem::path root_;
};

}  // namespace cog_converter

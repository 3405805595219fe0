#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

namespace cog_converter {

class RasterDataset;

// オブジェクトストレージの抽象インターフェース
// 失敗時はfalse（またはnullptr）を返し、ecにCogErrcを設定する
class ObjectStore {
   public:
    virtual ~ObjectStore() = default;

    [[nodiscard]] virtual bool exists(const std::string& bucket, const std::string& key,
                                      std::error_code& ec) = 0;

    // サーバー側コピー。完了後はdst側で読み取り可能になっている
    [[nodiscard]] virtual bool copy(const std::string& src_bucket, const std::string& src_key,
                                    const std::string& dst_bucket, const std::string& dst_key,
                                    std::error_code& ec) = 0;

    [[nodiscard]] virtual bool download(const std::string& bucket, const std::string& key,
                                        const std::filesystem::path& local_path,
                                        std::error_code& ec) = 0;

    [[nodiscard]] virtual bool upload(const std::string& bucket, const std::string& key,
                                      const std::filesystem::path& local_path,
                                      std::error_code& ec) = 0;

    virtual std::string object_url(const std::string& bucket, const std::string& key) const = 0;

    // object_urlのURLを部分読み込みで開く（オブジェクト全体はダウンロードしない）
    [[nodiscard]] virtual std::shared_ptr<RasterDataset> open_remote_stream(
        const std::string& url, std::error_code& ec) = 0;

    [[nodiscard]] virtual bool set_public_read_policy(const std::string& bucket,
                                                      std::error_code& ec) = 0;

    // 全オリジンからのGET/HEADを許可する
    [[nodiscard]] virtual bool set_cors_allow_all(const std::string& bucket,
                                                  std::error_code& ec) = 0;

    [[nodiscard]] virtual bool ensure_bucket(const std::string& bucket, std::error_code& ec) = 0;
};

}  // namespace cog_converter

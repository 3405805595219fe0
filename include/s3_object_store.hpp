#pragma once

#include <map>
#include <memory>
#include <string>
#include <system_error>

#include "aws_signature.hpp"
#include "log_sink.hpp"
#include "object_store.hpp"

namespace cog_converter {

struct S3Config {
    // host[:port]。空ならs3.<region>.amazonaws.com
    std::string endpoint;
    std::string region = "us-east-1";
    AwsCredentials credentials;
    bool https = true;
    // trueなら<bucket>.<endpoint>、falseなら<endpoint>/<bucket>
    bool virtual_hosting = true;
    // 1リクエストのタイムアウト（0ならGDALの既定値）
    int timeout_seconds = 0;
};

// S3互換ストレージ。データの読み書きはGDALの/vsis3/で行い、
// GDALが扱わないバケット操作（作成、ポリシー、CORS）は署名付きHTTPで送る
class S3ObjectStore : public ObjectStore {
   public:
    explicit S3ObjectStore(S3Config config, Logger logger = Logger());

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

    // /vsis3/<bucket>/<key>
    std::string object_url(const std::string& bucket, const std::string& key) const override;

    [[nodiscard]] std::shared_ptr<RasterDataset> open_remote_stream(
        const std::string& url, std::error_code& ec) override;

    [[nodiscard]] bool set_public_read_policy(const std::string& bucket,
                                              std::error_code& ec) override;

    [[nodiscard]] bool set_cors_allow_all(const std::string& bucket,
                                          std::error_code& ec) override;

    [[nodiscard]] bool ensure_bucket(const std::string& bucket, std::error_code& ec) override;

    const S3Config& config() const { return config_; }

    // バケット操作の送信先（署名とURLの組み立て）
    std::string endpoint_host() const;
    std::string bucket_url(const std::string& bucket, const std::string& subresource) const;
    AwsRequest bucket_request(const std::string& method, const std::string& bucket,
                              const std::string& subresource, const std::string& payload) const;

   private:
    // 署名してPUTし、HTTPステータスからエラー分類を決める
    [[nodiscard]] bool send_bucket_request(const AwsRequest& request, const std::string& url,
                                           std::error_code& ec);

    // VSIStatExLの結果をexistsの意味に変換する
    [[nodiscard]] bool stat_object(const std::string& path, std::error_code& ec);

    S3Config config_;
    Logger logger_;
};

// CPLHTTPFetchのエラーバッファから "HTTP error code : 403" のステータスを取り出す（なければ0）
int http_status_from_error(const std::string& message);

// バケット操作のHTTPステータスをエラー分類に変換する（2xxは空）
std::error_code map_http_status(int status) noexcept;

}  // namespace cog_converter

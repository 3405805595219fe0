#pragma once

#include <chrono>
#include <map>
#include <string>

namespace cog_converter {

struct AwsCredentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;

    bool empty() const { return access_key_id.empty() || secret_access_key.empty(); }
};

// 署名対象のHTTPリクエスト
struct AwsRequest {
    std::string method = "GET";
    std::string host;
    // URIエンコード済みのパス（"/bucket/key" など）
    std::string canonical_uri = "/";
    // 名前順に並べたクエリ（"policy=" など）
    std::string canonical_query;
    // host以外に署名するヘッダー（名前は小文字）
    std::map<std::string, std::string> headers;
    std::string payload;
};

std::string sha256_hex(const std::string& data);

// MD5の生バイトをBase64にしたもの（Content-MD5ヘッダー用）
std::string md5_base64(const std::string& data);

// AWS4 + secret から日付・リージョン・サービスの順にHMACを重ねた署名鍵（生バイト）
std::string aws_signing_key(const std::string& secret, const std::string& date,
                            const std::string& region, const std::string& service);

// "20130524T000000Z" 形式
std::string amz_timestamp(std::chrono::system_clock::time_point time);

// パスの各セグメントをRFC 3986の非予約文字以外エンコードする（'/'は残す）
std::string uri_encode_path(const std::string& path);

// 署名バージョン4で署名し、送信すべきヘッダー（Authorizationを含む）を返す
// amz_dateはamz_timestamp()の形式
std::map<std::string, std::string> sign_aws_request(const AwsRequest& request,
                                                    const AwsCredentials& credentials,
                                                    const std::string& region,
                                                    const std::string& service,
                                                    const std::string& amz_date);

}  // namespace cog_converter

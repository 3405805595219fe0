#include "s3_object_store.hpp"

#include <cpl_http.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <cpl_vsi_error.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>

#include "bucket_policy.hpp"
#include "dataset.hpp"
#include "errors.hpp"
#include "gdal_env.hpp"

namespace cog_converter {

namespace {

constexpr const char* kVsiPrefix = "/vsis3/";
constexpr const char* kHttpErrorMarker = "HTTP error code : ";

bool is_missing(int vsi_error, const std::string& message) {
    if (vsi_error == VSIE_None || vsi_error == VSIE_AWSObjectNotFound) {
        return true;
    }
    // HEADの404は本文がないためHTTPエラーとして報告される
    return vsi_error == VSIE_HttpError && message.find("404") != std::string::npos;
}

std::error_code last_vsi_error() {
    const int vsi_error = VSIGetLastErrorNo();
    const std::string message = VSIGetLastErrorMsg();
    if (vsi_error == VSIE_HttpError && message.find("403") != std::string::npos) {
        return make_error_code(CogErrc::access_denied);
    }
    const std::error_code ec = map_vsi_error(vsi_error);
    return ec ? ec : make_error_code(CogErrc::storage_io_failure);
}

std::string create_bucket_configuration(const std::string& region) {
    // us-east-1はLocationConstraintを付けない
    if (region.empty() || region == "us-east-1") {
        return {};
    }
    return "<CreateBucketConfiguration xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
           "<LocationConstraint>" +
           region + "</LocationConstraint></CreateBucketConfiguration>";
}

}  // namespace

int http_status_from_error(const std::string& message) {
    const auto pos = message.find(kHttpErrorMarker);
    if (pos == std::string::npos) {
        return 0;
    }
    return std::atoi(message.c_str() + pos + std::char_traits<char>::length(kHttpErrorMarker));
}

std::error_code map_http_status(int status) noexcept {
    if (status == 0 || (status >= 200 && status < 300)) {
        return {};
    }
    if (status == 401 || status == 403) {
        return make_error_code(CogErrc::access_denied);
    }
    if (status == 404) {
        return make_error_code(CogErrc::not_found);
    }
    return make_error_code(CogErrc::storage_io_failure);
}

S3ObjectStore::S3ObjectStore(S3Config config, Logger logger)
    : config_(std::move(config)), logger_(std::move(logger)) {
    ensure_gdal_registered();

    VSISetPathSpecificOption(kVsiPrefix, "AWS_REGION", config_.region.c_str());
    VSISetPathSpecificOption(kVsiPrefix, "AWS_HTTPS", config_.https ? "YES" : "NO");
    VSISetPathSpecificOption(kVsiPrefix, "AWS_VIRTUAL_HOSTING",
                             config_.virtual_hosting ? "TRUE" : "FALSE");
    if (!config_.endpoint.empty()) {
        VSISetPathSpecificOption(kVsiPrefix, "AWS_S3_ENDPOINT", config_.endpoint.c_str());
    }
    if (config_.timeout_seconds > 0) {
        VSISetPathSpecificOption(kVsiPrefix, "GDAL_HTTP_TIMEOUT",
                                 std::to_string(config_.timeout_seconds).c_str());
    }
    if (config_.credentials.empty()) {
        VSISetPathSpecificOption(kVsiPrefix, "AWS_NO_SIGN_REQUEST", "YES");
    } else {
        VSISetPathSpecificOption(kVsiPrefix, "AWS_ACCESS_KEY_ID",
                                 config_.credentials.access_key_id.c_str());
        VSISetPathSpecificOption(kVsiPrefix, "AWS_SECRET_ACCESS_KEY",
                                 config_.credentials.secret_access_key.c_str());
        if (!config_.credentials.session_token.empty()) {
            VSISetPathSpecificOption(kVsiPrefix, "AWS_SESSION_TOKEN",
                                     config_.credentials.session_token.c_str());
        }
    }
}

std::string S3ObjectStore::object_url(const std::string& bucket, const std::string& key) const {
    return kVsiPrefix + bucket + "/" + key;
}

bool S3ObjectStore::stat_object(const std::string& path, std::error_code& ec) {
    // 直前のコピーやアップロードの結果を見るため、キャッシュを捨てる
    VSICurlPartialClearCache(path.c_str());
    VSIErrorReset();

    VSIStatBufL stat;
    if (VSIStatExL(path.c_str(), &stat, VSI_STAT_EXISTS_FLAG | VSI_STAT_SET_ERROR_FLAG) == 0) {
        return true;
    }
    if (!is_missing(VSIGetLastErrorNo(), VSIGetLastErrorMsg())) {
        ec = last_vsi_error();
    }
    return false;
}

bool S3ObjectStore::exists(const std::string& bucket, const std::string& key,
                           std::error_code& ec) {
    if (bucket.empty() || key.empty()) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }
    return stat_object(object_url(bucket, key), ec);
}

bool S3ObjectStore::copy(const std::string& src_bucket, const std::string& src_key,
                         const std::string& dst_bucket, const std::string& dst_key,
                         std::error_code& ec) {
    const std::string source = object_url(src_bucket, src_key);
    if (!stat_object(source, ec)) {
        if (!ec) {
            ec = make_error_code(CogErrc::not_found);
        }
        return false;
    }

    GdalErrorCollector errors;
    VSIErrorReset();
    // /vsis3/同士ならGDALはサーバー側コピーを使う
    const std::string target = object_url(dst_bucket, dst_key);
    if (VSICopyFile(source.c_str(), target.c_str(), nullptr, static_cast<vsi_l_offset>(-1),
                    nullptr, nullptr, nullptr) != 0) {
        logger_.error(source + " -> " + target + ": " + errors.summary());
        ec = last_vsi_error();
        return false;
    }
    VSICurlPartialClearCache(target.c_str());
    return true;
}

bool S3ObjectStore::download(const std::string& bucket, const std::string& key,
                             const std::filesystem::path& local_path, std::error_code& ec) {
    const std::string source = object_url(bucket, key);
    if (!stat_object(source, ec)) {
        if (!ec) {
            ec = make_error_code(CogErrc::not_found);
        }
        return false;
    }

    GdalErrorCollector errors;
    VSIErrorReset();
    if (VSICopyFile(source.c_str(), local_path.string().c_str(), nullptr,
                    static_cast<vsi_l_offset>(-1), nullptr, nullptr, nullptr) != 0) {
        logger_.error(source + ": " + errors.summary());
        ec = last_vsi_error();
        std::error_code cleanup_ec;
        std::filesystem::remove(local_path, cleanup_ec);
        return false;
    }
    return true;
}

bool S3ObjectStore::upload(const std::string& bucket, const std::string& key,
                           const std::filesystem::path& local_path, std::error_code& ec) {
    std::error_code fs_ec;
    if (!std::filesystem::is_regular_file(local_path, fs_ec)) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }

    GdalErrorCollector errors;
    VSIErrorReset();
    const std::string target = object_url(bucket, key);
    // 大きなファイルはGDALがマルチパートアップロードにする
    if (VSICopyFile(local_path.string().c_str(), target.c_str(), nullptr,
                    static_cast<vsi_l_offset>(-1), nullptr, nullptr, nullptr) != 0) {
        logger_.error(target + ": " + errors.summary());
        const std::error_code vsi_ec = last_vsi_error();
        ec = vsi_ec == CogErrc::access_denied ? vsi_ec
                                              : make_error_code(CogErrc::storage_io_failure);
        return false;
    }
    VSICurlPartialClearCache(target.c_str());
    return true;
}

std::shared_ptr<RasterDataset> S3ObjectStore::open_remote_stream(const std::string& url,
                                                                 std::error_code& ec) {
    const std::string prefix(kVsiPrefix);
    if (url.compare(0, prefix.size(), prefix) != 0 || url.size() == prefix.size()) {
        ec = make_error_code(CogErrc::invalid_input);
        return nullptr;
    }
    if (!stat_object(url, ec)) {
        if (!ec) {
            ec = make_error_code(CogErrc::not_found);
        }
        return nullptr;
    }
    return RasterDataset::open_url(url, ec);
}

std::string S3ObjectStore::endpoint_host() const {
    if (!config_.endpoint.empty()) {
        return config_.endpoint;
    }
    if (config_.region.empty() || config_.region == "us-east-1") {
        return "s3.amazonaws.com";
    }
    return "s3." + config_.region + ".amazonaws.com";
}

std::string S3ObjectStore::bucket_url(const std::string& bucket,
                                      const std::string& subresource) const {
    const std::string scheme = config_.https ? "https://" : "http://";
    std::string url = config_.virtual_hosting
                          ? scheme + bucket + "." + endpoint_host() + "/"
                          : scheme + endpoint_host() + "/" + uri_encode_path(bucket);
    if (!subresource.empty()) {
        url += "?" + subresource;
    }
    return url;
}

AwsRequest S3ObjectStore::bucket_request(const std::string& method, const std::string& bucket,
                                         const std::string& subresource,
                                         const std::string& payload) const {
    AwsRequest request;
    request.method = method;
    if (config_.virtual_hosting) {
        request.host = bucket + "." + endpoint_host();
        request.canonical_uri = "/";
    } else {
        request.host = endpoint_host();
        request.canonical_uri = "/" + uri_encode_path(bucket);
    }
    if (!subresource.empty()) {
        request.canonical_query = subresource + "=";
    }
    request.payload = payload;
    if (!payload.empty()) {
        request.headers["content-md5"] = md5_base64(payload);
        request.headers["content-type"] =
            subresource == "policy" ? "application/json" : "application/xml";
    }
    return request;
}

bool S3ObjectStore::send_bucket_request(const AwsRequest& request, const std::string& url,
                                        std::error_code& ec) {
    if (config_.credentials.empty()) {
        logger_.error(url + ": バケット操作には認証情報が必要です");
        ec = make_error_code(CogErrc::access_denied);
        return false;
    }

    const auto headers = sign_aws_request(request, config_.credentials, config_.region, "s3",
                                          amz_timestamp(std::chrono::system_clock::now()));
    std::string header_lines;
    for (const auto& [name, value] : headers) {
        // Hostはcurlがurlから付ける
        if (name == "host") {
            continue;
        }
        if (!header_lines.empty()) {
            header_lines += "\r\n";
        }
        header_lines += name + ": " + value;
    }

    CPLStringList options;
    options.SetNameValue("CUSTOMREQUEST", request.method.c_str());
    options.SetNameValue("HEADERS", header_lines.c_str());
    if (!request.payload.empty()) {
        options.SetNameValue("POSTFIELDS", request.payload.c_str());
    }
    if (config_.timeout_seconds > 0) {
        options.SetNameValue("TIMEOUT", std::to_string(config_.timeout_seconds).c_str());
    }

    GdalErrorCollector errors;
    CPLHTTPResult* result = CPLHTTPFetch(url.c_str(), options.List());
    if (!result) {
        ec = make_error_code(CogErrc::storage_io_failure);
        return false;
    }

    const std::string error_text = result->pszErrBuf ? result->pszErrBuf : "";
    const std::string body = result->pabyData && result->nDataLen > 0
                                 ? std::string(reinterpret_cast<const char*>(result->pabyData),
                                               static_cast<std::size_t>(result->nDataLen))
                                 : std::string();
    const int curl_status = result->nStatus;
    CPLHTTPDestroyResult(result);

    const int status = http_status_from_error(error_text);
    // 既に自分が所有しているバケットの作成は成功扱い
    if (status == 409 && body.find("BucketAlreadyOwnedByYou") != std::string::npos) {
        return true;
    }
    if (status != 0) {
        logger_.error(request.method + " " + url + ": HTTP " + std::to_string(status) +
                      (body.empty() ? "" : " " + body));
        ec = map_http_status(status);
        if (!ec) {
            ec = make_error_code(CogErrc::storage_io_failure);
        }
        return false;
    }
    if (curl_status != 0 || !error_text.empty()) {
        logger_.error(request.method + " " + url + ": " + error_text);
        ec = make_error_code(CogErrc::storage_io_failure);
        return false;
    }
    return true;
}

bool S3ObjectStore::set_public_read_policy(const std::string& bucket, std::error_code& ec) {
    if (bucket.empty()) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }
    const std::string policy = public_read_policy(bucket);
    return send_bucket_request(bucket_request("PUT", bucket, "policy", policy),
                               bucket_url(bucket, "policy"), ec);
}

bool S3ObjectStore::set_cors_allow_all(const std::string& bucket, std::error_code& ec) {
    if (bucket.empty()) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }
    const std::string cors = cors_allow_all_configuration();
    return send_bucket_request(bucket_request("PUT", bucket, "cors", cors),
                               bucket_url(bucket, "cors"), ec);
}

bool S3ObjectStore::ensure_bucket(const std::string& bucket, std::error_code& ec) {
    if (bucket.empty()) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }
    const std::string configuration = create_bucket_configuration(config_.region);
    return send_bucket_request(bucket_request("PUT", bucket, "", configuration),
                               bucket_url(bucket, ""), ec);
}

}  // namespace cog_converter

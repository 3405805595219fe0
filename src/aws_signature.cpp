#include "aws_signature.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace cog_converter {

namespace {

constexpr const char* kAlgorithm = "AWS4-HMAC-SHA256";

std::string to_hex(const unsigned char* data, std::size_t length) {
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        os << std::setw(2) << static_cast<int>(data[i]);
    }
    return os.str();
}

std::string digest(const std::string& data, const EVP_MD* md) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), out, &length, md, nullptr) != 1) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(out), length);
}

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &length)) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(out), length);
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

}  // namespace

std::string sha256_hex(const std::string& data) {
    const std::string raw = digest(data, EVP_sha256());
    return to_hex(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
}

std::string md5_base64(const std::string& data) {
    const std::string raw = digest(data, EVP_md5());
    // 4/3倍 + 終端
    std::vector<unsigned char> out(4 * ((raw.size() + 2) / 3) + 1);
    const int length = EVP_EncodeBlock(out.data(),
                                       reinterpret_cast<const unsigned char*>(raw.data()),
                                       static_cast<int>(raw.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), length > 0 ? length : 0);
}

std::string aws_signing_key(const std::string& secret, const std::string& date,
                            const std::string& region, const std::string& service) {
    const std::string date_key = hmac_sha256("AWS4" + secret, date);
    const std::string region_key = hmac_sha256(date_key, region);
    const std::string service_key = hmac_sha256(region_key, service);
    return hmac_sha256(service_key, "aws4_request");
}

std::string amz_timestamp(std::chrono::system_clock::time_point time) {
    const std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buffer[17] = {};
    std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &utc);
    return buffer;
}

std::string uri_encode_path(const std::string& path) {
    std::ostringstream os;
    os << std::uppercase << std::hex << std::setfill('0');
    for (const unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            os << c;
        } else {
            os << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return os.str();
}

std::map<std::string, std::string> sign_aws_request(const AwsRequest& request,
                                                    const AwsCredentials& credentials,
                                                    const std::string& region,
                                                    const std::string& service,
                                                    const std::string& amz_date) {
    const std::string date = amz_date.substr(0, 8);
    const std::string payload_hash = sha256_hex(request.payload);

    std::map<std::string, std::string> headers = request.headers;
    headers["host"] = request.host;
    headers["x-amz-date"] = amz_date;
    headers["x-amz-content-sha256"] = payload_hash;
    if (!credentials.session_token.empty()) {
        headers["x-amz-security-token"] = credentials.session_token;
    }

    // std::mapなのでヘッダー名の順に並ぶ
    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : headers) {
        canonical_headers += name + ":" + trim(value) + "\n";
        if (!signed_headers.empty()) {
            signed_headers += ";";
        }
        signed_headers += name;
    }

    const std::string canonical_request = request.method + "\n" + request.canonical_uri + "\n" +
                                          request.canonical_query + "\n" + canonical_headers +
                                          "\n" + signed_headers + "\n" + payload_hash;

    const std::string scope = date + "/" + region + "/" + service + "/aws4_request";
    const std::string string_to_sign = std::string(kAlgorithm) + "\n" + amz_date + "\n" + scope +
                                       "\n" + sha256_hex(canonical_request);

    const std::string key =
        aws_signing_key(credentials.secret_access_key, date, region, service);
    const std::string raw_signature = hmac_sha256(key, string_to_sign);
    const std::string signature = to_hex(
        reinterpret_cast<const unsigned char*>(raw_signature.data()), raw_signature.size());

    headers["authorization"] = std::string(kAlgorithm) + " Credential=" +
                               credentials.access_key_id + "/" + scope +
                               ",SignedHeaders=" + signed_headers + ",Signature=" + signature;
    return headers;
}

}  // namespace cog_converter

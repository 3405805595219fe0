#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <system_error>

namespace cog_converter {

// 起動時に一度だけ読み込み、パイプラインに明示的に渡す設定値
struct Settings {
    std::filesystem::path scratch_dir;  // TEMP_DIR
    std::string default_bucket;         // COG_BUCKET
    std::filesystem::path store_root;   // COG_STORE_ROOT
    int retry_attempts = 3;             // COG_RETRY_ATTEMPTS
    std::chrono::milliseconds retry_backoff{500};    // COG_RETRY_BACKOFF_MS
    std::chrono::seconds storage_deadline{600};      // COG_STORAGE_DEADLINE_SEC

    // S3互換ストレージ（COG_STORE_ROOTが空のときに使う）
    std::string s3_endpoint;                 // AWS_S3_ENDPOINT（host[:port]）
    std::string s3_region = "us-east-1";     // AWS_REGION
    std::string s3_access_key_id;            // AWS_ACCESS_KEY_ID
    std::string s3_secret_access_key;        // AWS_SECRET_ACCESS_KEY
    std::string s3_session_token;            // AWS_SESSION_TOKEN
    bool s3_https = true;                    // AWS_HTTPS
    bool s3_virtual_hosting = true;          // AWS_VIRTUAL_HOSTING

    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    // 任意のキー検索関数から設定を構築
    static Settings from_lookup(const Lookup& lookup, std::error_code& ec);

    // dotenvファイル（存在する場合）と環境変数から構築。環境変数が優先される
    static Settings load(const std::filesystem::path& env_file, std::error_code& ec);
};

// KEY=VALUE形式のdotenvファイルを解析
[[nodiscard]] std::optional<std::map<std::string, std::string>> parse_env_file(
    const std::filesystem::path& env_file, std::error_code& ec);

}  // namespace cog_converter

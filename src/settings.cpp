#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

#include "errors.hpp"

namespace cog_converter {

namespace {

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

bool parse_int(const std::string& text, long long& value) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, err] = std::from_chars(first, last, value);
    return err == std::errc() && ptr == last;
}

// GDALの設定値と同じくYES/NO、TRUE/FALSE、ON/OFF、1/0を受け付ける
std::optional<bool> parse_bool(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (text == "YES" || text == "TRUE" || text == "ON" || text == "1") {
        return true;
    }
    if (text == "NO" || text == "FALSE" || text == "OFF" || text == "0") {
        return false;
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::map<std::string, std::string>> parse_env_file(
    const std::filesystem::path& env_file, std::error_code& ec) {
    std::ifstream file(env_file);
    if (!file.is_open()) {
        ec = make_error_code(CogErrc::invalid_input);
        return std::nullopt;
    }

    std::map<std::string, std::string> values;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty()) {
            values[key] = value;
        }
    }

    return values;
}

Settings Settings::from_lookup(const Lookup& lookup, std::error_code& ec) {
    Settings settings;

    auto read_int = [&](const char* name, long long min_value, long long& out) {
        auto text = lookup(name);
        if (!text || text->empty()) {
            return;
        }
        long long value = 0;
        if (!parse_int(*text, value) || value < min_value) {
            ec = make_error_code(CogErrc::invalid_input);
            return;
        }
        out = value;
    };

    auto read_bool = [&](const char* name, bool& out) {
        auto text = lookup(name);
        if (!text || text->empty()) {
            return;
        }
        const auto value = parse_bool(*text);
        if (!value) {
            ec = make_error_code(CogErrc::invalid_input);
            return;
        }
        out = *value;
    };

    if (auto temp_dir = lookup("TEMP_DIR"); temp_dir && !temp_dir->empty()) {
        settings.scratch_dir = *temp_dir;
    } else {
        std::error_code temp_ec;
        settings.scratch_dir = std::filesystem::temp_directory_path(temp_ec);
        if (temp_ec) {
            settings.scratch_dir = "/tmp";
        }
    }

    if (auto bucket = lookup("COG_BUCKET")) {
        settings.default_bucket = *bucket;
    }
    if (auto root = lookup("COG_STORE_ROOT")) {
        settings.store_root = *root;
    }

    if (auto endpoint = lookup("AWS_S3_ENDPOINT")) {
        settings.s3_endpoint = *endpoint;
    }
    if (auto region = lookup("AWS_REGION"); region && !region->empty()) {
        settings.s3_region = *region;
    }
    if (auto key_id = lookup("AWS_ACCESS_KEY_ID")) {
        settings.s3_access_key_id = *key_id;
    }
    if (auto secret = lookup("AWS_SECRET_ACCESS_KEY")) {
        settings.s3_secret_access_key = *secret;
    }
    if (auto token = lookup("AWS_SESSION_TOKEN")) {
        settings.s3_session_token = *token;
    }
    read_bool("AWS_HTTPS", settings.s3_https);
    read_bool("AWS_VIRTUAL_HOSTING", settings.s3_virtual_hosting);

    long long attempts = settings.retry_attempts;
    long long backoff_ms = settings.retry_backoff.count();
    long long deadline_sec = settings.storage_deadline.count();
    read_int("COG_RETRY_ATTEMPTS", 1, attempts);
    read_int("COG_RETRY_BACKOFF_MS", 0, backoff_ms);
    read_int("COG_STORAGE_DEADLINE_SEC", 1, deadline_sec);

    settings.retry_attempts = static_cast<int>(attempts);
    settings.retry_backoff = std::chrono::milliseconds(backoff_ms);
    settings.storage_deadline = std::chrono::seconds(deadline_sec);
    return settings;
}

Settings Settings::load(const std::filesystem::path& env_file, std::error_code& ec) {
    std::map<std::string, std::string> file_values;
    std::error_code stat_ec;
    if (!env_file.empty() && std::filesystem::is_regular_file(env_file, stat_ec)) {
        auto parsed = parse_env_file(env_file, ec);
        if (!parsed) {
            return Settings{};
        }
        file_values = std::move(*parsed);
    }

    return from_lookup(
        [&file_values](const std::string& name) -> std::optional<std::string> {
            if (const char* value = std::getenv(name.c_str())) {
                return std::string(value);
            }
            auto it = file_values.find(name);
            if (it != file_values.end()) {
                return it->second;
            }
            return std::nullopt;
        },
        ec);
}

}  // namespace cog_converter

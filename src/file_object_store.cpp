#include "file_object_store.hpp"

#include <unistd.h>

#include <cerrno>
#include <fstream>

#include "bucket_policy.hpp"
#include "dataset.hpp"
#include "errors.hpp"
#include "random_token.hpp"

namespace cog_converter {

namespace fs = std::filesystem;

namespace {

constexpr const char* kUrlScheme = "file://";
// バケット名として使えない名前（先頭がドット）
constexpr const char* kCorsDirectory = ".cors";

// ファイルに対する読み取り可否を確認
std::error_code check_readable(const fs::path& path) {
    if (::access(path.c_str(), R_OK) != 0) {
        return map_filesystem_error(std::error_code(errno, std::generic_category()));
    }
    return {};
}

}  // namespace

FilesystemObjectStore::FilesystemObjectStore(fs::path root) : root_(std::move(root)) {}

std::optional<fs::path> FilesystemObjectStore::object_path(const std::string& bucket,
                                                           const std::string& key) const {
    if (bucket.empty() || key.empty() || bucket.find('/') != std::string::npos ||
        bucket.front() == '.') {
        return std::nullopt;
    }

    const fs::path relative(key);
    if (relative.is_absolute()) {
        return std::nullopt;
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return std::nullopt;
        }
    }
    return root_ / bucket / relative;
}

bool FilesystemObjectStore::atomic_copy(const fs::path& from, const fs::path& to,
                                        std::error_code& ec) {
    std::error_code fs_ec;
    fs::create_directories(to.parent_path(), fs_ec);
    if (fs_ec) {
        ec = map_filesystem_error(fs_ec);
        return false;
    }

    const fs::path partial =
        to.parent_path() / ("." + to.filename().string() + ".part-" + random_token());
    fs::copy_file(from, partial, fs::copy_options::overwrite_existing, fs_ec);
    if (fs_ec) {
        std::error_code cleanup_ec;
        fs::remove(partial, cleanup_ec);
        ec = map_filesystem_error(fs_ec);
        return false;
    }

    fs::rename(partial, to, fs_ec);
    if (fs_ec) {
        std::error_code cleanup_ec;
        fs::remove(partial, cleanup_ec);
        ec = make_error_code(CogErrc::storage_io_failure);
        return false;
    }
    return true;
}

bool FilesystemObjectStore::exists(const std::string& bucket, const std::string& key,
                                   std::error_code& ec) {
    auto path = object_path(bucket, key);
    if (!path) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }

    std::error_code fs_ec;
    if (!fs::is_directory(root_ / bucket, fs_ec)) {
        // バケット自体が存在しない
        ec = fs_ec ? map_filesystem_error(fs_ec) : make_error_code(CogErrc::not_found);
        return false;
    }

    const auto status = fs::status(*path, fs_ec);
    if (fs_ec && fs_ec != std::errc::no_such_file_or_directory) {
        ec = make_error_code(CogErrc::storage_io_failure);
        return false;
    }
    return fs::is_regular_file(status);
}

bool FilesystemObjectStore::copy(const std::string& src_bucket, const std::string& src_key,
                                 const std::string& dst_bucket, const std::string& dst_key,
                                 std::error_code& ec) {
    auto from = object_path(src_bucket, src_key);
    auto to = object_path(dst_bucket, dst_key);
    if (!from || !to) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }

    std::error_code fs_ec;
    if (!fs::is_regular_file(*from, fs_ec)) {
        ec = fs_ec ? map_filesystem_error(fs_ec) : make_error_code(CogErrc::not_found);
        return false;
    }
    if (auto read_ec = check_readable(*from)) {
        ec = read_ec;
        return false;
    }

    return atomic_copy(*from, *to, ec);
}

bool FilesystemObjectStore::download(const std::string& bucket, const std::string& key,
                                     const fs::path& local_path, std::error_code& ec) {
    auto from = object_path(bucket, key);
    if (!from) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }

    std::error_code fs_ec;
    if (!fs::is_regular_file(*from, fs_ec)) {
        ec = fs_ec ? map_filesystem_error(fs_ec) : make_error_code(CogErrc::not_found);
        return false;
    }
    if (auto read_ec = check_readable(*from)) {
        ec = read_ec;
        return false;
    }

    fs::copy_file(*from, local_path, fs::copy_options::overwrite_existing, fs_ec);
    if (fs_ec) {
        ec = make_error_code(CogErrc::storage_io_failure);
        return false;
    }
    return true;
}

bool FilesystemObjectStore::upload(const std::string& bucket, const std::string& key,
                                   const fs::path& local_path, std::error_code& ec) {
    auto to = object_path(bucket, key);
    if (!to) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }

    std::error_code fs_ec;
    if (!fs::is_directory(root_ / bucket, fs_ec)) {
        ec = fs_ec ? map_filesystem_error(fs_ec) : make_error_code(CogErrc::not_found);
        return false;
    }
    if (!fs::is_regular_file(local_path, fs_ec)) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }

    if (!atomic_copy(local_path, *to, ec)) {
        // アップロードの失敗はすべてストレージI/O失敗として報告する
        if (ec != CogErrc::access_denied) {
            ec = make_error_code(CogErrc::storage_io_failure);
        }
        return false;
    }
    return true;
}

std::string FilesystemObjectStore::object_url(const std::string& bucket,
                                              const std::string& key) const {
    std::error_code ec;
    auto root = fs::absolute(root_, ec);
    if (ec) {
        root = root_;
    }
    return kUrlScheme + (root / bucket / key).lexically_normal().string();
}

std::shared_ptr<RasterDataset> FilesystemObjectStore::open_remote_stream(const std::string& url,
                                                                        std::error_code& ec) {
    const std::string scheme(kUrlScheme);
    if (url.compare(0, scheme.size(), scheme) != 0) {
        ec = make_error_code(CogErrc::invalid_input);
        return nullptr;
    }
    const fs::path path = url.substr(scheme.size());

    std::error_code fs_ec;
    if (!fs::is_regular_file(path, fs_ec)) {
        ec = fs_ec ? map_filesystem_error(fs_ec) : make_error_code(CogErrc::not_found);
        return nullptr;
    }
    if (auto read_ec = check_readable(path)) {
        ec = read_ec;
        return nullptr;
    }

    // GDALは必要なブロックだけをファイルから読む
    return RasterDataset::open_url(path.string(), ec);
}

bool FilesystemObjectStore::set_public_read_policy(const std::string& bucket,
                                                   std::error_code& ec) {
    if (!object_path(bucket, ".")) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }
    const fs::path bucket_dir = root_ / bucket;

    std::error_code fs_ec;
    if (!fs::is_directory(bucket_dir, fs_ec)) {
        ec = fs_ec ? map_filesystem_error(fs_ec) : make_error_code(CogErrc::not_found);
        return false;
    }

    // 全員に読み取りを許可（ディレクトリは走査も許可）
    const auto dir_perms = fs::perms::others_read | fs::perms::others_exec |
                           fs::perms::group_read | fs::perms::group_exec;
    const auto file_perms = fs::perms::others_read | fs::perms::group_read;

    fs::permissions(bucket_dir, dir_perms, fs::perm_options::add, fs_ec);
    if (fs_ec) {
        ec = map_filesystem_error(fs_ec);
        return false;
    }

    fs::recursive_directory_iterator it(bucket_dir, fs_ec);
    const fs::recursive_directory_iterator end;
    while (!fs_ec && it != end) {
        const bool is_dir = it->is_directory(fs_ec);
        if (!fs_ec) {
            fs::permissions(it->path(), is_dir ? dir_perms : file_perms, fs::perm_options::add,
                            fs_ec);
        }
        if (!fs_ec) {
            it.increment(fs_ec);
        }
    }
    if (fs_ec) {
        ec = map_filesystem_error(fs_ec);
        return false;
    }
    return true;
}

bool FilesystemObjectStore::set_cors_allow_all(const std::string& bucket, std::error_code& ec) {
    if (!object_path(bucket, ".")) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }

    std::error_code fs_ec;
    if (!fs::is_directory(root_ / bucket, fs_ec)) {
        ec = fs_ec ? map_filesystem_error(fs_ec) : make_error_code(CogErrc::not_found);
        return false;
    }

    const fs::path cors_dir = root_ / kCorsDirectory;
    fs::create_directories(cors_dir, fs_ec);
    if (fs_ec) {
        ec = map_filesystem_error(fs_ec);
        return false;
    }

    const fs::path staging = cors_dir / (bucket + ".xml." + random_token());
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        out << cors_allow_all_configuration();
        if (!out) {
            ec = make_error_code(CogErrc::storage_io_failure);
            return false;
        }
    }
    fs::rename(staging, cors_dir / (bucket + ".xml"), fs_ec);
    if (fs_ec) {
        std::error_code cleanup_ec;
        fs::remove(staging, cleanup_ec);
        ec = make_error_code(CogErrc::storage_io_failure);
        return false;
    }
    return true;
}

bool FilesystemObjectStore::ensure_bucket(const std::string& bucket, std::error_code& ec) {
    if (!object_path(bucket, ".")) {
        ec = make_error_code(CogErrc::invalid_input);
        return false;
    }

    std::error_code fs_ec;
    fs::create_directories(root_ / bucket, fs_ec);
    if (fs_ec) {
        ec = map_filesystem_error(fs_ec);
        return false;
    }
    return true;
}

}  // namespace cog_converter

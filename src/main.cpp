#ifdef _WIN32
#include <windows.h>
#endif

#include <cxxopts.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "acquisition.hpp"
#include "cog_engine.hpp"
#include "converter.hpp"
#include "file_object_store.hpp"
#include "log_sink.hpp"
#include "pipeline.hpp"
#include "s3_object_store.hpp"
#include "scratch.hpp"
#include "settings.hpp"

namespace fs = std::filesystem;
using namespace cog_converter;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitJobFailed = 1;
constexpr int kExitUsage = 2;

// 1行1キー。空行と#で始まる行は無視する
bool read_keys_file(const fs::path& path, std::vector<std::string>& keys) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::string line;
    while (std::getline(file, line)) {
        const auto begin = line.find_first_not_of(" \t\r");
        if (begin == std::string::npos || line[begin] == '#') {
            continue;
        }
        const auto end = line.find_last_not_of(" \t\r");
        keys.push_back(line.substr(begin, end - begin + 1));
    }
    return true;
}

// key=value の列をマップにする（キーは小文字にそろえる）
bool parse_profile_options(const std::vector<std::string>& items, OptionMap& options) {
    for (const auto& item : items) {
        const auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            return false;
        }
        std::string key = item.substr(0, eq);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        options[key] = item.substr(eq + 1);
    }
    return true;
}

S3Config s3_config_from(const Settings& settings) {
    S3Config config;
    config.endpoint = settings.s3_endpoint;
    config.region = settings.s3_region;
    config.credentials.access_key_id = settings.s3_access_key_id;
    config.credentials.secret_access_key = settings.s3_secret_access_key;
    config.credentials.session_token = settings.s3_session_token;
    config.https = settings.s3_https;
    config.virtual_hosting = settings.s3_virtual_hosting;
    config.timeout_seconds = static_cast<int>(settings.storage_deadline.count());
    return config;
}

}  // namespace

int main(int argc, char* argv[]) {
#ifdef _WIN32
    // Windowsコンソール出力をUTF-8に設定
    SetConsoleOutputCP(CP_UTF8);
#endif

    cxxopts::Options options("cog_converter",
                             "オブジェクトストレージ上のGeoTIFFをCloud Optimized GeoTIFFに変換");

    options.add_options()("k,key", "変換するソースキー（複数指定可）",
                          cxxopts::value<std::vector<std::string>>())(
        "f,keys-file", "ソースキーを1行ずつ記載したファイル", cxxopts::value<std::string>())(
        "i,input", "ローカルのGeoTIFFを変換する（バケットを使わない）",
        cxxopts::value<std::string>())("output", "--input の出力先パス",
                                       cxxopts::value<std::string>())(
        "b,bucket", "変換先バケット（デフォルト: COG_BUCKET）", cxxopts::value<std::string>())(
        "r,replicate-from", "変換前にソースを複製するバケット", cxxopts::value<std::string>())(
        "p,preload", "ダウンロードしてから開く（デフォルト: ストリーム）")(
        "o,overwrite", "既存のCOGを上書きする")("c,compress", "非可逆圧縮（JPEG）を使う")(
        "dem", "標高データとして可逆圧縮と予測子を使う")(
        "smooth-dem", "DEMのオーバービューを3次補間で作成する")(
        "web-optimized", "EPSG:3857のタイルグリッドに再投影する")(
        "public", "完了後に変換先バケットを公開読み取りにする")(
        "cors", "完了後に変換先バケットのCORSをすべてのオリジンに開く")(
        "create-bucket", "変換先バケットがなければ作成する")(
        "w,workers", "並列ジョブ数（デフォルト: 1）", cxxopts::value<int>()->default_value("1"))(
        "t,threads", "エンジンのスレッド数（0は全CPU）",
        cxxopts::value<int>()->default_value("0"))("no-internal-mask",
                                                   "内部マスクを作成しない")(
        "overview-blocksize", "オーバービューのタイルサイズ（GDAL_TIFF_OVR_BLOCKSIZE、デフォルト: 128）",
        cxxopts::value<int>()->default_value("128"))(
        "profile-option", "プロファイルのオプション key=value（複数指定可）",
        cxxopts::value<std::vector<std::string>>())(
        "store-root",
        "バケットを配置するルートディレクトリ（デフォルト: COG_STORE_ROOT、未指定ならS3）",
        cxxopts::value<std::string>())("scratch-dir", "一時ファイルのディレクトリ（デフォルト: TEMP_DIR）",
                                       cxxopts::value<std::string>())(
        "env-file", "設定を読み込むdotenvファイル",
        cxxopts::value<std::string>()->default_value(".env.secret"))("v,verbose",
                                                                     "デバッグログを出力")(
        "h,help", "使用方法を表示");

    std::unique_ptr<cxxopts::ParseResult> parsed;
    try {
        parsed = std::make_unique<cxxopts::ParseResult>(options.parse(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << "エラー: " << e.what() << std::endl;
        std::cerr << options.help() << std::endl;
        return kExitUsage;
    }
    const cxxopts::ParseResult& result = *parsed;

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return kExitSuccess;
    }

    auto sink = std::make_shared<ConsoleLogSink>(result.count("verbose") ? LogLevel::Debug
                                                                         : LogLevel::Info);
    Logger logger(sink);

    std::error_code ec;
    const Settings settings = Settings::load(result["env-file"].as<std::string>(), ec);
    if (ec) {
        logger.error("設定を読み込めません: " + ec.message());
        return kExitUsage;
    }

    ClassificationFlags flags;
    flags.is_dem = result.count("dem") > 0;
    flags.compress = result.count("compress") > 0;
    flags.smooth_dem = result.count("smooth-dem") > 0;
    flags.web_optimized = result.count("web-optimized") > 0;

    OptionMap overrides;
    if (result.count("profile-option") &&
        !parse_profile_options(result["profile-option"].as<std::vector<std::string>>(),
                               overrides)) {
        logger.error("--profile-option は key=value の形式で指定してください");
        return kExitUsage;
    }
    std::string reason;
    if (!check_profile_overrides(flags, overrides, reason)) {
        logger.error(reason);
        return kExitUsage;
    }

    EngineConfig engine_config;
    engine_config.num_threads = result["threads"].as<int>();
    engine_config.internal_mask = result.count("no-internal-mask") == 0;
    engine_config.overview_block_size = result["overview-blocksize"].as<int>();
    if (engine_config.num_threads < 0 || engine_config.overview_block_size <= 0) {
        logger.error("--threads と --overview-blocksize の値が不正です");
        return kExitUsage;
    }

    RetryPolicy retry;
    retry.max_attempts = settings.retry_attempts;
    retry.initial_backoff = settings.retry_backoff;
    retry.deadline = settings.storage_deadline;

    const fs::path scratch_dir = result.count("scratch-dir")
                                     ? fs::path(result["scratch-dir"].as<std::string>())
                                     : settings.scratch_dir;
    ScratchManager scratch(scratch_dir);
    GdalCogEngine engine(logger);

    fs::path store_root = result.count("store-root")
                              ? fs::path(result["store-root"].as<std::string>())
                              : settings.store_root;

    // ローカルファイルの単体変換
    if (result.count("input")) {
        FilesystemObjectStore store(store_root.empty() ? fs::current_path() : store_root);
        AcquisitionStrategy acquisition(store, scratch, retry, logger);

        CogConverter::Config config;
        config.flags = flags;
        config.profile_overrides = overrides;
        config.engine = engine_config;
        if (result.count("output")) {
            config.output_path = fs::path(result["output"].as<std::string>());
        }

        CogConverter converter(std::move(config), acquisition, engine, logger);
        const auto output = converter.run(LocalPath{result["input"].as<std::string>()}, ec);
        if (!output) {
            return kExitJobFailed;
        }
        logger.info("最終出力: " + output->string());
        return kExitSuccess;
    }

    std::vector<std::string> keys;
    if (result.count("key")) {
        keys = result["key"].as<std::vector<std::string>>();
    }
    if (result.count("keys-file")) {
        const fs::path keys_file = result["keys-file"].as<std::string>();
        if (!read_keys_file(keys_file, keys)) {
            logger.error("キーファイルを開けません: " + keys_file.string());
            return kExitUsage;
        }
    }
    if (keys.empty()) {
        logger.error("--key, --keys-file, --input のいずれかを指定してください");
        std::cerr << options.help() << std::endl;
        return kExitUsage;
    }

    PipelineConfig config;
    config.target_bucket =
        result.count("bucket") ? result["bucket"].as<std::string>() : settings.default_bucket;
    if (config.target_bucket.empty()) {
        logger.error("変換先バケットを --bucket または COG_BUCKET で指定してください");
        return kExitUsage;
    }
    if (result.count("replicate-from")) {
        config.replicate_from = result["replicate-from"].as<std::string>();
    }
    config.mode = result.count("preload") ? AcquisitionMode::Preload : AcquisitionMode::Stream;
    config.flags = flags;
    config.overwrite = result.count("overwrite") > 0;
    config.make_public = result.count("public") > 0;
    config.allow_cors = result.count("cors") > 0;
    config.create_bucket = result.count("create-bucket") > 0;
    config.workers = result["workers"].as<int>();
    config.engine = engine_config;
    config.profile_overrides = overrides;
    config.retry = retry;
    if (config.workers < 1) {
        logger.error("--workers は1以上を指定してください");
        return kExitUsage;
    }

    logger.info("=== COG変換を開始 ===");
    std::unique_ptr<ObjectStore> store;
    if (store_root.empty()) {
        const S3Config s3 = s3_config_from(settings);
        logger.info("ストア: S3 (" + (s3.endpoint.empty() ? s3.region : s3.endpoint) +
                    ") / 一時ディレクトリ: " + scratch_dir.string());
        if (s3.credentials.empty()) {
            logger.warn("AWSの認証情報がないため匿名でアクセスします");
        }
        store = std::make_unique<S3ObjectStore>(s3, logger);
    } else {
        logger.info("ストア: " + store_root.string() + " / 一時ディレクトリ: " +
                    scratch_dir.string());
        store = std::make_unique<FilesystemObjectStore>(store_root);
    }

    CogPipeline pipeline(std::move(config), *store, engine, scratch, logger);
    const BatchReport report = pipeline.run(keys);

    if (scratch.removal_failures() > 0) {
        logger.warn(std::to_string(scratch.removal_failures()) + " 個の一時ファイルを削除できませんでした");
    }

    logger.info("=== 変換完了 ===");
    return report.failed() == 0 ? kExitSuccess : kExitJobFailed;
}

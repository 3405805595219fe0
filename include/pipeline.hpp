#pragma once

#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

#include "acquisition.hpp"
#include "cog_engine.hpp"
#include "log_sink.hpp"
#include "object_store.hpp"
#include "profile_selector.hpp"
#include "retry.hpp"
#include "scratch.hpp"

namespace cog_converter {

// 1つのソースキーに対する変換ジョブ
struct Job {
    std::string source_key;
    std::string destination_key;
    ClassificationFlags flags;
    bool overwrite = false;
};

enum class JobStatus { Skipped, Succeeded, Failed };

const char* to_string(JobStatus status);

struct JobOutcome {
    Job job;
    JobStatus status = JobStatus::Failed;
    std::string profile_id;
    std::error_code error;
    std::string message;
};

struct BatchReport {
    std::vector<JobOutcome> outcomes;

    std::size_t skipped() const { return count(JobStatus::Skipped); }
    std::size_t succeeded() const { return count(JobStatus::Succeeded); }
    std::size_t failed() const { return count(JobStatus::Failed); }

   private:
    std::size_t count(JobStatus status) const;
};

struct PipelineConfig {
    std::string target_bucket;
    // 空またはtarget_bucketと同じ場合は複製しない
    std::string replicate_from;
    AcquisitionMode mode = AcquisitionMode::Stream;
    ClassificationFlags flags;
    bool overwrite = false;
    bool make_public = false;
    // バッチ後にすべてのオリジンからのGET/HEADを許可する
    bool allow_cors = false;
    bool create_bucket = false;
    int workers = 1;
    EngineConfig engine;
    OptionMap profile_overrides;
    RetryPolicy retry;
};

// キーの列を順に（またはworkers並列で）COGに変換してアップロードする
// 各ジョブの失敗はそのジョブにのみ記録され、残りのジョブは続行される
class CogPipeline {
   public:
    CogPipeline(PipelineConfig config, ObjectStore& store, TranscodeEngine& engine,
                ScratchManager& scratch, Logger logger = Logger());

    std::vector<Job> enumerate(const std::vector<std::string>& keys) const;

    JobOutcome run_job(const Job& job);

    BatchReport run(const std::vector<std::string>& keys);

   private:
    void process(const Job& job, JobOutcome& outcome);

    // 変換先が既に存在するか（overwrite時は常にfalse）
    [[nodiscard]] bool destination_exists(const Job& job, bool& exists, std::error_code& ec);
    [[nodiscard]] bool replicate(const Job& job, std::error_code& ec);
    [[nodiscard]] bool replication_enabled() const;

    void fail(JobOutcome& outcome, std::error_code ec, const std::string& message) const;

    PipelineConfig config_;
    ObjectStore& store_;
    TranscodeEngine& engine_;
    ScratchManager& scratch_;
    Logger logger_;
    AcquisitionStrategy acquisition_;
};

}  // namespace cog_converter

#include "pipeline.hpp"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

#include "errors.hpp"
#include "transcode_invoker.hpp"

namespace cog_converter {

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Skipped:
            return "Skipped";
        case JobStatus::Succeeded:
            return "Succeeded";
        case JobStatus::Failed:
            return "Failed";
    }
    return "";
}

std::size_t BatchReport::count(JobStatus status) const {
    return static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(),
                      [status](const JobOutcome& outcome) { return outcome.status == status; }));
}

CogPipeline::CogPipeline(PipelineConfig config, ObjectStore& store, TranscodeEngine& engine,
                         ScratchManager& scratch, Logger logger)
    : config_(std::move(config)),
      store_(store),
      engine_(engine),
      scratch_(scratch),
      logger_(std::move(logger)),
      acquisition_(store_, scratch_, config_.retry, logger_) {}

std::vector<Job> CogPipeline::enumerate(const std::vector<std::string>& keys) const {
    // 変換先キーはフラグと上書き指定だけで決まるので、取得前に求められる
    const std::string profile_id = select_profile_id(config_.flags, config_.profile_overrides);

    std::vector<Job> jobs;
    jobs.reserve(keys.size());
    for (const auto& key : keys) {
        Job job;
        job.source_key = key;
        job.destination_key = destination_key(key, profile_id);
        job.flags = config_.flags;
        job.overwrite = config_.overwrite;
        jobs.push_back(std::move(job));
    }
    return jobs;
}

bool CogPipeline::replication_enabled() const {
    return !config_.replicate_from.empty() && config_.replicate_from != config_.target_bucket;
}

bool CogPipeline::destination_exists(const Job& job, bool& exists, std::error_code& ec) {
    exists = false;
    if (job.overwrite) {
        return true;
    }
    return with_retry(
        config_.retry, logger_, "存在確認 " + job.destination_key,
        [&](std::error_code& op_ec) {
            exists = store_.exists(config_.target_bucket, job.destination_key, op_ec);
            return !op_ec;
        },
        ec);
}

bool CogPipeline::replicate(const Job& job, std::error_code& ec) {
    logger_.info("複製中: " + config_.replicate_from + "/" + job.source_key + " -> " +
                 config_.target_bucket);

    const bool copied = with_retry(
        config_.retry, logger_, "コピー " + job.source_key,
        [&](std::error_code& op_ec) {
            return store_.copy(config_.replicate_from, job.source_key, config_.target_bucket,
                               job.source_key, op_ec);
        },
        ec);
    if (!copied) {
        return false;
    }

    // コピー後、取得前に複製先で参照できることを確認する
    bool visible = false;
    const bool checked = with_retry(
        config_.retry, logger_, "複製の確認 " + job.source_key,
        [&](std::error_code& op_ec) {
            visible = store_.exists(config_.target_bucket, job.source_key, op_ec);
            return !op_ec;
        },
        ec);
    if (!checked || !visible) {
        ec = make_error_code(CogErrc::storage_io_failure);
        return false;
    }
    return true;
}

void CogPipeline::fail(JobOutcome& outcome, std::error_code ec, const std::string& message) const {
    outcome.status = JobStatus::Failed;
    outcome.error = ec;
    outcome.message = message + " (" + ec.message() + ")";
    logger_.error(outcome.job.source_key + ": " + outcome.message);
}

void CogPipeline::process(const Job& job, JobOutcome& outcome) {
    std::error_code ec;

    bool exists = false;
    if (!destination_exists(job, exists, ec)) {
        fail(outcome, make_error_code(CogErrc::storage_io_failure), "存在確認に失敗しました");
        return;
    }
    if (exists) {
        outcome.status = JobStatus::Skipped;
        outcome.message = "変換済み";
        logger_.info("スキップ（既に存在）: " + job.destination_key);
        return;
    }

    if (replication_enabled() && !replicate(job, ec)) {
        fail(outcome, ec, "複製に失敗しました");
        return;
    }

    auto acquired = acquisition_.acquire(config_.target_bucket, job.source_key, config_.mode, ec);
    if (!acquired) {
        fail(outcome, ec, "ソースを取得できません");
        return;
    }

    const EncodingProfile profile =
        select_profile(job.flags, acquired->dataset->sample_types(), config_.profile_overrides);
    outcome.profile_id = profile.id;

    logger_.info("COGを作成中: " + job.source_key + " -> " + job.destination_key +
                 " (プロファイル: " + profile.id + ", " + to_string(config_.mode) + ")");

    const auto extension = std::filesystem::path(job.destination_key).extension().string();
    auto output = scratch_.allocate(extension.empty() ? ".tif" : extension, ec);
    if (!output) {
        fail(outcome, ec, "一時ファイルを確保できません");
        return;
    }
    output->mark_in_use();

    TranscodeInvoker invoker(engine_, logger_);
    TranslateOptions options;
    options.web_optimized = job.flags.web_optimized;
    if (!invoker.run(*acquired->dataset, output->path(), profile, options, config_.engine, ec)) {
        fail(outcome, ec, "COGの作成に失敗しました");
        return;
    }

    // アップロード前にソース側の一時ファイルを解放する
    acquired->dataset.reset();
    acquired->scratch.release();

    // 並列実行時に他のジョブが先に書いた可能性があるため再確認する
    if (!destination_exists(job, exists, ec)) {
        fail(outcome, make_error_code(CogErrc::storage_io_failure), "存在確認に失敗しました");
        return;
    }
    if (exists) {
        outcome.status = JobStatus::Skipped;
        outcome.message = "変換中に作成済み";
        logger_.info("スキップ（変換中に作成済み）: " + job.destination_key);
        return;
    }

    const bool uploaded = with_retry(
        config_.retry, logger_, "アップロード " + job.destination_key,
        [&](std::error_code& op_ec) {
            return store_.upload(config_.target_bucket, job.destination_key, output->path(),
                                 op_ec);
        },
        ec);
    if (!uploaded) {
        fail(outcome, make_error_code(CogErrc::storage_io_failure), "アップロードに失敗しました");
        return;
    }

    output->release();
    outcome.status = JobStatus::Succeeded;
    logger_.info("アップロード完了: " + config_.target_bucket + "/" + job.destination_key);
}

JobOutcome CogPipeline::run_job(const Job& job) {
    JobOutcome outcome;
    outcome.job = job;
    outcome.profile_id = select_profile_id(job.flags, config_.profile_overrides);

    try {
        process(job, outcome);
    } catch (const std::system_error& e) {
        fail(outcome, map_filesystem_error(e.code()), std::string("例外: ") + e.what());
    } catch (const std::exception& e) {
        fail(outcome, make_error_code(CogErrc::transcode_failure),
             std::string("例外: ") + e.what());
    }
    return outcome;
}

BatchReport CogPipeline::run(const std::vector<std::string>& keys) {
    const std::vector<Job> jobs = enumerate(keys);

    BatchReport report;
    report.outcomes.resize(jobs.size());

    logger_.info(std::to_string(jobs.size()) + " 件のジョブを開始 (バケット: " +
                 config_.target_bucket + ")");

    if (config_.create_bucket) {
        std::error_code ec;
        const bool ensured = with_retry(
            config_.retry, logger_, "バケット作成 " + config_.target_bucket,
            [&](std::error_code& op_ec) { return store_.ensure_bucket(config_.target_bucket, op_ec); },
            ec);
        if (!ensured) {
            // バケットがなければどのジョブも実行できない
            for (std::size_t i = 0; i < jobs.size(); ++i) {
                report.outcomes[i].job = jobs[i];
                report.outcomes[i].profile_id =
                    select_profile_id(jobs[i].flags, config_.profile_overrides);
                fail(report.outcomes[i], ec, "バケットを作成できません");
            }
            return report;
        }
    }

    if (config_.workers > 1 && jobs.size() > 1) {
        tbb::task_arena arena(config_.workers);
        arena.execute([&] {
            tbb::parallel_for(tbb::blocked_range<std::size_t>(0, jobs.size(), 1),
                              [&](const tbb::blocked_range<std::size_t>& range) {
                                  for (std::size_t i = range.begin(); i != range.end(); ++i) {
                                      report.outcomes[i] = run_job(jobs[i]);
                                  }
                              });
        });
    } else {
        for (std::size_t i = 0; i < jobs.size(); ++i) {
            report.outcomes[i] = run_job(jobs[i]);
        }
    }

    if (config_.make_public) {
        std::error_code ec;
        const bool applied = with_retry(
            config_.retry, logger_, "公開設定 " + config_.target_bucket,
            [&](std::error_code& op_ec) {
                return store_.set_public_read_policy(config_.target_bucket, op_ec);
            },
            ec);
        if (applied) {
            logger_.info("バケットを公開読み取りに設定しました: " + config_.target_bucket);
        } else {
            logger_.error("公開設定に失敗しました: " + config_.target_bucket + " (" +
                          ec.message() + ")");
        }
    }

    if (config_.allow_cors) {
        std::error_code ec;
        const bool applied = with_retry(
            config_.retry, logger_, "CORS設定 " + config_.target_bucket,
            [&](std::error_code& op_ec) {
                return store_.set_cors_allow_all(config_.target_bucket, op_ec);
            },
            ec);
        if (applied) {
            logger_.info("すべてのオリジンからのGETを許可しました: " + config_.target_bucket);
        } else {
            logger_.error("CORS設定に失敗しました: " + config_.target_bucket + " (" +
                          ec.message() + ")");
        }
    }

    logger_.info("完了: 成功 " + std::to_string(report.succeeded()) + " / スキップ " +
                 std::to_string(report.skipped()) + " / 失敗 " +
                 std::to_string(report.failed()));
    return report;
}

}  // namespace cog_converter

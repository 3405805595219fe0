#pragma once

#include <chrono>
#include <string>
#include <system_error>
#include <thread>

#include "errors.hpp"
#include "log_sink.hpp"

namespace cog_converter {

// ストレージ呼び出しの有限回リトライ設定
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{500};
    double backoff_multiplier = 2.0;
    // この時間を過ぎたら新たな試行を開始しない
    std::chrono::milliseconds deadline{std::chrono::seconds(600)};
};

// op(std::error_code&) -> bool を実行し、StorageIOFailureの場合のみ再試行する
template <typename Operation>
[[nodiscard]] bool with_retry(const RetryPolicy& policy, const Logger& logger,
                              const std::string& what, Operation&& op, std::error_code& ec) {
    const auto start = std::chrono::steady_clock::now();
    auto backoff = policy.initial_backoff;
    const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;

    for (int attempt = 1;; ++attempt) {
        ec.clear();
        if (op(ec)) {
            return true;
        }
        if (!ec) {
            // 失敗を返したのにエラーが未設定の場合はI/O失敗として扱う
            ec = make_error_code(CogErrc::storage_io_failure);
        }
        if (!is_retryable(ec) || attempt >= attempts) {
            return false;
        }

        const auto elapsed = std::chrono::steady_clock::now() - start;
        if (elapsed + backoff >= policy.deadline) {
            logger.warn(what + ": 期限を超えるため再試行を中止");
            return false;
        }

        logger.warn(what + " に失敗 (" + ec.message() + ")、再試行 " +
                    std::to_string(attempt + 1) + "/" + std::to_string(attempts));
        std::this_thread::sleep_for(backoff);
        backoff = std::chrono::duration_cast<std::chrono::milliseconds>(
            backoff * policy.backoff_multiplier);
    }
}

}  // namespace cog_converter

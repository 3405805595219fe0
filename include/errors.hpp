#pragma once

#include <string>
#include <system_error>

namespace cog_converter {

// ジョブ単位で報告されるエラー分類
enum class CogErrc {
    not_found = 1,       // ソースオブジェクトが存在しない
    access_denied,       // 読み取り権限なし
    transcode_failure,   // エンジンエラーまたは構造検証の失敗
    storage_io_failure,  // exists/copy/download/uploadの失敗
    invalid_input,       // 不正なローカル入力（リソース確保前に失敗）
};

const std::error_category& cog_category() noexcept;

std::error_code make_error_code(CogErrc e) noexcept;

// ファイルシステム由来のerror_codeを分類に変換
std::error_code map_filesystem_error(const std::error_code& ec) noexcept;

// リトライ対象はStorageIOFailureのみ
bool is_retryable(const std::error_code& ec) noexcept;

}  // namespace cog_converter

namespace std {
template <>
struct is_error_code_enum<cog_converter::CogErrc> : true_type {};
}  // namespace std

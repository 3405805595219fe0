#pragma once

#include <string>

namespace cog_converter {

// バケット内の全オブジェクトに匿名のs3:GetObjectを許可するバケットポリシー（JSON）
std::string public_read_policy(const std::string& bucket);

// 全オリジンからのGET/HEADを許可するCORS設定（S3のCORSConfiguration XML）
// COGビューアが範囲読み込みできるようRange関連のヘッダーを公開する
std::string cors_allow_all_configuration();

}  // namespace cog_converter

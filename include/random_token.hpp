#pragma once

#include <string>

namespace cog_converter {

// 一時ファイル名用の16桁の16進トークン（スレッドローカルな乱数生成器を使用）
std::string random_token();

}  // namespace cog_converter

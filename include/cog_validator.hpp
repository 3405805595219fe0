#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace cog_converter {

// COG構造検証の結果。errorsが空ならvalid
struct ValidationReport {
    bool valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

// タイル化、IFDの配置順、オーバービューとタイルデータの並びを検査する
ValidationReport validate_cog(const std::filesystem::path& path);

}  // namespace cog_converter

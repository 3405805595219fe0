#pragma once

#include <cpl_error.h>

#include <string>
#include <system_error>
#include <vector>

namespace cog_converter {

// GDALの全ドライバを登録する（何度呼んでもよい）
void ensure_gdal_registered();

// VSIGetLastErrorNo() の値をジョブのエラー分類に変換する（エラーなしなら空）
std::error_code map_vsi_error(int vsi_error) noexcept;

// スコープ内でこのスレッドに出たGDALのエラー・警告を集める
class GdalErrorCollector {
   public:
    GdalErrorCollector();
    ~GdalErrorCollector();

    GdalErrorCollector(const GdalErrorCollector&) = delete;
    GdalErrorCollector& operator=(const GdalErrorCollector&) = delete;

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }
    // 最後に記録されたCE_Failure以上のエラー番号（なければCPLE_None）
    CPLErrorNum last_error_number() const { return last_error_number_; }

    // 集めたエラーを "; " で連結する
    std::string summary() const;

   private:
    static void CPL_STDCALL handle(CPLErr level, CPLErrorNum number, const char* message);

    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;
    CPLErrorNum last_error_number_ = CPLE_None;
};

}  // namespace cog_converter

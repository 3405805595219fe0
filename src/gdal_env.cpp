#include "gdal_env.hpp"

#include <cpl_vsi_error.h>
#include <gdal.h>

#include <mutex>

#include "errors.hpp"

namespace cog_converter {

void ensure_gdal_registered() {
    static std::once_flag registered;
    std::call_once(registered, [] { GDALAllRegister(); });
}

std::error_code map_vsi_error(int vsi_error) noexcept {
    switch (vsi_error) {
        case VSIE_None:
            return {};
        case VSIE_AWSObjectNotFound:
        case VSIE_AWSBucketNotFound:
            return make_error_code(CogErrc::not_found);
        case VSIE_AWSAccessDenied:
        case VSIE_AWSInvalidCredentials:
        case VSIE_AWSSignatureDoesNotMatch:
            return make_error_code(CogErrc::access_denied);
        default:
            return make_error_code(CogErrc::storage_io_failure);
    }
}

GdalErrorCollector::GdalErrorCollector() { CPLPushErrorHandlerEx(&GdalErrorCollector::handle, this); }

GdalErrorCollector::~GdalErrorCollector() { CPLPopErrorHandler(); }

void CPL_STDCALL GdalErrorCollector::handle(CPLErr level, CPLErrorNum number,
                                            const char* message) {
    auto* self = static_cast<GdalErrorCollector*>(CPLGetErrorHandlerUserData());
    if (!self) {
        return;
    }
    const std::string text = message ? message : "";
    if (level >= CE_Failure) {
        self->errors_.push_back(text);
        self->last_error_number_ = number;
    } else if (level == CE_Warning) {
        self->warnings_.push_back(text);
    }
}

std::string GdalErrorCollector::summary() const {
    std::string joined;
    for (const auto& error : errors_) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += error;
    }
    return joined;
}

}  // namespace cog_converter

#include "errors.hpp"

namespace cog_converter {

namespace {

class CogCategory : public std::error_category {
   public:
    const char* name() const noexcept override { return "cog_converter"; }

    std::string message(int value) const override {
        switch (static_cast<CogErrc>(value)) {
            case CogErrc::not_found:
                return "source object not found";
            case CogErrc::access_denied:
                return "access denied";
            case CogErrc::transcode_failure:
                return "transcode failure";
            case CogErrc::storage_io_failure:
                return "storage I/O failure";
            case CogErrc::invalid_input:
                return "invalid input";
        }
        return "unknown error";
    }
};

}  // namespace

const std::error_category& cog_category() noexcept {
    static const CogCategory category;
    return category;
}

std::error_code make_error_code(CogErrc e) noexcept {
    return {static_cast<int>(e), cog_category()};
}

std::error_code map_filesystem_error(const std::error_code& ec) noexcept {
    if (!ec || ec.category() == cog_category()) {
        return ec;
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return make_error_code(CogErrc::not_found);
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return make_error_code(CogErrc::access_denied);
    }
    return make_error_code(CogErrc::storage_io_failure);
}

bool is_retryable(const std::error_code& ec) noexcept {
    return ec == CogErrc::storage_io_failure;
}

}  // namespace cog_converter

#include "scratch.hpp"

#include "errors.hpp"
#include "random_token.hpp"

namespace cog_converter {

const char* to_string(ScratchState state) {
    switch (state) {
        case ScratchState::Created:
            return "Created";
        case ScratchState::InUse:
            return "InUse";
        case ScratchState::Released:
            return "Released";
    }
    return "";
}

ScratchResource::ScratchResource(ScratchManager* owner, std::filesystem::path path)
    : owner_(owner), path_(std::move(path)), state_(ScratchState::Created) {}

ScratchResource::~ScratchResource() { release(); }

ScratchResource::ScratchResource(ScratchResource&& other) noexcept
    : owner_(other.owner_), path_(std::move(other.path_)), state_(other.state_) {
    other.owner_ = nullptr;
    other.state_ = ScratchState::Released;
}

ScratchResource& ScratchResource::operator=(ScratchResource&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        path_ = std::move(other.path_);
        state_ = other.state_;
        other.owner_ = nullptr;
        other.state_ = ScratchState::Released;
    }
    return *this;
}

void ScratchResource::mark_in_use() {
    if (state_ == ScratchState::Created) {
        state_ = ScratchState::InUse;
    }
}

void ScratchResource::release() {
    if (owner_ == nullptr || state_ == ScratchState::Released) {
        return;
    }
    state_ = ScratchState::Released;
    owner_->on_release(path_);
    owner_ = nullptr;
}

ScratchManager::ScratchManager(std::filesystem::path root) : root_(std::move(root)) {}

std::optional<ScratchResource> ScratchManager::allocate(const std::string& suffix,
                                                        std::error_code& ec) {
    std::error_code fs_ec;
    std::filesystem::create_directories(root_, fs_ec);
    if (fs_ec) {
        ec = map_filesystem_error(fs_ec);
        return std::nullopt;
    }

    // 衝突した場合は別のトークンで再試行
    for (int attempt = 0; attempt < 8; ++attempt) {
        auto path = root_ / ("cog_" + random_token() + suffix);
        if (!std::filesystem::exists(path, fs_ec) && !fs_ec) {
            ++allocated_;
            return ScratchResource(this, std::move(path));
        }
        if (fs_ec) {
            ec = map_filesystem_error(fs_ec);
            return std::nullopt;
        }
    }

    ec = make_error_code(CogErrc::storage_io_failure);
    return std::nullopt;
}

void ScratchManager::on_release(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        ++removal_failures_;
    }
    ++released_;
}

}  // namespace cog_converter

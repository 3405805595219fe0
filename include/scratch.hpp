#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace cog_converter {

enum class ScratchState { Created, InUse, Released };

const char* to_string(ScratchState state);

class ScratchManager;

// ジョブ専有の一時ファイル。release()またはデストラクタで一度だけ解放される
class ScratchResource {
   public:
    ScratchResource() = default;
    ~ScratchResource();

    ScratchResource(const ScratchResource&) = delete;
    ScratchResource& operator=(const ScratchResource&) = delete;
    ScratchResource(ScratchResource&& other) noexcept;
    ScratchResource& operator=(ScratchResource&& other) noexcept;

    const std::filesystem::path& path() const { return path_; }
    ScratchState state() const { return state_; }
    bool empty() const { return owner_ == nullptr; }

    void mark_in_use();

    // 2回目以降の呼び出しは何もしない
    void release();

   private:
    friend class ScratchManager;
    ScratchResource(ScratchManager* owner, std::filesystem::path path);

    ScratchManager* owner_ = nullptr;
    std::filesystem::path path_;
    ScratchState state_ = ScratchState::Released;
};

// スクラッチディレクトリ配下に一意なパスを払い出し、解放数を記録する
class ScratchManager {
   public:
    explicit ScratchManager(std::filesystem::path root);

    ScratchManager(const ScratchManager&) = delete;
    ScratchManager& operator=(const ScratchManager&) = delete;

    [[nodiscard]] std::optional<ScratchResource> allocate(const std::string& suffix,
                                                          std::error_code& ec);

    const std::filesystem::path& root() const { return root_; }

    std::size_t allocated() const { return allocated_.load(); }
    std::size_t released() const { return released_.load(); }
    std::size_t outstanding() const { return allocated() - released(); }
    // 削除に失敗した一時ファイルの数
    std::size_t removal_failures() const { return removal_failures_.load(); }

   private:
    friend class ScratchResource;
    void on_release(const std::filesystem::path& path);

    std::filesystem::path root_;
    std::atomic<std::size_t> allocated_{0};
    std::atomic<std::size_t> released_{0};
    std::atomic<std::size_t> removal_failures_{0};
};

}  // namespace cog_converter

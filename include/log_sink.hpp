#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace cog_converter {

enum class LogLevel { Debug, Info, Warning, Error };

const char* to_string(LogLevel level);

// ログ出力先の抽象インターフェース
class LogSink {
   public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, std::string_view message) = 0;
};

// Debug/Infoは標準出力、Warning/Errorは標準エラーへ出力する
class ConsoleLogSink : public LogSink {
   public:
    explicit ConsoleLogSink(LogLevel min_level = LogLevel::Info);

    void write(LogLevel level, std::string_view message) override;

   private:
    LogLevel min_level_;
    std::mutex mutex_;
};

// 各コンポーネントに値で渡すロガー。シンク未設定の場合は何も出力しない
class Logger {
   public:
    Logger() = default;
    explicit Logger(std::shared_ptr<LogSink> sink);

    void debug(std::string_view message) const { log(LogLevel::Debug, message); }
    void info(std::string_view message) const { log(LogLevel::Info, message); }
    void warn(std::string_view message) const { log(LogLevel::Warning, message); }
    void error(std::string_view message) const { log(LogLevel::Error, message); }

    void log(LogLevel level, std::string_view message) const;

   private:
    std::shared_ptr<LogSink> sink_;
};

}  // namespace cog_converter

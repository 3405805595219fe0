#include "log_sink.hpp"

#include <iostream>

namespace cog_converter {

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "";
}

ConsoleLogSink::ConsoleLogSink(LogLevel min_level) : min_level_(min_level) {}

void ConsoleLogSink::write(LogLevel level, std::string_view message) {
    if (level < min_level_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = level >= LogLevel::Warning ? std::cerr : std::cout;
    out << "[" << to_string(level) << "] " << message << std::endl;
}

Logger::Logger(std::shared_ptr<LogSink> sink) : sink_(std::move(sink)) {}

void Logger::log(LogLevel level, std::string_view message) const {
    if (sink_) {
        sink_->write(level, message);
    }
}

}  // namespace cog_converter

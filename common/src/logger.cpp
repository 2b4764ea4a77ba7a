#include "logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace mailcatch {

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string level(name);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "trace") return LogLevel::Trace;
    if (level == "debug") return LogLevel::Debug;
    if (level == "info") return LogLevel::Info;
    if (level == "warning" || level == "warn") return LogLevel::Warning;
    if (level == "error") return LogLevel::Error;
    if (level == "fatal") return LogLevel::Fatal;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(LogLevel level, bool console, const std::filesystem::path& file,
                  size_t max_file_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);

    level_ = level;
    console_ = console;
    max_file_size_ = max_file_size;
    max_files_ = max_files;

    if (file_stream_.is_open()) {
        file_stream_.close();
    }

    if (!file.empty()) {
        log_file_ = file;
        std::error_code ec;
        if (auto parent = file.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        file_stream_.open(file, std::ios::app);
        if (file_stream_.is_open()) {
            auto size = std::filesystem::file_size(file, ec);
            current_size_ = ec ? 0 : static_cast<size_t>(size);
        } else {
            std::cerr << "Cannot open log file " << file << ", logging to console only\n";
        }
    }
}

void Logger::trace(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Trace >= level_) {
        write(LogLevel::Trace, loc, std::string(msg));
    }
}

void Logger::debug(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Debug >= level_) {
        write(LogLevel::Debug, loc, std::string(msg));
    }
}

void Logger::info(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Info >= level_) {
        write(LogLevel::Info, loc, std::string(msg));
    }
}

void Logger::warning(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Warning >= level_) {
        write(LogLevel::Warning, loc, std::string(msg));
    }
}

void Logger::error(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Error >= level_) {
        write(LogLevel::Error, loc, std::string(msg));
    }
}

void Logger::fatal(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Fatal >= level_) {
        write(LogLevel::Fatal, loc, std::string(msg));
    }
}

void Logger::write(LogLevel level, const std::source_location& loc, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::filesystem::path file_path(loc.file_name());
    std::string formatted = std::format("[{}] [{}] [{}:{}] {}",
                                        get_timestamp(), level_to_string(level),
                                        file_path.filename().string(), loc.line(),
                                        message);

    if (console_) {
        const char* color = "";
        const char* reset = "\033[0m";

        switch (level) {
            case LogLevel::Trace:   color = "\033[90m"; break;  // Gray
            case LogLevel::Debug:   color = "\033[36m"; break;  // Cyan
            case LogLevel::Info:    color = "\033[32m"; break;  // Green
            case LogLevel::Warning: color = "\033[33m"; break;  // Yellow
            case LogLevel::Error:   color = "\033[31m"; break;  // Red
            case LogLevel::Fatal:   color = "\033[35m"; break;  // Magenta
        }

        std::cerr << color << formatted << reset << "\n";
    }

    if (file_stream_.is_open()) {
        rotate_if_needed();
        file_stream_ << formatted << "\n";
        file_stream_.flush();
        current_size_ += formatted.length() + 1;
    }
}

void Logger::rotate_if_needed() {
    if (current_size_ < max_file_size_) return;

    file_stream_.close();

    // <file>.1 is the newest rotation, files past max_files_ are dropped
    std::error_code ec;
    for (size_t i = max_files_ - 1; i > 0; --i) {
        std::filesystem::path old_file = log_file_;
        old_file += "." + std::to_string(i);

        std::filesystem::path new_file = log_file_;
        new_file += "." + std::to_string(i + 1);

        if (std::filesystem::exists(old_file, ec)) {
            if (i + 1 >= max_files_) {
                std::filesystem::remove(old_file, ec);
            } else {
                std::filesystem::rename(old_file, new_file, ec);
            }
        }
    }

    std::filesystem::path rotated = log_file_;
    rotated += ".1";
    std::filesystem::rename(log_file_, rotated, ec);

    file_stream_.open(log_file_, std::ios::app);
    current_size_ = 0;
}

std::string Logger::level_to_string(LogLevel level) const {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO ";
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

}  // namespace mailcatch

#pragma once

#include "logger.hpp"
#include <string>
#include <chrono>
#include <filesystem>
#include <optional>
#include <unordered_map>
#include <cstdint>

namespace mailcatch {

struct ServerConfig {
    std::string bind_address = "127.0.0.1";
    uint16_t port = 0;
    size_t max_connections = 1000;
    size_t thread_pool_size = 4;
    std::chrono::seconds connection_timeout{300};
};

struct StorageConfig {
    std::filesystem::path path = "/var/lib/mailcatch/mails.db";
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::filesystem::path file;
    bool log_to_console = true;
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

struct SMTPConfig : ServerConfig {
    std::string hostname = "localhost";
    size_t max_message_size = 25 * 1024 * 1024;  // 25 MB
    size_t max_recipients = 100;

    SMTPConfig() {
        port = 1025;
    }
};

// What a listing does with a stored value that no longer decodes
enum class CorruptRecordPolicy {
    FailFast,
    Skip
};

struct HTTPConfig : ServerConfig {
    std::string access_key;
    CorruptRecordPolicy corrupt_records = CorruptRecordPolicy::FailFast;

    HTTPConfig() {
        port = 8025;
        connection_timeout = std::chrono::seconds{30};
    }
};

class Config {
public:
    static Config& instance();

    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    bool load(const std::filesystem::path& config_file);
    bool load_from_string(const std::string& content);

    const StorageConfig& storage() const { return storage_; }
    const LogConfig& log() const { return log_; }
    const SMTPConfig& smtp() const { return smtp_; }
    const HTTPConfig& http() const { return http_; }

    StorageConfig& storage() { return storage_; }
    LogConfig& log() { return log_; }
    SMTPConfig& smtp() { return smtp_; }
    HTTPConfig& http() { return http_; }

    std::optional<std::string> get(const std::string& key) const;

private:
    void parse_section(const std::string& section, const std::string& key, const std::string& value);
    bool parse_server_key(ServerConfig& server, const std::string& key, const std::string& value);

    StorageConfig storage_;
    LogConfig log_;
    SMTPConfig smtp_;
    HTTPConfig http_;

    std::unordered_map<std::string, std::string> custom_values_;
};

}  // namespace mailcatch

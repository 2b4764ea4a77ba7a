#include "config.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace mailcatch {

namespace {

bool to_bool(const std::string& v) {
    return v == "true" || v == "yes" || v == "1" || v == "on";
}

int64_t to_int(const std::string& v) {
    try {
        return std::stoll(v);
    } catch (const std::exception&) {
        return 0;
    }
}

}  // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::filesystem::path& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

bool Config::load_from_string(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    std::string current_section;

    while (std::getline(stream, line)) {
        auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        auto end = line.find_last_not_of(" \t\r\n");
        line = line.substr(start, end - start + 1);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            std::transform(current_section.begin(), current_section.end(), current_section.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        auto trim = [](std::string& s) {
            auto first = s.find_first_not_of(" \t");
            auto last = s.find_last_not_of(" \t");
            if (first != std::string::npos && last != std::string::npos) {
                s = s.substr(first, last - first + 1);
            } else {
                s.clear();
            }
        };
        trim(key);
        trim(value);

        if (value.length() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        parse_section(current_section, key, value);
    }

    return true;
}

bool Config::parse_server_key(ServerConfig& server, const std::string& key,
                              const std::string& value) {
    if (key == "bind_address" || key == "address") {
        server.bind_address = value;
    } else if (key == "port") {
        server.port = static_cast<uint16_t>(to_int(value));
    } else if (key == "max_connections") {
        server.max_connections = static_cast<size_t>(to_int(value));
    } else if (key == "thread_pool_size" || key == "threads") {
        server.thread_pool_size = static_cast<size_t>(std::max<int64_t>(1, to_int(value)));
    } else if (key == "connection_timeout" || key == "timeout") {
        server.connection_timeout = std::chrono::seconds{to_int(value)};
    } else {
        return false;
    }
    return true;
}

void Config::parse_section(const std::string& section, const std::string& key,
                           const std::string& value) {
    if (section == "storage") {
        if (key == "path" || key == "database") {
            storage_.path = value;
        }
    } else if (section == "log" || section == "logging") {
        if (key == "level") {
            if (auto level = parse_log_level(value)) {
                log_.level = *level;
            }
        } else if (key == "file") {
            log_.file = value;
        } else if (key == "console") {
            log_.log_to_console = to_bool(value);
        } else if (key == "max_file_size") {
            log_.max_file_size = static_cast<size_t>(to_int(value));
        } else if (key == "max_files") {
            log_.max_files = static_cast<size_t>(to_int(value));
        }
    } else if (section == "smtp") {
        if (parse_server_key(smtp_, key, value)) return;

        if (key == "hostname") {
            smtp_.hostname = value;
        } else if (key == "max_message_size") {
            smtp_.max_message_size = static_cast<size_t>(to_int(value));
        } else if (key == "max_recipients") {
            smtp_.max_recipients = static_cast<size_t>(to_int(value));
        }
    } else if (section == "http" || section == "api") {
        if (parse_server_key(http_, key, value)) return;

        if (key == "access_key" || key == "key") {
            http_.access_key = value;
        } else if (key == "corrupt_records") {
            std::string policy = value;
            std::transform(policy.begin(), policy.end(), policy.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (policy == "skip") {
                http_.corrupt_records = CorruptRecordPolicy::Skip;
            } else if (policy == "fail") {
                http_.corrupt_records = CorruptRecordPolicy::FailFast;
            }
        }
    } else {
        std::string full_key = section.empty() ? key : section + "." + key;
        custom_values_[full_key] = value;
    }
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = custom_values_.find(key);
    if (it != custom_values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace mailcatch

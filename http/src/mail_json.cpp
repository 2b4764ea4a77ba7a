#include "mail_json.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mailcatch::http {

nlohmann::json to_json(const Mail& mail) {
    return nlohmann::json{
        {"id", mail.id},
        {"from", mail.from},
        {"to", mail.to},
        {"subject", mail.subject},
        {"body", mail.body},
        {"received_at", format_timestamp(mail.received_at)}
    };
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds).count();

    auto time = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(6) << micros << 'Z';
    return oss.str();
}

}  // namespace mailcatch::http

#pragma once

#include "storage/mail.hpp"
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace mailcatch::http {

// {"id","from","to","subject","body","received_at"}
nlohmann::json to_json(const Mail& mail);

// UTC, "YYYY-MM-DDTHH:MM:SS.ffffffZ"
std::string format_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace mailcatch::http

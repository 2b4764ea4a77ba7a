#pragma once

#include "http_request.hpp"
#include <string>
#include <string_view>

namespace mailcatch::http {

// Shared-secret check on the "k" query parameter, applied before routing
class AccessGate {
public:
    static constexpr const char* KEY_PARAM = "k";

    // Throws std::invalid_argument for an empty key
    explicit AccessGate(std::string access_key);

    bool allows(const Request& request) const;

    static bool constant_time_equals(std::string_view a, std::string_view b);

private:
    std::string access_key_;
};

}  // namespace mailcatch::http

#pragma once

#include "access_gate.hpp"
#include "http_router.hpp"
#include <optional>
#include <string_view>

namespace mailcatch::http {

// Turns one request line into at most one response. nullopt means the
// connection is closed without writing anything.
class RequestEngine {
public:
    RequestEngine(const Router& router, const AccessGate& gate);

    std::optional<Response> handle(std::string_view line) const;

private:
    const Router& router_;
    const AccessGate& gate_;
};

}  // namespace mailcatch::http

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace mailcatch::http {

namespace status {
    constexpr int OK = 200;
    constexpr int BAD_REQUEST = 400;
    constexpr int NOT_FOUND = 404;
    constexpr int INTERNAL_ERROR = 500;

    std::string reason(int code);
}

struct Response {
    int status = status::OK;
    std::string content_type;
    std::string body;

    // Status line, Content-Type and Content-Length when there is a body, blank line, body
    std::string serialize() const;

    static Response empty(int code);
    static Response json(const nlohmann::json& value);
};

}  // namespace mailcatch::http

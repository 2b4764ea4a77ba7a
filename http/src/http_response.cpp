#include "http_response.hpp"

namespace mailcatch::http {

std::string status::reason(int code) {
    switch (code) {
        case OK: return "OK";
        case BAD_REQUEST: return "Bad Request";
        case NOT_FOUND: return "Not Found";
        case INTERNAL_ERROR: return "Internal Server Error";
        default: return "Unknown";
    }
}

std::string Response::serialize() const {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + status::reason(status) + "\r\n";

    if (!body.empty() || !content_type.empty()) {
        out += "Content-Type: " + content_type + "\r\n";
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }

    out += "\r\n";
    out += body;
    return out;
}

Response Response::empty(int code) {
    Response response;
    response.status = code;
    return response;
}

Response Response::json(const nlohmann::json& value) {
    Response response;
    response.status = status::OK;
    response.content_type = "application/json";
    // Captured bodies are not guaranteed to be UTF-8
    response.body = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return response;
}

}  // namespace mailcatch::http

#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <unordered_map>

namespace mailcatch::http {

enum class Method {
    Get,
    Post,
    Put,
    Delete
};

using Params = std::unordered_map<std::string, std::string>;

struct Request {
    Method method = Method::Get;
    std::string path;       // raw, without the query string
    Params query;           // decoded; last value wins
    Params params;          // bound by the router

    std::optional<std::string> query_value(const std::string& key) const;
    std::optional<std::string> param(const std::string& name) const;
};

enum class ParseStatus {
    OK,
    MALFORMED,        // fewer than two tokens
    UNKNOWN_METHOD    // not GET, POST, PUT or DELETE
};

struct ParseResult {
    ParseStatus status = ParseStatus::MALFORMED;
    Request request;
};

// "METHOD path[?query] [version]"; the version token is ignored
ParseResult parse_request_line(std::string_view line);

std::optional<Method> parse_method(std::string_view token);
std::string method_to_string(Method method);

// application/x-www-form-urlencoded: '+' is a space, %XX is a byte, bad escapes stay literal
std::string url_decode(std::string_view encoded);
Params parse_query(std::string_view query);

}  // namespace mailcatch::http

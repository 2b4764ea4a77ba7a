#include "http_request.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace mailcatch::http {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

std::vector<std::string_view> split_whitespace(std::string_view line) {
    std::vector<std::string_view> tokens;
    size_t pos = 0;
    while (pos < line.size()) {
        auto start = line.find_first_not_of(" \t", pos);
        if (start == std::string_view::npos) break;
        auto end = line.find_first_of(" \t", start);
        if (end == std::string_view::npos) end = line.size();
        tokens.push_back(line.substr(start, end - start));
        pos = end;
    }
    return tokens;
}

std::optional<std::string> lookup(const Params& map, const std::string& key) {
    auto it = map.find(key);
    if (it != map.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string> Request::query_value(const std::string& key) const {
    return lookup(query, key);
}

std::optional<std::string> Request::param(const std::string& name) const {
    return lookup(params, name);
}

std::optional<Method> parse_method(std::string_view token) {
    std::string upper(token);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "GET") return Method::Get;
    if (upper == "POST") return Method::Post;
    if (upper == "PUT") return Method::Put;
    if (upper == "DELETE") return Method::Delete;
    return std::nullopt;
}

std::string method_to_string(Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
        case Method::Put: return "PUT";
        case Method::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

std::string url_decode(std::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());

    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c == '%' && i + 2 < encoded.size()) {
            int hi = hex_value(encoded[i + 1]);
            int lo = hex_value(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        decoded += (c == '+') ? ' ' : c;
    }

    return decoded;
}

Params parse_query(std::string_view query) {
    Params params;

    size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string_view::npos) amp = query.size();

        auto pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                params[url_decode(pair)] = "";
            } else {
                params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }

        pos = amp + 1;
    }

    return params;
}

ParseResult parse_request_line(std::string_view line) {
    ParseResult result;

    auto tokens = split_whitespace(line);
    if (tokens.size() < 2) {
        result.status = ParseStatus::MALFORMED;
        return result;
    }

    auto method = parse_method(tokens[0]);
    if (!method) {
        result.status = ParseStatus::UNKNOWN_METHOD;
        return result;
    }

    result.request.method = *method;

    auto target = tokens[1];
    auto question = target.find('?');
    if (question == std::string_view::npos) {
        result.request.path = std::string(target);
    } else {
        result.request.path = std::string(target.substr(0, question));
        result.request.query = parse_query(target.substr(question + 1));
    }

    result.status = ParseStatus::OK;
    return result;
}

}  // namespace mailcatch::http

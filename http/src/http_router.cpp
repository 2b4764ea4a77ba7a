#include "http_router.hpp"

namespace mailcatch::http {

namespace {

std::vector<std::string_view> split_segments(std::string_view path) {
    if (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }

    std::vector<std::string_view> segments;
    size_t pos = 0;
    while (true) {
        auto slash = path.find('/', pos);
        if (slash == std::string_view::npos) {
            segments.push_back(path.substr(pos));
            break;
        }
        segments.push_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return segments;
}

}  // namespace

void Router::add(Method method, std::string pattern, Handler handler) {
    routes_.push_back(Route{method, std::move(pattern), std::move(handler)});
}

std::optional<Router::Match> Router::match(Method method, std::string_view path) const {
    for (const auto& route : routes_) {
        if (route.method != method) {
            continue;
        }
        if (auto params = match_path(route.pattern, path)) {
            return Match{&route, std::move(*params)};
        }
    }
    return std::nullopt;
}

std::optional<Params> Router::match_path(std::string_view pattern, std::string_view path) {
    auto pattern_segments = split_segments(pattern);
    auto path_segments = split_segments(path);

    if (pattern_segments.size() != path_segments.size()) {
        return std::nullopt;
    }

    Params params;
    for (size_t i = 0; i < pattern_segments.size(); ++i) {
        auto expected = pattern_segments[i];
        auto actual = path_segments[i];

        if (!expected.empty() && expected.front() == ':') {
            params[std::string(expected.substr(1))] = std::string(actual);
        } else if (expected != actual) {
            return std::nullopt;
        }
    }

    return params;
}

}  // namespace mailcatch::http

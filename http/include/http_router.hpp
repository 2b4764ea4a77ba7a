#pragma once

#include "http_request.hpp"
#include "http_response.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mailcatch::http {

using Handler = std::function<Response(const Request&)>;

struct Route {
    Method method;
    std::string pattern;
    Handler handler;
};

// Routes are tried in registration order; the first match wins
class Router {
public:
    struct Match {
        const Route* route;
        Params params;
    };

    void add(Method method, std::string pattern, Handler handler);

    std::optional<Match> match(Method method, std::string_view path) const;

    // Segment-wise comparison after trimming one trailing '/' from each side.
    // A pattern segment ":name" binds the raw path segment under "name".
    static std::optional<Params> match_path(std::string_view pattern, std::string_view path);

    size_t size() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
};

}  // namespace mailcatch::http

#include "request_engine.hpp"
#include "storage/mail_store.hpp"
#include "logger.hpp"

namespace mailcatch::http {

RequestEngine::RequestEngine(const Router& router, const AccessGate& gate)
    : router_(router)
    , gate_(gate) {
}

std::optional<Response> RequestEngine::handle(std::string_view line) const {
    auto parsed = parse_request_line(line);

    switch (parsed.status) {
        case ParseStatus::MALFORMED:
            return Response::empty(status::BAD_REQUEST);
        case ParseStatus::UNKNOWN_METHOD:
            LOG_DEBUG("Unsupported method, closing");
            return std::nullopt;
        case ParseStatus::OK:
            break;
    }

    Request& request = parsed.request;

    if (!gate_.allows(request)) {
        LOG_DEBUG_FMT("Access denied for {} {}", method_to_string(request.method), request.path);
        return std::nullopt;
    }

    auto match = router_.match(request.method, request.path);
    if (!match) {
        return Response::empty(status::NOT_FOUND);
    }

    request.params = std::move(match->params);

    try {
        return match->route->handler(request);
    } catch (const StorageError& e) {
        LOG_ERROR_FMT("{} {} failed: {}", method_to_string(request.method), request.path, e.what());
        return Response::empty(status::INTERNAL_ERROR);
    }
}

}  // namespace mailcatch::http

#include "http_session.hpp"
#include "logger.hpp"

namespace mailcatch::http {

HTTPSession::HTTPSession(asio::io_context& io_context, tcp::socket socket,
                         std::shared_ptr<const RequestEngine> engine)
    : Session(io_context, std::move(socket))
    , engine_(std::move(engine)) {
    set_deliver_partial_line(true);
}

void HTTPSession::on_connect() {
    LOG_DEBUG_FMT("API connection from {}:{}", remote_address(), remote_port());
}

void HTTPSession::on_data(const std::string& data) {
    if (handled_) return;
    handled_ = true;

    // Headers and body are never read
    stop_reading();

    auto response = engine_->handle(data);
    if (response) {
        send_and_close(response->serialize());
    } else {
        stop();
    }
}

}  // namespace mailcatch::http

#include "http_server.hpp"
#include "logger.hpp"

namespace mailcatch::http {

HTTPServer::HTTPServer(const HTTPConfig& config, std::shared_ptr<MailStore> store)
    : config_(config)
    , store_(std::move(store))
    , gate_(config_.access_key)
    , handlers_(store_, config_.corrupt_records) {
    handlers_.register_routes(router_);
    engine_ = std::make_shared<RequestEngine>(router_, gate_);
}

HTTPServer::~HTTPServer() {
    stop();
}

void HTTPServer::start() {
    http_server_ = std::make_unique<Server<HTTPSession>>(
        "HTTP",
        config_.bind_address,
        config_.port,
        config_.thread_pool_size
    );

    http_server_->set_session_factory(
        [this](asio::io_context& io_ctx, tcp::socket socket) {
            return std::make_shared<HTTPSession>(io_ctx, std::move(socket), engine_);
        }
    );

    http_server_->set_max_connections(config_.max_connections);
    http_server_->set_connection_timeout(config_.connection_timeout);

    LOG_INFO_FMT("Starting HTTP API on {}:{}", config_.bind_address, config_.port);
    http_server_->start();
}

void HTTPServer::stop() {
    if (http_server_) {
        http_server_->stop();
        http_server_.reset();
        LOG_INFO("HTTP API stopped");
    }
}

bool HTTPServer::is_running() const {
    return http_server_ && http_server_->is_running();
}

uint16_t HTTPServer::port() const {
    return http_server_ ? http_server_->local_port() : 0;
}

}  // namespace mailcatch::http

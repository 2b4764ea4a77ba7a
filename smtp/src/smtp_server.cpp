#include "smtp_server.hpp"
#include "logger.hpp"

namespace mailcatch::smtp {

SMTPServer::SMTPServer(const SMTPConfig& config, std::shared_ptr<MailStore> store)
    : config_(config)
    , store_(std::move(store)) {
}

SMTPServer::~SMTPServer() {
    stop();
}

void SMTPServer::start() {
    smtp_server_ = std::make_unique<Server<SMTPSession>>(
        "SMTP",
        config_.bind_address,
        config_.port,
        config_.thread_pool_size
    );

    smtp_server_->set_session_factory(
        [this](asio::io_context& io_ctx, tcp::socket socket) {
            auto session = std::make_shared<SMTPSession>(
                io_ctx, std::move(socket), store_, config_.hostname
            );
            session->set_max_message_size(config_.max_message_size);
            session->set_max_recipients(config_.max_recipients);
            return session;
        }
    );

    smtp_server_->set_max_connections(config_.max_connections);
    smtp_server_->set_connection_timeout(config_.connection_timeout);

    LOG_INFO_FMT("Starting SMTP server on {}:{}", config_.bind_address, config_.port);
    smtp_server_->start();
}

void SMTPServer::stop() {
    if (smtp_server_) {
        smtp_server_->stop();
        smtp_server_.reset();
        LOG_INFO("SMTP server stopped");
    }
}

bool SMTPServer::is_running() const {
    return smtp_server_ && smtp_server_->is_running();
}

uint16_t SMTPServer::port() const {
    return smtp_server_ ? smtp_server_->local_port() : 0;
}

size_t SMTPServer::connection_count() const {
    return smtp_server_ ? smtp_server_->connection_count() : 0;
}

}  // namespace mailcatch::smtp

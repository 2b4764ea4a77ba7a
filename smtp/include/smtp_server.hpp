#pragma once

#include "net/server.hpp"
#include "config.hpp"
#include "storage/mail_store.hpp"
#include "smtp_session.hpp"
#include <memory>

namespace mailcatch::smtp {

class SMTPServer {
public:
    SMTPServer(const SMTPConfig& config, std::shared_ptr<MailStore> store);

    ~SMTPServer();

    void start();
    void stop();

    bool is_running() const;
    // Bound port once started; 0 before
    uint16_t port() const;
    size_t connection_count() const;

private:
    SMTPConfig config_;
    std::shared_ptr<MailStore> store_;

    std::unique_ptr<Server<SMTPSession>> smtp_server_;
};

}  // namespace mailcatch::smtp

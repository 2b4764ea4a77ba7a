#pragma once

#include "net/server.hpp"
#include "config.hpp"
#include "storage/mail_store.hpp"
#include "access_gate.hpp"
#include "http_router.hpp"
#include "mail_handlers.hpp"
#include "request_engine.hpp"
#include "http_session.hpp"
#include <memory>

namespace mailcatch::http {

class HTTPServer {
public:
    // Throws std::invalid_argument when the access key is empty
    HTTPServer(const HTTPConfig& config, std::shared_ptr<MailStore> store);

    ~HTTPServer();

    void start();
    void stop();

    bool is_running() const;
    // Bound port once started; 0 before
    uint16_t port() const;

private:
    HTTPConfig config_;
    std::shared_ptr<MailStore> store_;

    AccessGate gate_;
    MailHandlers handlers_;
    Router router_;
    std::shared_ptr<const RequestEngine> engine_;

    std::unique_ptr<Server<HTTPSession>> http_server_;
};

}  // namespace mailcatch::http

#pragma once

#include "net/session.hpp"
#include "request_engine.hpp"
#include <memory>

namespace mailcatch::http {

// One request line, at most one response, then close
class HTTPSession : public Session {
public:
    HTTPSession(asio::io_context& io_context, tcp::socket socket,
                std::shared_ptr<const RequestEngine> engine);

    ~HTTPSession() override = default;

protected:
    void on_connect() override;
    void on_data(const std::string& data) override;

private:
    std::shared_ptr<const RequestEngine> engine_;
    bool handled_ = false;
};

}  // namespace mailcatch::http

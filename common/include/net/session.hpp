#pragma once

#include <memory>
#include <string>
#include <deque>
#include <functional>
#include <chrono>
#include <utility>
#include <boost/asio.hpp>

namespace mailcatch {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// One accepted connection. Every handler of a session runs on its strand, so
// the read, write and timer paths never race each other.
class Session : public std::enable_shared_from_this<Session> {
public:
    static constexpr size_t MAX_LINE_LENGTH = 64 * 1024;

    Session(asio::io_context& io_context, tcp::socket socket);
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    virtual void start();
    virtual void stop();

    void send(const std::string& data);
    void send_line(const std::string& line);
    // Queues data and closes the connection once everything queued has been written
    void send_and_close(const std::string& data);

    std::string remote_address() const;
    uint16_t remote_port() const;
    bool is_stopped() const { return stopped_; }

    // Deadline for the next read or write; re-armed after each one completes
    void set_timeout(std::chrono::seconds timeout);
    void reset_timeout();

    void set_close_handler(std::function<void()> handler) { close_handler_ = std::move(handler); }

protected:
    virtual void on_connect();
    virtual void on_data(const std::string& data) = 0;
    virtual void on_line(const std::string& line);
    virtual void on_disconnect();
    virtual void on_error(const boost::system::error_code& ec);

    void do_read();
    void do_write();
    void stop_reading() { reading_ = false; }
    // Hand an unterminated last line to on_line when the peer ends its side
    void set_deliver_partial_line(bool enabled) { deliver_partial_line_ = enabled; }

    void close_socket();

    asio::io_context& io_context_;
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::socket socket_;

    asio::streambuf read_buffer_;
    std::deque<std::string> write_queue_;
    bool reading_ = true;
    bool closing_ = false;
    bool deliver_partial_line_ = false;

    asio::steady_timer timeout_timer_;
    std::chrono::seconds timeout_{300};

    bool stopped_ = false;

private:
    void handle_read(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void handle_write(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void handle_timeout(const boost::system::error_code& ec);
    void enqueue(std::string data, bool close_after);

    std::function<void()> close_handler_;
};

}  // namespace mailcatch

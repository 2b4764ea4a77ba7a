#include "net/session.hpp"
#include "logger.hpp"
#include <istream>

namespace mailcatch {

Session::Session(asio::io_context& io_context, tcp::socket socket)
    : io_context_(io_context)
    , strand_(asio::make_strand(io_context))
    , socket_(std::move(socket))
    , read_buffer_(MAX_LINE_LENGTH)
    , timeout_timer_(io_context) {
}

void Session::start() {
    auto self = shared_from_this();
    asio::dispatch(strand_, [this, self]() {
        on_connect();
        reset_timeout();
        do_read();
    });
}

void Session::stop() {
    if (stopped_) return;
    stopped_ = true;

    timeout_timer_.cancel();
    on_disconnect();
    close_socket();

    if (close_handler_) {
        auto handler = std::move(close_handler_);
        close_handler_ = nullptr;
        handler();
    }
}

void Session::close_socket() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

std::string Session::remote_address() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string();
}

uint16_t Session::remote_port() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return 0;
    }
    return endpoint.port();
}

void Session::set_timeout(std::chrono::seconds timeout) {
    timeout_ = timeout;
}

void Session::reset_timeout() {
    if (stopped_) return;

    timeout_timer_.expires_after(timeout_);
    auto self = shared_from_this();
    timeout_timer_.async_wait(asio::bind_executor(strand_,
        [this, self](const boost::system::error_code& ec) {
            handle_timeout(ec);
        }));
}

void Session::handle_timeout(const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted) {
        return;  // Timer was cancelled or re-armed
    }
    if (!stopped_) {
        LOG_DEBUG_FMT("Session timeout for {}:{}", remote_address(), remote_port());
        stop();
    }
}

void Session::send(const std::string& data) {
    enqueue(data, false);
}

void Session::send_line(const std::string& line) {
    send(line + "\r\n");
}

void Session::send_and_close(const std::string& data) {
    enqueue(data, true);
}

void Session::enqueue(std::string data, bool close_after) {
    auto self = shared_from_this();
    asio::dispatch(strand_, [this, self, data = std::move(data), close_after]() mutable {
        if (stopped_) return;

        bool was_empty = write_queue_.empty();
        if (!data.empty()) {
            write_queue_.push_back(std::move(data));
        }
        if (close_after) {
            closing_ = true;
        }

        if (was_empty) {
            if (write_queue_.empty()) {
                if (closing_) stop();
            } else {
                do_write();
            }
        }
    });
}

void Session::do_read() {
    if (stopped_ || !reading_) return;

    auto self = shared_from_this();
    asio::async_read_until(
        socket_,
        read_buffer_,
        '\n',
        asio::bind_executor(strand_,
            [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
                handle_read(ec, bytes_transferred);
            }));
}

void Session::handle_read(const boost::system::error_code& ec, std::size_t /* bytes_transferred */) {
    if (stopped_) return;

    if (!ec) {
        reset_timeout();

        std::istream is(&read_buffer_);
        std::string line;
        std::getline(is, line);

        // Remove trailing \r if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        on_line(line);

        do_read();
    } else if (ec == asio::error::eof && deliver_partial_line_ && read_buffer_.size() > 0) {
        auto data = read_buffer_.data();
        std::string line(asio::buffers_begin(data), asio::buffers_end(data));
        read_buffer_.consume(read_buffer_.size());

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        reading_ = false;
        on_line(line);

        // A queued response closes the connection once written
        if (!closing_) {
            stop();
        }
    } else {
        on_error(ec);
        stop();
    }
}

void Session::do_write() {
    if (stopped_ || write_queue_.empty()) return;

    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(write_queue_.front()),
        asio::bind_executor(strand_,
            [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
                handle_write(ec, bytes_transferred);
            }));
}

void Session::handle_write(const boost::system::error_code& ec, std::size_t /* bytes_transferred */) {
    if (stopped_) return;

    if (!ec) {
        write_queue_.pop_front();
        if (!write_queue_.empty()) {
            do_write();
        } else if (closing_) {
            stop();
        } else {
            reset_timeout();
        }
    } else {
        on_error(ec);
        stop();
    }
}

void Session::on_connect() {
    LOG_DEBUG_FMT("New connection from {}:{}", remote_address(), remote_port());
}

void Session::on_line(const std::string& line) {
    on_data(line);
}

void Session::on_disconnect() {
    LOG_DEBUG_FMT("Connection closed from {}:{}", remote_address(), remote_port());
}

void Session::on_error(const boost::system::error_code& ec) {
    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::error::operation_aborted) {
        return;  // Normal disconnection
    }
    if (ec == asio::error::not_found) {
        LOG_WARNING_FMT("Line from {} exceeds {} bytes, closing", remote_address(), MAX_LINE_LENGTH);
        return;
    }
    LOG_ERROR_FMT("Session error: {}", ec.message());
}

}  // namespace mailcatch

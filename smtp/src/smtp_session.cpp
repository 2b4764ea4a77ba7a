#include "smtp_session.hpp"
#include "smtp_message.hpp"
#include "logger.hpp"

namespace mailcatch::smtp {

SMTPSession::SMTPSession(asio::io_context& io_context, tcp::socket socket,
                         std::shared_ptr<MailStore> store,
                         const std::string& hostname)
    : Session(io_context, std::move(socket))
    , store_(std::move(store))
    , hostname_(hostname) {
}

void SMTPSession::on_connect() {
    Session::on_connect();
    LOG_INFO_FMT("SMTP connection from {}:{}", remote_address(), remote_port());

    // Send greeting
    send_line(reply::make(reply::SERVICE_READY, hostname_ + " ESMTP mailcatch ready"));
}

void SMTPSession::on_data(const std::string& data) {
    if (state_ == SessionState::DATA) {
        std::string response = process_data_line(data);
        if (!response.empty()) {
            send_line(response);
        }
    } else {
        process_command(data);
    }
}

void SMTPSession::process_command(const std::string& line) {
    LOG_DEBUG_FMT("SMTP command: {}", line);

    Command cmd = Command::parse(line);

    if (cmd.type == CommandType::UNKNOWN) {
        send_line(reply::make(reply::SYNTAX_ERROR, "Unrecognized command"));
        return;
    }

    std::string response = CommandHandler::instance().execute(*this, cmd);

    if (cmd.type == CommandType::QUIT) {
        stop_reading();
        send_and_close(response + "\r\n");
        return;
    }

    if (!response.empty()) {
        send_line(response);
    }
}

void SMTPSession::begin_data() {
    data_lines_.clear();
    data_size_ = 0;
    data_overflow_ = false;
    state_ = SessionState::DATA;
}

std::string SMTPSession::process_data_line(const std::string& line) {
    // Check for end of data
    if (line == ".") {
        return finish_data();
    }

    // Once over the limit the rest of the data is read and dropped
    if (data_overflow_) {
        return "";
    }

    // Handle byte-stuffing (lines starting with . have extra . prepended)
    std::string content_line = line;
    if (!content_line.empty() && content_line[0] == '.') {
        content_line.erase(0, 1);
    }

    // Check message size
    data_size_ += content_line.size() + 2;
    if (data_size_ > max_message_size_) {
        LOG_WARNING_FMT("Message from {} exceeds {} bytes, discarding", remote_address(), max_message_size_);
        data_overflow_ = true;
        data_lines_.clear();
        data_lines_.shrink_to_fit();
        return "";
    }

    data_lines_.push_back(std::move(content_line));
    return "";
}

std::string SMTPSession::finish_data() {
    std::string response;

    if (data_overflow_) {
        response = reply::make(reply::EXCEEDED_STORAGE, "Message size exceeds fixed maximum");
    } else if (auto id = store_message()) {
        response = reply::make(reply::OK, "OK: queued as " + *id);
    } else {
        response = reply::make(reply::LOCAL_ERROR, "Requested action aborted: local error in processing");
    }

    envelope_.clear();
    data_lines_.clear();
    data_size_ = 0;
    data_overflow_ = false;
    state_ = SessionState::GREETED;

    return response;
}

std::optional<std::string> SMTPSession::store_message() {
    if (envelope_.rcpt_to.empty()) {
        return std::nullopt;
    }

    auto content = parse_message(data_lines_);

    Mail mail;
    mail.received_at = Mail::now();
    mail.id = Mail::generate_id(mail.received_at);
    mail.from = envelope_.mail_from;
    mail.to = envelope_.rcpt_to;
    mail.subject = std::move(content.subject);
    mail.body = std::move(content.body);

    try {
        store_->put(mail.id, mail);
    } catch (const StorageError& e) {
        LOG_ERROR_FMT("Failed to store message from {}: {}", mail.from, e.what());
        return std::nullopt;
    }

    LOG_INFO_FMT("Captured message {} from <{}> to {} recipient(s)", mail.id, mail.from, mail.to.size());
    return mail.id;
}

}  // namespace mailcatch::smtp

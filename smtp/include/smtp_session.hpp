#pragma once

#include "net/session.hpp"
#include "storage/mail_store.hpp"
#include "smtp_commands.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace mailcatch::smtp {

enum class SessionState {
    CONNECTED,      // Initial state
    GREETED,        // After HELO/EHLO
    MAIL,           // After MAIL FROM
    RCPT,           // After at least one RCPT TO
    DATA,           // During DATA reception
    QUIT            // After QUIT
};

struct Envelope {
    std::string mail_from;
    std::vector<std::string> rcpt_to;

    void clear() {
        mail_from.clear();
        rcpt_to.clear();
    }
};

class SMTPSession : public Session {
public:
    SMTPSession(asio::io_context& io_context, tcp::socket socket,
                std::shared_ptr<MailStore> store,
                const std::string& hostname);

    ~SMTPSession() override = default;

    // State
    SessionState state() const { return state_; }
    void set_state(SessionState state) { state_ = state; }

    // Envelope access
    Envelope& envelope() { return envelope_; }
    const Envelope& envelope() const { return envelope_; }

    // Client identification
    const std::string& client_hostname() const { return client_hostname_; }
    void set_client_hostname(const std::string& hostname) { client_hostname_ = hostname; }

    // Switches to the data phase with an empty buffer
    void begin_data();

    // Assembles the envelope and buffered data into a Mail and stores it.
    // Returns the new id, or nullopt when the store failed.
    std::optional<std::string> store_message();

    // Configuration
    const std::string& hostname() const { return hostname_; }
    size_t max_message_size() const { return max_message_size_; }
    void set_max_message_size(size_t size) { max_message_size_ = size; }
    size_t max_recipients() const { return max_recipients_; }
    void set_max_recipients(size_t max) { max_recipients_ = max; }

    // Consumes one line of the data phase. Returns the reply once the
    // terminating "." arrives, an empty string before that.
    std::string process_data_line(const std::string& line);

protected:
    void on_connect() override;
    void on_data(const std::string& data) override;

private:
    void process_command(const std::string& line);
    std::string finish_data();

    SessionState state_ = SessionState::CONNECTED;
    Envelope envelope_;
    std::string client_hostname_;

    std::shared_ptr<MailStore> store_;
    std::string hostname_;

    size_t max_message_size_ = 25 * 1024 * 1024;  // 25 MB
    size_t max_recipients_ = 100;

    std::vector<std::string> data_lines_;
    size_t data_size_ = 0;
    bool data_overflow_ = false;
};

}  // namespace mailcatch::smtp

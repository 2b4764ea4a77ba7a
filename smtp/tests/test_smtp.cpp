#include <catch2/catch_test_macros.hpp>
#include "smtp_commands.hpp"
#include "smtp_message.hpp"
#include "smtp_session.hpp"
#include <filesystem>

using namespace mailcatch;
using namespace mailcatch::smtp;

namespace {

class TempDirectory {
public:
    TempDirectory() {
        path_ = std::filesystem::temp_directory_path() / "mailcatch_smtp_test" /
                std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// A session over an unconnected socket; commands are driven through the handler table
struct SessionFixture {
    asio::io_context io;
    TempDirectory temp;
    std::shared_ptr<MailStore> store;
    std::shared_ptr<SMTPSession> session;

    explicit SessionFixture(bool open_store = true) {
        store = std::make_shared<MailStore>(temp.path() / "mails.db");
        if (open_store) {
            REQUIRE(store->initialize());
        }
        session = std::make_shared<SMTPSession>(io, tcp::socket(io), store, "mx.test");
    }

    std::string run(const std::string& line) {
        return CommandHandler::instance().execute(*session, Command::parse(line));
    }

    std::string send_data(const std::vector<std::string>& lines) {
        std::string last;
        for (const auto& line : lines) {
            last = session->process_data_line(line);
        }
        return last;
    }

    void open_transaction() {
        REQUIRE(run("EHLO client.test").rfind("250", 0) == 0);
        REQUIRE(run("MAIL FROM:<a@x>") == "250 OK");
        REQUIRE(run("RCPT TO:<b@y>") == "250 OK");
        REQUIRE(run("DATA").rfind("354", 0) == 0);
    }
};

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

}  // namespace

TEST_CASE("SMTP command parsing", "[smtp][commands]") {
    SECTION("Parse HELO command") {
        auto cmd = Command::parse("HELO client.example.com");
        REQUIRE(cmd.type == CommandType::HELO);
        REQUIRE(cmd.argument == "client.example.com");
    }

    SECTION("Parse MAIL FROM command") {
        auto cmd = Command::parse("MAIL FROM:<sender@example.com>");
        REQUIRE(cmd.type == CommandType::MAIL);
        REQUIRE(cmd.name == "MAIL FROM:");
        REQUIRE(cmd.argument == "<sender@example.com>");
    }

    SECTION("Qualifier is case-insensitive and may be followed by a space") {
        auto cmd = Command::parse("mail from: <sender@example.com> SIZE=100");
        REQUIRE(cmd.type == CommandType::MAIL);
        REQUIRE(cmd.name == "MAIL FROM:");
        REQUIRE(cmd.argument == "<sender@example.com> SIZE=100");
    }

    SECTION("Parse RCPT TO command") {
        auto cmd = Command::parse("RCPT TO:<recipient@example.com>");
        REQUIRE(cmd.type == CommandType::RCPT);
        REQUIRE(cmd.argument == "<recipient@example.com>");
    }

    SECTION("MAIL without qualifier keeps its argument") {
        auto cmd = Command::parse("MAIL <sender@example.com>");
        REQUIRE(cmd.type == CommandType::MAIL);
        REQUIRE(cmd.name == "MAIL");
    }

    SECTION("Recognized but unsupported verbs") {
        REQUIRE(Command::parse("AUTH PLAIN").type == CommandType::AUTH);
        REQUIRE(Command::parse("STARTTLS").type == CommandType::STARTTLS);
        REQUIRE(Command::parse("EXPN staff").type == CommandType::EXPN);
    }

    SECTION("Parse unknown command") {
        REQUIRE(Command::parse("INVALID").type == CommandType::UNKNOWN);
        REQUIRE(Command::parse("").type == CommandType::UNKNOWN);
    }

    SECTION("Case insensitive parsing") {
        REQUIRE(Command::parse("helo client.example.com").type == CommandType::HELO);
        REQUIRE(Command::parse("Quit").type == CommandType::QUIT);
    }

    SECTION("Bytes outside ASCII never match a verb") {
        REQUIRE(Command::parse("\xC8LO client.example.com").type == CommandType::UNKNOWN);
        REQUIRE(Command::parse("QU\xC9T").type == CommandType::UNKNOWN);
        REQUIRE(Command::parse("\xFF\xFE\x80").type == CommandType::UNKNOWN);
    }
}

TEST_CASE("Email address parsing", "[smtp][email]") {
    SECTION("Simple email address") {
        auto addr = EmailAddress::parse("user@example.com");
        REQUIRE(addr.has_value());
        REQUIRE(addr->local_part == "user");
        REQUIRE(addr->domain == "example.com");
        REQUIRE(addr->full_address == "user@example.com");
    }

    SECTION("Email in angle brackets with parameters") {
        auto addr = EmailAddress::parse("<user@example.com> BODY=8BITMIME");
        REQUIRE(addr.has_value());
        REQUIRE(addr->full_address == "user@example.com");
    }

    SECTION("Null sender") {
        auto addr = EmailAddress::parse("<>");
        REQUIRE(addr.has_value());
        REQUIRE(addr->is_null());
    }

    SECTION("Invalid addresses") {
        REQUIRE_FALSE(EmailAddress::parse("userexample.com").has_value());
        REQUIRE_FALSE(EmailAddress::parse("@example.com").has_value());
        REQUIRE_FALSE(EmailAddress::parse("user@").has_value());
        REQUIRE_FALSE(EmailAddress::parse("<user@example.com").has_value());
        REQUIRE_FALSE(EmailAddress::parse("").has_value());
    }
}

TEST_CASE("SMTP reply codes", "[smtp][reply]") {
    SECTION("Make simple reply") {
        REQUIRE(reply::make(250, "OK") == "250 OK");
    }

    SECTION("Make multi-line reply") {
        std::vector<std::string> lines = {"Hello", "PIPELINING", "SIZE 10240000"};
        REQUIRE(reply::make_multi(250, lines) == "250-Hello\r\n250-PIPELINING\r\n250 SIZE 10240000");
    }
}

TEST_CASE("Command type conversion", "[smtp][commands]") {
    REQUIRE(Command::type_to_string(CommandType::HELO) == "HELO");
    REQUIRE(Command::type_to_string(CommandType::VRFY) == "VRFY");
    REQUIRE(Command::type_to_string(CommandType::UNKNOWN) == "UNKNOWN");

    REQUIRE(Command::string_to_type("MAIL FROM:") == CommandType::MAIL);
    REQUIRE(Command::string_to_type("RCPT TO:") == CommandType::RCPT);
    REQUIRE(Command::string_to_type("INVALID") == CommandType::UNKNOWN);
}

TEST_CASE("Message content parsing", "[smtp][message]") {
    SECTION("Subject and body are split at the blank line") {
        auto content = parse_message({"From: a@x", "Subject:  Greetings ", "", "line one", "line two"});
        REQUIRE(content.subject == "Greetings");
        REQUIRE(content.body == "line one\r\nline two");
    }

    SECTION("Folded subject is unfolded") {
        auto content = parse_message({"Subject: first", "\tsecond", "X-Other: y", "", "body"});
        REQUIRE(content.subject == "first second");
        REQUIRE(content.body == "body");
    }

    SECTION("Header name match is case-insensitive and the first one wins") {
        auto content = parse_message({"SUBJECT: one", "subject: two", "", ""});
        REQUIRE(content.subject == "one");
        REQUIRE(content.body.empty());
    }

    SECTION("Data without a header block is all body") {
        auto content = parse_message({"hello"});
        REQUIRE(content.subject.empty());
        REQUIRE(content.body == "hello");
    }

    SECTION("Header-looking data without a blank line is all body") {
        auto content = parse_message({"Subject: hi", "text"});
        REQUIRE(content.subject.empty());
        REQUIRE(content.body == "Subject: hi\r\ntext");
    }

    SECTION("Empty data") {
        auto content = parse_message({});
        REQUIRE(content.subject.empty());
        REQUIRE(content.body.empty());
    }

    SECTION("Header field detection") {
        REQUIRE(is_header_field("Subject: x"));
        REQUIRE(is_header_field("X-Empty:"));
        REQUIRE_FALSE(is_header_field("no colon here"));
        REQUIRE_FALSE(is_header_field(": value"));
        REQUIRE_FALSE(is_header_field("Two words: value"));
    }
}

TEST_CASE("SMTP command sequencing", "[smtp][session]") {
    SessionFixture f;

    SECTION("MAIL before greeting is out of sequence") {
        REQUIRE(starts_with(f.run("MAIL FROM:<a@x>"), "503"));
        REQUIRE(f.session->state() == SessionState::CONNECTED);
    }

    SECTION("HELO requires an argument") {
        REQUIRE(starts_with(f.run("HELO"), "501"));
        REQUIRE(f.run("HELO client.test") == "250 mx.test Hello client.test");
        REQUIRE(f.session->state() == SessionState::GREETED);
    }

    SECTION("EHLO advertises extensions") {
        f.session->set_max_message_size(1000);
        auto reply_str = f.run("EHLO client.test");
        REQUIRE(reply_str.find("250-SIZE 1000") != std::string::npos);
        REQUIRE(reply_str.find("250-8BITMIME") != std::string::npos);
        REQUIRE(reply_str.find("250-PIPELINING") != std::string::npos);
        REQUIRE(reply_str.find("250 HELP") != std::string::npos);
    }

    SECTION("RCPT before MAIL is out of sequence") {
        f.run("EHLO client.test");
        REQUIRE(starts_with(f.run("RCPT TO:<b@y>"), "503"));
    }

    SECTION("DATA without recipients is out of sequence") {
        f.run("EHLO client.test");
        REQUIRE(starts_with(f.run("DATA"), "503"));
        f.run("MAIL FROM:<a@x>");
        REQUIRE(starts_with(f.run("DATA"), "503"));
    }

    SECTION("Malformed addresses are rejected") {
        f.run("EHLO client.test");
        REQUIRE(starts_with(f.run("MAIL FROM:nobody"), "501"));
        REQUIRE(starts_with(f.run("MAIL <a@x>"), "501"));
        REQUIRE(f.run("MAIL FROM:<>") == "250 OK");
        REQUIRE(starts_with(f.run("RCPT TO:<>"), "501"));
        REQUIRE(starts_with(f.run("RCPT TO:<local>"), "501"));
    }

    SECTION("Recipient limit") {
        f.session->set_max_recipients(2);
        f.run("EHLO client.test");
        f.run("MAIL FROM:<a@x>");
        REQUIRE(f.run("RCPT TO:<b1@y>") == "250 OK");
        REQUIRE(f.run("RCPT TO:<b2@y>") == "250 OK");
        REQUIRE(starts_with(f.run("RCPT TO:<b3@y>"), "452"));
        REQUIRE(f.session->envelope().rcpt_to.size() == 2);
    }

    SECTION("RSET clears the envelope") {
        f.run("EHLO client.test");
        f.run("MAIL FROM:<a@x>");
        f.run("RCPT TO:<b@y>");
        REQUIRE(f.run("RSET") == "250 OK");
        REQUIRE(f.session->state() == SessionState::GREETED);
        REQUIRE(f.session->envelope().mail_from.empty());
        REQUIRE(f.session->envelope().rcpt_to.empty());
    }

    SECTION("RSET before greeting stays connected") {
        REQUIRE(f.run("RSET") == "250 OK");
        REQUIRE(f.session->state() == SessionState::CONNECTED);
    }

    SECTION("Informational commands") {
        REQUIRE(f.run("NOOP") == "250 OK");
        REQUIRE(starts_with(f.run("VRFY someone"), "252"));
        REQUIRE(starts_with(f.run("VRFY"), "501"));
        REQUIRE(starts_with(f.run("HELP"), "214"));
    }

    SECTION("Unsupported extensions answer 502") {
        REQUIRE(starts_with(f.run("AUTH PLAIN"), "502"));
        REQUIRE(starts_with(f.run("STARTTLS"), "502"));
    }

    SECTION("QUIT") {
        REQUIRE(f.run("QUIT") == "221 mx.test closing connection");
        REQUIRE(f.session->state() == SessionState::QUIT);
    }
}

TEST_CASE("SMTP data phase", "[smtp][session]") {
    SessionFixture f;
    f.open_transaction();
    REQUIRE(f.session->state() == SessionState::DATA);

    SECTION("Message is stored with unstuffed lines") {
        auto reply_str = f.send_data({"Subject: Hi", "", "..leading dot", "plain", "."});
        REQUIRE(starts_with(reply_str, "250 OK: queued as "));
        REQUIRE(f.session->state() == SessionState::GREETED);

        auto id = reply_str.substr(std::string("250 OK: queued as ").size());
        auto mail = f.store->get(id);
        REQUIRE(mail.has_value());
        REQUIRE(mail->from == "a@x");
        REQUIRE(mail->to == std::vector<std::string>{"b@y"});
        REQUIRE(mail->subject == "Hi");
        REQUIRE(mail->body == ".leading dot\r\nplain");
    }

    SECTION("Lines before the terminator produce no reply") {
        REQUIRE(f.session->process_data_line("hello").empty());
        REQUIRE(f.store->count() == 0);
    }

    SECTION("A second transaction follows the first") {
        f.send_data({"first", "."});
        REQUIRE(f.run("MAIL FROM:<c@x>") == "250 OK");
        REQUIRE(f.run("RCPT TO:<d@y>") == "250 OK");
        f.run("DATA");
        REQUIRE(starts_with(f.send_data({"second", "."}), "250"));
        REQUIRE(f.store->count() == 2);
    }

    SECTION("Oversized message is consumed and rejected") {
        f.session->set_max_message_size(10);
        REQUIRE(f.session->process_data_line("0123456789abcdef").empty());
        REQUIRE(f.session->state() == SessionState::DATA);
        REQUIRE(f.session->process_data_line("QUIT").empty());
        REQUIRE(starts_with(f.session->process_data_line("."), "552"));
        REQUIRE(f.session->state() == SessionState::GREETED);
        REQUIRE(f.store->count() == 0);
    }
}

TEST_CASE("SMTP storage failure answers 451", "[smtp][session]") {
    SessionFixture f(false);
    f.open_transaction();

    REQUIRE(starts_with(f.send_data({"body", "."}), "451"));
    REQUIRE(f.session->state() == SessionState::GREETED);
    REQUIRE(f.session->envelope().rcpt_to.empty());
}

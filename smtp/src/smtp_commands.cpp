#include "smtp_commands.hpp"
#include "smtp_session.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>

namespace mailcatch::smtp {

namespace {

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

}  // namespace

Command Command::parse(const std::string& line) {
    Command cmd;

    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return cmd;
    }

    size_t sep = trimmed.find_first_of(" \t");
    std::string name = to_upper(trimmed.substr(0, sep));
    std::string rest = sep == std::string::npos ? "" : trim(trimmed.substr(sep));

    // "MAIL FROM:<a@b>" and "RCPT TO:<a@b>" carry a qualifier before the path
    auto strip_qualifier = [&](const std::string& qualifier) {
        if (rest.size() >= qualifier.size() &&
            to_upper(rest.substr(0, qualifier.size())) == qualifier) {
            name += " " + qualifier;
            rest = trim(rest.substr(qualifier.size()));
        }
    };

    if (name == "MAIL") {
        strip_qualifier("FROM:");
    } else if (name == "RCPT") {
        strip_qualifier("TO:");
    }

    cmd.name = name;
    cmd.type = string_to_type(name);
    cmd.argument = rest;
    return cmd;
}

CommandType Command::string_to_type(const std::string& name) {
    static const std::unordered_map<std::string, CommandType> mapping = {
        {"HELO", CommandType::HELO},
        {"EHLO", CommandType::EHLO},
        {"MAIL FROM:", CommandType::MAIL},
        {"MAIL", CommandType::MAIL},
        {"RCPT TO:", CommandType::RCPT},
        {"RCPT", CommandType::RCPT},
        {"DATA", CommandType::DATA},
        {"RSET", CommandType::RSET},
        {"NOOP", CommandType::NOOP},
        {"QUIT", CommandType::QUIT},
        {"VRFY", CommandType::VRFY},
        {"HELP", CommandType::HELP},
        {"AUTH", CommandType::AUTH},
        {"STARTTLS", CommandType::STARTTLS},
        {"EXPN", CommandType::EXPN}
    };

    auto it = mapping.find(name);
    return it != mapping.end() ? it->second : CommandType::UNKNOWN;
}

std::string Command::type_to_string(CommandType type) {
    switch (type) {
        case CommandType::HELO: return "HELO";
        case CommandType::EHLO: return "EHLO";
        case CommandType::MAIL: return "MAIL";
        case CommandType::RCPT: return "RCPT";
        case CommandType::DATA: return "DATA";
        case CommandType::RSET: return "RSET";
        case CommandType::NOOP: return "NOOP";
        case CommandType::QUIT: return "QUIT";
        case CommandType::VRFY: return "VRFY";
        case CommandType::HELP: return "HELP";
        case CommandType::AUTH: return "AUTH";
        case CommandType::STARTTLS: return "STARTTLS";
        case CommandType::EXPN: return "EXPN";
        default: return "UNKNOWN";
    }
}

std::optional<EmailAddress> EmailAddress::parse(const std::string& str) {
    std::string email = trim(str);

    // Extract the path from angle brackets if present, otherwise up to the first parameter
    auto start = email.find('<');
    if (start != std::string::npos) {
        auto end = email.find('>', start);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        email = trim(email.substr(start + 1, end - start - 1));
    } else {
        email = email.substr(0, email.find_first_of(" \t"));
    }

    if (email.empty()) {
        // Null reverse-path <>
        if (start != std::string::npos) {
            return EmailAddress{"", "", ""};
        }
        return std::nullopt;
    }

    auto at = email.rfind('@');
    if (at == std::string::npos || at == 0 || at == email.length() - 1) {
        return std::nullopt;
    }

    EmailAddress addr;
    addr.local_part = email.substr(0, at);
    addr.domain = email.substr(at + 1);
    addr.full_address = email;

    return addr;
}

CommandHandler& CommandHandler::instance() {
    static CommandHandler instance;
    return instance;
}

CommandHandler::CommandHandler() {
    handlers_[CommandType::HELO] = handle_helo;
    handlers_[CommandType::EHLO] = handle_ehlo;
    handlers_[CommandType::MAIL] = handle_mail;
    handlers_[CommandType::RCPT] = handle_rcpt;
    handlers_[CommandType::DATA] = handle_data;
    handlers_[CommandType::RSET] = handle_rset;
    handlers_[CommandType::NOOP] = handle_noop;
    handlers_[CommandType::QUIT] = handle_quit;
    handlers_[CommandType::VRFY] = handle_vrfy;
    handlers_[CommandType::HELP] = handle_help;
}

void CommandHandler::register_handler(CommandType type, Handler handler) {
    handlers_[type] = std::move(handler);
}

std::string CommandHandler::execute(SMTPSession& session, const Command& cmd) {
    auto it = handlers_.find(cmd.type);
    if (it != handlers_.end()) {
        return it->second(session, cmd);
    }
    return reply::make(reply::COMMAND_NOT_IMPLEMENTED, "Command not implemented");
}

std::string CommandHandler::handle_helo(SMTPSession& session, const Command& cmd) {
    if (cmd.argument.empty()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Hostname required");
    }

    session.set_client_hostname(cmd.argument);
    session.set_state(SessionState::GREETED);
    session.envelope().clear();

    return reply::make(reply::OK, session.hostname() + " Hello " + cmd.argument);
}

std::string CommandHandler::handle_ehlo(SMTPSession& session, const Command& cmd) {
    if (cmd.argument.empty()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Hostname required");
    }

    session.set_client_hostname(cmd.argument);
    session.set_state(SessionState::GREETED);
    session.envelope().clear();

    std::vector<std::string> capabilities;
    capabilities.push_back(session.hostname() + " Hello " + cmd.argument);
    capabilities.push_back("SIZE " + std::to_string(session.max_message_size()));
    capabilities.push_back("8BITMIME");
    capabilities.push_back("PIPELINING");
    capabilities.push_back("HELP");

    return reply::make_multi(reply::OK, capabilities);
}

std::string CommandHandler::handle_mail(SMTPSession& session, const Command& cmd) {
    if (session.state() != SessionState::GREETED &&
        session.state() != SessionState::MAIL &&
        session.state() != SessionState::RCPT) {
        return reply::make(reply::BAD_SEQUENCE, "Send HELO/EHLO first");
    }

    if (cmd.name != "MAIL FROM:") {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Syntax: MAIL FROM:<address>");
    }

    auto addr = EmailAddress::parse(cmd.argument);
    if (!addr) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Invalid sender address");
    }

    session.envelope().clear();
    session.envelope().mail_from = addr->full_address;
    session.set_state(SessionState::MAIL);

    return reply::make(reply::OK, "OK");
}

std::string CommandHandler::handle_rcpt(SMTPSession& session, const Command& cmd) {
    if (session.state() != SessionState::MAIL && session.state() != SessionState::RCPT) {
        return reply::make(reply::BAD_SEQUENCE, "Send MAIL FROM first");
    }

    if (cmd.name != "RCPT TO:") {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Syntax: RCPT TO:<address>");
    }

    if (session.envelope().rcpt_to.size() >= session.max_recipients()) {
        return reply::make(reply::INSUFFICIENT_STORAGE, "Too many recipients");
    }

    auto addr = EmailAddress::parse(cmd.argument);
    if (!addr || addr->is_null()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Invalid recipient address");
    }

    // Every recipient is captured; there is no relay or local-user check
    session.envelope().rcpt_to.push_back(addr->full_address);
    session.set_state(SessionState::RCPT);

    return reply::make(reply::OK, "OK");
}

std::string CommandHandler::handle_data(SMTPSession& session, const Command& /* cmd */) {
    if (session.state() != SessionState::RCPT || session.envelope().rcpt_to.empty()) {
        return reply::make(reply::BAD_SEQUENCE, "Send RCPT TO first");
    }

    session.begin_data();
    return reply::make(reply::START_MAIL_INPUT, "Start mail input; end with <CRLF>.<CRLF>");
}

std::string CommandHandler::handle_rset(SMTPSession& session, const Command& /* cmd */) {
    session.envelope().clear();
    if (session.state() != SessionState::CONNECTED) {
        session.set_state(SessionState::GREETED);
    }

    return reply::make(reply::OK, "OK");
}

std::string CommandHandler::handle_noop(SMTPSession& /* session */, const Command& /* cmd */) {
    return reply::make(reply::OK, "OK");
}

std::string CommandHandler::handle_quit(SMTPSession& session, const Command& /* cmd */) {
    session.set_state(SessionState::QUIT);
    return reply::make(reply::SERVICE_CLOSING, session.hostname() + " closing connection");
}

std::string CommandHandler::handle_vrfy(SMTPSession& /* session */, const Command& cmd) {
    if (cmd.argument.empty()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Address required");
    }

    return reply::make(reply::CANNOT_VRFY, "Cannot VRFY user, but will accept message");
}

std::string CommandHandler::handle_help(SMTPSession& session, const Command& /* cmd */) {
    std::vector<std::string> help;
    help.push_back(session.hostname() + " supports:");
    help.push_back("HELO EHLO MAIL RCPT DATA RSET NOOP QUIT VRFY HELP");

    return reply::make_multi(reply::HELP, help);
}

}  // namespace mailcatch::smtp

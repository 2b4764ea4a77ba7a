#include "smtp_message.hpp"
#include <algorithm>
#include <cctype>
#include <optional>

namespace mailcatch::smtp {

namespace {

std::string trim(const std::string& value) {
    auto start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

bool is_continuation(const std::string& line) {
    return !line.empty() && (line[0] == ' ' || line[0] == '\t');
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string join_crlf(std::vector<std::string>::const_iterator begin,
                      std::vector<std::string>::const_iterator end) {
    std::string result;
    for (auto it = begin; it != end; ++it) {
        if (it != begin) {
            result += "\r\n";
        }
        result += *it;
    }
    return result;
}

}  // namespace

bool is_header_field(const std::string& line) {
    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    // RFC 5322 field names are printable US-ASCII except ':' and space
    return std::all_of(line.begin(), line.begin() + static_cast<std::ptrdiff_t>(colon), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc > 32 && uc < 127;
    });
}

MessageContent parse_message(const std::vector<std::string>& lines) {
    MessageContent content;

    if (lines.empty() || !is_header_field(lines.front())) {
        content.body = join_crlf(lines.begin(), lines.end());
        return content;
    }

    // Find the blank line closing the header block
    auto separator = lines.end();
    for (auto it = lines.begin(); it != lines.end(); ++it) {
        if (it->empty()) {
            separator = it;
            break;
        }
        if (!is_header_field(*it) && !is_continuation(*it)) {
            break;
        }
    }

    if (separator == lines.end()) {
        content.body = join_crlf(lines.begin(), lines.end());
        return content;
    }

    std::optional<std::string> subject;
    bool in_subject = false;
    for (auto it = lines.begin(); it != separator; ++it) {
        if (is_continuation(*it)) {
            if (in_subject) {
                *subject += " " + trim(*it);
            }
            continue;
        }

        in_subject = false;
        auto colon = it->find(':');
        if (!subject && iequals(it->substr(0, colon), "Subject")) {
            subject = trim(it->substr(colon + 1));
            in_subject = true;
        }
    }

    content.subject = subject ? trim(*subject) : "";
    content.body = join_crlf(separator + 1, lines.end());
    return content;
}

}  // namespace mailcatch::smtp

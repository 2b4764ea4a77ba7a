#pragma once

#include <string>
#include <vector>

namespace mailcatch::smtp {

struct MessageContent {
    std::string subject;
    std::string body;
};

// Splits the unstuffed DATA lines into the Subject header and the body.
// A header block is recognized only when the first line is a header field and
// the block is closed by an empty line; otherwise all lines are body. Body
// lines are joined with CRLF, without a trailing line break.
MessageContent parse_message(const std::vector<std::string>& lines);

// "Name: value" with a printable, non-empty field name
bool is_header_field(const std::string& line);

}  // namespace mailcatch::smtp

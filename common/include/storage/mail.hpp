#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>

namespace mailcatch {

// A captured message. Written once by ingestion and never modified afterwards.
struct Mail {
    std::string id;
    std::string from;
    std::vector<std::string> to;
    std::string subject;
    std::string body;
    std::chrono::system_clock::time_point received_at;

    bool operator==(const Mail& other) const = default;

    // Binary encoding used for the stored value:
    //   u8 version (1)
    //   str id, str from, u32 n, n x str to, str subject, str body
    //   i64 received_at (microseconds since epoch)
    // where str is a u32 length followed by the bytes; integers are big-endian.
    std::string serialize() const;
    static std::optional<Mail> deserialize(std::string_view data);

    // Time-ordered id: 16 hex digits of microseconds since epoch, '-', 8 random hex digits
    static std::string generate_id(std::chrono::system_clock::time_point at);

    // Current time at the precision the encoding keeps
    static std::chrono::system_clock::time_point now();
};

}  // namespace mailcatch

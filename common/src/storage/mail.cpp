#include "storage/mail.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <cstdint>
#include <openssl/rand.h>

namespace mailcatch {

namespace {

constexpr uint8_t ENCODING_VERSION = 1;

void put_u32(std::string& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xFF));
    }
}

void put_i64(std::string& out, int64_t value) {
    auto bits = static_cast<uint64_t>(value);
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((bits >> shift) & 0xFF));
    }
}

void put_str(std::string& out, const std::string& value) {
    put_u32(out, static_cast<uint32_t>(value.size()));
    out.append(value);
}

class Reader {
public:
    explicit Reader(std::string_view data) : data_(data) {}

    bool u8(uint8_t& value) {
        if (remaining() < 1) return false;
        value = static_cast<uint8_t>(data_[pos_++]);
        return true;
    }

    bool u32(uint32_t& value) {
        if (remaining() < 4) return false;
        value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | static_cast<uint8_t>(data_[pos_++]);
        }
        return true;
    }

    bool i64(int64_t& value) {
        if (remaining() < 8) return false;
        uint64_t bits = 0;
        for (int i = 0; i < 8; ++i) {
            bits = (bits << 8) | static_cast<uint8_t>(data_[pos_++]);
        }
        value = static_cast<int64_t>(bits);
        return true;
    }

    bool str(std::string& value) {
        uint32_t length = 0;
        if (!u32(length) || remaining() < length) return false;
        value.assign(data_.substr(pos_, length));
        pos_ += length;
        return true;
    }

    size_t remaining() const { return data_.size() - pos_; }

private:
    std::string_view data_;
    size_t pos_ = 0;
};

uint32_t random_u32() {
    uint32_t value = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
        // RAND_bytes only fails when the CSPRNG cannot be seeded
        std::random_device rd;
        value = rd();
    }
    return value;
}

}  // namespace

std::string Mail::serialize() const {
    std::string out;
    out.reserve(32 + id.size() + from.size() + subject.size() + body.size());

    out.push_back(static_cast<char>(ENCODING_VERSION));
    put_str(out, id);
    put_str(out, from);
    put_u32(out, static_cast<uint32_t>(to.size()));
    for (const auto& recipient : to) {
        put_str(out, recipient);
    }
    put_str(out, subject);
    put_str(out, body);

    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        received_at.time_since_epoch()).count();
    put_i64(out, micros);

    return out;
}

std::optional<Mail> Mail::deserialize(std::string_view data) {
    Reader reader(data);
    Mail mail;

    uint8_t version = 0;
    if (!reader.u8(version) || version != ENCODING_VERSION) {
        return std::nullopt;
    }

    uint32_t recipients = 0;
    if (!reader.str(mail.id) || !reader.str(mail.from) || !reader.u32(recipients)) {
        return std::nullopt;
    }

    // Every recipient needs at least its length prefix
    if (recipients > reader.remaining() / 4) {
        return std::nullopt;
    }
    mail.to.resize(recipients);
    for (auto& recipient : mail.to) {
        if (!reader.str(recipient)) return std::nullopt;
    }

    int64_t micros = 0;
    if (!reader.str(mail.subject) || !reader.str(mail.body) || !reader.i64(micros)) {
        return std::nullopt;
    }

    if (reader.remaining() != 0) {
        return std::nullopt;
    }

    // Must fit the clock's own duration
    constexpr int64_t max_micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::duration::max()).count();
    if (micros > max_micros || micros < -max_micros) {
        return std::nullopt;
    }

    mail.received_at = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(micros)));
    return mail;
}

std::string Mail::generate_id(std::chrono::system_clock::time_point at) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        at.time_since_epoch()).count();

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << static_cast<uint64_t>(micros)
        << '-'
        << std::setw(8) << random_u32();
    return oss.str();
}

std::chrono::system_clock::time_point Mail::now() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

}  // namespace mailcatch

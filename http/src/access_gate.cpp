#include "access_gate.hpp"
#include <openssl/crypto.h>
#include <stdexcept>

namespace mailcatch::http {

AccessGate::AccessGate(std::string access_key)
    : access_key_(std::move(access_key)) {
    if (access_key_.empty()) {
        throw std::invalid_argument("access key must not be empty");
    }
}

bool AccessGate::allows(const Request& request) const {
    auto it = request.query.find(KEY_PARAM);
    if (it == request.query.end()) {
        return false;
    }
    return constant_time_equals(it->second, access_key_);
}

bool AccessGate::constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace mailcatch::http

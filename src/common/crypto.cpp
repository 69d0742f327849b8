#include "common/crypto.hpp"
#include <sodium.h>
#include <vector>

namespace toolrelay::crypto {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool iequals_prefix(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        char a = s[i];
        char b = prefix[i];
        if (a >= 'A' && a <= 'Z') a = static_cast<char>(a - 'A' + 'a');
        if (b >= 'A' && b <= 'Z') b = static_cast<char>(b - 'A' + 'a');
        if (a != b) return false;
    }
    return true;
}

} // anonymous namespace

bool init() {
    return sodium_init() >= 0;
}

// ============================================================================
// Random
// ============================================================================

void random_bytes(std::span<uint8_t> buffer) {
    randombytes_buf(buffer.data(), buffer.size());
}

std::string to_hex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

std::string generate_token(size_t bytes) {
    std::vector<uint8_t> buffer(bytes);
    random_bytes(buffer);
    auto token = to_hex(buffer);
    sodium_memzero(buffer.data(), buffer.size());
    return token;
}

std::string generate_uuid() {
    uint8_t b[16];
    random_bytes(b);
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

    auto hex = to_hex(b);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// ============================================================================
// Token comparison
// ============================================================================

bool secure_compare(std::string_view presented, std::string_view expected) {
    if (expected.empty()) {
        return false;
    }
    if (presented.size() != expected.size()) {
        (void)sodium_memcmp(expected.data(), expected.data(), expected.size());
        return false;
    }
    return sodium_memcmp(presented.data(), expected.data(), expected.size()) == 0;
}

std::string_view extract_bearer_token(std::string_view header) {
    header = trim(header);
    if (iequals_prefix(header, "Bearer ")) {
        header.remove_prefix(7);
        return trim(header);
    }
    if (header.find(' ') != std::string_view::npos) {
        // Another scheme ("Basic ...") is not a bare token
        return {};
    }
    return header;
}

std::string_view first_subprotocol(std::string_view header) {
    auto comma = header.find(',');
    if (comma != std::string_view::npos) {
        header = header.substr(0, comma);
    }
    return trim(header);
}

} // namespace toolrelay::crypto

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace toolrelay::crypto {

// Minimum entropy of a relay or agent token
inline constexpr size_t TOKEN_BYTES = 32;

// Initialize libsodium (call once at startup, safe to call again)
bool init();

// ============================================================================
// Random
// ============================================================================

void random_bytes(std::span<uint8_t> buffer);

// Hex-encoded token of `bytes` random bytes
std::string generate_token(size_t bytes = TOKEN_BYTES);

// Random RFC 4122 version 4 UUID, lower-case
std::string generate_uuid();

// ============================================================================
// Token comparison
// ============================================================================

// Constant-time equality. Runs in time dependent only on the expected length.
bool secure_compare(std::string_view presented, std::string_view expected);

// Token from an Authorization header value: "Bearer <t>" or a bare token.
// Returns an empty view when nothing usable is present.
std::string_view extract_bearer_token(std::string_view header);

// First value of a comma-separated Sec-WebSocket-Protocol header, trimmed.
std::string_view first_subprotocol(std::string_view header);

std::string to_hex(std::span<const uint8_t> data);

} // namespace toolrelay::crypto

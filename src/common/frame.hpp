#pragma once

#include "common/error.hpp"
#include <boost/json.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace toolrelay::wire {

// Maximum size of a single relay frame on the socket
inline constexpr size_t MAX_FRAME_SIZE = 4 * 1024 * 1024;

enum class FrameType : uint8_t {
    CALL,
    RESPONSE,
    FRAME_ERROR,
    HEARTBEAT,
    TOOLS,
};

const char* frame_type_name(FrameType type);

// ============================================================================
// Frame payloads
// ============================================================================

struct CallFrame {
    std::string id;
    std::string method;
    boost::json::object params;
    std::optional<uint32_t> timeout_ms;  // time left on the edge deadline
};

struct ResponseFrame {
    std::string id;
    boost::json::value result;
};

struct ErrorFrame {
    std::string id;
    ErrorKind kind{ErrorKind::PROTOCOL_ERROR};
    std::string message;
};

struct HeartbeatFrame {};

// Tool advertisement sent by the daemon after it connects
struct ToolsFrame {
    boost::json::array tools;
};

using Frame = std::variant<CallFrame, ResponseFrame, ErrorFrame, HeartbeatFrame, ToolsFrame>;

FrameType frame_type(const Frame& frame);

// Correlation id of a frame, nullptr for heartbeat and tools frames.
const std::string* frame_id(const Frame& frame);

// ============================================================================
// JSON codec
// ============================================================================

enum class FrameError {
    MALFORMED_JSON,
    NOT_AN_OBJECT,
    MISSING_TYPE,
    UNKNOWN_TYPE,
    MISSING_ID,
    MISSING_METHOD,
    INVALID_FIELD,
    FRAME_TOO_LARGE,
};

std::string frame_error_message(FrameError error);

class FrameCodec {
public:
    static std::string encode(const Frame& frame);

    // Validates the whole frame; a frame is never half-decoded.
    static std::expected<Frame, FrameError> decode(std::string_view text);

    static boost::json::object to_json(const Frame& frame);
    static std::expected<Frame, FrameError> from_json(const boost::json::object& obj);
};

} // namespace toolrelay::wire

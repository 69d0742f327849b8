#include "common/frame.hpp"

namespace json = boost::json;

namespace toolrelay::wire {

namespace {

std::optional<std::string> read_string(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string()) {
        return std::string(it->value().as_string());
    }
    return std::nullopt;
}

} // anonymous namespace

const char* frame_type_name(FrameType type) {
    switch (type) {
        case FrameType::CALL: return "call";
        case FrameType::RESPONSE: return "response";
        case FrameType::FRAME_ERROR: return "error";
        case FrameType::HEARTBEAT: return "heartbeat";
        case FrameType::TOOLS: return "tools";
    }
    return "unknown";
}

FrameType frame_type(const Frame& frame) {
    return static_cast<FrameType>(frame.index());
}

const std::string* frame_id(const Frame& frame) {
    if (auto* call = std::get_if<CallFrame>(&frame)) return &call->id;
    if (auto* resp = std::get_if<ResponseFrame>(&frame)) return &resp->id;
    if (auto* err = std::get_if<ErrorFrame>(&frame)) return &err->id;
    return nullptr;
}

std::string frame_error_message(FrameError error) {
    switch (error) {
        case FrameError::MALFORMED_JSON: return "Malformed JSON";
        case FrameError::NOT_AN_OBJECT: return "Frame is not a JSON object";
        case FrameError::MISSING_TYPE: return "Frame has no type";
        case FrameError::UNKNOWN_TYPE: return "Unknown frame type";
        case FrameError::MISSING_ID: return "Frame has no id";
        case FrameError::MISSING_METHOD: return "Call frame has no method";
        case FrameError::INVALID_FIELD: return "Frame field has the wrong type";
        case FrameError::FRAME_TOO_LARGE: return "Frame too large";
        default: return "Unknown error";
    }
}

// ============================================================================
// FrameCodec
// ============================================================================

json::object FrameCodec::to_json(const Frame& frame) {
    json::object obj;

    std::visit([&obj](const auto& f) {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, CallFrame>) {
            obj["id"] = f.id;
            obj["type"] = "call";
            obj["method"] = f.method;
            obj["params"] = f.params;
            if (f.timeout_ms) {
                obj["timeout_ms"] = *f.timeout_ms;
            }
        } else if constexpr (std::is_same_v<T, ResponseFrame>) {
            obj["id"] = f.id;
            obj["type"] = "response";
            obj["result"] = f.result;
        } else if constexpr (std::is_same_v<T, ErrorFrame>) {
            obj["id"] = f.id;
            obj["type"] = "error";
            obj["kind"] = error_kind_name(f.kind);
            obj["message"] = f.message;
        } else if constexpr (std::is_same_v<T, HeartbeatFrame>) {
            obj["type"] = "heartbeat";
        } else if constexpr (std::is_same_v<T, ToolsFrame>) {
            obj["type"] = "tools";
            obj["tools"] = f.tools;
        }
    }, frame);

    return obj;
}

std::string FrameCodec::encode(const Frame& frame) {
    return json::serialize(to_json(frame));
}

std::expected<Frame, FrameError> FrameCodec::decode(std::string_view text) {
    if (text.size() > MAX_FRAME_SIZE) {
        return std::unexpected(FrameError::FRAME_TOO_LARGE);
    }

    boost::system::error_code ec;
    json::value jv = json::parse(text, ec);
    if (ec) {
        return std::unexpected(FrameError::MALFORMED_JSON);
    }
    if (!jv.is_object()) {
        return std::unexpected(FrameError::NOT_AN_OBJECT);
    }
    return from_json(jv.as_object());
}

std::expected<Frame, FrameError> FrameCodec::from_json(const json::object& obj) {
    auto type = read_string(obj, "type");
    if (!type) {
        return std::unexpected(FrameError::MISSING_TYPE);
    }

    if (*type == "heartbeat") {
        return HeartbeatFrame{};
    }

    if (*type == "tools") {
        ToolsFrame frame;
        if (auto it = obj.find("tools"); it != obj.end()) {
            if (!it->value().is_array()) {
                return std::unexpected(FrameError::INVALID_FIELD);
            }
            frame.tools = it->value().as_array();
        }
        return frame;
    }

    if (*type != "call" && *type != "response" && *type != "error") {
        return std::unexpected(FrameError::UNKNOWN_TYPE);
    }

    auto id = read_string(obj, "id");
    if (!id || id->empty()) {
        return std::unexpected(FrameError::MISSING_ID);
    }

    if (*type == "call") {
        CallFrame call;
        call.id = std::move(*id);

        auto method = read_string(obj, "method");
        if (!method || method->empty()) {
            return std::unexpected(FrameError::MISSING_METHOD);
        }
        call.method = std::move(*method);

        if (auto it = obj.find("params"); it != obj.end() && !it->value().is_null()) {
            if (!it->value().is_object()) {
                return std::unexpected(FrameError::INVALID_FIELD);
            }
            call.params = it->value().as_object();
        }

        if (auto it = obj.find("timeout_ms"); it != obj.end()) {
            boost::system::error_code num_ec;
            auto ms = it->value().to_number<int64_t>(num_ec);
            if (num_ec || ms <= 0 || ms > UINT32_MAX) {
                return std::unexpected(FrameError::INVALID_FIELD);
            }
            call.timeout_ms = static_cast<uint32_t>(ms);
        }
        return call;
    }

    if (*type == "response") {
        ResponseFrame response;
        response.id = std::move(*id);
        if (auto it = obj.find("result"); it != obj.end()) {
            response.result = it->value();
        }
        return response;
    }

    ErrorFrame error;
    error.id = std::move(*id);
    // A missing or unrecognised kind still answers the call, as a protocol error
    auto kind = read_string(obj, "kind");
    error.kind = kind ? error_kind_from_name(*kind).value_or(ErrorKind::PROTOCOL_ERROR)
                      : ErrorKind::PROTOCOL_ERROR;
    error.message = read_string(obj, "message").value_or(kind ? "" : "error frame without kind");
    return error;
}

} // namespace toolrelay::wire

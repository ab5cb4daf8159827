#include "terminal_protocol.hpp"
#include <nlohmann/json.hpp>
#include <fmt/format.h>

using json = nlohmann::json;

const char* frame_type_name(FrameType type) {
    switch (type) {
        case FrameType::Input:     return "input";
        case FrameType::Resize:    return "resize";
        case FrameType::Ping:      return "ping";
        case FrameType::Pong:      return "pong";
        case FrameType::Connected: return "connected";
        case FrameType::Output:    return "output";
        case FrameType::Error:     return "error";
    }
    return "error";
}

static bool frame_type_from_name(const std::string& name, FrameType& out) {
    static const FrameType all[] = {
        FrameType::Input, FrameType::Resize, FrameType::Ping, FrameType::Pong,
        FrameType::Connected, FrameType::Output, FrameType::Error,
    };
    for (FrameType t : all) {
        if (name == frame_type_name(t)) {
            out = t;
            return true;
        }
    }
    return false;
}

// ── Frame constructors ──────────────────────────────────────

TerminalFrame TerminalFrame::input(std::string data) {
    TerminalFrame f;
    f.type = FrameType::Input;
    f.data = std::move(data);
    return f;
}

TerminalFrame TerminalFrame::resize(int rows, int cols) {
    TerminalFrame f;
    f.type = FrameType::Resize;
    f.rows = rows;
    f.cols = cols;
    return f;
}

TerminalFrame TerminalFrame::ping() {
    TerminalFrame f;
    f.type = FrameType::Ping;
    return f;
}

TerminalFrame TerminalFrame::pong() {
    TerminalFrame f;
    f.type = FrameType::Pong;
    return f;
}

TerminalFrame TerminalFrame::connected(std::string session_id) {
    TerminalFrame f;
    f.type = FrameType::Connected;
    f.session_id = std::move(session_id);
    return f;
}

TerminalFrame TerminalFrame::output(std::string data) {
    TerminalFrame f;
    f.type = FrameType::Output;
    f.data = std::move(data);
    return f;
}

TerminalFrame TerminalFrame::failure(std::string message, std::string error) {
    TerminalFrame f;
    f.type = FrameType::Error;
    f.message = std::move(message);
    f.error = std::move(error);
    return f;
}

// ── Decoding ────────────────────────────────────────────────

static Result<TerminalFrame> protocol_error(const std::string& detail) {
    return Result<TerminalFrame>::Err(ErrorKind::Protocol, "frame: " + detail);
}

// Terminal dimensions travel as 16-bit unsigned values.
static bool read_dimension(const json& j, const char* key, int& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return false;
    auto v = it->get<long long>();
    if (v <= 0 || v > 65535) return false;
    out = static_cast<int>(v);
    return true;
}

static std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

Result<TerminalFrame> parse_frame(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) return protocol_error("invalid JSON");
    if (!j.is_object()) return protocol_error("expected a JSON object");

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) {
        return protocol_error("missing \"type\"");
    }

    TerminalFrame frame;
    const std::string type = type_it->get<std::string>();
    if (!frame_type_from_name(type, frame.type)) {
        return protocol_error(fmt::format("unknown type \"{}\"", type));
    }

    switch (frame.type) {
        case FrameType::Input:
        case FrameType::Output: {
            auto it = j.find("data");
            if (it == j.end() || !it->is_string()) {
                return protocol_error(fmt::format("{} without string \"data\"", type));
            }
            frame.data = it->get<std::string>();
            break;
        }
        case FrameType::Resize:
            if (!read_dimension(j, "rows", frame.rows) || !read_dimension(j, "cols", frame.cols)) {
                return protocol_error("resize needs positive integer rows and cols");
            }
            break;
        case FrameType::Connected:
            frame.session_id = string_field(j, "sessionId");
            if (frame.session_id.empty()) return protocol_error("connected without \"sessionId\"");
            break;
        case FrameType::Error:
            frame.message = string_field(j, "message");
            frame.error = string_field(j, "error");
            break;
        case FrameType::Ping:
        case FrameType::Pong:
            break;
    }
    return Result<TerminalFrame>::Ok(std::move(frame));
}

// ── Encoding ────────────────────────────────────────────────

std::string serialize_frame(const TerminalFrame& frame) {
    json j;
    j["type"] = frame_type_name(frame.type);
    switch (frame.type) {
        case FrameType::Input:
        case FrameType::Output:
            j["data"] = frame.data;
            break;
        case FrameType::Resize:
            j["rows"] = frame.rows;
            j["cols"] = frame.cols;
            break;
        case FrameType::Connected:
            j["sessionId"] = frame.session_id;
            break;
        case FrameType::Error:
            j["message"] = frame.message;
            j["error"] = frame.error;
            break;
        case FrameType::Ping:
        case FrameType::Pong:
            break;
    }
    // Remote output is arbitrary bytes; replace invalid UTF-8 instead of throwing.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ── Connect request ─────────────────────────────────────────

ConnectParams ConnectRequest::to_params(const ConnectDefaults& defaults) const {
    ConnectParams p;
    p.host_id = host_id;
    p.address = address.empty() ? host_id : address;
    p.port = port > 0 ? port : defaults.port;
    p.username = username.empty() ? defaults.user : username;
    p.password = password;
    p.private_key = private_key;
    p.timeout_secs = defaults.timeout;
    p.auth_prefer = defaults.auth_prefer;
    return p;
}

Result<ConnectRequest> parse_connect_request(const std::string& text) {
    using R = Result<ConnectRequest>;
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return R::Err(ErrorKind::Protocol, "connect request: expected a JSON object");
    }

    ConnectRequest req;
    req.host_id = string_field(j, "hostId");
    if (req.host_id.empty()) {
        return R::Err(ErrorKind::Protocol, "connect request: missing \"hostId\"");
    }
    req.address = string_field(j, "address");
    req.username = string_field(j, "username");
    req.password = string_field(j, "password");
    req.private_key = string_field(j, "privateKey");

    auto port_it = j.find("port");
    if (port_it != j.end()) {
        if (!port_it->is_number_integer() || port_it->get<long long>() <= 0 ||
            port_it->get<long long>() > 65535) {
            return R::Err(ErrorKind::Protocol, "connect request: invalid \"port\"");
        }
        req.port = port_it->get<int>();
    }

    // Absent or zero dimensions fall back to 24x80.
    int rows = 0, cols = 0;
    if (read_dimension(j, "rows", rows)) req.rows = rows;
    if (read_dimension(j, "cols", cols)) req.cols = cols;
    return R::Ok(std::move(req));
}

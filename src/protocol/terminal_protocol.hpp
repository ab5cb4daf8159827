#pragma once

#include <string>
#include <core/types.hpp>
#include <core/config.hpp>
#include <ssh/remote_connection.hpp>

// Frame types of the duplex terminal protocol.
//   client -> engine: input, resize, ping, pong
//   engine -> client: connected, output, error, pong
enum class FrameType { Input, Resize, Ping, Pong, Connected, Output, Error };

const char* frame_type_name(FrameType type);

struct TerminalFrame {
    FrameType type = FrameType::Ping;
    std::string data;           // input, output
    int rows = 0;               // resize
    int cols = 0;
    std::string session_id;     // connected
    std::string message;        // error: what failed
    std::string error;          // error: why

    static TerminalFrame input(std::string data);
    static TerminalFrame resize(int rows, int cols);
    static TerminalFrame ping();
    static TerminalFrame pong();
    static TerminalFrame connected(std::string session_id);
    static TerminalFrame output(std::string data);
    static TerminalFrame failure(std::string message, std::string error);
};

// Decode one JSON frame. Anything malformed is a Protocol error.
Result<TerminalFrame> parse_frame(const std::string& text);

// Encode one frame as a single-line JSON object.
std::string serialize_frame(const TerminalFrame& frame);

// First frame of a bridge: who to connect to and how.
struct ConnectRequest {
    std::string host_id;
    std::string address;        // defaults to host_id
    int port = 0;               // 0: config default
    std::string username;       // empty: config default
    std::string password;
    std::string private_key;    // PEM text
    int rows = DEFAULT_ROWS;
    int cols = DEFAULT_COLS;

    ConnectParams to_params(const ConnectDefaults& defaults) const;
};

Result<ConnectRequest> parse_connect_request(const std::string& text);

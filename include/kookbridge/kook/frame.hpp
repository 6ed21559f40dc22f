#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "kookbridge/core/error.hpp"

namespace kookbridge::kook {

using json = nlohmann::json;

/// Gateway signal types (`s` field of every frame).
enum class SignalType : int {
    Event = 0,
    Hello = 1,
    Ping = 2,
    Pong = 3,
    Reconnect = 5,
    ResumeAck = 6,
};

/// Returns the signal's name for log output.
auto signal_name(SignalType signal) -> std::string_view;

/// One gateway frame: `{s: <signal>, d: <payload>, sn?: <sequence>}`.
struct SignalFrame {
    SignalType signal = SignalType::Event;
    json payload;                      // null when `d` is absent
    std::optional<int64_t> sequence;
};

/// Parses a raw text message into a SignalFrame.
/// Malformed JSON yields SerializationError; a well-formed document that is
/// not a valid frame (non-object, missing or unknown `s`) yields
/// ProtocolError.
auto parse_signal_frame(std::string_view text) -> Result<SignalFrame>;

/// Serializes a frame for transmission. `d` is omitted when null and `sn`
/// when absent.
auto serialize_signal_frame(const SignalFrame& frame) -> std::string;

/// Builds the heartbeat frame `{s: 2, sn: last_sequence}`.
auto make_ping(int64_t last_sequence) -> SignalFrame;

} // namespace kookbridge::kook

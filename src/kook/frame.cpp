#include "kookbridge/kook/frame.hpp"

namespace kookbridge::kook {

auto signal_name(SignalType signal) -> std::string_view {
    switch (signal) {
        case SignalType::Event: return "event";
        case SignalType::Hello: return "hello";
        case SignalType::Ping: return "ping";
        case SignalType::Pong: return "pong";
        case SignalType::Reconnect: return "reconnect";
        case SignalType::ResumeAck: return "resume_ack";
        default: return "unknown";
    }
}

namespace {

auto to_signal_type(int64_t raw) -> std::optional<SignalType> {
    switch (raw) {
        case 0: return SignalType::Event;
        case 1: return SignalType::Hello;
        case 2: return SignalType::Ping;
        case 3: return SignalType::Pong;
        case 5: return SignalType::Reconnect;
        case 6: return SignalType::ResumeAck;
        default: return std::nullopt;
    }
}

} // anonymous namespace

auto parse_signal_frame(std::string_view text) -> Result<SignalFrame> {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError,
                       "Failed to parse signal frame JSON", e.what()));
    }

    if (!j.is_object()) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError, "Signal frame must be a JSON object"));
    }

    auto s_it = j.find("s");
    if (s_it == j.end() || !s_it->is_number_integer()) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError, "Signal frame is missing integer field 's'"));
    }

    auto signal = to_signal_type(s_it->get<int64_t>());
    if (!signal) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError,
                       "Unknown signal type",
                       std::to_string(s_it->get<int64_t>())));
    }

    SignalFrame frame;
    frame.signal = *signal;
    if (auto d_it = j.find("d"); d_it != j.end()) {
        frame.payload = *d_it;
    }
    if (auto sn_it = j.find("sn"); sn_it != j.end() && sn_it->is_number_integer()) {
        frame.sequence = sn_it->get<int64_t>();
    }
    return frame;
}

auto serialize_signal_frame(const SignalFrame& frame) -> std::string {
    json j = {{"s", static_cast<int>(frame.signal)}};
    if (!frame.payload.is_null()) {
        j["d"] = frame.payload;
    }
    if (frame.sequence) {
        j["sn"] = *frame.sequence;
    }
    return j.dump();
}

auto make_ping(int64_t last_sequence) -> SignalFrame {
    return SignalFrame{
        .signal = SignalType::Ping,
        .payload = nullptr,
        .sequence = last_sequence,
    };
}

} // namespace kookbridge::kook

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kookbridge::channels {

using json = nlohmann::json;

/// A message to be sent to a channel (host -> platform).
struct OutgoingMessage {
    std::string channel;
    std::optional<std::string> account_id;
    std::string recipient_id;   // "channel:<id>", "user:<id>", a chat code, ...
    std::string text;
    std::optional<std::string> media_url;
    std::optional<std::string> reply_to;
};

void to_json(json& j, const OutgoingMessage& m);
void from_json(const json& j, OutgoingMessage& m);

} // namespace kookbridge::channels

#include "kookbridge/channels/message.hpp"
#include "kookbridge/channels/channel.hpp"

namespace kookbridge::channels {

// ---------------------------------------------------------------------------
// OutgoingMessage JSON serialization
// ---------------------------------------------------------------------------

void to_json(json& j, const OutgoingMessage& m) {
    j = json{
        {"channel", m.channel},
        {"recipient_id", m.recipient_id},
        {"text", m.text},
    };
    if (m.account_id) j["account_id"] = *m.account_id;
    if (m.media_url) j["media_url"] = *m.media_url;
    if (m.reply_to) j["reply_to"] = *m.reply_to;
}

void from_json(const json& j, OutgoingMessage& m) {
    j.at("channel").get_to(m.channel);
    j.at("recipient_id").get_to(m.recipient_id);
    if (j.contains("text")) j.at("text").get_to(m.text);
    if (j.contains("account_id")) m.account_id = j.at("account_id").get<std::string>();
    if (j.contains("media_url")) m.media_url = j.at("media_url").get<std::string>();
    if (j.contains("reply_to")) m.reply_to = j.at("reply_to").get<std::string>();
}

} // namespace kookbridge::channels

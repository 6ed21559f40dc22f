#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "kookbridge/core/error.hpp"

namespace kookbridge::kook {

using json = nlohmann::json;

enum class ChannelType {
    Group,
    Direct,
    Broadcast,
};

auto channel_type_name(ChannelType type) -> std::string_view;

/// KOOK message type codes.
namespace message_type {
    inline constexpr int Text      = 1;
    inline constexpr int Image     = 2;
    inline constexpr int Video     = 3;
    inline constexpr int File      = 4;
    inline constexpr int Audio     = 8;
    inline constexpr int KMarkdown = 9;
    inline constexpr int Card      = 10;
    inline constexpr int System    = 255;
} // namespace message_type

struct EventAuthor {
    std::string id;
    std::string username;
    std::optional<std::string> nickname;
    bool bot = false;
};

struct EventQuote {
    std::string id;
    int type = 0;
    std::string content;
    int64_t created_at_ms = 0;
    std::string author_id;
    std::string author_name;
};

struct EventExtras {
    std::optional<std::string> guild_id;
    std::optional<std::string> channel_name;
    std::vector<std::string> mentions;
    bool mention_all = false;
    std::optional<EventAuthor> author;
    std::optional<EventQuote> quote;
    std::optional<std::string> kmarkdown_raw;   // extra.kmarkdown.raw_content
    std::optional<std::string> chat_code;       // DM session code
};

/// Normalized payload of an Event (signal 0) frame.
struct InboundEvent {
    ChannelType channel_type = ChannelType::Group;
    int message_type = 0;
    std::string target_id;
    std::string author_id;
    std::string content;
    std::string message_id;
    int64_t timestamp_ms = 0;
    std::string nonce;
    EventExtras extras;

    [[nodiscard]] auto is_group() const noexcept -> bool {
        return channel_type != ChannelType::Direct;
    }
};

/// Decodes the `d` payload of an Event frame.
/// Returns SerializationError when a required field is missing or mistyped.
auto parse_inbound_event(const json& payload) -> Result<InboundEvent>;

/// Text of the event; KMarkdown messages prefer the unformatted raw content.
auto extract_content(const InboundEvent& event) -> std::string;

/// True when `bot_id` is listed in the event's mentions. An unknown bot id
/// never matches.
auto is_bot_mentioned(const InboundEvent& event, std::optional<std::string_view> bot_id) -> bool;

/// Removes `(met)<bot_id>(met)` tokens, squeezes doubled whitespace, trims.
auto strip_bot_mention(std::string_view text, std::optional<std::string_view> bot_id) -> std::string;

} // namespace kookbridge::kook

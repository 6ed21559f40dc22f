#include "kookbridge/kook/event.hpp"

#include "kookbridge/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace kookbridge::kook {

auto channel_type_name(ChannelType type) -> std::string_view {
    switch (type) {
        case ChannelType::Group: return "GROUP";
        case ChannelType::Direct: return "PERSON";
        case ChannelType::Broadcast: return "BROADCAST";
        default: return "UNKNOWN";
    }
}

namespace {

/// Ids arrive as strings but some payloads carry them as numbers.
auto id_value(const json& j, std::string_view key) -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    return std::nullopt;
}

auto int_value(const json& j, std::string_view key, int64_t fallback) -> int64_t {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_string()) {
        try {
            return std::stoll(it->get<std::string>());
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

auto parse_author(const json& j) -> EventAuthor {
    EventAuthor author;
    author.id = id_value(j, "id").value_or("");
    author.username = j.value("username", "");
    if (auto it = j.find("nickname"); it != j.end() && it->is_string()) {
        author.nickname = it->get<std::string>();
    }
    author.bot = j.value("bot", false);
    return author;
}

auto parse_quote(const json& j) -> EventQuote {
    EventQuote quote;
    quote.id = id_value(j, "id").value_or("");
    quote.type = static_cast<int>(int_value(j, "type", 0));
    quote.content = j.value("content", "");
    quote.created_at_ms = int_value(j, "create_at", 0);
    if (auto it = j.find("author"); it != j.end() && it->is_object()) {
        quote.author_id = id_value(*it, "id").value_or("");
        quote.author_name = it->value("username", "");
    }
    return quote;
}

auto parse_extras(const json& j) -> EventExtras {
    EventExtras extras;
    if (!j.is_object()) return extras;

    extras.guild_id = id_value(j, "guild_id");
    if (auto it = j.find("channel_name"); it != j.end() && it->is_string()) {
        extras.channel_name = it->get<std::string>();
    }
    if (auto it = j.find("mention"); it != j.end() && it->is_array()) {
        for (const auto& m : *it) {
            if (m.is_string()) extras.mentions.push_back(m.get<std::string>());
            else if (m.is_number_integer()) extras.mentions.push_back(std::to_string(m.get<int64_t>()));
        }
    }
    extras.mention_all = j.value("mention_all", false);
    if (auto it = j.find("author"); it != j.end() && it->is_object()) {
        extras.author = parse_author(*it);
    }
    if (auto it = j.find("quote"); it != j.end() && it->is_object()) {
        extras.quote = parse_quote(*it);
    }
    if (auto it = j.find("kmarkdown"); it != j.end() && it->is_object()) {
        if (auto raw = it->find("raw_content"); raw != it->end() && raw->is_string()) {
            extras.kmarkdown_raw = raw->get<std::string>();
        }
    }
    if (auto it = j.find("code"); it != j.end() && it->is_string()) {
        extras.chat_code = it->get<std::string>();
    }
    return extras;
}

} // anonymous namespace

auto parse_inbound_event(const json& payload) -> Result<InboundEvent> {
    if (!payload.is_object()) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "Event payload must be an object"));
    }

    InboundEvent event;

    auto channel_type = payload.value("channel_type", "");
    if (channel_type == "GROUP") {
        event.channel_type = ChannelType::Group;
    } else if (channel_type == "PERSON") {
        event.channel_type = ChannelType::Direct;
    } else if (channel_type == "BROADCAST") {
        event.channel_type = ChannelType::Broadcast;
    } else {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "Unknown channel_type", channel_type));
    }

    auto type_it = payload.find("type");
    if (type_it == payload.end() || !type_it->is_number_integer()) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "Event is missing integer field 'type'"));
    }
    event.message_type = type_it->get<int>();

    auto target_id = id_value(payload, "target_id");
    auto author_id = id_value(payload, "author_id");
    if (!target_id || !author_id) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "Event is missing target_id or author_id"));
    }
    event.target_id = std::move(*target_id);
    event.author_id = std::move(*author_id);

    if (auto it = payload.find("content"); it != payload.end() && it->is_string()) {
        event.content = it->get<std::string>();
    }
    event.message_id = id_value(payload, "msg_id").value_or("");
    event.timestamp_ms = int_value(payload, "msg_timestamp", 0);
    if (auto it = payload.find("nonce"); it != payload.end() && it->is_string()) {
        event.nonce = it->get<std::string>();
    }
    if (auto it = payload.find("extra"); it != payload.end()) {
        event.extras = parse_extras(*it);
    }
    return event;
}

auto extract_content(const InboundEvent& event) -> std::string {
    if (event.message_type == message_type::KMarkdown &&
        event.extras.kmarkdown_raw && !event.extras.kmarkdown_raw->empty()) {
        return *event.extras.kmarkdown_raw;
    }
    return event.content;
}

auto is_bot_mentioned(const InboundEvent& event, std::optional<std::string_view> bot_id) -> bool {
    if (!bot_id || bot_id->empty()) {
        return false;
    }
    return std::ranges::find(event.extras.mentions, *bot_id) != event.extras.mentions.end();
}

auto strip_bot_mention(std::string_view text, std::optional<std::string_view> bot_id) -> std::string {
    if (!bot_id || bot_id->empty()) {
        return std::string(text);
    }

    std::string token = "(met)" + std::string(*bot_id) + "(met)";
    std::string without;
    without.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        auto hit = text.find(token, pos);
        if (hit == std::string_view::npos) {
            without.append(text.substr(pos));
            break;
        }
        without.append(text.substr(pos, hit - pos));
        pos = hit + token.size();
    }

    // Runs of two or more whitespace characters become one space.
    std::string squeezed;
    squeezed.reserve(without.size());
    size_t i = 0;
    while (i < without.size()) {
        if (std::isspace(static_cast<unsigned char>(without[i]))) {
            size_t run = i;
            while (run < without.size() && std::isspace(static_cast<unsigned char>(without[run]))) {
                ++run;
            }
            if (run - i >= 2) {
                squeezed += ' ';
            } else {
                squeezed += without[i];
            }
            i = run;
            continue;
        }
        squeezed += without[i];
        ++i;
    }
    return utils::trim(squeezed);
}

} // namespace kookbridge::kook

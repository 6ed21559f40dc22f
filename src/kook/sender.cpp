#include "kookbridge/kook/sender.hpp"
#include "kookbridge/core/logger.hpp"
#include "kookbridge/core/utils.hpp"

#include <array>
#include <cctype>

namespace kookbridge::kook {

auto normalize_target(std::string_view target) -> Result<std::string> {
    static constexpr std::array<std::string_view, 7> kPrefixes = {
        "kook:channel:", "kook:user:", "kook:dm:", "kook:group:", "kook:",
        "channel:", "user:",
    };

    auto trimmed = utils::trim(target);
    std::string_view view = trimmed;
    for (auto prefix : kPrefixes) {
        if (utils::starts_with_icase(view, prefix)) {
            view.remove_prefix(prefix.size());
            break;
        }
    }

    auto id = utils::trim(view);
    if (id.empty()) {
        return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "Invalid KOOK target", std::string(target)));
    }
    return id;
}

auto is_direct_target(std::string_view target) -> bool {
    return target.starts_with("user:") || target.starts_with("kook:user:");
}

auto is_chat_code(std::string_view id) -> bool {
    if (id.size() < 24) {
        return false;
    }
    for (char c : id) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void to_json(nlohmann::json& j, const SendResult& r) {
    j = nlohmann::json{{"message_id", r.message_id}, {"chat_id", r.chat_id}};
}

// ---------------------------------------------------------------------------
// KookSender
// ---------------------------------------------------------------------------

KookSender::KookSender(std::shared_ptr<KookApi> api, int text_chunk_limit)
    : api_(std::move(api))
    , text_chunk_limit_(text_chunk_limit > 0 ? text_chunk_limit : kDefaultTextChunkLimit)
{
}

auto KookSender::send_one(std::string_view to, std::string_view text, const SendOptions& options)
    -> boost::asio::awaitable<Result<SendResult>> {
    auto target_id = normalize_target(to);
    if (!target_id) {
        co_return make_fail(target_id.error());
    }

    bool direct = options.is_dm || is_direct_target(to);
    Result<SentMessage> sent;
    if (direct) {
        DirectMessageRequest request;
        request.content = std::string(text);
        request.quote = options.reply_to;
        if (is_chat_code(*target_id)) {
            request.chat_code = *target_id;
        } else {
            request.target_id = *target_id;
        }
        sent = co_await api_->send_direct_message(std::move(request));
    } else {
        ChannelMessageRequest request;
        request.target_id = *target_id;
        request.content = std::string(text);
        request.quote = options.reply_to;
        sent = co_await api_->send_channel_message(std::move(request));
    }

    if (!sent) {
        co_return make_fail(
            make_error(sent.error().code(),
                       direct ? "KOOK DM send failed" : "KOOK send failed",
                       sent.error().what()));
    }
    co_return SendResult{.message_id = sent->message_id, .chat_id = *target_id};
}

auto KookSender::send_text(std::string_view to, std::string_view text, SendOptions options)
    -> boost::asio::awaitable<Result<SendResult>> {
    auto chunks = utils::chunk_text(text, static_cast<std::size_t>(text_chunk_limit_));
    if (chunks.empty()) {
        co_return make_fail(
            make_error(ErrorCode::InvalidArgument, "Refusing to send an empty KOOK message"));
    }

    LOG_DEBUG("kook: sending {} chunk(s) to {}", chunks.size(), to);
    Result<SendResult> last = SendResult{};
    for (const auto& chunk : chunks) {
        last = co_await send_one(to, chunk, options);
        if (!last) {
            co_return make_fail(last.error());
        }
    }
    co_return last;
}

auto KookSender::send_media(std::string_view to,
                            std::string_view text,
                            std::string_view media_url,
                            SendOptions options)
    -> boost::asio::awaitable<Result<SendResult>> {
    if (!utils::trim(text).empty()) {
        auto caption = co_await send_text(to, text, options);
        if (!caption) {
            co_return make_fail(caption.error());
        }
        if (media_url.empty()) {
            co_return caption;
        }
    }

    if (media_url.empty()) {
        co_return make_fail(
            make_error(ErrorCode::InvalidArgument, "Media message needs text or a media URL"));
    }
    co_return co_await send_text(to, media_url, std::move(options));
}

auto KookSender::open_dm_session(std::string_view user_id)
    -> boost::asio::awaitable<Result<std::string>> {
    auto target_id = normalize_target(user_id);
    if (!target_id) {
        co_return make_fail(target_id.error());
    }
    auto chat = co_await api_->create_user_chat(*target_id);
    if (!chat) {
        co_return make_fail(
            make_error(chat.error().code(), "KOOK create DM session failed", chat.error().what()));
    }
    co_return chat->code;
}

} // namespace kookbridge::kook

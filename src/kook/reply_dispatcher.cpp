#include "kookbridge/kook/reply_dispatcher.hpp"
#include "kookbridge/core/logger.hpp"
#include "kookbridge/core/utils.hpp"

namespace kookbridge::kook {

KookReplyDispatcher::KookReplyDispatcher(std::shared_ptr<KookSender> sender, ReplyTarget target)
    : sender_(std::move(sender))
    , target_(std::move(target))
{
}

auto KookReplyDispatcher::deliver(ReplyPayload payload, ReplyKind kind)
    -> boost::asio::awaitable<Result<void>> {
    LOG_DEBUG("{} deliver {} reply: text={}", target_.account_tag, reply_kind_name(kind),
              utils::truncate_utf8(payload.text, 100));

    bool has_text = !utils::trim(payload.text).empty();
    if (!has_text && !payload.media_url) {
        LOG_DEBUG("{} deliver: empty text, skipping", target_.account_tag);
        co_return ok_result();
    }

    std::string to = target_.is_dm ? "user:" + target_.conversation_id
                                   : target_.conversation_id;
    SendOptions options{
        .reply_to = target_.reply_to_message_id,
        .is_dm = target_.is_dm,
    };

    Result<SendResult> sent;
    if (payload.media_url) {
        sent = co_await sender_->send_media(to, payload.text, *payload.media_url, options);
    } else {
        sent = co_await sender_->send_text(to, payload.text, options);
    }
    if (!sent) {
        co_return make_fail(sent.error());
    }

    ++delivered_;
    co_return ok_result();
}

void KookReplyDispatcher::on_error(const Error& error, ReplyKind kind) {
    LOG_ERROR("{} {} reply failed: {}", target_.account_tag, reply_kind_name(kind), error.what());
}

} // namespace kookbridge::kook

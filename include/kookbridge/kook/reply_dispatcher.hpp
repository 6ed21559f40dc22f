#pragma once

#include <memory>
#include <optional>
#include <string>

#include "kookbridge/kook/host.hpp"
#include "kookbridge/kook/sender.hpp"

namespace kookbridge::kook {

/// Where replies to one inbound message go.
struct ReplyTarget {
    std::string account_tag;            // "kook[<account>]" for logs
    std::string conversation_id;        // channel id, or sender id for DMs
    std::optional<std::string> reply_to_message_id;
    bool is_dm = false;
};

/// Delivers host replies back to the conversation a message came from,
/// quoting that message.
class KookReplyDispatcher : public ReplyDispatcher {
public:
    KookReplyDispatcher(std::shared_ptr<KookSender> sender, ReplyTarget target);

    auto deliver(ReplyPayload payload, ReplyKind kind)
        -> boost::asio::awaitable<Result<void>> override;

    void on_error(const Error& error, ReplyKind kind) override;

    [[nodiscard]] auto delivered() const noexcept -> int { return delivered_; }
    [[nodiscard]] auto target() const noexcept -> const ReplyTarget& { return target_; }

private:
    std::shared_ptr<KookSender> sender_;
    ReplyTarget target_;
    int delivered_ = 0;
};

} // namespace kookbridge::kook

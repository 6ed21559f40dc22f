#include "kookbridge/kook/inbound.hpp"
#include "kookbridge/core/logger.hpp"
#include "kookbridge/core/utils.hpp"
#include "kookbridge/kook/account.hpp"
#include "kookbridge/kook/policy.hpp"
#include "kookbridge/kook/reply_dispatcher.hpp"
#include "kookbridge/kook/sender.hpp"

namespace kookbridge::kook {

namespace {

constexpr std::size_t kPreviewLength = 160;

auto sender_display_name(const InboundEvent& event) -> std::optional<std::string> {
    if (event.extras.author && !event.extras.author->username.empty()) {
        return event.extras.author->username;
    }
    return std::nullopt;
}

} // anonymous namespace

InboundHandler::InboundHandler(ConfigProvider config,
                               std::string account_id,
                               std::shared_ptr<HostRuntime> host,
                               std::shared_ptr<KookApi> api)
    : config_(std::move(config))
    , account_id_(normalize_account_id(account_id))
    , host_(std::move(host))
    , api_(std::move(api))
{
}

auto InboundHandler::handle(InboundEvent event, std::optional<std::string> bot_id)
    -> boost::asio::awaitable<Result<void>> {
    const auto account = resolve_account(config_(), account_id_);
    const auto tag = account.tag();

    const bool is_group = event.is_group();
    const auto raw_content = extract_content(event);
    const bool mentioned = is_bot_mentioned(event, bot_id);
    const auto content = strip_bot_mention(raw_content, bot_id);
    const auto sender_name = sender_display_name(event);
    const auto& sender_id = event.author_id;
    const auto& channel_id = event.target_id;
    const auto speaker = sender_name.value_or(sender_id);

    LOG_INFO("{}: received message from {} in {} ({})",
             tag, sender_id, channel_id, channel_type_name(event.channel_type));

    // -- Policy gate ---------------------------------------------------------

    auto decision = evaluate_policy(account, PolicyInput{
        .is_group = is_group,
        .channel_id = channel_id,
        .guild_id = event.extras.guild_id,
        .sender_id = sender_id,
        .mentioned = mentioned,
    });

    switch (decision.verdict) {
        case PolicyVerdict::RecordOnly:
            LOG_INFO("{}: message in {} did not mention bot, recording to history", tag, channel_id);
            history_.record(channel_id, HistoryEntry{
                .sender_id = sender_id,
                .body = speaker + ": " + content,
                .timestamp_ms = utils::timestamp_ms(),
                .message_id = event.message_id,
            }, account.history_limit);
            co_return ok_result();

        case PolicyVerdict::RejectGroupDisabled:
        case PolicyVerdict::RejectGroupNotAllowed:
        case PolicyVerdict::RejectChannelDisabled:
        case PolicyVerdict::RejectSenderNotAllowed:
        case PolicyVerdict::RejectDmNotAllowed:
            LOG_INFO("{}: message from {} in {} blocked ({})",
                     tag, sender_id, channel_id, policy_verdict_name(decision.verdict));
            co_return ok_result();

        case PolicyVerdict::AcceptPendingPairing: {
            auto paired = co_await host_->authorize_pairing(PairingRequest{
                .channel = std::string(kChannelId),
                .account_id = account.account_id,
                .sender_id = sender_id,
                .sender_name = sender_name,
            });
            if (!paired) {
                co_return make_fail(paired.error());
            }
            if (!*paired) {
                LOG_INFO("{}: sender {} is awaiting pairing approval", tag, sender_id);
                co_return ok_result();
            }
            break;
        }

        case PolicyVerdict::Accept:
            break;
    }

    // -- Routing and notification ------------------------------------------

    auto route = host_->resolve_route(RouteRequest{
        .channel = std::string(kChannelId),
        .account_id = account.account_id,
        .peer = RoutePeer{
            .kind = is_group ? PeerKind::Group : PeerKind::Direct,
            .id = is_group ? channel_id : sender_id,
        },
    });
    if (!route) {
        co_return make_fail(route.error());
    }

    auto preview = utils::truncate_utf8(utils::collapse_whitespace(content), kPreviewLength);
    auto label = is_group
        ? "KOOK[" + account.account_id + "] message in channel " + channel_id
        : "KOOK[" + account.account_id + "] DM from " + sender_id;
    host_->enqueue_notification(label + ": " + preview, NotificationContext{
        .session_key = route->session_key,
        .context_key = "kook:message:" + channel_id + ":" + event.message_id,
    });

    // -- Envelope and history context --------------------------------------

    std::string message_body = content;
    if (event.extras.quote && !event.extras.quote->content.empty()) {
        message_body = "[Replying to: \"" + event.extras.quote->content + "\"]\n\n" + content;
    }
    message_body = speaker + ": " + message_body;

    auto body = host_->format_envelope(EnvelopeParams{
        .channel = std::string(kChannelLabel),
        .from = is_group ? channel_id + ":" + sender_id : sender_id,
        .timestamp_ms = utils::timestamp_ms(),
        .body = message_body,
    });

    const auto history_mark = history_.mark(channel_id);
    if (is_group) {
        body = history_.build_context(channel_id, body, account.history_limit,
            [&](const HistoryEntry& entry) {
                return host_->format_envelope(EnvelopeParams{
                    .channel = std::string(kChannelLabel),
                    .from = channel_id + ":" + entry.sender_id,
                    .timestamp_ms = entry.timestamp_ms,
                    .body = entry.body,
                });
            });
    }

    auto to = is_group ? "channel:" + channel_id : "user:" + sender_id;

    InboundContext context;
    context.body = std::move(body);
    context.raw_body = content;
    context.command_body = content;
    context.from = "kook:" + sender_id;
    context.to = to;
    context.session_key = route->session_key;
    context.account_id = route->account_id;
    context.chat_type = is_group ? ChatType::Group : ChatType::Direct;
    if (is_group) {
        context.group_subject = channel_id;
    }
    context.sender_name = speaker;
    context.sender_id = sender_id;
    context.message_sid = event.message_id;
    context.timestamp_ms = utils::timestamp_ms();
    context.was_mentioned = mentioned;
    context.command_authorized = true;
    context.originating_to = to;

    // -- Dispatch ------------------------------------------------------------

    auto dispatcher = std::make_shared<KookReplyDispatcher>(
        std::make_shared<KookSender>(api_, account.text_chunk_limit),
        ReplyTarget{
            .account_tag = tag,
            .conversation_id = is_group ? channel_id : sender_id,
            .reply_to_message_id = event.message_id.empty()
                ? std::nullopt
                : std::optional<std::string>(event.message_id),
            .is_dm = !is_group,
        });

    LOG_INFO("{}: dispatching to agent (session={})", tag, route->session_key);
    auto outcome = co_await host_->dispatch_reply(std::move(context), dispatcher);
    if (!outcome) {
        co_return make_fail(outcome.error());
    }

    if (is_group) {
        history_.consume(channel_id, history_mark);
    }

    LOG_INFO("{}: dispatch complete (queued_final={}, replies={})",
             tag, outcome->queued_final, outcome->counts.final);
    co_return ok_result();
}

} // namespace kookbridge::kook

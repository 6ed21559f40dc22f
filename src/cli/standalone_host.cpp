#include "kookbridge/cli/standalone_host.hpp"
#include "kookbridge/core/logger.hpp"
#include "kookbridge/core/utils.hpp"

namespace kookbridge::cli {

StandaloneHost::StandaloneHost(StandaloneHostOptions options)
    : options_(std::move(options))
{
}

auto StandaloneHost::resolve_route(const kook::RouteRequest& request)
    -> Result<kook::ResolvedRoute> {
    if (request.peer.id.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "Route peer id is empty"));
    }
    const auto* kind = request.peer.kind == kook::PeerKind::Group ? "group" : "direct";
    return kook::ResolvedRoute{
        .session_key = "agent:" + options_.agent_id + ":" + request.channel + ":" +
                       request.account_id + ":" + kind + ":" + request.peer.id,
        .account_id = request.account_id,
        .agent_id = options_.agent_id,
    };
}

void StandaloneHost::enqueue_notification(std::string text, kook::NotificationContext context) {
    LOG_INFO("[host] {} ({})", text, context.context_key);
}

auto StandaloneHost::format_envelope(const kook::EnvelopeParams& params) -> std::string {
    return "[" + params.channel + " " + params.from + " " +
           utils::format_iso(params.timestamp_ms) + "] " + params.body;
}

auto StandaloneHost::dispatch_reply(kook::InboundContext context,
                                    std::shared_ptr<kook::ReplyDispatcher> dispatcher)
    -> boost::asio::awaitable<Result<kook::DispatchOutcome>> {
    json j = context;
    LOG_DEBUG("[host] inbound context: {}", j.dump());

    kook::DispatchOutcome outcome;
    if (!options_.echo || context.raw_body.empty()) {
        co_return outcome;
    }

    auto delivered = co_await dispatcher->deliver(
        kook::ReplyPayload{.text = context.raw_body}, kook::ReplyKind::Final);
    if (!delivered) {
        dispatcher->on_error(delivered.error(), kook::ReplyKind::Final);
        co_return make_fail(delivered.error());
    }
    outcome.queued_final = true;
    outcome.counts.final = 1;
    co_return outcome;
}

auto StandaloneHost::authorize_pairing(kook::PairingRequest request)
    -> boost::asio::awaitable<Result<bool>> {
    LOG_INFO("[host] pairing request from {} on {}[{}]: {}",
             request.sender_name.value_or(request.sender_id), request.channel,
             request.account_id, options_.auto_approve_pairing ? "approved" : "pending");
    co_return options_.auto_approve_pairing;
}

} // namespace kookbridge::cli

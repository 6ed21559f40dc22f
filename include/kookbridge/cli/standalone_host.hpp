#pragma once

#include <memory>
#include <string>

#include "kookbridge/kook/host.hpp"

namespace kookbridge::cli {

struct StandaloneHostOptions {
    std::string agent_id = "main";
    /// Reply to every dispatched message with its own text.
    bool echo = false;
    /// Approve DMs held under the "pairing" policy without asking anyone.
    bool auto_approve_pairing = false;
};

/// Host runtime used by `kookbridge run` when no orchestration runtime is
/// attached: routes every peer to its own session, logs notifications and
/// inbound contexts, and optionally echoes.
class StandaloneHost : public kook::HostRuntime {
public:
    explicit StandaloneHost(StandaloneHostOptions options = {});

    auto resolve_route(const kook::RouteRequest& request) -> Result<kook::ResolvedRoute> override;

    void enqueue_notification(std::string text, kook::NotificationContext context) override;

    auto format_envelope(const kook::EnvelopeParams& params) -> std::string override;

    auto dispatch_reply(kook::InboundContext context,
                        std::shared_ptr<kook::ReplyDispatcher> dispatcher)
        -> boost::asio::awaitable<Result<kook::DispatchOutcome>> override;

    auto authorize_pairing(kook::PairingRequest request)
        -> boost::asio::awaitable<Result<bool>> override;

private:
    StandaloneHostOptions options_;
};

} // namespace kookbridge::cli

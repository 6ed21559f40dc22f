#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "kookbridge/core/config.hpp"
#include "kookbridge/kook/admission.hpp"
#include "kookbridge/kook/client.hpp"
#include "kookbridge/kook/history.hpp"
#include "kookbridge/kook/host.hpp"

namespace kookbridge::kook {

/// Returns the current configuration. Called once per event.
using ConfigProvider = std::function<Config()>;

/// Turns an admitted KOOK message into a host dispatch: policy gate,
/// history buffering, routing, envelope and reply wiring.
///
/// Owns the account's pending group history. Runs on the account strand.
class InboundHandler : public InboundEventHandler {
public:
    InboundHandler(ConfigProvider config,
                   std::string account_id,
                   std::shared_ptr<HostRuntime> host,
                   std::shared_ptr<KookApi> api);

    auto handle(InboundEvent event, std::optional<std::string> bot_id)
        -> boost::asio::awaitable<Result<void>> override;

    [[nodiscard]] auto history() const noexcept -> const PendingHistory& { return history_; }

private:
    ConfigProvider config_;
    std::string account_id_;
    std::shared_ptr<HostRuntime> host_;
    std::shared_ptr<KookApi> api_;
    PendingHistory history_;
};

} // namespace kookbridge::kook

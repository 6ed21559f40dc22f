#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "kookbridge/core/abort.hpp"
#include "kookbridge/kook/session.hpp"

namespace kookbridge::kook {

/// Wait before reconnect attempt `attempt` (1-based):
/// min(base * 2^(attempt-1), max).
auto backoff_delay(int attempt, const GatewayTimings& timings) -> std::chrono::milliseconds;

/// Keeps one account connected: runs ConnectionSessions back to back with
/// exponential backoff until the abort signal fires.
class GatewaySupervisor {
public:
    GatewaySupervisor(boost::asio::any_io_executor executor,
                      std::shared_ptr<KookApi> api,
                      std::shared_ptr<GatewayConnector> connector,
                      GatewayTimings timings,
                      EventSink sink,
                      GatewayHooks hooks,
                      std::string tag);

    GatewaySupervisor(const GatewaySupervisor&) = delete;
    GatewaySupervisor& operator=(const GatewaySupervisor&) = delete;

    /// Returns once cancelled. Transient failures never escape.
    auto run(AbortSignal& abort) -> boost::asio::awaitable<void>;

    [[nodiscard]] auto session() const noexcept -> const GatewaySession& { return session_; }
    [[nodiscard]] auto reconnect_state() const noexcept -> const ReconnectState& { return reconnect_; }
    [[nodiscard]] auto bot_id() const noexcept -> const std::optional<std::string>& { return bot_id_; }

private:
    /// Looks up the bot's own user id. Failure leaves it unknown.
    auto refresh_identity() -> boost::asio::awaitable<void>;

    /// False when the wait was cut short by the abort signal.
    auto wait_before_retry(std::chrono::milliseconds delay, AbortSignal& abort)
        -> boost::asio::awaitable<bool>;

    boost::asio::any_io_executor executor_;
    std::shared_ptr<KookApi> api_;
    std::shared_ptr<GatewayConnector> connector_;
    GatewayTimings timings_;
    EventSink sink_;
    GatewayHooks hooks_;
    std::string tag_;

    GatewaySession session_;
    ReconnectState reconnect_;
    std::optional<std::string> bot_id_;
};

} // namespace kookbridge::kook

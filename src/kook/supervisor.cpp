#include "kookbridge/kook/supervisor.hpp"
#include "kookbridge/core/logger.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace kookbridge::kook {

auto backoff_delay(int attempt, const GatewayTimings& timings) -> std::chrono::milliseconds {
    auto wait = timings.reconnect_base;
    for (int i = 1; i < attempt && wait < timings.reconnect_max; ++i) {
        wait *= 2;
    }
    return std::min(wait, timings.reconnect_max);
}

GatewaySupervisor::GatewaySupervisor(boost::asio::any_io_executor executor,
                                     std::shared_ptr<KookApi> api,
                                     std::shared_ptr<GatewayConnector> connector,
                                     GatewayTimings timings,
                                     EventSink sink,
                                     GatewayHooks hooks,
                                     std::string tag)
    : executor_(std::move(executor))
    , api_(std::move(api))
    , connector_(std::move(connector))
    , timings_(timings)
    , sink_(std::move(sink))
    , hooks_(std::move(hooks))
    , tag_(std::move(tag))
{
}

auto GatewaySupervisor::run(AbortSignal& abort) -> boost::asio::awaitable<void> {
    LOG_INFO("{}: starting gateway connection", tag_);

    while (!abort.aborted()) {
        if (session_.session_id.empty()) {
            co_await refresh_identity();
            if (abort.aborted()) {
                break;
            }
        }

        auto session = std::make_shared<ConnectionSession>(
            executor_, api_, connector_, session_, reconnect_, timings_, sink_, hooks_, tag_);
        auto outcome = co_await session->run(abort);
        if (outcome == SessionOutcome::Cancelled || abort.aborted()) {
            break;
        }

        ++reconnect_.attempt;
        reconnect_.next_wait = backoff_delay(reconnect_.attempt, timings_);
        LOG_INFO("{}: {}, reconnecting in {}ms (attempt {})",
                 tag_, session_outcome_name(outcome),
                 reconnect_.next_wait.count(), reconnect_.attempt);
        if (hooks_.on_reconnect_scheduled) {
            hooks_.on_reconnect_scheduled(reconnect_.attempt, reconnect_.next_wait);
        }

        if (!co_await wait_before_retry(reconnect_.next_wait, abort)) {
            break;
        }
    }

    session_.reset();
    reconnect_ = ReconnectState{};
    LOG_INFO("{}: gateway connection stopped", tag_);
}

auto GatewaySupervisor::refresh_identity() -> boost::asio::awaitable<void> {
    auto identity = co_await api_->fetch_self_identity();
    if (identity) {
        bot_id_ = identity->id;
        LOG_INFO("{}: bot ID resolved: {} ({})", tag_, identity->id, identity->username);
    } else {
        bot_id_.reset();
        LOG_WARN("{}: bot ID unknown, self-message filter disabled: {}",
                 tag_, identity.error().what());
    }
    if (hooks_.on_identity) {
        hooks_.on_identity(bot_id_);
    }
}

auto GatewaySupervisor::wait_before_retry(std::chrono::milliseconds delay, AbortSignal& abort)
    -> boost::asio::awaitable<bool> {
    auto timer = std::make_shared<boost::asio::steady_timer>(executor_, delay);
    AbortSubscription subscription(abort, [timer] {
        boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
    });

    boost::system::error_code ec;
    co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return !abort.aborted();
}

} // namespace kookbridge::kook

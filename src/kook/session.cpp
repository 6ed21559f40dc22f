#include "kookbridge/kook/session.hpp"
#include "kookbridge/core/logger.hpp"

#include <algorithm>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace kookbridge::kook {

namespace {

auto payload_string(const json& payload, std::string_view key) -> std::string {
    if (!payload.is_object()) return {};
    auto it = payload.find(key);
    return (it != payload.end() && it->is_string()) ? it->get<std::string>() : std::string{};
}

auto payload_code(const json& payload) -> int64_t {
    if (!payload.is_object()) return 0;
    auto it = payload.find("code");
    return (it != payload.end() && it->is_number_integer()) ? it->get<int64_t>() : 0;
}

} // anonymous namespace

auto session_state_name(SessionState state) -> std::string_view {
    switch (state) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::FetchingEndpoint: return "fetching_endpoint";
        case SessionState::Connecting: return "connecting";
        case SessionState::AwaitingHello: return "awaiting_hello";
        case SessionState::Live: return "live";
        case SessionState::Closing: return "closing";
        default: return "unknown";
    }
}

auto session_outcome_name(SessionOutcome outcome) -> std::string_view {
    switch (outcome) {
        case SessionOutcome::Cancelled: return "cancelled";
        case SessionOutcome::EndpointUnavailable: return "endpoint unavailable";
        case SessionOutcome::ConnectFailed: return "connect failed";
        case SessionOutcome::HelloTimeout: return "hello timeout";
        case SessionOutcome::ConnectionLost: return "connection lost";
        case SessionOutcome::ServerReconnect: return "server requested reconnect";
        default: return "unknown";
    }
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

ConnectionSession::ConnectionSession(boost::asio::any_io_executor executor,
                                     std::shared_ptr<KookApi> api,
                                     std::shared_ptr<GatewayConnector> connector,
                                     GatewaySession& state,
                                     ReconnectState& reconnect,
                                     GatewayTimings timings,
                                     EventSink sink,
                                     GatewayHooks hooks,
                                     std::string tag)
    : executor_(executor)
    , api_(std::move(api))
    , connector_(std::move(connector))
    , state_(state)
    , reconnect_(reconnect)
    , timings_(timings)
    , sink_(std::move(sink))
    , hooks_(std::move(hooks))
    , tag_(std::move(tag))
    , events_(executor, kSessionEventBacklog)
    , hello_timer_(executor)
    , heartbeat_timer_(executor)
{
}

// ---------------------------------------------------------------------------
// Event loop
// ---------------------------------------------------------------------------

auto ConnectionSession::run(AbortSignal& abort) -> boost::asio::awaitable<SessionOutcome> {
    if (abort.aborted()) {
        co_return co_await shutdown(SessionOutcome::Cancelled);
    }

    transition(SessionState::FetchingEndpoint);
    auto endpoint = co_await api_->fetch_gateway_endpoint();
    if (abort.aborted()) {
        co_return co_await shutdown(SessionOutcome::Cancelled);
    }
    if (!endpoint) {
        LOG_WARN("{}: failed to fetch gateway endpoint: {}", tag_, endpoint.error().what());
        co_return co_await shutdown(SessionOutcome::EndpointUnavailable);
    }
    state_.endpoint_url = *endpoint;

    transition(SessionState::Connecting);
    bool resuming = !state_.session_id.empty();
    auto url = resuming
        ? with_resume_params(*endpoint, state_.session_id, state_.last_sequence)
        : *endpoint;
    LOG_INFO("{}: connecting to gateway{}", tag_,
             resuming ? " (resume sn=" + std::to_string(state_.last_sequence) + ")" : "");

    auto connection = co_await connector_->connect(std::move(url));
    if (connection) {
        connection_ = std::move(*connection);
    }
    if (abort.aborted()) {
        co_return co_await shutdown(SessionOutcome::Cancelled);
    }
    if (!connection) {
        LOG_WARN("{}: failed to open gateway socket: {}", tag_, connection.error().what());
        co_return co_await shutdown(SessionOutcome::ConnectFailed);
    }

    auto self = shared_from_this();
    AbortSubscription subscription(abort, [self] {
        boost::asio::post(self->executor_, [self] {
            self->post_event(AbortRequested{});
        });
    });

    boost::asio::co_spawn(
        executor_,
        [self, conn = connection_]() -> boost::asio::awaitable<void> {
            co_await self->read_loop(conn);
        },
        boost::asio::detached);

    transition(SessionState::AwaitingHello);
    arm_hello_timer();

    for (;;) {
        auto event = co_await events_.async_receive(boost::asio::use_awaitable);
        std::optional<SessionOutcome> outcome;

        if (auto* arrived = std::get_if<FrameArrived>(&event)) {
            auto frame = parse_signal_frame(arrived->text);
            if (!frame) {
                LOG_WARN("{}: dropping malformed frame: {}", tag_, frame.error().what());
                continue;
            }
            outcome = handle_frame(*frame);
        } else if (auto* closed = std::get_if<SocketClosed>(&event)) {
            LOG_WARN("{}: websocket closed: {}", tag_, closed->error.what());
            outcome = SessionOutcome::ConnectionLost;
        } else if (auto* hello = std::get_if<HelloTimedOut>(&event)) {
            if (hello->generation == timer_generation_ &&
                state_.state == SessionState::AwaitingHello) {
                LOG_WARN("{}: no hello within {}ms", tag_, timings_.hello_timeout.count());
                outcome = SessionOutcome::HelloTimeout;
            }
        } else if (auto* due = std::get_if<HeartbeatDue>(&event)) {
            if (due->generation == timer_generation_ && state_.state == SessionState::Live) {
                auto sent = co_await send_heartbeat();
                if (!sent) {
                    LOG_WARN("{}: heartbeat send failed: {}", tag_, sent.error().what());
                    outcome = SessionOutcome::ConnectionLost;
                } else {
                    arm_heartbeat();
                }
            }
        } else if (std::holds_alternative<AbortRequested>(event)) {
            LOG_INFO("{}: abort signal received, closing websocket", tag_);
            outcome = SessionOutcome::Cancelled;
        }

        if (outcome) {
            co_return co_await shutdown(*outcome);
        }
    }
}

auto ConnectionSession::read_loop(std::shared_ptr<GatewayConnection> connection)
    -> boost::asio::awaitable<void> {
    for (;;) {
        auto text = co_await connection->read();
        boost::system::error_code ec;
        if (!text) {
            co_await events_.async_send(boost::system::error_code{},
                                        SessionEvent{SocketClosed{text.error()}},
                                        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            co_return;
        }
        co_await events_.async_send(boost::system::error_code{},
                                    SessionEvent{FrameArrived{std::move(*text)}},
                                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            // Session already shut down.
            co_return;
        }
    }
}

auto ConnectionSession::handle_frame(const SignalFrame& frame) -> std::optional<SessionOutcome> {
    switch (frame.signal) {
        case SignalType::Hello: {
            if (state_.state != SessionState::AwaitingHello) {
                LOG_DEBUG("{}: ignoring hello in state {}", tag_,
                          session_state_name(state_.state));
                return std::nullopt;
            }
            auto code = payload_code(frame.payload);
            if (code != 0) {
                LOG_ERROR("{}: gateway rejected handshake (code {})", tag_, code);
                state_.session_id.clear();
                state_.last_sequence = 0;
                return SessionOutcome::ConnectionLost;
            }

            defuse_timers();
            if (auto id = payload_string(frame.payload, "session_id"); !id.empty()) {
                state_.session_id = std::move(id);
            }
            reconnect_.attempt = 0;
            reconnect_.next_wait = std::chrono::milliseconds{0};
            transition(SessionState::Live);
            arm_heartbeat();
            LOG_INFO("{}: hello received, session={}", tag_, state_.session_id);
            return std::nullopt;
        }

        case SignalType::Event: {
            if (state_.state != SessionState::Live) {
                LOG_DEBUG("{}: ignoring event before hello", tag_);
                return std::nullopt;
            }
            if (frame.sequence) {
                state_.last_sequence = std::max(state_.last_sequence, *frame.sequence);
            }
            if (sink_) {
                sink_(frame.payload);
            }
            return std::nullopt;
        }

        case SignalType::Pong:
            LOG_TRACE("{}: pong", tag_);
            return std::nullopt;

        case SignalType::Reconnect:
            LOG_INFO("{}: server requested reconnect", tag_);
            state_.session_id.clear();
            state_.last_sequence = 0;
            return SessionOutcome::ServerReconnect;

        case SignalType::ResumeAck: {
            if (auto id = payload_string(frame.payload, "session_id"); !id.empty()) {
                state_.session_id = std::move(id);
            }
            LOG_INFO("{}: resume acknowledged, session={}", tag_, state_.session_id);
            return std::nullopt;
        }

        case SignalType::Ping:
            LOG_TRACE("{}: ignoring ping from server", tag_);
            return std::nullopt;
    }
    return std::nullopt;
}

auto ConnectionSession::send_heartbeat() -> boost::asio::awaitable<Result<void>> {
    if (!connection_) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionClosed, "No gateway connection"));
    }
    LOG_TRACE("{}: ping sn={}", tag_, state_.last_sequence);
    co_return co_await connection_->write(serialize_signal_frame(make_ping(state_.last_sequence)));
}

auto ConnectionSession::shutdown(SessionOutcome outcome)
    -> boost::asio::awaitable<SessionOutcome> {
    if (state_.state != SessionState::Disconnected) {
        transition(SessionState::Closing);
    }
    defuse_timers();
    if (connection_) {
        co_await connection_->close();
        connection_.reset();
    }
    events_.close();
    events_.cancel();
    transition(SessionState::Disconnected);

    if (outcome == SessionOutcome::Cancelled) {
        state_.reset();
    }
    LOG_DEBUG("{}: session ended ({})", tag_, session_outcome_name(outcome));
    co_return outcome;
}

// ---------------------------------------------------------------------------
// State and timers
// ---------------------------------------------------------------------------

void ConnectionSession::transition(SessionState next) {
    auto previous = state_.state;
    if (previous == next) {
        return;
    }
    state_.state = next;
    LOG_DEBUG("{}: {} -> {}", tag_, session_state_name(previous), session_state_name(next));
    if (hooks_.on_state_change) {
        hooks_.on_state_change(previous, next);
    }
}

void ConnectionSession::post_event(SessionEvent event) {
    if (!events_.is_open() || events_.try_send(boost::system::error_code{}, event)) {
        return;
    }
    // Backlog full: wait for room without blocking the caller.
    boost::asio::co_spawn(
        executor_,
        [self = shared_from_this(), event = std::move(event)]() mutable
            -> boost::asio::awaitable<void> {
            boost::system::error_code ec;
            co_await self->events_.async_send(
                boost::system::error_code{}, std::move(event),
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        },
        boost::asio::detached);
}

void ConnectionSession::arm_hello_timer() {
    auto generation = ++timer_generation_;
    hello_timer_.expires_after(timings_.hello_timeout);
    hello_timer_.async_wait(
        [self = shared_from_this(), generation](const boost::system::error_code& ec) {
            if (ec || generation != self->timer_generation_) {
                return;
            }
            self->post_event(HelloTimedOut{generation});
        });
}

void ConnectionSession::arm_heartbeat() {
    auto generation = ++timer_generation_;
    heartbeat_timer_.expires_after(timings_.heartbeat_interval);
    heartbeat_timer_.async_wait(
        [self = shared_from_this(), generation](const boost::system::error_code& ec) {
            if (ec || generation != self->timer_generation_) {
                return;
            }
            self->post_event(HeartbeatDue{generation});
        });
}

void ConnectionSession::defuse_timers() {
    ++timer_generation_;
    hello_timer_.cancel();
    heartbeat_timer_.cancel();
}

} // namespace kookbridge::kook

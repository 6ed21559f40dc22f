#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>

#include "kookbridge/core/abort.hpp"
#include "kookbridge/kook/client.hpp"
#include "kookbridge/kook/frame.hpp"
#include "kookbridge/kook/transport.hpp"

namespace kookbridge::kook {

using json = nlohmann::json;

/// Protocol timings. Tests shrink them; production uses the defaults.
struct GatewayTimings {
    std::chrono::milliseconds hello_timeout{6000};
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds reconnect_base{2000};
    std::chrono::milliseconds reconnect_max{60000};
};

enum class SessionState {
    Disconnected,
    FetchingEndpoint,
    Connecting,
    AwaitingHello,
    Live,
    Closing,
};

auto session_state_name(SessionState state) -> std::string_view;

/// Why a ConnectionSession ended.
enum class SessionOutcome {
    Cancelled,
    EndpointUnavailable,
    ConnectFailed,
    HelloTimeout,
    ConnectionLost,
    ServerReconnect,
};

auto session_outcome_name(SessionOutcome outcome) -> std::string_view;

/// Gateway state that outlives a single socket. Owned by the supervisor;
/// `session_id` and `last_sequence` carry over into resumed connections.
struct GatewaySession {
    std::string endpoint_url;
    std::string session_id;
    int64_t last_sequence = 0;
    SessionState state = SessionState::Disconnected;

    void reset() {
        endpoint_url.clear();
        session_id.clear();
        last_sequence = 0;
        state = SessionState::Disconnected;
    }
};

struct ReconnectState {
    int attempt = 0;
    std::chrono::milliseconds next_wait{0};
};

/// Observer callbacks. All run on the account's strand.
struct GatewayHooks {
    std::function<void(SessionState from, SessionState to)> on_state_change;
    std::function<void(int attempt, std::chrono::milliseconds wait)> on_reconnect_scheduled;
    std::function<void(const std::optional<std::string>& bot_id)> on_identity;
};

/// Receives the payload of every Event frame. Must not block.
using EventSink = std::function<void(json payload)>;

// Loop events, one per transition trigger.
struct FrameArrived { std::string text; };
struct SocketClosed { Error error; };
struct HelloTimedOut { uint64_t generation; };
struct HeartbeatDue { uint64_t generation; };
struct AbortRequested {};

using SessionEvent =
    std::variant<FrameArrived, SocketClosed, HelloTimedOut, HeartbeatDue, AbortRequested>;

using SessionEventChannel = boost::asio::experimental::concurrent_channel<
    void(boost::system::error_code, SessionEvent)>;

/// Events buffered ahead of the session loop before the socket reader waits.
inline constexpr std::size_t kSessionEventBacklog = 64;

/// One connection attempt: endpoint fetch, socket, handshake, heartbeat
/// and live relay, until the socket is gone or the run is cancelled.
///
/// All members are touched only from `executor`, which must be a strand
/// (or a single-threaded context).
class ConnectionSession : public std::enable_shared_from_this<ConnectionSession> {
public:
    ConnectionSession(boost::asio::any_io_executor executor,
                      std::shared_ptr<KookApi> api,
                      std::shared_ptr<GatewayConnector> connector,
                      GatewaySession& state,
                      ReconnectState& reconnect,
                      GatewayTimings timings,
                      EventSink sink,
                      GatewayHooks hooks,
                      std::string tag);

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    /// Runs the session to completion. Never throws.
    auto run(AbortSignal& abort) -> boost::asio::awaitable<SessionOutcome>;

private:
    void transition(SessionState next);

    /// Queues a control event from a timer or the abort signal. Dropped once
    /// the session has shut down.
    void post_event(SessionEvent event);

    void arm_hello_timer();
    void arm_heartbeat();
    void defuse_timers();

    auto read_loop(std::shared_ptr<GatewayConnection> connection) -> boost::asio::awaitable<void>;

    /// Returns an outcome when the frame ends the session.
    auto handle_frame(const SignalFrame& frame) -> std::optional<SessionOutcome>;

    auto send_heartbeat() -> boost::asio::awaitable<Result<void>>;
    auto shutdown(SessionOutcome outcome) -> boost::asio::awaitable<SessionOutcome>;

    boost::asio::any_io_executor executor_;
    std::shared_ptr<KookApi> api_;
    std::shared_ptr<GatewayConnector> connector_;
    GatewaySession& state_;
    ReconnectState& reconnect_;
    GatewayTimings timings_;
    EventSink sink_;
    GatewayHooks hooks_;
    std::string tag_;

    SessionEventChannel events_;
    boost::asio::steady_timer hello_timer_;
    boost::asio::steady_timer heartbeat_timer_;
    uint64_t timer_generation_ = 0;
    std::shared_ptr<GatewayConnection> connection_;
};

} // namespace kookbridge::kook

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "kookbridge/core/error.hpp"
#include "kookbridge/core/types.hpp"

namespace kookbridge::kook {

using json = nlohmann::json;

inline constexpr std::string_view kChannelId = "kook";
inline constexpr std::string_view kChannelLabel = "KOOK";

enum class PeerKind {
    Group,
    Direct,
};

struct RoutePeer {
    PeerKind kind = PeerKind::Direct;
    std::string id;
};

struct RouteRequest {
    std::string channel{kChannelId};
    std::string account_id;
    RoutePeer peer;
};

struct ResolvedRoute {
    std::string session_key;
    std::string account_id;
    std::string agent_id;
};

struct NotificationContext {
    std::string session_key;
    std::string context_key;
};

struct EnvelopeParams {
    std::string channel{kChannelLabel};
    std::string from;
    int64_t timestamp_ms = 0;
    std::string body;
};

/// Everything the host needs to produce a reply to one inbound message.
struct InboundContext {
    std::string body;               // envelope plus buffered history
    std::string raw_body;
    std::string command_body;
    std::string from;               // "kook:<sender>"
    std::string to;                 // "channel:<id>" or "user:<id>"
    std::string session_key;
    std::string account_id;
    ChatType chat_type = ChatType::Direct;
    std::optional<std::string> group_subject;
    std::string sender_name;
    std::string sender_id;
    std::string provider{kChannelId};
    std::string message_sid;
    int64_t timestamp_ms = 0;
    bool was_mentioned = false;
    bool command_authorized = true;
    std::string originating_to;
};

void to_json(json& j, const InboundContext& ctx);

enum class ReplyKind {
    Tool,
    Block,
    Final,
};

auto reply_kind_name(ReplyKind kind) -> std::string_view;

struct ReplyPayload {
    std::string text;
    std::optional<std::string> media_url;
};

struct DispatchCounts {
    int tool = 0;
    int block = 0;
    int final = 0;
};

struct DispatchOutcome {
    bool queued_final = false;
    DispatchCounts counts;
};

/// Sink for replies the host produces for one inbound message.
class ReplyDispatcher {
public:
    virtual ~ReplyDispatcher() = default;

    virtual auto deliver(ReplyPayload payload, ReplyKind kind)
        -> boost::asio::awaitable<Result<void>> = 0;

    /// Called by the host when producing or delivering a reply failed.
    virtual void on_error(const Error& error, ReplyKind kind) = 0;
};

struct PairingRequest {
    std::string channel{kChannelId};
    std::string account_id;
    std::string sender_id;
    std::optional<std::string> sender_name;
};

/// Capabilities the bridge consumes from the host messaging runtime.
/// Passed explicitly to every component that needs it.
class HostRuntime {
public:
    virtual ~HostRuntime() = default;

    virtual auto resolve_route(const RouteRequest& request) -> Result<ResolvedRoute> = 0;

    virtual void enqueue_notification(std::string text, NotificationContext context) = 0;

    virtual auto format_envelope(const EnvelopeParams& params) -> std::string = 0;

    virtual auto dispatch_reply(InboundContext context,
                                std::shared_ptr<ReplyDispatcher> dispatcher)
        -> boost::asio::awaitable<Result<DispatchOutcome>> = 0;

    /// Final say on a DM accepted under the "pairing" policy.
    virtual auto authorize_pairing(PairingRequest request)
        -> boost::asio::awaitable<Result<bool>> = 0;
};

} // namespace kookbridge::kook

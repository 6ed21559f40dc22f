#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "kookbridge/core/error.hpp"
#include "kookbridge/infra/http_client.hpp"
#include "kookbridge/kook/event.hpp"

namespace kookbridge::kook {

using json = nlohmann::json;

inline constexpr std::string_view kKookApiHost = "https://www.kookapp.cn";
inline constexpr std::string_view kKookApiPrefix = "/api/v3";

struct BotIdentity {
    std::string id;
    std::string username;
    std::optional<std::string> identify_num;
    bool bot = true;
};

struct ChannelMessageRequest {
    std::string target_id;
    std::string content;
    int type = message_type::KMarkdown;
    std::optional<std::string> quote;
    std::optional<std::string> temp_target_id;
};

/// Exactly one of `target_id` (user id) or `chat_code` is set.
struct DirectMessageRequest {
    std::optional<std::string> target_id;
    std::optional<std::string> chat_code;
    std::string content;
    int type = message_type::KMarkdown;
    std::optional<std::string> quote;
};

struct SentMessage {
    std::string message_id;
    int64_t timestamp_ms = 0;
    std::string nonce;
};

struct UserChat {
    std::string code;
    std::string target_id;
};

/// The KOOK REST surface the bridge consumes. Credentials are bound at
/// construction.
class KookApi {
public:
    virtual ~KookApi() = default;

    /// GET /gateway/index: the WebSocket URL for a new connection.
    virtual auto fetch_gateway_endpoint() -> boost::asio::awaitable<Result<std::string>> = 0;

    /// GET /user/me
    virtual auto fetch_self_identity() -> boost::asio::awaitable<Result<BotIdentity>> = 0;

    virtual auto send_channel_message(ChannelMessageRequest request)
        -> boost::asio::awaitable<Result<SentMessage>> = 0;

    virtual auto send_direct_message(DirectMessageRequest request)
        -> boost::asio::awaitable<Result<SentMessage>> = 0;

    /// Opens (or returns the existing) DM session with a user.
    virtual auto create_user_chat(std::string user_id)
        -> boost::asio::awaitable<Result<UserChat>> = 0;

    virtual auto update_channel_message(std::string message_id, std::string content)
        -> boost::asio::awaitable<Result<void>> = 0;

    virtual auto delete_channel_message(std::string message_id)
        -> boost::asio::awaitable<Result<void>> = 0;
};

/// Unwraps a KOOK `{code, message, data}` envelope. A non-zero `code`
/// becomes ApiError (Unauthorized for 401); `data` is returned otherwise.
auto parse_api_envelope(int http_status, std::string_view body) -> Result<json>;

/// KookApi over HTTPS.
class KookRestClient : public KookApi {
public:
    KookRestClient(boost::asio::io_context& ioc,
                   std::string token,
                   std::string host = std::string(kKookApiHost));

    auto fetch_gateway_endpoint() -> boost::asio::awaitable<Result<std::string>> override;
    auto fetch_self_identity() -> boost::asio::awaitable<Result<BotIdentity>> override;
    auto send_channel_message(ChannelMessageRequest request)
        -> boost::asio::awaitable<Result<SentMessage>> override;
    auto send_direct_message(DirectMessageRequest request)
        -> boost::asio::awaitable<Result<SentMessage>> override;
    auto create_user_chat(std::string user_id)
        -> boost::asio::awaitable<Result<UserChat>> override;
    auto update_channel_message(std::string message_id, std::string content)
        -> boost::asio::awaitable<Result<void>> override;
    auto delete_channel_message(std::string message_id)
        -> boost::asio::awaitable<Result<void>> override;

private:
    auto get(std::string path) -> boost::asio::awaitable<Result<json>>;
    auto post(std::string path, json body) -> boost::asio::awaitable<Result<json>>;

    infra::HttpClient http_;
};

} // namespace kookbridge::kook

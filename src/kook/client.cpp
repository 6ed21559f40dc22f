#include "kookbridge/kook/client.hpp"
#include "kookbridge/core/logger.hpp"

namespace kookbridge::kook {

namespace {

auto parse_sent_message(const json& data) -> SentMessage {
    SentMessage sent;
    if (!data.is_object()) {
        return sent;
    }
    sent.message_id = data.value("msg_id", "");
    if (auto it = data.find("msg_timestamp"); it != data.end() && it->is_number_integer()) {
        sent.timestamp_ms = it->get<int64_t>();
    }
    sent.nonce = data.value("nonce", "");
    return sent;
}

} // anonymous namespace

auto parse_api_envelope(int http_status, std::string_view body) -> Result<json> {
    json envelope;
    try {
        envelope = json::parse(body);
    } catch (const json::parse_error& e) {
        if (http_status < 200 || http_status >= 300) {
            return std::unexpected(
                make_error(ErrorCode::ApiError,
                           "KOOK API request failed",
                           "status=" + std::to_string(http_status)));
        }
        return std::unexpected(
            make_error(ErrorCode::SerializationError,
                       "Failed to parse KOOK API response", e.what()));
    }

    if (!envelope.is_object() || !envelope.contains("code")) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError,
                       "KOOK API response is not an envelope",
                       "status=" + std::to_string(http_status)));
    }

    int code = envelope["code"].is_number_integer() ? envelope["code"].get<int>() : -1;
    if (code != 0) {
        auto message = envelope.value("message", std::string{});
        if (message.empty()) {
            message = "code " + std::to_string(code);
        }
        return std::unexpected(
            make_error(code == 401 || http_status == 401 ? ErrorCode::Unauthorized
                                                         : ErrorCode::ApiError,
                       "KOOK API error", message));
    }

    if (auto it = envelope.find("data"); it != envelope.end()) {
        return *it;
    }
    return json(nullptr);
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

KookRestClient::KookRestClient(boost::asio::io_context& ioc,
                               std::string token,
                               std::string host)
    : http_(ioc, infra::HttpClientConfig{
          .base_url = std::move(host),
          .timeout_seconds = 30,
          .default_headers = {
              {"Authorization", "Bot " + token},
              {"User-Agent", "kookbridge"},
          },
      })
{
}

// ---------------------------------------------------------------------------
// Transport helpers
// ---------------------------------------------------------------------------

auto KookRestClient::get(std::string path) -> boost::asio::awaitable<Result<json>> {
    auto response = co_await http_.get(std::string(kKookApiPrefix) + path);
    if (!response) {
        co_return make_fail(response.error());
    }
    co_return parse_api_envelope(response->status, response->body);
}

auto KookRestClient::post(std::string path, json body) -> boost::asio::awaitable<Result<json>> {
    auto response = co_await http_.post(std::string(kKookApiPrefix) + path, body.dump());
    if (!response) {
        co_return make_fail(response.error());
    }
    co_return parse_api_envelope(response->status, response->body);
}

// ---------------------------------------------------------------------------
// Endpoints
// ---------------------------------------------------------------------------

auto KookRestClient::fetch_gateway_endpoint() -> boost::asio::awaitable<Result<std::string>> {
    auto data = co_await get("/gateway/index?compress=0");
    if (!data) {
        co_return make_fail(data.error());
    }
    auto url = data->is_object() ? data->value("url", std::string{}) : std::string{};
    if (url.empty()) {
        co_return make_fail(
            make_error(ErrorCode::ProtocolError, "Gateway response carries no url"));
    }
    co_return url;
}

auto KookRestClient::fetch_self_identity() -> boost::asio::awaitable<Result<BotIdentity>> {
    auto data = co_await get("/user/me");
    if (!data) {
        co_return make_fail(data.error());
    }
    if (!data->is_object()) {
        co_return make_fail(
            make_error(ErrorCode::SerializationError, "User response is not an object"));
    }

    BotIdentity identity;
    if (auto it = data->find("id"); it != data->end()) {
        identity.id = it->is_string() ? it->get<std::string>()
                                      : it->is_number_integer() ? std::to_string(it->get<int64_t>())
                                                                : std::string{};
    }
    identity.username = data->value("username", "");
    if (auto it = data->find("identify_num"); it != data->end() && it->is_string()) {
        identity.identify_num = it->get<std::string>();
    }
    identity.bot = data->value("bot", true);

    if (identity.id.empty()) {
        co_return make_fail(
            make_error(ErrorCode::ProtocolError, "User response carries no id"));
    }
    co_return identity;
}

auto KookRestClient::send_channel_message(ChannelMessageRequest request)
    -> boost::asio::awaitable<Result<SentMessage>> {
    json body = {
        {"target_id", request.target_id},
        {"content", request.content},
        {"type", request.type},
    };
    if (request.quote) body["quote"] = *request.quote;
    if (request.temp_target_id) body["temp_target_id"] = *request.temp_target_id;

    auto data = co_await post("/message/create", std::move(body));
    if (!data) {
        co_return make_fail(data.error());
    }
    co_return parse_sent_message(*data);
}

auto KookRestClient::send_direct_message(DirectMessageRequest request)
    -> boost::asio::awaitable<Result<SentMessage>> {
    if (!request.target_id && !request.chat_code) {
        co_return make_fail(
            make_error(ErrorCode::InvalidArgument,
                       "Direct message needs a target_id or chat_code"));
    }

    json body = {
        {"content", request.content},
        {"type", request.type},
    };
    if (request.target_id) body["target_id"] = *request.target_id;
    if (request.chat_code) body["chat_code"] = *request.chat_code;
    if (request.quote) body["quote"] = *request.quote;

    auto data = co_await post("/direct-message/create", std::move(body));
    if (!data) {
        co_return make_fail(data.error());
    }
    co_return parse_sent_message(*data);
}

auto KookRestClient::create_user_chat(std::string user_id)
    -> boost::asio::awaitable<Result<UserChat>> {
    auto data = co_await post("/user-chat/create", json{{"target_id", user_id}});
    if (!data) {
        co_return make_fail(data.error());
    }

    UserChat chat;
    chat.code = data->is_object() ? data->value("code", std::string{}) : std::string{};
    chat.target_id = user_id;
    if (chat.code.empty()) {
        co_return make_fail(
            make_error(ErrorCode::ProtocolError, "User chat response carries no code"));
    }
    co_return chat;
}

auto KookRestClient::update_channel_message(std::string message_id, std::string content)
    -> boost::asio::awaitable<Result<void>> {
    auto data = co_await post("/message/update",
                              json{{"msg_id", message_id}, {"content", content}});
    if (!data) {
        co_return make_fail(data.error());
    }
    co_return ok_result();
}

auto KookRestClient::delete_channel_message(std::string message_id)
    -> boost::asio::awaitable<Result<void>> {
    auto data = co_await post("/message/delete", json{{"msg_id", message_id}});
    if (!data) {
        co_return make_fail(data.error());
    }
    LOG_DEBUG("kook: deleted message {}", message_id);
    co_return ok_result();
}

} // namespace kookbridge::kook

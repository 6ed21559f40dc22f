#include "kookbridge/channels/kook.hpp"
#include "kookbridge/core/logger.hpp"
#include "kookbridge/kook/sender.hpp"

namespace kookbridge::channels {

void to_json(json& j, const KookStatus& s) {
    j = json{
        {"account_id", s.account_id},
        {"running", s.running},
        {"state", kook::session_state_name(s.state)},
        {"reconnect_attempt", s.reconnect_attempt},
        {"next_wait_ms", s.next_wait.count()},
    };
    if (s.bot_id) j["bot_id"] = *s.bot_id;
    if (s.last_error) j["last_error"] = *s.last_error;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

KookChannel::KookChannel(KookChannelOptions options, boost::asio::io_context& ioc)
    : options_(std::move(options))
    , ioc_(ioc)
    , account_id_(kook::normalize_account_id(options_.account_id))
{
    status_.account_id = account_id_;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

auto KookChannel::start() -> boost::asio::awaitable<Result<void>> {
    if (running_.exchange(true)) {
        co_return make_fail(make_error(ErrorCode::ChannelError,
                                       "KOOK channel '" + account_id_ + "' is already running"));
    }
    LOG_INFO("[kook] Starting channel '{}'", account_id_);
    {
        std::lock_guard lock(status_mutex_);
        status_.running = true;
        status_.last_error.reset();
    }

    kook::GatewayHooks hooks;
    hooks.on_state_change = [this](kook::SessionState, kook::SessionState to) {
        std::lock_guard lock(status_mutex_);
        status_.state = to;
        if (to == kook::SessionState::Live) {
            status_.reconnect_attempt = 0;
            status_.next_wait = std::chrono::milliseconds{0};
        }
    };
    hooks.on_reconnect_scheduled = [this](int attempt, std::chrono::milliseconds wait) {
        std::lock_guard lock(status_mutex_);
        status_.reconnect_attempt = attempt;
        status_.next_wait = wait;
    };
    hooks.on_identity = [this](const std::optional<std::string>& bot_id) {
        std::lock_guard lock(status_mutex_);
        status_.bot_id = bot_id;
    };

    auto result = co_await kook::monitor_kook(ioc_, kook::MonitorOptions{
        .config = options_.config,
        .host = options_.host,
        .abort = &abort_,
        .account_id = account_id_,
        .timings = options_.timings,
        .make_api = options_.make_api,
        .make_connector = options_.make_connector,
        .hooks = std::move(hooks),
    });

    running_.store(false);
    {
        std::lock_guard lock(status_mutex_);
        status_.running = false;
        status_.state = kook::SessionState::Disconnected;
        if (!result) {
            status_.last_error = result.error().what();
        }
    }

    if (!result) {
        LOG_ERROR("[kook] Channel '{}' failed to start: {}", account_id_, result.error().what());
        co_return make_fail(result.error());
    }
    LOG_INFO("[kook] Channel '{}' stopped", account_id_);
    co_return ok_result();
}

auto KookChannel::stop() -> boost::asio::awaitable<void> {
    LOG_INFO("[kook] Stopping channel '{}'", account_id_);
    abort_.abort();
    co_return;
}

// ---------------------------------------------------------------------------
// Sending
// ---------------------------------------------------------------------------

auto KookChannel::make_api(const kook::AccountView& account) const
    -> std::shared_ptr<kook::KookApi> {
    if (options_.make_api) {
        return options_.make_api(account);
    }
    return std::make_shared<kook::KookRestClient>(ioc_, account.token);
}

auto KookChannel::send(OutgoingMessage msg) -> boost::asio::awaitable<Result<void>> {
    if (!options_.config) {
        co_return make_fail(make_error(ErrorCode::InvalidConfig,
                                       "Config is required for KOOK send"));
    }
    auto account = kook::resolve_account(options_.config(), msg.account_id.value_or(account_id_));
    if (!account.configured) {
        co_return make_fail(make_error(ErrorCode::InvalidConfig,
            "KOOK bot token not configured for account '" + account.account_id + "'"));
    }

    kook::KookSender sender(make_api(account), account.text_chunk_limit);
    kook::SendOptions send_options{.reply_to = msg.reply_to, .is_dm = false};

    Result<kook::SendResult> sent;
    if (msg.media_url) {
        sent = co_await sender.send_media(msg.recipient_id, msg.text, *msg.media_url, send_options);
    } else {
        sent = co_await sender.send_text(msg.recipient_id, msg.text, send_options);
    }
    if (!sent) {
        co_return make_fail(sent.error());
    }

    LOG_DEBUG("[kook] Sent message {} to {}", sent->message_id, sent->chat_id);
    co_return ok_result();
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

auto KookChannel::status() const -> KookStatus {
    std::lock_guard lock(status_mutex_);
    return status_;
}

} // namespace kookbridge::channels

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "kookbridge/channels/channel.hpp"
#include "kookbridge/core/abort.hpp"
#include "kookbridge/kook/monitor.hpp"

namespace kookbridge::channels {

using json = nlohmann::json;

/// Live view of one KOOK account's gateway.
struct KookStatus {
    std::string account_id;
    bool running = false;
    kook::SessionState state = kook::SessionState::Disconnected;
    int reconnect_attempt = 0;
    std::chrono::milliseconds next_wait{0};
    std::optional<std::string> bot_id;
    std::optional<std::string> last_error;
};

void to_json(json& j, const KookStatus& s);

struct KookChannelOptions {
    kook::ConfigProvider config;
    std::shared_ptr<kook::HostRuntime> host;
    /// Empty selects the default account.
    std::string account_id;
    kook::GatewayTimings timings;
    kook::ApiFactory make_api;
    kook::ConnectorFactory make_connector;
};

/// One KOOK account as a channel: start() runs the gateway monitor, send()
/// goes out over the REST API.
class KookChannel : public Channel {
public:
    KookChannel(KookChannelOptions options, boost::asio::io_context& ioc);
    ~KookChannel() override = default;

    auto start() -> boost::asio::awaitable<Result<void>> override;
    auto stop() -> boost::asio::awaitable<void> override;
    auto send(OutgoingMessage msg) -> boost::asio::awaitable<Result<void>> override;

    [[nodiscard]] auto name() const -> std::string_view override { return account_id_; }
    [[nodiscard]] auto type() const -> std::string_view override { return kook::kChannelId; }
    [[nodiscard]] auto is_running() const noexcept -> bool override { return running_.load(); }

    /// Thread-safe copy of the current status.
    [[nodiscard]] auto status() const -> KookStatus;

private:
    auto make_api(const kook::AccountView& account) const -> std::shared_ptr<kook::KookApi>;

    KookChannelOptions options_;
    boost::asio::io_context& ioc_;
    std::string account_id_;
    AbortSignal abort_;
    std::atomic<bool> running_{false};

    mutable std::mutex status_mutex_;
    KookStatus status_;
};

} // namespace kookbridge::channels

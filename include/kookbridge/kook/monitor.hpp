#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "kookbridge/core/abort.hpp"
#include "kookbridge/core/config.hpp"
#include "kookbridge/kook/account.hpp"
#include "kookbridge/kook/client.hpp"
#include "kookbridge/kook/host.hpp"
#include "kookbridge/kook/inbound.hpp"
#include "kookbridge/kook/session.hpp"
#include "kookbridge/kook/transport.hpp"

namespace kookbridge::kook {

/// Builds the REST client for an account. Defaults to KookRestClient.
using ApiFactory = std::function<std::shared_ptr<KookApi>(const AccountView&)>;

/// Builds the socket connector for an account. Defaults to BeastConnector.
using ConnectorFactory =
    std::function<std::shared_ptr<GatewayConnector>(boost::asio::any_io_executor)>;

struct MonitorOptions {
    ConfigProvider config;
    std::shared_ptr<HostRuntime> host;
    AbortSignal* abort = nullptr;
    /// Monitor only this account; all enabled accounts when unset.
    std::optional<std::string> account_id;

    GatewayTimings timings;
    ApiFactory make_api;
    ConnectorFactory make_connector;
    /// Extra observer callbacks, e.g. for a status snapshot.
    GatewayHooks hooks;
};

/// Runs the gateway for one or all KOOK accounts until `abort` fires.
///
/// Configuration problems (no config, disabled or token-less account) fail
/// with InvalidConfig before any socket is opened. Network failures are
/// retried internally and never returned.
auto monitor_kook(boost::asio::io_context& ioc, MonitorOptions options)
    -> boost::asio::awaitable<Result<void>>;

} // namespace kookbridge::kook

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include "kookbridge/core/error.hpp"

namespace kookbridge::kook {

/// One open gateway socket carrying text frames.
///
/// One read() and one write()/close() may be outstanding at the same time.
class GatewayConnection {
public:
    virtual ~GatewayConnection() = default;

    /// Next text message. ConnectionClosed once the socket is gone.
    virtual auto read() -> boost::asio::awaitable<Result<std::string>> = 0;

    virtual auto write(std::string text) -> boost::asio::awaitable<Result<void>> = 0;

    /// Closes the socket; later calls do nothing. A pending read() completes
    /// with ConnectionClosed.
    virtual auto close() -> boost::asio::awaitable<void> = 0;

    [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;
};

/// Opens gateway sockets.
class GatewayConnector {
public:
    virtual ~GatewayConnector() = default;

    virtual auto connect(std::string url)
        -> boost::asio::awaitable<Result<std::shared_ptr<GatewayConnection>>> = 0;
};

struct GatewayUrl {
    bool secure = true;
    std::string host;
    std::string port;
    std::string target;   // path plus query, "/" at minimum
};

/// Splits a ws:// or wss:// URL.
auto parse_gateway_url(std::string_view url) -> Result<GatewayUrl>;

/// Appends KOOK's resume parameters (`resume=1&sn=..&session_id=..`).
auto with_resume_params(std::string_view url, std::string_view session_id, int64_t last_sequence)
    -> std::string;

/// Beast WebSocket over TLS.
class BeastConnector : public GatewayConnector {
public:
    explicit BeastConnector(boost::asio::any_io_executor executor);
    ~BeastConnector() override;

    auto connect(std::string url)
        -> boost::asio::awaitable<Result<std::shared_ptr<GatewayConnection>>> override;

private:
    boost::asio::any_io_executor executor_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
};

} // namespace kookbridge::kook

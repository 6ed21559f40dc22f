#include "kookbridge/kook/transport.hpp"
#include "kookbridge/core/logger.hpp"
#include "kookbridge/core/utils.hpp"

#include <chrono>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

namespace kookbridge::kook {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;

using WsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

// ---------------------------------------------------------------------------
// URL helpers
// ---------------------------------------------------------------------------

auto parse_gateway_url(std::string_view url) -> Result<GatewayUrl> {
    GatewayUrl parsed;
    std::string_view rest = url;

    if (utils::starts_with_icase(rest, "wss://")) {
        parsed.secure = true;
        rest.remove_prefix(6);
    } else if (utils::starts_with_icase(rest, "ws://")) {
        parsed.secure = false;
        rest.remove_prefix(5);
    } else {
        return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "Gateway URL must be ws:// or wss://",
                       std::string(url)));
    }

    auto slash = rest.find_first_of("/?");
    auto authority = rest.substr(0, slash);
    parsed.target = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));
    if (parsed.target.front() == '?') {
        parsed.target.insert(0, "/");
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        parsed.host = std::string(authority.substr(0, colon));
        parsed.port = std::string(authority.substr(colon + 1));
    } else {
        parsed.host = std::string(authority);
        parsed.port = parsed.secure ? "443" : "80";
    }

    if (parsed.host.empty() || parsed.port.empty()) {
        return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "Gateway URL has no host", std::string(url)));
    }
    return parsed;
}

auto with_resume_params(std::string_view url, std::string_view session_id, int64_t last_sequence)
    -> std::string {
    std::string out(url);
    out += url.find('?') == std::string_view::npos ? '?' : '&';
    out += "resume=1&sn=" + std::to_string(last_sequence);
    out += "&session_id=" + utils::url_encode(session_id);
    return out;
}

// ---------------------------------------------------------------------------
// BeastConnection
// ---------------------------------------------------------------------------

namespace {

class BeastConnection : public GatewayConnection {
public:
    BeastConnection(std::shared_ptr<ssl::context> ctx, std::unique_ptr<WsStream> ws)
        : ctx_(std::move(ctx)), ws_(std::move(ws)) {
        ws_->text(true);
    }

    auto read() -> net::awaitable<Result<std::string>> override {
        if (!open_) {
            co_return make_fail(
                make_error(ErrorCode::ConnectionClosed, "Gateway connection is closed"));
        }

        beast::flat_buffer buffer;
        boost::system::error_code ec;
        co_await ws_->async_read(buffer, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            open_ = false;
            if (ec == websocket::error::closed) {
                co_return make_fail(
                    make_error(ErrorCode::ConnectionClosed,
                               "Gateway closed the connection",
                               "code=" + std::to_string(ws_->reason().code) +
                               " reason=" + std::string(ws_->reason().reason.c_str())));
            }
            co_return make_fail(
                make_error(ErrorCode::ConnectionClosed, "Gateway read failed", ec.message()));
        }
        co_return beast::buffers_to_string(buffer.data());
    }

    auto write(std::string text) -> net::awaitable<Result<void>> override {
        if (!open_) {
            co_return make_fail(
                make_error(ErrorCode::ConnectionClosed, "Gateway connection is closed"));
        }

        boost::system::error_code ec;
        co_await ws_->async_write(net::buffer(text), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return make_fail(
                make_error(ErrorCode::IoError, "Gateway write failed", ec.message()));
        }
        co_return ok_result();
    }

    auto close() -> net::awaitable<void> override {
        if (closed_) {
            co_return;
        }
        closed_ = true;

        if (open_ && ws_->is_open()) {
            boost::system::error_code ec;
            co_await ws_->async_close(websocket::close_code::normal,
                                      net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_DEBUG("kook: websocket close handshake failed: {}", ec.message());
            }
        }
        open_ = false;

        boost::system::error_code ec;
        beast::get_lowest_layer(*ws_).socket().close(ec);
    }

    [[nodiscard]] auto is_open() const noexcept -> bool override { return open_; }

private:
    std::shared_ptr<ssl::context> ctx_;
    std::unique_ptr<WsStream> ws_;
    bool open_ = true;
    bool closed_ = false;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// BeastConnector
// ---------------------------------------------------------------------------

BeastConnector::BeastConnector(net::any_io_executor executor)
    : executor_(std::move(executor))
    , ssl_ctx_(std::make_shared<ssl::context>(ssl::context::tlsv12_client))
{
    ssl_ctx_->set_default_verify_paths();
}

BeastConnector::~BeastConnector() = default;

auto BeastConnector::connect(std::string url)
    -> net::awaitable<Result<std::shared_ptr<GatewayConnection>>> {
    auto parsed = parse_gateway_url(url);
    if (!parsed) {
        co_return make_fail(parsed.error());
    }
    if (!parsed->secure) {
        co_return make_fail(
            make_error(ErrorCode::InvalidArgument, "KOOK gateway requires wss://"));
    }

    boost::system::error_code ec;
    net::ip::tcp::resolver resolver(executor_);
    auto const results = co_await resolver.async_resolve(
        parsed->host, parsed->port, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed, "Failed to resolve gateway host", ec.message()));
    }

    auto ws = std::make_unique<WsStream>(executor_, *ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), parsed->host.c_str())) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed, "Failed to set SNI hostname", parsed->host));
    }

    auto& tcp_stream = beast::get_lowest_layer(*ws);
    tcp_stream.expires_after(std::chrono::seconds(30));
    co_await tcp_stream.async_connect(results, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed, "Failed to connect to gateway", ec.message()));
    }

    co_await ws->next_layer().async_handshake(
        ssl::stream_base::client, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed, "TLS handshake failed", ec.message()));
    }
    tcp_stream.expires_never();

    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeouts.handshake_timeout = std::chrono::seconds(10);
    ws->set_option(timeouts);
    ws->set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "kookbridge");
        }));

    co_await ws->async_handshake(parsed->host, parsed->target,
                                 net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed, "WebSocket handshake failed", ec.message()));
    }

    LOG_DEBUG("kook: websocket connected to {}", parsed->host);
    co_return std::shared_ptr<GatewayConnection>(
        std::make_shared<BeastConnection>(ssl_ctx_, std::move(ws)));
}

} // namespace kookbridge::kook

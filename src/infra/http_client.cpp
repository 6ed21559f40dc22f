#include "kookbridge/infra/http_client.hpp"
#include "kookbridge/core/logger.hpp"

#include <httplib.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace kookbridge::infra {

namespace {

auto to_http_response(const httplib::Result& result)
    -> Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        if (err == httplib::Error::ConnectionTimeout || err == httplib::Error::Read) {
            return std::unexpected(
                make_error(ErrorCode::Timeout, "HTTP request timed out", httplib::to_string(err)));
        }
        return std::unexpected(
            make_error(ErrorCode::ConnectionFailed, "HTTP request failed", httplib::to_string(err)));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;

    for (const auto& [key, value] : result->headers) {
        response.headers[key] = value;
    }

    return response;
}

auto to_headers(const std::map<std::string, std::string>& in) -> httplib::Headers {
    httplib::Headers hdrs;
    for (const auto& [k, v] : in) {
        hdrs.emplace(k, v);
    }
    return hdrs;
}

} // anonymous namespace

struct HttpClient::Impl {
    boost::asio::io_context& ioc;
    HttpClientConfig config;

    Impl(boost::asio::io_context& ioc_, HttpClientConfig config_)
        : ioc(ioc_), config(std::move(config_)) {
        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }

    /// Creates a fresh client (httplib::Client is not thread-safe).
    auto make_client() const -> std::unique_ptr<httplib::Client> {
        auto client = std::make_unique<httplib::Client>(config.base_url);
        client->set_connection_timeout(config.timeout_seconds);
        client->set_read_timeout(config.timeout_seconds);
        client->set_write_timeout(config.timeout_seconds);
        client->set_default_headers(to_headers(config.default_headers));
        return client;
    }

    /// Runs a blocking httplib call on a background thread and resumes the
    /// awaiting coroutine once it completes.
    auto run_blocking(std::function<httplib::Result(httplib::Client&)> call)
        -> boost::asio::awaitable<Result<HttpResponse>> {
        struct CallState {
            std::mutex mtx;
            std::optional<Result<HttpResponse>> result;
        };

        auto state = std::make_shared<CallState>();
        auto executor = co_await boost::asio::this_coro::executor;
        auto timer = std::make_shared<boost::asio::steady_timer>(
            executor, boost::asio::steady_timer::time_point::max());

        std::thread([state, timer, call = std::move(call), client = make_client()]() mutable {
            auto response = to_http_response(call(*client));
            {
                std::lock_guard lock(state->mtx);
                state->result = std::move(response);
            }
            // Post cancel to the timer's executor for thread safety.
            boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
        }).detach();

        boost::system::error_code ec;
        co_await timer->async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        std::lock_guard lock(state->mtx);
        if (!state->result.has_value()) {
            // Timer was cancelled by io_context shutdown, not by our thread.
            co_return make_fail(
                make_error(ErrorCode::ConnectionClosed,
                           "HTTP request was cancelled", ec.message()));
        }
        co_return std::move(*state->result);
    }
};

HttpClient::HttpClient(boost::asio::io_context& ioc, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(ioc, std::move(config))) {}

HttpClient::~HttpClient() = default;

auto HttpClient::get(std::string_view path,
                     const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    LOG_DEBUG("GET {}{}", impl_->config.base_url, path);
    co_return co_await impl_->run_blocking(
        [p = std::string(path), hdrs = to_headers(headers)](httplib::Client& client) {
            return client.Get(p, hdrs);
        });
}

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    LOG_DEBUG("POST {}{}", impl_->config.base_url, path);
    co_return co_await impl_->run_blocking(
        [p = std::string(path), b = std::string(body),
         ct = std::string(content_type),
         hdrs = to_headers(headers)](httplib::Client& client) {
            return client.Post(p, hdrs, b, ct);
        });
}

} // namespace kookbridge::infra

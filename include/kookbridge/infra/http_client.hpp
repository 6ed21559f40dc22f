#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio.hpp>

#include "kookbridge/core/error.hpp"

namespace kookbridge::infra {

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;
    int timeout_seconds = 30;
    std::map<std::string, std::string> default_headers;
};

/// Asynchronous HTTP client wrapping cpp-httplib.
/// Each request runs on a background thread so the calling coroutine's
/// executor keeps serving other work (heartbeats, frame decoding).
class HttpClient {
public:
    explicit HttpClient(boost::asio::io_context& ioc, HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// Performs an asynchronous HTTP GET request.
    auto get(std::string_view path,
             const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Performs an asynchronous HTTP POST request.
    auto post(std::string_view path,
              std::string_view body,
              std::string_view content_type = "application/json",
              const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kookbridge::infra

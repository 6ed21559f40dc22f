#pragma once

#include <string_view>

#include <boost/asio/awaitable.hpp>

#include "kookbridge/core/error.hpp"
#include "kookbridge/channels/message.hpp"

namespace kookbridge::channels {

/// Abstract base class for a platform channel: start/stop its inbound side
/// and send messages out through it.
class Channel {
public:
    virtual ~Channel() = default;

    /// Runs the channel until stop() is called or startup fails.
    virtual auto start() -> boost::asio::awaitable<Result<void>> = 0;

    virtual auto stop() -> boost::asio::awaitable<void> = 0;

    virtual auto send(OutgoingMessage msg) -> boost::asio::awaitable<Result<void>> = 0;

    /// Returns the instance name of this channel (e.g. "kook").
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// Returns the channel type identifier.
    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    [[nodiscard]] virtual auto is_running() const noexcept -> bool = 0;
};

} // namespace kookbridge::channels

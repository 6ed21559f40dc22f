#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "kookbridge/core/error.hpp"
#include "kookbridge/kook/account.hpp"
#include "kookbridge/kook/client.hpp"

namespace kookbridge::kook {

/// Strips `kook:channel:`, `kook:user:`, `kook:dm:`, `kook:group:`, a bare
/// `kook:` and the short `channel:` / `user:` forms, then trims.
/// Returns InvalidArgument when nothing is left.
auto normalize_target(std::string_view target) -> Result<std::string>;

/// `user:` / `kook:user:` targets address a person.
auto is_direct_target(std::string_view target) -> bool;

/// DM session codes are long lowercase hex strings.
auto is_chat_code(std::string_view id) -> bool;

struct SendOptions {
    std::optional<std::string> reply_to;
    bool is_dm = false;
};

struct SendResult {
    std::string message_id;
    std::string chat_id;
};

void to_json(nlohmann::json& j, const SendResult& r);

/// Outbound messages for one account. Text goes out as KMarkdown and is
/// split at `text_chunk_limit`.
class KookSender {
public:
    KookSender(std::shared_ptr<KookApi> api, int text_chunk_limit = kDefaultTextChunkLimit);

    /// Sends `text` to `to`, one message per chunk. Returns the result of
    /// the last chunk; stops at the first failed chunk.
    auto send_text(std::string_view to, std::string_view text, SendOptions options = {})
        -> boost::asio::awaitable<Result<SendResult>>;

    /// KOOK only renders pre-uploaded assets inline, so media goes out as a
    /// link after the optional caption.
    auto send_media(std::string_view to,
                    std::string_view text,
                    std::string_view media_url,
                    SendOptions options = {})
        -> boost::asio::awaitable<Result<SendResult>>;

    /// Opens a DM session with `user_id` and returns its chat code.
    auto open_dm_session(std::string_view user_id) -> boost::asio::awaitable<Result<std::string>>;

    [[nodiscard]] auto text_chunk_limit() const noexcept -> int { return text_chunk_limit_; }

private:
    auto send_one(std::string_view to, std::string_view text, const SendOptions& options)
        -> boost::asio::awaitable<Result<SendResult>>;

    std::shared_ptr<KookApi> api_;
    int text_chunk_limit_;
};

} // namespace kookbridge::kook

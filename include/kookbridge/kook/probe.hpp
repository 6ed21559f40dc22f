#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "kookbridge/kook/client.hpp"

namespace kookbridge::kook {

struct ProbeResult {
    bool ok = false;
    std::optional<std::string> error;
    std::optional<std::string> bot_id;
    std::optional<std::string> bot_name;
};

void to_json(nlohmann::json& j, const ProbeResult& r);

/// Verifies credentials by asking KOOK who the bot is. Never fails; the
/// outcome is reported in the result.
auto probe_bot(KookApi& api, std::string_view token) -> boost::asio::awaitable<ProbeResult>;

} // namespace kookbridge::kook

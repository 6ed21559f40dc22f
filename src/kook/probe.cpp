#include "kookbridge/kook/probe.hpp"
#include "kookbridge/core/logger.hpp"

namespace kookbridge::kook {

void to_json(nlohmann::json& j, const ProbeResult& r) {
    j = nlohmann::json{{"ok", r.ok}};
    if (r.error) j["error"] = *r.error;
    if (r.bot_id) j["bot_id"] = *r.bot_id;
    if (r.bot_name) j["bot_name"] = *r.bot_name;
}

auto probe_bot(KookApi& api, std::string_view token) -> boost::asio::awaitable<ProbeResult> {
    ProbeResult result;
    if (token.empty()) {
        result.error = "missing credentials (token)";
        co_return result;
    }

    auto identity = co_await api.fetch_self_identity();
    if (!identity) {
        LOG_DEBUG("kook: probe failed: {}", identity.error().what());
        result.error = identity.error().what();
        co_return result;
    }

    result.ok = true;
    result.bot_id = identity->id;
    result.bot_name = identity->username;
    co_return result;
}

} // namespace kookbridge::kook

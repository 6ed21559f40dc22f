#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "kookbridge/core/types.hpp"

// std::optional serializer for nlohmann/json, so NLOHMANN_DEFINE macros
// work with optional fields via j.value("key", default_val).
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace kookbridge {

/// A list of platform ids. Config files may spell ids as strings or
/// numbers; both are stored as strings.
struct IdList {
    std::vector<std::string> entries;

    [[nodiscard]] auto empty() const noexcept -> bool { return entries.empty(); }
    [[nodiscard]] auto contains(std::string_view id) const -> bool;
};

void to_json(json& j, const IdList& l);
void from_json(const json& j, IdList& l);

/// Per-channel (or per-guild, or "*") overrides.
struct KookGroupConfig {
    std::optional<bool> enabled;
    std::optional<bool> require_mention;
    std::optional<std::string> group_policy;   // "open", "allowlist", "disabled"
    std::optional<IdList> allow_from;          // senders allowed in this channel
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(KookGroupConfig, enabled, require_mention, group_policy, allow_from)

using KookGroupMap = std::map<std::string, KookGroupConfig>;

/// Settings of one entry under `channels.kook.accounts`.
struct KookAccountConfig {
    std::optional<bool> enabled;
    std::optional<std::string> name;
    std::optional<std::string> token;
    std::optional<std::string> dm_policy;      // "open", "pairing", "allowlist"
    std::optional<IdList> allow_from;
    std::optional<std::string> group_policy;
    std::optional<IdList> group_allow_from;
    std::optional<bool> require_mention;
    std::optional<int> text_chunk_limit;
    std::optional<int> history_limit;
    std::optional<KookGroupMap> groups;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(KookAccountConfig, enabled, name, token, dm_policy, allow_from, group_policy, group_allow_from, require_mention, text_chunk_limit, history_limit, groups)

/// Top-level `channels.kook` section. Fields double as defaults for every
/// account listed under `accounts`.
struct KookConfig {
    std::optional<bool> enabled;
    std::optional<std::string> name;
    std::optional<std::string> token;
    std::optional<std::string> dm_policy;
    std::optional<IdList> allow_from;
    std::optional<std::string> group_policy;
    std::optional<IdList> group_allow_from;
    std::optional<bool> require_mention;
    std::optional<int> text_chunk_limit;
    std::optional<int> history_limit;
    std::optional<KookGroupMap> groups;
    std::optional<std::map<std::string, KookAccountConfig>> accounts;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(KookConfig, enabled, name, token, dm_policy, allow_from, group_policy, group_allow_from, require_mention, text_chunk_limit, history_limit, groups, accounts)

struct ChannelsConfig {
    std::optional<KookConfig> kook;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ChannelsConfig, kook)

struct GroupChatConfig {
    std::optional<int> history_limit;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(GroupChatConfig, history_limit)

struct MessagesConfig {
    GroupChatConfig group_chat;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(MessagesConfig, group_chat)

struct Config {
    ChannelsConfig channels;
    MessagesConfig messages;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, channels, messages, log_level)

/// Default number of unaddressed group messages kept per channel.
inline constexpr int kDefaultGroupHistoryLimit = 50;

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace kookbridge

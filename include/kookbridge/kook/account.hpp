#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kookbridge/core/config.hpp"

namespace kookbridge::kook {

inline constexpr std::string_view kDefaultAccountId = "default";
inline constexpr std::string_view kDefaultDmPolicy = "pairing";
inline constexpr std::string_view kDefaultGroupPolicy = "allowlist";
inline constexpr int kDefaultTextChunkLimit = 4000;

enum class TokenSource {
    Config,
    Env,
    None,
};

auto token_source_name(TokenSource source) -> std::string_view;

/// Effective settings of one KOOK account: per-account values layered over
/// the top-level `channels.kook` section and the global defaults.
/// Recompute it for every event; config may change between events.
struct AccountView {
    std::string account_id;
    bool enabled = true;
    bool configured = false;
    std::optional<std::string> name;
    std::string token;
    TokenSource token_source = TokenSource::None;

    std::string dm_policy{kDefaultDmPolicy};
    IdList allow_from;
    std::string group_policy{kDefaultGroupPolicy};
    IdList group_allow_from;
    bool require_mention = true;
    int text_chunk_limit = kDefaultTextChunkLimit;
    int history_limit = kDefaultGroupHistoryLimit;
    KookGroupMap groups;

    /// Log tag, e.g. "kook[default]".
    [[nodiscard]] auto tag() const -> std::string {
        return "kook[" + account_id + "]";
    }
};

/// Trims and lower-cases an account id; empty maps to "default".
auto normalize_account_id(std::string_view account_id) -> std::string;

/// Builds the effective view of `account_id` (the default account when
/// empty). Never fails; an unknown account resolves to the top-level
/// settings with `configured` reflecting token presence.
auto resolve_account(const Config& config, std::string_view account_id = {}) -> AccountView;

/// Keys of `channels.kook.accounts`, or {"default"} when none are listed.
auto list_account_ids(const Config& config) -> std::vector<std::string>;

/// "default" when listed, otherwise the first listed id.
auto default_account_id(const Config& config) -> std::string;

auto list_enabled_accounts(const Config& config) -> std::vector<AccountView>;

/// One message per account that cannot start (no token).
auto collect_status_issues(const std::vector<AccountView>& accounts) -> std::vector<std::string>;

/// Configuration smells worth surfacing to an operator.
auto collect_warnings(const AccountView& account) -> std::vector<std::string>;

} // namespace kookbridge::kook

#include "kookbridge/kook/account.hpp"

#include "kookbridge/core/utils.hpp"

#include <algorithm>
#include <cstdlib>

namespace kookbridge::kook {

auto token_source_name(TokenSource source) -> std::string_view {
    switch (source) {
        case TokenSource::Config: return "config";
        case TokenSource::Env: return "env";
        case TokenSource::None: return "none";
        default: return "none";
    }
}

auto normalize_account_id(std::string_view account_id) -> std::string {
    auto id = utils::to_lower(utils::trim(account_id));
    if (id.empty()) {
        return std::string(kDefaultAccountId);
    }
    return id;
}

namespace {

auto find_account(const KookConfig& kook, std::string_view id) -> const KookAccountConfig* {
    if (!kook.accounts) return nullptr;
    for (const auto& [key, account] : *kook.accounts) {
        if (normalize_account_id(key) == id) {
            return &account;
        }
    }
    return nullptr;
}

template <typename T>
auto pick(const std::optional<T>& account_value, const std::optional<T>& top_value)
    -> std::optional<T> {
    if (account_value) return account_value;
    return top_value;
}

auto non_empty(const std::optional<std::string>& s) -> std::optional<std::string> {
    if (s && !utils::trim(*s).empty()) {
        return utils::trim(*s);
    }
    return std::nullopt;
}

} // anonymous namespace

auto resolve_account(const Config& config, std::string_view account_id) -> AccountView {
    AccountView view;
    view.account_id = normalize_account_id(account_id);

    const KookConfig top = config.channels.kook.value_or(KookConfig{});
    const KookAccountConfig account = [&] {
        if (auto* found = find_account(top, view.account_id)) return *found;
        return KookAccountConfig{};
    }();

    view.enabled = top.enabled.value_or(true) && account.enabled.value_or(true);
    view.name = pick(account.name, top.name);

    if (auto token = non_empty(account.token)) {
        view.token = *token;
        view.token_source = TokenSource::Config;
    } else if (auto top_token = non_empty(top.token);
               top_token && view.account_id == kDefaultAccountId) {
        view.token = *top_token;
        view.token_source = TokenSource::Config;
    } else if (auto* env = std::getenv("KOOK_BOT_TOKEN"); env && !utils::trim(env).empty()) {
        view.token = utils::trim(env);
        view.token_source = TokenSource::Env;
    }
    view.configured = !view.token.empty();

    if (auto v = pick(account.dm_policy, top.dm_policy)) view.dm_policy = *v;
    if (auto v = pick(account.allow_from, top.allow_from)) view.allow_from = *v;
    if (auto v = pick(account.group_policy, top.group_policy)) view.group_policy = *v;
    if (auto v = pick(account.group_allow_from, top.group_allow_from)) view.group_allow_from = *v;
    if (auto v = pick(account.require_mention, top.require_mention)) view.require_mention = *v;
    if (auto v = pick(account.text_chunk_limit, top.text_chunk_limit); v && *v > 0) {
        view.text_chunk_limit = *v;
    }

    if (auto v = pick(account.history_limit, top.history_limit)) {
        view.history_limit = *v;
    } else if (config.messages.group_chat.history_limit) {
        view.history_limit = *config.messages.group_chat.history_limit;
    }
    if (view.history_limit < 0) {
        view.history_limit = 0;
    }

    if (top.groups) {
        view.groups = *top.groups;
    }
    if (account.groups) {
        for (const auto& [key, group] : *account.groups) {
            view.groups[key] = group;
        }
    }

    return view;
}

auto list_account_ids(const Config& config) -> std::vector<std::string> {
    std::vector<std::string> ids;
    if (config.channels.kook && config.channels.kook->accounts) {
        for (const auto& [key, account] : *config.channels.kook->accounts) {
            auto id = normalize_account_id(key);
            if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
                ids.push_back(std::move(id));
            }
        }
    }
    if (ids.empty()) {
        ids.emplace_back(kDefaultAccountId);
    }
    return ids;
}

auto default_account_id(const Config& config) -> std::string {
    auto ids = list_account_ids(config);
    for (const auto& id : ids) {
        if (id == kDefaultAccountId) return id;
    }
    return ids.front();
}

auto list_enabled_accounts(const Config& config) -> std::vector<AccountView> {
    std::vector<AccountView> accounts;
    for (const auto& id : list_account_ids(config)) {
        auto view = resolve_account(config, id);
        if (view.enabled) {
            accounts.push_back(std::move(view));
        }
    }
    return accounts;
}

auto collect_status_issues(const std::vector<AccountView>& accounts) -> std::vector<std::string> {
    std::vector<std::string> issues;
    for (const auto& account : accounts) {
        if (!account.configured) {
            issues.push_back("KOOK bot token not configured for account '" +
                             account.account_id + "'");
        }
    }
    return issues;
}

auto collect_warnings(const AccountView& account) -> std::vector<std::string> {
    std::vector<std::string> warnings;
    if (account.group_policy == "open") {
        warnings.push_back(
            "- KOOK groups: group_policy=\"open\" allows any channel to trigger the bot. "
            "Set channels.kook.group_policy=\"allowlist\" and configure "
            "channels.kook.group_allow_from.");
    }
    return warnings;
}

} // namespace kookbridge::kook

#include "kookbridge/kook/policy.hpp"

#include "kookbridge/core/logger.hpp"
#include "kookbridge/core/utils.hpp"

namespace kookbridge::kook {

auto policy_verdict_name(PolicyVerdict verdict) -> std::string_view {
    switch (verdict) {
        case PolicyVerdict::Accept: return "accept";
        case PolicyVerdict::AcceptPendingPairing: return "accept_pending_pairing";
        case PolicyVerdict::RecordOnly: return "record_only";
        case PolicyVerdict::RejectGroupDisabled: return "group_disabled";
        case PolicyVerdict::RejectGroupNotAllowed: return "group_not_allowed";
        case PolicyVerdict::RejectChannelDisabled: return "channel_disabled";
        case PolicyVerdict::RejectSenderNotAllowed: return "sender_not_allowed";
        case PolicyVerdict::RejectDmNotAllowed: return "dm_not_allowed";
        default: return "unknown";
    }
}

auto find_group_config(const AccountView& account,
                       std::string_view channel_id,
                       const std::optional<std::string>& guild_id)
    -> std::optional<KookGroupConfig> {
    if (account.groups.empty()) {
        return std::nullopt;
    }
    if (auto it = account.groups.find(std::string(channel_id)); it != account.groups.end()) {
        return it->second;
    }
    if (guild_id && !guild_id->empty()) {
        if (auto it = account.groups.find(*guild_id); it != account.groups.end()) {
            return it->second;
        }
    }
    if (auto it = account.groups.find("*"); it != account.groups.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto normalize_allow_entry(std::string_view entry) -> std::string {
    auto trimmed = utils::trim(entry);
    std::string_view view = trimmed;
    if (utils::starts_with_icase(view, "kook:user:")) {
        view.remove_prefix(10);
    } else if (utils::starts_with_icase(view, "kook:")) {
        view.remove_prefix(5);
    }
    return utils::trim(view);
}

auto allow_list_matches(const IdList& list, std::string_view id) -> bool {
    if (id.empty()) {
        return false;
    }
    for (const auto& entry : list.entries) {
        if (normalize_allow_entry(entry) == id) {
            return true;
        }
    }
    return false;
}

namespace {

auto evaluate_group(const AccountView& account, const PolicyInput& input) -> PolicyDecision {
    PolicyDecision decision;
    auto group = find_group_config(account, input.channel_id, input.guild_id);

    decision.group_policy = (group && group->group_policy) ? *group->group_policy
                                                           : account.group_policy;
    decision.require_mention = (group && group->require_mention) ? *group->require_mention
                                                                 : account.require_mention;

    if (decision.group_policy == "disabled") {
        decision.verdict = PolicyVerdict::RejectGroupDisabled;
        return decision;
    }
    if (decision.group_policy != "open") {
        // Anything other than "open" or "disabled" is treated as "allowlist".
        bool listed = allow_list_matches(account.group_allow_from, input.channel_id) ||
                      (input.guild_id && allow_list_matches(account.group_allow_from, *input.guild_id));
        if (!listed) {
            decision.verdict = PolicyVerdict::RejectGroupNotAllowed;
            return decision;
        }
    }

    if (group && group->enabled && !*group->enabled) {
        decision.verdict = PolicyVerdict::RejectChannelDisabled;
        return decision;
    }
    if (group && group->allow_from && !group->allow_from->empty() &&
        !allow_list_matches(*group->allow_from, input.sender_id)) {
        decision.verdict = PolicyVerdict::RejectSenderNotAllowed;
        return decision;
    }

    if (decision.require_mention && !input.mentioned) {
        decision.verdict = PolicyVerdict::RecordOnly;
        return decision;
    }

    decision.verdict = PolicyVerdict::Accept;
    return decision;
}

auto evaluate_direct(const AccountView& account, const PolicyInput& input) -> PolicyDecision {
    PolicyDecision decision;
    const auto& policy = account.dm_policy;

    if (policy == "open") {
        decision.verdict = PolicyVerdict::Accept;
    } else if (policy == "allowlist") {
        decision.verdict = allow_list_matches(account.allow_from, input.sender_id)
            ? PolicyVerdict::Accept
            : PolicyVerdict::RejectDmNotAllowed;
    } else {
        // "pairing" and unrecognized values defer to the pairing flow. A
        // sender already on the allow list skips it.
        decision.verdict = allow_list_matches(account.allow_from, input.sender_id)
            ? PolicyVerdict::Accept
            : PolicyVerdict::AcceptPendingPairing;
    }
    return decision;
}

} // anonymous namespace

auto evaluate_policy(const AccountView& account, const PolicyInput& input) -> PolicyDecision {
    auto decision = input.is_group ? evaluate_group(account, input)
                                   : evaluate_direct(account, input);
    LOG_TRACE("{}: policy {} for sender {} in {}",
              account.tag(), policy_verdict_name(decision.verdict),
              input.sender_id, input.channel_id);
    return decision;
}

} // namespace kookbridge::kook

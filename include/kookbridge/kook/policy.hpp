#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "kookbridge/kook/account.hpp"

namespace kookbridge::kook {

enum class PolicyVerdict {
    Accept,
    /// DM under "pairing": accepted here, the host's pairing flow decides.
    AcceptPendingPairing,
    /// Addressed-only group: the message is kept as history context.
    RecordOnly,
    RejectGroupDisabled,
    RejectGroupNotAllowed,
    RejectChannelDisabled,
    RejectSenderNotAllowed,
    RejectDmNotAllowed,
};

auto policy_verdict_name(PolicyVerdict verdict) -> std::string_view;

/// The facts about one inbound message that the gate looks at.
struct PolicyInput {
    bool is_group = false;
    std::string channel_id;
    std::optional<std::string> guild_id;
    std::string sender_id;
    bool mentioned = false;
};

struct PolicyDecision {
    PolicyVerdict verdict = PolicyVerdict::Accept;
    std::string group_policy;   // effective value, empty for DMs
    bool require_mention = false;

    [[nodiscard]] auto proceeds() const noexcept -> bool {
        return verdict == PolicyVerdict::Accept ||
               verdict == PolicyVerdict::AcceptPendingPairing;
    }
};

/// Per-channel group config: channel id, then guild id, then "*".
auto find_group_config(const AccountView& account,
                       std::string_view channel_id,
                       const std::optional<std::string>& guild_id)
    -> std::optional<KookGroupConfig>;

/// Strips a `kook:` or `kook:user:` prefix (case-insensitive) and trims.
auto normalize_allow_entry(std::string_view entry) -> std::string;

/// True when any normalized entry of `list` equals `id`.
auto allow_list_matches(const IdList& list, std::string_view id) -> bool;

/// Applies group/DM access rules and the mention gate. The result is
/// computed from the given view only and must not be reused for a later
/// event.
auto evaluate_policy(const AccountView& account, const PolicyInput& input) -> PolicyDecision;

} // namespace kookbridge::kook

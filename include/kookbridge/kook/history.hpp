#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace kookbridge::kook {

inline constexpr std::string_view kHistoryContextHeader =
    "[Chat messages since your last reply - for context]";
inline constexpr std::string_view kCurrentMessageMarker =
    "[Current message - respond to this]";

/// Channels tracked at once; the least recently recorded one is dropped
/// beyond this.
inline constexpr std::size_t kMaxHistoryChannels = 1000;

struct HistoryEntry {
    std::string sender_id;
    std::string body;
    int64_t timestamp_ms = 0;
    std::string message_id;
};

/// Unaddressed group messages kept per channel until the bot is mentioned.
///
/// Owned by one account's admission pipeline and touched only from that
/// account's strand; it does no locking of its own.
class PendingHistory {
public:
    using Formatter = std::function<std::string(const HistoryEntry&)>;

    explicit PendingHistory(std::size_t max_channels = kMaxHistoryChannels)
        : max_channels_(max_channels) {}

    /// Appends `entry` under `key`, evicting the oldest entries beyond
    /// `limit`. A limit of 0 (or less) records nothing.
    void record(const std::string& key, HistoryEntry entry, int limit);

    /// Prepends the newest `limit` buffered entries of `key` to `current`
    /// under the context header. Returns `current` unchanged when nothing is
    /// buffered or `limit` disables history.
    [[nodiscard]] auto build_context(const std::string& key,
                                     std::string_view current,
                                     int limit,
                                     const Formatter& format) const -> std::string;

    /// Position just past the newest entry of `key`. Entries recorded later
    /// compare at or above it.
    [[nodiscard]] auto mark(const std::string& key) const -> uint64_t;

    /// Drops the entries of `key` recorded before `mark`, keeping anything
    /// that arrived since.
    void consume(const std::string& key, uint64_t mark);

    void clear(const std::string& key);

    [[nodiscard]] auto entries(const std::string& key) const -> std::vector<HistoryEntry>;
    [[nodiscard]] auto size(const std::string& key) const -> std::size_t;
    [[nodiscard]] auto channel_count() const noexcept -> std::size_t { return channels_.size(); }

private:
    struct Slot {
        uint64_t seq = 0;
        HistoryEntry entry;
    };

    void touch(const std::string& key);

    std::size_t max_channels_;
    uint64_t next_seq_ = 0;
    std::map<std::string, std::deque<Slot>> channels_;
    std::list<std::string> recency_;   // front = least recently recorded
};

} // namespace kookbridge::kook

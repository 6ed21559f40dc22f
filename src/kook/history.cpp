#include "kookbridge/kook/history.hpp"

#include <algorithm>
#include <cstddef>

namespace kookbridge::kook {

void PendingHistory::record(const std::string& key, HistoryEntry entry, int limit) {
    if (limit <= 0) {
        return;
    }

    auto& queue = channels_[key];
    queue.push_back(Slot{.seq = next_seq_++, .entry = std::move(entry)});
    while (queue.size() > static_cast<std::size_t>(limit)) {
        queue.pop_front();
    }
    touch(key);

    while (channels_.size() > max_channels_ && !recency_.empty()) {
        channels_.erase(recency_.front());
        recency_.pop_front();
    }
}

auto PendingHistory::build_context(const std::string& key,
                                   std::string_view current,
                                   int limit,
                                   const Formatter& format) const -> std::string {
    if (limit <= 0) {
        return std::string(current);
    }
    auto it = channels_.find(key);
    if (it == channels_.end() || it->second.empty()) {
        return std::string(current);
    }

    const auto& queue = it->second;
    auto shown = std::min(queue.size(), static_cast<std::size_t>(limit));

    std::string out(kHistoryContextHeader);
    out += '\n';
    for (auto slot = queue.end() - static_cast<std::ptrdiff_t>(shown); slot != queue.end(); ++slot) {
        out += format(slot->entry);
        out += '\n';
    }
    out += '\n';
    out += kCurrentMessageMarker;
    out += '\n';
    out += current;
    return out;
}

auto PendingHistory::mark(const std::string& key) const -> uint64_t {
    auto it = channels_.find(key);
    if (it == channels_.end() || it->second.empty()) {
        return 0;
    }
    return it->second.back().seq + 1;
}

void PendingHistory::consume(const std::string& key, uint64_t mark) {
    auto it = channels_.find(key);
    if (it == channels_.end()) {
        return;
    }
    auto& queue = it->second;
    while (!queue.empty() && queue.front().seq < mark) {
        queue.pop_front();
    }
    if (queue.empty()) {
        clear(key);
    }
}

void PendingHistory::clear(const std::string& key) {
    channels_.erase(key);
    recency_.remove(key);
}

auto PendingHistory::entries(const std::string& key) const -> std::vector<HistoryEntry> {
    auto it = channels_.find(key);
    if (it == channels_.end()) {
        return {};
    }
    std::vector<HistoryEntry> out;
    out.reserve(it->second.size());
    for (const auto& slot : it->second) {
        out.push_back(slot.entry);
    }
    return out;
}

auto PendingHistory::size(const std::string& key) const -> std::size_t {
    auto it = channels_.find(key);
    return it == channels_.end() ? 0 : it->second.size();
}

void PendingHistory::touch(const std::string& key) {
    auto it = std::find(recency_.begin(), recency_.end(), key);
    if (it != recency_.end()) {
        recency_.splice(recency_.end(), recency_, it);
    } else {
        recency_.push_back(key);
    }
}

} // namespace kookbridge::kook

#include "kookbridge/core/abort.hpp"

#include <vector>

namespace kookbridge {

void AbortSignal::abort() {
    std::vector<Listener> to_fire;
    {
        std::lock_guard lock(mutex_);
        if (aborted_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        to_fire.reserve(listeners_.size());
        for (auto& [id, listener] : listeners_) {
            to_fire.push_back(std::move(listener));
        }
        listeners_.clear();
    }
    // Fire outside the lock so listeners may unsubscribe or subscribe.
    for (auto& listener : to_fire) {
        listener();
    }
}

auto AbortSignal::subscribe(Listener listener) -> ListenerId {
    {
        std::lock_guard lock(mutex_);
        if (!aborted_.load(std::memory_order_acquire)) {
            auto id = next_id_++;
            listeners_.emplace(id, std::move(listener));
            return id;
        }
    }
    listener();
    return 0;
}

void AbortSignal::unsubscribe(ListenerId id) {
    std::lock_guard lock(mutex_);
    listeners_.erase(id);
}

} // namespace kookbridge

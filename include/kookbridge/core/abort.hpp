#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace kookbridge {

/// Cooperative cancellation flag shared between a monitor's caller and the
/// sessions it runs. Once aborted it stays aborted.
///
/// Listeners are invoked synchronously from abort() on the aborting thread;
/// listeners that touch strand-bound state must post onto their strand.
class AbortSignal {
public:
    using Listener = std::function<void()>;
    using ListenerId = uint64_t;

    AbortSignal() = default;

    AbortSignal(const AbortSignal&) = delete;
    AbortSignal& operator=(const AbortSignal&) = delete;

    [[nodiscard]] auto aborted() const noexcept -> bool {
        return aborted_.load(std::memory_order_acquire);
    }

    /// Sets the flag and fires every registered listener once.
    void abort();

    /// Registers a listener. If the signal is already aborted the listener
    /// runs immediately and 0 is returned.
    auto subscribe(Listener listener) -> ListenerId;

    void unsubscribe(ListenerId id);

private:
    std::atomic<bool> aborted_{false};
    std::mutex mutex_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId next_id_ = 1;
};

/// Unsubscribes on scope exit.
class AbortSubscription {
public:
    AbortSubscription() = default;
    AbortSubscription(AbortSignal& signal, AbortSignal::Listener listener)
        : signal_(&signal), id_(signal.subscribe(std::move(listener))) {}

    ~AbortSubscription() { reset(); }

    AbortSubscription(const AbortSubscription&) = delete;
    AbortSubscription& operator=(const AbortSubscription&) = delete;

    AbortSubscription(AbortSubscription&& other) noexcept
        : signal_(other.signal_), id_(other.id_) {
        other.signal_ = nullptr;
        other.id_ = 0;
    }

    AbortSubscription& operator=(AbortSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            signal_ = other.signal_;
            id_ = other.id_;
            other.signal_ = nullptr;
            other.id_ = 0;
        }
        return *this;
    }

    void reset() {
        if (signal_ && id_ != 0) {
            signal_->unsubscribe(id_);
        }
        signal_ = nullptr;
        id_ = 0;
    }

private:
    AbortSignal* signal_ = nullptr;
    AbortSignal::ListenerId id_ = 0;
};

} // namespace kookbridge

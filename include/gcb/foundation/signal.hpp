#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> used for gateway lifecycle events
///        (transport opened/closed, server online/offline, session transitions).

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace gcb::foundation {

/// Thread-safe signal dispatching to registered slots in connection order.
///
/// Slots are invoked outside the internal lock, on the emitting thread, so a
/// slot may connect or disconnect other slots (the change applies from the
/// next emit()).
///
/// @code
///   Signal<const std::string&> serverOnline;
///   auto id = serverOnline.connect([](const std::string& serverId) {
///       announce(serverId, true);
///   });
///   serverOnline.emit("Survival");
///   serverOnline.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    ~Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        slots_.erase(id);
    }

    void disconnectAll() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

    /// Invoke every slot connected at the time of the call.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                snapshot.push_back(slot);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    std::map<SlotId, Slot> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace gcb::foundation

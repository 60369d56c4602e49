#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> for synchronous observer dispatch.
///
/// Source-of-truth writers (skill updates, battle recording) publish an
/// event through a Signal; derived-state handlers connected to it run
/// synchronously on the publishing thread, inside the same unit of work.
/// Uses std::shared_mutex so emit() calls can overlap while connect() and
/// disconnect() obtain exclusive access.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace gec::foundation {

/// Thread-safe signal (observer pattern) that dispatches events to
/// registered callbacks in connection order.
///
/// @tparam Args The argument types passed to each slot. Reference types
///              are allowed, so a handler can mutate staged state.
///
/// Example:
/// @code
///   Signal<PlayerState&, const SkillChanged&> onSkillChanged;
///   auto id = onSkillChanged.connect([](PlayerState& s, const SkillChanged& e) {
///       s.profile.totalLevel = game::computeTotalLevel(s.skills);
///   });
///   onSkillChanged.emit(staged, event);
///   onSkillChanged.disconnect(id);
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

    /// Remove a previously registered callback by its SlotId.
    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        slots_.erase(id);
    }

    /// Invoke every registered slot, in connection order.
    ///
    /// Slots are snapshotted under a shared lock and invoked outside it,
    /// so a slot may connect or disconnect without deadlocking.
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
    // Ordered by id so handlers run in the order they were connected.
    std::map<SlotId, Slot> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace gec::foundation

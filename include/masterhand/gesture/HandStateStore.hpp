/**
 * @file HandStateStore.hpp
 * @brief Fixed two-slot container for per-hand-side temporal state
 *
 * @copyright 2025 MasterHand Project
 * @license MIT License
 */

#ifndef MASTERHAND_GESTURE_HAND_STATE_STORE_HPP
#define MASTERHAND_GESTURE_HAND_STATE_STORE_HPP

#include <array>
#include "GestureTypes.hpp"
#include "SnapDetector.hpp"

namespace masterhand {
namespace gesture {

/**
 * @brief Persistent state for the Left and Right hands
 *
 * Both slots start at the process-start defaults and are never removed.
 * A side that is not observed keeps its last state indefinitely.
 *
 * Thread-safety: Not thread-safe. The owning GestureStateMachine serializes access.
 */
class HandStateStore {
public:
    const HandTemporalState& get(HandSide side) const {
        return slots_[index(side)];
    }

    HandTemporalState& get(HandSide side) {
        return slots_[index(side)];
    }

    /**
     * @brief Return every slot to its initial value
     */
    void reset() {
        slots_.fill(HandTemporalState{});
    }

    bool operator==(const HandStateStore& other) const { return slots_ == other.slots_; }
    bool operator!=(const HandStateStore& other) const { return !(*this == other); }

private:
    static size_t index(HandSide side) { return static_cast<size_t>(side); }

    std::array<HandTemporalState, NUM_HAND_SIDES> slots_{};
};

} // namespace gesture
} // namespace masterhand

#endif // MASTERHAND_GESTURE_HAND_STATE_STORE_HPP

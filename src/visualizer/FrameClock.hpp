/**
 * @file FrameClock.hpp
 * @brief One-shot per-frame callback queue with cancellable handles.
 *
 * Callers request a callback for the next frame and re-request from inside
 * it to keep a loop alive, the same contract as a browser animation frame.
 * The hosting window calls tick() once per vsync-paced update and asks for
 * another update while anything is pending.
 *
 * @section Patterns
 * - Cooperative scheduling: every callback runs on the GUI thread.
 */

#pragma once
#include <functional>
#include <vector>
#include "util/Signal.hpp"
#include "util/Types.hpp"

namespace lg {

using FrameHandle = u64;
inline constexpr FrameHandle kNoFrame = 0;

class FrameClock {
public:
    using Callback = std::function<void(f64 nowMs)>;

    FrameHandle request(Callback callback);
    void cancel(FrameHandle handle);
    void cancelAll();

    // Runs everything requested before this call. Callbacks requested
    // while ticking wait for the next tick.
    void tick(f64 nowMs);

    bool hasPending() const {
        return !queue_.empty();
    }
    usize pendingCount() const {
        return queue_.size();
    }

    // Emitted when the queue goes from empty to non-empty
    Signal<> frameRequested;

private:
    struct Entry {
        FrameHandle handle;
        Callback callback;
    };

    std::vector<Entry> queue_;
    std::vector<FrameHandle> cancelledDuringTick_;
    FrameHandle lastHandle_{kNoFrame};
    bool ticking_{false};
};

} // namespace lg

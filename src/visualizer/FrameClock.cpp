#include "FrameClock.hpp"
#include <algorithm>

namespace lg {

FrameHandle FrameClock::request(Callback callback) {
    bool wasEmpty = queue_.empty();
    FrameHandle handle = ++lastHandle_;
    queue_.push_back({handle, std::move(callback)});
    if (wasEmpty)
        frameRequested();
    return handle;
}

void FrameClock::cancel(FrameHandle handle) {
    if (handle == kNoFrame)
        return;
    std::erase_if(queue_, [handle](const Entry& e) { return e.handle == handle; });
    if (ticking_)
        cancelledDuringTick_.push_back(handle);
}

void FrameClock::cancelAll() {
    if (ticking_) {
        for (const auto& e : queue_)
            cancelledDuringTick_.push_back(e.handle);
    }
    queue_.clear();
}

void FrameClock::tick(f64 nowMs) {
    if (ticking_)
        return;

    std::vector<Entry> due;
    due.swap(queue_);
    ticking_ = true;
    cancelledDuringTick_.clear();

    for (auto& entry : due) {
        // A callback earlier in this tick may have cancelled a later one
        if (std::find(cancelledDuringTick_.begin(),
                      cancelledDuringTick_.end(),
                      entry.handle) != cancelledDuringTick_.end())
            continue;
        if (entry.callback)
            entry.callback(nowMs);
    }

    ticking_ = false;
    cancelledDuringTick_.clear();
}

} // namespace lg

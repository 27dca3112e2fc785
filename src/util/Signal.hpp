#pragma once
// Signal.hpp - Minimal synchronous signal/slot for non-QObject classes
// Slots run on the emitting thread, in connection order.

#include <functional>
#include <utility>
#include <vector>
#include "util/Types.hpp"

namespace lg {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = u64;

    SlotId connect(Slot slot) {
        SlotId id = ++lastId_;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) {
        std::erase_if(slots_, [id](const auto& s) { return s.first == id; });
    }

    // Copy first so a slot may disconnect itself while being called.
    void operator()(Args... args) const {
        auto snapshot = slots_;
        for (auto& [id, slot] : snapshot) {
            if (slot)
                slot(args...);
        }
    }

private:
    std::vector<std::pair<SlotId, Slot>> slots_;
    SlotId lastId_{0};
};

} // namespace lg

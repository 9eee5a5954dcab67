/// @file timer_queue.cpp
/// @brief TimerQueue implementation.

#include "nrt/foundation/timer_queue.hpp"

#include <algorithm>

namespace nrt::foundation {

TimerId TimerQueue::schedule(Duration delay, Callback fn) {
    auto due = now_ + std::max(delay, Duration::zero());
    auto id = nextId_++;
    pending_.emplace(Key{due, nextSequence_++}, Entry{id, std::move(fn)});
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [id](const auto& kv) { return kv.second.id == id; });
    if (it == pending_.end()) {
        return false;
    }
    pending_.erase(it);
    return true;
}

std::size_t TimerQueue::advance(Duration elapsed) {
    auto target = now_ + std::max(elapsed, Duration::zero());
    std::size_t ran = 0;

    while (!pending_.empty()) {
        auto it = pending_.begin();
        if (it->first.first > target) {
            break;
        }
        now_ = std::max(now_, it->first.first);
        auto fn = std::move(it->second.fn);
        pending_.erase(it);
        ++ran;
        if (fn) {
            fn();
        }
    }

    now_ = target;
    return ran;
}

std::size_t TimerQueue::drain(std::size_t limit) {
    std::size_t ran = 0;
    while (!pending_.empty() && ran < limit) {
        auto due = pending_.begin()->first.first;
        ran += advance(due - now_);
    }
    return ran;
}

} // namespace nrt::foundation

#pragma once

#include <chrono>
#include <functional>

namespace veil {

using TimePoint = std::chrono::system_clock::time_point;

// Injectable wall-clock source. Components take one so that token lifecycles,
// cache expiry and breaker cooldowns can be driven deterministically.
using Clock = std::function<TimePoint()>;

inline Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

inline long long to_epoch_seconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline long long to_epoch_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_seconds(long long sec) {
    return TimePoint(std::chrono::seconds(sec));
}

}

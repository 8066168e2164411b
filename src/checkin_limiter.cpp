#include "checkin_limiter.hpp"
#include "crypto_primitives.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include <algorithm>

namespace veil {

CheckInLimiter::CheckInLimiter(KeyValueStore& store, CircuitBreaker& breaker, std::string salt,
                               std::chrono::seconds window, Clock clock)
    : store_(store),
      breaker_(breaker),
      salt_(std::move(salt)),
      window_(window),
      clock_(std::move(clock))
{}

std::string CheckInLimiter::key_for(const std::string& device_id) const {
    return "checkin:" + CryptoPrimitives::blind(device_id, salt_);
}

// Reads the last check-in time and reports the remaining wait inside the window.
std::chrono::seconds CheckInLimiter::seconds_until_next_check_in(const std::string& device_id) {
    if (device_id.empty()) return std::chrono::seconds(0);

    try {
        auto last = breaker_.execute([&] { return store_.get(key_for(device_id)); });
        if (!last) return std::chrono::seconds(0);

        long long last_sec = std::stoll(*last);
        long long elapsed = to_epoch_seconds(clock_()) - last_sec;
        long long remaining = window_.count() - elapsed;
        return std::chrono::seconds(std::max(0LL, remaining));
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter("checkin_limiter_fail_open");
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORE_UNAVAILABLE,
                            device_id, std::string("Check-in limiter failing open: ") + e.what());
        return std::chrono::seconds(0);
    }
}

// Stamps the current time; the key expires when the window closes.
bool CheckInLimiter::record_check_in(const std::string& device_id) {
    if (device_id.empty()) return false;

    try {
        std::string now = std::to_string(to_epoch_seconds(clock_()));
        breaker_.execute([&] { store_.set(key_for(device_id), now, window_); });
        return true;
    } catch (const std::exception&) {
        MetricsRegistry::instance().increment_counter("checkin_limiter_write_failures");
        return false;
    }
}

}

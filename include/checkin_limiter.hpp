#pragma once

#include <string>
#include <chrono>
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "key_value_store.hpp"

namespace veil {

// Check-in frequency guard layered over the shared store.
// Keys are blinded device ids (checkin:<sha256(id + salt)>) so the store never
// sees a token in the clear. Store failures fail open.
// The window belongs to a token, not to a person: CheckInAnonymizer carries it
// across a rotation through the previous token, but a client that discards its
// token pair registers as a new device and starts a fresh window.
class CheckInLimiter {
public:
    CheckInLimiter(KeyValueStore& store, CircuitBreaker& breaker, std::string salt,
                   std::chrono::seconds window, Clock clock = system_clock());

    /**
     * Time left before the device may check in again.
     * @return Zero when a check-in is allowed now (or the store is unreachable).
     */
    std::chrono::seconds seconds_until_next_check_in(const std::string& device_id);

    bool can_check_in(const std::string& device_id) {
        return seconds_until_next_check_in(device_id).count() == 0;
    }

    // Stores the check-in time with a TTL of one window. False when not persisted.
    bool record_check_in(const std::string& device_id);

    std::chrono::seconds window() const { return window_; }

private:
    std::string key_for(const std::string& device_id) const;

    KeyValueStore& store_;
    CircuitBreaker& breaker_;
    std::string salt_;
    std::chrono::seconds window_;
    Clock clock_;
};

}

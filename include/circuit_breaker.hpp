#pragma once

#include <string>
#include <mutex>
#include <chrono>
#include <thread>
#include <exception>
#include <type_traits>
#include "clock.hpp"
#include "key_value_store.hpp"

namespace veil {

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

const char* circuit_state_name(CircuitState state);

// Thrown without touching the dependency while the breaker is open.
class CircuitOpenError : public StoreError {
public:
    explicit CircuitOpenError(const std::string& name)
        : StoreError("circuit '" + name + "' is open") {}
};

struct CircuitBreakerOptions {
    std::string name = "store";
    int failure_threshold = 3;
    int success_threshold = 2;
    std::chrono::milliseconds reset_timeout{30000};
    int max_retries = 2;
    std::chrono::milliseconds retry_delay{50};
    double backoff_factor = 2.0;
    std::chrono::milliseconds max_retry_delay{500};
};

struct CircuitBreakerStatus {
    CircuitState state;
    int consecutive_failures;
    long long total_requests;
    long long failed_requests;
    long long rejected_requests;
    long long retries;
};

// Fault-tolerance state machine around the shared store.
// CLOSED passes calls through and counts consecutive failures; reaching the
// threshold OPENs the circuit, which rejects calls until reset_timeout elapses.
// The next call then probes in HALF_OPEN: success_threshold successes close the
// circuit, any failure reopens it.
class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitBreakerOptions options, Clock clock = system_clock());

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * Runs fn under breaker protection. Failures (std::exception) are retried
     * with exponential backoff while the circuit is CLOSED, up to max_retries.
     * @throws CircuitOpenError when the circuit is open.
     * @throws The last failure once retries are exhausted.
     */
    template <typename Fn>
    auto execute(Fn&& fn) -> decltype(fn()) {
        if (!allow_request()) {
            throw CircuitOpenError(options_.name);
        }

        for (int attempt = 0;; ++attempt) {
            try {
                if constexpr (std::is_void_v<decltype(fn())>) {
                    fn();
                    record_success();
                    return;
                } else {
                    auto result = fn();
                    record_success();
                    return result;
                }
            } catch (const std::exception& e) {
                if (attempt >= options_.max_retries || state() != CircuitState::CLOSED) {
                    record_failure(e.what());
                    throw;
                }
                note_retry();
                std::this_thread::sleep_for(backoff_delay(attempt + 1));
            }
        }
    }

    // True when a call may proceed. Moves OPEN to HALF_OPEN once the cooldown elapsed.
    bool allow_request();

    // True while the circuit is OPEN and still inside its cooldown window.
    bool is_open() const;

    CircuitState state() const;
    CircuitBreakerStatus status() const;
    const std::string& name() const { return options_.name; }

    void record_success();
    void record_failure(const std::string& reason);

    void force_open(const std::string& reason = "forced open");
    void reset();

private:
    void note_retry();
    std::chrono::milliseconds backoff_delay(int retry) const;
    void transition(CircuitState next, const std::string& reason);  // mutex_ held
    void publish_state();                                           // mutex_ held

    CircuitBreakerOptions options_;
    Clock clock_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    int failures_ = 0;
    int successes_ = 0;
    TimePoint opened_at_{};
    long long total_requests_ = 0;
    long long failed_requests_ = 0;
    long long rejected_requests_ = 0;
    long long retries_ = 0;
};

}

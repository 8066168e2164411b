#include "circuit_breaker.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace veil {

const char* circuit_state_name(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

CircuitBreaker::CircuitBreaker(CircuitBreakerOptions options, Clock clock)
    : options_(std::move(options)), clock_(std::move(clock)) {
    std::lock_guard<std::mutex> lock(mutex_);
    publish_state();
}

bool CircuitBreaker::allow_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_requests_;
    MetricsRegistry::instance().increment_counter("circuit_breaker_" + options_.name + "_requests");

    if (state_ == CircuitState::OPEN) {
        if (clock_() - opened_at_ < options_.reset_timeout) {
            ++rejected_requests_;
            MetricsRegistry::instance().increment_counter("circuit_breaker_" + options_.name + "_rejections");
            return false;
        }
        transition(CircuitState::HALF_OPEN, "cooldown elapsed, probing");
    }
    return true;
}

bool CircuitBreaker::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == CircuitState::OPEN && clock_() - opened_at_ < options_.reset_timeout;
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreakerStatus CircuitBreaker::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CircuitBreakerStatus{state_, failures_, total_requests_, failed_requests_,
                                rejected_requests_, retries_};
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::HALF_OPEN) {
        if (++successes_ >= options_.success_threshold) {
            transition(CircuitState::CLOSED, "probe succeeded");
        }
    } else if (state_ == CircuitState::CLOSED) {
        failures_ = 0;
    }
}

void CircuitBreaker::record_failure(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failed_requests_;
    MetricsRegistry::instance().increment_counter("circuit_breaker_" + options_.name + "_failures");

    if (state_ == CircuitState::HALF_OPEN) {
        transition(CircuitState::OPEN, "probe failed: " + reason);
    } else if (state_ == CircuitState::CLOSED) {
        if (++failures_ >= options_.failure_threshold) {
            transition(CircuitState::OPEN, reason);
        }
    }
}

void CircuitBreaker::force_open(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    transition(CircuitState::OPEN, reason);
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    transition(CircuitState::CLOSED, "reset");
}

void CircuitBreaker::note_retry() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++retries_;
    MetricsRegistry::instance().increment_counter("circuit_breaker_" + options_.name + "_retries");
}

// Exponential backoff with +/-25% jitter, capped at max_retry_delay.
std::chrono::milliseconds CircuitBreaker::backoff_delay(int retry) const {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> jitter(0.75, 1.25);

    double delay = static_cast<double>(options_.retry_delay.count()) *
                   std::pow(options_.backoff_factor, retry - 1) * jitter(rng);
    delay = std::min(delay, static_cast<double>(options_.max_retry_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, delay)));
}

void CircuitBreaker::transition(CircuitState next, const std::string& reason) {
    CircuitState prev = state_;
    state_ = next;
    failures_ = 0;
    successes_ = 0;
    if (next == CircuitState::OPEN) {
        opened_at_ = clock_();
        MetricsRegistry::instance().increment_counter("circuit_breaker_" + options_.name + "_opened");
    }
    publish_state();

    if (prev != next) {
        auto level = next == CircuitState::OPEN ? SecurityLogger::Level::WARNING : SecurityLogger::Level::INFO;
        SecurityLogger::log(level, SecurityLogger::EventType::CIRCUIT_STATE, "internal",
                            options_.name + " " + circuit_state_name(prev) + " -> " +
                            circuit_state_name(next) + ": " + reason);
    }
}

void CircuitBreaker::publish_state() {
    double value = 2.0;
    if (state_ == CircuitState::OPEN) value = 0.0;
    if (state_ == CircuitState::HALF_OPEN) value = 1.0;
    MetricsRegistry::instance().set_gauge("circuit_breaker_" + options_.name + "_state", value);
}

}

#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <cctype>
#include <ctime>
#include <exception>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace veil {

// Points a stream at another buffer until the guard leaves scope.
class StreamRedirect {
public:
    StreamRedirect(std::ostream& stream, std::streambuf* target)
        : stream_(stream), original_(stream.rdbuf(target)) {}
    ~StreamRedirect() { stream_.rdbuf(original_); }

    StreamRedirect(const StreamRedirect&) = delete;
    StreamRedirect& operator=(const StreamRedirect&) = delete;

private:
    std::ostream& stream_;
    std::streambuf* original_;
};

// Logs anonymization events. Tokens and fingerprints passed as the subject are
// blinded with a process-local salt before they reach the log stream.
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        TOKEN_ISSUED,
        TOKEN_ROTATED,
        ROTATION_LAG,
        DEVICE_CAP_EXCEEDED,
        STORE_CONNECTED,
        STORE_UNAVAILABLE,
        CIRCUIT_STATE,
        INVALID_INPUT,
        DEGRADED_CRYPTO,
        ERASURE,
        PII_REDACTED
    };

    /**
     * Records an anonymization event with a blinded subject.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param subject Token, fingerprint or component name. Blinded unless "internal" or "unknown".
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& subject,
                   const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] ";

        ss << "id=" << blind_subject(subject, gmt);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    // Escapes quotes and line breaks and drops non-printable characters.
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    // The log salt rotates every 6 hours, so subject hashes from older log
    // windows cannot be joined with newer ones.
    static std::string blind_subject(const std::string& subject, const struct tm& gmt) {
        if (subject.empty() || subject == "unknown" || subject == "internal") {
            return subject.empty() ? "unknown" : subject;
        }

        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::string salt;
        {
            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now_steady = std::chrono::steady_clock::now();
            if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
                unsigned char b[32];
                if (RAND_bytes(b, 32) != 1) {
                    std::cerr << "[CRITICAL] CSPRNG failure in SecurityLogger. Terminating instance for safety.\n";
                    std::terminate();
                }
                std::stringstream salt_ss;
                for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
                log_salt = salt_ss.str();
                last_rotation = now_steady;

                std::cout << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] [INFO] [LOGGER] msg=\"subject blinding salt rotated\"\n";
            }
            salt = log_salt;
        }

        std::string data = subject + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::TOKEN_ISSUED: return "TOKEN_ISSUED";
            case EventType::TOKEN_ROTATED: return "TOKEN_ROTATED";
            case EventType::ROTATION_LAG: return "ROTATION_LAG";
            case EventType::DEVICE_CAP_EXCEEDED: return "DEVICE_CAP";
            case EventType::STORE_CONNECTED: return "STORE_CONNECTED";
            case EventType::STORE_UNAVAILABLE: return "STORE_UNAVAILABLE";
            case EventType::CIRCUIT_STATE: return "CIRCUIT";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::DEGRADED_CRYPTO: return "DEGRADED_CRYPTO";
            case EventType::ERASURE: return "ERASURE";
            case EventType::PII_REDACTED: return "PII_REDACTED";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}

#include <iostream>
#include <string>
#include <memory>
#include <cstdlib>

#include <boost/json.hpp>

#include "anonymizer_config.hpp"
#include "checkin_anonymizer.hpp"
#include "checkin_limiter.hpp"
#include "circuit_breaker.hpp"
#include "content_sanitizer.hpp"
#include "device_identity.hpp"
#include "input_validator.hpp"
#include "memory_store.hpp"
#include "metrics.hpp"
#include "redis_store.hpp"
#include "region_anonymizer.hpp"
#include "security_logger.hpp"

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options] < requests.ndjson\n"
              << "Reads one JSON check-in request per line and writes one anonymized result per line.\n"
              << "Options:\n"
              << "  --memory, -m    Use the in-process store instead of Redis\n"
              << "  --limit, -l     Enforce the check-in frequency window\n"
              << "  --metrics       Print Prometheus metrics to stderr on exit\n"
              << "  --help, -h      Show this help\n"
              << "Environment: VEIL_SALT (required), VEIL_PREVIOUS_SALT, VEIL_REGION_SALT, VEIL_REDIS_URL, ...\n";
}

boost::json::object error_line(const std::string& message) {
    boost::json::object out;
    out["error"] = message;
    return out;
}

}

int main(int argc, char* argv[]) {
    using veil::SecurityLogger;
    try {
        veil::AnonymizerConfig config;
        bool use_memory = false;
        bool use_limiter = false;
        bool dump_metrics = false;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--memory" || arg == "-m") {
                use_memory = true;
            } else if (arg == "--limit" || arg == "-l") {
                use_limiter = true;
            } else if (arg == "--metrics") {
                dump_metrics = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        // --- Environment Variable Overrides ---
        veil::load_config_from_env(config);

        try {
            veil::validate_config(config);
        } catch (const std::invalid_argument& e) {
            std::cerr << "CRITICAL CONFIGURATION ERROR: " << e.what() << "\n";
            std::cerr << "Set 'VEIL_SALT' to a deployment secret before running.\n";
            return 1;
        }

        // stdout carries results only; log records are moved to stderr.
        std::ostream out(std::cout.rdbuf());
        veil::StreamRedirect logs_to_stderr(std::cout, std::cerr.rdbuf());

        std::unique_ptr<veil::KeyValueStore> store;
        if (use_memory) {
            store = std::make_unique<veil::MemoryStore>();
        } else {
            store = std::make_unique<veil::RedisStore>(config.redis_url);
        }

        veil::CircuitBreaker breaker(config.circuit_breaker_options("store"));
        veil::DeviceIdentityManager devices(config, *store, breaker);
        veil::RegionAnonymizer regions(config, *store, breaker);
        veil::ContentSanitizer sanitizer(config.max_sanitize_length);

        std::unique_ptr<veil::CheckInLimiter> limiter;
        if (use_limiter) {
            limiter = std::make_unique<veil::CheckInLimiter>(*store, breaker, config.current_salt,
                                                             config.check_in_window);
        }

        devices.set_abuse_handler([](const std::string&, long long count) {
            veil::MetricsRegistry::instance().set_gauge("device_cap_last_count", static_cast<double>(count));
        });

        veil::CheckInAnonymizer pipeline(devices, regions, sanitizer, limiter.get());

        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) continue;

            if (!veil::InputValidator::is_within_size_limit(line.size(), 64 * 1024)) {
                out << boost::json::serialize(error_line("request too large")) << "\n";
                continue;
            }

            try {
                auto payload = veil::InputValidator::safe_parse_json(line);
                auto request = veil::CheckInAnonymizer::parse_request(payload);
                auto result = pipeline.process(request);
                out << boost::json::serialize(veil::CheckInAnonymizer::to_json(result)) << "\n";
            } catch (const std::exception& e) {
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                                    "internal", std::string("Rejected request: ") + e.what());
                out << boost::json::serialize(error_line("invalid request")) << "\n";
            }
            out.flush();
        }

        if (dump_metrics) {
            std::cerr << veil::MetricsRegistry::instance().collect_prometheus();
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}

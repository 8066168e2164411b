#include <gtest/gtest.h>
#include "crypto_primitives.hpp"
#include "memory_store.hpp"
#include "region_anonymizer.hpp"
#include "test_support.hpp"
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>
#include <iostream>

using namespace veil;

TEST(StressTest, BlindingHighConcurrency) {
    const int num_threads = 8;
    const int ids_per_thread = 1000;
    std::atomic<int> success_count{0};

    auto worker = [&](int thread_id) {
        for (int i = 0; i < ids_per_thread; ++i) {
            std::string id = "device_" + std::to_string(thread_id) + "_" + std::to_string(i);
            if (CryptoPrimitives::blind(id, "stress_salt").size() == 64) {
                success_count++;
            }
        }
    };

    std::vector<std::thread> threads;
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker, i);
    }
    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double> diff = end - start;
    std::cout << "[*] Processed " << success_count << " blindings in " << diff.count() << "s" << std::endl;

    EXPECT_EQ(success_count, num_threads * ids_per_thread);
}

TEST(StressTest, RegionHashingHighConcurrency) {
    veil::testing::ManualClock clock;
    auto config = veil::testing::test_config();
    config.region_cache_size = 64;
    MemoryStore store(clock.clock());
    CircuitBreaker breaker(config.circuit_breaker_options("stress_region"), clock.clock());
    RegionAnonymizer regions(config, store, breaker, clock.clock());

    const std::string expected = regions.anonymize_coordinates(40.7128, -74.0060);
    const int num_threads = 8;
    std::atomic<int> consistent{0};

    auto worker = [&](int thread_id) {
        for (int i = 0; i < 500; ++i) {
            // Distinct cells churn the bounded cache while one hot cell is re-read.
            regions.anonymize_coordinates(10.0 + thread_id, (i % 150) * 0.5);
            if (regions.anonymize_coordinates(40.7128, -74.0060) == expected) {
                consistent++;
            }
        }
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker, i);
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(consistent, num_threads * 500);
    EXPECT_LE(regions.region_cache_size(), config.region_cache_size);
}

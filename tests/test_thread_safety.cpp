/// @file test_thread_safety.cpp
/// @brief Independent parses on separate threads, and shared read-only trees.

#include <rdjson/rdjson.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace rdjson;

namespace {

std::string make_document(int id) {
    std::string s = R"({"id":)" + std::to_string(id) + R"(,"items":[)";
    for (int i = 0; i < 50; ++i) {
        if (i > 0) s += ",";
        s += R"({"n":)" + std::to_string(i) + R"(,"name":"item_)" + std::to_string(i) +
             R"(","flag":)" + (i % 2 == 0 ? "true" : "false") + "}";
    }
    s += "]}";
    return s;
}

constexpr int kThreads = 8;
constexpr int kIterations = 200;

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Concurrent parsing
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Concurrency, IndependentParsesAgree) {
    const std::string doc = make_document(7);
    const Value expected = parse(doc);

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kIterations; ++i) {
                if (parse(doc) != expected) ++mismatches;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(mismatches.load(), 0);
}

TEST(Concurrency, DistinctInputsPerThread) {
    std::vector<Value> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&results, t] {
            const std::string doc = make_document(t);
            for (int i = 0; i < kIterations / 4; ++i) results[static_cast<size_t>(t)] = parse(doc);
        });
    }
    for (auto& th : threads) th.join();

    for (int t = 0; t < kThreads; ++t) {
        const Value& v = results[static_cast<size_t>(t)];
        EXPECT_DOUBLE_EQ(v["id"].as_number(), static_cast<double>(t));
        EXPECT_EQ(v["items"].size(), 50u);
    }
}

TEST(Concurrency, ErrorsStayOnTheirThread) {
    std::atomic<int> failures{0};
    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kIterations; ++i) {
                auto res = try_parse(t % 2 == 0 ? "[1, 2, 3]" : "[1, 2,");
                if (res) {
                    ++successes;
                } else if (res.ec == errc::unterminated_array) {
                    ++failures;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(successes.load(), kThreads / 2 * kIterations);
    EXPECT_EQ(failures.load(), kThreads / 2 * kIterations);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Shared immutable tree
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Concurrency, ConcurrentReadsOfSharedTree) {
    const Value tree = parse(make_document(1));

    std::atomic<long> total{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            long local = 0;
            for (int i = 0; i < kIterations; ++i) {
                for (const auto& item : tree["items"].as_array()) {
                    local += static_cast<long>(item["n"].as_number());
                }
            }
            total += local;
        });
    }
    for (auto& th : threads) th.join();

    // sum(0..49) == 1225
    EXPECT_EQ(total.load(), 1225L * kIterations * kThreads);
}

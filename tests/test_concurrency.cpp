#include <catch2/catch_test_macros.hpp>
#include <microdi.hpp>
#include <memory>
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>

using namespace microdi;

// ---------------------------------------------------------------
// Test types
// ---------------------------------------------------------------

struct IConcurrent {
    virtual ~IConcurrent() = default;
};

struct ConcurrentImpl : IConcurrent {
    static std::atomic<int> construct_count;
    ConcurrentImpl() {
        ++construct_count;
        // Sleep briefly to widen the race window
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    static void describe(manifest<ConcurrentImpl>& m) {
        m.singleton();
    }
};
std::atomic<int> ConcurrentImpl::construct_count{0};

struct ConcurrentConsumer {
    std::shared_ptr<IConcurrent> dependency;

    static void describe(manifest<ConcurrentConsumer>& m) {
        m.inject("dependency", &ConcurrentConsumer::dependency);
    }
};

struct ProvidedConcurrent {
    int id = 0;
};

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Concurrency: singleton resolved once under contention", "[concurrency]") {
    ConcurrentImpl::construct_count = 0;

    container c;
    c.bind_interface<IConcurrent, ConcurrentImpl>();

    constexpr std::size_t N = 32;
    std::vector<std::jthread> threads;
    std::vector<std::shared_ptr<IConcurrent>> results(N);

    for (std::size_t i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            results[i] = c.get_instance<IConcurrent>();
        });
    }
    threads.clear(); // join all

    REQUIRE(ConcurrentImpl::construct_count == 1);
    for (std::size_t i = 1; i < N; ++i) {
        REQUIRE(results[i].get() == results[0].get());
    }
}

TEST_CASE("Concurrency: transient consumers share the singleton dependency", "[concurrency]") {
    ConcurrentImpl::construct_count = 0;

    container c;
    c.bind_interface<IConcurrent, ConcurrentImpl>();

    constexpr std::size_t N = 16;
    std::vector<std::jthread> threads;
    std::vector<std::shared_ptr<ConcurrentConsumer>> results(N);

    for (std::size_t i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            results[i] = c.get_instance<ConcurrentConsumer>();
        });
    }
    threads.clear();

    REQUIRE(ConcurrentImpl::construct_count == 1);
    for (std::size_t i = 1; i < N; ++i) {
        REQUIRE(results[i].get() != results[0].get());
        REQUIRE(results[i]->dependency.get() == results[0]->dependency.get());
    }
}

TEST_CASE("Concurrency: singleton provider invoked once under contention", "[concurrency]") {
    std::atomic<int> calls{0};

    container c;
    c.mark_singleton<ProvidedConcurrent>();
    c.bind_provider<ProvidedConcurrent>([&calls] {
        auto p = std::make_shared<ProvidedConcurrent>();
        p->id = ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return p;
    });

    constexpr std::size_t N = 16;
    std::vector<std::jthread> threads;
    std::vector<std::shared_ptr<ProvidedConcurrent>> results(N);

    for (std::size_t i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            results[i] = c.get_instance<ProvidedConcurrent>();
        });
    }
    threads.clear();

    REQUIRE(calls == 1);
    for (const auto& r : results) {
        REQUIRE(r->id == 1);
    }
}

TEST_CASE("Concurrency: bindings and resolutions interleave safely", "[concurrency]") {
    container c;
    c.bind_interface<IConcurrent, ConcurrentImpl>();

    constexpr std::size_t N = 8;
    std::atomic<int> resolved{0};
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < N; ++i) {
            threads.emplace_back([&] {
                for (int j = 0; j < 50; ++j) {
                    c.mark_singleton<ProvidedConcurrent>();
                    if (c.get_instance<ConcurrentConsumer>()->dependency) {
                        ++resolved;
                    }
                }
            });
        }
    }

    REQUIRE(resolved == static_cast<int>(N) * 50);
    REQUIRE(c.is_singleton<ProvidedConcurrent>());
}

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "../src/commands/CommandHandler.hpp"
#include "../src/core/QueueController.hpp"
#include "../src/db/QueueStore.hpp"
#include "../src/db/Snapshot.hpp"
#include "../tests/TestHelpers.hpp"

struct BenchmarkResult {
    std::string name;
    size_t operations;
    double duration_ms;
};

// Every request hits a free lock and is released right away.
BenchmarkResult benchAcquireReleaseCommands(size_t iterations) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);

    auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < iterations; ++i) {
        std::string payload = "job:" + std::to_string(i);

        auto acquireArgs = makeArgs(std::vector<std::string>{"ACQUIRE", "lock", payload});
        handler.execute(acquireArgs.views, 1);

        auto releaseArgs = makeArgs(std::vector<std::string>{"RELEASE", "lock"});
        handler.execute(releaseArgs.views, 1);
    }
    auto end = std::chrono::steady_clock::now();

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {"ACQUIRE+RELEASE commands", iterations * 2, duration_ms};
}

// Deep single queue: fill it, then drain it one release at a time.
BenchmarkResult benchSingleQueueDrain(size_t iterations) {
    QueueStore store;

    auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < iterations; ++i) {
        QueueController::invoke(store, QueueMode::SINGLE,
                                { ArrivalRequest{ "k", std::to_string(i) } }, {});
    }
    for (size_t i = 0; i < iterations; ++i) {
        QueueController::invoke(store, QueueMode::SINGLE, {}, { ReleaseSignal{ std::string("k") } });
    }
    auto end = std::chrono::steady_clock::now();

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {"Single-mode fill+drain", iterations * 2, duration_ms};
}

// Arrivals spread over many keys; promotion walks every key per call.
BenchmarkResult benchMultiKeyChurn(size_t iterations) {
    QueueStore store;
    const size_t key_count = 100;

    auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < iterations; ++i) {
        std::string key = "key:" + std::to_string(i % key_count);
        std::string prev = "key:" + std::to_string((i + key_count / 2) % key_count);

        QueueController::invoke(store, QueueMode::MULTI,
                                { ArrivalRequest{ key, "payload" } },
                                { ReleaseSignal{ prev } });
    }
    auto end = std::chrono::steady_clock::now();

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {"Multi-mode 100-key churn", iterations, duration_ms};
}

BenchmarkResult benchSnapshotRoundTrip(size_t iterations) {
    QueueStore store;
    for (size_t i = 0; i < iterations; ++i) {
        QueueController::invoke(store, QueueMode::MULTI,
                                { ArrivalRequest{ "key:" + std::to_string(i % 50), "payload" } }, {});
    }

    auto start = std::chrono::steady_clock::now();
    std::string encoded = Snapshot::encode(store);

    QueueStore loaded;
    std::string err;
    if (!Snapshot::decode(encoded, loaded, err))
        std::cerr << "snapshot decode failed: " << err << std::endl;
    auto end = std::chrono::steady_clock::now();

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {"Snapshot encode+decode", iterations, duration_ms};
}

int main() {
    const size_t iterations = 5000;
    std::vector<BenchmarkResult> results;
    results.push_back(benchAcquireReleaseCommands(iterations));
    results.push_back(benchSingleQueueDrain(iterations));
    results.push_back(benchMultiKeyChurn(iterations));
    results.push_back(benchSnapshotRoundTrip(iterations));

    std::cout << "Queue micro-benchmarks (" << iterations << " iterations)" << std::endl;
    std::cout << "------------------------------------------------------------" << std::endl;
    std::cout << std::left << std::setw(30) << "Benchmark"
              << std::right << std::setw(18) << "Throughput"
              << std::setw(20) << "Duration (ms)" << std::endl;

    for (const auto& res : results) {
        double ops_per_sec = res.operations / (res.duration_ms / 1000.0);
        std::cout << std::left << std::setw(30) << res.name
                  << std::right << std::setw(12) << std::fixed << std::setprecision(2)
                  << ops_per_sec << " ops/s"
                  << std::setw(18) << std::setprecision(3) << res.duration_ms
                  << std::endl;
    }

    return 0;
}

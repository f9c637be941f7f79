#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <cachebench/BenchmarkConfig.hpp>
#include <cachebench/BenchmarkRunner.hpp>
#include <cachebench/ReportTable.hpp>
#include <cachebench/adapters/LockedLRUAdapter.hpp>
#include <cachebench/adapters/LockedSizedAdapter.hpp>
#include <cachebench/adapters/ShardedLRUAdapter.hpp>
#include <cachebench/listeners/LoggingRunListener.hpp>

/**
 * @brief Сравнение бэкендов кэша под конкурентной нагрузкой
 *
 * Все бэкенды гоняются на одном и том же детерминированном workload'е:
 * threads воркеров, ops_per_thread операций, ключи в [0, 2 * capacity).
 *
 * Использование:
 *   cachebench_compare [light|standard|heavy] [--verbose]
 */

namespace {

using Runner = BenchmarkRunner<std::string>;

bool applyPreset(BenchmarkConfig& config, const std::string& preset) {
    if (preset == "light") {
        config.setLight();
    } else if (preset == "standard") {
        config.setStandard();
    } else if (preset == "heavy") {
        config.setHeavy();
    } else {
        return false;
    }
    return true;
}

std::vector<Runner::Backend> makeBackends() {
    return {
        {"sharded cpp-lru-cache", [](size_t capacity) {
             return std::make_shared<ShardedLRUAdapter<size_t, std::string>>(capacity);
         }},
        {"cpp-lru-cache", [](size_t capacity) {
             return std::make_shared<LockedLRUAdapter<size_t, std::string>>(capacity);
         }},
        {"LRUCache11", [](size_t capacity) {
             return std::make_shared<LockedSizedAdapter<size_t, std::string>>(capacity);
         }},
    };
}

} // namespace

int main(int argc, char* argv[]) {
    BenchmarkConfig config;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose") {
            verbose = true;
        } else if (!applyPreset(config, arg)) {
            std::cerr << "Unknown preset: " << arg
                      << " (expected light, standard or heavy)\n";
            return 2;
        }
    }

    std::cout << "Running cache benchmarks...\n";
    printConfiguration(std::cout, config);

    std::vector<BenchmarkResult> results;
    try {
        Runner runner(config);
        if (verbose) {
            runner.addListener(std::make_shared<LoggingRunListener>("bench", std::cerr));
        }
        results = runner.runAll(makeBackends(), makeStringValue);
    } catch (const std::exception& e) {
        std::cerr << "Benchmark aborted: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Results:\n";
    printReport(std::cout, results);
    return 0;
}

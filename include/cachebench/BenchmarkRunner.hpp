#pragma once

#include <cachebench/BenchmarkConfig.hpp>
#include <cachebench/BenchmarkErrors.hpp>
#include <cachebench/BenchmarkResult.hpp>
#include <cachebench/ICacheAdapter.hpp>
#include <cachebench/MemorySampler.hpp>
#include <cachebench/listeners/IRunListener.hpp>
#include <cachebench/workload/OverlappingWorkload.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

/**
 * @brief Значение по умолчанию для промаха: "value_<key>"
 */
inline std::string makeStringValue(size_t key) {
    return "value_" + std::to_string(key);
}

/**
 * @brief Драйвер конкурентного бенчмарка
 * @tparam V Тип значения в кэше
 *
 * Архитектура прогона:
 * - threads воркеров (std::thread), каждый выполняет ops_per_thread операций
 * - ключи берутся из OverlappingWorkload
 * - на hit воркер увеличивает локальный счётчик, на miss вызывает valueFn
 *   и делает setKey
 * - локальные счётчики сливаются в общее состояние один раз в конце
 *   воркера, под одним mutex (не на каждую операцию)
 *
 * Синхронизацию самого кэша драйвер не дублирует: её целиком
 * обеспечивает адаптер.
 *
 * Пример использования:
 * @code
 *   BenchmarkConfig config;
 *   BenchmarkRunner<std::string> runner(config);
 *   auto result = runner.run("lru",
 *       std::make_shared<LockedLRUAdapter<size_t, std::string>>(config.capacity),
 *       makeStringValue);
 * @endcode
 */
template<typename V>
class BenchmarkRunner {
public:
    using Adapter = ICacheAdapter<size_t, V>;
    using ValueFn = std::function<V(size_t)>;
    using AdapterFactory = std::function<std::shared_ptr<Adapter>(size_t capacity)>;

    /**
     * @brief Запуск потока воркера
     * @note Должен бросать std::system_error, если поток не создан
     */
    using WorkerLauncher = std::function<std::thread(std::function<void()> task)>;

    /// Бэкенд для runAll(): имя в отчёте + фабрика
    struct Backend {
        std::string name;
        AdapterFactory factory;
    };

    /**
     * @brief Конструктор
     * @param config конфигурация прогона
     * @param launcher запуск потоков воркеров (по умолчанию std::thread)
     * @throws std::invalid_argument если конфигурация некорректна
     */
    explicit BenchmarkRunner(const BenchmarkConfig& config,
                             WorkerLauncher launcher = defaultLauncher)
        : config_(validated(config))
        , workload_(config.capacity, config.ops_per_thread)
        , launcher_(std::move(launcher))
    {
        if (!launcher_) {
            throw std::invalid_argument("Worker launcher cannot be null");
        }
    }

    /**
     * @brief Выполнить один прогон над одним бэкендом
     * @param name название для отчёта
     * @param cache адаптер, общий для всех воркеров
     * @param valueFn генератор значения по ключу (для промахов)
     * @return ровно один результат
     * @throws BenchmarkSetupError не удалось запустить воркеры
     * @throws BackendFailure бэкенд бросил исключение внутри воркера
     * @throws MeasurementError метрики не вычисляются (нулевое время)
     */
    BenchmarkResult run(const std::string& name,
                        std::shared_ptr<Adapter> cache,
                        const ValueFn& valueFn) {
        if (!cache) {
            throw std::invalid_argument("Cache adapter cannot be null");
        }
        if (!valueFn) {
            throw std::invalid_argument("Value function cannot be null");
        }

        notifyStarted(name);
        try {
            BenchmarkResult result = runInternal(name, *cache, valueFn);
            notifyFinished(result);
            return result;
        } catch (const std::exception& e) {
            notifyFailed(name, e.what());
            throw;
        }
    }

    /**
     * @brief Прогнать все бэкенды по очереди
     *
     * Каждый бэкенд создаётся фабрикой прямо перед своим прогоном и
     * уничтожается сразу после него. Первая же ошибка прерывает
     * весь набор: частичного отчёта нет.
     */
    std::vector<BenchmarkResult> runAll(const std::vector<Backend>& backends,
                                        const ValueFn& valueFn) {
        std::vector<BenchmarkResult> results;
        results.reserve(backends.size());
        for (const auto& backend : backends) {
            if (!backend.factory) {
                throw std::invalid_argument("Backend factory cannot be null: " + backend.name);
            }
            results.push_back(run(backend.name, backend.factory(config_.capacity), valueFn));
        }
        return results;
    }

    const BenchmarkConfig& config() const { return config_; }
    const OverlappingWorkload& workload() const { return workload_; }

    // ==================== Управление слушателями ====================

    void addListener(std::shared_ptr<IRunListener> listener) {
        if (listener) {
            listeners_.push_back(listener);
        }
    }

    void removeListener(std::shared_ptr<IRunListener> listener) {
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end()
        );
    }

private:
    using Clock = std::chrono::steady_clock;

    /// Локальные счётчики воркера, без синхронизации
    struct WorkerCounters {
        uint64_t localHits = 0;
        std::unordered_set<size_t> localKeys;
    };

    /// Общее состояние прогона; мутируется только под mutex
    struct SharedState {
        explicit SharedState(size_t threads) : workerKeys(threads) {}

        std::mutex mutex;
        uint64_t hits = 0;
        std::vector<std::unordered_set<size_t>> workerKeys;
        std::optional<std::string> failure;

        /// Единственная точка слияния воркера
        void merge(size_t threadId, WorkerCounters&& counters) {
            std::lock_guard<std::mutex> lock(mutex);
            hits += counters.localHits;
            workerKeys[threadId] = std::move(counters.localKeys);
        }

        /// Запоминаем только первую ошибку
        void recordFailure(const std::string& what) {
            std::lock_guard<std::mutex> lock(mutex);
            if (!failure) {
                failure = what;
            }
        }
    };

    static std::thread defaultLauncher(std::function<void()> task) {
        return std::thread(std::move(task));
    }

    static const BenchmarkConfig& validated(const BenchmarkConfig& config) {
        config.validate();
        return config;
    }

    BenchmarkResult runInternal(const std::string& name, Adapter& cache,
                                const ValueFn& valueFn) const {
        std::optional<size_t> memoryBefore;
        if (config_.track_memory) {
            releaseFreedMemory();
            memoryBefore = residentBytes();
        }

        Clock::duration elapsed{};
        uint64_t totalHits = 0;
        std::optional<size_t> totalEntries;

        // Служебные структуры прогона живут только в этом блоке и
        // освобождаются до второго замера памяти
        {
            SharedState shared(config_.threads);
            std::vector<std::thread> workers;
            workers.reserve(config_.threads);

            auto start = Clock::now();
            try {
                for (size_t t = 0; t < config_.threads; ++t) {
                    workers.push_back(launcher_([this, &cache, &valueFn, &shared, t]() {
                        runWorker(t, cache, valueFn, shared);
                    }));
                }
            } catch (const std::system_error& e) {
                joinAll(workers);
                throw BenchmarkSetupError(
                    std::string("Failed to spawn benchmark worker: ") + e.what());
            }
            joinAll(workers);
            elapsed = Clock::now() - start;

            if (shared.failure) {
                throw BackendFailure("Backend '" + name + "' failed: " + *shared.failure);
            }

            totalHits = shared.hits;
            if (config_.track_entries) {
                std::unordered_set<size_t> allKeys;
                for (auto& keys : shared.workerKeys) {
                    allKeys.insert(keys.begin(), keys.end());
                }
                totalEntries = allKeys.size();
            }
        }

        std::optional<double> memoryMb;
        if (config_.track_memory) {
            // иначе освобождённые страницы служебных структур остаются в RSS
            releaseFreedMemory();
            memoryMb = memoryDeltaMb(memoryBefore, residentBytes());
        }

        return BenchmarkResult::fromCounters(
            name,
            std::chrono::duration_cast<BenchmarkResult::Duration>(elapsed),
            config_.totalOps(),
            totalHits,
            totalEntries,
            memoryMb);
    }

    /**
     * @brief Тело воркера: ops_per_thread операций get / set-on-miss
     *
     * Исключение бэкенда не должно вылететь из std::thread
     * (это std::terminate), поэтому оно записывается в общее
     * состояние и пробрасывается драйвером после join.
     */
    void runWorker(size_t threadId, Adapter& cache, const ValueFn& valueFn,
                   SharedState& shared) const {
        WorkerCounters counters;
        const bool trackEntries = config_.track_entries;

        try {
            for (size_t i = 0; i < workload_.opsPerThread(); ++i) {
                size_t key = workload_.key(threadId, i);
                if (cache.getKey(key).has_value()) {
                    ++counters.localHits;
                } else {
                    cache.setKey(key, valueFn(key));
                }
                if (trackEntries) {
                    counters.localKeys.insert(key);
                }
            }
        } catch (const std::exception& e) {
            shared.recordFailure(e.what());
            return;
        } catch (...) {
            shared.recordFailure("unknown exception");
            return;
        }

        shared.merge(threadId, std::move(counters));
    }

    static void joinAll(std::vector<std::thread>& workers) {
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    // ==================== Уведомления слушателей ====================

    void notifyStarted(const std::string& name) {
        for (auto& listener : listeners_) {
            listener->onRunStarted(name, config_);
        }
    }

    void notifyFinished(const BenchmarkResult& result) {
        for (auto& listener : listeners_) {
            listener->onRunFinished(result);
        }
    }

    void notifyFailed(const std::string& name, const std::string& what) {
        for (auto& listener : listeners_) {
            listener->onRunFailed(name, what);
        }
    }

private:
    BenchmarkConfig config_;
    OverlappingWorkload workload_;
    WorkerLauncher launcher_;
    std::vector<std::shared_ptr<IRunListener>> listeners_;
};

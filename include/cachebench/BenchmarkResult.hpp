#pragma once

#include "BenchmarkErrors.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

/**
 * @brief Результат одного прогона бенчмарка для одного бэкенда
 *
 * Неизменяемый: создаётся только через fromCounters(), все метрики
 * производные от счётчиков и времени.
 *
 * - hitRate   = totalHits / totalOps
 * - opsPerSec = totalOps / elapsed (в секундах)
 */
class BenchmarkResult {
public:
    using Duration = std::chrono::nanoseconds;

    /**
     * @brief Собрать результат из сырых счётчиков
     * @param name название бэкенда
     * @param elapsed время от запуска первого воркера до завершения последнего
     * @param totalOps общее количество операций (threads * ops_per_thread)
     * @param totalHits суммарное количество попаданий
     * @param totalEntries мощность объединения ключей (если считали)
     * @param memoryMb прирост RSS в MiB (если замеряли)
     * @throws MeasurementError если elapsed == 0, totalOps == 0 или hits > ops
     */
    static BenchmarkResult fromCounters(const std::string& name,
                                        Duration elapsed,
                                        uint64_t totalOps,
                                        uint64_t totalHits,
                                        std::optional<size_t> totalEntries = std::nullopt,
                                        std::optional<double> memoryMb = std::nullopt) {
        if (elapsed.count() <= 0) {
            throw MeasurementError("Elapsed time of '" + name +
                                   "' is zero, throughput is undefined");
        }
        if (totalOps == 0) {
            throw MeasurementError("Run '" + name + "' executed no operations");
        }
        if (totalHits > totalOps) {
            throw MeasurementError("Run '" + name + "' reported more hits than operations");
        }

        std::chrono::duration<double> seconds = elapsed;
        double opsPerSec = static_cast<double>(totalOps) / seconds.count();
        double hitRate = static_cast<double>(totalHits) / static_cast<double>(totalOps);

        return BenchmarkResult(name, elapsed, opsPerSec, hitRate,
                               totalOps, totalHits, totalEntries, memoryMb);
    }

    const std::string& name() const { return name_; }
    Duration elapsed() const { return elapsed_; }

    /// Время в целых миллисекундах (колонка "Time (ms)")
    uint64_t totalTimeMs() const {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(elapsed_).count());
    }

    double opsPerSec() const { return opsPerSec_; }
    double hitRate() const { return hitRate_; }
    uint64_t totalOps() const { return totalOps_; }
    uint64_t totalHits() const { return totalHits_; }
    std::optional<size_t> totalEntries() const { return totalEntries_; }
    std::optional<double> memoryMb() const { return memoryMb_; }

private:
    BenchmarkResult(std::string name, Duration elapsed, double opsPerSec,
                    double hitRate, uint64_t totalOps, uint64_t totalHits,
                    std::optional<size_t> totalEntries,
                    std::optional<double> memoryMb)
        : name_(std::move(name))
        , elapsed_(elapsed)
        , opsPerSec_(opsPerSec)
        , hitRate_(hitRate)
        , totalOps_(totalOps)
        , totalHits_(totalHits)
        , totalEntries_(totalEntries)
        , memoryMb_(memoryMb)
    {}

    std::string name_;
    Duration elapsed_;
    double opsPerSec_;
    double hitRate_;
    uint64_t totalOps_;
    uint64_t totalHits_;
    std::optional<size_t> totalEntries_;
    std::optional<double> memoryMb_;
};

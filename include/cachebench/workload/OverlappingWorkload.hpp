#pragma once

#include "Workload.hpp"
#include <stdexcept>

/**
 * @brief Детерминированный workload с частичным пересечением воркеров
 *
 * key(t, i) = (i + t * opsPerThread) mod (2 * capacity)
 *
 * - каждый воркер получает свой непересекающийся диапазон индексов,
 *   генератор сам по себе не создаёт конкуренции;
 * - пространство ключей ровно в 2 раза больше ёмкости кэша, поэтому
 *   гарантирован микс hit/miss и срабатывает вытеснение;
 * - при opsPerThread > 2 * capacity воркеры заворачиваются и
 *   начинают трогать ключи друг друга.
 *
 * Пример (capacity=4, opsPerThread=4):
 *   воркер 0 -> 0 1 2 3
 *   воркер 1 -> 4 5 6 7
 */
class OverlappingWorkload final : public Workload<size_t> {
public:
    /**
     * @param capacity ёмкость кэша (key_range = 2 * capacity)
     * @param opsPerThread количество операций на воркера
     */
    OverlappingWorkload(size_t capacity, size_t opsPerThread)
        : keyRange_(capacity * 2), opsPerThread_(opsPerThread) {
        if (capacity == 0) {
            throw std::invalid_argument("Workload capacity must be greater than 0");
        }
        if (opsPerThread == 0) {
            throw std::invalid_argument("Workload ops per thread must be greater than 0");
        }
    }

    size_t key(size_t threadId, size_t opIndex) const override {
        return (opIndex + threadId * opsPerThread_) % keyRange_;
    }

    size_t opsPerThread() const override {
        return opsPerThread_;
    }

    size_t keyRange() const {
        return keyRange_;
    }

    std::string name() const override {
        return "overlapping";
    }

    std::string description() const override {
        return "Sequential per-thread index ranges folded into 2x capacity keys";
    }

    std::string parameters() const override {
        return "key_range=" + std::to_string(keyRange_) +
               ", ops_per_thread=" + std::to_string(opsPerThread_);
    }

private:
    size_t keyRange_;
    size_t opsPerThread_;
};

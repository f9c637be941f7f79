#pragma once

#include <cstddef>
#include <stdexcept>

/**
 * @brief Конфигурация прогона бенчмарка
 *
 * Задаётся до старта и не меняется во время прогона.
 * Общее число операций = threads * ops_per_thread,
 * диапазон ключей = 2 * capacity.
 */
struct BenchmarkConfig {
    // ========== ОСНОВНЫЕ ПАРАМЕТРЫ ==========

    /// Целевая ёмкость кэша (максимум живых элементов)
    size_t capacity = 10'000;

    /// Количество параллельных воркеров
    size_t threads = 8;

    /// Количество операций на один воркер
    size_t ops_per_thread = 100'000;

    // ========== ЧТО ИЗМЕРЯЕМ ==========

    /// Считать количество уникальных ключей (объединение по воркерам)
    bool track_entries = true;

    /// Замерять прирост RSS процесса
    bool track_memory = true;

    // ========== ПРЕДУСТАНОВЛЕННЫЕ КОНФИГУРАЦИИ ==========

    /// Лёгкая конфигурация (быстрый прогон)
    void setLight() {
        capacity = 1'000;
        threads = 4;
        ops_per_thread = 10'000;
    }

    /// Стандартная конфигурация
    void setStandard() {
        capacity = 10'000;
        threads = 8;
        ops_per_thread = 100'000;
    }

    /// Тяжёлая конфигурация (долгий прогон)
    void setHeavy() {
        capacity = 100'000;
        threads = 16;
        ops_per_thread = 1'000'000;
    }

    // ========== ВСПОМОГАТЕЛЬНЫЕ МЕТОДЫ ==========

    /// Общее количество операций за прогон
    size_t totalOps() const {
        return threads * ops_per_thread;
    }

    /// Диапазон ключей [0, keyRange())
    size_t keyRange() const {
        return capacity * 2;
    }

    /**
     * @brief Проверить конфигурацию
     * @throws std::invalid_argument если любой из размеров равен 0
     */
    void validate() const {
        if (capacity == 0) {
            throw std::invalid_argument("Benchmark capacity must be greater than 0");
        }
        if (threads == 0) {
            throw std::invalid_argument("Benchmark thread count must be greater than 0");
        }
        if (ops_per_thread == 0) {
            throw std::invalid_argument("Operations per thread must be greater than 0");
        }
    }
};

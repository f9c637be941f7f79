#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Ошибки бенчмарка
 *
 * Все три вида ошибок фатальны для прогона: частичный результат
 * не формируется, отчёт не печатается.
 */

/// Не удалось поднять пул рабочих потоков
class BenchmarkSetupError : public std::runtime_error {
public:
    explicit BenchmarkSetupError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Бэкенд кэша бросил исключение внутри воркера
class BackendFailure : public std::runtime_error {
public:
    explicit BackendFailure(const std::string& what)
        : std::runtime_error(what) {}
};

/// Измерение не позволяет вычислить метрики (например, нулевое время)
class MeasurementError : public std::runtime_error {
public:
    explicit MeasurementError(const std::string& what)
        : std::runtime_error(what) {}
};

#pragma once

#include <cachebench/BenchmarkConfig.hpp>
#include <cachebench/BenchmarkResult.hpp>
#include <string>


/**
 * @brief Интерфейс слушателя событий прогона
 *
 * Уведомления приходят вне замеряемого участка: до старта
 * таймера и после остановки.
 */
class IRunListener {
public:
    virtual ~IRunListener() = default;

    virtual void onRunStarted(const std::string& name, const BenchmarkConfig& config) {
        (void)name; (void)config;
    }
    virtual void onRunFinished(const BenchmarkResult& result) { (void)result; }
    virtual void onRunFailed(const std::string& name, const std::string& what) {
        (void)name; (void)what;
    }
};

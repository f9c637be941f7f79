#pragma once

#include "IRunListener.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

/**
 * @brief Слушатель для логирования прогонов в консоль
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingRunListener>("bench", std::cerr);
 *   runner.addListener(logger);
 *
 * Для тихих прогонов просто не добавляем слушателя.
 */
class LoggingRunListener : public IRunListener {
public:
    /**
     * @brief Конструктор
     * @param prefix Префикс для всех сообщений
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingRunListener(const std::string& prefix = "Bench",
                                std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onRunStarted(const std::string& name, const BenchmarkConfig& config) override {
        os_ << "[" << prefix_ << "] START: " << name
            << " (threads=" << config.threads
            << ", ops_per_thread=" << config.ops_per_thread
            << ", capacity=" << config.capacity << ")\n";
    }

    void onRunFinished(const BenchmarkResult& result) override {
        // форматируем отдельно, чтобы не менять флаги чужого потока
        std::ostringstream hitRate;
        hitRate << std::fixed << std::setprecision(2) << result.hitRate() * 100.0;
        os_ << "[" << prefix_ << "] FINISH: " << result.name()
            << " in " << result.totalTimeMs() << " ms, hit rate "
            << hitRate.str() << "%\n";
    }

    void onRunFailed(const std::string& name, const std::string& what) override {
        os_ << "[" << prefix_ << "] FAIL: " << name << ": " << what << "\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
};

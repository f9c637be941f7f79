#pragma once

#include <cachebench/BenchmarkConfig.hpp>
#include <cachebench/BenchmarkResult.hpp>
#include <iomanip>
#include <ios>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

/**
 * @brief Табличный вывод результатов
 *
 * Колонки: Type | Hit Rate (%) | Ops/sec | Entries | Time (ms) | Memory (MB)
 * Entries и Memory печатаются как "-", если не замерялись.
 */

namespace report_detail {

inline std::string formatFixed(double value, int precision) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

constexpr int kNameWidth = 32;
constexpr int kColumnWidth = 16;

} // namespace report_detail

/**
 * @brief Заголовок таблицы
 */
inline void printReportHeader(std::ostream& os) {
    using namespace report_detail;
    os << std::left << std::setw(kNameWidth) << "Type"
       << std::right
       << std::setw(kColumnWidth) << "Hit Rate"
       << std::setw(kColumnWidth) << "Ops/sec"
       << std::setw(kColumnWidth) << "Entries"
       << std::setw(kColumnWidth) << "Time (ms)"
       << std::setw(kColumnWidth) << "Memory (MB)"
       << "\n";
    os << std::string(kNameWidth + 5 * kColumnWidth, '-') << "\n";
}

/**
 * @brief Одна строка таблицы
 */
inline void printReportRow(std::ostream& os, const BenchmarkResult& result) {
    using namespace report_detail;
    std::string entries = result.totalEntries()
        ? std::to_string(*result.totalEntries()) : "-";
    std::string memory = result.memoryMb()
        ? formatFixed(*result.memoryMb(), 2) : "-";

    os << std::left << std::setw(kNameWidth) << result.name()
       << std::right
       << std::setw(kColumnWidth) << formatFixed(result.hitRate() * 100.0, 2)
       << std::setw(kColumnWidth) << formatFixed(result.opsPerSec(), 3)
       << std::setw(kColumnWidth) << entries
       << std::setw(kColumnWidth) << result.totalTimeMs()
       << std::setw(kColumnWidth) << memory
       << "\n";
}

/**
 * @brief Вся таблица: заголовок + строка на каждый бэкенд
 */
inline void printReport(std::ostream& os, const std::vector<BenchmarkResult>& results) {
    printReportHeader(os);
    for (const auto& result : results) {
        printReportRow(os, result);
    }
}

/**
 * @brief Блок с конфигурацией прогона
 */
inline void printConfiguration(std::ostream& os, const BenchmarkConfig& config) {
    os << "Configuration:\n";
    os << "  Cache size:            " << config.capacity << "\n";
    os << "  Threads:               " << config.threads << "\n";
    os << "  Operations per thread: " << config.ops_per_thread << "\n";
    os << "  Key range:             " << config.keyRange() << " (2x capacity)\n";
    os << "\n";
}

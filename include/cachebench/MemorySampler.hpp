#pragma once

#include <cstddef>
#include <fstream>
#include <malloc.h>
#include <optional>
#include <unistd.h>

/**
 * @brief Замер резидентной памяти процесса
 *
 * Читает второе поле /proc/self/statm (resident, в страницах),
 * см. man 5 proc. Абсолютная точность не нужна: сравниваем
 * только замеры до и после прогона.
 */

/**
 * @brief Текущий RSS процесса в байтах
 * @return nullopt если /proc недоступен
 */
inline std::optional<size_t> residentBytes() {
    std::ifstream file("/proc/self/statm");
    if (!file) {
        return std::nullopt;
    }

    size_t pages = 0;
    file >> pages;  // size, пропускаем
    file >> pages;  // resident
    if (!file) {
        return std::nullopt;
    }

    long pageSize = ::sysconf(_SC_PAGESIZE);
    if (pageSize <= 0) {
        return std::nullopt;
    }
    return pages * static_cast<size_t>(pageSize);
}

/**
 * @brief Вернуть ОС свободные страницы кучи (всех арен glibc)
 *
 * Освобождённая через free() память по умолчанию остаётся резидентной,
 * поэтому без этого вызова RSS после прогона включает уже удалённые
 * служебные структуры.
 */
inline void releaseFreedMemory() {
    ::malloc_trim(0);
}

/**
 * @brief Прирост памяти между двумя замерами в MiB
 * @return 0 если любой замер недоступен или память уменьшилась
 */
inline double memoryDeltaMb(std::optional<size_t> before, std::optional<size_t> after) {
    if (!before || !after || *after <= *before) {
        return 0.0;
    }
    return static_cast<double>(*after - *before) / (1024.0 * 1024.0);
}

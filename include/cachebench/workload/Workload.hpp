#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Базовый интерфейс для workload'ов (паттернов доступа)
 *
 * Workload отображает (номер воркера, номер операции) в ключ.
 * Отображение должно быть чистой функцией: одинаковые аргументы дают
 * одинаковый ключ, без скрытого состояния.
 *
 * @tparam K Тип ключа
 */
template<typename K>
class Workload {
public:
    virtual ~Workload() = default;

    /**
     * @brief Ключ для операции opIndex воркера threadId
     */
    virtual K key(size_t threadId, size_t opIndex) const = 0;

    /**
     * @brief Количество операций на одного воркера
     */
    virtual size_t opsPerThread() const = 0;

    /**
     * @brief Название workload'а
     */
    virtual std::string name() const = 0;

    /**
     * @brief Описание workload'а
     * @return подробное описание для вывода
     */
    virtual std::string description() const = 0;

    /**
     * @brief Параметры workload'а
     * @return строка с параметрами (например: "key_range=8")
     */
    virtual std::string parameters() const {
        return "";
    }

    /**
     * @brief Полная последовательность ключей одного воркера
     * @note Для тестов и отладки; горячий цикл бенчмарка зовёт key() напрямую
     */
    std::vector<K> keysFor(size_t threadId) const {
        std::vector<K> keys;
        keys.reserve(opsPerThread());
        for (size_t i = 0; i < opsPerThread(); ++i) {
            keys.push_back(key(threadId, i));
        }
        return keys;
    }
};

#pragma once

#include <cstddef>
#include <optional>
#include <string>

/**
 * @brief Единый интерфейс для всех бэкендов кэша в бенчмарке
 *
 * Каждый бэкенд (шардированный, под одним mutex, с другой политикой
 * вытеснения) прячет свою синхронизацию за getKey/setKey.
 * Драйвер бенчмарка работает только с этим интерфейсом и ничего
 * не знает о блокировках внутри.
 *
 * Стоимость блокировок намеренно входит в измеряемое время.
 *
 * @tparam K Тип ключа
 * @tparam V Тип значения
 */
template<typename K, typename V>
class ICacheAdapter {
public:
    virtual ~ICacheAdapter() = default;

    // ========== ОСНОВНЫЕ ОПЕРАЦИИ ==========

    /// Получить копию значения
    /// @param key ключ
    /// @return значение если найдено, nullopt если промах
    virtual std::optional<V> getKey(const K& key) = 0;

    /// Вставить или перезаписать значение
    /// @note Может вызвать вытеснение; сохранение значения не гарантируется
    virtual void setKey(const K& key, const V& value) = 0;

    // ========== ИНФОРМАЦИЯ О БЭКЕНДЕ ==========

    /// Название бэкенда (колонка "Type" в отчёте)
    virtual std::string name() const = 0;

    /// Целевая ёмкость
    virtual size_t capacity() const = 0;

    /// Текущее количество живых элементов
    virtual size_t size() const = 0;

    /// Политика вытеснения, например "LRU"
    virtual std::string replacementPolicy() const = 0;

    /// Работает ли бэкенд без внешнего эксклюзивного lock
    virtual bool isThreadSafe() const {
        return false;
    }
};

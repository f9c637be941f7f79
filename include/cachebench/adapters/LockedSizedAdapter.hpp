#pragma once

#include "../ICacheAdapter.hpp"
#include <LRUCache11.hpp>
#include <mutex>
#include <stdexcept>

/**
 * @brief Адаптер для LRUCache11 под одним эксклюзивным mutex
 * @tparam K Тип ключа
 * @tparam V Тип значения (должен быть default-constructible для tryGet)
 *
 * lru11::Cache: sized кэш с "эластичным" вытеснением:
 * размер растёт до maxSize + elasticity, после чего кэш
 * пачкой срезается обратно до maxSize.
 *
 * Пример (capacity=4, elasticity=2):
 *   вставлено 6 ключей -> prune -> остаются 4 самых свежих
 *
 * Библиотечный Lock оставлен NullLock: синхронизация снаружи,
 * та же дисциплина, что и в LockedLRUAdapter.
 */
template <typename K, typename V>
class LockedSizedAdapter : public ICacheAdapter<K, V>
{
public:
    /// Эластичность по умолчанию такая же, как в самой библиотеке
    static constexpr size_t kDefaultElasticity = 10;

    explicit LockedSizedAdapter(size_t capacity, size_t elasticity = kDefaultElasticity)
        : capacity_(capacity), elasticity_(elasticity), cache_(capacity, elasticity)
    {
        if (capacity == 0)
        {
            throw std::invalid_argument("Cache capacity must be greater than 0");
        }
    }

    std::optional<V> getKey(const K &key) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        V value{};
        if (cache_.tryGet(key, value))
        {
            return value;
        }
        return std::nullopt;
    }

    void setKey(const K &key, const V &value) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.insert(key, value);
    }

    std::string name() const override
    {
        return "LRUCache11 (mutex)";
    }

    size_t capacity() const override
    {
        return capacity_;
    }

    size_t size() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    std::string replacementPolicy() const override
    {
        return "elastic LRU";
    }

    size_t elasticity() const
    {
        return elasticity_;
    }

private:
    size_t capacity_;
    size_t elasticity_;
    lru11::Cache<K, V> cache_;
    mutable std::mutex mutex_;
};

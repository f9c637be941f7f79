#pragma once

#include "../ICacheAdapter.hpp"
#include <lrucache.hpp>
#include <mutex>
#include <stdexcept>

/**
 * @brief Адаптер для cpp-lru-cache под одним эксклюзивным mutex
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * cache::lru_cache: однопоточная библиотека (точный LRU).
 * Вся структура защищена одним mutex: каждый getKey/setKey
 * захватывает и отпускает его.
 *
 * @note get() меняет порядок LRU, поэтому даже чтение берёт
 *       эксклюзивный lock.
 */
template<typename K, typename V>
class LockedLRUAdapter : public ICacheAdapter<K, V> {
public:
    explicit LockedLRUAdapter(size_t capacity)
        : capacity_(capacity), cache_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("Cache capacity must be greater than 0");
        }
    }

    std::optional<V> getKey(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        // get() бросает std::range_error на промахе, поэтому сначала exists()
        if (!cache_.exists(key)) {
            return std::nullopt;
        }
        return cache_.get(key);
    }

    void setKey(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.put(key, value);
    }

    std::string name() const override {
        return "cpp-lru-cache (mutex)";
    }

    size_t capacity() const override {
        return capacity_;
    }

    size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    std::string replacementPolicy() const override {
        return "LRU";
    }

private:
    size_t capacity_;
    cache::lru_cache<K, V> cache_;
    mutable std::mutex mutex_;
};

#pragma once

#include "../ICacheAdapter.hpp"
#include <lrucache.hpp>
#include <algorithm>
#include <array>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

/**
 * @brief Шардированный конкурентный кэш на основе cpp-lru-cache
 * @tparam K Тип ключа (должен быть hashable)
 * @tparam V Тип значения
 * @tparam ShardCount Количество шардов (рекомендуется степень 2)
 *
 * Ключи распределяются по независимым шардам через std::hash<K>.
 * У каждого шарда свой mutex, поэтому потоки, работающие с разными
 * шардами, не блокируют друг друга. Снаружи адаптер можно звать
 * из любого количества потоков без дополнительной синхронизации.
 *
 * @note capacity распределяется между шардами равномерно, остаток достаётся
 *       первым шардам. При capacity=1000 и ShardCount=16 шарды 0..7 получат
 *       по 63 элемента, шарды 8..15 по 62.
 *       LRU точный только внутри шарда, глобально приближённый.
 */
template<typename K, typename V, size_t ShardCount = 16>
class ShardedLRUAdapter : public ICacheAdapter<K, V> {
public:
    static_assert(ShardCount > 0, "ShardCount must be greater than 0");

    /**
     * @brief Конструктор
     * @param totalCapacity Общая ёмкость (распределяется по шардам)
     */
    explicit ShardedLRUAdapter(size_t totalCapacity)
        : totalCapacity_(totalCapacity)
    {
        if (totalCapacity == 0) {
            throw std::invalid_argument("Total capacity must be greater than 0");
        }

        // первые totalCapacity % ShardCount шардов получают по лишнему слоту,
        // так что сумма ёмкостей шардов равна totalCapacity
        const size_t base = totalCapacity / ShardCount;
        const size_t remainder = totalCapacity % ShardCount;

        for (size_t i = 0; i < ShardCount; ++i) {
            size_t slots = base + (i < remainder ? 1 : 0);
            shards_[i].capacity = std::max(slots, size_t(1));
            shards_[i].cache = std::make_unique<cache::lru_cache<K, V>>(shards_[i].capacity);
        }
    }

    /**
     * @brief Получить значение (exclusive lock на шард)
     * @note get() двигает ключ в начало LRU списка шарда
     */
    std::optional<V> getKey(const K& key) override {
        auto& shard = getShard(key);
        std::unique_lock lock(shard.mutex);
        if (!shard.cache->exists(key)) {
            return std::nullopt;
        }
        return shard.cache->get(key);
    }

    void setKey(const K& key, const V& value) override {
        auto& shard = getShard(key);
        std::unique_lock lock(shard.mutex);
        shard.cache->put(key, value);
    }

    std::string name() const override {
        return "sharded cpp-lru-cache x" + std::to_string(ShardCount);
    }

    /**
     * @note Если totalCapacity < ShardCount, каждый шард всё равно
     *       держит один слот, и фактически в кэше может оказаться
     *       до ShardCount элементов
     */
    size_t capacity() const override {
        return totalCapacity_;
    }

    /**
     * @brief Сумма размеров всех шардов (не атомарный snapshot)
     */
    size_t size() const override {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            total += shard.cache->size();
        }
        return total;
    }

    std::string replacementPolicy() const override {
        return "per-shard LRU";
    }

    bool isThreadSafe() const override {
        return true;
    }

    static constexpr size_t shardCount() { return ShardCount; }

    /**
     * @brief Ёмкость одного шарда
     * @throws std::out_of_range если index >= ShardCount
     */
    size_t shardCapacity(size_t index) const {
        if (index >= ShardCount) {
            throw std::out_of_range("Shard index out of range");
        }
        return shards_[index].capacity;
    }

    /**
     * @brief Индекс шарда для ключа
     */
    size_t shardIndex(const K& key) const {
        std::hash<K> hasher;
        return hasher(key) % ShardCount;
    }

private:
    struct Shard {
        std::unique_ptr<cache::lru_cache<K, V>> cache;
        size_t capacity = 1;
        mutable std::shared_mutex mutex;
    };

    size_t totalCapacity_;
    std::array<Shard, ShardCount> shards_;

    Shard& getShard(const K& key) {
        return shards_[shardIndex(key)];
    }
};

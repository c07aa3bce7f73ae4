#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

/**
 * @brief Словарь ключ -> shared_ptr под reader/writer блокировкой
 *
 * Чтение (find, size, getAll) идёт под shared_lock,
 * изменение (insert, clear) под unique_lock.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    /**
     * @brief Вставить или заменить значение по ключу
     */
    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @return nullptr если ключа нет
     */
    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return it == map_.end() ? nullptr : it->second;
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    /**
     * @brief Копия содержимого; объекты общие с кэшем
     */
    std::unordered_map<K, std::shared_ptr<V>> getAll() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};

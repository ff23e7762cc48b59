#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>
#include <functional>

/**
 * @brief Потокобезопасный словарь с разделяемым владением значениями
 *
 * Чтение под shared_lock, запись под unique_lock.
 * Значения хранятся как shared_ptr: найденный объект остаётся валидным,
 * даже если ключ перезаписан или удалён другим потоком.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Вставить, только если ключа ещё нет
     * @return Значение, которое лежит в словаре после вызова
     */
    std::shared_ptr<V> insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto [it, inserted] = map_.emplace(key, value);
        return it->second;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Снимок всех значений (порядок не определён)
     */
    std::vector<std::shared_ptr<V>> values() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &[key, value] : map_)
        {
            result.push_back(value);
        }
        return result;
    }

    /**
     * @brief Снимок значений, удовлетворяющих предикату
     */
    std::vector<std::shared_ptr<V>> filter(const std::function<bool(const V &)> &predicate) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        for (const auto &[key, value] : map_)
        {
            if (value && predicate(*value))
            {
                result.push_back(value);
            }
        }
        return result;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};

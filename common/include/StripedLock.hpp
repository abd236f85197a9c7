#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <vector>

/**
 * @file StripedLock.hpp
 * @brief Набор мьютексов фиксированного размера, ключ -> полоса (stripe)
 *
 * Вместо отдельного мьютекса на каждый ключ (таблица растёт без ограничений)
 * ключи хешируются в одну из N полос. Несколько ключей захватываются
 * в порядке возрастания индекса полосы - это единый глобальный порядок,
 * поэтому встречные захваты (a, b) и (b, a) не дают deadlock.
 */
template <typename K, typename Hash = std::hash<K>>
class StripedLock
{
public:
    /**
     * @brief Scoped-владение захваченными полосами
     *
     * Освобождает все полосы в деструкторе. Пустой Handle ничего не держит.
     */
    class Handle
    {
    public:
        Handle() = default;
        Handle(Handle&&) noexcept = default;
        Handle& operator=(Handle&&) noexcept = default;

        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;

        bool ownsLock() const { return !locks_.empty(); }
        std::size_t size() const { return locks_.size(); }

        void release()
        {
            // Освобождаем в обратном порядке
            while (!locks_.empty())
            {
                locks_.pop_back();
            }
        }

    private:
        friend class StripedLock;
        std::vector<std::unique_lock<std::mutex>> locks_;
    };

    explicit StripedLock(std::size_t stripes)
        : mutexes_(stripes)
    {
        if (stripes == 0)
        {
            throw std::invalid_argument("StripedLock requires at least one stripe");
        }
    }

    StripedLock(const StripedLock&) = delete;
    StripedLock& operator=(const StripedLock&) = delete;

    std::size_t stripeCount() const { return mutexes_.size(); }

    std::size_t stripeOf(const K& key) const
    {
        return hash_(key) % mutexes_.size();
    }

    Handle acquire(const K& key)
    {
        Handle handle;
        handle.locks_.emplace_back(mutexes_[stripeOf(key)]);
        return handle;
    }

    /**
     * @brief Захватить полосы для нескольких ключей
     *
     * Ключи, попавшие в одну полосу, захватывают её один раз.
     */
    Handle acquire(const std::vector<K>& keys)
    {
        std::vector<std::size_t> stripes;
        stripes.reserve(keys.size());
        for (const auto& key : keys)
        {
            stripes.push_back(stripeOf(key));
        }
        std::sort(stripes.begin(), stripes.end());
        stripes.erase(std::unique(stripes.begin(), stripes.end()), stripes.end());

        Handle handle;
        handle.locks_.reserve(stripes.size());
        for (auto index : stripes)
        {
            handle.locks_.emplace_back(mutexes_[index]);
        }
        return handle;
    }

private:
    std::vector<std::mutex> mutexes_;
    Hash hash_;
};

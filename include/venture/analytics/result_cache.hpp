/**
 * @file result_cache.hpp
 * @brief TTL + least-recently-used memoization for derived analytics.
 *
 * Entries expire a fixed time after they were stored, measured on the
 * injected clock. When the cache is full, inserting evicts the entry
 * that was read or written least recently.
 *
 * get_or_compute() coalesces concurrent requests: while a value for a key
 * is being computed, further callers for that key wait on the same
 * computation and receive its value or its exception. Exceptions are not
 * cached. Erasing a key while its value is being computed discards that
 * result, and later callers start a fresh computation.
 */

#ifndef VENTURE_ANALYTICS_RESULT_CACHE_HPP
#define VENTURE_ANALYTICS_RESULT_CACHE_HPP

#include "venture/core/clock.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace venture
{
    namespace analytics
    {

        /**
         * @struct CacheStats
         * @brief Counters since construction or the last clear().
         */
        struct CacheStats
        {
            size_t hits = 0;
            size_t misses = 0;
            size_t evictions = 0;   ///< Dropped for capacity
            size_t expirations = 0; ///< Dropped for age
            size_t coalesced = 0;   ///< Callers that joined an in-flight computation
            size_t discarded = 0;   ///< Results not stored because their key was erased mid-computation
        };

        /**
         * @class ResultCache
         * @brief Thread-safe keyed cache of values of type V.
         *
         * Usage:
         * @code
         *   ResultCache<PerformanceSnapshot> cache(clock, std::chrono::minutes(5), 1000);
         *   auto perf = cache.get_or_compute("performance:P1:*:*",
         *                                    [&] { return calc.calculate_portfolio_performance("P1", {}); });
         * @endcode
         */
        template <typename V>
        class ResultCache
        {
        public:
            /**
             * @param clock Time source for entry age. Must outlive the cache.
             * @param ttl Maximum age of a returned entry.
             * @param capacity Maximum number of entries.
             * @throws std::invalid_argument If ttl or capacity is not positive.
             */
            ResultCache(const core::Clock &clock, std::chrono::system_clock::duration ttl, size_t capacity)
                : clock_(clock), ttl_(ttl), capacity_(capacity)
            {
                if (ttl_ <= std::chrono::system_clock::duration::zero())
                {
                    throw std::invalid_argument("Cache TTL must be positive");
                }
                if (capacity_ == 0)
                {
                    throw std::invalid_argument("Expected positive value for parameter 'capacity', got: 0");
                }
            }

            ResultCache(const ResultCache &) = delete;
            ResultCache &operator=(const ResultCache &) = delete;

            /**
             * @brief Fresh value for @p key, or nullopt. Expired entries are removed.
             */
            std::optional<V> get(const std::string &key)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return lookup(key);
            }

            /**
             * @brief Store @p value, evicting the least recently used entry if full.
             */
            void set(const std::string &key, V value)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                store(key, std::move(value));
            }

            /**
             * @brief Cached value, or the result of @p compute stored under @p key.
             *
             * @p compute runs without the cache lock held.
             * @throws Whatever @p compute throws.
             */
            template <typename Fn>
            V get_or_compute(const std::string &key, Fn compute)
            {
                std::promise<V> promise;
                uint64_t ticket = 0;
                {
                    std::unique_lock<std::mutex> lock(mutex_);

                    auto cached = lookup(key);
                    if (cached)
                    {
                        return *cached;
                    }

                    auto pending = in_flight_.find(key);
                    if (pending != in_flight_.end())
                    {
                        std::shared_future<V> shared = pending->second.result;
                        ++stats_.coalesced;
                        lock.unlock();
                        return shared.get();
                    }

                    ticket = ++next_ticket_;
                    in_flight_.emplace(key, InFlight{promise.get_future().share(), ticket});
                }

                try
                {
                    V value = compute();
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        if (finish(key, ticket))
                        {
                            store(key, value);
                        }
                        else
                        {
                            ++stats_.discarded;
                        }
                    }
                    promise.set_value(value);
                    return value;
                }
                catch (...)
                {
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        finish(key, ticket);
                    }
                    promise.set_exception(std::current_exception());
                    throw;
                }
            }

            /** @brief Remove one entry and detach any computation in flight for it. @return true if it was present. */
            bool erase(const std::string &key)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                in_flight_.erase(key);
                auto it = index_.find(key);
                if (it == index_.end())
                {
                    return false;
                }
                entries_.erase(it->second);
                index_.erase(it);
                return true;
            }

            /**
             * @brief Remove every entry whose key satisfies @p pred.
             *
             * Computations in flight for matching keys are detached too.
             * @return Count of stored entries removed.
             */
            template <typename Predicate>
            size_t erase_if(Predicate pred)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                size_t removed = 0;
                for (auto it = entries_.begin(); it != entries_.end();)
                {
                    if (pred(it->key))
                    {
                        index_.erase(it->key);
                        it = entries_.erase(it);
                        ++removed;
                    }
                    else
                    {
                        ++it;
                    }
                }
                for (auto it = in_flight_.begin(); it != in_flight_.end();)
                {
                    if (pred(it->first))
                    {
                        it = in_flight_.erase(it);
                    }
                    else
                    {
                        ++it;
                    }
                }
                return removed;
            }

            void clear()
            {
                std::lock_guard<std::mutex> lock(mutex_);
                entries_.clear();
                index_.clear();
                in_flight_.clear();
                stats_ = CacheStats();
            }

            size_t size() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return entries_.size();
            }

            CacheStats stats() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return stats_;
            }

            size_t capacity() const { return capacity_; }

        private:
            struct Entry
            {
                std::string key;
                V value;
                core::Timestamp stored_at;
            };

            using EntryList = std::list<Entry>;

            struct InFlight
            {
                std::shared_future<V> result;
                uint64_t ticket;
            };

            // Caller holds mutex_. True if @p ticket still owns the in-flight slot for @p key.
            bool finish(const std::string &key, uint64_t ticket)
            {
                auto it = in_flight_.find(key);
                if (it == in_flight_.end() || it->second.ticket != ticket)
                {
                    return false;
                }
                in_flight_.erase(it);
                return true;
            }

            // Caller holds mutex_. Front of entries_ is the most recently used.
            std::optional<V> lookup(const std::string &key)
            {
                auto it = index_.find(key);
                if (it == index_.end())
                {
                    ++stats_.misses;
                    return std::nullopt;
                }

                if (clock_.now() - it->second->stored_at >= ttl_)
                {
                    entries_.erase(it->second);
                    index_.erase(it);
                    ++stats_.expirations;
                    ++stats_.misses;
                    return std::nullopt;
                }

                entries_.splice(entries_.begin(), entries_, it->second);
                ++stats_.hits;
                return entries_.front().value;
            }

            // Caller holds mutex_.
            void store(const std::string &key, V value)
            {
                auto it = index_.find(key);
                if (it != index_.end())
                {
                    it->second->value = std::move(value);
                    it->second->stored_at = clock_.now();
                    entries_.splice(entries_.begin(), entries_, it->second);
                    return;
                }

                while (entries_.size() >= capacity_)
                {
                    index_.erase(entries_.back().key);
                    entries_.pop_back();
                    ++stats_.evictions;
                }

                entries_.push_front(Entry{key, std::move(value), clock_.now()});
                index_[key] = entries_.begin();
            }

            const core::Clock &clock_;
            std::chrono::system_clock::duration ttl_;
            size_t capacity_;

            mutable std::mutex mutex_;
            EntryList entries_;
            std::unordered_map<std::string, typename EntryList::iterator> index_;
            std::unordered_map<std::string, InFlight> in_flight_;
            uint64_t next_ticket_ = 0;
            CacheStats stats_;
        };

    } // namespace analytics
} // namespace venture

#endif // VENTURE_ANALYTICS_RESULT_CACHE_HPP

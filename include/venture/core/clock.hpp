/**
 * @file clock.hpp
 * @brief Injectable time source.
 *
 * The instrument engine and the result cache read time only through a
 * Clock reference, so accrual and expiry are replayable in tests.
 */

#pragma once

#include "venture/core/date.hpp"

#include <chrono>
#include <mutex>

namespace venture
{
    namespace core
    {

        /**
         * @class Clock
         * @brief Abstract time source.
         */
        class Clock
        {
        public:
            virtual ~Clock() = default;

            /** @brief Current instant. */
            virtual Timestamp now() const = 0;

            /** @brief Current UTC calendar day. */
            Date today() const { return Date::from_timestamp(now()); }
        };

        /** @brief Reads std::chrono::system_clock. */
        class SystemClock : public Clock
        {
        public:
            Timestamp now() const override { return std::chrono::system_clock::now(); }
        };

        /**
         * @class ManualClock
         * @brief Clock that only moves when told to. Thread-safe.
         */
        class ManualClock : public Clock
        {
        public:
            explicit ManualClock(Timestamp start) : now_(start) {}
            explicit ManualClock(const Date &start) : now_(start.to_timestamp()) {}

            Timestamp now() const override
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return now_;
            }

            void set(Timestamp t)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                now_ = t;
            }

            void set(const Date &d) { set(d.to_timestamp()); }

            void advance(std::chrono::system_clock::duration d)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                now_ += d;
            }

            void advance_days(long long days) { advance(std::chrono::hours(24 * days)); }

        private:
            mutable std::mutex mutex_;
            Timestamp now_;
        };

    } // namespace core
} // namespace venture

/**
 * @file date.hpp
 * @brief Calendar date type used by instrument terms and cash-flow series.
 *
 * Dates are stored as a count of days since 1970-01-01 on the proleptic
 * Gregorian calendar and exchanged as "YYYY-MM-DD" strings, the same
 * format used by the data loaders.
 */

#ifndef VENTURE_CORE_DATE_HPP
#define VENTURE_CORE_DATE_HPP

#include <chrono>
#include <string>

namespace venture
{
    namespace core
    {

        /// Wall-clock instant used for accrual bookkeeping.
        using Timestamp = std::chrono::system_clock::time_point;

        /**
         * @class Date
         * @brief A calendar day without time zone.
         *
         * Usage:
         * @code
         *   Date issue = Date::parse("2024-01-15");
         *   Date maturity = issue.add_days(730);
         *   int64_t term = Date::days_between(issue, maturity);
         * @endcode
         */
        class Date
        {
        public:
            /** @brief Construct 1970-01-01. */
            Date() = default;

            /**
             * @brief Construct from year/month/day.
             * @throws ValidationError If the triple is not a valid calendar day.
             */
            Date(int year, unsigned month, unsigned day);

            /**
             * @brief Parse a "YYYY-MM-DD" string.
             * @throws ValidationError If the text is malformed or not a real day.
             */
            static Date parse(const std::string &text);

            /**
             * @brief Check the "YYYY-MM-DD" format without throwing.
             */
            static bool is_valid(const std::string &text);

            /** @brief Construct from a day count since the Unix epoch. */
            static Date from_days(long long days_since_epoch);

            /** @brief The UTC calendar day containing an instant. */
            static Date from_timestamp(const Timestamp &ts);

            /** @brief Midnight UTC at the start of this day. */
            Timestamp to_timestamp() const;

            /** @brief Format as "YYYY-MM-DD". */
            std::string to_string() const;

            int year() const;
            unsigned month() const;
            unsigned day() const;

            long long days_since_epoch() const { return days_; }

            Date add_days(long long days) const { return from_days(days_ + days); }

            /**
             * @brief Signed number of days from @p from to @p to.
             */
            static long long days_between(const Date &from, const Date &to)
            {
                return to.days_ - from.days_;
            }

            bool operator==(const Date &o) const { return days_ == o.days_; }
            bool operator!=(const Date &o) const { return days_ != o.days_; }
            bool operator<(const Date &o) const { return days_ < o.days_; }
            bool operator<=(const Date &o) const { return days_ <= o.days_; }
            bool operator>(const Date &o) const { return days_ > o.days_; }
            bool operator>=(const Date &o) const { return days_ >= o.days_; }

        private:
            long long days_ = 0;
        };

        /**
         * @brief Elapsed time between two instants in fractional days.
         * @return Negative when @p to precedes @p from.
         */
        double days_between(const Timestamp &from, const Timestamp &to);

    } // namespace core
} // namespace venture

#endif // VENTURE_CORE_DATE_HPP

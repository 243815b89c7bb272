/**
 * @file date.cpp
 * @brief Implementation of the Date calendar type.
 *
 * Day-count conversion uses the civil-from-days / days-from-civil
 * algorithms on a March-based year, valid for the whole int range of
 * years used here.
 */

#include "venture/core/date.hpp"
#include "venture/core/errors.hpp"

#include <cctype>
#include <cstdio>

namespace venture
{
    namespace core
    {

        namespace
        {

            constexpr long long SECONDS_PER_DAY = 86400;

            long long days_from_civil(int y, unsigned m, unsigned d)
            {
                y -= m <= 2 ? 1 : 0;
                const long long era = (y >= 0 ? y : y - 399) / 400;
                const unsigned yoe = static_cast<unsigned>(y - era * 400);
                const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + static_cast<long long>(doe) - 719468;
            }

            void civil_from_days(long long z, int &y, unsigned &m, unsigned &d)
            {
                z += 719468;
                const long long era = (z >= 0 ? z : z - 146096) / 146097;
                const unsigned doe = static_cast<unsigned>(z - era * 146097);
                const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
                const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
                const unsigned mp = (5 * doy + 2) / 153;
                d = doy - (153 * mp + 2) / 5 + 1;
                m = mp < 10 ? mp + 3 : mp - 9;
                y = static_cast<int>(static_cast<long long>(yoe) + era * 400) + (m <= 2 ? 1 : 0);
            }

            bool is_leap(int y)
            {
                return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
            }

            unsigned days_in_month(int y, unsigned m)
            {
                static const unsigned DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (m == 2 && is_leap(y))
                {
                    return 29;
                }
                return DAYS[m - 1];
            }

            bool has_date_shape(const std::string &text)
            {
                if (text.size() != 10 || text[4] != '-' || text[7] != '-')
                {
                    return false;
                }
                for (size_t i = 0; i < text.size(); ++i)
                {
                    if (i == 4 || i == 7)
                        continue;
                    if (!std::isdigit(static_cast<unsigned char>(text[i])))
                        return false;
                }
                return true;
            }

        } // anonymous namespace

        Date::Date(int year, unsigned month, unsigned day)
        {
            if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month))
            {
                throw ValidationError("date",
                                      "Invalid calendar date: " + std::to_string(year) + "-" +
                                          std::to_string(month) + "-" + std::to_string(day));
            }
            days_ = days_from_civil(year, month, day);
        }

        Date Date::parse(const std::string &text)
        {
            if (!has_date_shape(text))
            {
                throw ValidationError("date", "Expected date in YYYY-MM-DD format, got: '" + text + "'");
            }
            int year = std::stoi(text.substr(0, 4));
            unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
            unsigned day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
            return Date(year, month, day);
        }

        bool Date::is_valid(const std::string &text)
        {
            if (!has_date_shape(text))
            {
                return false;
            }
            int year = std::stoi(text.substr(0, 4));
            unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
            unsigned day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
            return month >= 1 && month <= 12 && day >= 1 && day <= days_in_month(year, month);
        }

        Date Date::from_days(long long days_since_epoch)
        {
            Date d;
            d.days_ = days_since_epoch;
            return d;
        }

        Date Date::from_timestamp(const Timestamp &ts)
        {
            long long secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
            long long days = secs / SECONDS_PER_DAY;
            if (secs % SECONDS_PER_DAY < 0)
            {
                --days; // floor for instants before the epoch
            }
            return from_days(days);
        }

        Timestamp Date::to_timestamp() const
        {
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::seconds(days_ * SECONDS_PER_DAY)));
        }

        std::string Date::to_string() const
        {
            int y;
            unsigned m;
            unsigned d;
            civil_from_days(days_, y, m, d);
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", y, m, d);
            return std::string(buffer);
        }

        int Date::year() const
        {
            int y;
            unsigned m;
            unsigned d;
            civil_from_days(days_, y, m, d);
            return y;
        }

        unsigned Date::month() const
        {
            int y;
            unsigned m;
            unsigned d;
            civil_from_days(days_, y, m, d);
            return m;
        }

        unsigned Date::day() const
        {
            int y;
            unsigned m;
            unsigned d;
            civil_from_days(days_, y, m, d);
            return d;
        }

        double days_between(const Timestamp &from, const Timestamp &to)
        {
            std::chrono::duration<double> elapsed = to - from;
            return elapsed.count() / static_cast<double>(SECONDS_PER_DAY);
        }

    } // namespace core
} // namespace venture

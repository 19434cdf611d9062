#include "FilenameDate.h"

#include <filesystem>
#include <functional>
#include <iomanip>
#include <regex>
#include <sstream>
#include <vector>

namespace PhotoDater
{
    namespace
    {
        constexpr int MIN_YEAR = 1900;
        constexpr int MAX_YEAR = 2100;

        bool isValidYear(int year) { return year >= MIN_YEAR && year <= MAX_YEAR; }
        bool isValidMonth(int month) { return month >= 1 && month <= 12; }

        /**
         * @brief One tier of the matcher: a pattern and the function that turns its
         * capture groups into a date (or nullopt when the numbers are not a real date).
         */
        struct DatePattern
        {
            std::regex pattern;
            std::function<std::optional<FilenameDate>(const std::smatch&)> build;
        };

        std::optional<FilenameDate> buildFullDate(const std::smatch& m)
        {
            int year = std::stoi(m[1].str());
            int month = std::stoi(m[2].str());
            int day = std::stoi(m[3].str());

            if (!isValidYear(year) || !isValidMonth(month) || day < 1 || day > 31) {
                return std::nullopt;
            }
            // e.g. Feb 30
            if (day > daysInMonth(year, month)) {
                return std::nullopt;
            }
            return FilenameDate{year, month, day, DatePrecision::FullDate};
        }

        std::optional<FilenameDate> buildYearMonth(const std::smatch& m)
        {
            int year = std::stoi(m[1].str());
            int month = std::stoi(m[2].str());

            if (!isValidYear(year) || !isValidMonth(month)) {
                return std::nullopt;
            }
            return FilenameDate{year, month, 1, DatePrecision::YearMonth};
        }

        std::optional<FilenameDate> buildYearOnly(const std::smatch& m)
        {
            int year = std::stoi(m[1].str());
            if (!isValidYear(year)) {
                return std::nullopt;
            }
            return FilenameDate{year, 1, 1, DatePrecision::YearOnly};
        }

        // Ordered from most to least specific. The lookaheads keep a looser
        // tier from matching the prefix of a more complete date.
        const std::vector<DatePattern>& datePatterns()
        {
            static const std::vector<DatePattern> patterns = {
                { std::regex(R"((\d{4})[.-](\d{1,2})[.-](\d{1,2}))"), buildFullDate },
                { std::regex(R"((\d{4})[.-](\d{1,2})(?![.-]\d))"), buildYearMonth },
                { std::regex(R"((\d{4})(?![.-]\d))"), buildYearOnly },
            };
            return patterns;
        }
    }

    int daysInMonth(int year, int month)
    {
        static const int DAYS[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
        if (!isValidMonth(month)) return 0;

        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        if (month == 2 && leap) return 29;
        return DAYS[month - 1];
    }

    std::optional<FilenameDate> inferDate(const std::string& filename)
    {
        const std::string stem = std::filesystem::path(filename).stem().string();

        for (const auto& tier : datePatterns()) {
            std::smatch match;
            if (std::regex_search(stem, match, tier.pattern)) {
                // The first tier that matches decides, even when its date is invalid
                return tier.build(match);
            }
        }
        return std::nullopt;
    }

    std::string FilenameDate::toExifDateTime() const
    {
        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(4) << year << ':'
            << std::setw(2) << month << ':'
            << std::setw(2) << day << " 00:00:00";
        return oss.str();
    }

    std::string FilenameDate::toIsoDate() const
    {
        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(4) << year << '-'
            << std::setw(2) << month << '-'
            << std::setw(2) << day;
        return oss.str();
    }

    std::time_t FilenameDate::toLocalTime() const
    {
        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = 0;
        tm.tm_min = 0;
        tm.tm_sec = 0;
        tm.tm_isdst = -1; // Let mktime determine daylight saving time
        return std::mktime(&tm);
    }

    bool FilenameDate::operator==(const FilenameDate& other) const
    {
        return year == other.year && month == other.month && day == other.day
            && precision == other.precision;
    }

} // namespace PhotoDater

#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace PhotoDater
{
    /**
     * @brief How much of the date was actually present in the filename.
     */
    enum class DatePrecision
    {
        FullDate,   // YYYY.MM.DD / YYYY-MM-DD
        YearMonth,  // YYYY.MM / YYYY-MM, day defaults to 1
        YearOnly    // YYYY, month and day default to 1
    };

    /**
     * @brief A calendar date recovered from a filename. Time of day is always 00:00:00.
     */
    struct FilenameDate
    {
        int year = 1900;
        int month = 1;
        int day = 1;
        DatePrecision precision = DatePrecision::YearOnly;

        /**
         * @brief Formats the date the way EXIF stores it: "YYYY:MM:DD 00:00:00".
         */
        std::string toExifDateTime() const;

        /**
         * @brief Formats the date as "YYYY-MM-DD".
         */
        std::string toIsoDate() const;

        /**
         * @brief Local midnight of this date as a time_t.
         */
        std::time_t toLocalTime() const;

        bool operator==(const FilenameDate& other) const;
        bool operator!=(const FilenameDate& other) const { return !(*this == other); }
    };

    /**
     * @brief Infers a date from a filename (the extension is ignored).
     *
     * Tries, in order, a full date, a year-month pair and a bare year, and
     * returns the result of the first pattern that matches. A matched but
     * invalid date yields std::nullopt rather than a coarser date.
     *
     * @param filename A file name such as "2023.07.04_bbq.png". Directories are not expected.
     * @return The inferred date, or std::nullopt when no usable date is present.
     */
    std::optional<FilenameDate> inferDate(const std::string& filename);

    /**
     * @brief Number of days in the given month, honouring leap years.
     */
    int daysInMonth(int year, int month);

} // namespace PhotoDater

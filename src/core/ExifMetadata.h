#pragma once
#include "Common.h"
#include "FilenameDate.h"

#include <exiv2/exiv2.hpp>

namespace PhotoDater
{
    /**
     * @brief Capture-time fields carried by a produced JPEG.
     */
    struct CaptureTimes
    {
        std::string dateTime;          // Exif.Image.DateTime
        std::string dateTimeOriginal;  // Exif.Photo.DateTimeOriginal
        std::string dateTimeDigitized; // Exif.Photo.DateTimeDigitized
        std::string software;          // Exif.Image.Software
    };

    /**
     * @brief Builds and embeds the EXIF block written into every output JPEG.
     */
    class ExifMetadata
    {
    public:
        /**
         * @brief Creates the EXIF data for a date: all three date fields set to
         * "YYYY:MM:DD 00:00:00" and the Software tag set to SOFTWARE_TAG.
         */
        static Exiv2::ExifData fromDate(const FilenameDate& date);

        /**
         * @brief Returns a copy of an encoded JPEG with the given EXIF block embedded.
         * @throws ImageEncodeException if the buffer is not a JPEG Exiv2 can rewrite.
         */
        static std::vector<unsigned char> embed(const std::vector<unsigned char>& jpeg,
                                                const Exiv2::ExifData& exifData);

        /**
         * @brief Reads the capture-time fields back from an encoded image.
         * Missing fields are left empty.
         * @throws ImageDecodeException if the buffer is not an image Exiv2 understands.
         */
        static CaptureTimes read(const std::vector<unsigned char>& encoded);
    };

} // namespace PhotoDater

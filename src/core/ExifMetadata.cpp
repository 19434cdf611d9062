#include "ExifMetadata.h"

namespace PhotoDater
{
    namespace
    {
        std::string valueOf(const Exiv2::ExifData& exifData, const std::string& key)
        {
            auto pos = exifData.findKey(Exiv2::ExifKey(key));
            if (pos == exifData.end()) return "";
            return pos->toString();
        }
    }

    Exiv2::ExifData ExifMetadata::fromDate(const FilenameDate& date)
    {
        const std::string stamp = date.toExifDateTime();

        Exiv2::ExifData exifData;
        exifData["Exif.Image.DateTime"] = stamp;
        exifData["Exif.Image.Software"] = SOFTWARE_TAG;
        exifData["Exif.Photo.DateTimeOriginal"] = stamp;
        exifData["Exif.Photo.DateTimeDigitized"] = stamp;
        return exifData;
    }

    std::vector<unsigned char> ExifMetadata::embed(const std::vector<unsigned char>& jpeg,
                                                   const Exiv2::ExifData& exifData)
    {
        try
        {
            auto image = Exiv2::ImageFactory::open(jpeg.data(), jpeg.size());
            image->setExifData(exifData);
            image->writeMetadata();

            Exiv2::BasicIo& io = image->io();
            io.seek(0, Exiv2::BasicIo::beg);

            std::vector<unsigned char> result(io.size());
            const auto readCount = io.read(result.data(), result.size());
            if (readCount != result.size()) {
                throw ImageEncodeException("short read while embedding EXIF data");
            }
            return result;
        }
        catch (const Exiv2::Error& e)
        {
            throw ImageEncodeException(std::string("could not embed EXIF data: ") + e.what());
        }
    }

    CaptureTimes ExifMetadata::read(const std::vector<unsigned char>& encoded)
    {
        try
        {
            auto image = Exiv2::ImageFactory::open(encoded.data(), encoded.size());
            image->readMetadata();
            const Exiv2::ExifData& exifData = image->exifData();

            CaptureTimes times;
            times.dateTime = valueOf(exifData, "Exif.Image.DateTime");
            times.dateTimeOriginal = valueOf(exifData, "Exif.Photo.DateTimeOriginal");
            times.dateTimeDigitized = valueOf(exifData, "Exif.Photo.DateTimeDigitized");
            times.software = valueOf(exifData, "Exif.Image.Software");
            return times;
        }
        catch (const Exiv2::Error& e)
        {
            throw ImageDecodeException(std::string("could not read EXIF data: ") + e.what());
        }
    }

} // namespace PhotoDater

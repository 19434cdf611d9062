#include "ImageNormalizer.h"
#include "ExifMetadata.h"
#include "Orientation.h"

#include <fstream>
#include <iterator>

namespace PhotoDater
{
    namespace
    {
        const unsigned char PNG_SIGNATURE[] = { 0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n' };

        // Largest shrink factor handed to the Lanczos kernel in one pass
        constexpr int MAX_LANCZOS_FACTOR = 2;

        enum class ResampleMode { MovingAverage = 2, Lanczos = 6 };
    }

    void ProcessorOptions::validate() const
    {
        if (maxDimension <= 0) {
            throw PhotoDaterException("max dimension must be a positive number of pixels, got " + std::to_string(maxDimension));
        }
        if (quality < 1 || quality > 100) {
            throw PhotoDaterException("JPEG quality must be between 1 and 100, got " + std::to_string(quality));
        }
    }

    ImageNormalizer::SourceFormat ImageNormalizer::sniffFormat(const std::vector<unsigned char>& header)
    {
        if (header.size() >= sizeof(PNG_SIGNATURE) &&
            std::equal(std::begin(PNG_SIGNATURE), std::end(PNG_SIGNATURE), header.begin())) {
            return SourceFormat::Png;
        }
        if (header.size() >= 3 && header[0] == 0xFF && header[1] == 0xD8 && header[2] == 0xFF) {
            return SourceFormat::Jpeg;
        }
        return SourceFormat::Unknown;
    }

    CImg<unsigned char> ImageNormalizer::decode(const fs::path& sourcePath)
    {
        std::ifstream in(sourcePath, std::ios::binary);
        if (!in) {
            throw ImageDecodeException("cannot open " + sourcePath.string());
        }
        std::vector<unsigned char> header(sizeof(PNG_SIGNATURE), 0);
        in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
        header.resize(static_cast<std::size_t>(in.gcount()));
        in.close();

        try
        {
            switch (sniffFormat(header))
            {
            case SourceFormat::Png:
            {
                // Decode wide so 16-bit samples survive, then bring them down to 8 bits
                CImg<unsigned short> wide;
                unsigned int bitsPerValue = 8;
                wide.load_png(sourcePath.c_str(), &bitsPerValue);
                if (bitsPerValue == 16) {
                    wide /= 257;
                }
                CImg<unsigned char> img(wide);
                if (img.is_empty()) throw ImageDecodeException("empty image in " + sourcePath.string());
                return img;
            }
            case SourceFormat::Jpeg:
            {
                CImg<unsigned char> img;
                img.load_jpeg(sourcePath.c_str());
                if (img.is_empty()) throw ImageDecodeException("empty image in " + sourcePath.string());
                // JPEG has no alpha, four components are CMYK
                if (img.spectrum() == 4) {
                    return cmykToRgb(img, hasAdobeMarker(sourcePath));
                }
                return img;
            }
            case SourceFormat::Unknown:
                break;
            }
        }
        catch (const CImgException& e)
        {
            throw ImageDecodeException(sourcePath.filename().string() + ": " + e.what());
        }
        throw ImageDecodeException(sourcePath.filename().string() + " is neither a PNG nor a JPEG image");
    }

    bool ImageNormalizer::hasAdobeMarker(const fs::path& jpegPath)
    {
        std::ifstream in(jpegPath, std::ios::binary);
        const std::vector<unsigned char> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (data.size() < 4 || data[0] != 0xFF || data[1] != 0xD8) return false;

        std::size_t pos = 2;
        while (pos + 4 <= data.size()) {
            if (data[pos] != 0xFF) break;
            const unsigned char marker = data[pos + 1];
            if (marker == 0xFF) { // fill byte
                ++pos;
                continue;
            }
            if (marker == 0xD9 || marker == 0xDA) break; // EOI, SOS

            const std::size_t length = (static_cast<std::size_t>(data[pos + 2]) << 8) | data[pos + 3];
            if (length < 2 || pos + 2 + length > data.size()) break;

            // APP14 "Adobe"
            if (marker == 0xEE && length >= 7 && std::equal(data.begin() + pos + 4, data.begin() + pos + 9, "Adobe")) {
                return true;
            }
            pos += 2 + length;
        }
        return false;
    }

    CImg<unsigned char> ImageNormalizer::cmykToRgb(const CImg<unsigned char>& cmyk, bool inverted)
    {
        CImg<unsigned char> rgb(cmyk.width(), cmyk.height(), 1, 3);
        cimg_forXY(rgb, x, y) {
            // Adobe writers store 255 - ink
            const unsigned int k = inverted ? cmyk(x, y, 0, 3) : 255u - cmyk(x, y, 0, 3);
            cimg_forC(rgb, c) {
                const unsigned int ink = inverted ? cmyk(x, y, 0, c) : 255u - cmyk(x, y, 0, c);
                rgb(x, y, 0, c) = static_cast<unsigned char>((ink * k + 127u) / 255u);
            }
        }
        return rgb;
    }

    CImg<unsigned char> ImageNormalizer::compositeOnWhite(const CImg<unsigned char>& color,
                                                          const CImg<unsigned char>& alpha)
    {
        CImg<unsigned char> result(color.width(), color.height(), 1, 3);
        cimg_forXY(result, x, y) {
            const unsigned int a = alpha(x, y);
            cimg_forC(result, c) {
                const unsigned int src = color(x, y, 0, color.spectrum() == 1 ? 0 : c);
                result(x, y, 0, c) = static_cast<unsigned char>((src * a + 255u * (255u - a) + 127u) / 255u);
            }
        }
        return result;
    }

    CImg<unsigned char> ImageNormalizer::flattenToRgb(const CImg<unsigned char>& img)
    {
        switch (img.spectrum())
        {
        case 1: // Gray
        {
            CImg<unsigned char> rgb(img.width(), img.height(), 1, 3);
            cimg_forC(rgb, c) {
                rgb.draw_image(0, 0, 0, c, img);
            }
            return rgb;
        }
        case 2: // Gray + alpha
            return compositeOnWhite(img.get_channel(0), img.get_channel(1));
        case 3:
            return img;
        case 4: // RGBA
            return compositeOnWhite(img.get_channels(0, 2), img.get_channel(3));
        default:
            return img.get_channels(0, 2);
        }
    }

    std::pair<int, int> ImageNormalizer::fitWithin(int width, int height, int maxDimension)
    {
        if (width <= maxDimension && height <= maxDimension) {
            return { width, height };
        }

        if (width > height) {
            const auto scaled = static_cast<int>(static_cast<long long>(height) * maxDimension / width);
            return { maxDimension, std::max(1, scaled) };
        }
        const auto scaled = static_cast<int>(static_cast<long long>(width) * maxDimension / height);
        return { std::max(1, scaled), maxDimension };
    }

    CImg<unsigned char> ImageNormalizer::resizeProportional(const CImg<unsigned char>& img, int maxDimension)
    {
        const auto [targetWidth, targetHeight] = fitWithin(img.width(), img.height(), maxDimension);
        if (targetWidth == img.width() && targetHeight == img.height()) {
            return img;
        }

        CImg<unsigned char> resized(img);

        // Area-average large reductions first; the Lanczos kernel alone would alias
        if (resized.width() > targetWidth * MAX_LANCZOS_FACTOR && resized.height() > targetHeight * MAX_LANCZOS_FACTOR) {
            resized.resize(targetWidth * MAX_LANCZOS_FACTOR, targetHeight * MAX_LANCZOS_FACTOR, -100, -100,
                           static_cast<int>(ResampleMode::MovingAverage));
        }
        resized.resize(targetWidth, targetHeight, -100, -100, static_cast<int>(ResampleMode::Lanczos));
        return resized;
    }

    std::vector<unsigned char> ImageNormalizer::encodeJpeg(const CImg<unsigned char>& img, int quality)
    {
        if (img.spectrum() != 3) {
            throw ImageEncodeException("expected 3 channels, got " + std::to_string(img.spectrum()));
        }

        // Headroom for headers and for tiny images at high quality
        unsigned int bufferSize = static_cast<unsigned int>(img.size()) + 65536u;
        std::vector<unsigned char> buffer(bufferSize);

        try
        {
            img.save_jpeg_buffer(buffer.data(), bufferSize, static_cast<unsigned int>(quality));
        }
        catch (const CImgException& e)
        {
            throw ImageEncodeException(e.what());
        }

        buffer.resize(bufferSize);
        return buffer;
    }

    std::vector<unsigned char> ImageNormalizer::normalize(const fs::path& sourcePath,
                                                          const ProcessorOptions& options,
                                                          const FilenameDate& date)
    {
        options.validate();

        CImg<unsigned char> img = decode(sourcePath);

        // 1. Orientation (an unreadable tag leaves the image as decoded)
        Orientation::apply(img, Orientation::readTag(sourcePath));

        // 2. Color mode
        img = flattenToRgb(img);

        // 3. Size
        img = resizeProportional(img, options.maxDimension);

        // 4 + 5. Metadata and encoding
        std::vector<unsigned char> jpeg = encodeJpeg(img, options.quality);
        return ExifMetadata::embed(jpeg, ExifMetadata::fromDate(date));
    }

} // namespace PhotoDater

#pragma once
#include "Common.h"
#include "FilenameDate.h"

namespace PhotoDater
{
    /**
     * @brief Output settings shared by every file in a batch.
     */
    struct ProcessorOptions
    {
        int maxDimension = 1024;
        int quality = 85;

        /**
         * @brief Throws PhotoDaterException unless maxDimension > 0 and quality is in [1, 100].
         */
        void validate() const;
    };

    /**
     * @brief Turns a PNG or JPEG file into an upright, RGB, size-bounded JPEG
     * carrying capture-time EXIF data.
     */
    class ImageNormalizer
    {
    public:
        /**
         * @brief Runs the whole pipeline on one file.
         *
         * Orientation is corrected from the source's EXIF tag, transparency is
         * flattened onto white, the image is scaled down to fit maxDimension and
         * then encoded with the EXIF block built from the date.
         *
         * @param sourcePath The PNG or JPEG file to read.
         * @param options Bounding dimension and JPEG quality.
         * @param date Date written into the EXIF block.
         * @return The encoded JPEG bytes.
         * @throws ImageDecodeException if the source cannot be read as an image.
         * @throws ImageEncodeException if the JPEG cannot be produced.
         */
        static std::vector<unsigned char> normalize(const fs::path& sourcePath,
                                                    const ProcessorOptions& options,
                                                    const FilenameDate& date);

        // --- Pipeline stages ---

        /**
         * @brief Decodes a PNG or JPEG file, detected by its signature, to 8-bit samples.
         */
        static CImg<unsigned char> decode(const fs::path& sourcePath);

        /**
         * @brief Composites alpha onto white and expands grayscale so the result has 3 channels.
         */
        static CImg<unsigned char> flattenToRgb(const CImg<unsigned char>& img);

        /**
         * @brief Size after fitting (width, height) within maxDimension. Never enlarges.
         */
        static std::pair<int, int> fitWithin(int width, int height, int maxDimension);

        /**
         * @brief Lanczos downscale to fitWithin(); returns the input untouched if it already fits.
         */
        static CImg<unsigned char> resizeProportional(const CImg<unsigned char>& img, int maxDimension);

        /**
         * @brief Converts a CMYK raster to RGB. `inverted` is set for Adobe-style
         * JPEGs, which store each ink as 255 minus its amount.
         */
        static CImg<unsigned char> cmykToRgb(const CImg<unsigned char>& cmyk, bool inverted);

        /**
         * @brief Encodes a 3-channel image as a baseline JPEG without metadata.
         */
        static std::vector<unsigned char> encodeJpeg(const CImg<unsigned char>& img, int quality);

    private:
        enum class SourceFormat { Png, Jpeg, Unknown };

        static SourceFormat sniffFormat(const std::vector<unsigned char>& header);

        // True if the JPEG carries an APP14 Adobe segment before the scan data
        static bool hasAdobeMarker(const fs::path& jpegPath);

        // Composites `color` (1 or 3 channels) onto white using `alpha`
        static CImg<unsigned char> compositeOnWhite(const CImg<unsigned char>& color,
                                                    const CImg<unsigned char>& alpha);
    };

} // namespace PhotoDater

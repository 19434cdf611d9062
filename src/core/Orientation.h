#pragma once
#include "Common.h"

namespace PhotoDater
{
    /**
     * @brief Primitive raster transforms. Rotations are clockwise.
     */
    enum class TransformOp
    {
        FlipHorizontal,
        FlipVertical,
        Rotate90,
        Rotate180,
        Rotate270
    };

    /**
     * @brief Maps an EXIF orientation tag to the transforms that make the image display upright.
     */
    class Orientation
    {
    public:
        static constexpr int DEFAULT_TAG = 1;

        /**
         * @brief The ordered operations for a tag (1-8). Unknown tags map to no operation.
         */
        static const std::vector<TransformOp>& operationsFor(int tag);

        /**
         * @brief Applies one primitive transform in place.
         */
        static void applyOp(CImg<unsigned char>& img, TransformOp op);

        /**
         * @brief Applies the full transform for a tag in place.
         */
        static void apply(CImg<unsigned char>& img, int tag);

        /**
         * @brief Reads the EXIF orientation of an image file.
         * Returns DEFAULT_TAG when the tag is missing, out of range or unreadable.
         */
        static int readTag(const fs::path& imagePath);
    };

} // namespace PhotoDater

#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <stdexcept>

// --- CImg Configuration ---
// These defines must be set *before* including CImg.h

// 1. Disable the CImg display (GUI) functionality, which is not needed
//    and avoids a dependency on the X11 library.
#define cimg_display 0

// 2. Enable native JPEG and PNG codecs.
//    (Requires linking libjpeg and libpng)
#define cimg_use_jpeg
#define cimg_use_png

// 3. Include the CImg header file (must be in your include path)
#include "CImg.h"

// --- C++ Namespace Setup ---

namespace fs = std::filesystem;
using namespace cimg_library;

/**
 * @brief Global definitions and utilities for PhotoDater.
 */
namespace PhotoDater
{
    // Extensions picked up by the batch driver (without the leading dot)
    const std::vector<std::string> SUPPORTED_IMG_FORMATS = {
        "png", "jpg", "jpeg"
    };

    // Extension given to every produced file
    const std::string OUTPUT_EXTENSION = ".jpg";

    // Value written to the EXIF Software tag
    const std::string SOFTWARE_TAG = "img-date-processor";

    /**
     * @brief Base exception for invalid options and file system errors.
     */
    class PhotoDaterException : public std::runtime_error {
    public:
        explicit PhotoDaterException(const std::string& message)
            : std::runtime_error("PhotoDater Error: " + message) {}
    };

    /**
     * @brief The source bytes are not a readable PNG or JPEG image.
     */
    class ImageDecodeException : public PhotoDaterException {
    public:
        explicit ImageDecodeException(const std::string& message)
            : PhotoDaterException("decode failed: " + message) {}
    };

    /**
     * @brief The output JPEG could not be produced or persisted.
     */
    class ImageEncodeException : public PhotoDaterException {
    public:
        explicit ImageEncodeException(const std::string& message)
            : PhotoDaterException("encode failed: " + message) {}
    };

    /**
     * @brief Helper to convert a string to lowercase.
     */
    inline std::string to_lower(const std::string& str) {
        std::string data = str;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c){ return std::tolower(c); });
        return data;
    }

} // namespace PhotoDater

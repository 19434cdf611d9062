#pragma once
#include "Common.h"
#include "FileTimestamps.h"
#include "ImageNormalizer.h"

#include <memory>

namespace PhotoDater
{
    /**
     * @brief Outcome counts of one batch run. found == processed + skipped + failed.
     */
    struct BatchReport
    {
        int found = 0;
        int processed = 0;
        int skipped = 0; // no date in the filename
        int failed = 0;  // decode, encode or write error
    };

    /**
     * @brief Converts every dated PNG/JPEG under a directory into a timestamped JPEG.
     */
    class BatchProcessor
    {
    public:
        enum class FileResult { Processed, Skipped, Failed };

        /**
         * @param options Validated on construction.
         * @param creationSetter Defaults to the host platform's implementation.
         * @throws PhotoDaterException if the options are invalid.
         */
        explicit BatchProcessor(const ProcessorOptions& options,
                                std::unique_ptr<CreationTimeSetter> creationSetter = nullptr);

        /**
         * @brief Processes a single image. Never throws for per-file problems.
         * @param sourcePath Image to read; its filename must carry a date.
         * @param destPath Where the JPEG is written. Parent directories are created.
         */
        FileResult processImage(const fs::path& sourcePath, const fs::path& destPath);

        /**
         * @brief Recursively processes all PNG/JPG/JPEG files in sourceDir, mirroring
         * the directory layout into destDir with a .jpg extension.
         * @throws PhotoDaterException if sourceDir is missing or not a directory.
         */
        BatchReport processDirectory(const fs::path& sourceDir, const fs::path& destDir);

        const ProcessorOptions& options() const { return m_options; }

    private:
        ProcessorOptions m_options;
        std::unique_ptr<CreationTimeSetter> m_creationSetter;
    };

} // namespace PhotoDater

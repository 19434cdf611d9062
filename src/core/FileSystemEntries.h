#pragma once
#include "Common.h"

namespace PhotoDater
{
    /**
     * @brief Path resolution, directory creation and image discovery for the batch driver.
     */
    class FileSystemEntries
    {
    public:
        /**
         * @brief Ensures the parent directory of a given file path exists.
         * @param filePath The full path to a file.
         * @throws PhotoDaterException if the directory cannot be created.
         */
        static void ensureDirectoryExists(const fs::path& filePath);

        /**
         * @brief Converts a relative path to an absolute path.
         */
        static fs::path makeAbsolute(const fs::path& path);

        /**
         * @brief Gets all regular files whose extension is one of `extensions`
         * (case-insensitive, with or without the leading dot), sorted by path.
         */
        static std::vector<fs::path> getFilesByExtensions(fs::path directory,
                                                          const std::vector<std::string>& extensions,
                                                          bool recursive = true);

        /**
         * @brief Maps a file found under sourceRoot to the same relative location under
         * destRoot, with its extension replaced.
         */
        static fs::path mirrorPath(const fs::path& file, const fs::path& sourceRoot,
                                   const fs::path& destRoot, const std::string& newExtension);

        /**
         * @brief Writes a byte buffer to a file, replacing any existing content.
         * @throws ImageEncodeException if the file cannot be written completely.
         */
        static void writeBytes(const fs::path& filePath, const std::vector<unsigned char>& bytes);
    };

} // namespace PhotoDater

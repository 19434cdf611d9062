#include "BatchProcessor.h"
#include "FileSystemEntries.h"
#include "FilenameDate.h"

namespace PhotoDater
{
    BatchProcessor::BatchProcessor(const ProcessorOptions& options,
                                   std::unique_ptr<CreationTimeSetter> creationSetter)
        : m_options(options)
        , m_creationSetter(std::move(creationSetter))
    {
        m_options.validate();
        if (!m_creationSetter) {
            m_creationSetter = CreationTimeSetter::forPlatform();
        }
    }

    BatchProcessor::FileResult BatchProcessor::processImage(const fs::path& sourcePath, const fs::path& destPath)
    {
        const std::string name = sourcePath.filename().string();

        std::optional<FilenameDate> date = inferDate(name);
        if (!date) {
            std::cout << "No valid date found in filename: " << name << std::endl;
            return FileResult::Skipped;
        }

        try
        {
            std::vector<unsigned char> jpeg = ImageNormalizer::normalize(sourcePath, m_options, *date);

            FileSystemEntries::ensureDirectoryExists(destPath);
            FileSystemEntries::writeBytes(destPath, jpeg);
        }
        catch (const std::exception& e)
        {
            std::cerr << "Error processing " << name << ": " << e.what() << std::endl;
            return FileResult::Failed;
        }

        // The JPEG exists at this point; a timestamp failure does not undo that
        const bool timestamped = FileTimestamps::apply(destPath, date->toLocalTime(), *m_creationSetter);

        std::cout << "Processed: " << name << " -> " << destPath.filename().string()
                  << " (date: " << date->toIsoDate() << ")"
                  << (timestamped ? "" : " [file timestamps unchanged]") << std::endl;
        return FileResult::Processed;
    }

    BatchReport BatchProcessor::processDirectory(const fs::path& sourceDir, const fs::path& destDir)
    {
        if (!fs::exists(sourceDir)) {
            throw PhotoDaterException("Source directory does not exist: " + sourceDir.string());
        }
        if (!fs::is_directory(sourceDir)) {
            throw PhotoDaterException("Source path is not a directory: " + sourceDir.string());
        }

        const fs::path sourceRoot = FileSystemEntries::makeAbsolute(sourceDir);
        const fs::path destRoot = FileSystemEntries::makeAbsolute(destDir);

        BatchReport report;
        std::vector<fs::path> files = FileSystemEntries::getFilesByExtensions(sourceRoot, SUPPORTED_IMG_FORMATS, true);
        report.found = static_cast<int>(files.size());

        if (files.empty()) {
            std::cout << "No PNG or JPG files found in: " << sourceDir.string() << std::endl;
            return report;
        }
        std::cout << "Found " << report.found << " image files" << std::endl;

        for (const auto& file : files)
        {
            fs::path destFile = FileSystemEntries::mirrorPath(file, sourceRoot, destRoot, OUTPUT_EXTENSION);
            switch (processImage(file, destFile))
            {
            case FileResult::Processed: report.processed++; break;
            case FileResult::Skipped:   report.skipped++;   break;
            case FileResult::Failed:    report.failed++;    break;
            }
        }

        std::cout << "\nProcessed " << report.processed << " out of " << report.found << " images" << std::endl;
        return report;
    }

} // namespace PhotoDater

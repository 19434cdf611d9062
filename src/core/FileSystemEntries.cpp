#include "FileSystemEntries.h"
#include <fstream>

namespace PhotoDater
{
    void FileSystemEntries::ensureDirectoryExists(const fs::path& filePath)
    {
        fs::path directory = filePath.parent_path();
        if (!directory.empty() && !fs::exists(directory))
        {
            try
            {
                fs::create_directories(directory);
                std::cout << "Created directory: '" << directory.string() << "'." << std::endl;
            }
            catch (const std::exception& e)
            {
                throw PhotoDaterException("Could not create directory: " + directory.string() + ". Reason: " + e.what());
            }
        }
    }

    fs::path FileSystemEntries::makeAbsolute(const fs::path& path)
    {
        return fs::absolute(path);
    }

    std::vector<fs::path> FileSystemEntries::getFilesByExtensions(fs::path directory,
                                                                  const std::vector<std::string>& extensions,
                                                                  bool recursive)
    {
        directory = makeAbsolute(directory);
        std::vector<fs::path> files;

        std::vector<std::string> targetExts;
        for (const auto& ext : extensions) {
            targetExts.push_back(to_lower(ext.find('.') == 0 ? ext : "." + ext));
        }

        auto add_file_if_match = [&](const fs::directory_entry& entry) {
            std::error_code ec;
            if (!entry.is_regular_file(ec)) return;
            const std::string fileExt = to_lower(entry.path().extension().string());
            if (std::find(targetExts.begin(), targetExts.end(), fileExt) != targetExts.end()) {
                files.push_back(fs::absolute(entry.path()));
            }
        };

        try
        {
            if (recursive) {
                fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied);
                for (; it != fs::recursive_directory_iterator(); ++it) {
                    std::error_code ec;
                    if (it->is_directory(ec) && !ec) {
                        // An unreadable subdirectory is skipped, the rest of the tree is still scanned
                        fs::directory_iterator probe(it->path(), ec);
                        if (ec) {
                            std::cerr << "Warning: skipping unreadable directory " << it->path().string()
                                      << ": " << ec.message() << std::endl;
                            it.disable_recursion_pending();
                        }
                        continue;
                    }
                    add_file_if_match(*it);
                }
            } else {
                for (const auto& entry : fs::directory_iterator(directory)) {
                    add_file_if_match(entry);
                }
            }
        }
        catch (const std::exception& e)
        {
            std::cerr << "Error scanning directory " << directory.string() << ": " << e.what() << std::endl;
        }

        std::sort(files.begin(), files.end());
        return files;
    }

    fs::path FileSystemEntries::mirrorPath(const fs::path& file, const fs::path& sourceRoot,
                                           const fs::path& destRoot, const std::string& newExtension)
    {
        fs::path relative = file.lexically_relative(sourceRoot);
        if (relative.empty()) {
            relative = file.filename();
        }
        return destRoot / relative.replace_extension(newExtension);
    }

    void FileSystemEntries::writeBytes(const fs::path& filePath, const std::vector<unsigned char>& bytes)
    {
        std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ImageEncodeException("cannot open " + filePath.string() + " for writing");
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            // Never leave a truncated JPEG behind
            std::error_code ec;
            if (!fs::remove(filePath, ec) && ec) {
                std::cerr << "Warning: could not remove partial file " << filePath.string() << ": " << ec.message() << std::endl;
            }
            throw ImageEncodeException("failed writing " + filePath.string());
        }
    }

} // namespace PhotoDater

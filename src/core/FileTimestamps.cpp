#include "FileTimestamps.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>

#ifdef __APPLE__
#include <sys/attr.h>
#include <unistd.h>
#endif

namespace PhotoDater
{
#ifdef __APPLE__
    namespace
    {
        class MacCreationTimeSetter : public CreationTimeSetter
        {
        public:
            bool setCreationTime(const fs::path& filePath, std::time_t when) override
            {
                struct attrlist attributes;
                std::memset(&attributes, 0, sizeof(attributes));
                attributes.bitmapcount = ATTR_BIT_MAP_COUNT;
                attributes.commonattr = ATTR_CMN_CRTIME;

                struct timespec creation;
                creation.tv_sec = when;
                creation.tv_nsec = 0;

                if (setattrlist(filePath.c_str(), &attributes, &creation, sizeof(creation), 0) != 0) {
                    std::cerr << "Warning: could not set creation time of " << filePath.string()
                              << ": " << std::strerror(errno) << std::endl;
                    return false;
                }
                return true;
            }
        };
    }

    std::unique_ptr<CreationTimeSetter> CreationTimeSetter::forPlatform()
    {
        return std::make_unique<MacCreationTimeSetter>();
    }
#else
    std::unique_ptr<CreationTimeSetter> CreationTimeSetter::forPlatform()
    {
        return std::make_unique<NoopCreationTimeSetter>();
    }
#endif

    bool FileTimestamps::setModificationTime(const fs::path& filePath, std::time_t when)
    {
        struct timespec times[2];
        times[0].tv_sec = when; // access
        times[0].tv_nsec = 0;
        times[1].tv_sec = when; // modification
        times[1].tv_nsec = 0;

        if (utimensat(AT_FDCWD, filePath.c_str(), times, 0) != 0) {
            std::cerr << "Warning: could not set timestamps of " << filePath.string()
                      << ": " << std::strerror(errno) << std::endl;
            return false;
        }
        return true;
    }

    bool FileTimestamps::apply(const fs::path& filePath, std::time_t when, CreationTimeSetter& creationSetter)
    {
        const bool modified = setModificationTime(filePath, when);
        const bool created = creationSetter.setCreationTime(filePath, when);
        return modified && created;
    }

} // namespace PhotoDater

#pragma once
#include "Common.h"

#include <ctime>
#include <memory>

namespace PhotoDater
{
    /**
     * @brief Best-effort setter for a file's creation (birth) time.
     * Implementations return false instead of throwing when the platform refuses.
     */
    class CreationTimeSetter
    {
    public:
        virtual ~CreationTimeSetter() = default;

        virtual bool setCreationTime(const fs::path& filePath, std::time_t when) = 0;

        /**
         * @brief The implementation for the host platform (a no-op where
         * creation time cannot be set).
         */
        static std::unique_ptr<CreationTimeSetter> forPlatform();
    };

    /**
     * @brief Used on platforms without a settable creation time. Nothing to do, so it always succeeds.
     */
    class NoopCreationTimeSetter : public CreationTimeSetter
    {
    public:
        bool setCreationTime(const fs::path&, std::time_t) override { return true; }
    };

    class FileTimestamps
    {
    public:
        /**
         * @brief Sets access and modification time of a file.
         * @return false if the system call failed. Never throws.
         */
        static bool setModificationTime(const fs::path& filePath, std::time_t when);

        /**
         * @brief Sets modification time and, through `creationSetter`, creation time.
         * @return true if every timestamp the platform supports was set. Never throws.
         */
        static bool apply(const fs::path& filePath, std::time_t when, CreationTimeSetter& creationSetter);
    };

} // namespace PhotoDater

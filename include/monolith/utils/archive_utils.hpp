/**
 * @file archive_utils.hpp
 * @brief Tar archive helpers and scoped scratch directories
 *
 * Archives are produced and unpacked with the system `tar` utility, the
 * same format `docker cp -` consumes and emits.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <filesystem>

namespace monolith {
namespace utils {

/**
 * @class TemporaryDirectory
 * @brief Uniquely named directory removed (recursively) on destruction
 */
class TemporaryDirectory {
public:
    /**
     * @brief Create a fresh directory
     * @param prefix Name prefix
     * @param root Parent directory (default: system temp directory)
     * @throws std::filesystem::filesystem_error if creation fails
     */
    explicit TemporaryDirectory(const std::string& prefix,
                                const std::filesystem::path& root = {});
    ~TemporaryDirectory();

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @class ArchiveUtils
 * @brief Single-file tar bundling for environment transfers
 */
class ArchiveUtils {
public:
    /**
     * @brief Bundle one file into a tar archive under its base name only
     *
     * @param source File to bundle
     * @param archive Archive path to write
     * @return true on success (failures are logged)
     */
    static bool CreateArchive(const std::filesystem::path& source,
                              const std::filesystem::path& archive);

    /**
     * @brief Unpack a tar archive into a directory
     *
     * @param archive Archive to read
     * @param destination Target directory (created if missing)
     * @return true on success (failures are logged)
     */
    static bool ExtractArchive(const std::filesystem::path& archive,
                               const std::filesystem::path& destination);

    /**
     * @brief Check whether an archive holds no file data
     *
     * Missing files, zero-length files and archives whose members are all
     * empty count as empty.
     *
     * @param archive Archive to inspect
     * @return true if nothing useful can be extracted
     */
    static bool IsEmptyArchive(const std::filesystem::path& archive);
};

} // namespace utils
} // namespace monolith

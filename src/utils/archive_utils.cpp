/**
 * @file archive_utils.cpp
 * @brief Implementation of tar helpers and scratch directories
 *
 * @date 2025
 */

#include "monolith/utils/archive_utils.hpp"
#include "monolith/utils/process_utils.hpp"
#include "monolith/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <random>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace monolith {
namespace utils {

// ============================================================================
// TEMPORARY DIRECTORY
// ============================================================================

TemporaryDirectory::TemporaryDirectory(const std::string& prefix,
                                       const std::filesystem::path& root) {
    auto base = root.empty() ? std::filesystem::temp_directory_path() : root;
    std::filesystem::create_directories(base);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(100000, 999999);

    for (int attempt = 0; attempt < 16; ++attempt) {
        std::ostringstream name;
        name << prefix << "_" << ::getpid() << "_"
             << std::chrono::steady_clock::now().time_since_epoch().count()
             << "_" << dis(gen);
        auto candidate = base / name.str();
        if (std::filesystem::create_directory(candidate)) {
            path_ = candidate;
            return;
        }
    }

    throw std::filesystem::filesystem_error(
        "cannot create unique temporary directory", base,
        std::make_error_code(std::errc::file_exists));
}

TemporaryDirectory::~TemporaryDirectory() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temporary directory {}: {}", path_.string(), ec.message());
    }
}

// ============================================================================
// TAR ARCHIVES
// ============================================================================

bool ArchiveUtils::CreateArchive(const std::filesystem::path& source,
                                 const std::filesystem::path& archive) {
    if (!std::filesystem::is_regular_file(source)) {
        spdlog::error("Cannot archive {}: not a regular file", source.string());
        return false;
    }

    auto parent = source.parent_path();
    ProcessSpec spec;
    spec.argv = {"tar", "-C", parent.empty() ? "." : parent.string(),
                 "-cf", archive.string(), source.filename().string()};

    spdlog::debug("Executing: {}", FormatCommandLine(spec.argv));
    auto result = RunProcess(spec);
    if (!result.Succeeded()) {
        spdlog::error("Failed to archive {}: {}", source.string(),
                      result.spawned ? StringUtils::TrimRight(result.stderr_output)
                                     : result.error_message);
        return false;
    }
    return true;
}

bool ArchiveUtils::ExtractArchive(const std::filesystem::path& archive,
                                  const std::filesystem::path& destination) {
    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", destination.string(), ec.message());
        return false;
    }

    ProcessSpec spec;
    spec.argv = {"tar", "-xf", archive.string(), "-C", destination.string()};

    spdlog::debug("Executing: {}", FormatCommandLine(spec.argv));
    auto result = RunProcess(spec);
    if (!result.Succeeded()) {
        spdlog::error("Failed to extract {}: {}", archive.string(),
                      result.spawned ? StringUtils::TrimRight(result.stderr_output)
                                     : result.error_message);
        return false;
    }
    return true;
}

bool ArchiveUtils::IsEmptyArchive(const std::filesystem::path& archive) {
    std::error_code ec;
    auto size = std::filesystem::file_size(archive, ec);
    if (ec || size == 0) {
        return true;
    }

    ProcessSpec spec;
    spec.argv = {"tar", "-tvf", archive.string()};
    auto result = RunProcess(spec);
    if (!result.Succeeded()) {
        spdlog::warn("Cannot list archive {}: {}", archive.string(),
                     StringUtils::TrimRight(result.stderr_output));
        return true;
    }

    // GNU tar verbose listing: <mode> <owner/group> <size> <date> <time> <name>
    std::istringstream listing(result.stdout_output);
    std::string line;
    while (std::getline(listing, line)) {
        auto fields = StringUtils::SplitWhitespace(line);
        if (fields.size() < 3) {
            continue;
        }
        if (fields[0].empty() || fields[0][0] != '-') {
            return false;
        }
        if (fields[2] != "0") {
            return false;
        }
    }
    return true;
}

} // namespace utils
} // namespace monolith

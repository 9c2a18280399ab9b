/**
 * @file transfer_protocol.cpp
 * @brief File movement between the host and a live environment
 *
 * @date 2025
 */

#include "monolith/core/transfer_protocol.hpp"
#include "monolith/core/errors.hpp"
#include "monolith/utils/archive_utils.hpp"
#include "monolith/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace monolith {
namespace core {

using utils::ArchiveUtils;
using utils::StringUtils;
using utils::TemporaryDirectory;

namespace {

bool IsPlainEntry(const std::filesystem::path& path) {
    auto status = std::filesystem::symlink_status(path);
    return std::filesystem::is_regular_file(status) || std::filesystem::is_directory(status);
}

// Links and special files in an environment archive are never materialised on the host
void RejectSpecialEntries(const std::filesystem::path& extracted, const std::string& remote) {
    if (!IsPlainEntry(extracted)) {
        throw RemoteFileNotFoundError(remote + " is not a regular file or directory");
    }
    if (!std::filesystem::is_directory(std::filesystem::symlink_status(extracted))) {
        return;
    }
    for (const auto& entry : std::filesystem::recursive_directory_iterator(extracted)) {
        if (!IsPlainEntry(entry.path())) {
            throw RemoteFileNotFoundError(remote + " contains " +
                                          entry.path().filename().string() +
                                          ", which is not a regular file or directory");
        }
    }
}

} // anonymous namespace

TransferProtocol::TransferProtocol(EnvironmentBackend& backend,
                                   const CommandExecutor& executor,
                                   std::filesystem::path scratch_root)
    : backend_(backend), executor_(executor), scratch_root_(std::move(scratch_root)) {
}

std::string TransferProtocol::RemoteParent(const std::string& remote) {
    std::string path = remote;
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return "";
    }
    if (slash == 0) {
        return "/";
    }
    return path.substr(0, slash);
}

std::string TransferProtocol::RemoteBaseName(const std::string& remote) {
    std::string path = remote;
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// ============================================================================
// HOST → ENVIRONMENT
// ============================================================================

void TransferProtocol::CopyTo(const EnvironmentHandle& env,
                              const std::filesystem::path& local,
                              const std::string& remote) const {
    if (!std::filesystem::is_regular_file(local)) {
        throw std::invalid_argument("Local file not found: " + local.string());
    }
    if (!StringUtils::StartsWith(remote, "/")) {
        throw std::invalid_argument("Remote path must be absolute: " + remote);
    }

    const std::string parent = RemoteParent(remote);
    const std::string base_name = RemoteBaseName(remote);
    if (base_name.empty()) {
        throw std::invalid_argument("Remote path names no file: " + remote);
    }

    bool created_dir = false;
    auto probe = executor_.Execute(env, "test -d " + StringUtils::ShellQuote(parent));
    if (!probe.Succeeded()) {
        auto mkdir = executor_.Execute(env, "mkdir -p " + StringUtils::ShellQuote(parent));
        if (!mkdir.Succeeded()) {
            throw BackendError("Cannot create directory " + parent + " in " + env.ShortId() +
                               ": " + mkdir.stderr_output.value_or(""));
        }
        created_dir = true;
    }

    if (created_dir) {
        spdlog::debug("Copying {} to {}:{} (created {})", local.string(), env.ShortId(), remote,
                      parent);
    } else {
        spdlog::debug("Copying {} to {}:{}", local.string(), env.ShortId(), remote);
    }

    TemporaryDirectory staging("monolith-put", scratch_root_);

    // Stage under the destination name so the archive entry matches it
    std::filesystem::path source = local;
    if (local.filename().string() != base_name) {
        source = staging.Path() / base_name;
        std::filesystem::copy_file(local, source,
                                   std::filesystem::copy_options::overwrite_existing);
    }

    auto archive = staging.Path() / "transfer.tar";
    if (!ArchiveUtils::CreateArchive(source, archive)) {
        throw BackendError("Failed to archive " + local.string());
    }

    backend_.PutArchive(env, archive, parent);
}

// ============================================================================
// ENVIRONMENT → HOST
// ============================================================================

void TransferProtocol::CopyFrom(const EnvironmentHandle& env,
                                const std::string& remote,
                                const std::filesystem::path& local) const {
    auto probe = executor_.Execute(env, "test -e " + StringUtils::ShellQuote(remote));
    if (!probe.Succeeded()) {
        throw RemoteFileNotFoundError("File " + remote + " not found in the container");
    }

    spdlog::debug("Copying {}:{} to {}", env.ShortId(), remote, local.string());

    TemporaryDirectory staging("monolith-get", scratch_root_);
    auto archive = staging.Path() / "transfer.tar";

    backend_.GetArchive(env, remote, archive);
    if (ArchiveUtils::IsEmptyArchive(archive)) {
        throw RemoteFileNotFoundError("File " + remote + " not found in the container");
    }

    auto extract_dir = staging.Path() / "extract";
    if (!ArchiveUtils::ExtractArchive(archive, extract_dir)) {
        throw BackendError("Failed to extract archive of " + remote);
    }

    auto extracted = extract_dir / RemoteBaseName(remote);
    if (!std::filesystem::exists(std::filesystem::symlink_status(extracted))) {
        throw RemoteFileNotFoundError("Archive of " + remote + " does not contain " +
                                      RemoteBaseName(remote));
    }

    try {
        RejectSpecialEntries(extracted, remote);
        if (local.has_parent_path()) {
            std::filesystem::create_directories(local.parent_path());
        }
        std::filesystem::copy(extracted, local,
                              std::filesystem::copy_options::overwrite_existing |
                              std::filesystem::copy_options::recursive);
    }
    catch (const std::filesystem::filesystem_error& e) {
        throw BackendError("Cannot write " + local.string() + ": " + e.what());
    }
}

} // namespace core
} // namespace monolith

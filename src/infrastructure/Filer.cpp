/**
 * @file Filer.cpp
 * @brief Implementation of Filer.
 */

#include "infrastructure/Filer.hpp"

#include <cerrno>
#include <cstdio>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <uuid/uuid.h>

namespace fs = std::filesystem;

namespace scansorter::infrastructure {

namespace {

constexpr int kMaxNameAttempts = 8;

enum class RenameStatus { Moved, TargetExists, CrossDevice, Failed };

// rename(2) that refuses to replace an existing target.
RenameStatus RenameNoReplace(const fs::path& from, const fs::path& to, std::error_code& ec) {
    ec.clear();
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return RenameStatus::Moved;
    }

    const int err = errno;
    if (err == EEXIST) return RenameStatus::TargetExists;
    if (err == EXDEV) return RenameStatus::CrossDevice;

    if (err == EINVAL || err == ENOSYS) {
        // Filesystem without RENAME_NOREPLACE support.
        if (fs::exists(to, ec)) return RenameStatus::TargetExists;
        fs::rename(from, to, ec);
        if (!ec) return RenameStatus::Moved;
        if (ec == std::errc::cross_device_link) return RenameStatus::CrossDevice;
        return RenameStatus::Failed;
    }

    ec = std::error_code(err, std::generic_category());
    return RenameStatus::Failed;
}

FilingResult Failure(const std::string& error) {
    FilingResult result;
    result.success = false;
    result.error = error;
    return result;
}

FilingResult Success(const fs::path& destination) {
    FilingResult result;
    result.success = true;
    result.destination = destination.string();
    return result;
}

} // namespace

Filer::Filer(SuffixGenerator suffixGenerator)
    : m_suffixGenerator(std::move(suffixGenerator)) {}

std::string Filer::RandomSuffix() {
    uuid_t id;
    uuid_generate_random(id);
    char text[37];
    uuid_unparse_lower(id, text);
    return std::string(text, 6);
}

bool Filer::EnsureDirectory(const fs::path& dir, std::string& error) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    const std::string createError = ec ? ec.message() : std::string("path exists and is not a directory");
    // Another file may have created it concurrently.
    if (fs::is_directory(dir, ec)) {
        return true;
    }
    error = "Could not create directory " + dir.string() + ": " + createError;
    return false;
}

FilingResult Filer::fileClassified(const std::string& sourcePath,
                                   const std::string& finishedDir,
                                   const std::string& token) const {
    const std::string extension = fs::path(sourcePath).extension().string();
    return moveInto(sourcePath, finishedDir, [this, &token, &extension](int) {
        return token + "_" + m_suffixGenerator() + extension;
    });
}

FilingResult Filer::fileUnclassified(const std::string& sourcePath,
                                     const std::string& errorDir) const {
    const fs::path source(sourcePath);
    const std::string basename = source.filename().string();
    const std::string stem = source.stem().string();
    const std::string extension = source.extension().string();
    return moveInto(source, errorDir, [this, &basename, &stem, &extension](int attempt) {
        if (attempt == 0) return basename;
        return stem + "_" + m_suffixGenerator() + extension;
    });
}

FilingResult Filer::moveInto(const fs::path& source, const fs::path& dir, const NameForAttempt& nameFor) const {
    std::string error;
    if (!EnsureDirectory(dir, error)) {
        return Failure(error);
    }

    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        const fs::path target = dir / nameFor(attempt);
        std::error_code ec;
        switch (RenameNoReplace(source, target, ec)) {
            case RenameStatus::Moved:
                return Success(target);
            case RenameStatus::TargetExists:
                continue;
            case RenameStatus::CrossDevice:
                return copyAcrossVolumes(source, dir, nameFor, attempt);
            case RenameStatus::Failed:
                return Failure("Rename " + source.string() + " -> " + target.string() + " failed: " + ec.message());
        }
    }
    return Failure("No free destination name in " + dir.string() + " for " + source.filename().string());
}

FilingResult Filer::copyAcrossVolumes(const fs::path& source, const fs::path& dir,
                                      const NameForAttempt& nameFor, int firstAttempt) const {
    // Fixed short stem: the source name may already be close to NAME_MAX.
    const fs::path temp = dir / (".scansorter." + RandomSuffix() + ".part");

    std::error_code ec;
    fs::copy_file(source, temp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(temp, ec);
        return Failure("Copy " + source.string() + " -> " + temp.string() + " failed: " + reason);
    }

    std::error_code sizeEc;
    const auto sourceSize = fs::file_size(source, sizeEc);
    const auto copySize = sizeEc ? 0 : fs::file_size(temp, sizeEc);
    if (sizeEc || sourceSize != copySize) {
        fs::remove(temp, ec);
        return Failure("Copy of " + source.string() + " is incomplete");
    }

    for (int attempt = firstAttempt; attempt < kMaxNameAttempts; ++attempt) {
        const fs::path target = dir / nameFor(attempt);
        const RenameStatus status = RenameNoReplace(temp, target, ec);
        if (status == RenameStatus::TargetExists) {
            continue;
        }
        if (status != RenameStatus::Moved) {
            const std::string reason = ec.message();
            fs::remove(temp, ec);
            return Failure("Rename " + temp.string() + " -> " + target.string() + " failed: " + reason);
        }

        fs::remove(source, ec);
        if (ec) {
            // Never leave the file in both buckets.
            std::string reason = ec.message();
            std::error_code cleanupEc;
            fs::remove(target, cleanupEc);
            if (cleanupEc) {
                reason += "; copy left at " + target.string() + " (" + cleanupEc.message() + ")";
            }
            return Failure("Copied but could not remove source " + source.string() + ": " + reason);
        }
        return Success(target);
    }

    fs::remove(temp, ec);
    return Failure("No free destination name in " + dir.string() + " for " + source.filename().string());
}

} // namespace scansorter::infrastructure

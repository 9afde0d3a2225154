/**
 * @file Filer.hpp
 * @brief Moves processed scans into the finished or error bucket.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <string>

namespace scansorter::infrastructure {

/**
 * @struct FilingResult
 * @brief Outcome of a single move.
 */
struct FilingResult {
    bool success = false;
    std::string destination; ///< Final path when success is true.
    std::string error;       ///< Reason when success is false.
};

/**
 * @class Filer
 * @brief Atomic, no-clobber move of a file into a destination directory.
 *
 * Same-volume moves are a single rename that never replaces an existing file.
 * Cross-volume moves copy to a temporary name in the destination, rename it into
 * place and only then remove the source. The source file is never visible in
 * both locations once the call returns.
 */
class Filer {
public:
    /** @brief Produces the random part of a destination name. */
    using SuffixGenerator = std::function<std::string()>;

    explicit Filer(SuffixGenerator suffixGenerator = RandomSuffix);

    /**
     * @brief Moves a classified file to `{token}_{suffix}{ext}` in @p finishedDir.
     */
    FilingResult fileClassified(const std::string& sourcePath,
                                const std::string& finishedDir,
                                const std::string& token) const;

    /**
     * @brief Moves an unclassified file to @p errorDir under its original basename.
     *
     * If that name is taken, `{stem}_{suffix}{ext}` is used instead.
     */
    FilingResult fileUnclassified(const std::string& sourcePath,
                                  const std::string& errorDir) const;

    /** @brief Six lowercase hex characters taken from a random UUID. */
    static std::string RandomSuffix();

    /**
     * @brief Creates @p dir (and parents). An existing directory counts as success.
     * @param error Receives the reason on failure.
     */
    static bool EnsureDirectory(const std::filesystem::path& dir, std::string& error);

private:
    using NameForAttempt = std::function<std::string(int attempt)>;

    FilingResult moveInto(const std::filesystem::path& source,
                          const std::filesystem::path& dir,
                          const NameForAttempt& nameFor) const;

    FilingResult copyAcrossVolumes(const std::filesystem::path& source,
                                   const std::filesystem::path& dir,
                                   const NameForAttempt& nameFor,
                                   int firstAttempt) const;

    SuffixGenerator m_suffixGenerator;
};

} // namespace scansorter::infrastructure

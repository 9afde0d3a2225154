/**
 * @file ClassificationOutcome.hpp
 * @brief Value objects describing the result of processing one intake file.
 */

#pragma once

#include <optional>
#include <string>

namespace scansorter::domain {

/**
 * @enum PipelineStage
 * @brief Last state reached by a file. Skipped and Errored are absorbing.
 */
enum class PipelineStage {
    Detected,
    Gated,
    Extracted,
    Parsed,
    Filed,
    Skipped,   ///< Left untouched in intake.
    Errored    ///< Could not be read; filed into the error bucket when possible.
};

/**
 * @enum FileOutcome
 * @brief Terminal outcome of a single file.
 */
enum class FileOutcome {
    Classified,           ///< Token found, moved into the finished bucket.
    NoTokenFound,         ///< Readable but no token, moved into the error bucket.
    DecodeFailure,        ///< Image unreadable after retries, moved into the error bucket.
    EngineFailure,        ///< OCR engine raised, moved into the error bucket.
    LockTimeout,          ///< Never became ready, left in intake.
    Vanished,             ///< Disappeared before it became ready.
    UnsupportedExtension, ///< Not an image, left in intake.
    NotAFile,             ///< Directory or special file, ignored.
    FilesystemFailure,    ///< Move failed twice, left in intake.
    UnexpectedError       ///< A stage threw; the file stays wherever it was.
};

inline std::string StageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Detected: return "Detected";
        case PipelineStage::Gated: return "Gated";
        case PipelineStage::Extracted: return "Extracted";
        case PipelineStage::Parsed: return "Parsed";
        case PipelineStage::Filed: return "Filed";
        case PipelineStage::Skipped: return "Skipped";
        case PipelineStage::Errored: return "Errored";
        default: return "Unknown";
    }
}

inline std::string OutcomeToString(FileOutcome outcome) {
    switch (outcome) {
        case FileOutcome::Classified: return "Classified";
        case FileOutcome::NoTokenFound: return "NoTokenFound";
        case FileOutcome::DecodeFailure: return "DecodeFailure";
        case FileOutcome::EngineFailure: return "EngineFailure";
        case FileOutcome::LockTimeout: return "LockTimeout";
        case FileOutcome::Vanished: return "Vanished";
        case FileOutcome::UnsupportedExtension: return "UnsupportedExtension";
        case FileOutcome::NotAFile: return "NotAFile";
        case FileOutcome::FilesystemFailure: return "FilesystemFailure";
        case FileOutcome::UnexpectedError: return "UnexpectedError";
        default: return "Unknown";
    }
}

/**
 * @struct ClassificationReport
 * @brief Everything known about one processed file.
 */
struct ClassificationReport {
    std::string sourcePath;
    PipelineStage stage = PipelineStage::Detected;
    FileOutcome outcome = FileOutcome::NoTokenFound;
    std::optional<std::string> token;   ///< Set only when a token was parsed.
    std::string destination;            ///< Final path, empty if the file was not moved.
    std::string message;                ///< Human-readable summary, as logged.

    bool moved() const { return !destination.empty(); }
};

} // namespace scansorter::domain

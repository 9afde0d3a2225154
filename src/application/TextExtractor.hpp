/**
 * @file TextExtractor.hpp
 * @brief Turns an image file into best-effort text.
 */

#pragma once

#include "domain/OcrEngine.hpp"
#include "domain/RetryPolicy.hpp"

#include <functional>
#include <memory>
#include <string>

namespace scansorter::application {

/**
 * @enum ExtractStatus
 * @brief Why extraction did or did not produce text.
 */
enum class ExtractStatus {
    Success,       ///< Engine ran; text may still be empty.
    Unreadable,    ///< Image could not be decoded within the attempt bound.
    EngineFailure  ///< Decoded, but the engine raised. Not retried.
};

/**
 * @struct ExtractionResult
 * @brief Text plus diagnostics for one image.
 */
struct ExtractionResult {
    ExtractStatus status = ExtractStatus::Unreadable;
    std::string text;          ///< Raw engine output, verbatim.
    std::string errorMessage;
    int decodeAttempts = 0;

    bool success() const { return status == ExtractStatus::Success; }
};

/**
 * @class TextExtractor
 * @brief Decodes an image with bounded retries, then runs the OCR engine once.
 */
class TextExtractor {
public:
    /** @brief Receives one line per failed decode attempt. */
    using StatusCallback = std::function<void(const std::string&)>;

    TextExtractor(std::shared_ptr<domain::ImageDecoder> decoder,
                  std::shared_ptr<domain::OcrEngine> engine,
                  domain::RetryPolicy decodeRetry);

    /** @param statusCallback Optional progress sink; stdout when empty. */
    ExtractionResult extract(const std::string& imagePath, const StatusCallback& statusCallback = nullptr);

private:
    std::shared_ptr<domain::ImageDecoder> m_decoder;
    std::shared_ptr<domain::OcrEngine> m_engine;
    domain::RetryPolicy m_decodeRetry;
};

} // namespace scansorter::application

/**
 * @file TextExtractor.cpp
 * @brief Implementation of TextExtractor.
 */

#include "application/TextExtractor.hpp"

#include <iostream>
#include <utility>

namespace scansorter::application {

TextExtractor::TextExtractor(std::shared_ptr<domain::ImageDecoder> decoder,
                             std::shared_ptr<domain::OcrEngine> engine,
                             domain::RetryPolicy decodeRetry)
    : m_decoder(std::move(decoder)), m_engine(std::move(engine)), m_decodeRetry(decodeRetry) {}

ExtractionResult TextExtractor::extract(const std::string& imagePath, const StatusCallback& statusCallback) {
    ExtractionResult result;

    std::string lastDecodeError;
    auto decoded = domain::RetryWithBackoff<std::unique_ptr<domain::DecodedImage>>(
        m_decodeRetry,
        [this, &imagePath, &lastDecodeError](int) -> std::optional<std::unique_ptr<domain::DecodedImage>> {
            try {
                auto image = m_decoder->decode(imagePath);
                if (image) return std::move(image);
                lastDecodeError = "decoder returned no image";
            } catch (const std::exception& e) {
                lastDecodeError = e.what();
            }
            return std::nullopt;
        },
        [this, &imagePath, &statusCallback](int attempt) {
            const std::string message = "[WARNING] Image '" + imagePath + "' is locked or unreadable. Retrying (" +
                                        std::to_string(attempt) + "/" + std::to_string(m_decodeRetry.maxAttempts) +
                                        ")...";
            if (statusCallback) {
                statusCallback(message);
            } else {
                std::cout << "[TextExtractor] " << message << std::endl;
            }
        });

    result.decodeAttempts = decoded.attempts;
    if (!decoded.succeeded()) {
        result.status = ExtractStatus::Unreadable;
        result.errorMessage = "Max retries reached (" + std::to_string(decoded.attempts) + "): " + lastDecodeError;
        return result;
    }

    try {
        result.text = m_engine->recognize(**decoded.value);
        result.status = ExtractStatus::Success;
    } catch (const std::exception& e) {
        result.status = ExtractStatus::EngineFailure;
        result.errorMessage = e.what();
    }
    return result;
}

} // namespace scansorter::application

/**
 * @file OcrEngine.hpp
 * @brief Interfaces for image decoding and image-to-text recognition.
 */

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace scansorter::domain {

/**
 * @class DecodedImage
 * @brief Opaque handle to a fully decoded image owned by a decoder implementation.
 */
class DecodedImage {
public:
    virtual ~DecodedImage() = default;
};

/**
 * @class ImageDecoder
 * @brief Opens and fully decodes an image file.
 */
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;

    /**
     * @brief Decodes the image at the given path.
     * @return The decoded image, or nullptr if it could not be read.
     */
    virtual std::unique_ptr<DecodedImage> decode(const std::string& imagePath) = 0;
};

/**
 * @class OcrEngineError
 * @brief Raised by an engine for unsupported input or internal failures.
 */
class OcrEngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class OcrEngine
 * @brief Black-box text recognizer. Treated as opaque and unreliable.
 */
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    /**
     * @brief Recognizes text on a decoded image.
     * @return Raw engine output, possibly empty.
     * @throws OcrEngineError on engine failure.
     */
    virtual std::string recognize(const DecodedImage& image) = 0;
};

} // namespace scansorter::domain

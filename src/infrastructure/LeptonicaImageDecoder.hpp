/**
 * @file LeptonicaImageDecoder.hpp
 * @brief ImageDecoder backed by Leptonica.
 */

#pragma once

#include "domain/OcrEngine.hpp"

// Leptonica's image type, kept out of this header's includes.
struct Pix;

namespace scansorter::infrastructure {

/**
 * @class LeptonicaImage
 * @brief Owns a decoded Leptonica Pix.
 */
class LeptonicaImage : public domain::DecodedImage {
public:
    explicit LeptonicaImage(Pix* pix);
    ~LeptonicaImage() override;

    LeptonicaImage(const LeptonicaImage&) = delete;
    LeptonicaImage& operator=(const LeptonicaImage&) = delete;

    Pix* pix() const { return m_pix; }

private:
    Pix* m_pix = nullptr;
};

/**
 * @class LeptonicaImageDecoder
 * @brief Reads PNG, JPEG, TIFF and BMP files fully into memory.
 */
class LeptonicaImageDecoder : public domain::ImageDecoder {
public:
    std::unique_ptr<domain::DecodedImage> decode(const std::string& imagePath) override;
};

} // namespace scansorter::infrastructure

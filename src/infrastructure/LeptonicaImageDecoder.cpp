/**
 * @file LeptonicaImageDecoder.cpp
 * @brief Implementation of LeptonicaImageDecoder.
 */

#include "infrastructure/LeptonicaImageDecoder.hpp"

#include <leptonica/allheaders.h>

namespace scansorter::infrastructure {

LeptonicaImage::LeptonicaImage(Pix* pix)
    : m_pix(pix) {}

LeptonicaImage::~LeptonicaImage() {
    if (m_pix) {
        pixDestroy(&m_pix);
    }
}

std::unique_ptr<domain::DecodedImage> LeptonicaImageDecoder::decode(const std::string& imagePath) {
    // pixRead decodes the whole file; a truncated or locked file yields null.
    Pix* pix = pixRead(imagePath.c_str());
    if (!pix) {
        return nullptr;
    }
    return std::make_unique<LeptonicaImage>(pix);
}

} // namespace scansorter::infrastructure

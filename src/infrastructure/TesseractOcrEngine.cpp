/**
 * @file TesseractOcrEngine.cpp
 * @brief Implementation of TesseractOcrEngine.
 */

#include "infrastructure/TesseractOcrEngine.hpp"
#include "infrastructure/LeptonicaImageDecoder.hpp"

#include <utility>

#include <leptonica/allheaders.h>
#include <tesseract/baseapi.h>

namespace scansorter::infrastructure {

TesseractOcrEngine::TesseractOcrEngine(std::string tessdataDir, std::string language)
    : m_tessdataDir(std::move(tessdataDir))
    , m_language(std::move(language)) {}

TesseractOcrEngine::~TesseractOcrEngine() {
    if (m_api) {
        m_api->End();
    }
}

bool TesseractOcrEngine::initialize(std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized) return true;

    auto api = std::make_unique<tesseract::TessBaseAPI>();
    if (api->Init(m_tessdataDir.c_str(), m_language.c_str()) != 0) {
        errorMsg = "Could not initialize Tesseract with language '" + m_language + "' from " + m_tessdataDir;
        return false;
    }

    m_api = std::move(api);
    m_initialized = true;
    return true;
}

std::string TesseractOcrEngine::recognize(const domain::DecodedImage& image) {
    const auto* leptonicaImage = dynamic_cast<const LeptonicaImage*>(&image);
    if (!leptonicaImage || !leptonicaImage->pix()) {
        throw domain::OcrEngineError("Unsupported image handle passed to Tesseract");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) {
        throw domain::OcrEngineError("Tesseract engine is not initialized");
    }

    m_api->SetImage(leptonicaImage->pix());
    std::unique_ptr<char[]> text(m_api->GetUTF8Text());
    m_api->Clear();

    if (!text) {
        throw domain::OcrEngineError("Tesseract failed to recognize the image");
    }
    return std::string(text.get());
}

} // namespace scansorter::infrastructure

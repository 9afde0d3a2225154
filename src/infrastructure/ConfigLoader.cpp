/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace scansorter::infrastructure {

namespace {

std::string NormalizeExtension(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    return ext;
}

std::chrono::milliseconds ReadDelay(const nlohmann::json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    const long long value = j.at(key).get<long long>();
    if (value < 0) {
        throw std::invalid_argument(std::string(key) + " must not be negative");
    }
    return std::chrono::milliseconds(value);
}

int ReadAttempts(const nlohmann::json& j, const char* key, int fallback) {
    if (!j.contains(key)) return fallback;
    const int value = j.at(key).get<int>();
    if (value < 1) {
        throw std::invalid_argument(std::string(key) + " must be at least 1");
    }
    return value;
}

} // namespace

std::string AppSettings::intakeDirectory() const {
    return (fs::path(rootDirectory) / "waves").string();
}

std::string AppSettings::finishedDirectory() const {
    return (fs::path(rootDirectory) / "wavesfinished").string();
}

std::string AppSettings::errorDirectory() const {
    if (errorLayout == ErrorLayout::Sibling) {
        return (fs::path(rootDirectory) / "waveserrors").string();
    }
    return (fs::path(finishedDirectory()) / "UncapturedPO").string();
}

std::optional<ErrorLayout> ConfigLoader::ParseErrorLayout(const std::string& value) {
    if (value == "nested") return ErrorLayout::Nested;
    if (value == "sibling") return ErrorLayout::Sibling;
    return std::nullopt;
}

AppSettings ConfigLoader::Load(const std::string& rootDirectory) {
    AppSettings settings;
    settings.rootDirectory = rootDirectory;

    const fs::path configPath = fs::path(rootDirectory) / "settings.json";
    std::error_code ec;
    if (!fs::exists(configPath, ec)) {
        return settings;
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Could not open " << configPath << ". Using defaults." << std::endl;
        return settings;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    std::string error;
    if (!ApplyJson(buffer.str(), settings, error)) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << error << ". Using defaults." << std::endl;
    }
    return settings;
}

bool ConfigLoader::ApplyJson(const std::string& jsonText, AppSettings& settings, std::string& error) {
    AppSettings updated = settings;
    try {
        const nlohmann::json j = nlohmann::json::parse(jsonText);
        if (!j.is_object()) {
            error = "top-level value must be an object";
            return false;
        }

        if (j.contains("error_layout")) {
            const std::string layout = j.at("error_layout").get<std::string>();
            auto parsed = ParseErrorLayout(layout);
            if (!parsed) {
                error = "unknown error_layout '" + layout + "'";
                return false;
            }
            updated.errorLayout = *parsed;
        }
        if (j.contains("tessdata_dir")) {
            updated.tessdataOverride = j.at("tessdata_dir").get<std::string>();
        }
        if (j.contains("language")) {
            updated.language = j.at("language").get<std::string>();
        }

        updated.settleDelay = ReadDelay(j, "settle_delay_ms", updated.settleDelay);
        updated.gateAttempts = ReadAttempts(j, "gate_attempts", updated.gateAttempts);
        updated.gateBackoff = ReadDelay(j, "gate_backoff_ms", updated.gateBackoff);
        updated.decodeAttempts = ReadAttempts(j, "decode_attempts", updated.decodeAttempts);
        updated.decodeDelay = ReadDelay(j, "decode_delay_ms", updated.decodeDelay);

        if (j.contains("image_extensions")) {
            if (!j.at("image_extensions").is_array()) {
                error = "image_extensions must be an array";
                return false;
            }
            std::vector<std::string> extensions;
            for (const auto& item : j.at("image_extensions")) {
                extensions.push_back(NormalizeExtension(item.get<std::string>()));
            }
            if (extensions.empty()) {
                error = "image_extensions must not be empty";
                return false;
            }
            updated.imageExtensions = extensions;
        }
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }

    settings = updated;
    return true;
}

} // namespace scansorter::infrastructure

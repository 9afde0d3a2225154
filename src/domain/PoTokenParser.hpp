/**
 * @file PoTokenParser.hpp
 * @brief Extracts a Purchase Order token from OCR text.
 */

#pragma once

#include <optional>
#include <string>

namespace scansorter::domain {

/**
 * @brief Stateless parser for PO tokens.
 *
 * A token is zero or more uppercase letters, the literal "PO", then one or more
 * digits. Matching is case-sensitive and the leftmost match in the text wins.
 */
class PoTokenParser {
public:
    /**
     * @brief Finds the first PO token in the text.
     * @param text Raw OCR output.
     * @return The token, or std::nullopt if the text holds none.
     */
    static std::optional<std::string> Parse(const std::string& text);
};

} // namespace scansorter::domain

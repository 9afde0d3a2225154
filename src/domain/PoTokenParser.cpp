/**
 * @file PoTokenParser.cpp
 * @brief Implementation of PoTokenParser.
 */

#include "domain/PoTokenParser.hpp"

#include <regex>

namespace scansorter::domain {

std::optional<std::string> PoTokenParser::Parse(const std::string& text) {
    static const std::regex kPoToken("[A-Z]*PO[0-9]+");

    std::smatch match;
    if (std::regex_search(text, match, kPoToken)) {
        return match.str(0);
    }
    return std::nullopt;
}

} // namespace scansorter::domain

/**
 * @file string_utils.h
 * @brief Small string helpers shared by the session and the navigator
 */

#pragma once

#include <algorithm>
#include <string>

namespace vaulthunter {

/**
 * @brief Lowercase ASCII letters, leave every other byte untouched
 *
 * Independent of the C locale. Bytes of multi-byte UTF-8 sequences are never
 * rewritten, so "Émail" lowers to "Émail" and still matches "mail".
 */
inline std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return text;
}

} // namespace vaulthunter

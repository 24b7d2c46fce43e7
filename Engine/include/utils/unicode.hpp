#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace Driftwatch {

/**
 * @brief Number of code points in a UTF-8 string.
 *
 * Matches what PostgreSQL LENGTH() reports for a UTF8 database; stray
 * continuation bytes are not counted.
 */
inline size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ) {
        uint8_t c = static_cast<uint8_t>(s[i]);
        size_t len = 0;

        if (c < 0x80) len = 1;
        else if ((c >> 5) == 0x6) len = 2;
        else if ((c >> 4) == 0xE) len = 3;
        else if ((c >> 3) == 0x1E) len = 4;
        else { ++i; continue; } // Invalid start byte

        for (size_t j = 1; j < len; ++j) {
            if (i + j >= s.size() || (static_cast<uint8_t>(s[i + j]) >> 6) != 0x2) {
                len = j;
                break;
            }
        }

        ++count;
        i += len;
    }
    return count;
}

/**
 * @brief ASCII-only lower-casing; multi-byte sequences pass through unchanged.
 */
inline std::string ascii_lower(const std::string& s) {
    std::string out = s;
    for (char& ch : out) {
        if (ch >= 'A' && ch <= 'Z') ch = static_cast<char>(ch - 'A' + 'a');
    }
    return out;
}

} // namespace Driftwatch

//
// unicode_runtime.cpp
// SvelteFormat - Unicode Runtime Library Implementation
//
// UTF-8 decoding and column width measurement.
//

#include "unicode_runtime.h"

// =============================================================================
// UTF-8 Decoding
// =============================================================================

// Get number of bytes in a UTF-8 sequence from the first byte
static inline int utf8_sequence_length(unsigned char first_byte) {
    if ((first_byte & 0x80) == 0x00) return 1;  // 0xxxxxxx
    if ((first_byte & 0xE0) == 0xC0) return 2;  // 110xxxxx
    if ((first_byte & 0xF0) == 0xE0) return 3;  // 1110xxxx
    if ((first_byte & 0xF8) == 0xF0) return 4;  // 11110xxx
    return 0; // Invalid
}

int32_t unicode_decode_utf8(const char* utf8, size_t available, int* bytes_consumed) {
    const unsigned char* s = (const unsigned char*)utf8;
    int len = utf8_sequence_length(s[0]);

    if (len == 0 || (size_t)len > available) {
        *bytes_consumed = 1;
        return 0xFFFD; // Replacement character for invalid or truncated UTF-8
    }

    for (int i = 1; i < len; i++) {
        if ((s[i] & 0xC0) != 0x80) {
            *bytes_consumed = 1;
            return 0xFFFD;
        }
    }

    int32_t codepoint = 0;

    switch (len) {
        case 1:
            codepoint = s[0];
            break;

        case 2:
            codepoint = ((s[0] & 0x1F) << 6) | (s[1] & 0x3F);
            break;

        case 3:
            codepoint = ((s[0] & 0x0F) << 12) | ((s[1] & 0x3F) << 6) | (s[2] & 0x3F);
            break;

        case 4:
            codepoint = ((s[0] & 0x07) << 18) | ((s[1] & 0x3F) << 12) |
                       ((s[2] & 0x3F) << 6) | (s[3] & 0x3F);
            break;
    }

    *bytes_consumed = len;

    // Validate codepoint range
    if (codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        return 0xFFFD;
    }

    return codepoint;
}

size_t unicode_codepoint_count(const char* utf8, size_t len) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < len) {
        int consumed = 1;
        unicode_decode_utf8(utf8 + pos, len - pos, &consumed);
        pos += consumed;
        count++;
    }
    return count;
}

// =============================================================================
// Display Width
// =============================================================================

int unicode_codepoint_width(int32_t codepoint) {
    // Zero-width: combining marks, zero width space/joiners, variation selectors
    if ((codepoint >= 0x0300 && codepoint <= 0x036F) ||
        (codepoint >= 0x1AB0 && codepoint <= 0x1AFF) ||
        (codepoint >= 0x20D0 && codepoint <= 0x20FF) ||
        (codepoint >= 0xFE20 && codepoint <= 0xFE2F) ||
        (codepoint >= 0x200B && codepoint <= 0x200F) ||
        (codepoint >= 0xFE00 && codepoint <= 0xFE0F)) {
        return 0;
    }

    // East Asian wide and fullwidth ranges
    if ((codepoint >= 0x1100 && codepoint <= 0x115F) ||   // Hangul Jamo
        (codepoint >= 0x2E80 && codepoint <= 0x303E) ||   // CJK Radicals .. CJK Symbols
        (codepoint >= 0x3041 && codepoint <= 0x33FF) ||   // Hiragana .. CJK Compatibility
        (codepoint >= 0x3400 && codepoint <= 0x4DBF) ||   // CJK Extension A
        (codepoint >= 0x4E00 && codepoint <= 0x9FFF) ||   // CJK Unified Ideographs
        (codepoint >= 0xA000 && codepoint <= 0xA4CF) ||   // Yi
        (codepoint >= 0xAC00 && codepoint <= 0xD7A3) ||   // Hangul Syllables
        (codepoint >= 0xF900 && codepoint <= 0xFAFF) ||   // CJK Compatibility Ideographs
        (codepoint >= 0xFE30 && codepoint <= 0xFE4F) ||   // CJK Compatibility Forms
        (codepoint >= 0xFF00 && codepoint <= 0xFF60) ||   // Fullwidth Forms
        (codepoint >= 0xFFE0 && codepoint <= 0xFFE6) ||
        (codepoint >= 0x1F300 && codepoint <= 0x1F64F) || // Pictographs, Emoticons
        (codepoint >= 0x1F900 && codepoint <= 0x1F9FF) || // Supplemental Symbols
        (codepoint >= 0x20000 && codepoint <= 0x3FFFD)) { // CJK Extension B..
        return 2;
    }

    return 1;
}

size_t unicode_display_width(const char* utf8, size_t len) {
    size_t width = 0;
    size_t pos = 0;

    // Fast path for ASCII runs
    while (pos < len) {
        unsigned char c = (unsigned char)utf8[pos];
        if (c < 0x80) {
            width++;
            pos++;
            continue;
        }
        int consumed = 1;
        int32_t cp = unicode_decode_utf8(utf8 + pos, len - pos, &consumed);
        width += unicode_codepoint_width(cp);
        pos += consumed;
    }

    return width;
}

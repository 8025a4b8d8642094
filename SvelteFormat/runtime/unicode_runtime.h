//
// unicode_runtime.h
// SvelteFormat - Unicode Runtime Library
//
// UTF-8 decoding helpers used to measure the display width of rendered
// text. The renderer counts columns, not bytes, so that multi-byte
// characters do not cause premature line breaks.
//

#ifndef SVELTEFORMAT_UNICODE_RUNTIME_H
#define SVELTEFORMAT_UNICODE_RUNTIME_H

#include <cstdint>
#include <cstddef>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// UTF-8 Decoding
// =============================================================================

/**
 * Decode one UTF-8 sequence
 *
 * @param utf8 Pointer to the first byte of the sequence
 * @param available Number of readable bytes starting at utf8
 * @param bytes_consumed Output parameter: bytes making up the sequence
 * @return The codepoint, or U+FFFD for malformed input
 */
int32_t unicode_decode_utf8(const char* utf8, size_t available, int* bytes_consumed);

/**
 * Count codepoints in a UTF-8 buffer
 *
 * @param utf8 Input buffer (need not be null-terminated)
 * @param len Length of the buffer in bytes
 * @return Number of codepoints (malformed bytes count as one each)
 */
size_t unicode_codepoint_count(const char* utf8, size_t len);

// =============================================================================
// Display Width
// =============================================================================

/**
 * Column width of a single codepoint
 * Combining marks and zero-width characters are 0, East Asian wide and
 * fullwidth characters are 2, everything else is 1.
 */
int unicode_codepoint_width(int32_t codepoint);

/**
 * Column width of a UTF-8 buffer
 *
 * @param utf8 Input buffer (need not be null-terminated)
 * @param len Length of the buffer in bytes
 * @return Sum of unicode_codepoint_width over every codepoint
 */
size_t unicode_display_width(const char* utf8, size_t len);

#ifdef __cplusplus
}
#endif

#endif // SVELTEFORMAT_UNICODE_RUNTIME_H

//
// base64_codec.h
// SvelteFormat - Base64 Codec
//
// Reversible text encoding for snipped embedded regions. The alphabet
// contains no quotes, angle brackets or whitespace, so an encoded body can
// sit inside a double-quoted attribute value without disturbing the markup.
//

#ifndef SVELTEFORMAT_BASE64_CODEC_H
#define SVELTEFORMAT_BASE64_CODEC_H

#include <string>

namespace SvelteFormat {

// Encode arbitrary bytes (standard alphabet, '=' padded)
std::string base64Encode(const std::string& bytes);

// Decode a padded or unpadded base64 string
// Returns false (leaving out untouched) on characters outside the alphabet
// or on a truncated final quantum
bool base64Decode(const std::string& encoded, std::string& out);

} // namespace SvelteFormat

#endif // SVELTEFORMAT_BASE64_CODEC_H

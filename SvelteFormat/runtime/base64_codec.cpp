//
// base64_codec.cpp
// SvelteFormat - Base64 Codec Implementation
//

#include "base64_codec.h"
#include <cstdint>

namespace SvelteFormat {

static const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Map an alphabet character back to its 6-bit value, -1 if not in alphabet
static int decodeChar(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string base64Encode(const std::string& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < bytes.size()) {
        uint32_t triple = ((uint32_t)(unsigned char)bytes[i] << 16) |
                          ((uint32_t)(unsigned char)bytes[i + 1] << 8) |
                          (uint32_t)(unsigned char)bytes[i + 2];
        out += kAlphabet[(triple >> 18) & 0x3F];
        out += kAlphabet[(triple >> 12) & 0x3F];
        out += kAlphabet[(triple >> 6) & 0x3F];
        out += kAlphabet[triple & 0x3F];
        i += 3;
    }

    size_t remaining = bytes.size() - i;
    if (remaining == 1) {
        uint32_t triple = (uint32_t)(unsigned char)bytes[i] << 16;
        out += kAlphabet[(triple >> 18) & 0x3F];
        out += kAlphabet[(triple >> 12) & 0x3F];
        out += "==";
    } else if (remaining == 2) {
        uint32_t triple = ((uint32_t)(unsigned char)bytes[i] << 16) |
                          ((uint32_t)(unsigned char)bytes[i + 1] << 8);
        out += kAlphabet[(triple >> 18) & 0x3F];
        out += kAlphabet[(triple >> 12) & 0x3F];
        out += kAlphabet[(triple >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

bool base64Decode(const std::string& encoded, std::string& out) {
    std::string decoded;
    decoded.reserve((encoded.size() / 4) * 3);

    uint32_t buffer = 0;
    int bits = 0;
    size_t significant = 0;

    for (size_t i = 0; i < encoded.size(); i++) {
        unsigned char c = (unsigned char)encoded[i];
        if (c == '=') {
            // Padding may only appear at the end
            for (size_t j = i; j < encoded.size(); j++) {
                if (encoded[j] != '=') {
                    return false;
                }
            }
            break;
        }

        int value = decodeChar(c);
        if (value < 0) {
            return false;
        }

        buffer = (buffer << 6) | (uint32_t)value;
        bits += 6;
        significant++;

        if (bits >= 8) {
            bits -= 8;
            decoded += (char)((buffer >> bits) & 0xFF);
        }
    }

    // A single leftover character cannot encode a full byte
    if (significant % 4 == 1) {
        return false;
    }

    out = decoded;
    return true;
}

} // namespace SvelteFormat

//
// svelteformat_snip.cpp
// SvelteFormat - Embedded Region Codec Implementation
//

#include "svelteformat_snip.h"
#include "svelteformat_embed.h"
#include "../runtime/base64_codec.h"
#include <cstring>

namespace SvelteFormat {

const char* const SNIPPED_CONTENT_ATTRIBUTE = "\xE2\x9C\x82sveltefmt:content\xE2\x9C\x82";

static bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static bool isWordChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

// Position of the next "<tagName" followed by whitespace, '>' or '/'
static size_t findOpenTag(const std::string& source, const std::string& tagName, size_t from) {
    std::string open = "<" + tagName;
    size_t pos = source.find(open, from);
    while (pos != std::string::npos) {
        size_t after = pos + open.size();
        if (after < source.size() &&
            (isSpace(source[after]) || source[after] == '>' || source[after] == '/')) {
            return pos;
        }
        pos = source.find(open, pos + 1);
    }
    return std::string::npos;
}

// =============================================================================
// Offset Mapping
// =============================================================================

void OffsetMap::addCopied(size_t outStart, size_t inStart, size_t length) {
    if (length > 0) {
        m_segments.push_back({outStart, length, inStart, length, true});
    }
}

void OffsetMap::addReplaced(size_t outStart, size_t outLength, size_t inStart, size_t inLength) {
    if (outLength > 0 || inLength > 0) {
        m_segments.push_back({outStart, outLength, inStart, inLength, false});
    }
}

size_t OffsetMap::toInput(size_t offset) const {
    if (m_segments.empty()) {
        return offset;
    }

    // Segments are contiguous and ordered by output position
    const Segment* segment = &m_segments.front();
    for (const auto& candidate : m_segments) {
        if (candidate.outStart > offset) {
            break;
        }
        segment = &candidate;
    }

    size_t into = offset > segment->outStart ? offset - segment->outStart : 0;
    if (into >= segment->outLength) {
        return segment->inStart + segment->inLength + (into - segment->outLength);
    }
    return segment->copied ? segment->inStart + into : segment->inStart;
}

size_t PreprocessedSource::toOriginal(size_t offset) const {
    return styles.toInput(scripts.toInput(offset + trimmed));
}

// =============================================================================
// Snipping
// =============================================================================

std::string snipTagContent(const std::string& tagName, const std::string& source,
                           const std::string& placeholder, OffsetMap* offsets) {
    std::string out;
    std::string closeTag = "</" + tagName + ">";
    size_t i = 0;

    while (true) {
        size_t open = findOpenTag(source, tagName, i);
        if (open == std::string::npos) {
            break;
        }

        size_t attrsStart = open + 1 + tagName.size();
        size_t attrsEnd = source.find('>', attrsStart);
        if (attrsEnd == std::string::npos) {
            break;
        }

        // <script src="..."/> has no body to snip
        if (source[attrsEnd - 1] == '/') {
            if (offsets) {
                offsets->addCopied(out.size(), i, attrsEnd + 1 - i);
            }
            out.append(source, i, attrsEnd + 1 - i);
            i = attrsEnd + 1;
            continue;
        }

        size_t close = source.find(closeTag, attrsEnd + 1);
        if (close == std::string::npos) {
            break;
        }

        size_t leading = open;
        while (leading > i && isSpace(source[leading - 1])) {
            leading--;
        }
        if (offsets) {
            offsets->addCopied(out.size(), i, leading - i);
        }
        out.append(source, i, leading - i);

        std::string attributes = source.substr(attrsStart, attrsEnd - attrsStart);
        std::string content = source.substr(attrsEnd + 1, close - attrsEnd - 1);

        // The start tag up to its '>' is carried over unchanged
        size_t tagStart = out.size();
        out += "<" + tagName + attributes;
        size_t synthesizedStart = out.size();
        out += std::string(" ") + SNIPPED_CONTENT_ATTRIBUTE + "=\"" +
               base64Encode(content) + "\">" + placeholder + closeTag;

        i = close + closeTag.size();
        while (i < source.size() && isSpace(source[i])) {
            i++;
        }

        if (offsets) {
            offsets->addCopied(tagStart, open, attrsEnd - open);
            offsets->addReplaced(synthesizedStart, out.size() - synthesizedStart, attrsEnd, i - attrsEnd);
        }
    }

    if (offsets) {
        offsets->addCopied(out.size(), i, source.size() - i);
    }
    out.append(source, i, std::string::npos);
    return out;
}

PreprocessedSource preprocessSource(const std::string& text) {
    PreprocessedSource result;
    std::string snipped = snipTagContent("style", text, "", &result.styles);
    snipped = snipTagContent("script", snipped, "{}", &result.scripts);

    size_t first = 0;
    while (first < snipped.size() && isSpace(snipped[first])) {
        first++;
    }
    size_t last = snipped.size();
    while (last > first && isSpace(snipped[last - 1])) {
        last--;
    }
    result.text = snipped.substr(first, last - first);
    result.trimmed = first;
    return result;
}

std::string preprocess(const std::string& text) {
    return preprocessSource(text).text;
}

bool hasSnippedContent(const std::string& text) {
    return text.find(SNIPPED_CONTENT_ATTRIBUTE) != std::string::npos;
}

std::string unsnipContent(const std::string& text) {
    const size_t markerLen = std::strlen(SNIPPED_CONTENT_ATTRIBUTE);
    std::string out;
    size_t i = 0;
    size_t search = 0;

    while (true) {
        size_t marker = text.find(SNIPPED_CONTENT_ATTRIBUTE, search);
        if (marker == std::string::npos) {
            break;
        }
        search = marker + markerLen;

        // ="payload">body</
        size_t valueStart = marker + markerLen;
        if (text.compare(valueStart, 2, "=\"") != 0) {
            continue;
        }
        size_t valueEnd = text.find("\">", valueStart + 2);
        if (valueEnd == std::string::npos) {
            continue;
        }
        std::string payload = text.substr(valueStart + 2, valueEnd - valueStart - 2);
        size_t bodyStart = valueEnd + 2;
        size_t bodyEnd = text.find("</", bodyStart);
        if (bodyEnd == std::string::npos ||
            text.find('\n', bodyStart) < bodyEnd ||
            payload.find('\n') != std::string::npos) {
            continue;
        }

        // The whitespace before the marker goes too; the tag it belongs to
        // must open on the same line
        size_t tagEnd = marker;
        while (tagEnd > i && isSpace(text[tagEnd - 1])) {
            tagEnd--;
        }
        size_t lineStart = text.rfind('\n', tagEnd == 0 ? 0 : tagEnd - 1);
        lineStart = lineStart == std::string::npos ? 0 : lineStart + 1;
        if (lineStart < i) {
            lineStart = i;
        }
        bool hasOpenTag = false;
        for (size_t p = lineStart; p + 1 < tagEnd; p++) {
            if (text[p] == '<' && isWordChar(text[p + 1])) {
                hasOpenTag = true;
                break;
            }
        }
        if (!hasOpenTag) {
            continue;
        }

        std::string decoded;
        if (!base64Decode(payload, decoded)) {
            continue;
        }

        out.append(text, i, tagEnd - i);
        out += ">";
        out += decoded;
        i = bodyEnd;
        search = bodyEnd;
    }

    out.append(text, i, std::string::npos);
    return out;
}

std::string getSnippedContent(const EmbeddedBlockNode& node) {
    const std::string* encoded = node.getAttributeText(SNIPPED_CONTENT_ATTRIBUTE);
    if (!encoded || encoded->empty()) {
        return "";
    }
    std::string decoded;
    if (!base64Decode(*encoded, decoded)) {
        throw EmbedError("Corrupt snipped content in <" + node.name + "> block");
    }
    return decoded;
}

bool isSnippedContentAttribute(const ASTNode& attribute) {
    return attribute.getType() == NodeType::ATTRIBUTE &&
           static_cast<const AttributeNode&>(attribute).name == SNIPPED_CONTENT_ATTRIBUTE;
}

} // namespace SvelteFormat

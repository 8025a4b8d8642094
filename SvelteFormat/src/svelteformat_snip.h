//
// svelteformat_snip.h
// SvelteFormat - Embedded Region Codec
//
// Before parsing, the body of every <style> and <script> region is cut out
// and carried in a marker attribute as base64, leaving a placeholder body
// the markup parser can balance without understanding the sublanguage.
// All offsets downstream refer to the preprocessed text; PreprocessedSource
// maps them back to the original source.
//

#ifndef SVELTEFORMAT_SNIP_H
#define SVELTEFORMAT_SNIP_H

#include "svelteformat_ast.h"
#include <string>
#include <vector>

namespace SvelteFormat {

// Marker attribute carrying the encoded body
extern const char* const SNIPPED_CONTENT_ATTRIBUTE;

// Maps offsets in rewritten text back to the text it was produced from.
// Copied runs map one to one; an offset inside a synthesized run maps to
// the start of the input it replaced.
class OffsetMap {
public:
    void addCopied(size_t outStart, size_t inStart, size_t length);
    void addReplaced(size_t outStart, size_t outLength, size_t inStart, size_t inLength);

    size_t toInput(size_t offset) const;

private:
    struct Segment {
        size_t outStart;
        size_t outLength;
        size_t inStart;
        size_t inLength;
        bool copied;
    };
    std::vector<Segment> m_segments;
};

// Replace the body of every <tagName ...>body</tagName> region with
// placeholder, recording the body in the marker attribute. Whitespace
// directly around each region is removed.
std::string snipTagContent(const std::string& tagName, const std::string& source,
                           const std::string& placeholder = "", OffsetMap* offsets = nullptr);

struct PreprocessedSource {
    std::string text;
    OffsetMap styles;     // original -> styles snipped
    OffsetMap scripts;    // styles snipped -> scripts snipped
    size_t trimmed;       // leading whitespace removed last

    PreprocessedSource() : trimmed(0) {}

    // Offset in the original source of an offset in text
    size_t toOriginal(size_t offset) const;
};

// Snip styles (empty placeholder) and scripts ("{}"), then trim the text
PreprocessedSource preprocessSource(const std::string& text);
std::string preprocess(const std::string& text);

// True if text contains a snipped region
bool hasSnippedContent(const std::string& text);

// Reverse snipTagContent on a piece of preprocessed text: every marker is
// replaced by the decoded body
std::string unsnipContent(const std::string& text);

// Decoded body of a snipped script/style node; empty if the node carries
// no marker. Throws EmbedError on a corrupt payload.
std::string getSnippedContent(const EmbeddedBlockNode& node);

// True for the marker attribute itself
bool isSnippedContentAttribute(const ASTNode& attribute);

} // namespace SvelteFormat

#endif // SVELTEFORMAT_SNIP_H

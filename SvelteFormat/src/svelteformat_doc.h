//
// svelteformat_doc.h
// SvelteFormat - Document Intermediate Representation
//
// The layout algebra produced by the printer and consumed by the renderer.
// A Doc is an immutable value: builders return new nodes and nothing
// downstream ever mutates one. Subtrees may be shared freely.
//

#ifndef SVELTEFORMAT_DOC_H
#define SVELTEFORMAT_DOC_H

#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace SvelteFormat {

// =============================================================================
// Document Node Types
// =============================================================================

enum class DocType {
    TEXT,           // Literal string
    CONCAT,         // Ordered sequence
    INDENT,         // Contents one level deeper
    DEDENT,         // Contents one level shallower
    GROUP,          // Contents rendered fully flat or fully broken
    LINE,           // Line break opportunity (see LineMode)
    FILL,           // Alternating content/separator, each pair breaks independently
    BREAK_PARENT    // Forces every enclosing group broken
};

enum class LineMode {
    SOFT,      // nothing when flat, newline when broken
    NORMAL,    // space when flat, newline when broken
    HARD,      // always a newline
    LITERAL    // always a raw newline, indentation is not re-applied
};

class DocNode;
using Doc = std::shared_ptr<const DocNode>;

class DocNode {
public:
    DocType type;
    std::string text;          // TEXT
    std::vector<Doc> parts;    // CONCAT, FILL
    Doc contents;              // INDENT, DEDENT, GROUP
    LineMode lineMode;         // LINE
    bool keepIfLonely;         // LINE: encodes an author blank line

    explicit DocNode(DocType t)
        : type(t), lineMode(LineMode::NORMAL), keepIfLonely(false) {}
};

// =============================================================================
// Builders
// =============================================================================

namespace DocBuilders {

Doc text(const std::string& s);
Doc concat(const std::vector<Doc>& parts);
Doc indent(const Doc& contents);
Doc dedent(const Doc& contents);
Doc group(const Doc& contents);
Doc fill(const std::vector<Doc>& parts);
Doc breakParent();

Doc line();                               // space or newline
Doc softline();                           // nothing or newline
Doc hardline();                           // newline, breaks enclosing groups
Doc literalline();                        // raw newline, breaks enclosing groups
Doc lineWithMode(LineMode mode, bool keepIfLonely);

// Line produced by whitespace-only text: a normal line that may carry the
// "keep if lonely" mark when the text held a blank line
Doc whitespaceLine(bool keepIfLonely);

// Hard line marked "keep if lonely", used for blank lines at the edge of
// text. Renders as an empty line and breaks its enclosing groups.
Doc keepIfLonelyLine();

// Interleave separator between docs
Doc join(const Doc& separator, const std::vector<Doc>& docs);
std::vector<Doc> joinParts(const Doc& separator, const std::vector<Doc>& docs);

} // namespace DocBuilders

// =============================================================================
// Inspection Utilities
// =============================================================================

using DocPredicate = std::function<bool(const Doc&)>;

bool isLine(const Doc& doc);
bool isLineDiscardedIfLonely(const Doc& doc);

// True if the doc renders nothing: empty strings, discardable lines,
// or containers holding only those
bool isEmptyDoc(const Doc& doc);
bool isEmptyGroup(const std::vector<Doc>& docs);

// Parts of a CONCAT or FILL, nullptr for every other type
const std::vector<Doc>* getParts(const Doc& doc);

// Copy of a CONCAT or FILL with its parts replaced
Doc withParts(const Doc& doc, const std::vector<Doc>& parts);

// =============================================================================
// Trimming
// =============================================================================

// Result of a trim: the surviving sequence and the removed docs
struct TrimResult {
    std::vector<Doc> docs;
    std::vector<Doc> removed;

    bool trimmed() const { return !removed.empty(); }
};

// Remove leading docs matching isWhitespace. When the first doc does not
// match, descend into it if it is a CONCAT or FILL (rebuilding it) so that
// nested leading whitespace is trimmed as well. The input is not modified.
TrimResult trimLeft(const std::vector<Doc>& docs, const DocPredicate& isWhitespace);

// Mirror of trimLeft for the trailing end
TrimResult trimRight(const std::vector<Doc>& docs, const DocPredicate& isWhitespace);

// trimLeft followed by trimRight, returning only the surviving docs
std::vector<Doc> trim(const std::vector<Doc>& docs, const DocPredicate& isWhitespace);

// Debug dump in builder notation
std::string docToString(const Doc& doc);

} // namespace SvelteFormat

#endif // SVELTEFORMAT_DOC_H

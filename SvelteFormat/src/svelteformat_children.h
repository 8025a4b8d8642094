//
// svelteformat_children.h
// SvelteFormat - Child Flattening
//
// Turns the printed docs of a run of sibling nodes into one ordered doc
// sequence. Inline siblings are batched into a FILL so running text wraps
// word by word; a line break is only made possible where the nodes on both
// sides allow one, and everything between two legal break points is glued
// into a single unit.
//

#ifndef SVELTEFORMAT_CHILDREN_H
#define SVELTEFORMAT_CHILDREN_H

#include "svelteformat_ast.h"
#include "svelteformat_doc.h"
#include <vector>
#include <string>

namespace SvelteFormat {

// =============================================================================
// Node Classification
// =============================================================================

// Plain element whose tag is on the inline-element list
bool isInlineElement(const ASTNode& node);

// Non-whitespace text, expression tags, control-flow blocks and inline
// elements; everything else is a block node
bool isInlineNode(const ASTNode& node);

// Whitespace-only text
bool isEmptyNode(const ASTNode& node);

// Whether a line break may be inserted directly before/after the node
// without changing rendered whitespace
bool canBreakBefore(const ASTNode& node);
bool canBreakAfter(const ASTNode& node);

// =============================================================================
// Doc Sequence Helpers
// =============================================================================

// Split text into words joined by lines. A run of two or more newlines at
// either end becomes a keep-if-lonely hard line.
std::vector<Doc> splitTextToDocs(const std::string& text);

// Move a trailing line into a dedent so the closing tag lines up with the
// opening one, without adding whitespace the source did not have
std::vector<Doc> dedentFinalNewline(const std::vector<Doc>& docs);

// Lift leading and trailing lines (at any nesting depth) out to the top
// level, with the remaining docs wrapped in a FILL
std::vector<Doc> extractOutermostNewlines(const std::vector<Doc>& docs);

// =============================================================================
// ChildFlattener
// =============================================================================

class ChildFlattener {
public:
    // Preformatted content is emitted as is, without break bookkeeping
    explicit ChildFlattener(bool preformatted);

    // Add the next sibling and its printed doc
    void add(const ASTNode& node, const Doc& doc);

    // Flush the pending inline run and return the flattened sequence
    std::vector<Doc> finish();

private:
    struct PendingChild {
        const ASTNode* node;
        Doc doc;
    };

    void flush();
    void outputChildDoc(const Doc& doc, const std::vector<const ASTNode*>& fromNodes);
    void linebreakPossible();

    bool m_preformatted;
    std::vector<Doc> m_childDocs;
    std::vector<PendingChild> m_currentGroup;
    int m_lastBreakIndex;    // first doc of the unbreakable tail, -1 if none
};

} // namespace SvelteFormat

#endif // SVELTEFORMAT_CHILDREN_H

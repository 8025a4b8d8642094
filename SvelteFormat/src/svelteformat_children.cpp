//
// svelteformat_children.cpp
// SvelteFormat - Child Flattening Implementation
//

#include "svelteformat_children.h"

namespace SvelteFormat {

using namespace DocBuilders;

static bool isWhitespaceChar(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// =============================================================================
// Node Classification
// =============================================================================

bool isInlineElement(const ASTNode& node) {
    return node.getType() == NodeType::ELEMENT &&
           isInlineElementName(static_cast<const ElementNode&>(node).name);
}

bool isInlineNode(const ASTNode& node) {
    switch (node.getType()) {
        case NodeType::TEXT: {
            const TextNode& text = static_cast<const TextNode&>(node);
            return !text.isWhitespace() || text.raw.empty();
        }
        case NodeType::MUSTACHE_TAG:
        case NodeType::RAW_MUSTACHE_TAG:
        case NodeType::IF_BLOCK:
        case NodeType::EACH_BLOCK:
        case NodeType::AWAIT_BLOCK:
            return true;
        case NodeType::ELEMENT:
            return isInlineElement(node);
        default:
            return false;
    }
}

bool isEmptyNode(const ASTNode& node) {
    return node.getType() == NodeType::TEXT &&
           static_cast<const TextNode&>(node).isWhitespace();
}

bool canBreakBefore(const ASTNode& node) {
    switch (node.getType()) {
        case NodeType::TEXT: {
            const std::string& raw = static_cast<const TextNode&>(node).raw;
            return !raw.empty() && isWhitespaceChar(raw.front());
        }
        case NodeType::ELEMENT:
            return !isInlineElement(node);
        default:
            return true;
    }
}

bool canBreakAfter(const ASTNode& node) {
    switch (node.getType()) {
        case NodeType::TEXT: {
            const std::string& raw = static_cast<const TextNode&>(node).raw;
            return !raw.empty() && isWhitespaceChar(raw.back());
        }
        case NodeType::ELEMENT:
            return !isInlineElement(node);
        default:
            return true;
    }
}

// =============================================================================
// Doc Sequence Helpers
// =============================================================================

// Text opens with two newlines, each optionally preceded by blanks
static bool startsWithBlankLine(const std::string& text) {
    int newlines = 0;
    for (char c : text) {
        if (c == '\n') {
            if (++newlines == 2) {
                return true;
            }
        } else if (c != ' ' && c != '\t' && c != '\f' && c != '\r') {
            return false;
        }
    }
    return false;
}

// Text closes with two newlines, each optionally followed by blanks
static bool endsWithBlankLine(const std::string& text) {
    int newlines = 0;
    for (size_t i = text.size(); i > 0; i--) {
        char c = text[i - 1];
        if (c == '\n') {
            if (++newlines == 2) {
                return true;
            }
        } else if (c != ' ' && c != '\t' && c != '\f' && c != '\r') {
            return false;
        }
    }
    return false;
}

std::vector<Doc> splitTextToDocs(const std::string& text) {
    std::vector<Doc> docs;
    size_t i = 0;
    bool pendingLine = false;

    while (i < text.size()) {
        char c = text[i];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r') {
            pendingLine = true;
            i++;
            continue;
        }

        size_t wordStart = i;
        while (i < text.size() && text[i] != ' ' && text[i] != '\t' && text[i] != '\n' &&
               text[i] != '\f' && text[i] != '\r') {
            i++;
        }
        if (pendingLine) {
            docs.push_back(line());
            pendingLine = false;
        }
        docs.push_back(DocBuilders::text(text.substr(wordStart, i - wordStart)));
    }
    if (pendingLine) {
        docs.push_back(line());
    }

    if (docs.empty()) {
        return docs;
    }
    if (startsWithBlankLine(text)) {
        docs.front() = keepIfLonelyLine();
    }
    if (endsWithBlankLine(text)) {
        docs.back() = keepIfLonelyLine();
    }
    return docs;
}

std::vector<Doc> dedentFinalNewline(const std::vector<Doc>& docs) {
    TrimResult trimmed = trimRight(docs, isLine);
    if (!trimmed.trimmed()) {
        return docs;
    }
    std::vector<Doc> result = trimmed.docs;
    result.push_back(dedent(trimmed.removed.back()));
    return result;
}

std::vector<Doc> extractOutermostNewlines(const std::vector<Doc>& docs) {
    TrimResult leading = trimLeft(docs, isLine);
    TrimResult trailing = trimRight(leading.docs, isLine);

    std::vector<Doc> result = leading.removed;
    if (!isEmptyGroup(trailing.docs)) {
        result.push_back(fill(trailing.docs));
    }
    result.insert(result.end(), trailing.removed.begin(), trailing.removed.end());
    return result;
}

// =============================================================================
// ChildFlattener
// =============================================================================

ChildFlattener::ChildFlattener(bool preformatted)
    : m_preformatted(preformatted)
    , m_lastBreakIndex(-1)
{
}

void ChildFlattener::linebreakPossible() {
    int size = static_cast<int>(m_childDocs.size());
    if (m_lastBreakIndex >= 0 && m_lastBreakIndex < size - 1) {
        std::vector<Doc> tail(m_childDocs.begin() + m_lastBreakIndex, m_childDocs.end());
        m_childDocs.resize(m_lastBreakIndex);
        m_childDocs.push_back(concat(tail));
    }
    m_lastBreakIndex = -1;
}

void ChildFlattener::outputChildDoc(const Doc& doc, const std::vector<const ASTNode*>& fromNodes) {
    if (!m_preformatted) {
        if (!doc || canBreakBefore(*fromNodes.front())) {
            linebreakPossible();
            // Separate children by softlines unless they are lines already;
            // keep-if-lonely lines are blank lines and may follow a break.
            // A hard one renders its own blank line
            if (doc && !isLineDiscardedIfLonely(doc) && doc->lineMode != LineMode::HARD &&
                !m_childDocs.empty() && !isLine(m_childDocs.back())) {
                m_childDocs.push_back(softline());
            }
        }
        if (m_lastBreakIndex < 0 && doc && !canBreakAfter(*fromNodes.back())) {
            m_lastBreakIndex = static_cast<int>(m_childDocs.size());
        }
    }
    if (doc) {
        m_childDocs.push_back(doc);
    }
}

void ChildFlattener::flush() {
    std::vector<Doc> groupDocs;
    std::vector<const ASTNode*> groupNodes;
    for (const auto& child : m_currentGroup) {
        groupDocs.push_back(child.doc);
        groupNodes.push_back(child.node);
    }
    for (const auto& doc : extractOutermostNewlines(groupDocs)) {
        outputChildDoc(doc, groupNodes);
    }
    m_currentGroup.clear();
}

void ChildFlattener::add(const ASTNode& node, const Doc& doc) {
    if (isInlineNode(node)) {
        m_currentGroup.push_back({&node, doc});
        return;
    }

    flush();
    outputChildDoc(isLine(doc) ? doc : concat({breakParent(), doc}), {&node});
}

std::vector<Doc> ChildFlattener::finish() {
    flush();
    // Line breaks are fine after the last child
    outputChildDoc(nullptr, {});
    return m_childDocs;
}

} // namespace SvelteFormat

//
// svelteformat_doc.cpp
// SvelteFormat - Document IR Implementation
//

#include "svelteformat_doc.h"
#include <sstream>

namespace SvelteFormat {

namespace DocBuilders {

Doc text(const std::string& s) {
    auto node = std::make_shared<DocNode>(DocType::TEXT);
    node->text = s;
    return node;
}

Doc concat(const std::vector<Doc>& parts) {
    auto node = std::make_shared<DocNode>(DocType::CONCAT);
    node->parts = parts;
    return node;
}

Doc indent(const Doc& contents) {
    auto node = std::make_shared<DocNode>(DocType::INDENT);
    node->contents = contents;
    return node;
}

Doc dedent(const Doc& contents) {
    auto node = std::make_shared<DocNode>(DocType::DEDENT);
    node->contents = contents;
    return node;
}

Doc group(const Doc& contents) {
    auto node = std::make_shared<DocNode>(DocType::GROUP);
    node->contents = contents;
    return node;
}

Doc fill(const std::vector<Doc>& parts) {
    auto node = std::make_shared<DocNode>(DocType::FILL);
    node->parts = parts;
    return node;
}

Doc breakParent() {
    static const Doc instance = std::make_shared<DocNode>(DocType::BREAK_PARENT);
    return instance;
}

Doc lineWithMode(LineMode mode, bool keepIfLonely) {
    auto node = std::make_shared<DocNode>(DocType::LINE);
    node->lineMode = mode;
    node->keepIfLonely = keepIfLonely;
    return node;
}

Doc line() {
    static const Doc instance = lineWithMode(LineMode::NORMAL, false);
    return instance;
}

Doc softline() {
    static const Doc instance = lineWithMode(LineMode::SOFT, false);
    return instance;
}

Doc hardline() {
    static const Doc instance = concat({lineWithMode(LineMode::HARD, false), breakParent()});
    return instance;
}

Doc literalline() {
    static const Doc instance = concat({lineWithMode(LineMode::LITERAL, false), breakParent()});
    return instance;
}

Doc whitespaceLine(bool keepIfLonely) {
    return keepIfLonely ? lineWithMode(LineMode::NORMAL, true) : line();
}

Doc keepIfLonelyLine() {
    static const Doc instance = lineWithMode(LineMode::HARD, true);
    return instance;
}

std::vector<Doc> joinParts(const Doc& separator, const std::vector<Doc>& docs) {
    std::vector<Doc> parts;
    for (size_t i = 0; i < docs.size(); i++) {
        if (i > 0) {
            parts.push_back(separator);
        }
        parts.push_back(docs[i]);
    }
    return parts;
}

Doc join(const Doc& separator, const std::vector<Doc>& docs) {
    return concat(joinParts(separator, docs));
}

} // namespace DocBuilders

// =============================================================================
// Inspection Utilities
// =============================================================================

bool isLine(const Doc& doc) {
    return doc && doc->type == DocType::LINE;
}

bool isLineDiscardedIfLonely(const Doc& doc) {
    return isLine(doc) && !doc->keepIfLonely;
}

bool isEmptyDoc(const Doc& doc) {
    if (!doc) {
        return true;
    }
    switch (doc->type) {
        case DocType::TEXT:
            return doc->text.empty();
        case DocType::LINE:
            return !doc->keepIfLonely;
        case DocType::INDENT:
        case DocType::DEDENT:
        case DocType::GROUP:
            return isEmptyDoc(doc->contents);
        case DocType::CONCAT:
        case DocType::FILL:
            return isEmptyGroup(doc->parts);
        case DocType::BREAK_PARENT:
            return false;
    }
    return false;
}

bool isEmptyGroup(const std::vector<Doc>& docs) {
    for (const auto& doc : docs) {
        if (!isEmptyDoc(doc)) {
            return false;
        }
    }
    return true;
}

const std::vector<Doc>* getParts(const Doc& doc) {
    if (doc && (doc->type == DocType::CONCAT || doc->type == DocType::FILL)) {
        return &doc->parts;
    }
    return nullptr;
}

Doc withParts(const Doc& doc, const std::vector<Doc>& parts) {
    if (doc->type == DocType::FILL) {
        return DocBuilders::fill(parts);
    }
    return DocBuilders::concat(parts);
}

// =============================================================================
// Trimming
// =============================================================================

TrimResult trimLeft(const std::vector<Doc>& docs, const DocPredicate& isWhitespace) {
    TrimResult result;

    size_t firstNonWhitespace = 0;
    while (firstNonWhitespace < docs.size() && isWhitespace(docs[firstNonWhitespace])) {
        firstNonWhitespace++;
    }

    if (firstNonWhitespace > 0) {
        result.removed.assign(docs.begin(), docs.begin() + firstNonWhitespace);
        result.docs.assign(docs.begin() + firstNonWhitespace, docs.end());
        return result;
    }

    result.docs = docs;
    if (docs.empty()) {
        return result;
    }

    const std::vector<Doc>* parts = getParts(docs.front());
    if (parts) {
        TrimResult inner = trimLeft(*parts, isWhitespace);
        if (inner.trimmed()) {
            result.docs.front() = withParts(docs.front(), inner.docs);
            result.removed = inner.removed;
        }
    }
    return result;
}

TrimResult trimRight(const std::vector<Doc>& docs, const DocPredicate& isWhitespace) {
    TrimResult result;

    size_t keep = docs.size();
    while (keep > 0 && isWhitespace(docs[keep - 1])) {
        keep--;
    }

    if (keep < docs.size()) {
        result.docs.assign(docs.begin(), docs.begin() + keep);
        result.removed.assign(docs.begin() + keep, docs.end());
        return result;
    }

    result.docs = docs;
    if (docs.empty()) {
        return result;
    }

    const std::vector<Doc>* parts = getParts(docs.back());
    if (parts) {
        TrimResult inner = trimRight(*parts, isWhitespace);
        if (inner.trimmed()) {
            result.docs.back() = withParts(docs.back(), inner.docs);
            result.removed = inner.removed;
        }
    }
    return result;
}

std::vector<Doc> trim(const std::vector<Doc>& docs, const DocPredicate& isWhitespace) {
    return trimRight(trimLeft(docs, isWhitespace).docs, isWhitespace).docs;
}

// =============================================================================
// Debug Output
// =============================================================================

static void appendDoc(std::ostringstream& oss, const Doc& doc) {
    if (!doc) {
        oss << "null";
        return;
    }
    switch (doc->type) {
        case DocType::TEXT:
            oss << '"';
            for (char c : doc->text) {
                if (c == '\n') oss << "\\n";
                else if (c == '"') oss << "\\\"";
                else oss << c;
            }
            oss << '"';
            break;
        case DocType::CONCAT:
        case DocType::FILL:
            oss << (doc->type == DocType::FILL ? "fill([" : "concat([");
            for (size_t i = 0; i < doc->parts.size(); i++) {
                if (i > 0) oss << ", ";
                appendDoc(oss, doc->parts[i]);
            }
            oss << "])";
            break;
        case DocType::INDENT:
            oss << "indent(";
            appendDoc(oss, doc->contents);
            oss << ")";
            break;
        case DocType::DEDENT:
            oss << "dedent(";
            appendDoc(oss, doc->contents);
            oss << ")";
            break;
        case DocType::GROUP:
            oss << "group(";
            appendDoc(oss, doc->contents);
            oss << ")";
            break;
        case DocType::LINE:
            switch (doc->lineMode) {
                case LineMode::SOFT: oss << "softline"; break;
                case LineMode::NORMAL: oss << "line"; break;
                case LineMode::HARD: oss << "hardline"; break;
                case LineMode::LITERAL: oss << "literalline"; break;
            }
            if (doc->keepIfLonely) oss << "(keepIfLonely)";
            break;
        case DocType::BREAK_PARENT:
            oss << "breakParent";
            break;
    }
}

std::string docToString(const Doc& doc) {
    std::ostringstream oss;
    appendDoc(oss, doc);
    return oss.str();
}

} // namespace SvelteFormat

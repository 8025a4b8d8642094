//
// svelteformat_parser.h
// SvelteFormat - Parser
//
// Recursive descent parser that converts component markup into an Abstract
// Syntax Tree (AST). Expressions are not parsed; the scanner only finds
// where each one ends, honouring nesting, string and template literals.
//

#ifndef SVELTEFORMAT_PARSER_H
#define SVELTEFORMAT_PARSER_H

#include "svelteformat_ast.h"

#include <vector>
#include <memory>
#include <string>
#include <stdexcept>
#include <functional>

namespace SvelteFormat {

// =============================================================================
// Parse Error
// =============================================================================

class ParseError : public std::runtime_error {
public:
    size_t start;
    size_t end;

    ParseError(const std::string& msg, size_t s, size_t e)
        : std::runtime_error(msg), start(s), end(e) {}

    // "Parse Error at line:column: message" with a 1-based position
    std::string toString(const std::string& source) const;
};

// 1-based line and column of a byte offset
struct SourcePosition {
    int line;
    int column;

    SourcePosition() : line(1), column(1) {}
};

SourcePosition offsetToPosition(const std::string& source, size_t offset);

// =============================================================================
// Expression Scanning
// =============================================================================

// Called for every top-level character; returning true stops the scan
using ScanStop = std::function<bool(const std::string& text, size_t pos)>;

// Scan text from `from`, skipping string literals, template literals,
// comments and bracketed groups, and return the first top-level position
// where stop() is true. Returns std::string::npos if none is found or a
// literal is left open.
size_t scanTopLevel(const std::string& text, size_t from, const ScanStop& stop);

// Start of the first top-level occurrence of keyword as a whole word
// preceded by whitespace, or std::string::npos
size_t findTopLevelKeyword(const std::string& text, const std::string& keyword);

// =============================================================================
// Parser
// =============================================================================

class Parser {
public:
    Parser();
    ~Parser();

    // Parse preprocessed component text. Returns nullptr on failure; the
    // error is then available through getErrors().
    std::unique_ptr<RootNode> parse(const std::string& source);

    const std::vector<ParseError>& getErrors() const { return m_errors; }
    bool hasErrors() const { return !m_errors.empty(); }

private:
    std::string m_source;
    size_t m_pos;
    RootNode* m_root;
    std::vector<ParseError> m_errors;

    // Markup
    void parseNodes(std::vector<NodePtr>& out, NodeType parentKind, bool topLevel);
    NodePtr parseElement(NodeType parentKind, bool topLevel);
    NodePtr parseEmbeddedBlock(size_t start, const std::string& name, bool topLevel);
    NodePtr parseComment();
    NodePtr parseText();
    NodeType classifyElement(const std::string& name, NodeType parentKind, size_t start) const;
    void liftComponentExpression(ElementNode& element);

    // Attributes
    void parseAttributes(std::vector<NodePtr>& attributes);
    NodePtr parseAttribute();
    NodePtr parseBraceAttribute();
    void parseAttributeValue(std::vector<NodePtr>& parts);
    void parseValueParts(std::vector<NodePtr>& parts, char quote);
    NodePtr makeDirective(NodeType kind, const std::string& prefix, const std::string& name,
                          size_t nameStart, bool hasValue, std::vector<NodePtr>& value, size_t start);

    // Tags and blocks
    NodePtr parseTag(NodeType parentKind);
    NodePtr parseMustache();
    NodePtr parseDebugTag(size_t start);
    NodePtr parseBlock(size_t start, NodeType parentKind);
    std::unique_ptr<IfBlockNode> parseIfBlock(size_t start, bool elseif, NodeType parentKind);
    NodePtr parseEachBlock(size_t start, NodeType parentKind);
    NodePtr parseAwaitBlock(size_t start, NodeType parentKind);
    void expectBlockClose(const std::string& keyword);

    // Expressions
    ExpressionPtr readExpression();
    size_t findExpressionEnd(size_t from);
    ExpressionPtr makeExpression(const std::string& text, size_t relStart, size_t relEnd,
                                 size_t base, bool allowEmpty = false);

    // Character level
    bool atEnd() const { return m_pos >= m_source.size(); }
    char peek(size_t offset = 0) const;
    bool lookingAt(const char* text) const;
    bool lookingAtWord(const char* word) const;
    void skipWhitespace();
    void requireWhitespace();
    void expect(char c);
    std::string readTagName();
    std::string readWord();

    // Error at the current position, or spanning [start, current position)
    ParseError error(const std::string& message) const;
    ParseError error(const std::string& message, size_t start) const;
};

} // namespace SvelteFormat

#endif // SVELTEFORMAT_PARSER_H

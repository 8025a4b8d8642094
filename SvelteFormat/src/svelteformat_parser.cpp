//
// svelteformat_parser.cpp
// SvelteFormat - Parser Implementation
//

#include "svelteformat_parser.h"
#include <cstring>
#include <sstream>

namespace SvelteFormat {

static bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

static bool isAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// =============================================================================
// Error Reporting
// =============================================================================

SourcePosition offsetToPosition(const std::string& source, size_t offset) {
    SourcePosition position;
    size_t limit = offset < source.size() ? offset : source.size();
    for (size_t i = 0; i < limit; i++) {
        if (source[i] == '\n') {
            position.line++;
            position.column = 1;
        } else {
            position.column++;
        }
    }
    return position;
}

std::string ParseError::toString(const std::string& source) const {
    SourcePosition position = offsetToPosition(source, start);
    std::ostringstream oss;
    oss << "Parse Error at " << position.line << ":" << position.column << ": " << what();
    return oss.str();
}

ParseError Parser::error(const std::string& message) const {
    return ParseError(message, m_pos, m_pos);
}

ParseError Parser::error(const std::string& message, size_t start) const {
    return ParseError(message, start, m_pos > start ? m_pos : start);
}

// =============================================================================
// Expression Scanning
// =============================================================================

// Index just past the string literal opening at pos, or npos
static size_t skipStringLiteral(const std::string& text, size_t pos) {
    char quote = text[pos];
    size_t i = pos + 1;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\\') {
            i += 2;
        } else if (c == quote) {
            return i + 1;
        } else if (c == '\n') {
            return std::string::npos;
        } else {
            i++;
        }
    }
    return std::string::npos;
}

// Index just past the template literal opening at pos, or npos
static size_t skipTemplateLiteral(const std::string& text, size_t pos) {
    size_t i = pos + 1;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\\') {
            i += 2;
        } else if (c == '`') {
            return i + 1;
        } else if (c == '$' && i + 1 < text.size() && text[i + 1] == '{') {
            size_t close = scanTopLevel(text, i + 2, [](const std::string& t, size_t p) {
                return t[p] == '}';
            });
            if (close == std::string::npos) {
                return std::string::npos;
            }
            i = close + 1;
        } else {
            i++;
        }
    }
    return std::string::npos;
}

size_t scanTopLevel(const std::string& text, size_t from, const ScanStop& stop) {
    int depth = 0;
    size_t i = from;

    while (i < text.size()) {
        char c = text[i];

        if (c == '"' || c == '\'') {
            i = skipStringLiteral(text, i);
            if (i == std::string::npos) {
                return std::string::npos;
            }
            continue;
        }
        if (c == '`') {
            i = skipTemplateLiteral(text, i);
            if (i == std::string::npos) {
                return std::string::npos;
            }
            continue;
        }
        if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
            size_t newline = text.find('\n', i);
            if (newline == std::string::npos) {
                return std::string::npos;
            }
            i = newline + 1;
            continue;
        }
        if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            size_t close = text.find("*/", i + 2);
            if (close == std::string::npos) {
                return std::string::npos;
            }
            i = close + 2;
            continue;
        }

        if (depth == 0 && stop(text, i)) {
            return i;
        }

        if (c == '(' || c == '[' || c == '{') {
            depth++;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth == 0) {
                return std::string::npos;
            }
            depth--;
        }
        i++;
    }

    return std::string::npos;
}

size_t findTopLevelKeyword(const std::string& text, const std::string& keyword) {
    return scanTopLevel(text, 0, [&keyword](const std::string& t, size_t p) {
        if (p == 0 || !isSpace(t[p - 1])) {
            return false;
        }
        if (t.compare(p, keyword.size(), keyword) != 0) {
            return false;
        }
        size_t after = p + keyword.size();
        return after == t.size() || isSpace(t[after]);
    });
}

// =============================================================================
// Construction
// =============================================================================

Parser::Parser()
    : m_pos(0)
    , m_root(nullptr)
{
}

Parser::~Parser() = default;

// =============================================================================
// Top-Level Parsing
// =============================================================================

std::unique_ptr<RootNode> Parser::parse(const std::string& source) {
    m_source = source;
    m_pos = 0;
    m_errors.clear();

    auto root = std::make_unique<RootNode>();
    root->start = 0;
    root->end = source.size();
    root->html->start = 0;
    root->html->end = source.size();
    m_root = root.get();

    try {
        parseNodes(root->html->children, NodeType::FRAGMENT, true);

        if (!atEnd()) {
            if (lookingAt("</")) {
                size_t start = m_pos;
                m_pos += 2;
                std::string name = readTagName();
                throw error("</" + name + "> attempted to close an element that was not open", start);
            }
            throw error("Unexpected block closing tag");
        }
    } catch (const ParseError& e) {
        m_errors.push_back(e);
        m_root = nullptr;
        return nullptr;
    }

    m_root = nullptr;
    return root;
}

// =============================================================================
// Markup
// =============================================================================

void Parser::parseNodes(std::vector<NodePtr>& out, NodeType parentKind, bool topLevel) {
    while (!atEnd()) {
        if (lookingAt("<!--")) {
            out.push_back(parseComment());
        } else if (lookingAt("</")) {
            return;
        } else if (peek() == '<') {
            NodePtr element = parseElement(parentKind, topLevel);
            // Hoisted script/style blocks leave nothing behind
            if (element) {
                out.push_back(std::move(element));
            }
        } else if (lookingAt("{/") || lookingAt("{:")) {
            return;
        } else if (peek() == '{') {
            out.push_back(parseTag(parentKind));
        } else {
            out.push_back(parseText());
        }
    }
}

NodePtr Parser::parseText() {
    size_t start = m_pos;
    while (!atEnd() && peek() != '<' && peek() != '{') {
        m_pos++;
    }
    auto text = std::make_unique<TextNode>(m_source.substr(start, m_pos - start));
    text->start = start;
    text->end = m_pos;
    return text;
}

NodePtr Parser::parseComment() {
    size_t start = m_pos;
    m_pos += 4;
    size_t close = m_source.find("-->", m_pos);
    if (close == std::string::npos) {
        m_pos = m_source.size();
        throw error("comment was left open, expected -->", start);
    }
    auto comment = std::make_unique<CommentNode>(m_source.substr(m_pos, close - m_pos));
    m_pos = close + 3;
    comment->start = start;
    comment->end = m_pos;
    return comment;
}

NodeType Parser::classifyElement(const std::string& name, NodeType parentKind, size_t start) const {
    if (name.compare(0, 7, "svelte:") == 0) {
        if (name == "svelte:head") return NodeType::HEAD;
        if (name == "svelte:window") return NodeType::WINDOW;
        if (name == "svelte:options") return NodeType::OPTIONS;
        if (name == "svelte:body") return NodeType::BODY;
        if (name == "svelte:self" || name == "svelte:component") return NodeType::INLINE_COMPONENT;
        throw ParseError("Valid <svelte:...> tag names are svelte:head, svelte:options, "
                         "svelte:window, svelte:body, svelte:self or svelte:component",
                         start, start + name.size() + 1);
    }
    if (name == "slot") {
        return NodeType::SLOT;
    }
    if (name == "title" && parentKind == NodeType::HEAD) {
        return NodeType::TITLE;
    }
    if ((name[0] >= 'A' && name[0] <= 'Z') || name.find('.') != std::string::npos) {
        return NodeType::INLINE_COMPONENT;
    }
    return NodeType::ELEMENT;
}

NodePtr Parser::parseElement(NodeType parentKind, bool topLevel) {
    size_t start = m_pos;
    m_pos++;

    std::string name = readTagName();
    if (name.empty() || !isAlpha(name[0])) {
        throw error("Expected valid tag name", start);
    }

    if (name == "script" || name == "style") {
        return parseEmbeddedBlock(start, name, topLevel);
    }

    NodeType kind = classifyElement(name, parentKind, start);
    auto element = std::make_unique<ElementNode>(kind, name);
    element->start = start;

    parseAttributes(element->attributes);

    bool selfClosed = false;
    if (lookingAt("/>")) {
        m_pos += 2;
        selfClosed = true;
    } else {
        expect('>');
    }

    if (name == "svelte:component") {
        liftComponentExpression(*element);
    }

    if (selfClosed || (kind == NodeType::ELEMENT && isVoidElementName(name))) {
        element->end = m_pos;
        return element;
    }

    parseNodes(element->children, kind, false);

    if (!lookingAt("</")) {
        throw error("<" + name + "> was left open", start);
    }
    size_t closeStart = m_pos;
    m_pos += 2;
    std::string closeName = readTagName();
    skipWhitespace();
    expect('>');
    if (closeName != name) {
        throw error("</" + closeName + "> attempted to close <" + name + ">", closeStart);
    }

    element->end = m_pos;
    return element;
}

void Parser::liftComponentExpression(ElementNode& element) {
    for (auto it = element.attributes.begin(); it != element.attributes.end(); ++it) {
        if ((*it)->getType() != NodeType::ATTRIBUTE) {
            continue;
        }
        AttributeNode* attr = static_cast<AttributeNode*>(it->get());
        if (attr->name != "this") {
            continue;
        }
        if (attr->value.size() != 1 || attr->value[0]->getType() != NodeType::MUSTACHE_TAG) {
            throw ParseError("Invalid component definition: this must be an {expression}",
                             attr->start, attr->end);
        }
        MustacheTagNode* tag = static_cast<MustacheTagNode*>(attr->value[0].get());
        element.expression = std::move(tag->expression);
        element.attributes.erase(it);
        return;
    }
    throw ParseError("<svelte:component> must have a 'this' attribute", element.start, m_pos);
}

NodePtr Parser::parseEmbeddedBlock(size_t start, const std::string& name, bool topLevel) {
    NodeType kind = name == "script" ? NodeType::SCRIPT : NodeType::STYLE;
    auto block = std::make_unique<EmbeddedBlockNode>(kind, name);
    block->start = start;

    parseAttributes(block->attributes);

    if (lookingAt("/>")) {
        m_pos += 2;
    } else {
        expect('>');

        // Body is opaque up to the matching end tag
        size_t contentStart = m_pos;
        std::string closing = "</" + name;
        size_t close = m_source.find(closing, contentStart);
        if (close == std::string::npos) {
            m_pos = m_source.size();
            throw error("<" + name + "> was left open", start);
        }
        block->content = m_source.substr(contentStart, close - contentStart);
        m_pos = close + closing.size();
        skipWhitespace();
        expect('>');
    }
    block->end = m_pos;

    const std::string* context = block->getAttributeText("context");
    if (context && *context == "module") {
        block->context = "module";
    }

    if (!topLevel) {
        return block;
    }

    if (kind == NodeType::STYLE) {
        if (m_root->css) {
            throw ParseError("You can only have one top-level <style> tag per component",
                             start, block->end);
        }
        m_root->css = std::move(block);
    } else if (block->context == "module") {
        if (m_root->module) {
            throw ParseError("A component can only have one <script context=\"module\"> element",
                             start, block->end);
        }
        m_root->module = std::move(block);
    } else {
        if (m_root->instance) {
            throw ParseError("A component can only have one instance-level <script> element",
                             start, block->end);
        }
        m_root->instance = std::move(block);
    }
    return nullptr;
}

// =============================================================================
// Attributes
// =============================================================================

void Parser::parseAttributes(std::vector<NodePtr>& attributes) {
    while (true) {
        skipWhitespace();
        if (atEnd()) {
            throw error("Unexpected end of input");
        }
        if (peek() == '>' || lookingAt("/>")) {
            return;
        }
        attributes.push_back(parseAttribute());
    }
}

NodePtr Parser::parseBraceAttribute() {
    size_t start = m_pos;
    m_pos++;
    skipWhitespace();

    if (lookingAt("...")) {
        m_pos += 3;
        ExpressionPtr expr = readExpression();
        expect('}');
        auto spread = std::make_unique<SpreadNode>(std::move(expr));
        spread->start = start;
        spread->end = m_pos;
        return spread;
    }

    ExpressionPtr expr = readExpression();
    if (!expr->isIdentifier()) {
        throw ParseError("Expected an identifier in attribute shorthand", expr->start, expr->end);
    }
    expect('}');

    auto attr = std::make_unique<AttributeNode>(expr->code);
    auto shorthand = std::make_unique<AttributeShorthandNode>(std::move(expr));
    shorthand->start = start;
    shorthand->end = m_pos;
    attr->value.push_back(std::move(shorthand));
    attr->start = start;
    attr->end = m_pos;
    return attr;
}

NodePtr Parser::parseAttribute() {
    size_t start = m_pos;

    if (peek() == '{') {
        return parseBraceAttribute();
    }

    while (!atEnd()) {
        char c = peek();
        if (isSpace(c) || c == '=' || c == '>' || c == '/' || c == '"' || c == '\'') {
            break;
        }
        m_pos++;
    }
    std::string name = m_source.substr(start, m_pos - start);
    if (name.empty()) {
        throw error("Expected attribute name");
    }

    bool hasValue = false;
    std::vector<NodePtr> value;

    size_t afterName = m_pos;
    skipWhitespace();
    if (peek() == '=') {
        m_pos++;
        skipWhitespace();
        hasValue = true;
        parseAttributeValue(value);
    } else {
        m_pos = afterName;
    }

    size_t colon = name.find(':');
    if (colon != std::string::npos) {
        std::string prefix = name.substr(0, colon);
        NodeType kind = NodeType::ATTRIBUTE;
        if (prefix == "on") kind = NodeType::EVENT_HANDLER;
        else if (prefix == "bind") kind = NodeType::BINDING;
        else if (prefix == "class") kind = NodeType::CLASS_DIRECTIVE;
        else if (prefix == "let") kind = NodeType::LET_DIRECTIVE;
        else if (prefix == "ref") kind = NodeType::REF_DIRECTIVE;
        else if (prefix == "transition" || prefix == "in" || prefix == "out") kind = NodeType::TRANSITION;
        else if (prefix == "use") kind = NodeType::ACTION;
        else if (prefix == "animate") kind = NodeType::ANIMATION;

        if (kind != NodeType::ATTRIBUTE) {
            return makeDirective(kind, prefix, name.substr(colon + 1), start + colon + 1,
                                 hasValue, value, start);
        }
    }

    auto attr = std::make_unique<AttributeNode>(name);
    attr->isTrue = !hasValue;
    attr->value = std::move(value);
    attr->start = start;
    attr->end = m_pos;
    return attr;
}

NodePtr Parser::makeDirective(NodeType kind, const std::string& prefix, const std::string& name,
                              size_t nameStart, bool hasValue, std::vector<NodePtr>& value,
                              size_t start) {
    std::vector<std::string> segments;
    std::string segment;
    for (char c : name) {
        if (c == '|') {
            segments.push_back(segment);
            segment.clear();
        } else {
            segment += c;
        }
    }
    segments.push_back(segment);

    if (segments[0].empty()) {
        throw ParseError("Expected a name after '" + prefix + ":'", start, m_pos);
    }

    auto directive = std::make_unique<DirectiveNode>(kind, segments[0]);
    directive->modifiers.assign(segments.begin() + 1, segments.end());
    directive->intro = prefix == "transition" || prefix == "in";
    directive->outro = prefix == "transition" || prefix == "out";

    if (hasValue) {
        if (value.size() != 1 || value[0]->getType() != NodeType::MUSTACHE_TAG) {
            throw ParseError("Directive value must be a JavaScript expression enclosed in curly braces",
                             start, m_pos);
        }
        MustacheTagNode* tag = static_cast<MustacheTagNode*>(value[0].get());
        directive->expression = std::move(tag->expression);
    } else if (kind == NodeType::BINDING || kind == NodeType::CLASS_DIRECTIVE) {
        // bind:value is short for bind:value={value}
        directive->expression = std::make_unique<ExpressionNode>(segments[0]);
        directive->expression->start = nameStart;
        directive->expression->end = nameStart + segments[0].size();
    }

    directive->start = start;
    directive->end = m_pos;
    return directive;
}

void Parser::parseAttributeValue(std::vector<NodePtr>& parts) {
    char c = peek();
    if (c == '"' || c == '\'') {
        size_t open = m_pos;
        m_pos++;
        parseValueParts(parts, c);
        if (atEnd()) {
            throw error("Unterminated attribute value", open);
        }
        if (parts.empty()) {
            auto empty = std::make_unique<TextNode>("");
            empty->start = m_pos;
            empty->end = m_pos;
            parts.push_back(std::move(empty));
        }
        m_pos++;
        return;
    }

    parseValueParts(parts, 0);
    if (parts.empty()) {
        throw error("Expected attribute value");
    }
}

void Parser::parseValueParts(std::vector<NodePtr>& parts, char quote) {
    size_t textStart = m_pos;

    auto flushText = [&]() {
        if (m_pos > textStart) {
            auto text = std::make_unique<TextNode>(m_source.substr(textStart, m_pos - textStart));
            text->start = textStart;
            text->end = m_pos;
            parts.push_back(std::move(text));
        }
    };

    while (!atEnd()) {
        char c = peek();
        if (quote) {
            if (c == quote) {
                break;
            }
        } else if (isSpace(c) || c == '"' || c == '\'' || c == '=' || c == '<' ||
                   c == '>' || c == '`' || lookingAt("/>")) {
            break;
        }

        if (c == '{') {
            flushText();
            parts.push_back(parseMustache());
            textStart = m_pos;
            continue;
        }
        m_pos++;
    }
    flushText();
}

// =============================================================================
// Tags
// =============================================================================

NodePtr Parser::parseTag(NodeType parentKind) {
    size_t start = m_pos;

    if (lookingAt("{#")) {
        return parseBlock(start, parentKind);
    }

    if (lookingAt("{@html") && isSpace(peek(6))) {
        m_pos += 6;
        skipWhitespace();
        ExpressionPtr expr = readExpression();
        expect('}');
        auto tag = std::make_unique<MustacheTagNode>(true, std::move(expr));
        tag->start = start;
        tag->end = m_pos;
        return tag;
    }

    if (lookingAt("{@debug") && (isSpace(peek(7)) || peek(7) == '}')) {
        return parseDebugTag(start);
    }

    if (lookingAt("{@")) {
        throw error("Expected {@html ...} or {@debug ...}", start);
    }

    return parseMustache();
}

NodePtr Parser::parseMustache() {
    size_t start = m_pos;
    m_pos++;
    skipWhitespace();
    ExpressionPtr expr = readExpression();
    expect('}');
    auto tag = std::make_unique<MustacheTagNode>(false, std::move(expr));
    tag->start = start;
    tag->end = m_pos;
    return tag;
}

NodePtr Parser::parseDebugTag(size_t start) {
    m_pos += 7;
    size_t bodyStart = m_pos;
    size_t close = findExpressionEnd(m_pos);
    std::string body = m_source.substr(bodyStart, close - bodyStart);

    auto debug = std::make_unique<DebugTagNode>();
    size_t segmentStart = 0;
    while (segmentStart <= body.size()) {
        size_t comma = scanTopLevel(body, segmentStart, [](const std::string& t, size_t p) {
            return t[p] == ',';
        });
        size_t segmentEnd = comma == std::string::npos ? body.size() : comma;
        ExpressionPtr id = makeExpression(body, segmentStart, segmentEnd, bodyStart, true);
        if (id) {
            if (!id->isIdentifier()) {
                throw ParseError("{@debug ...} arguments must be identifiers, not arbitrary expressions",
                                 id->start, id->end);
            }
            debug->identifiers.push_back(std::move(id));
        } else if (comma != std::string::npos || !debug->identifiers.empty()) {
            throw ParseError("Expected identifier", bodyStart + segmentStart, bodyStart + segmentEnd);
        }
        if (comma == std::string::npos) {
            break;
        }
        segmentStart = comma + 1;
    }

    m_pos = close;
    expect('}');
    debug->start = start;
    debug->end = m_pos;
    return debug;
}

// =============================================================================
// Blocks
// =============================================================================

NodePtr Parser::parseBlock(size_t start, NodeType parentKind) {
    m_pos += 2;
    std::string keyword = readWord();

    if (keyword == "if") {
        return parseIfBlock(start, false, parentKind);
    }
    if (keyword == "each") {
        return parseEachBlock(start, parentKind);
    }
    if (keyword == "await") {
        return parseAwaitBlock(start, parentKind);
    }
    throw error("Expected if, each or await", start);
}

void Parser::expectBlockClose(const std::string& keyword) {
    size_t start = m_pos;
    if (!lookingAt("{/")) {
        throw error("Expected {/" + keyword + "}", start);
    }
    m_pos += 2;
    skipWhitespace();
    std::string word = readWord();
    if (word != keyword) {
        throw error("Expected {/" + keyword + "}", start);
    }
    skipWhitespace();
    expect('}');
}

std::unique_ptr<IfBlockNode> Parser::parseIfBlock(size_t start, bool elseif, NodeType parentKind) {
    requireWhitespace();

    auto block = std::make_unique<IfBlockNode>();
    block->start = start;
    block->elseif = elseif;
    block->expression = readExpression();
    expect('}');

    parseNodes(block->children, parentKind, false);

    if (lookingAt("{:")) {
        size_t elseStart = m_pos;
        m_pos += 2;
        if (readWord() != "else") {
            throw error("Expected {:else} or {:else if ...}", elseStart);
        }
        skipWhitespace();

        auto elseBlock = std::make_unique<ElseBlockNode>();
        elseBlock->start = elseStart;

        if (lookingAtWord("if")) {
            // {:else if} continues the chain; the outermost block owns {/if}
            m_pos += 2;
            elseBlock->addChild(parseIfBlock(elseStart, true, parentKind));
        } else {
            expect('}');
            parseNodes(elseBlock->children, parentKind, false);
        }

        elseBlock->end = m_pos;
        block->elseBlock = std::move(elseBlock);
    }

    if (!elseif) {
        expectBlockClose("if");
    }
    block->end = m_pos;
    return block;
}

NodePtr Parser::parseEachBlock(size_t start, NodeType parentKind) {
    requireWhitespace();

    size_t headerStart = m_pos;
    size_t headerEnd = findExpressionEnd(m_pos);
    std::string header = m_source.substr(headerStart, headerEnd - headerStart);

    size_t as = findTopLevelKeyword(header, "as");
    if (as == std::string::npos) {
        m_pos = headerEnd;
        throw error("Expected 'as' in {#each ...}", start);
    }

    auto block = std::make_unique<EachBlockNode>();
    block->start = start;
    block->expression = makeExpression(header, 0, as, headerStart);

    size_t contextStart = as + 2;
    size_t contextEnd = scanTopLevel(header, contextStart, [](const std::string& t, size_t p) {
        return t[p] == ',' || t[p] == '(';
    });
    if (contextEnd == std::string::npos) {
        contextEnd = header.size();
    }
    block->context = makeExpression(header, contextStart, contextEnd, headerStart);

    size_t rest = contextEnd;
    if (rest < header.size() && header[rest] == ',') {
        size_t indexStart = rest + 1;
        size_t indexEnd = header.find('(', indexStart);
        if (indexEnd == std::string::npos) {
            indexEnd = header.size();
        }
        ExpressionPtr index = makeExpression(header, indexStart, indexEnd, headerStart);
        if (!index->isIdentifier()) {
            throw ParseError("Expected an identifier for the each block index",
                             index->start, index->end);
        }
        block->index = index->code;
        rest = indexEnd;
    }

    if (rest < header.size() && header[rest] == '(') {
        size_t keyStart = rest + 1;
        size_t keyEnd = scanTopLevel(header, keyStart, [](const std::string& t, size_t p) {
            return t[p] == ')';
        });
        if (keyEnd == std::string::npos) {
            m_pos = headerEnd;
            throw error("Expected ')' after each block key", headerStart + rest);
        }
        block->key = makeExpression(header, keyStart, keyEnd, headerStart);
        size_t trailing = header.find_first_not_of(" \t\n\r\f", keyEnd + 1);
        if (trailing != std::string::npos) {
            throw ParseError("Unexpected text after each block key",
                             headerStart + trailing, headerEnd);
        }
    }

    m_pos = headerEnd;
    expect('}');

    parseNodes(block->children, parentKind, false);

    if (lookingAt("{:")) {
        size_t elseStart = m_pos;
        m_pos += 2;
        if (readWord() != "else") {
            throw error("Expected {:else}", elseStart);
        }
        skipWhitespace();
        expect('}');

        auto elseBlock = std::make_unique<ElseBlockNode>();
        elseBlock->start = elseStart;
        parseNodes(elseBlock->children, parentKind, false);
        elseBlock->end = m_pos;
        block->elseBlock = std::move(elseBlock);
    }

    expectBlockClose("each");
    block->end = m_pos;
    return block;
}

NodePtr Parser::parseAwaitBlock(size_t start, NodeType parentKind) {
    requireWhitespace();

    size_t headerStart = m_pos;
    size_t headerEnd = findExpressionEnd(m_pos);
    std::string header = m_source.substr(headerStart, headerEnd - headerStart);

    auto block = std::make_unique<AwaitBlockNode>();
    block->start = start;

    BlockSectionNode* current = block->pending.get();

    size_t thenAt = findTopLevelKeyword(header, "then");
    size_t catchAt = findTopLevelKeyword(header, "catch");
    if (thenAt != std::string::npos) {
        block->expression = makeExpression(header, 0, thenAt, headerStart);
        ExpressionPtr value = makeExpression(header, thenAt + 4, header.size(), headerStart, true);
        block->value = value ? value->code : "";
        current = block->then.get();
    } else if (catchAt != std::string::npos) {
        block->expression = makeExpression(header, 0, catchAt, headerStart);
        ExpressionPtr pattern = makeExpression(header, catchAt + 5, header.size(), headerStart, true);
        block->error = pattern ? pattern->code : "";
        current = block->catchBlock.get();
    } else {
        block->expression = makeExpression(header, 0, header.size(), headerStart);
    }

    m_pos = headerEnd;
    expect('}');

    while (true) {
        current->start = m_pos;
        parseNodes(current->children, parentKind, false);
        current->end = m_pos;

        if (!lookingAt("{:")) {
            break;
        }

        size_t sectionStart = m_pos;
        m_pos += 2;
        std::string word = readWord();
        BlockSectionNode* next = nullptr;
        std::string* binding = nullptr;
        if (word == "then") {
            next = block->then.get();
            binding = &block->value;
        } else if (word == "catch") {
            next = block->catchBlock.get();
            binding = &block->error;
        } else {
            throw error("Expected {:then ...} or {:catch ...}", sectionStart);
        }
        if (next == current || !next->children.empty()) {
            throw error("Duplicate {:" + word + "} section", sectionStart);
        }

        size_t bindingStart = m_pos;
        size_t close = findExpressionEnd(m_pos);
        std::string bindingText = m_source.substr(bindingStart, close - bindingStart);
        ExpressionPtr pattern = makeExpression(bindingText, 0, bindingText.size(), bindingStart, true);
        *binding = pattern ? pattern->code : "";
        m_pos = close;
        expect('}');

        current = next;
    }

    expectBlockClose("await");
    block->end = m_pos;
    return block;
}

// =============================================================================
// Expressions
// =============================================================================

size_t Parser::findExpressionEnd(size_t from) {
    size_t close = scanTopLevel(m_source, from, [](const std::string& t, size_t p) {
        return t[p] == '}';
    });
    if (close == std::string::npos) {
        m_pos = m_source.size();
        throw error("Unexpected end of input: expected '}'", from);
    }
    return close;
}

ExpressionPtr Parser::makeExpression(const std::string& text, size_t relStart, size_t relEnd,
                                     size_t base, bool allowEmpty) {
    size_t first = relStart;
    while (first < relEnd && isSpace(text[first])) {
        first++;
    }
    size_t last = relEnd;
    while (last > first && isSpace(text[last - 1])) {
        last--;
    }

    if (first == last) {
        if (allowEmpty) {
            return nullptr;
        }
        throw ParseError("Expected expression", base + relStart, base + relEnd);
    }

    auto expr = std::make_unique<ExpressionNode>(text.substr(first, last - first));
    expr->start = base + first;
    expr->end = base + last;
    return expr;
}

ExpressionPtr Parser::readExpression() {
    size_t start = m_pos;
    size_t close = findExpressionEnd(m_pos);
    std::string text = m_source.substr(start, close - start);
    ExpressionPtr expr = makeExpression(text, 0, text.size(), start);
    m_pos = close;
    return expr;
}

// =============================================================================
// Character Level
// =============================================================================

char Parser::peek(size_t offset) const {
    size_t index = m_pos + offset;
    return index < m_source.size() ? m_source[index] : '\0';
}

bool Parser::lookingAt(const char* text) const {
    return m_source.compare(m_pos, std::strlen(text), text) == 0;
}

bool Parser::lookingAtWord(const char* word) const {
    size_t len = std::strlen(word);
    return lookingAt(word) && (m_pos + len >= m_source.size() || isSpace(m_source[m_pos + len]));
}

void Parser::skipWhitespace() {
    while (!atEnd() && isSpace(peek())) {
        m_pos++;
    }
}

void Parser::requireWhitespace() {
    if (atEnd() || !isSpace(peek())) {
        throw error("Expected whitespace");
    }
    skipWhitespace();
}

void Parser::expect(char c) {
    if (peek() != c) {
        if (atEnd()) {
            throw error(std::string("Unexpected end of input: expected '") + c + "'");
        }
        throw error(std::string("Expected '") + c + "'");
    }
    m_pos++;
}

std::string Parser::readTagName() {
    size_t start = m_pos;
    while (!atEnd() && !isSpace(peek()) && peek() != '/' && peek() != '>') {
        m_pos++;
    }
    return m_source.substr(start, m_pos - start);
}

std::string Parser::readWord() {
    size_t start = m_pos;
    while (!atEnd() && isAlpha(peek())) {
        m_pos++;
    }
    return m_source.substr(start, m_pos - start);
}

} // namespace SvelteFormat

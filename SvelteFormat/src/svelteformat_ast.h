//
// svelteformat_ast.h
// SvelteFormat - Abstract Syntax Tree Definitions
//
// Defines all AST node types for representing parsed component markup.
// Every node carries its half-open [start, end) byte range into the
// preprocessed source. Container nodes own their children; there are no
// parent links, ancestry is reconstructed by the printer while it walks.
//

#ifndef SVELTEFORMAT_AST_H
#define SVELTEFORMAT_AST_H

#include <string>
#include <vector>
#include <memory>
#include <sstream>

namespace SvelteFormat {

// Forward declarations
class ASTNode;
class ExpressionNode;
class FragmentNode;
class ElseBlockNode;
class BlockSectionNode;
class AttributeNode;
class EmbeddedBlockNode;

// Smart pointer types for AST nodes
using NodePtr = std::unique_ptr<ASTNode>;
using ExpressionPtr = std::unique_ptr<ExpressionNode>;

// =============================================================================
// AST Node Types
// =============================================================================

enum class NodeType {
    // Structure
    ROOT,
    FRAGMENT,

    // Element-like containers
    ELEMENT,
    INLINE_COMPONENT,
    SLOT,
    WINDOW,
    HEAD,
    TITLE,
    OPTIONS,
    BODY,

    // Inline content
    TEXT,
    MUSTACHE_TAG,
    RAW_MUSTACHE_TAG,

    // Control-flow blocks
    IF_BLOCK,
    ELSE_BLOCK,
    EACH_BLOCK,
    AWAIT_BLOCK,
    PENDING_BLOCK,
    THEN_BLOCK,
    CATCH_BLOCK,

    // Attributes and directives
    ATTRIBUTE,
    ATTRIBUTE_SHORTHAND,
    EVENT_HANDLER,
    BINDING,
    CLASS_DIRECTIVE,
    LET_DIRECTIVE,
    REF_DIRECTIVE,
    TRANSITION,
    ACTION,
    ANIMATION,
    SPREAD,

    // Miscellaneous
    DEBUG_TAG,
    COMMENT,
    SCRIPT,
    STYLE,
    EXPRESSION
};

inline const char* nodeTypeToString(NodeType type) {
    switch (type) {
        case NodeType::ROOT: return "Root";
        case NodeType::FRAGMENT: return "Fragment";
        case NodeType::ELEMENT: return "Element";
        case NodeType::INLINE_COMPONENT: return "InlineComponent";
        case NodeType::SLOT: return "Slot";
        case NodeType::WINDOW: return "Window";
        case NodeType::HEAD: return "Head";
        case NodeType::TITLE: return "Title";
        case NodeType::OPTIONS: return "Options";
        case NodeType::BODY: return "Body";
        case NodeType::TEXT: return "Text";
        case NodeType::MUSTACHE_TAG: return "MustacheTag";
        case NodeType::RAW_MUSTACHE_TAG: return "RawMustacheTag";
        case NodeType::IF_BLOCK: return "IfBlock";
        case NodeType::ELSE_BLOCK: return "ElseBlock";
        case NodeType::EACH_BLOCK: return "EachBlock";
        case NodeType::AWAIT_BLOCK: return "AwaitBlock";
        case NodeType::PENDING_BLOCK: return "PendingBlock";
        case NodeType::THEN_BLOCK: return "ThenBlock";
        case NodeType::CATCH_BLOCK: return "CatchBlock";
        case NodeType::ATTRIBUTE: return "Attribute";
        case NodeType::ATTRIBUTE_SHORTHAND: return "AttributeShorthand";
        case NodeType::EVENT_HANDLER: return "EventHandler";
        case NodeType::BINDING: return "Binding";
        case NodeType::CLASS_DIRECTIVE: return "Class";
        case NodeType::LET_DIRECTIVE: return "Let";
        case NodeType::REF_DIRECTIVE: return "Ref";
        case NodeType::TRANSITION: return "Transition";
        case NodeType::ACTION: return "Action";
        case NodeType::ANIMATION: return "Animation";
        case NodeType::SPREAD: return "Spread";
        case NodeType::DEBUG_TAG: return "DebugTag";
        case NodeType::COMMENT: return "Comment";
        case NodeType::SCRIPT: return "Script";
        case NodeType::STYLE: return "Style";
        case NodeType::EXPRESSION: return "Expression";
    }
    return "Unknown";
}

// =============================================================================
// Base AST Node
// =============================================================================

class ASTNode {
public:
    virtual ~ASTNode() = default;

    virtual NodeType getType() const = 0;
    virtual std::string toString(int indent = 0) const = 0;

    size_t start = 0;
    size_t end = 0;

protected:
    std::string makeIndent(int indent) const {
        return std::string(indent * 2, ' ');
    }

    std::string rangeString() const {
        std::ostringstream oss;
        oss << "[" << start << "," << end << ")";
        return oss.str();
    }
};

// Node with an ordered list of owned children
class ContainerNode : public ASTNode {
public:
    std::vector<NodePtr> children;

    void addChild(NodePtr child) {
        children.push_back(std::move(child));
    }

protected:
    void appendChildren(std::ostringstream& oss, int indent) const {
        for (const auto& child : children) {
            oss << child->toString(indent);
        }
    }
};

// =============================================================================
// Expressions
// =============================================================================

// Expression kept as source text. The formatter never interprets the code
// beyond classifying bare identifiers.
class ExpressionNode : public ASTNode {
public:
    std::string code;

    explicit ExpressionNode(const std::string& c) : code(c) {}

    NodeType getType() const override { return NodeType::EXPRESSION; }

    // True if the code is a single JavaScript identifier
    bool isIdentifier() const {
        if (code.empty()) {
            return false;
        }
        for (size_t i = 0; i < code.size(); i++) {
            unsigned char c = static_cast<unsigned char>(code[i]);
            bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                         c == '_' || c == '$' || c >= 0x80;
            bool digit = c >= '0' && c <= '9';
            if (!alpha && !(digit && i > 0)) {
                return false;
            }
        }
        return true;
    }

    bool isIdentifierNamed(const std::string& name) const {
        return isIdentifier() && code == name;
    }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "Expression(" << code << ")\n";
        return oss.str();
    }
};

// =============================================================================
// Markup Nodes
// =============================================================================

class FragmentNode : public ContainerNode {
public:
    NodeType getType() const override { return NodeType::FRAGMENT; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "Fragment " << rangeString() << "\n";
        appendChildren(oss, indent + 1);
        return oss.str();
    }
};

// Element, InlineComponent, Slot, Window, Head, Title, Options, Body
class ElementNode : public ContainerNode {
public:
    NodeType kind;
    std::string name;
    std::vector<NodePtr> attributes;
    ExpressionPtr expression;   // svelte:component this={...}

    ElementNode(NodeType k, const std::string& n) : kind(k), name(n) {}

    NodeType getType() const override { return kind; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << nodeTypeToString(kind) << "(" << name << ") "
            << rangeString() << "\n";
        if (expression) {
            oss << makeIndent(indent + 1) << "this:\n";
            oss << expression->toString(indent + 2);
        }
        for (const auto& attr : attributes) {
            oss << attr->toString(indent + 1);
        }
        appendChildren(oss, indent + 1);
        return oss.str();
    }
};

class TextNode : public ASTNode {
public:
    std::string raw;    // source text
    std::string data;   // decoded text (identical, entities are kept)

    explicit TextNode(const std::string& r) : raw(r), data(r) {}

    NodeType getType() const override { return NodeType::TEXT; }

    // True if the text consists of whitespace only (or is empty)
    bool isWhitespace() const {
        return raw.find_first_not_of(" \t\n\r\f") == std::string::npos;
    }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "Text(\"";
        for (char c : raw) {
            if (c == '\n') oss << "\\n";
            else oss << c;
        }
        oss << "\")\n";
        return oss.str();
    }
};

// {expr} or {@html expr}
class MustacheTagNode : public ASTNode {
public:
    bool rawHtml;
    ExpressionPtr expression;

    MustacheTagNode(bool isRaw, ExpressionPtr expr)
        : rawHtml(isRaw), expression(std::move(expr)) {}

    NodeType getType() const override {
        return rawHtml ? NodeType::RAW_MUSTACHE_TAG : NodeType::MUSTACHE_TAG;
    }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << (rawHtml ? "RawMustacheTag\n" : "MustacheTag\n");
        oss << expression->toString(indent + 1);
        return oss.str();
    }
};

// {@debug a, b}
class DebugTagNode : public ASTNode {
public:
    std::vector<ExpressionPtr> identifiers;

    NodeType getType() const override { return NodeType::DEBUG_TAG; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "DebugTag\n";
        for (const auto& id : identifiers) {
            oss << id->toString(indent + 1);
        }
        return oss.str();
    }
};

class CommentNode : public ASTNode {
public:
    std::string data;

    explicit CommentNode(const std::string& d) : data(d) {}

    NodeType getType() const override { return NodeType::COMMENT; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "Comment(" << data << ")\n";
        return oss.str();
    }
};

// =============================================================================
// Control-Flow Blocks
// =============================================================================

class ElseBlockNode : public ContainerNode {
public:
    NodeType getType() const override { return NodeType::ELSE_BLOCK; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "ElseBlock\n";
        appendChildren(oss, indent + 1);
        return oss.str();
    }
};

// {#if expr}...{:else}...{/if}
class IfBlockNode : public ContainerNode {
public:
    ExpressionPtr expression;
    std::unique_ptr<ElseBlockNode> elseBlock;   // nullptr if no else branch
    bool elseif = false;                        // created from {:else if}

    NodeType getType() const override { return NodeType::IF_BLOCK; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << (elseif ? "IfBlock(elseif)\n" : "IfBlock\n");
        oss << expression->toString(indent + 1);
        appendChildren(oss, indent + 1);
        if (elseBlock) {
            oss << elseBlock->toString(indent + 1);
        }
        return oss.str();
    }
};

// {#each expr as context, index (key)}...{:else}...{/each}
class EachBlockNode : public ContainerNode {
public:
    ExpressionPtr expression;
    ExpressionPtr context;       // destructuring pattern kept as text
    std::string index;           // empty if absent
    ExpressionPtr key;           // nullptr if absent
    std::unique_ptr<ElseBlockNode> elseBlock;

    NodeType getType() const override { return NodeType::EACH_BLOCK; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "EachBlock";
        if (!index.empty()) {
            oss << "(index=" << index << ")";
        }
        oss << "\n";
        oss << expression->toString(indent + 1);
        oss << context->toString(indent + 1);
        if (key) {
            oss << makeIndent(indent + 1) << "key:\n";
            oss << key->toString(indent + 2);
        }
        appendChildren(oss, indent + 1);
        if (elseBlock) {
            oss << elseBlock->toString(indent + 1);
        }
        return oss.str();
    }
};

// Pending, Then or Catch section of an await block
class BlockSectionNode : public ContainerNode {
public:
    NodeType kind;

    explicit BlockSectionNode(NodeType k) : kind(k) {}

    NodeType getType() const override { return kind; }

    bool hasContent() const {
        for (const auto& child : children) {
            if (child->getType() != NodeType::TEXT ||
                !static_cast<const TextNode*>(child.get())->isWhitespace()) {
                return true;
            }
        }
        return false;
    }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << nodeTypeToString(kind) << "\n";
        appendChildren(oss, indent + 1);
        return oss.str();
    }
};

// {#await expr}...{:then value}...{:catch error}...{/await}
class AwaitBlockNode : public ASTNode {
public:
    ExpressionPtr expression;
    std::string value;    // then binding pattern, empty if absent
    std::string error;    // catch binding pattern, empty if absent
    std::unique_ptr<BlockSectionNode> pending;
    std::unique_ptr<BlockSectionNode> then;
    std::unique_ptr<BlockSectionNode> catchBlock;

    AwaitBlockNode()
        : pending(new BlockSectionNode(NodeType::PENDING_BLOCK))
        , then(new BlockSectionNode(NodeType::THEN_BLOCK))
        , catchBlock(new BlockSectionNode(NodeType::CATCH_BLOCK))
    {}

    NodeType getType() const override { return NodeType::AWAIT_BLOCK; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "AwaitBlock";
        if (!value.empty()) oss << "(then " << value << ")";
        if (!error.empty()) oss << "(catch " << error << ")";
        oss << "\n";
        oss << expression->toString(indent + 1);
        oss << pending->toString(indent + 1);
        oss << then->toString(indent + 1);
        oss << catchBlock->toString(indent + 1);
        return oss.str();
    }
};

// =============================================================================
// Attributes and Directives
// =============================================================================

// name, name="text {expr}", name={expr} or {name}
class AttributeNode : public ASTNode {
public:
    std::string name;
    bool isTrue = false;             // valueless attribute
    std::vector<NodePtr> value;      // Text, MustacheTag or AttributeShorthand parts

    explicit AttributeNode(const std::string& n) : name(n) {}

    NodeType getType() const override { return NodeType::ATTRIBUTE; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "Attribute(" << name << (isTrue ? ", true" : "") << ")\n";
        for (const auto& part : value) {
            oss << part->toString(indent + 1);
        }
        return oss.str();
    }
};

class AttributeShorthandNode : public ASTNode {
public:
    ExpressionPtr expression;

    explicit AttributeShorthandNode(ExpressionPtr expr) : expression(std::move(expr)) {}

    NodeType getType() const override { return NodeType::ATTRIBUTE_SHORTHAND; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "AttributeShorthand(" << expression->code << ")\n";
        return oss.str();
    }
};

// on:, bind:, class:, let:, ref:, transition:/in:/out:, use:, animate:
class DirectiveNode : public ASTNode {
public:
    NodeType kind;
    std::string name;
    std::vector<std::string> modifiers;
    ExpressionPtr expression;   // nullptr if absent
    bool intro = false;         // transition: or in:
    bool outro = false;         // transition: or out:

    DirectiveNode(NodeType k, const std::string& n) : kind(k), name(n) {}

    NodeType getType() const override { return kind; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << nodeTypeToString(kind) << "(" << name;
        for (const auto& mod : modifiers) {
            oss << "|" << mod;
        }
        oss << ")\n";
        if (expression) {
            oss << expression->toString(indent + 1);
        }
        return oss.str();
    }
};

// {...expr}
class SpreadNode : public ASTNode {
public:
    ExpressionPtr expression;

    explicit SpreadNode(ExpressionPtr expr) : expression(std::move(expr)) {}

    NodeType getType() const override { return NodeType::SPREAD; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "Spread\n";
        oss << expression->toString(indent + 1);
        return oss.str();
    }
};

// =============================================================================
// Embedded Regions
// =============================================================================

// <script> or <style>. The body has been replaced by a placeholder before
// parsing; the original body travels in the snip marker attribute.
class EmbeddedBlockNode : public ASTNode {
public:
    NodeType kind;
    std::string name;                 // "script" or "style"
    std::vector<NodePtr> attributes;  // AttributeNodes, marker included
    std::string context;              // "default" or "module"
    std::string content;              // placeholder body as parsed

    EmbeddedBlockNode(NodeType k, const std::string& n)
        : kind(k), name(n), context("default") {}

    NodeType getType() const override { return kind; }

    // Text value of an attribute, or nullptr if absent or not plain text
    const std::string* getAttributeText(const std::string& attrName) const;

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << nodeTypeToString(kind) << "(" << context << ") "
            << rangeString() << "\n";
        for (const auto& attr : attributes) {
            oss << attr->toString(indent + 1);
        }
        return oss.str();
    }
};

// Synthetic root: hoisted script/style slots plus the markup fragment
class RootNode : public ASTNode {
public:
    std::unique_ptr<EmbeddedBlockNode> module;
    std::unique_ptr<EmbeddedBlockNode> instance;
    std::unique_ptr<EmbeddedBlockNode> css;
    std::unique_ptr<FragmentNode> html;

    RootNode() : html(new FragmentNode()) {}

    NodeType getType() const override { return NodeType::ROOT; }

    std::string toString(int indent = 0) const override {
        std::ostringstream oss;
        oss << makeIndent(indent) << "Root\n";
        if (module) oss << module->toString(indent + 1);
        if (instance) oss << instance->toString(indent + 1);
        if (css) oss << css->toString(indent + 1);
        oss << html->toString(indent + 1);
        return oss.str();
    }
};

// =============================================================================
// Element Vocabulary
// =============================================================================

// Elements that never have children or an end tag
bool isVoidElementName(const std::string& name);

// Elements rendered inline by browsers; whitespace around them is significant
bool isInlineElementName(const std::string& name);

// =============================================================================
// Attribute Lookup Helpers
// =============================================================================

// Text value of the named attribute in an attribute list, or nullptr when the
// attribute is absent, valueless, or has no text part
inline const std::string* findAttributeText(const std::vector<NodePtr>& attributes,
                                            const std::string& attrName) {
    for (const auto& attr : attributes) {
        if (attr->getType() != NodeType::ATTRIBUTE) {
            continue;
        }
        const AttributeNode* a = static_cast<const AttributeNode*>(attr.get());
        if (a->name != attrName || a->isTrue) {
            continue;
        }
        for (const auto& part : a->value) {
            if (part->getType() == NodeType::TEXT) {
                return &static_cast<const TextNode*>(part.get())->data;
            }
        }
        return nullptr;
    }
    return nullptr;
}

inline const std::string* EmbeddedBlockNode::getAttributeText(const std::string& attrName) const {
    return findAttributeText(attributes, attrName);
}

} // namespace SvelteFormat

#endif // SVELTEFORMAT_AST_H

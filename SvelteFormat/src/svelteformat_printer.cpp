//
// svelteformat_printer.cpp
// SvelteFormat - AST to Doc Printer Implementation
//

#include "svelteformat_printer.h"
#include "svelteformat_children.h"
#include "svelteformat_snip.h"
#include <algorithm>
#include <cctype>

namespace SvelteFormat {

using namespace DocBuilders;

// Attributes whose value may be re-flowed
static bool isFormattableAttribute(const std::string& name) {
    return name == "class";
}

static std::string trimmed(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(first, last - first + 1);
}

static std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static std::vector<std::string> splitOnNewlines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t newline = text.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, newline - start));
        start = newline + 1;
    }
    return lines;
}

bool isIgnoreDirective(const ASTNode& node) {
    if (node.getType() != NodeType::COMMENT) {
        return false;
    }
    std::string data = trimmed(static_cast<const CommentNode&>(node).data);
    return data == "sveltefmt-ignore" || data == "prettier-ignore";
}

// =============================================================================
// Construction
// =============================================================================

Printer::Printer(const std::string& source, const FormatterOptions& options,
                 const EmbeddedFormatterRegistry& registry)
    : m_source(source)
    , m_options(options)
    , m_registry(registry)
{
}

Doc Printer::print(const RootNode& root) const {
    PrintState state;
    PrintPath rootPath(&root, nullptr);
    Context ctx{state, root};
    return printPath(rootPath, ctx);
}

// =============================================================================
// Dispatch
// =============================================================================

Doc Printer::printPath(const PrintPath& path, Context& ctx) const {
    const ASTNode& node = *path.node;

    if (ctx.state.ignoreNext && !isEmptyNode(node)) {
        ctx.state.ignoreNext = false;
        return printVerbatim(node);
    }

    switch (node.getType()) {
        case NodeType::ROOT:
            return printRoot(static_cast<const RootNode&>(node), path, ctx);

        case NodeType::FRAGMENT:
            return printFragment(static_cast<const FragmentNode&>(node), path, ctx);

        case NodeType::ELEMENT:
        case NodeType::INLINE_COMPONENT:
        case NodeType::SLOT:
        case NodeType::WINDOW:
        case NodeType::HEAD:
        case NodeType::TITLE:
            return printElement(static_cast<const ElementNode&>(node), path, ctx);

        case NodeType::OPTIONS:
        case NodeType::BODY:
            return printSpecialElement(static_cast<const ElementNode&>(node), path, ctx);

        case NodeType::TEXT:
            return printText(static_cast<const TextNode&>(node), path);

        case NodeType::MUSTACHE_TAG:
            return concat({text("{"),
                           printExpression(*static_cast<const MustacheTagNode&>(node).expression),
                           text("}")});

        case NodeType::RAW_MUSTACHE_TAG:
            return concat({text("{@html "),
                           printExpression(*static_cast<const MustacheTagNode&>(node).expression),
                           text("}")});

        case NodeType::IF_BLOCK:
            return printIfBlock(static_cast<const IfBlockNode&>(node), path, ctx);

        case NodeType::ELSE_BLOCK:
            return printElseBlock(static_cast<const ElseBlockNode&>(node), path, ctx);

        case NodeType::EACH_BLOCK:
            return printEachBlock(static_cast<const EachBlockNode&>(node), path, ctx);

        case NodeType::AWAIT_BLOCK:
            return printAwaitBlock(static_cast<const AwaitBlockNode&>(node), path, ctx);

        case NodeType::PENDING_BLOCK:
        case NodeType::THEN_BLOCK:
        case NodeType::CATCH_BLOCK:
            return printBlockSection(static_cast<const BlockSectionNode&>(node), path, ctx);

        case NodeType::ATTRIBUTE:
            return printAttribute(static_cast<const AttributeNode&>(node), path, ctx);

        case NodeType::ATTRIBUTE_SHORTHAND:
            return printExpression(*static_cast<const AttributeShorthandNode&>(node).expression);

        case NodeType::EVENT_HANDLER:
        case NodeType::BINDING:
        case NodeType::CLASS_DIRECTIVE:
        case NodeType::LET_DIRECTIVE:
        case NodeType::REF_DIRECTIVE:
        case NodeType::TRANSITION:
        case NodeType::ACTION:
        case NodeType::ANIMATION:
            return printDirective(static_cast<const DirectiveNode&>(node));

        case NodeType::SPREAD:
            return concat({line(), text("{..."),
                           printExpression(*static_cast<const SpreadNode&>(node).expression),
                           text("}")});

        case NodeType::DEBUG_TAG: {
            const DebugTagNode& debug = static_cast<const DebugTagNode&>(node);
            std::vector<Doc> ids;
            for (const auto& id : debug.identifiers) {
                ids.push_back(printExpression(*id));
            }
            return concat({text("{@debug"),
                           ids.empty() ? text("") : concat({text(" "), join(text(", "), ids)}),
                           text("}")});
        }

        case NodeType::COMMENT:
            return printComment(static_cast<const CommentNode&>(node), path, ctx);

        case NodeType::SCRIPT:
        case NodeType::STYLE:
            return printEmbeddedBlock(static_cast<const EmbeddedBlockNode&>(node), path, ctx);

        case NodeType::EXPRESSION:
            return printExpression(static_cast<const ExpressionNode&>(node));
    }

    throw PrinterError(std::string("no printing rule for node type ") +
                       nodeTypeToString(node.getType()));
}

// =============================================================================
// Structure
// =============================================================================

Doc Printer::printRoot(const RootNode& root, const PrintPath& path, Context& ctx) const {
    std::vector<Doc> parts;

    for (Section section : sortOrderSections(m_options.sort_order)) {
        switch (section) {
            case Section::SCRIPTS:
                if (root.module) {
                    parts.push_back(concat({printHoistedBlock(*root.module, path, ctx), hardline()}));
                }
                if (root.instance) {
                    parts.push_back(concat({printHoistedBlock(*root.instance, path, ctx), hardline()}));
                }
                break;
            case Section::STYLES:
                if (root.css) {
                    parts.push_back(concat({printHoistedBlock(*root.css, path, ctx), hardline()}));
                }
                break;
            case Section::MARKUP: {
                Doc html = printPath(path.child(root.html.get()), ctx);
                if (!isEmptyDoc(html)) {
                    parts.push_back(html);
                }
                break;
            }
        }
    }

    ctx.state.ignoreNext = false;
    return group(join(hardline(), parts));
}

Doc Printer::printHoistedBlock(const EmbeddedBlockNode& block, const PrintPath& rootPath,
                               Context& ctx) const {
    // An ignore comment right before the block travels with it
    for (const auto& child : ctx.root.html->children) {
        if (child->end == block.start && isIgnoreDirective(*child)) {
            std::string data = static_cast<const CommentNode&>(*child).data;
            return concat({text("<!--" + data + "-->"), hardline(), printVerbatim(block)});
        }
    }
    return printPath(rootPath.child(&block), ctx);
}

Doc Printer::printFragment(const FragmentNode& fragment, const PrintPath& path, Context& ctx) const {
    const std::vector<NodePtr>& children = fragment.children;
    bool allEmpty = std::all_of(children.begin(), children.end(),
                                [](const NodePtr& child) { return isEmptyNode(*child); });
    if (allEmpty) {
        return text("");
    }

    if (isPreTagContent(path)) {
        return concat(printChildren(children, path, ctx));
    }

    std::vector<Doc> docs = trim(printChildren(children, path, ctx), isLine);
    if (isEmptyGroup(docs)) {
        return text("");
    }
    docs.push_back(hardline());
    return concat(docs);
}

Doc Printer::printElement(const ElementNode& element, const PrintPath& path, Context& ctx) const {
    bool supportedLanguage = !(element.name == "template" &&
                               !isSupportedTemplateLanguage(declaredLanguage(element.attributes)));
    bool isEmpty = std::all_of(element.children.begin(), element.children.end(),
                               [](const NodePtr& child) { return isEmptyNode(*child); });
    bool isSelfClosing = isEmpty &&
                         (!m_options.strict_mode ||
                          element.kind != NodeType::ELEMENT ||
                          isVoidElementName(element.name));

    Doc body;
    if (isEmpty) {
        body = text("");
    } else if (!supportedLanguage) {
        body = text(printRaw(element));
    } else if (isInlineElement(element) || isPreTagContent(path)) {
        body = printIndentedPreservingWhitespace(element.children, path, ctx);
    } else {
        body = printIndentedWithNewlines(element.children, path, ctx);
    }

    std::vector<Doc> attrParts;
    if (element.kind == NodeType::INLINE_COMPONENT && element.expression) {
        attrParts.push_back(concat({line(), text("this="), printWrappedExpression(*element.expression)}));
    }
    std::vector<Doc> attrs = printAttributeList(element.attributes, path, ctx);
    attrParts.insert(attrParts.end(), attrs.begin(), attrs.end());
    if (m_options.bracket_new_line) {
        attrParts.push_back(dedent(isSelfClosing ? line() : softline()));
    }

    std::vector<Doc> parts = {
        text("<"),
        text(element.name),
        indent(group(concat(attrParts)))
    };
    if (isSelfClosing) {
        parts.push_back(text(m_options.bracket_new_line ? "" : " "));
        parts.push_back(text("/>"));
    } else {
        parts.push_back(text(">"));
        parts.push_back(body);
        parts.push_back(text("</" + element.name + ">"));
    }
    return group(concat(parts));
}

// <svelte:options> and <svelte:body> always self-close
Doc Printer::printSpecialElement(const ElementNode& element, const PrintPath& path, Context& ctx) const {
    return group(concat({
        text("<"),
        text(element.name),
        indent(group(concat(printAttributeList(element.attributes, path, ctx)))),
        text(" />")
    }));
}

Doc Printer::printText(const TextNode& node, const PrintPath& path) const {
    if (isPreTagContent(path)) {
        return text(node.data);
    }

    if (node.isWhitespace()) {
        // A whitespace-only text is a line that survives only if it held a
        // blank line; otherwise it is dropped when lonely
        bool blankLine = std::count(node.raw.begin(), node.raw.end(), '\n') >= 2;
        return whitespaceLine(blankLine);
    }

    // Words are joined by lines, and the fill breaks wherever the line runs out
    return fill(splitTextToDocs(node.raw));
}

Doc Printer::printComment(const CommentNode& comment, const PrintPath& path, Context& ctx) const {
    if (isIgnoreDirective(comment)) {
        const ASTNode* next = findNextSibling(path);
        if (!next && hoistedBlockAt(ctx.root, comment.end)) {
            // Printed together with the hoisted block it precedes
            return text("");
        }
        if (findNextContentSibling(path)) {
            ctx.state.ignoreNext = true;
        }
    }

    std::string data = comment.data;
    if (hasSnippedContent(data)) {
        data = unsnipContent(data);
    }
    return group(concat({text("<!--"), text(data), text("-->")}));
}

Doc Printer::printEmbeddedBlock(const EmbeddedBlockNode& block, const PrintPath& path, Context& ctx) const {
    EmbeddedKind kind = block.kind == NodeType::SCRIPT ? EmbeddedKind::SCRIPT : EmbeddedKind::STYLE;
    EmbeddedRequest request(kind, declaredLanguage(block.attributes));

    EmbeddedResult result = m_registry.format(getSnippedContent(block), request);
    if (!result.formatted) {
        return printVerbatim(block);
    }

    Doc openTag = group(concat({
        text("<"),
        text(block.name),
        indent(group(concat(printAttributeList(block.attributes, path, ctx)))),
        text(">")
    }));
    Doc closeTag = text("</" + block.name + ">");

    if (trimmed(result.text).empty()) {
        return concat({openTag, closeTag});
    }

    std::string prefix = m_options.indent_script_and_style ? m_options.indentUnit() : "";
    std::vector<Doc> parts = {openTag};
    for (const auto& codeLine : splitOnNewlines(result.text)) {
        parts.push_back(literalline());
        if (!codeLine.empty()) {
            parts.push_back(text(prefix + codeLine));
        }
    }
    parts.push_back(literalline());
    parts.push_back(closeTag);
    return concat(parts);
}

// =============================================================================
// Blocks
// =============================================================================

// Control-flow blocks always break, each branch on its own lines

Doc Printer::printIfBlock(const IfBlockNode& block, const PrintPath& path, Context& ctx) const {
    std::vector<Doc> def = {
        text("{#if "),
        printExpression(*block.expression),
        text("}"),
        printIndentedWithNewlines(block.children, path, ctx)
    };
    if (block.elseBlock) {
        def.push_back(printPath(path.child(block.elseBlock.get()), ctx));
    }
    def.push_back(text("{/if}"));
    def.push_back(breakParent());
    return group(concat(def));
}

Doc Printer::printElseBlock(const ElseBlockNode& block, const PrintPath& path, Context& ctx) const {
    const ASTNode* parent = path.parentNode();

    // {:else if}: only when the nested if block is the sole child
    if (block.children.size() == 1 &&
        block.children[0]->getType() == NodeType::IF_BLOCK &&
        !(parent && parent->getType() == NodeType::EACH_BLOCK)) {
        const IfBlockNode& ifNode = static_cast<const IfBlockNode&>(*block.children[0]);
        PrintPath ifPath = path.child(&ifNode, &block.children);

        std::vector<Doc> def = {
            text("{:else if "),
            printExpression(*ifNode.expression),
            text("}"),
            printIndentedWithNewlines(ifNode.children, ifPath, ctx)
        };
        if (ifNode.elseBlock) {
            def.push_back(printPath(ifPath.child(ifNode.elseBlock.get()), ctx));
        }
        def.push_back(breakParent());
        return group(concat(def));
    }

    return group(concat({text("{:else}"), printIndentedWithNewlines(block.children, path, ctx),
                         breakParent()}));
}

Doc Printer::printEachBlock(const EachBlockNode& block, const PrintPath& path, Context& ctx) const {
    std::vector<Doc> def = {
        text("{#each "),
        printExpression(*block.expression),
        text(" as "),
        printExpression(*block.context)
    };
    if (!block.index.empty()) {
        def.push_back(text(", " + block.index));
    }
    if (block.key) {
        def.push_back(text(" ("));
        def.push_back(printExpression(*block.key));
        def.push_back(text(")"));
    }
    def.push_back(text("}"));
    def.push_back(printIndentedWithNewlines(block.children, path, ctx));
    if (block.elseBlock) {
        def.push_back(printPath(path.child(block.elseBlock.get()), ctx));
    }
    def.push_back(text("{/each}"));
    def.push_back(breakParent());
    return group(concat(def));
}

Doc Printer::printAwaitBlock(const AwaitBlockNode& block, const PrintPath& path, Context& ctx) const {
    bool hasPending = block.pending->hasContent();
    bool hasThen = block.then->hasContent();
    bool hasCatch = block.catchBlock->hasContent();

    auto binding = [](const std::string& pattern) {
        return text(pattern.empty() ? "" : " " + pattern);
    };

    std::vector<Doc> parts;
    if (!hasPending && hasThen) {
        parts.push_back(group(concat({text("{#await "), printExpression(*block.expression),
                                      text(" then"), binding(block.value), text("}")})));
        parts.push_back(indent(printPath(path.child(block.then.get()), ctx)));
    } else {
        parts.push_back(group(concat({text("{#await "), printExpression(*block.expression), text("}")})));
        if (hasPending) {
            parts.push_back(indent(printPath(path.child(block.pending.get()), ctx)));
        }
        if (hasThen) {
            parts.push_back(group(concat({text("{:then"), binding(block.value), text("}")})));
            parts.push_back(indent(printPath(path.child(block.then.get()), ctx)));
        }
    }
    if (hasCatch) {
        parts.push_back(group(concat({text("{:catch"), binding(block.error), text("}")})));
        parts.push_back(indent(printPath(path.child(block.catchBlock.get()), ctx)));
    }
    parts.push_back(text("{/await}"));
    parts.push_back(breakParent());
    return group(concat(parts));
}

Doc Printer::printBlockSection(const BlockSectionNode& section, const PrintPath& path, Context& ctx) const {
    std::vector<Doc> parts = {softline()};
    std::vector<Doc> children = trim(printChildren(section.children, path, ctx), isLine);
    parts.insert(parts.end(), children.begin(), children.end());
    parts.push_back(dedent(softline()));
    return concat(parts);
}

// =============================================================================
// Attributes
// =============================================================================

std::vector<Doc> Printer::printAttributeList(const std::vector<NodePtr>& attributes,
                                             const PrintPath& path, Context& ctx) const {
    std::vector<Doc> docs;
    for (const auto& attr : attributes) {
        if (isSnippedContentAttribute(*attr)) {
            continue;
        }
        docs.push_back(printPath(path.child(attr.get(), &attributes), ctx));
    }
    return docs;
}

Doc Printer::printAttribute(const AttributeNode& attr, const PrintPath& path, Context& ctx) const {
    bool loneMustache = !attr.isTrue && attr.value.size() == 1 &&
                        attr.value[0]->getType() == NodeType::MUSTACHE_TAG;
    bool shorthand = !attr.isTrue && attr.value.size() == 1 &&
                     attr.value[0]->getType() == NodeType::ATTRIBUTE_SHORTHAND;
    if (loneMustache) {
        const MustacheTagNode& tag = static_cast<const MustacheTagNode&>(*attr.value[0]);
        shorthand = tag.expression->isIdentifierNamed(attr.name);
    }

    if (shorthand) {
        if (m_options.strict_mode) {
            return concat({line(), text(attr.name + "=\"{" + attr.name + "}\"")});
        }
        if (m_options.allow_shorthand) {
            return concat({line(), text("{" + attr.name + "}")});
        }
        return concat({line(), text(attr.name + "={" + attr.name + "}")});
    }

    if (attr.isTrue) {
        return concat({line(), text(attr.name)});
    }

    bool quotes = !loneMustache || m_options.strict_mode;
    Doc value = printAttributeValue(attr, path, ctx, quotes);
    if (!quotes) {
        return concat({line(), text(attr.name), text("="), value});
    }

    // Keep the outer grammar intact when the value itself holds a double quote
    std::string quote = "\"";
    for (const auto& part : attr.value) {
        if (part->getType() == NodeType::TEXT &&
            static_cast<const TextNode&>(*part).raw.find('"') != std::string::npos) {
            quote = "'";
            break;
        }
    }
    return concat({line(), text(attr.name), text("="), text(quote), value, text(quote)});
}

Doc Printer::printAttributeValue(const AttributeNode& attr, const PrintPath& path, Context& ctx,
                                 bool quotes) const {
    std::vector<Doc> valueDocs;
    for (const auto& part : attr.value) {
        valueDocs.push_back(printPath(path.child(part.get(), &attr.value), ctx));
    }
    if (!quotes || !isFormattableAttribute(attr.name)) {
        return concat(valueDocs);
    }
    return indent(group(concat(trim(valueDocs, isLine))));
}

Doc Printer::printDirective(const DirectiveNode& directive) const {
    std::string keyword;
    bool omitSelfNamedExpression = false;
    bool printsExpression = true;

    switch (directive.kind) {
        case NodeType::EVENT_HANDLER:
            keyword = "on";
            break;
        case NodeType::BINDING:
            keyword = "bind";
            omitSelfNamedExpression = true;
            break;
        case NodeType::CLASS_DIRECTIVE:
            keyword = "class";
            omitSelfNamedExpression = true;
            break;
        case NodeType::LET_DIRECTIVE:
            keyword = "let";
            omitSelfNamedExpression = true;
            break;
        case NodeType::REF_DIRECTIVE:
            keyword = "ref";
            printsExpression = false;
            break;
        case NodeType::TRANSITION:
            keyword = directive.intro && directive.outro ? "transition" : directive.intro ? "in" : "out";
            break;
        case NodeType::ACTION:
            keyword = "use";
            break;
        case NodeType::ANIMATION:
            keyword = "animate";
            break;
        default:
            throw PrinterError(std::string("not a directive: ") + nodeTypeToString(directive.kind));
    }

    std::vector<Doc> parts = {line(), text(keyword + ":" + directive.name)};
    if (!directive.modifiers.empty()) {
        std::vector<Doc> modifiers;
        for (const auto& modifier : directive.modifiers) {
            modifiers.push_back(text(modifier));
        }
        parts.push_back(concat({text("|"), join(text("|"), modifiers)}));
    }
    if (printsExpression && directive.expression &&
        !(omitSelfNamedExpression && directive.expression->isIdentifierNamed(directive.name))) {
        parts.push_back(text("="));
        parts.push_back(printWrappedExpression(*directive.expression));
    }
    return concat(parts);
}

// =============================================================================
// Children
// =============================================================================

std::vector<Doc> Printer::printChildren(const std::vector<NodePtr>& children, const PrintPath& path,
                                        Context& ctx) const {
    ChildFlattener flattener(isPreTagContent(path));
    for (const auto& child : children) {
        if (isConsumedIgnoreComment(*child, children, ctx.root)) {
            continue;
        }
        PrintPath childPath = path.child(child.get(), &children);
        flattener.add(*child, printPath(childPath, ctx));
    }
    // An ignore comment never reaches past its own siblings
    ctx.state.ignoreNext = false;
    return flattener.finish();
}

Doc Printer::printIndentedWithNewlines(const std::vector<NodePtr>& children, const PrintPath& path,
                                       Context& ctx) const {
    std::vector<Doc> parts = {softline()};
    std::vector<Doc> docs = trim(printChildren(children, path, ctx), isLine);
    parts.insert(parts.end(), docs.begin(), docs.end());
    parts.push_back(dedent(softline()));
    return indent(concat(parts));
}

Doc Printer::printIndentedPreservingWhitespace(const std::vector<NodePtr>& children,
                                               const PrintPath& path, Context& ctx) const {
    return indent(concat(dedentFinalNewline(printChildren(children, path, ctx))));
}

// =============================================================================
// Source Slices
// =============================================================================

std::string Printer::sourceSlice(const ASTNode& node) const {
    if (node.start >= m_source.size() || node.end <= node.start) {
        return "";
    }
    return m_source.substr(node.start, node.end - node.start);
}

// Original source text, raw newlines included
Doc Printer::printVerbatim(const ASTNode& node) const {
    std::string slice = sourceSlice(node);
    if (hasSnippedContent(slice)) {
        slice = unsnipContent(slice);
    }

    std::vector<std::string> lines = splitOnNewlines(slice);
    std::vector<Doc> parts;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            parts.push_back(literalline());
        }
        parts.push_back(text(lines[i]));
    }
    return concat(parts);
}

// Body of an element in a language we cannot format, as written
std::string Printer::printRaw(const ElementNode& element) const {
    if (element.children.empty()) {
        return "";
    }
    size_t start = element.children.front()->start;
    size_t end = element.children.back()->end;
    if (end <= start || start >= m_source.size()) {
        return "";
    }
    return m_source.substr(start, end - start);
}

// =============================================================================
// Expressions
// =============================================================================

Doc Printer::printExpression(const ExpressionNode& expr) const {
    return text(m_registry.formatExpression(expr.code));
}

// {expr}, or "{expr}" in strict mode
Doc Printer::printWrappedExpression(const ExpressionNode& expr) const {
    const char* open = m_options.strict_mode ? "\"{" : "{";
    const char* close = m_options.strict_mode ? "}\"" : "}";
    return concat({text(open), printExpression(expr), text(close)});
}

// =============================================================================
// Path Queries
// =============================================================================

bool Printer::isPreTagContent(const PrintPath& path) const {
    for (const PrintPath* p = &path; p; p = p->parent) {
        NodeType type = p->node->getType();
        if (type == NodeType::ELEMENT &&
            toLower(static_cast<const ElementNode*>(p->node)->name) == "pre") {
            return true;
        }
        if (type == NodeType::ATTRIBUTE &&
            !isFormattableAttribute(static_cast<const AttributeNode*>(p->node)->name)) {
            return true;
        }
    }
    return false;
}

const ASTNode* Printer::findNextSibling(const PrintPath& path) const {
    if (!path.siblings) {
        return nullptr;
    }
    for (const auto& sibling : *path.siblings) {
        if (sibling.get() != path.node && sibling->start == path.node->end) {
            return sibling.get();
        }
    }
    return nullptr;
}

// First following sibling that is not whitespace-only text
const ASTNode* Printer::findNextContentSibling(const PrintPath& path) const {
    if (!path.siblings) {
        return nullptr;
    }
    bool seen = false;
    for (const auto& sibling : *path.siblings) {
        if (sibling.get() == path.node) {
            seen = true;
        } else if (seen && !isEmptyNode(*sibling)) {
            return sibling.get();
        }
    }
    return nullptr;
}

const EmbeddedBlockNode* Printer::hoistedBlockAt(const RootNode& root, size_t start) const {
    const EmbeddedBlockNode* blocks[] = {root.module.get(), root.instance.get(), root.css.get()};
    for (const EmbeddedBlockNode* block : blocks) {
        if (block && block->start == start) {
            return block;
        }
    }
    return nullptr;
}

bool Printer::isConsumedIgnoreComment(const ASTNode& node, const std::vector<NodePtr>& siblings,
                                      const RootNode& root) const {
    if (!isIgnoreDirective(node) || !hoistedBlockAt(root, node.end)) {
        return false;
    }
    for (const auto& sibling : siblings) {
        if (sibling.get() != &node && sibling->start == node.end) {
            return false;
        }
    }
    return true;
}

} // namespace SvelteFormat

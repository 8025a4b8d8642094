//
// svelteformat_printer.h
// SvelteFormat - AST to Doc Printer
//
// Maps every node kind to a Doc. The walk carries an explicit cursor
// (PrintPath, rebuilt on the stack for each call) and an explicit
// per-invocation state (PrintState), so one Printer can be used from
// several threads or re-entered while printing.
//

#ifndef SVELTEFORMAT_PRINTER_H
#define SVELTEFORMAT_PRINTER_H

#include "svelteformat_ast.h"
#include "svelteformat_doc.h"
#include "svelteformat_embed.h"
#include "svelteformat_options.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace SvelteFormat {

// A node kind without a printing rule: the parser and printer disagree
class PrinterError : public std::logic_error {
public:
    explicit PrinterError(const std::string& msg) : std::logic_error(msg) {}
};

// Transient state of one print invocation
struct PrintState {
    bool ignoreNext;    // an ignore comment suppresses the next sibling

    PrintState() : ignoreNext(false) {}
};

// Cursor: current node, its ancestors, and the sibling list it lives in
struct PrintPath {
    const ASTNode* node;
    const PrintPath* parent;
    const std::vector<NodePtr>* siblings;

    PrintPath(const ASTNode* n, const PrintPath* p, const std::vector<NodePtr>* s = nullptr)
        : node(n), parent(p), siblings(s) {}

    PrintPath child(const ASTNode* n, const std::vector<NodePtr>* s = nullptr) const {
        return PrintPath(n, this, s);
    }

    const ASTNode* parentNode() const {
        return parent ? parent->node : nullptr;
    }
};

class Printer {
public:
    // source is the preprocessed text the tree was parsed from
    Printer(const std::string& source, const FormatterOptions& options,
            const EmbeddedFormatterRegistry& registry);

    // Print a whole component
    Doc print(const RootNode& root) const;

private:
    struct Context {
        PrintState& state;
        const RootNode& root;
    };

    Doc printPath(const PrintPath& path, Context& ctx) const;

    // Structure
    Doc printRoot(const RootNode& root, const PrintPath& path, Context& ctx) const;
    Doc printHoistedBlock(const EmbeddedBlockNode& block, const PrintPath& rootPath, Context& ctx) const;
    Doc printFragment(const FragmentNode& fragment, const PrintPath& path, Context& ctx) const;
    Doc printElement(const ElementNode& element, const PrintPath& path, Context& ctx) const;
    Doc printSpecialElement(const ElementNode& element, const PrintPath& path, Context& ctx) const;
    Doc printText(const TextNode& text, const PrintPath& path) const;
    Doc printComment(const CommentNode& comment, const PrintPath& path, Context& ctx) const;
    Doc printEmbeddedBlock(const EmbeddedBlockNode& block, const PrintPath& path, Context& ctx) const;

    // Blocks
    Doc printIfBlock(const IfBlockNode& block, const PrintPath& path, Context& ctx) const;
    Doc printElseBlock(const ElseBlockNode& block, const PrintPath& path, Context& ctx) const;
    Doc printEachBlock(const EachBlockNode& block, const PrintPath& path, Context& ctx) const;
    Doc printAwaitBlock(const AwaitBlockNode& block, const PrintPath& path, Context& ctx) const;
    Doc printBlockSection(const BlockSectionNode& section, const PrintPath& path, Context& ctx) const;

    // Attributes
    Doc printAttribute(const AttributeNode& attr, const PrintPath& path, Context& ctx) const;
    Doc printAttributeValue(const AttributeNode& attr, const PrintPath& path, Context& ctx, bool quotes) const;
    Doc printDirective(const DirectiveNode& directive) const;
    std::vector<Doc> printAttributeList(const std::vector<NodePtr>& attributes, const PrintPath& path,
                                        Context& ctx) const;

    // Children
    std::vector<Doc> printChildren(const std::vector<NodePtr>& children, const PrintPath& path,
                                   Context& ctx) const;
    Doc printIndentedWithNewlines(const std::vector<NodePtr>& children, const PrintPath& path,
                                  Context& ctx) const;
    Doc printIndentedPreservingWhitespace(const std::vector<NodePtr>& children, const PrintPath& path,
                                          Context& ctx) const;

    // Source slices
    Doc printVerbatim(const ASTNode& node) const;
    std::string printRaw(const ElementNode& element) const;
    std::string sourceSlice(const ASTNode& node) const;

    // Expressions
    Doc printExpression(const ExpressionNode& expr) const;
    Doc printWrappedExpression(const ExpressionNode& expr) const;

    bool isPreTagContent(const PrintPath& path) const;
    const ASTNode* findNextSibling(const PrintPath& path) const;
    const ASTNode* findNextContentSibling(const PrintPath& path) const;
    const EmbeddedBlockNode* hoistedBlockAt(const RootNode& root, size_t start) const;
    bool isConsumedIgnoreComment(const ASTNode& node, const std::vector<NodePtr>& siblings,
                                 const RootNode& root) const;

    const std::string& m_source;
    const FormatterOptions& m_options;
    const EmbeddedFormatterRegistry& m_registry;
};

// True for "sveltefmt-ignore" and "prettier-ignore" comments
bool isIgnoreDirective(const ASTNode& node);

} // namespace SvelteFormat

#endif // SVELTEFORMAT_PRINTER_H

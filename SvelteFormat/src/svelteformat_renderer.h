//
// svelteformat_renderer.h
// SvelteFormat - Document Renderer
//
// Turns a Doc plus a width budget into text. A single pass walks the doc
// with an explicit command stack; every GROUP decides flat versus broken by
// measuring its flat form against the remainder of the current line.
//

#ifndef SVELTEFORMAT_RENDERER_H
#define SVELTEFORMAT_RENDERER_H

#include "svelteformat_doc.h"
#include <string>
#include <vector>
#include <unordered_map>

namespace SvelteFormat {

struct RenderOptions {
    int print_width;
    int tab_width;
    bool use_tabs;

    RenderOptions()
        : print_width(80)
        , tab_width(2)
        , use_tabs(false)
    {}
};

class DocRenderer {
public:
    explicit DocRenderer(const RenderOptions& options = RenderOptions());

    // Render a document. Deterministic: the same doc and options always
    // produce the same text. The doc is never modified.
    std::string render(const Doc& doc);

private:
    enum class Mode {
        BREAK,
        FLAT
    };

    struct Command {
        int indent;
        Mode mode;
        const DocNode* doc;
        size_t fillOffset;   // first unprocessed part of a FILL

        Command(int i, Mode m, const DocNode* d, size_t offset = 0)
            : indent(i), mode(m), doc(d), fillOffset(offset) {}
    };

    // Does the flat rendering of `next` (followed by restCommands up to the
    // next possible line break) fit in `width` columns?
    bool fits(std::vector<Command> next, const std::vector<Command>& restCommands,
              int width, bool mustBeFlat);

    // Whether a group is forced broken by a BREAK_PARENT somewhere inside it
    bool isForcedBroken(const DocNode* group);

    // Whether a subtree contains a BREAK_PARENT (memoised per node)
    bool containsBreakParent(const DocNode* doc);

    std::string makeIndent(int level) const;
    int indentWidth(int level) const;

    static void trimTrailingWhitespace(std::string& out);

    RenderOptions m_options;
    std::unordered_map<const DocNode*, bool> m_breakCache;
};

// Convenience wrapper
std::string renderDoc(const Doc& doc, const RenderOptions& options = RenderOptions());

} // namespace SvelteFormat

#endif // SVELTEFORMAT_RENDERER_H

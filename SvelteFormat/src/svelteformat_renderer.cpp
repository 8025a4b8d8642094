//
// svelteformat_renderer.cpp
// SvelteFormat - Document Renderer Implementation
//

#include "svelteformat_renderer.h"
#include "../runtime/unicode_runtime.h"
#include <algorithm>

namespace SvelteFormat {

// Column width of text up to its first newline; hasNewline reports whether
// the text continues on another line
static int textWidthToNewline(const std::string& text, bool& hasNewline) {
    size_t newline = text.find('\n');
    hasNewline = newline != std::string::npos;
    size_t len = hasNewline ? newline : text.size();
    return static_cast<int>(unicode_display_width(text.data(), len));
}

// Column reached after emitting text starting at column pos
static int advanceColumn(int pos, const std::string& text) {
    size_t newline = text.rfind('\n');
    if (newline == std::string::npos) {
        return pos + static_cast<int>(unicode_display_width(text.data(), text.size()));
    }
    return static_cast<int>(unicode_display_width(text.data() + newline + 1,
                                                  text.size() - newline - 1));
}

DocRenderer::DocRenderer(const RenderOptions& options)
    : m_options(options) {
}

std::string DocRenderer::makeIndent(int level) const {
    if (level <= 0) {
        return "";
    }
    if (m_options.use_tabs) {
        return std::string(level, '\t');
    }
    return std::string(static_cast<size_t>(level) * m_options.tab_width, ' ');
}

int DocRenderer::indentWidth(int level) const {
    return level <= 0 ? 0 : level * m_options.tab_width;
}

void DocRenderer::trimTrailingWhitespace(std::string& out) {
    size_t end = out.size();
    while (end > 0 && (out[end - 1] == ' ' || out[end - 1] == '\t')) {
        end--;
    }
    out.resize(end);
}

// =============================================================================
// Break Propagation
// =============================================================================

bool DocRenderer::containsBreakParent(const DocNode* doc) {
    if (!doc) {
        return false;
    }

    auto cached = m_breakCache.find(doc);
    if (cached != m_breakCache.end()) {
        return cached->second;
    }

    bool result = false;
    switch (doc->type) {
        case DocType::BREAK_PARENT:
            result = true;
            break;
        case DocType::CONCAT:
        case DocType::FILL:
            // Every part is visited so nested groups get their own entry
            for (const auto& part : doc->parts) {
                if (containsBreakParent(part.get())) {
                    result = true;
                }
            }
            break;
        case DocType::INDENT:
        case DocType::DEDENT:
        case DocType::GROUP:
            result = containsBreakParent(doc->contents.get());
            break;
        case DocType::LINE:
            result = doc->lineMode == LineMode::HARD || doc->lineMode == LineMode::LITERAL;
            break;
        case DocType::TEXT:
            result = false;
            break;
    }

    m_breakCache[doc] = result;
    return result;
}

bool DocRenderer::isForcedBroken(const DocNode* group) {
    return containsBreakParent(group);
}

// =============================================================================
// Fit Measurement
// =============================================================================

bool DocRenderer::fits(std::vector<Command> next, const std::vector<Command>& restCommands,
                       int width, bool mustBeFlat) {
    size_t restIdx = restCommands.size();
    std::vector<Command>& cmds = next;

    while (width >= 0) {
        if (cmds.empty()) {
            if (restIdx == 0) {
                return true;
            }
            cmds.push_back(restCommands[restIdx - 1]);
            restIdx--;
            continue;
        }

        Command cmd = cmds.back();
        cmds.pop_back();
        const DocNode* doc = cmd.doc;

        switch (doc->type) {
            case DocType::TEXT: {
                bool hasNewline = false;
                width -= textWidthToNewline(doc->text, hasNewline);
                if (hasNewline) {
                    return width >= 0;
                }
                break;
            }

            case DocType::CONCAT:
            case DocType::FILL:
                for (size_t i = doc->parts.size(); i > cmd.fillOffset; i--) {
                    cmds.emplace_back(cmd.indent, cmd.mode, doc->parts[i - 1].get());
                }
                break;

            case DocType::INDENT:
            case DocType::DEDENT:
                cmds.emplace_back(cmd.indent, cmd.mode, doc->contents.get());
                break;

            case DocType::GROUP: {
                bool broken = isForcedBroken(doc);
                if (mustBeFlat && broken) {
                    return false;
                }
                cmds.emplace_back(cmd.indent, broken ? Mode::BREAK : cmd.mode, doc->contents.get());
                break;
            }

            case DocType::LINE:
                if (cmd.mode == Mode::BREAK ||
                    doc->lineMode == LineMode::HARD ||
                    doc->lineMode == LineMode::LITERAL) {
                    return true;
                }
                if (doc->lineMode == LineMode::NORMAL) {
                    width -= 1;
                }
                break;

            case DocType::BREAK_PARENT:
                break;
        }
    }

    return false;
}

// =============================================================================
// Rendering
// =============================================================================

std::string DocRenderer::render(const Doc& root) {
    std::string out;
    if (!root) {
        return out;
    }

    const int width = m_options.print_width;
    int pos = 0;
    bool shouldRemeasure = false;

    std::vector<Command> cmds;
    cmds.emplace_back(0, Mode::BREAK, root.get());

    while (!cmds.empty()) {
        Command cmd = cmds.back();
        cmds.pop_back();
        const DocNode* doc = cmd.doc;

        switch (doc->type) {
            case DocType::TEXT:
                out += doc->text;
                pos = advanceColumn(pos, doc->text);
                break;

            case DocType::CONCAT:
                for (size_t i = doc->parts.size(); i > 0; i--) {
                    cmds.emplace_back(cmd.indent, cmd.mode, doc->parts[i - 1].get());
                }
                break;

            case DocType::INDENT:
                cmds.emplace_back(cmd.indent + 1, cmd.mode, doc->contents.get());
                break;

            case DocType::DEDENT:
                cmds.emplace_back(std::max(cmd.indent - 1, 0), cmd.mode, doc->contents.get());
                break;

            case DocType::GROUP: {
                bool broken = isForcedBroken(doc);
                if (cmd.mode == Mode::FLAT && !shouldRemeasure) {
                    cmds.emplace_back(cmd.indent, broken ? Mode::BREAK : Mode::FLAT,
                                      doc->contents.get());
                    break;
                }

                shouldRemeasure = false;
                Command next(cmd.indent, Mode::FLAT, doc->contents.get());
                int rem = width - pos;
                if (!broken && fits({next}, cmds, rem, false)) {
                    cmds.push_back(next);
                } else {
                    cmds.emplace_back(cmd.indent, Mode::BREAK, doc->contents.get());
                }
                break;
            }

            case DocType::FILL: {
                // Each content/separator pair is measured on its own: the
                // separator breaks only when the following content would
                // not fit on the current line.
                int rem = width - pos;
                const std::vector<Doc>& parts = doc->parts;
                size_t offset = cmd.fillOffset;
                if (offset >= parts.size()) {
                    break;
                }

                Command contentFlat(cmd.indent, Mode::FLAT, parts[offset].get());
                Command contentBreak(cmd.indent, Mode::BREAK, parts[offset].get());
                bool contentFits = fits({contentFlat}, {}, rem, true);

                if (parts.size() - offset == 1) {
                    cmds.push_back(contentFits ? contentFlat : contentBreak);
                    break;
                }

                Command whitespaceFlat(cmd.indent, Mode::FLAT, parts[offset + 1].get());
                Command whitespaceBreak(cmd.indent, Mode::BREAK, parts[offset + 1].get());

                if (parts.size() - offset == 2) {
                    if (contentFits) {
                        cmds.push_back(whitespaceFlat);
                        cmds.push_back(contentFlat);
                    } else {
                        cmds.push_back(whitespaceBreak);
                        cmds.push_back(contentBreak);
                    }
                    break;
                }

                Command remaining(cmd.indent, cmd.mode, doc, offset + 2);
                Command secondContent(cmd.indent, Mode::FLAT, parts[offset + 2].get());

                // Commands are popped from the back, so list them reversed
                bool firstAndSecondFit = fits({secondContent, whitespaceFlat, contentFlat},
                                              {}, rem, true);

                cmds.push_back(remaining);
                if (firstAndSecondFit) {
                    cmds.push_back(whitespaceFlat);
                    cmds.push_back(contentFlat);
                } else if (contentFits) {
                    cmds.push_back(whitespaceBreak);
                    cmds.push_back(contentFlat);
                } else {
                    cmds.push_back(whitespaceBreak);
                    cmds.push_back(contentBreak);
                }
                break;
            }

            case DocType::LINE:
                if (cmd.mode == Mode::FLAT) {
                    if (doc->lineMode == LineMode::NORMAL) {
                        out += ' ';
                        pos += 1;
                        break;
                    }
                    if (doc->lineMode == LineMode::SOFT) {
                        break;
                    }
                    // Hard lines break even inside a flat group; the
                    // enclosing groups have to be measured again
                    shouldRemeasure = true;
                }

                if (doc->lineMode == LineMode::LITERAL) {
                    out += '\n';
                    pos = 0;
                } else {
                    trimTrailingWhitespace(out);
                    out += '\n';
                    // A kept blank line from the edge of a text run
                    if (doc->lineMode == LineMode::HARD && doc->keepIfLonely) {
                        out += '\n';
                    }
                    out += makeIndent(cmd.indent);
                    pos = indentWidth(cmd.indent);
                }
                break;

            case DocType::BREAK_PARENT:
                break;
        }
    }

    return out;
}

std::string renderDoc(const Doc& doc, const RenderOptions& options) {
    DocRenderer renderer(options);
    return renderer.render(doc);
}

} // namespace SvelteFormat

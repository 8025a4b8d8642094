//
// svelteformat_options.h
// SvelteFormat - Formatter Options
//
// Named options controlling layout width, indentation, section ordering and
// the strictness of the printed markup. Every option has a default, so a
// default-constructed FormatterOptions formats like the stock tool.
//

#ifndef SVELTEFORMAT_OPTIONS_H
#define SVELTEFORMAT_OPTIONS_H

#include <string>
#include <vector>

#define SVELTEFORMAT_VERSION "1.0.0"

namespace SvelteFormat {

// =============================================================================
// Section Sort Order
// =============================================================================

// The three top-level sections, emitted in the order picked by SortOrder
enum class Section {
    SCRIPTS,   // module script, then instance script
    STYLES,    // the component style block
    MARKUP     // the markup fragment
};

enum class SortOrder {
    SCRIPTS_STYLES_MARKUP,
    SCRIPTS_MARKUP_STYLES,
    MARKUP_STYLES_SCRIPTS,
    MARKUP_SCRIPTS_STYLES,
    STYLES_MARKUP_SCRIPTS,
    STYLES_SCRIPTS_MARKUP
};

// Parse "scripts-styles-markup" and friends
// Throws std::invalid_argument for anything but the six permutations
SortOrder parseSortOrder(const std::string& text);

// Inverse of parseSortOrder
std::string sortOrderToString(SortOrder order);

// Expand a sort order into its three sections
std::vector<Section> sortOrderSections(SortOrder order);

// =============================================================================
// Formatter Options
// =============================================================================

struct FormatterOptions {
    int print_width;               // Target line width (default: 80)
    int tab_width;                 // Columns per indentation level (default: 2)
    bool use_tabs;                 // Indent with tabs instead of spaces (default: false)
    SortOrder sort_order;          // Section ordering (default: scripts-styles-markup)
    bool strict_mode;              // Quoted expressions, self-closing allow-list (default: false)
    bool bracket_new_line;         // Put '>' of a multi-line start tag on its own line (default: false)
    bool allow_shorthand;          // Print a={a} as {a} (default: true)
    bool indent_script_and_style;  // Indent script/style bodies one level (default: true)
    bool verbose;                  // Progress diagnostics on stderr (default: false)

    // Constructor with defaults
    FormatterOptions()
        : print_width(80)
        , tab_width(2)
        , use_tabs(false)
        , sort_order(SortOrder::SCRIPTS_STYLES_MARKUP)
        , strict_mode(false)
        , bracket_new_line(false)
        , allow_shorthand(true)
        , indent_script_and_style(true)
        , verbose(false)
    {}

    // Preset configurations
    static FormatterOptions Default() {
        return FormatterOptions();
    }

    static FormatterOptions Strict() {
        FormatterOptions opts;
        opts.strict_mode = true;
        return opts;
    }

    static FormatterOptions Compact() {
        FormatterOptions opts;
        opts.print_width = 120;
        opts.indent_script_and_style = false;
        return opts;
    }

    // One indentation level as text
    std::string indentUnit() const {
        return use_tabs ? std::string("\t") : std::string(tab_width, ' ');
    }
};

} // namespace SvelteFormat

#endif // SVELTEFORMAT_OPTIONS_H

//
// svelteformat_options.cpp
// SvelteFormat - Formatter Options Implementation
//

#include "svelteformat_options.h"
#include <stdexcept>

namespace SvelteFormat {

static const struct {
    SortOrder order;
    const char* name;
} kSortOrders[] = {
    {SortOrder::SCRIPTS_STYLES_MARKUP, "scripts-styles-markup"},
    {SortOrder::SCRIPTS_MARKUP_STYLES, "scripts-markup-styles"},
    {SortOrder::MARKUP_STYLES_SCRIPTS, "markup-styles-scripts"},
    {SortOrder::MARKUP_SCRIPTS_STYLES, "markup-scripts-styles"},
    {SortOrder::STYLES_MARKUP_SCRIPTS, "styles-markup-scripts"},
    {SortOrder::STYLES_SCRIPTS_MARKUP, "styles-scripts-markup"},
};

SortOrder parseSortOrder(const std::string& text) {
    for (const auto& entry : kSortOrders) {
        if (text == entry.name) {
            return entry.order;
        }
    }
    throw std::invalid_argument("Invalid sort order: '" + text +
                                "' (expected a permutation of scripts-styles-markup)");
}

std::string sortOrderToString(SortOrder order) {
    for (const auto& entry : kSortOrders) {
        if (entry.order == order) {
            return entry.name;
        }
    }
    return "scripts-styles-markup";
}

std::vector<Section> sortOrderSections(SortOrder order) {
    switch (order) {
        case SortOrder::SCRIPTS_STYLES_MARKUP:
            return {Section::SCRIPTS, Section::STYLES, Section::MARKUP};
        case SortOrder::SCRIPTS_MARKUP_STYLES:
            return {Section::SCRIPTS, Section::MARKUP, Section::STYLES};
        case SortOrder::MARKUP_STYLES_SCRIPTS:
            return {Section::MARKUP, Section::STYLES, Section::SCRIPTS};
        case SortOrder::MARKUP_SCRIPTS_STYLES:
            return {Section::MARKUP, Section::SCRIPTS, Section::STYLES};
        case SortOrder::STYLES_MARKUP_SCRIPTS:
            return {Section::STYLES, Section::MARKUP, Section::SCRIPTS};
        case SortOrder::STYLES_SCRIPTS_MARKUP:
            return {Section::STYLES, Section::SCRIPTS, Section::MARKUP};
    }
    return {Section::SCRIPTS, Section::STYLES, Section::MARKUP};
}

} // namespace SvelteFormat

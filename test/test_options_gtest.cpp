//
// test_options_gtest.cpp
// SvelteFormat - Formatter options tests
//

#include "svelteformat_options.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace SvelteFormat;

TEST(FormatterOptions, Defaults) {
    FormatterOptions options;
    EXPECT_EQ(options.print_width, 80);
    EXPECT_EQ(options.tab_width, 2);
    EXPECT_FALSE(options.use_tabs);
    EXPECT_EQ(options.sort_order, SortOrder::SCRIPTS_STYLES_MARKUP);
    EXPECT_FALSE(options.strict_mode);
    EXPECT_FALSE(options.bracket_new_line);
    EXPECT_TRUE(options.allow_shorthand);
    EXPECT_TRUE(options.indent_script_and_style);
    EXPECT_FALSE(options.verbose);
}

TEST(FormatterOptions, Presets) {
    EXPECT_TRUE(FormatterOptions::Strict().strict_mode);
    EXPECT_EQ(FormatterOptions::Compact().print_width, 120);
    EXPECT_FALSE(FormatterOptions::Compact().indent_script_and_style);
    EXPECT_EQ(FormatterOptions::Default().print_width, 80);
}

TEST(FormatterOptions, IndentUnit) {
    FormatterOptions options;
    EXPECT_EQ(options.indentUnit(), "  ");
    options.tab_width = 4;
    EXPECT_EQ(options.indentUnit(), "    ");
    options.use_tabs = true;
    EXPECT_EQ(options.indentUnit(), "\t");
}

TEST(SortOrder, ParsesEveryPermutation) {
    const char* names[] = {
        "scripts-styles-markup", "scripts-markup-styles", "markup-styles-scripts",
        "markup-scripts-styles", "styles-markup-scripts", "styles-scripts-markup",
    };
    for (const char* name : names) {
        EXPECT_EQ(sortOrderToString(parseSortOrder(name)), name);
    }
}

TEST(SortOrder, RejectsOtherText) {
    EXPECT_THROW(parseSortOrder("scripts-styles"), std::invalid_argument);
    EXPECT_THROW(parseSortOrder("Scripts-Styles-Markup"), std::invalid_argument);
    EXPECT_THROW(parseSortOrder(""), std::invalid_argument);
}

TEST(SortOrder, ExpandsToSections) {
    std::vector<Section> sections = sortOrderSections(SortOrder::MARKUP_SCRIPTS_STYLES);
    ASSERT_EQ(sections.size(), 3u);
    EXPECT_EQ(sections[0], Section::MARKUP);
    EXPECT_EQ(sections[1], Section::SCRIPTS);
    EXPECT_EQ(sections[2], Section::STYLES);
}

//
// test_printer_gtest.cpp
// SvelteFormat - AST to Doc printer tests
//

#include "svelteformat_printer.h"
#include "svelteformat_parser.h"
#include "svelteformat_renderer.h"
#include "svelteformat_snip.h"
#include <gtest/gtest.h>

using namespace SvelteFormat;

static std::string printSource(const std::string& source,
                               const FormatterOptions& options = FormatterOptions()) {
    EmbeddedFormatterRegistry registry;
    std::string text = preprocess(source);

    Parser parser;
    std::unique_ptr<RootNode> root = parser.parse(text);
    if (!root) {
        ADD_FAILURE() << "parse failed: " << parser.getErrors().front().toString(text);
        return "";
    }

    Printer printer(text, options, registry);
    RenderOptions render;
    render.print_width = options.print_width;
    render.tab_width = options.tab_width;
    render.use_tabs = options.use_tabs;
    return renderDoc(printer.print(*root), render);
}

static FormatterOptions withWidth(int width) {
    FormatterOptions options;
    options.print_width = width;
    return options;
}

// =============================================================================
// Elements and Text
// =============================================================================

TEST(Printer, ShortElementStaysOnOneLine) {
    EXPECT_EQ(printSource("<div>hello</div>"), "<div>hello</div>\n");
}

TEST(Printer, TextWrapsAtPrintWidth) {
    EXPECT_EQ(printSource("<p>aaa bbb ccc</p>", withWidth(10)), "<p>\n  aaa bbb\n  ccc\n</p>\n");
    EXPECT_EQ(printSource("<p>aaa bbb ccc</p>", withWidth(80)), "<p>aaa bbb ccc</p>\n");
}

TEST(Printer, InlineElementKeepsSurroundingText) {
    EXPECT_EQ(printSource("<p>Hello <b>world</b>!</p>"), "<p>Hello <b>world</b>!</p>\n");
}

TEST(Printer, BlockChildrenAreIndented) {
    EXPECT_EQ(printSource("<div><p>x</p></div>"), "<div>\n  <p>x</p>\n</div>\n");
}

TEST(Printer, TabWidthAndTabs) {
    FormatterOptions wide;
    wide.tab_width = 4;
    EXPECT_EQ(printSource("<div><p>x</p></div>", wide), "<div>\n    <p>x</p>\n</div>\n");

    FormatterOptions tabs;
    tabs.use_tabs = true;
    EXPECT_EQ(printSource("<div><p>x</p></div>", tabs), "<div>\n\t<p>x</p>\n</div>\n");
}

TEST(Printer, EmptyElementsSelfClose) {
    EXPECT_EQ(printSource("<div></div>"), "<div />\n");
    EXPECT_EQ(printSource("<Foo/>"), "<Foo />\n");
    EXPECT_EQ(printSource("<input type=\"text\" disabled>"), "<input type=\"text\" disabled />\n");
}

TEST(Printer, StrictModeSelfClosesOnlyVoidAndComponents) {
    FormatterOptions strict = FormatterOptions::Strict();
    EXPECT_EQ(printSource("<div></div>", strict), "<div></div>\n");
    EXPECT_EQ(printSource("<br>", strict), "<br />\n");
    EXPECT_EQ(printSource("<Foo></Foo>", strict), "<Foo />\n");
}

TEST(Printer, BlankLinesBetweenSiblingsCollapseToOne) {
    EXPECT_EQ(printSource("<div>a</div>\n\n<div>b</div>"), "<div>a</div>\n\n<div>b</div>\n");
    EXPECT_EQ(printSource("<div>a</div>\n\n\n<div>b</div>"), "<div>a</div>\n\n<div>b</div>\n");
    EXPECT_EQ(printSource("<div>a</div>\n<div>b</div>"), "<div>a</div>\n<div>b</div>\n");
}

TEST(Printer, BlankLineBetweenTextAndInlineSiblingIsKept) {
    std::string source = "<div>\n  Some text\n\n  <b>bold</b>\n</div>";
    EXPECT_EQ(printSource(source), source + "\n");
    EXPECT_EQ(printSource("\xE6\x97\xA5\xE6\x9C\xAC\n\n<input>"),
              "\xE6\x97\xA5\xE6\x9C\xAC\n\n<input />\n");
}

TEST(Printer, PreContentIsUntouched) {
    EXPECT_EQ(printSource("<pre>\n  keep   this\n</pre>"), "<pre>\n  keep   this\n</pre>\n");
}

TEST(Printer, WhitespaceOnlyInputPrintsNothing) {
    EXPECT_EQ(printSource("   \n"), "");
}

// =============================================================================
// Attributes
// =============================================================================

TEST(Printer, ShorthandAttributes) {
    EXPECT_EQ(printSource("<div {id}></div>"), "<div {id} />\n");
    EXPECT_EQ(printSource("<div id={id}></div>"), "<div {id} />\n");

    FormatterOptions noShorthand;
    noShorthand.allow_shorthand = false;
    EXPECT_EQ(printSource("<div {id}></div>", noShorthand), "<div id={id} />\n");

    EXPECT_EQ(printSource("<div {id}></div>", FormatterOptions::Strict()), "<div id=\"{id}\"></div>\n");
}

TEST(Printer, LongStartTagBreaksAttributes) {
    std::string source = "<div class=\"aaaa\" id=\"bbbb\" title=\"cccc\">x</div>";
    EXPECT_EQ(printSource(source, withWidth(20)),
              "<div\n  class=\"aaaa\"\n  id=\"bbbb\"\n  title=\"cccc\">\n  x\n</div>\n");

    FormatterOptions bracket = withWidth(20);
    bracket.bracket_new_line = true;
    EXPECT_EQ(printSource(source, bracket),
              "<div\n  class=\"aaaa\"\n  id=\"bbbb\"\n  title=\"cccc\"\n>\n  x\n</div>\n");
}

TEST(Printer, Directives) {
    EXPECT_EQ(printSource("<div on:click|once={handle} bind:value={value} class:active={isActive} />"),
              "<div on:click|once={handle} bind:value class:active={isActive} />\n");
    EXPECT_EQ(printSource("<div on:click={handle}></div>", FormatterOptions::Strict()),
              "<div on:click=\"{handle}\"></div>\n");
}

TEST(Printer, SpreadAttribute) {
    EXPECT_EQ(printSource("<Foo {...props} />"), "<Foo {...props} />\n");
}

TEST(Printer, SpecialElementsAlwaysSelfClose) {
    EXPECT_EQ(printSource("<svelte:options immutable />"), "<svelte:options immutable />\n");
}

// =============================================================================
// Blocks
// =============================================================================

TEST(Printer, EachBlock) {
    EXPECT_EQ(printSource("{#each items as item}<li>{item}</li>{/each}"),
              "{#each items as item}\n  <li>{item}</li>\n{/each}\n");
    EXPECT_EQ(printSource("{#each items as item, i (item.id)}<li>{item}</li>{/each}"),
              "{#each items as item, i (item.id)}\n  <li>{item}</li>\n{/each}\n");
}

TEST(Printer, IfElseBlock) {
    EXPECT_EQ(printSource("{#if a}<p>x</p>{:else}<p>y</p>{/if}"),
              "{#if a}\n  <p>x</p>\n{:else}\n  <p>y</p>\n{/if}\n");
    EXPECT_EQ(printSource("{#if a}<p>x</p>{:else if b}<p>y</p>{/if}"),
              "{#if a}\n  <p>x</p>\n{:else if b}\n  <p>y</p>\n{/if}\n");
}

TEST(Printer, BlocksWithInlineContentStillBreak) {
    EXPECT_EQ(printSource("{#if a}x{:else if b}y{:else}z{/if}"),
              "{#if a}\n  x\n{:else if b}\n  y\n{:else}\n  z\n{/if}\n");
    EXPECT_EQ(printSource("{#each items as item}{item}{/each}"),
              "{#each items as item}\n  {item}\n{/each}\n");
    EXPECT_EQ(printSource("{#await p then v}{v}{/await}"),
              "{#await p then v}\n  {v}\n{/await}\n");
}

TEST(Printer, AwaitBlockForms) {
    EXPECT_EQ(printSource("{#await p}<p>wait</p>{:then v}<p>{v}</p>{:catch e}<p>{e}</p>{/await}"),
              "{#await p}\n  <p>wait</p>\n{:then v}\n  <p>{v}</p>\n{:catch e}\n  <p>{e}</p>\n{/await}\n");
    EXPECT_EQ(printSource("{#await p then v}<p>{v}</p>{/await}"),
              "{#await p then v}\n  <p>{v}</p>\n{/await}\n");
}

TEST(Printer, Tags) {
    EXPECT_EQ(printSource("{@html  markup }"), "{@html markup}\n");
    EXPECT_EQ(printSource("{@debug a,b}"), "{@debug a, b}\n");
}

// =============================================================================
// Comments and Embedded Blocks
// =============================================================================

TEST(Printer, CommentIsKept) {
    EXPECT_EQ(printSource("<!-- hi -->"), "<!-- hi -->\n");
}

TEST(Printer, IgnoreCommentKeepsNextNodeVerbatim) {
    std::string source = "<!-- sveltefmt-ignore -->\n<div   class=\"a\"  >x</div>";
    EXPECT_EQ(printSource(source), source + "\n");
}

TEST(Printer, IgnoreCommentSkipsBlankLineBeforeNode) {
    std::string source = "<!-- sveltefmt-ignore -->\n\n<div  >x</div>";
    EXPECT_EQ(printSource(source), source + "\n");
}

TEST(Printer, IgnoreCommentWithoutFollowingNodeAffectsNothing) {
    EXPECT_EQ(printSource("<div><!-- prettier-ignore -->\n</div>\n<p>   x     y   </p>\n"),
              "<div>\n  <!-- prettier-ignore -->\n</div>\n<p>x y</p>\n");
    EXPECT_EQ(printSource("<section><p>a</p><!-- prettier-ignore --></section><p>   b   </p>"),
              "<section>\n  <p>a</p>\n  <!-- prettier-ignore -->\n</section>\n<p>b</p>\n");
}

TEST(Printer, IgnoreCommentTravelsWithHoistedScript) {
    std::string source = "<!-- sveltefmt-ignore -->\n<script>\n   let   a;\n</script>";
    EXPECT_EQ(printSource(source), source + "\n");
}

TEST(Printer, ScriptBodyIsIndented) {
    EXPECT_EQ(printSource("<script>\nlet a = 1;\n</script>\n\n<div>x</div>"),
              "<script>\n  let a = 1;\n</script>\n\n<div>x</div>\n");
}

TEST(Printer, ScriptAndStyleBodiesWithoutIndent) {
    FormatterOptions flat;
    flat.indent_script_and_style = false;
    EXPECT_EQ(printSource("<style>\n  div { color: red; }\n</style>", flat),
              "<style>\ndiv { color: red; }\n</style>\n");
}

TEST(Printer, SortOrderMovesSections) {
    FormatterOptions options;
    options.sort_order = SortOrder::MARKUP_STYLES_SCRIPTS;
    EXPECT_EQ(printSource("<script>let a;</script><div>x</div>", options),
              "<div>x</div>\n\n<script>\n  let a;\n</script>\n");
}

TEST(Printer, UnsupportedStyleLanguageIsVerbatim) {
    std::string source = "<style lang=\"stylus\">\na\n  b\n</style>";
    EXPECT_EQ(printSource(source), source + "\n");
}

TEST(Printer, NestedScriptStaysInHead) {
    EXPECT_EQ(printSource("<svelte:head><script src=\"a.js\"></script></svelte:head>"),
              "<svelte:head>\n  <script src=\"a.js\"></script>\n</svelte:head>\n");
}

// =============================================================================
// Printer State
// =============================================================================

TEST(Printer, PrinterIsReusable) {
    EmbeddedFormatterRegistry registry;
    FormatterOptions options;
    std::string text = preprocess("<!-- prettier-ignore -->\n<b  >x</b><i  >y</i>");

    Parser parser;
    std::unique_ptr<RootNode> root = parser.parse(text);
    ASSERT_TRUE(root != nullptr);

    Printer printer(text, options, registry);
    std::string first = renderDoc(printer.print(*root));
    std::string second = renderDoc(printer.print(*root));
    EXPECT_EQ(first, second);
}

TEST(Printer, IgnoreDirectiveRecognition) {
    EXPECT_TRUE(isIgnoreDirective(CommentNode(" sveltefmt-ignore ")));
    EXPECT_TRUE(isIgnoreDirective(CommentNode("prettier-ignore")));
    EXPECT_FALSE(isIgnoreDirective(CommentNode(" ignore ")));
    EXPECT_FALSE(isIgnoreDirective(TextNode("sveltefmt-ignore")));
}

//
// test_doc_renderer_gtest.cpp
// SvelteFormat - Doc IR and renderer tests
//

#include "svelteformat_doc.h"
#include "svelteformat_renderer.h"
#include <gtest/gtest.h>

using namespace SvelteFormat;
using namespace SvelteFormat::DocBuilders;

static std::string renderAt(const Doc& doc, int width) {
    RenderOptions options;
    options.print_width = width;
    return renderDoc(doc, options);
}

// =============================================================================
// Groups and Lines
// =============================================================================

TEST(DocRenderer, GroupStaysFlatWhenItFits) {
    Doc doc = group(concat({text("a"), line(), text("b")}));
    EXPECT_EQ(renderAt(doc, 80), "a b");
}

TEST(DocRenderer, GroupBreaksWhenTooWide) {
    Doc doc = group(concat({text("a"), line(), text("b")}));
    EXPECT_EQ(renderAt(doc, 2), "a\nb");
}

TEST(DocRenderer, SoftlineVanishesWhenFlat) {
    Doc doc = group(concat({text("["), indent(concat({softline(), text("x")})), softline(), text("]")}));
    EXPECT_EQ(renderAt(doc, 80), "[x]");
    EXPECT_EQ(renderAt(doc, 2), "[\n  x\n]");
}

TEST(DocRenderer, BreakParentForcesEnclosingGroup) {
    Doc doc = group(concat({text("a"), line(), text("b"), breakParent()}));
    EXPECT_EQ(renderAt(doc, 80), "a\nb");
}

TEST(DocRenderer, HardlineAlwaysBreaks) {
    EXPECT_EQ(renderAt(concat({text("a"), hardline(), text("b")}), 80), "a\nb");
}

TEST(DocRenderer, HardlineKeepsIndentationLiterallineDoesNot) {
    EXPECT_EQ(renderAt(indent(concat({text("a"), hardline(), text("b")})), 80), "a\n  b");
    EXPECT_EQ(renderAt(indent(concat({text("a"), literalline(), text("b")})), 80), "a\nb");
}

TEST(DocRenderer, KeptBlankLineRendersEmptyLineAndBreaksGroup) {
    Doc doc = group(concat({text("a"), line(), fill({text("b"), keepIfLonelyLine(), text("c")})}));
    EXPECT_EQ(renderAt(doc, 80), "a\nb\n\nc");
    EXPECT_EQ(renderAt(indent(concat({text("a  "), keepIfLonelyLine(), text("b")})), 80), "a\n\n  b");
}

TEST(DocRenderer, DedentRemovesOneLevel) {
    Doc doc = indent(indent(concat({text("a"), hardline(), dedent(concat({text("b"), hardline(), text("c")}))})));
    EXPECT_EQ(renderAt(doc, 80), "a\n    b\n  c");
}

TEST(DocRenderer, TrailingWhitespaceIsTrimmedBeforeNewline) {
    EXPECT_EQ(renderAt(concat({text("a  "), hardline(), text("b")}), 80), "a\nb");
}

TEST(DocRenderer, TabsIndentWhenRequested) {
    RenderOptions options;
    options.use_tabs = true;
    EXPECT_EQ(renderDoc(indent(concat({text("a"), hardline(), text("b")})), options), "a\n\tb");
}

TEST(DocRenderer, WidthIsMeasuredInDisplayColumns) {
    // 11 columns, 13 bytes
    Doc doc = group(concat({text("h\xC3\xA9llo"), line(), text("w\xC3\xB6rld")}));
    EXPECT_EQ(renderAt(doc, 11), "h\xC3\xA9llo w\xC3\xB6rld");
    EXPECT_EQ(renderAt(doc, 10), "h\xC3\xA9llo\nw\xC3\xB6rld");
}

TEST(DocRenderer, NestedGroupBreaksIndependently) {
    Doc inner = group(concat({text("b"), line(), text("c")}));
    Doc doc = group(concat({text("aaaa"), line(), inner}));
    // Outer breaks, inner still fits on its own line
    EXPECT_EQ(renderAt(doc, 4), "aaaa\nb c");
}

// =============================================================================
// Fill
// =============================================================================

TEST(DocRenderer, FillBreaksOnlyWhereNeeded) {
    Doc doc = fill({text("aaa"), line(), text("bbb"), line(), text("ccc")});
    EXPECT_EQ(renderAt(doc, 7), "aaa bbb\nccc");
    EXPECT_EQ(renderAt(doc, 80), "aaa bbb ccc");
    EXPECT_EQ(renderAt(doc, 3), "aaa\nbbb\nccc");
}

TEST(DocRenderer, EmptyDocRendersNothing) {
    EXPECT_EQ(renderAt(concat({}), 80), "");
    EXPECT_EQ(renderAt(group(text("")), 80), "");
}

// =============================================================================
// Inspection and Trimming
// =============================================================================

TEST(DocUtilities, LineClassification) {
    EXPECT_TRUE(isLine(line()));
    EXPECT_TRUE(isLine(softline()));
    EXPECT_FALSE(isLine(hardline()));
    EXPECT_TRUE(isLineDiscardedIfLonely(whitespaceLine(false)));
    EXPECT_FALSE(isLineDiscardedIfLonely(whitespaceLine(true)));
    EXPECT_FALSE(isLineDiscardedIfLonely(keepIfLonelyLine()));
}

TEST(DocUtilities, EmptyDocDetection) {
    EXPECT_TRUE(isEmptyDoc(text("")));
    EXPECT_TRUE(isEmptyDoc(concat({text(""), line(), group(softline())})));
    EXPECT_FALSE(isEmptyDoc(concat({text(""), keepIfLonelyLine()})));
    EXPECT_FALSE(isEmptyDoc(text("x")));
    EXPECT_FALSE(isEmptyDoc(breakParent()));
    EXPECT_TRUE(isEmptyGroup({}));
}

TEST(DocUtilities, TrimRemovesOuterLines) {
    std::vector<Doc> docs = {line(), softline(), text("a"), line()};
    std::vector<Doc> trimmed = trim(docs, isLine);
    ASSERT_EQ(trimmed.size(), 1u);
    EXPECT_EQ(trimmed[0]->text, "a");
}

TEST(DocUtilities, TrimLeftDescendsIntoConcat) {
    Doc first = concat({line(), text("a")});
    std::vector<Doc> docs = {first, text("b")};

    TrimResult result = trimLeft(docs, isLine);
    ASSERT_TRUE(result.trimmed());
    ASSERT_EQ(result.removed.size(), 1u);
    ASSERT_EQ(result.docs.size(), 2u);
    EXPECT_EQ(result.docs[0]->type, DocType::CONCAT);
    EXPECT_EQ(result.docs[0]->parts.size(), 1u);

    // Input is untouched
    EXPECT_EQ(first->parts.size(), 2u);
}

TEST(DocUtilities, TrimRightDescendsIntoFill) {
    std::vector<Doc> docs = {fill({text("a"), line()})};
    TrimResult result = trimRight(docs, isLine);
    ASSERT_TRUE(result.trimmed());
    EXPECT_EQ(result.docs[0]->type, DocType::FILL);
    EXPECT_EQ(result.docs[0]->parts.size(), 1u);
}

TEST(DocUtilities, JoinInterleavesSeparator) {
    EXPECT_EQ(renderAt(join(text(", "), {text("a"), text("b"), text("c")}), 80), "a, b, c");
    EXPECT_EQ(joinParts(text(","), {text("a")}).size(), 1u);
}

TEST(DocUtilities, DebugDump) {
    EXPECT_EQ(docToString(group(concat({text("a"), line()}))), "group(concat([\"a\", line]))");
    EXPECT_EQ(docToString(keepIfLonelyLine()), "hardline(keepIfLonely)");
}

//
// test_children_gtest.cpp
// SvelteFormat - Child flattening tests
//

#include "svelteformat_children.h"
#include "svelteformat_renderer.h"
#include <gtest/gtest.h>

using namespace SvelteFormat;
using namespace SvelteFormat::DocBuilders;

static std::unique_ptr<ElementNode> makeElement(const std::string& name) {
    return std::make_unique<ElementNode>(NodeType::ELEMENT, name);
}

static std::unique_ptr<MustacheTagNode> makeMustache(const std::string& code) {
    return std::make_unique<MustacheTagNode>(false, std::make_unique<ExpressionNode>(code));
}

// =============================================================================
// Node Classification
// =============================================================================

TEST(NodeClassification, InlineNodes) {
    EXPECT_TRUE(isInlineNode(TextNode("word")));
    EXPECT_TRUE(isInlineNode(TextNode("")));
    EXPECT_FALSE(isInlineNode(TextNode(" \n ")));
    EXPECT_TRUE(isInlineNode(*makeMustache("x")));
    EXPECT_TRUE(isInlineNode(*makeElement("span")));
    EXPECT_FALSE(isInlineNode(*makeElement("div")));
    EXPECT_FALSE(isInlineNode(CommentNode(" c ")));
    EXPECT_TRUE(isInlineNode(IfBlockNode()));
}

TEST(NodeClassification, EmptyNodes) {
    EXPECT_TRUE(isEmptyNode(TextNode("  \n\t")));
    EXPECT_FALSE(isEmptyNode(TextNode(" a ")));
    EXPECT_FALSE(isEmptyNode(*makeElement("div")));
}

TEST(NodeClassification, BreakOpportunities) {
    EXPECT_TRUE(canBreakBefore(TextNode(" a")));
    EXPECT_FALSE(canBreakBefore(TextNode("a ")));
    EXPECT_TRUE(canBreakAfter(TextNode("a ")));
    EXPECT_FALSE(canBreakAfter(TextNode(" a")));

    EXPECT_FALSE(canBreakBefore(*makeElement("b")));
    EXPECT_TRUE(canBreakBefore(*makeElement("p")));
    EXPECT_TRUE(canBreakAfter(*makeMustache("x")));
}

// =============================================================================
// Doc Sequence Helpers
// =============================================================================

TEST(SplitText, WordsJoinedByLines) {
    std::vector<Doc> docs = splitTextToDocs("hello  \n world");
    ASSERT_EQ(docs.size(), 3u);
    EXPECT_EQ(docs[0]->text, "hello");
    EXPECT_TRUE(isLine(docs[1]));
    EXPECT_EQ(docs[2]->text, "world");
}

TEST(SplitText, OuterWhitespaceBecomesLines) {
    std::vector<Doc> docs = splitTextToDocs(" a ");
    ASSERT_EQ(docs.size(), 3u);
    EXPECT_TRUE(isLineDiscardedIfLonely(docs[0]));
    EXPECT_TRUE(isLineDiscardedIfLonely(docs[2]));
}

TEST(SplitText, BlankLineAtEdgesIsKept) {
    std::vector<Doc> docs = splitTextToDocs("\n\nfoo\n  \n");
    ASSERT_EQ(docs.size(), 3u);
    EXPECT_TRUE(isLine(docs[0]));
    EXPECT_FALSE(isLineDiscardedIfLonely(docs[0]));
    EXPECT_FALSE(isLineDiscardedIfLonely(docs[2]));

    std::vector<Doc> single = splitTextToDocs("\nfoo");
    EXPECT_TRUE(isLineDiscardedIfLonely(single[0]));
}

TEST(DedentFinalNewline, MovesTrailingLineIntoDedent) {
    std::vector<Doc> docs = dedentFinalNewline({text("a"), line()});
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[1]->type, DocType::DEDENT);
    EXPECT_TRUE(isLine(docs[1]->contents));

    EXPECT_EQ(dedentFinalNewline({text("a")}).size(), 1u);
}

TEST(ExtractOutermostNewlines, LiftsLinesAroundFill) {
    std::vector<Doc> docs = extractOutermostNewlines({line(), text("a"), line(), text("b"), line()});
    ASSERT_EQ(docs.size(), 3u);
    EXPECT_TRUE(isLine(docs[0]));
    EXPECT_EQ(docs[1]->type, DocType::FILL);
    EXPECT_EQ(docs[1]->parts.size(), 3u);
    EXPECT_TRUE(isLine(docs[2]));
}

TEST(ExtractOutermostNewlines, OnlyLinesLeavesNoFill) {
    std::vector<Doc> docs = extractOutermostNewlines({line(), line()});
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_TRUE(isLine(docs[0]));
    EXPECT_TRUE(isLine(docs[1]));
}

// =============================================================================
// ChildFlattener
// =============================================================================

TEST(ChildFlattener, BlockSiblingsAreSeparatedBySoftlines) {
    auto first = makeElement("div");
    auto second = makeElement("div");

    ChildFlattener flattener(false);
    flattener.add(*first, text("A"));
    flattener.add(*second, text("B"));
    std::vector<Doc> docs = flattener.finish();

    ASSERT_EQ(docs.size(), 3u);
    EXPECT_EQ(docs[0]->type, DocType::CONCAT);
    EXPECT_EQ(docs[1]->lineMode, LineMode::SOFT);
    EXPECT_EQ(renderDoc(concat(docs)), "A\nB");
}

TEST(ChildFlattener, InlineRunBecomesOneFill) {
    TextNode words("Hello ");
    auto tag = makeMustache("name");

    ChildFlattener flattener(false);
    flattener.add(words, fill(splitTextToDocs(words.raw)));
    flattener.add(*tag, text("{name}"));
    std::vector<Doc> docs = flattener.finish();

    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(docs[0]->type, DocType::FILL);
    EXPECT_EQ(renderDoc(concat(docs)), "Hello {name}");
}

TEST(ChildFlattener, WhitespaceLineBetweenBlocksIsNotDoubled) {
    auto first = makeElement("div");
    TextNode newline("\n");
    auto second = makeElement("div");

    ChildFlattener flattener(false);
    flattener.add(*first, text("A"));
    flattener.add(newline, whitespaceLine(false));
    flattener.add(*second, text("B"));
    std::vector<Doc> docs = flattener.finish();

    ASSERT_EQ(docs.size(), 3u);
    EXPECT_EQ(docs[1]->lineMode, LineMode::NORMAL);
    EXPECT_EQ(renderDoc(concat({concat(docs), breakParent()})), "A\nB");
}

TEST(ChildFlattener, BlankLineBetweenBlocksSurvives) {
    auto first = makeElement("div");
    TextNode blank("\n\n");
    auto second = makeElement("div");

    ChildFlattener flattener(false);
    flattener.add(*first, text("A"));
    flattener.add(blank, whitespaceLine(true));
    flattener.add(*second, text("B"));
    std::vector<Doc> docs = flattener.finish();

    ASSERT_EQ(docs.size(), 4u);
    EXPECT_EQ(renderDoc(group(concat(docs))), "A\n\nB");
}

TEST(ChildFlattener, BlankLineClosingTextBeforeBlockSurvives) {
    TextNode words("Some text\n\n");
    auto block = makeElement("div");

    ChildFlattener flattener(false);
    flattener.add(words, fill(splitTextToDocs(words.raw)));
    flattener.add(*block, text("B"));
    std::vector<Doc> docs = flattener.finish();

    ASSERT_EQ(docs.size(), 3u);
    EXPECT_FALSE(isLineDiscardedIfLonely(docs[1]));
    EXPECT_EQ(renderDoc(group(concat(docs))), "Some text\n\nB");
}

TEST(ChildFlattener, BlankLineInsideInlineRunSurvives) {
    TextNode words("Some text\n\n ");
    auto tag = makeMustache("name");

    ChildFlattener flattener(false);
    flattener.add(words, fill(splitTextToDocs(words.raw)));
    flattener.add(*tag, text("{name}"));
    std::vector<Doc> docs = flattener.finish();

    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(renderDoc(group(concat(docs))), "Some text\n\n{name}");
}

TEST(ChildFlattener, PreformattedContentIsNotSeparated) {
    auto first = makeElement("div");
    auto second = makeElement("div");

    ChildFlattener flattener(true);
    flattener.add(*first, text("A"));
    flattener.add(*second, text("B"));
    std::vector<Doc> docs = flattener.finish();

    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(renderDoc(concat(docs)), "AB");
}

TEST(ChildFlattener, EmptyInputGivesEmptyOutput) {
    ChildFlattener flattener(false);
    EXPECT_TRUE(flattener.finish().empty());
}

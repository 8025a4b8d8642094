//
// test_parser_gtest.cpp
// SvelteFormat - Parser tests
//

#include "svelteformat_parser.h"
#include <gtest/gtest.h>

using namespace SvelteFormat;

static std::unique_ptr<RootNode> parseOk(const std::string& source) {
    Parser parser;
    std::unique_ptr<RootNode> root = parser.parse(source);
    EXPECT_TRUE(root != nullptr) << (parser.hasErrors() ? parser.getErrors().front().what() : "");
    return root;
}

static ParseError parseFail(const std::string& source) {
    Parser parser;
    std::unique_ptr<RootNode> root = parser.parse(source);
    EXPECT_TRUE(root == nullptr);
    EXPECT_EQ(parser.getErrors().size(), 1u);
    if (parser.getErrors().empty()) {
        return ParseError("no error", 0, 0);
    }
    return parser.getErrors().front();
}

template <typename T>
static const T& as(const NodePtr& node) {
    return static_cast<const T&>(*node);
}

// =============================================================================
// Expression Scanning
// =============================================================================

TEST(ExpressionScanning, StopsAtTopLevelBraceOnly) {
    auto isClose = [](const std::string& t, size_t p) { return t[p] == '}'; };
    EXPECT_EQ(scanTopLevel("a + b}", 0, isClose), 5u);
    EXPECT_EQ(scanTopLevel("{a: 1}}", 0, isClose), 6u);
    EXPECT_EQ(scanTopLevel("'}' + x}", 0, isClose), 7u);
    EXPECT_EQ(scanTopLevel("`${a}}`}", 0, isClose), 7u);
    EXPECT_EQ(scanTopLevel("a /* } */}", 0, isClose), 9u);
}

TEST(ExpressionScanning, OpenLiteralGivesNpos) {
    auto isClose = [](const std::string& t, size_t p) { return t[p] == '}'; };
    EXPECT_EQ(scanTopLevel("'abc}", 0, isClose), std::string::npos);
    EXPECT_EQ(scanTopLevel("a + b", 0, isClose), std::string::npos);
}

TEST(ExpressionScanning, KeywordMustBeWholeWord) {
    EXPECT_EQ(findTopLevelKeyword("items as item", "as"), 6u);
    EXPECT_EQ(findTopLevelKeyword("cases as c", "as"), 6u);
    EXPECT_EQ(findTopLevelKeyword("fn(a as b) as c", "as"), 11u);
    EXPECT_EQ(findTopLevelKeyword("promise", "then"), std::string::npos);
}

TEST(ExpressionScanning, OffsetToPosition) {
    SourcePosition position = offsetToPosition("ab\ncd", 4);
    EXPECT_EQ(position.line, 2);
    EXPECT_EQ(position.column, 2);
}

// =============================================================================
// Elements and Text
// =============================================================================

TEST(Parser, ElementWithTextChild) {
    auto root = parseOk("<div>hello</div>");
    ASSERT_TRUE(root);
    ASSERT_EQ(root->html->children.size(), 1u);

    const ElementNode& div = as<ElementNode>(root->html->children[0]);
    EXPECT_EQ(div.getType(), NodeType::ELEMENT);
    EXPECT_EQ(div.name, "div");
    EXPECT_EQ(div.start, 0u);
    EXPECT_EQ(div.end, 16u);
    ASSERT_EQ(div.children.size(), 1u);
    EXPECT_EQ(as<TextNode>(div.children[0]).raw, "hello");
}

TEST(Parser, ClassifiesElementKinds) {
    auto root = parseOk("<Foo /><slot /><svelte:head><title>x</title></svelte:head>"
                        "<svelte:window /><svelte:self /><ui.Button />");
    ASSERT_TRUE(root);
    const auto& children = root->html->children;
    ASSERT_EQ(children.size(), 6u);
    EXPECT_EQ(children[0]->getType(), NodeType::INLINE_COMPONENT);
    EXPECT_EQ(children[1]->getType(), NodeType::SLOT);
    EXPECT_EQ(children[2]->getType(), NodeType::HEAD);
    EXPECT_EQ(as<ElementNode>(children[2]).children[0]->getType(), NodeType::TITLE);
    EXPECT_EQ(children[3]->getType(), NodeType::WINDOW);
    EXPECT_EQ(children[4]->getType(), NodeType::INLINE_COMPONENT);
    EXPECT_EQ(children[5]->getType(), NodeType::INLINE_COMPONENT);
}

TEST(Parser, VoidElementsHaveNoEndTag) {
    auto root = parseOk("<br><input type=\"text\">after");
    ASSERT_TRUE(root);
    ASSERT_EQ(root->html->children.size(), 3u);
    EXPECT_EQ(as<ElementNode>(root->html->children[0]).name, "br");
    EXPECT_EQ(root->html->children[2]->getType(), NodeType::TEXT);
}

TEST(Parser, ComponentThisIsLifted) {
    auto root = parseOk("<svelte:component this={View} title=\"x\" />");
    ASSERT_TRUE(root);
    const ElementNode& component = as<ElementNode>(root->html->children[0]);
    ASSERT_TRUE(component.expression);
    EXPECT_EQ(component.expression->code, "View");
    ASSERT_EQ(component.attributes.size(), 1u);
    EXPECT_EQ(as<AttributeNode>(component.attributes[0]).name, "title");
}

TEST(Parser, CommentKeepsData) {
    auto root = parseOk("<!-- hi -->");
    ASSERT_TRUE(root);
    EXPECT_EQ(as<CommentNode>(root->html->children[0]).data, " hi ");
}

TEST(Parser, MustacheAndRawTags) {
    auto root = parseOk("{ a + b }{@html markup}{@debug x, y}");
    ASSERT_TRUE(root);
    const auto& children = root->html->children;
    ASSERT_EQ(children.size(), 3u);
    EXPECT_EQ(children[0]->getType(), NodeType::MUSTACHE_TAG);
    EXPECT_EQ(as<MustacheTagNode>(children[0]).expression->code, "a + b");
    EXPECT_EQ(children[1]->getType(), NodeType::RAW_MUSTACHE_TAG);
    EXPECT_EQ(as<MustacheTagNode>(children[1]).expression->code, "markup");
    const DebugTagNode& debug = as<DebugTagNode>(children[2]);
    ASSERT_EQ(debug.identifiers.size(), 2u);
    EXPECT_EQ(debug.identifiers[1]->code, "y");
}

// =============================================================================
// Attributes and Directives
// =============================================================================

TEST(Parser, AttributeForms) {
    auto root = parseOk("<input disabled value=\"a {b} c\" id={id} {name} {...rest}>");
    ASSERT_TRUE(root);
    const auto& attrs = as<ElementNode>(root->html->children[0]).attributes;
    ASSERT_EQ(attrs.size(), 5u);

    const AttributeNode& disabled = as<AttributeNode>(attrs[0]);
    EXPECT_TRUE(disabled.isTrue);

    const AttributeNode& value = as<AttributeNode>(attrs[1]);
    ASSERT_EQ(value.value.size(), 3u);
    EXPECT_EQ(value.value[1]->getType(), NodeType::MUSTACHE_TAG);

    const AttributeNode& id = as<AttributeNode>(attrs[2]);
    ASSERT_EQ(id.value.size(), 1u);
    EXPECT_EQ(id.value[0]->getType(), NodeType::MUSTACHE_TAG);

    const AttributeNode& name = as<AttributeNode>(attrs[3]);
    EXPECT_EQ(name.name, "name");
    ASSERT_EQ(name.value.size(), 1u);
    EXPECT_EQ(name.value[0]->getType(), NodeType::ATTRIBUTE_SHORTHAND);

    EXPECT_EQ(attrs[4]->getType(), NodeType::SPREAD);
}

TEST(Parser, EmptyQuotedValueIsOneEmptyText) {
    auto root = parseOk("<div title=\"\"></div>");
    ASSERT_TRUE(root);
    const AttributeNode& title = as<AttributeNode>(as<ElementNode>(root->html->children[0]).attributes[0]);
    EXPECT_FALSE(title.isTrue);
    ASSERT_EQ(title.value.size(), 1u);
    EXPECT_EQ(as<TextNode>(title.value[0]).raw, "");
}

TEST(Parser, Directives) {
    auto root = parseOk("<div on:click|once|preventDefault={go} bind:value class:active={on} "
                        "in:fade out:fly use:tooltip={opts} animate:flip></div>");
    ASSERT_TRUE(root);
    const auto& attrs = as<ElementNode>(root->html->children[0]).attributes;
    ASSERT_EQ(attrs.size(), 7u);

    const DirectiveNode& on = as<DirectiveNode>(attrs[0]);
    EXPECT_EQ(on.getType(), NodeType::EVENT_HANDLER);
    EXPECT_EQ(on.name, "click");
    ASSERT_EQ(on.modifiers.size(), 2u);
    EXPECT_EQ(on.modifiers[1], "preventDefault");
    EXPECT_EQ(on.expression->code, "go");

    const DirectiveNode& bind = as<DirectiveNode>(attrs[1]);
    EXPECT_EQ(bind.getType(), NodeType::BINDING);
    ASSERT_TRUE(bind.expression);
    EXPECT_EQ(bind.expression->code, "value");

    EXPECT_EQ(attrs[2]->getType(), NodeType::CLASS_DIRECTIVE);

    const DirectiveNode& in = as<DirectiveNode>(attrs[3]);
    EXPECT_EQ(in.getType(), NodeType::TRANSITION);
    EXPECT_TRUE(in.intro);
    EXPECT_FALSE(in.outro);
    EXPECT_FALSE(in.expression);

    const DirectiveNode& out = as<DirectiveNode>(attrs[4]);
    EXPECT_FALSE(out.intro);
    EXPECT_TRUE(out.outro);

    EXPECT_EQ(attrs[5]->getType(), NodeType::ACTION);
    EXPECT_EQ(attrs[6]->getType(), NodeType::ANIMATION);
}

TEST(Parser, UnknownPrefixIsPlainAttribute) {
    auto root = parseOk("<svg xlink:href=\"#a\"></svg>");
    ASSERT_TRUE(root);
    const auto& attrs = as<ElementNode>(root->html->children[0]).attributes;
    EXPECT_EQ(attrs[0]->getType(), NodeType::ATTRIBUTE);
    EXPECT_EQ(as<AttributeNode>(attrs[0]).name, "xlink:href");
}

// =============================================================================
// Blocks
// =============================================================================

TEST(Parser, IfElseIfChain) {
    auto root = parseOk("{#if a}x{:else if b}y{:else}z{/if}");
    ASSERT_TRUE(root);
    const IfBlockNode& outer = as<IfBlockNode>(root->html->children[0]);
    EXPECT_EQ(outer.expression->code, "a");
    EXPECT_FALSE(outer.elseif);
    ASSERT_TRUE(outer.elseBlock);
    ASSERT_EQ(outer.elseBlock->children.size(), 1u);

    const IfBlockNode& inner = as<IfBlockNode>(outer.elseBlock->children[0]);
    EXPECT_TRUE(inner.elseif);
    EXPECT_EQ(inner.expression->code, "b");
    ASSERT_TRUE(inner.elseBlock);
    EXPECT_EQ(as<TextNode>(inner.elseBlock->children[0]).raw, "z");
}

TEST(Parser, EachHeaderParts) {
    auto root = parseOk("{#each items as { id, name }, i (id)}<li>{name}</li>{:else}none{/each}");
    ASSERT_TRUE(root);
    const EachBlockNode& each = as<EachBlockNode>(root->html->children[0]);
    EXPECT_EQ(each.expression->code, "items");
    EXPECT_EQ(each.context->code, "{ id, name }");
    EXPECT_EQ(each.index, "i");
    ASSERT_TRUE(each.key);
    EXPECT_EQ(each.key->code, "id");
    ASSERT_TRUE(each.elseBlock);
    EXPECT_EQ(each.children.size(), 1u);
}

TEST(Parser, AwaitSections) {
    auto root = parseOk("{#await p}wait{:then v}ok{:catch e}bad{/await}");
    ASSERT_TRUE(root);
    const AwaitBlockNode& await = as<AwaitBlockNode>(root->html->children[0]);
    EXPECT_EQ(await.expression->code, "p");
    EXPECT_EQ(await.value, "v");
    EXPECT_EQ(await.error, "e");
    EXPECT_TRUE(await.pending->hasContent());
    EXPECT_TRUE(await.then->hasContent());
    EXPECT_TRUE(await.catchBlock->hasContent());
}

TEST(Parser, AwaitShortForm) {
    auto root = parseOk("{#await load() then data}{data}{/await}");
    ASSERT_TRUE(root);
    const AwaitBlockNode& await = as<AwaitBlockNode>(root->html->children[0]);
    EXPECT_EQ(await.expression->code, "load()");
    EXPECT_EQ(await.value, "data");
    EXPECT_FALSE(await.pending->hasContent());
    EXPECT_TRUE(await.then->hasContent());
}

// =============================================================================
// Script and Style Hoisting
// =============================================================================

TEST(Parser, TopLevelScriptAndStyleAreHoisted) {
    auto root = parseOk("<script context=\"module\">{}</script><script>{}</script>"
                        "<style></style><div></div>");
    ASSERT_TRUE(root);
    ASSERT_TRUE(root->module);
    EXPECT_EQ(root->module->context, "module");
    ASSERT_TRUE(root->instance);
    EXPECT_EQ(root->instance->content, "{}");
    ASSERT_TRUE(root->css);
    ASSERT_EQ(root->html->children.size(), 1u);
}

TEST(Parser, NestedScriptStaysInPlace) {
    auto root = parseOk("<svelte:head><script src=\"x.js\"></script></svelte:head>");
    ASSERT_TRUE(root);
    EXPECT_FALSE(root->instance);
    const ElementNode& head = as<ElementNode>(root->html->children[0]);
    ASSERT_EQ(head.children.size(), 1u);
    EXPECT_EQ(head.children[0]->getType(), NodeType::SCRIPT);
}

TEST(Parser, TreeDump) {
    auto root = parseOk("<div>hello</div>");
    ASSERT_TRUE(root);
    EXPECT_EQ(root->toString(),
              "Root\n"
              "  Fragment [0,16)\n"
              "    Element(div) [0,16)\n"
              "      Text(\"hello\")\n");
}

// =============================================================================
// Errors
// =============================================================================

TEST(ParserErrors, UnclosedElement) {
    std::string source = "<div>\n<span>";
    ParseError e = parseFail(source);
    EXPECT_STREQ(e.what(), "<span> was left open");
    EXPECT_EQ(e.start, 6u);
    EXPECT_EQ(e.toString(source), "Parse Error at 2:1: <span> was left open");
}

TEST(ParserErrors, MismatchedCloseTag) {
    ParseError e = parseFail("<div></span>");
    EXPECT_STREQ(e.what(), "</span> attempted to close <div>");
}

TEST(ParserErrors, StrayCloseTag) {
    ParseError e = parseFail("</div>");
    EXPECT_STREQ(e.what(), "</div> attempted to close an element that was not open");
}

TEST(ParserErrors, DuplicateStyle) {
    ParseError e = parseFail("<style></style><style></style>");
    EXPECT_STREQ(e.what(), "You can only have one top-level <style> tag per component");
}

TEST(ParserErrors, UnknownSvelteElement) {
    ParseError e = parseFail("<svelte:foo />");
    EXPECT_NE(std::string(e.what()).find("svelte:head"), std::string::npos);
}

TEST(ParserErrors, EachWithoutAs) {
    ParseError e = parseFail("{#each items}x{/each}");
    EXPECT_STREQ(e.what(), "Expected 'as' in {#each ...}");
}

TEST(ParserErrors, UnterminatedMustache) {
    ParseError e = parseFail("<p>{a</p>");
    EXPECT_STREQ(e.what(), "Unexpected end of input: expected '}'");
}

TEST(ParserErrors, DirectiveValueMustBeExpression) {
    ParseError e = parseFail("<div on:click=\"go\"></div>");
    EXPECT_STREQ(e.what(), "Directive value must be a JavaScript expression enclosed in curly braces");
}

TEST(ParserErrors, ParserCanBeReused) {
    Parser parser;
    EXPECT_TRUE(parser.parse("<div>") == nullptr);
    EXPECT_TRUE(parser.hasErrors());
    EXPECT_TRUE(parser.parse("<div></div>") != nullptr);
    EXPECT_FALSE(parser.hasErrors());
}

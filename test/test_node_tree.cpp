#include "html_parser.hpp"
#include "node_tree.hpp"

#include <gtest/gtest.h>

using namespace html_markdown;

static const Node *FindFirst(const Node &node, NodeType type) {
	if (node.type == type) {
		return &node;
	}
	for (const auto &child : node.children) {
		auto found = FindFirst(child, type);
		if (found) {
			return found;
		}
	}
	return nullptr;
}

TEST(NodeTreeTest, ClassifiesTags) {
	EXPECT_EQ(ClassifyTag("h3"), NodeType::HEADING);
	EXPECT_EQ(ClassifyTag("b"), NodeType::STRONG);
	EXPECT_EQ(ClassifyTag("i"), NodeType::EM);
	EXPECT_EQ(ClassifyTag("link"), NodeType::LINK_TAG);
	EXPECT_EQ(ClassifyTag("a"), NodeType::LINK);
	EXPECT_EQ(ClassifyTag("center"), NodeType::ELEMENT);
	EXPECT_EQ(ClassifyTag("my-widget"), NodeType::CUSTOM);
}

TEST(NodeTreeTest, InlineTypes) {
	EXPECT_TRUE(IsInlineType(NodeType::STRONG));
	EXPECT_TRUE(IsInlineType(NodeType::TEXT));
	EXPECT_FALSE(IsInlineType(NodeType::PARAGRAPH));
	EXPECT_FALSE(IsInlineType(NodeType::TABLE));
}

TEST(NodeTreeTest, ClassMatchingIsTokenBased) {
	Node node = MakeElement("span");
	node.attributes.emplace_back("class", "ocrx_word  word-box");
	EXPECT_TRUE(node.HasClass("ocrx_word"));
	EXPECT_TRUE(node.HasClass("word-box"));
	EXPECT_FALSE(node.HasClass("ocrx"));
	EXPECT_FALSE(node.HasClass("word"));
}

TEST(NodeTreeTest, SerializeEscapesTextAndAttributes) {
	Node link = MakeElement("a");
	link.attributes.emplace_back("href", "/q?a=1&b=\"2\"");
	link.children.push_back(MakeTextNode("x < y"));
	EXPECT_EQ(SerializeHtml(link), "<a href=\"/q?a=1&amp;b=&quot;2&quot;\">x &lt; y</a>");

	Node br = MakeElement("br");
	EXPECT_EQ(SerializeHtml(br), "<br>");
}

TEST(HtmlParserTest, BuildsTreeWithOffsets) {
	std::string html = "<html><body><p>Hello <b>World</b></p></body></html>";
	auto document = ParseHtml(html);
	ASSERT_TRUE(document.success);
	EXPECT_EQ(document.root.type, NodeType::HTML);

	auto paragraph = FindFirst(document.root, NodeType::PARAGRAPH);
	ASSERT_NE(paragraph, nullptr);
	EXPECT_EQ(paragraph->TextContent(), "Hello World");
	EXPECT_EQ(paragraph->source_offset, html.find("<p>"));

	auto bold = FindFirst(document.root, NodeType::STRONG);
	ASSERT_NE(bold, nullptr);
	EXPECT_EQ(bold->source_offset, html.find("<b>"));
}

TEST(HtmlParserTest, LowerCasesNamesAndDecodesEntities) {
	auto document = ParseHtml("<DIV CLASS=\"x\">a &amp; b</DIV>");
	ASSERT_TRUE(document.success);
	auto div = FindFirst(document.root, NodeType::DIV);
	ASSERT_NE(div, nullptr);
	EXPECT_EQ(div->tag_name, "div");
	EXPECT_EQ(div->GetAttribute("class"), "x");
	EXPECT_EQ(div->TextContent(), "a & b");
}

TEST(HtmlParserTest, EmptyInputYieldsEmptyDocument) {
	auto document = ParseHtml("   ");
	EXPECT_TRUE(document.success);
	EXPECT_EQ(document.root.type, NodeType::HTML);
	EXPECT_TRUE(document.root.children.empty());
}

TEST(HtmlParserTest, CommentsAreDropped) {
	auto document = ParseHtml("<p>a<!-- hidden -->b</p>");
	ASSERT_TRUE(document.success);
	auto paragraph = FindFirst(document.root, NodeType::PARAGRAPH);
	ASSERT_NE(paragraph, nullptr);
	EXPECT_EQ(paragraph->TextContent(), "ab");
}

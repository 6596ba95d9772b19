#include "html_markdown.hpp"

#include <gtest/gtest.h>

using namespace html_markdown;

static std::string Convert(const std::string &html, const ConversionOptions &options = ConversionOptions()) {
	auto result = ConvertHtml(html, options);
	EXPECT_FALSE(result.HasError()) << result.GetError();
	return result.markdown;
}

//===--------------------------------------------------------------------===//
// Headings and paragraphs
//===--------------------------------------------------------------------===//

TEST(RenderEngineTest, AtxHeading) {
	EXPECT_EQ(Convert("<h1>Hello World</h1>"), "# Hello World\n");
}

TEST(RenderEngineTest, UnderlinedHeadings) {
	ConversionOptions options;
	options.heading_style = HeadingStyle::UNDERLINED;
	EXPECT_EQ(Convert("<h1>Title</h1><h2>Sub</h2>", options), "Title\n=====\n\nSub\n---\n");
}

TEST(RenderEngineTest, ClosedAtxHeading) {
	ConversionOptions options;
	options.heading_style = HeadingStyle::ATX_CLOSED;
	EXPECT_EQ(Convert("<h2>Sub</h2>", options), "## Sub ##\n");
}

TEST(RenderEngineTest, ParagraphsAreSeparatedByBlankLine) {
	EXPECT_EQ(Convert("<p>First</p><p>Second</p>"), "First\n\nSecond\n");
}

TEST(RenderEngineTest, EmptyInputGivesEmptyOutput) {
	EXPECT_EQ(Convert(""), "");
}

//===--------------------------------------------------------------------===//
// Inline formatting
//===--------------------------------------------------------------------===//

TEST(RenderEngineTest, StrongAndEmphasis) {
	EXPECT_EQ(Convert("<p>Some <b>bold</b> and <em>italic</em> text</p>"), "Some **bold** and *italic* text\n");
}

TEST(RenderEngineTest, StrikeAndHighlight) {
	EXPECT_EQ(Convert("<p><del>x</del> <mark>y</mark></p>"), "~~x~~ ==y==\n");
}

TEST(RenderEngineTest, SuperscriptSymbol) {
	ConversionOptions options;
	options.sup_symbol = "^";
	EXPECT_EQ(Convert("<p>x<sup>2</sup></p>", options), "x^2^\n");
}

TEST(RenderEngineTest, QuoteAndAbbreviation) {
	EXPECT_EQ(Convert("<p><q>hi</q> <abbr title=\"HyperText\">HTML</abbr></p>"), "\"hi\" HTML (HyperText)\n");
}

TEST(RenderEngineTest, EscapesUnderscores) {
	EXPECT_EQ(Convert("<p>snake_case</p>"), "snake\\_case\n");
	ConversionOptions options;
	options.escape_underscores = false;
	EXPECT_EQ(Convert("<p>snake_case</p>", options), "snake_case\n");
}

TEST(RenderEngineTest, InlineCode) {
	EXPECT_EQ(Convert("<p>Use <code>x = 1</code> now</p>"), "Use `x = 1` now\n");
}

//===--------------------------------------------------------------------===//
// Links and images
//===--------------------------------------------------------------------===//

TEST(RenderEngineTest, LinkWithTitle) {
	EXPECT_EQ(Convert("<p><a href=\"https://example.com\" title=\"Ex\">Example</a></p>"),
	          "[Example](https://example.com \"Ex\")\n");
}

TEST(RenderEngineTest, Autolink) {
	EXPECT_EQ(Convert("<p><a href=\"https://example.com\">https://example.com</a></p>"), "<https://example.com>\n");
	ConversionOptions options;
	options.autolinks = false;
	EXPECT_EQ(Convert("<p><a href=\"https://example.com\">https://example.com</a></p>", options),
	          "[https://example.com](https://example.com)\n");
}

TEST(RenderEngineTest, Image) {
	EXPECT_EQ(Convert("<p><img src=\"a.png\" alt=\"Alt\"></p>"), "![Alt](a.png)\n");
}

TEST(RenderEngineTest, ImageInsideHeadingCollapsesToAlt) {
	std::string html = "<h2>Logo <img src=\"l.png\" alt=\"Brand\"></h2>";
	EXPECT_EQ(Convert(html), "## Logo Brand\n");

	ConversionOptions options;
	options.keep_inline_images_in = {"h2"};
	EXPECT_EQ(Convert(html, options), "## Logo ![Brand](l.png)\n");
}

//===--------------------------------------------------------------------===//
// Lists
//===--------------------------------------------------------------------===//

TEST(RenderEngineTest, UnorderedList) {
	EXPECT_EQ(Convert("<ul><li>One</li><li>Two</li></ul>"), "* One\n* Two\n");
}

TEST(RenderEngineTest, OrderedListHonorsStart) {
	EXPECT_EQ(Convert("<ol start=\"3\"><li>a</li><li>b</li></ol>"), "3. a\n4. b\n");
}

TEST(RenderEngineTest, OrderedListIgnoresNonNumericStart) {
	EXPECT_EQ(Convert("<ol start=\"abc\"><li>a</li><li>b</li></ol>"), "1. a\n2. b\n");
}

TEST(RenderEngineTest, NestedListCyclesBullets) {
	EXPECT_EQ(Convert("<ul><li>A<ul><li>B</li></ul></li></ul>"), "* A\n    + B\n");
}

TEST(RenderEngineTest, TaskListItem) {
	EXPECT_EQ(Convert("<ul><li><input type=\"checkbox\" checked> Done</li></ul>"), "* [x] Done\n");
}

TEST(RenderEngineTest, DefinitionList) {
	EXPECT_EQ(Convert("<dl><dt>Term</dt><dd>Desc</dd></dl>"), "Term\n:   Desc\n");
}

//===--------------------------------------------------------------------===//
// Blocks
//===--------------------------------------------------------------------===//

TEST(RenderEngineTest, Blockquote) {
	EXPECT_EQ(Convert("<blockquote><p>Quote</p></blockquote>"), "> Quote\n");
}

TEST(RenderEngineTest, NestedBlockquote) {
	EXPECT_EQ(Convert("<blockquote><p>a</p><blockquote><p>b</p></blockquote></blockquote>"), "> a\n>\n> > b\n");
}

TEST(RenderEngineTest, FencedCodeBlockWithLanguage) {
	EXPECT_EQ(Convert("<pre><code class=\"language-python\">print(1)</code></pre>"), "```python\nprint(1)\n```\n");
}

TEST(RenderEngineTest, IndentedCodeBlock) {
	ConversionOptions options;
	options.code_block_style = CodeBlockStyle::INDENTED;
	EXPECT_EQ(Convert("<pre><code>print(1)</code></pre>", options), "    print(1)\n");
}

TEST(RenderEngineTest, HorizontalRule) {
	EXPECT_EQ(Convert("<p>a</p><hr><p>b</p>"), "a\n\n---\n\nb\n");
}

TEST(RenderEngineTest, LineBreakStyles) {
	EXPECT_EQ(Convert("<p>a<br>b</p>"), "a  \nb\n");
	ConversionOptions options;
	options.newline_style = NewlineStyle::BACKSLASH;
	EXPECT_EQ(Convert("<p>a<br>b</p>", options), "a\\\nb\n");
}

TEST(RenderEngineTest, DetailsAndSummary) {
	EXPECT_EQ(Convert("<details><summary>More</summary><p>Body</p></details>"), "**More**\n\nBody\n");
}

TEST(RenderEngineTest, FigureWithCaption) {
	EXPECT_EQ(Convert("<figure><img src=\"a.png\" alt=\"A\"><figcaption>Cap</figcaption></figure>"),
	          "![A](a.png)\n\n*Cap*\n");
}

//===--------------------------------------------------------------------===//
// Tables
//===--------------------------------------------------------------------===//

TEST(RenderEngineTest, SimpleTable) {
	EXPECT_EQ(Convert("<table><tr><th>A</th><th>B</th></tr><tr><td>1</td><td>2</td></tr></table>"),
	          "| A | B |\n| --- | --- |\n| 1 | 2 |\n");
}

TEST(RenderEngineTest, TableWithoutHeaderUsesFirstRow) {
	EXPECT_EQ(Convert("<table><tr><td>x</td><td>y</td></tr><tr><td>1</td></tr></table>"),
	          "| x | y |\n| --- | --- |\n| 1 |  |\n");
}

TEST(RenderEngineTest, TableCellPipesAreEscaped) {
	EXPECT_EQ(Convert("<table><tr><th>a|b</th></tr></table>"), "| a\\|b |\n| --- |\n");
}

//===--------------------------------------------------------------------===//
// Options
//===--------------------------------------------------------------------===//

TEST(RenderEngineTest, InlineMode) {
	ConversionOptions options;
	options.convert_as_inline = true;
	EXPECT_EQ(Convert("<p>a</p><p>b</p>", options), "a b");
}

TEST(RenderEngineTest, MetadataComment) {
	EXPECT_EQ(Convert("<html><head><title>T</title></head><body><p>x</p></body></html>"),
	          "<!--\ntitle: T\n-->\n\nx\n");
	ConversionOptions options;
	options.extract_metadata = false;
	EXPECT_EQ(Convert("<html><head><title>T</title></head><body><p>x</p></body></html>", options), "x\n");
}

TEST(RenderEngineTest, PreserveTags) {
	ConversionOptions options;
	options.preserve_tags = {"table"};
	auto markdown = Convert("<p>a</p><table><tr><td>1</td></tr></table>", options);
	EXPECT_NE(markdown.find("<table>"), std::string::npos);
	EXPECT_NE(markdown.find("<td>1</td>"), std::string::npos);
}

TEST(RenderEngineTest, StripTagsKeepsChildren) {
	ConversionOptions options;
	options.strip_tags = {"b"};
	EXPECT_EQ(Convert("<p>a <b>bold</b> c</p>", options), "a bold c\n");
}

TEST(RenderEngineTest, Wrapping) {
	ConversionOptions options;
	options.wrap = true;
	options.wrap_width = 7;
	EXPECT_EQ(Convert("<p>aaa bbb ccc</p>", options), "aaa bbb\nccc\n");
}

TEST(RenderEngineTest, InvalidOptionsAreRejected) {
	ConversionOptions options;
	options.bullets = "";
	auto result = ConvertHtml("<p>x</p>", options);
	EXPECT_TRUE(result.HasError());
	EXPECT_TRUE(result.markdown.empty());
}

TEST(RenderEngineTest, ConversionIsDeterministic) {
	std::string html = "<h1>T</h1><ul><li>a</li></ul><table><tr><td>1</td><td>2</td></tr></table>";
	EXPECT_EQ(Convert(html), Convert(html));
}

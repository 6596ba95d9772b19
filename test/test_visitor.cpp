#include "html_markdown.hpp"

#include <gtest/gtest.h>

using namespace html_markdown;

namespace {

class HeadingOverride : public HtmlVisitor {
public:
	VisitResult VisitHeading(const NodeContext &ctx, uint32_t level, const std::string &text,
	                         const std::string &id) override {
		seen_level = level;
		seen_text = text;
		seen_id = id;
		return VisitResult::Custom("# CUSTOM");
	}

	uint32_t seen_level = 0;
	std::string seen_text;
	std::string seen_id;
};

class SilentHeadingAborter : public HtmlVisitor {
public:
	VisitResult VisitHeading(const NodeContext &ctx, uint32_t level, const std::string &text,
	                         const std::string &id) override {
		return VisitResult::Error("");
	}
};

class AdRemover : public HtmlVisitor {
public:
	VisitResult VisitElementStart(const NodeContext &ctx) override {
		if (ctx.tag_name == "div" && ctx.GetAttribute("class") == "ad") {
			return VisitResult::Skip();
		}
		return VisitResult::Continue();
	}
};

class Aborter : public HtmlVisitor {
public:
	VisitResult VisitElementStart(const NodeContext &ctx) override {
		if (ctx.tag_name == "section") {
			return VisitResult::Error("stop here");
		}
		return VisitResult::Continue();
	}
};

class SpanPreserver : public HtmlVisitor {
public:
	VisitResult VisitElementStart(const NodeContext &ctx) override {
		if (ctx.tag_name == "span") {
			return VisitResult::PreserveHtml();
		}
		return VisitResult::Continue();
	}
};

class StrongRewriter : public HtmlVisitor {
public:
	VisitResult VisitStrong(const NodeContext &ctx, const std::string &text) override {
		return VisitResult::Custom("<<" + text + ">>");
	}
	VisitResult VisitElementEnd(const NodeContext &ctx, const std::string &output) override {
		if (ctx.tag_name == "b") {
			return VisitResult::Custom("END");
		}
		return VisitResult::Continue();
	}
};

struct RecordedContext {
	std::string tag_name;
	size_t depth;
	size_t index_in_parent;
	std::string parent_tag;
	bool is_inline;
};

class ContextRecorder : public HtmlVisitor {
public:
	VisitResult VisitElementStart(const NodeContext &ctx) override {
		records.push_back(RecordedContext {ctx.tag_name, ctx.depth, ctx.index_in_parent,
		                                   ctx.HasParent() ? *ctx.parent_tag : std::string(), ctx.is_inline});
		return VisitResult::Continue();
	}

	const RecordedContext *Find(const std::string &tag_name) const {
		for (const auto &record : records) {
			if (record.tag_name == tag_name) {
				return &record;
			}
		}
		return nullptr;
	}

	std::vector<RecordedContext> records;
};

class LinkSkipper : public HtmlVisitor {
public:
	VisitResult VisitLink(const NodeContext &ctx, const std::string &href, const std::string &text,
	                      const std::string &title) override {
		if (href == "/hidden") {
			return VisitResult::Skip();
		}
		return VisitResult::Continue();
	}
};

class CustomElementRecorder : public HtmlVisitor {
public:
	VisitResult VisitCustomElement(const NodeContext &ctx, const std::string &tag_name,
	                               const std::string &html) override {
		seen_tag = tag_name;
		seen_html = html;
		return VisitResult::Custom("[widget]");
	}

	std::string seen_tag;
	std::string seen_html;
};

class RowRecorder : public HtmlVisitor {
public:
	VisitResult VisitTableRow(const NodeContext &ctx, const std::vector<std::string> &cells, bool is_header) override {
		rows.push_back(cells);
		headers.push_back(is_header);
		return VisitResult::Continue();
	}

	std::vector<std::vector<std::string>> rows;
	std::vector<bool> headers;
};

} // namespace

TEST(VisitorTest, CustomHeadingReplacesOutput) {
	HeadingOverride visitor;
	auto result = ConvertHtml("<h2 id=\"intro\">Original</h2><p>Body</p>", ConversionOptions(), &visitor);
	ASSERT_FALSE(result.HasError());
	EXPECT_NE(result.markdown.find("# CUSTOM"), std::string::npos);
	EXPECT_EQ(result.markdown.find("Original"), std::string::npos);
	EXPECT_NE(result.markdown.find("Body"), std::string::npos);
	EXPECT_EQ(visitor.seen_level, 2u);
	EXPECT_EQ(visitor.seen_text, "Original");
	EXPECT_EQ(visitor.seen_id, "intro");
}

TEST(VisitorTest, SkipRemovesSubtree) {
	AdRemover visitor;
	auto result = ConvertHtml("<p>Keep</p><div class=\"ad\"><p>Buy now</p></div><p>Also</p>", ConversionOptions(),
	                          &visitor);
	ASSERT_FALSE(result.HasError());
	EXPECT_EQ(result.markdown, "Keep\n\nAlso\n");
}

TEST(VisitorTest, ErrorAbortsConversion) {
	Aborter visitor;
	auto result = ConvertHtml("<p>a</p><section><p>b</p></section>", ConversionOptions(), &visitor);
	EXPECT_TRUE(result.HasError());
	EXPECT_EQ(result.GetError(), "stop here");
	EXPECT_TRUE(result.markdown.empty());
}

TEST(VisitorTest, ErrorWithoutMessageIsStillAnError) {
	SilentHeadingAborter visitor;
	auto result = ConvertHtml("<h1>Original</h1><p>tail</p>", ConversionOptions(), &visitor);
	EXPECT_TRUE(result.HasError());
	EXPECT_EQ(result.GetError(), "conversion aborted by visitor");
	EXPECT_TRUE(result.markdown.empty());

	auto with_metadata = ConvertWithMetadata("<h1>Original</h1>", ConversionOptions(), MetadataConfig(), &visitor);
	EXPECT_TRUE(with_metadata.HasError());
	EXPECT_TRUE(with_metadata.metadata.headers.empty());
}

TEST(VisitorTest, PreserveHtmlKeepsMarkup) {
	SpanPreserver visitor;
	auto result = ConvertHtml("<p>a <span class=\"x\">b</span> c</p>", ConversionOptions(), &visitor);
	ASSERT_FALSE(result.HasError());
	EXPECT_NE(result.markdown.find("<span class=\"x\">b</span>"), std::string::npos);
}

TEST(VisitorTest, ElementEndOverridesTypedCallback) {
	StrongRewriter visitor;
	auto result = ConvertHtml("<p>x <b>y</b> <strong>z</strong></p>", ConversionOptions(), &visitor);
	ASSERT_FALSE(result.HasError());
	EXPECT_EQ(result.markdown, "x END <<z>>\n");
}

TEST(VisitorTest, ContextDescribesPosition) {
	ContextRecorder visitor;
	auto result = ConvertHtml("<div><p>a<em>b</em></p></div>", ConversionOptions(), &visitor);
	ASSERT_FALSE(result.HasError());
	auto p = visitor.Find("p");
	auto em = visitor.Find("em");
	ASSERT_NE(p, nullptr);
	ASSERT_NE(em, nullptr);
	EXPECT_EQ(p->parent_tag, "div");
	EXPECT_FALSE(p->is_inline);
	EXPECT_EQ(em->parent_tag, "p");
	EXPECT_EQ(em->depth, p->depth + 1);
	EXPECT_EQ(em->index_in_parent, 1u);
	EXPECT_TRUE(em->is_inline);
}

TEST(VisitorTest, SkippedLinkIsDroppedFromMetadata) {
	LinkSkipper visitor;
	auto result = ConvertWithMetadata("<p><a href=\"/shown\">A</a> <a href=\"/hidden\">B</a></p>", ConversionOptions(),
	                                  MetadataConfig(), &visitor);
	ASSERT_FALSE(result.HasError());
	EXPECT_EQ(result.markdown, "[A](/shown)\n");
	ASSERT_EQ(result.metadata.links.size(), 1u);
	EXPECT_EQ(result.metadata.links[0].href, "/shown");
}

TEST(VisitorTest, SkippedSubtreeYieldsNoInlineImages) {
	AdRemover visitor;
	std::string png = "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mNkYPhfDwAChwGA60e6kgAAAABJRU5ErkJggg==";
	std::string html = "<div class=\"ad\"><img src=\"data:image/png;base64," + png + "\"></div>";
	auto result = ConvertWithInlineImages(html, ConversionOptions(), InlineImageConfig(), &visitor);
	ASSERT_FALSE(result.HasError());
	EXPECT_TRUE(result.inline_images.empty());
}

TEST(VisitorTest, CustomElementReceivesMarkup) {
	CustomElementRecorder visitor;
	auto result = ConvertHtml("<p>a <my-widget data-id=\"7\">w</my-widget></p>", ConversionOptions(), &visitor);
	ASSERT_FALSE(result.HasError());
	EXPECT_EQ(visitor.seen_tag, "my-widget");
	EXPECT_EQ(visitor.seen_html, "<my-widget data-id=\"7\">w</my-widget>");
	EXPECT_EQ(result.markdown, "a [widget]\n");
}

TEST(VisitorTest, TableRowsAreReported) {
	RowRecorder visitor;
	auto result = ConvertHtml("<table><thead><tr><th>A</th><th>B</th></tr></thead>"
	                          "<tbody><tr><td>1</td><td>2</td></tr></tbody></table>",
	                          ConversionOptions(), &visitor);
	ASSERT_FALSE(result.HasError());
	ASSERT_EQ(visitor.rows.size(), 2u);
	EXPECT_EQ(visitor.rows[0], (std::vector<std::string> {"A", "B"}));
	EXPECT_TRUE(visitor.headers[0]);
	EXPECT_EQ(visitor.rows[1], (std::vector<std::string> {"1", "2"}));
	EXPECT_FALSE(visitor.headers[1]);
	EXPECT_EQ(result.markdown, "| A | B |\n| --- | --- |\n| 1 | 2 |\n");
}

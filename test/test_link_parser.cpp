#include "link_parser.hpp"

#include <gtest/gtest.h>

using namespace html_markdown;

TEST(LinkParserTest, ClassifiesBySchemeFirst) {
	EXPECT_EQ(LinkParser::ClassifyLink("#section", "example.com"), LinkType::ANCHOR);
	EXPECT_EQ(LinkParser::ClassifyLink("MAILTO:a@b.com", "example.com"), LinkType::EMAIL);
	EXPECT_EQ(LinkParser::ClassifyLink("tel:+123", "example.com"), LinkType::PHONE);
	EXPECT_EQ(LinkParser::ClassifyLink("javascript:void(0)", "example.com"), LinkType::OTHER);
	EXPECT_EQ(LinkParser::ClassifyLink("/about", "example.com"), LinkType::INTERNAL);
	EXPECT_EQ(LinkParser::ClassifyLink("docs/page.html", ""), LinkType::INTERNAL);
}

TEST(LinkParserTest, AbsoluteLinksCompareHosts) {
	EXPECT_EQ(LinkParser::ClassifyLink("https://www.example.com/x", "example.com"), LinkType::INTERNAL);
	EXPECT_EQ(LinkParser::ClassifyLink("https://example.com/x", "www.example.com"), LinkType::INTERNAL);
	EXPECT_EQ(LinkParser::ClassifyLink("https://other.org/", "example.com"), LinkType::EXTERNAL);
	EXPECT_EQ(LinkParser::ClassifyLink("//cdn.example.net/a.js", "example.com"), LinkType::EXTERNAL);
	// Without a known document host every absolute link is external
	EXPECT_EQ(LinkParser::ClassifyLink("https://example.com/", ""), LinkType::EXTERNAL);
}

TEST(LinkParserTest, ExtractDomain) {
	EXPECT_EQ(LinkParser::ExtractDomain("https://User:pw@Example.COM:8080/path?q=1"), "example.com");
	EXPECT_EQ(LinkParser::ExtractDomain("//cdn.example.net/a.js"), "cdn.example.net");
	EXPECT_EQ(LinkParser::ExtractDomain("http://host#frag"), "host");
	EXPECT_EQ(LinkParser::ExtractDomain("/relative/path"), "");
	EXPECT_EQ(LinkParser::ExtractBaseDomain("WWW.Example.com"), "example.com");
	EXPECT_EQ(LinkParser::ExtractBaseDomain("www."), "www.");
}

TEST(LinkParserTest, ClassifiesImages) {
	EXPECT_EQ(LinkParser::ClassifyImage("data:image/png;base64,AAAA"), ImageType::DATA_URI);
	EXPECT_EQ(LinkParser::ClassifyImage("https://example.com/a.png"), ImageType::EXTERNAL);
	EXPECT_EQ(LinkParser::ClassifyImage("img/a.png"), ImageType::RELATIVE);
	EXPECT_STREQ(ImageTypeToString(ImageType::INLINE_SVG), "inline_svg");
	EXPECT_STREQ(LinkTypeToString(LinkType::PHONE), "phone");
}

TEST(LinkParserTest, SplitRel) {
	auto rel = LinkParser::SplitRel("  NoFollow\tnoopener  ");
	ASSERT_EQ(rel.size(), 2u);
	EXPECT_EQ(rel[0], "nofollow");
	EXPECT_EQ(rel[1], "noopener");
	EXPECT_TRUE(LinkParser::SplitRel("").empty());
}

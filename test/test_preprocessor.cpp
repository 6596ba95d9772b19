#include "html_markdown.hpp"
#include "html_parser.hpp"
#include "preprocessor.hpp"

#include <gtest/gtest.h>

using namespace html_markdown;

static const char *PAGE_HTML = "<nav><a href=\"/\">Home</a></nav>"
                               "<header>Site banner</header>"
                               "<main><article><header><h1>Title</h1></header><p>Body</p>"
                               "<aside>Related</aside>"
                               "<div class=\"cookie-notice\">Cookies</div></article></main>"
                               "<form action=\"/s\"><input type=\"text\" name=\"q\" value=\"query\"></form>"
                               "<footer>Legal</footer>"
                               "<script>var x = 1;</script><style>p {}</style>";

static std::string ConvertPage(PreprocessingPreset preset, bool enabled = true) {
	ConversionOptions options;
	options.preprocessing.enabled = enabled;
	options.preprocessing.preset = preset;
	auto result = ConvertHtml(PAGE_HTML, options);
	EXPECT_FALSE(result.HasError()) << result.GetError();
	return result.markdown;
}

static bool Contains(const std::string &haystack, const std::string &needle) {
	return haystack.find(needle) != std::string::npos;
}

TEST(PreprocessorTest, DisabledKeepsPageChrome) {
	auto markdown = ConvertPage(PreprocessingPreset::STANDARD, false);
	EXPECT_TRUE(Contains(markdown, "Home"));
	EXPECT_TRUE(Contains(markdown, "Site banner"));
	EXPECT_TRUE(Contains(markdown, "Legal"));
	EXPECT_FALSE(Contains(markdown, "var x"));
}

TEST(PreprocessorTest, MinimalOnlyDropsScriptsAndStyles) {
	ConversionOptions options;
	options.preprocessing.enabled = true;
	options.preprocessing.preset = PreprocessingPreset::MINIMAL;
	auto document = ParseHtml(PAGE_HTML);
	ASSERT_TRUE(document.success);
	EXPECT_EQ(ApplyPreprocessing(document.root, options.preprocessing), 2u);

	auto markdown = ConvertPage(PreprocessingPreset::MINIMAL);
	EXPECT_TRUE(Contains(markdown, "Home"));
	EXPECT_TRUE(Contains(markdown, "Legal"));
}

TEST(PreprocessorTest, StandardDropsNavigationAndForms) {
	auto markdown = ConvertPage(PreprocessingPreset::STANDARD);
	EXPECT_FALSE(Contains(markdown, "Home"));
	EXPECT_FALSE(Contains(markdown, "Site banner"));
	EXPECT_FALSE(Contains(markdown, "Legal"));
	EXPECT_FALSE(Contains(markdown, "query"));
	EXPECT_TRUE(Contains(markdown, "# Title"));
	EXPECT_TRUE(Contains(markdown, "Body"));
	EXPECT_TRUE(Contains(markdown, "Related"));
	EXPECT_TRUE(Contains(markdown, "Cookies"));
}

TEST(PreprocessorTest, AggressiveDropsAsidesAndChromeClasses) {
	auto markdown = ConvertPage(PreprocessingPreset::AGGRESSIVE);
	EXPECT_TRUE(Contains(markdown, "# Title"));
	EXPECT_TRUE(Contains(markdown, "Body"));
	EXPECT_FALSE(Contains(markdown, "Related"));
	EXPECT_FALSE(Contains(markdown, "Cookies"));
}

TEST(PreprocessorTest, NavigationAndFormSwitches) {
	ConversionOptions options;
	options.preprocessing.enabled = true;
	options.preprocessing.remove_navigation = false;
	options.preprocessing.remove_forms = false;
	auto result = ConvertHtml(PAGE_HTML, options);
	ASSERT_FALSE(result.HasError());
	EXPECT_TRUE(Contains(result.markdown, "Home"));
	EXPECT_TRUE(Contains(result.markdown, "query"));
}

TEST(PreprocessorTest, StructuredDataScriptsSurvive) {
	PreprocessingOptions options;
	options.enabled = true;
	Node json_ld = MakeElement("script");
	json_ld.attributes.emplace_back("type", "application/ld+json");
	EXPECT_FALSE(ShouldRemoveElement(json_ld, options, false));
	Node plain = MakeElement("script");
	EXPECT_TRUE(ShouldRemoveElement(plain, options, false));

	ConversionOptions conversion;
	conversion.preprocessing = options;
	auto result = ConvertWithMetadata("<script type=\"application/ld+json\">{\"@type\": \"Event\"}</script><p>x</p>",
	                                  conversion, MetadataConfig());
	ASSERT_FALSE(result.HasError());
	ASSERT_EQ(result.metadata.structured_data.size(), 1u);
	EXPECT_EQ(result.metadata.structured_data[0].schema_type.value_or(""), "Event");
}

TEST(PreprocessorTest, HeaderInsideContentIsKept) {
	PreprocessingOptions options;
	options.enabled = true;
	Node header = MakeElement("header");
	EXPECT_TRUE(ShouldRemoveElement(header, options, false));
	EXPECT_FALSE(ShouldRemoveElement(header, options, true));

	options.preset = PreprocessingPreset::AGGRESSIVE;
	Node body = MakeElement("body");
	body.attributes.emplace_back("class", "has-sidebar");
	EXPECT_FALSE(ShouldRemoveElement(body, options, false));
	Node menu = MakeElement("div");
	menu.attributes.emplace_back("id", "main-menu");
	EXPECT_TRUE(ShouldRemoveElement(menu, options, false));
}

#include "conversion_options.hpp"

#include <gtest/gtest.h>

using namespace html_markdown;

TEST(OptionsTest, DefaultsAreValid) {
	ConversionOptions options;
	EXPECT_EQ(ValidateOptions(options), "");
	EXPECT_EQ(options.heading_style, HeadingStyle::ATX);
	EXPECT_EQ(options.code_block_style, CodeBlockStyle::BACKTICKS);
	EXPECT_EQ(options.bullets, "*+-");
	EXPECT_TRUE(options.extract_metadata);
	EXPECT_FALSE(options.preprocessing.enabled);
}

TEST(OptionsTest, ValidationRejectsBadValues) {
	ConversionOptions options;
	options.bullets = "";
	EXPECT_NE(ValidateOptions(options), "");

	options = ConversionOptions();
	options.strong_em_symbol = '#';
	EXPECT_NE(ValidateOptions(options), "");

	options = ConversionOptions();
	options.wrap = true;
	options.wrap_width = 0;
	EXPECT_NE(ValidateOptions(options), "");

	options = ConversionOptions();
	options.list_indent_type = ListIndentType::TABS;
	options.list_indent_width = 0;
	EXPECT_EQ(ValidateOptions(options), "");

	options = ConversionOptions();
	options.hocr_row_overlap_ratio = 0;
	EXPECT_NE(ValidateOptions(options), "");
}

TEST(OptionsTest, ParsesJson) {
	ConversionOptions options;
	std::string error;
	ASSERT_TRUE(ParseOptionsJson(R"({
		"heading_style": "underlined",
		"bullets": "-",
		"strong_em_symbol": "_",
		"wrap": true,
		"wrap_width": 60,
		"keep_inline_images_in": ["h1", "td"],
		"preprocessing": {"enabled": true, "preset": "aggressive", "remove_forms": false},
		"hocr_min_column_gap": 25.5,
		"document_url": "https://example.com/",
	})",
	                             options, error))
	    << error;
	EXPECT_EQ(options.heading_style, HeadingStyle::UNDERLINED);
	EXPECT_EQ(options.bullets, "-");
	EXPECT_EQ(options.strong_em_symbol, '_');
	EXPECT_TRUE(options.wrap);
	EXPECT_EQ(options.wrap_width, 60u);
	EXPECT_EQ(options.keep_inline_images_in, (std::vector<std::string> {"h1", "td"}));
	EXPECT_TRUE(options.preprocessing.enabled);
	EXPECT_EQ(options.preprocessing.preset, PreprocessingPreset::AGGRESSIVE);
	EXPECT_FALSE(options.preprocessing.remove_forms);
	EXPECT_TRUE(options.preprocessing.remove_navigation);
	EXPECT_DOUBLE_EQ(options.hocr_min_column_gap, 25.5);
	EXPECT_EQ(options.document_url, "https://example.com/");
}

TEST(OptionsTest, RejectsInvalidJson) {
	ConversionOptions options;
	std::string error;
	EXPECT_FALSE(ParseOptionsJson("{\"colour\": true}", options, error));
	EXPECT_EQ(error, "unknown option 'colour'");

	EXPECT_FALSE(ParseOptionsJson("{\"wrap\": 1}", options, error));
	EXPECT_EQ(error, "option 'wrap' must be a boolean");

	EXPECT_FALSE(ParseOptionsJson("{\"heading_style\": \"setext\"}", options, error));
	EXPECT_EQ(error, "invalid value 'setext' for option 'heading_style'");

	EXPECT_FALSE(ParseOptionsJson("{\"wrap_width\": -3}", options, error));
	EXPECT_FALSE(ParseOptionsJson("{\"preprocessing\": {\"mode\": 1}}", options, error));
	EXPECT_FALSE(ParseOptionsJson("[1, 2]", options, error));
	EXPECT_FALSE(ParseOptionsJson("{broken", options, error));
	EXPECT_EQ(error.compare(0, 21, "invalid options JSON:"), 0);
}

TEST(OptionsTest, HeadingStyleNames) {
	HeadingStyle style;
	ASSERT_TRUE(ParseHeadingStyle("atx_closed", style));
	EXPECT_EQ(style, HeadingStyle::ATX_CLOSED);
	EXPECT_STREQ(HeadingStyleToString(style), "atx_closed");
	EXPECT_FALSE(ParseHeadingStyle("ATX", style));
}

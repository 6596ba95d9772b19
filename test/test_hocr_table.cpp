#include "hocr_table.hpp"
#include "html_markdown.hpp"
#include "html_parser.hpp"

#include <gtest/gtest.h>

using namespace html_markdown;

static HocrWord Word(const std::string &text, double x0, double y0, double x1, double y1, double confidence = 95) {
	HocrWord word;
	word.text = text;
	word.bbox.x0 = x0;
	word.bbox.y0 = y0;
	word.bbox.x1 = x1;
	word.bbox.y1 = y1;
	word.confidence = confidence;
	return word;
}

static std::string WordSpan(const std::string &text, int x0, int y0, int x1, int y1, int confidence = 95) {
	return "<span class=\"ocrx_word\" title=\"bbox " + std::to_string(x0) + " " + std::to_string(y0) + " " +
	       std::to_string(x1) + " " + std::to_string(y1) + "; x_wconf " + std::to_string(confidence) + "\">" + text +
	       "</span>";
}

TEST(HocrTableTest, ParsesTitleProperties) {
	HocrBoundingBox bbox;
	double confidence = 100;
	ASSERT_TRUE(SpatialTableReconstructor::ParseTitle("image \"p.png\"; bbox 10 20 110 40; x_wconf 87", bbox,
	                                                  confidence));
	EXPECT_EQ(bbox.x0, 10);
	EXPECT_EQ(bbox.y0, 20);
	EXPECT_EQ(bbox.x1, 110);
	EXPECT_EQ(bbox.y1, 40);
	EXPECT_EQ(confidence, 87);
	EXPECT_EQ(bbox.Height(), 20);
	EXPECT_EQ(bbox.MidX(), 60);

	EXPECT_FALSE(SpatialTableReconstructor::ParseTitle("x_wconf 50", bbox, confidence));
	EXPECT_FALSE(SpatialTableReconstructor::ParseTitle("bbox 1 2", bbox, confidence));
}

TEST(HocrTableTest, SingleRowGrid) {
	SpatialTableReconstructor reconstructor {HocrTableConfig()};
	auto grid = reconstructor.BuildGrid({Word("C", 400, 10, 450, 30), Word("A", 10, 12, 60, 32),
	                                     Word("B", 200, 11, 250, 31)});
	ASSERT_EQ(grid.size(), 1u);
	EXPECT_EQ(grid[0], (std::vector<std::string> {"A", "B", "C"}));
}

TEST(HocrTableTest, RowsAndEmptyCells) {
	SpatialTableReconstructor reconstructor {HocrTableConfig()};
	auto grid = reconstructor.BuildGrid({Word("Name", 10, 10, 80, 30), Word("Qty", 300, 10, 350, 30),
	                                     Word("Apple", 10, 50, 90, 70), Word("Pear", 10, 90, 80, 110),
	                                     Word("3", 300, 90, 320, 110)});
	ASSERT_EQ(grid.size(), 3u);
	EXPECT_EQ(grid[0], (std::vector<std::string> {"Name", "Qty"}));
	EXPECT_EQ(grid[1], (std::vector<std::string> {"Apple", ""}));
	EXPECT_EQ(grid[2], (std::vector<std::string> {"Pear", "3"}));
}

TEST(HocrTableTest, WordsInSameColumnAreJoined) {
	SpatialTableReconstructor reconstructor {HocrTableConfig()};
	auto grid = reconstructor.BuildGrid({Word("New", 10, 10, 40, 30), Word("York", 45, 10, 80, 30),
	                                     Word("NY", 300, 10, 330, 30)});
	ASSERT_EQ(grid.size(), 1u);
	EXPECT_EQ(grid[0], (std::vector<std::string> {"New York", "NY"}));
}

TEST(HocrTableTest, LowConfidenceWordsAreDropped) {
	HocrTableConfig config;
	config.min_confidence = 60;
	SpatialTableReconstructor reconstructor(config);
	auto grid = reconstructor.BuildGrid({Word("A", 10, 10, 40, 30), Word("noise", 150, 10, 190, 30, 20),
	                                     Word("B", 300, 10, 330, 30)});
	ASSERT_EQ(grid.size(), 1u);
	EXPECT_EQ(grid[0], (std::vector<std::string> {"A", "B"}));
}

TEST(HocrTableTest, SingleColumnIsNotATable) {
	SpatialTableReconstructor reconstructor {HocrTableConfig()};
	auto grid = reconstructor.BuildGrid({Word("one", 10, 10, 60, 30), Word("two", 12, 50, 60, 70)});
	EXPECT_TRUE(grid.empty());
	EXPECT_TRUE(reconstructor.BuildGrid({}).empty());
}

TEST(HocrTableTest, DetectsHocrDocuments) {
	auto meta = ParseHtml("<html><head><meta name=\"ocr-system\" content=\"tesseract\"></head><body></body></html>");
	ASSERT_TRUE(meta.success);
	EXPECT_TRUE(SpatialTableReconstructor::IsHocrDocument(meta.root));

	auto classes = ParseHtml("<div class=\"ocr_page\"><span class=\"ocr_line\">x</span></div>");
	ASSERT_TRUE(classes.success);
	EXPECT_TRUE(SpatialTableReconstructor::IsHocrDocument(classes.root));

	auto plain = ParseHtml("<p class=\"ocr\">x</p>");
	ASSERT_TRUE(plain.success);
	EXPECT_FALSE(SpatialTableReconstructor::IsHocrDocument(plain.root));
}

TEST(HocrTableTest, CollectsWordsFromSubtree) {
	auto document = ParseHtml("<div class=\"ocr_carea\"><span class=\"ocr_line\" title=\"bbox 0 0 500 30\">" +
	                          WordSpan("Hello", 10, 10, 60, 30) + " " + WordSpan("World", 200, 10, 260, 30) +
	                          "<span class=\"ocrx_word\">untitled</span></span></div>");
	ASSERT_TRUE(document.success);
	auto words = SpatialTableReconstructor::CollectWords(document.root);
	ASSERT_EQ(words.size(), 2u);
	EXPECT_EQ(words[0].text, "Hello");
	EXPECT_EQ(words[1].bbox.x0, 200);
	EXPECT_EQ(words[1].confidence, 95);
}

TEST(HocrTableTest, ConvertsHocrDocumentToPipeTable) {
	std::string html = "<html><head><title>scan</title><meta name=\"ocr-system\" content=\"tesseract\"></head><body>"
	                   "<div class=\"ocr_page\"><div class=\"ocr_carea\">"
	                   "<span class=\"ocr_line\">" +
	                   WordSpan("Item", 10, 10, 60, 30) + " " + WordSpan("Price", 300, 10, 360, 30) +
	                   "</span><span class=\"ocr_line\">" + WordSpan("Tea", 10, 50, 50, 70) + " " +
	                   WordSpan("4", 300, 50, 315, 70) + "</span></div></div></body></html>";
	auto result = ConvertHtml(html);
	ASSERT_FALSE(result.HasError()) << result.GetError();
	EXPECT_EQ(result.markdown, "| Item | Price |\n| --- | --- |\n| Tea | 4 |\n");

	ConversionOptions options;
	options.hocr_spatial_tables = false;
	result = ConvertHtml(html, options);
	ASSERT_FALSE(result.HasError());
	EXPECT_EQ(result.markdown, "Item Price\nTea 4\n");
}

TEST(HocrTableTest, CountsAlignedColumns) {
	SpatialTableReconstructor reconstructor {HocrTableConfig()};
	size_t aligned = 99;
	auto grid = reconstructor.BuildGrid({Word("Item", 10, 10, 60, 30), Word("Price", 300, 10, 360, 30),
	                                     Word("Tea", 10, 50, 50, 70), Word("4", 302, 50, 315, 70)},
	                                    &aligned);
	ASSERT_EQ(grid.size(), 2u);
	EXPECT_EQ(aligned, 2u);

	grid = reconstructor.BuildGrid({Word("The", 10, 10, 40, 30), Word("quick", 60, 10, 110, 30),
	                                Word("brown", 130, 10, 180, 30), Word("fox", 200, 10, 230, 30),
	                                Word("jumps", 10, 50, 70, 70), Word("over", 95, 50, 130, 70)},
	                               &aligned);
	ASSERT_EQ(grid.size(), 2u);
	EXPECT_EQ(aligned, 1u);
}

TEST(HocrTableTest, ProseStaysText) {
	std::string html = "<html><head><meta name=\"ocr-system\" content=\"tesseract\"></head><body>"
	                   "<div class=\"ocr_page\"><div class=\"ocr_carea\">"
	                   "<span class=\"ocr_line\">" +
	                   WordSpan("The", 10, 10, 40, 30) + " " + WordSpan("quick", 60, 10, 110, 30) + " " +
	                   WordSpan("brown", 130, 10, 180, 30) + " " + WordSpan("fox", 200, 10, 230, 30) +
	                   "</span><span class=\"ocr_line\">" + WordSpan("jumps", 10, 50, 70, 70) + " " +
	                   WordSpan("over", 95, 50, 130, 70) + "</span></div></div></body></html>";
	auto result = ConvertHtml(html);
	ASSERT_FALSE(result.HasError()) << result.GetError();
	EXPECT_EQ(result.markdown, "The quick brown fox\njumps over\n");

	auto document = ParseHtml(html);
	ASSERT_TRUE(document.success);
	EXPECT_EQ(SpatialTableReconstructor(HocrTableConfig()).Apply(document.root), 0u);
}

TEST(HocrTableTest, ExistingTablesAreLeftAlone) {
	auto document = ParseHtml("<div class=\"ocr_carea\"><table><tr><td>" + WordSpan("A", 10, 10, 30, 30) +
	                          "</td><td>" + WordSpan("B", 300, 10, 330, 30) + "</td></tr></table></div>");
	ASSERT_TRUE(document.success);
	SpatialTableReconstructor reconstructor {HocrTableConfig()};
	EXPECT_EQ(reconstructor.Apply(document.root), 0u);
}

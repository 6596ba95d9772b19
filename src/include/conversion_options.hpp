#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace html_markdown {

enum class HeadingStyle : uint8_t { ATX, ATX_CLOSED, UNDERLINED };
enum class ListIndentType : uint8_t { SPACES, TABS };
enum class CodeBlockStyle : uint8_t { INDENTED, BACKTICKS, TILDES };
enum class HighlightStyle : uint8_t { DOUBLE_EQUAL, HTML, BOLD, NONE };
enum class WhitespaceMode : uint8_t { NORMALIZED, STRICT };
enum class NewlineStyle : uint8_t { SPACES, BACKSLASH };
enum class PreprocessingPreset : uint8_t { MINIMAL, STANDARD, AGGRESSIVE };

struct PreprocessingOptions {
	bool enabled = false;
	PreprocessingPreset preset = PreprocessingPreset::STANDARD;
	bool remove_navigation = true;
	bool remove_forms = true;
};

struct ConversionOptions {
	HeadingStyle heading_style = HeadingStyle::ATX;
	ListIndentType list_indent_type = ListIndentType::SPACES;
	size_t list_indent_width = 4;
	//! Bullet characters, cycled by list nesting depth
	std::string bullets = "*+-";
	char strong_em_symbol = '*';
	bool escape_asterisks = true;
	bool escape_underscores = true;
	bool escape_misc = true;
	//! Escape every ASCII punctuation character
	bool escape_ascii = false;
	std::string code_language;
	CodeBlockStyle code_block_style = CodeBlockStyle::BACKTICKS;
	bool autolinks = true;
	bool default_title = false;
	bool br_in_tables = false;
	HighlightStyle highlight_style = HighlightStyle::DOUBLE_EQUAL;
	//! Prefix the output with a comment listing <head> metadata
	bool extract_metadata = true;
	WhitespaceMode whitespace_mode = WhitespaceMode::NORMALIZED;
	bool strip_newlines = false;
	bool wrap = false;
	size_t wrap_width = 80;
	bool convert_as_inline = false;
	std::string sub_symbol;
	std::string sup_symbol;
	NewlineStyle newline_style = NewlineStyle::SPACES;
	std::vector<std::string> keep_inline_images_in;
	std::vector<std::string> preserve_tags;
	std::vector<std::string> strip_tags;
	PreprocessingOptions preprocessing;

	bool hocr_spatial_tables = true;
	double hocr_min_confidence = 0.0;
	//! Fraction of the shorter box height two boxes must share to be one row
	double hocr_row_overlap_ratio = 0.5;
	//! Horizontal gap in pixels that starts a new column
	double hocr_min_column_gap = 50.0;

	//! URL of the document, used to classify links as internal/external
	std::string document_url;
};

//! Returns an empty string when the options are usable, otherwise the first problem found
std::string ValidateOptions(const ConversionOptions &options);

//! Applies the keys of a JSON object onto options. Returns false with a message on bad input.
bool ParseOptionsJson(const std::string &json, ConversionOptions &options, std::string &error);

bool ParseHeadingStyle(const std::string &value, HeadingStyle &result);
const char *HeadingStyleToString(HeadingStyle style);

} // namespace html_markdown

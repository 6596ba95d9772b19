#pragma once

#include "conversion_options.hpp"
#include "inline_image_extractor.hpp"
#include "metadata_collector.hpp"
#include "node_tree.hpp"
#include "visitor_dispatcher.hpp"

#include <string>
#include <vector>

namespace html_markdown {

struct ListFrame {
	bool ordered = false;
	//! Number of the next ordered item
	long counter = 1;
};

struct TableRowInfo {
	std::vector<std::string> cells;
	std::vector<std::string> alignments;
	bool is_header = false;
	//! Pipe row built from cells, before any visitor override
	std::string default_output;
	std::string output;
};

struct TableFrame {
	std::vector<TableRowInfo> rows;
	std::string caption;
	bool in_head = false;
};

// Mutable traversal state of one conversion. Everything the rules need
// besides the node itself lives here; nothing is shared between calls.
struct RenderState {
	RenderState(const ConversionOptions &options, const VisitorDispatcher &dispatcher)
	    : options(options), dispatcher(dispatcher), inline_mode(options.convert_as_inline) {
	}

	const ConversionOptions &options;
	const VisitorDispatcher &dispatcher;
	//! Optional observers, null when not requested
	MetadataCollector *collector = nullptr;
	InlineImageExtractor *images = nullptr;

	std::vector<ListFrame> lists;
	std::vector<TableFrame> tables;
	size_t blockquote_depth = 0;
	size_t depth = 0;
	bool inline_mode;
	//! Inside <pre> or inline code: text is emitted raw and seams are not normalized
	bool in_code = false;
	bool in_table_cell = false;
	bool in_heading = false;
	bool in_link = false;
	//! hOCR document: ocr_line and ocr_par classes act as block boundaries
	bool hocr_layout = false;
	//! Tag of the enclosing heading or table cell; images there collapse to alt text
	const std::string *image_context = nullptr;
};

//! Renders root and its subtree into raw Markdown, before final cleanup
RenderStatus RenderTree(const Node &root, RenderState &state, std::string &output);

//! Trims the rendered document, applies wrapping and terminates it with a single newline
std::string FinalizeMarkdown(const std::string &raw, const ConversionOptions &options);

} // namespace html_markdown

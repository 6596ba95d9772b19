#pragma once

#include "node_tree.hpp"

#include <string>

namespace html_markdown {

struct ParsedDocument {
	//! The <html> element, including parser-implied <head>/<body>
	Node root;
	bool success = false;
};

// Parse raw HTML into a Node tree using libxml2's recovering HTML parser.
// Comments, processing instructions and the doctype are dropped; tag and
// attribute names arrive lower-cased, character references resolved.
ParsedDocument ParseHtml(const std::string &html);

} // namespace html_markdown

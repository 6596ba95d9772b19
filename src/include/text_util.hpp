#pragma once

#include "conversion_options.hpp"

#include <string>

namespace html_markdown {

//! Boundary whitespace split off a piece of inline content
struct ChompedText {
	std::string prefix;
	std::string suffix;
	std::string text;
};

class TextUtil {
public:
	//! Escapes Markdown-significant characters in literal text according to the escape flags
	static std::string Escape(const std::string &text, const ConversionOptions &options);
	//! Collapses runs of ASCII and Unicode whitespace into a single space
	static std::string NormalizeWhitespace(const std::string &text);
	//! Moves leading/trailing whitespace out of the text as single spaces
	static ChompedText Chomp(const std::string &text);

	static std::string Trim(const std::string &text);
	static std::string TrimNewlines(const std::string &text);
	static std::string TrimTrailingWhitespace(const std::string &text);
	static std::string ToLower(const std::string &text);

	//! Prefixes every non-empty line after the first (or every line) with prefix
	static std::string Indent(const std::string &text, const std::string &prefix, bool skip_first_line);
	//! Prefixes every line, including empty ones, with prefix
	static std::string PrefixLines(const std::string &text, const std::string &prefix);
	//! Title followed by a rule line of the same display width
	static std::string Underline(const std::string &text, char rule_char);
	//! Greedy word wrap of each line at width columns
	static std::string Wrap(const std::string &text, size_t width);
	//! Shortest fence of fence_char that does not occur inside content (minimum length min_length)
	static std::string FenceFor(const std::string &content, char fence_char, size_t min_length);

	//! Joins two rendered chunks, collapsing the newlines at the seam to at most one blank line
	static std::string JoinChunks(const std::string &left, const std::string &right);
	static void AppendChunk(std::string &output, const std::string &chunk);

	//! Number of UTF-8 code points in text
	static size_t DisplayWidth(const std::string &text);
};

} // namespace html_markdown

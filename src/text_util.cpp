#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

namespace html_markdown {

static bool IsInlineSpace(char c) {
	return c == ' ' || c == '\t';
}

static bool IsAsciiWhitespace(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string TextUtil::Escape(const std::string &text, const ConversionOptions &options) {
	static const char *MISC_CHARS = "\\&<`[>~#=+|-";
	std::string result;
	result.reserve(text.size() + text.size() / 8);
	for (size_t i = 0; i < text.size(); i++) {
		char c = text[i];
		bool escape = false;
		if (options.escape_ascii && std::ispunct(static_cast<unsigned char>(c))) {
			escape = true;
		} else if (options.escape_misc && std::strchr(MISC_CHARS, c) != nullptr && c != '\0') {
			escape = true;
		} else if (options.escape_misc && (c == '.' || c == ')') && i > 0 &&
		           std::isdigit(static_cast<unsigned char>(text[i - 1]))) {
			// "1." at a line start would otherwise become an ordered list
			escape = true;
		} else if (options.escape_asterisks && c == '*') {
			escape = true;
		} else if (options.escape_underscores && c == '_') {
			escape = true;
		}
		if (escape) {
			result += '\\';
		}
		result += c;
	}
	return result;
}

// Length of the Unicode space sequence starting at pos, 0 if none
static size_t UnicodeSpaceLength(const std::string &text, size_t pos) {
	auto byte = [&](size_t offset) -> unsigned char {
		return pos + offset < text.size() ? static_cast<unsigned char>(text[pos + offset]) : 0;
	};
	unsigned char b0 = byte(0);
	if (b0 == 0xC2 && byte(1) == 0xA0) {
		// U+00A0
		return 2;
	}
	if (b0 == 0xE1 && byte(1) == 0x9A && byte(2) == 0x80) {
		// U+1680
		return 3;
	}
	if (b0 == 0xE2 && byte(1) == 0x80 && ((byte(2) >= 0x80 && byte(2) <= 0x8A) || byte(2) == 0xAF)) {
		// U+2000..U+200A, U+202F
		return 3;
	}
	if (b0 == 0xE2 && byte(1) == 0x81 && byte(2) == 0x9F) {
		// U+205F
		return 3;
	}
	if (b0 == 0xE3 && byte(1) == 0x80 && byte(2) == 0x80) {
		// U+3000
		return 3;
	}
	return 0;
}

std::string TextUtil::NormalizeWhitespace(const std::string &text) {
	std::string result;
	result.reserve(text.size());
	bool prev_was_space = false;
	size_t i = 0;
	while (i < text.size()) {
		size_t space_len = IsAsciiWhitespace(text[i]) ? 1 : UnicodeSpaceLength(text, i);
		if (space_len > 0) {
			if (!prev_was_space) {
				result += ' ';
				prev_was_space = true;
			}
			i += space_len;
			continue;
		}
		result += text[i];
		prev_was_space = false;
		i++;
	}
	return result;
}

ChompedText TextUtil::Chomp(const std::string &text) {
	ChompedText result;
	if (text.empty()) {
		return result;
	}
	size_t start = 0;
	size_t end = text.size();
	while (start < end && IsAsciiWhitespace(text[start])) {
		start++;
	}
	while (end > start && IsAsciiWhitespace(text[end - 1])) {
		end--;
	}
	if (start > 0) {
		result.prefix = " ";
	}
	if (end < text.size()) {
		result.suffix = " ";
	}
	result.text = text.substr(start, end - start);
	return result;
}

std::string TextUtil::Trim(const std::string &text) {
	size_t start = 0;
	size_t end = text.size();
	while (start < end && IsAsciiWhitespace(text[start])) {
		start++;
	}
	while (end > start && IsAsciiWhitespace(text[end - 1])) {
		end--;
	}
	return text.substr(start, end - start);
}

std::string TextUtil::TrimNewlines(const std::string &text) {
	size_t start = text.find_first_not_of('\n');
	if (start == std::string::npos) {
		return "";
	}
	size_t end = text.find_last_not_of('\n');
	return text.substr(start, end - start + 1);
}

std::string TextUtil::TrimTrailingWhitespace(const std::string &text) {
	size_t end = text.size();
	while (end > 0 && IsAsciiWhitespace(text[end - 1])) {
		end--;
	}
	return text.substr(0, end);
}

std::string TextUtil::ToLower(const std::string &text) {
	std::string result = text;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

std::string TextUtil::Indent(const std::string &text, const std::string &prefix, bool skip_first_line) {
	std::string result;
	result.reserve(text.size() + prefix.size() * 4);
	bool line_start = true;
	bool first_line = true;
	for (size_t i = 0; i < text.size(); i++) {
		char c = text[i];
		if (line_start) {
			bool empty_line = c == '\n';
			if (!empty_line && !(first_line && skip_first_line)) {
				result += prefix;
			}
			line_start = false;
		}
		result += c;
		if (c == '\n') {
			line_start = true;
			first_line = false;
		}
	}
	return result;
}

std::string TextUtil::PrefixLines(const std::string &text, const std::string &prefix) {
	std::string bare_prefix = prefix;
	while (!bare_prefix.empty() && bare_prefix.back() == ' ') {
		bare_prefix.pop_back();
	}
	std::string result;
	size_t start = 0;
	while (start <= text.size()) {
		size_t end = text.find('\n', start);
		if (end == std::string::npos) {
			end = text.size();
		}
		if (end == start) {
			result += bare_prefix;
		} else {
			result += prefix;
			result.append(text, start, end - start);
		}
		if (end == text.size()) {
			break;
		}
		result += '\n';
		start = end + 1;
	}
	return result;
}

size_t TextUtil::DisplayWidth(const std::string &text) {
	size_t width = 0;
	for (char c : text) {
		// Count lead bytes only
		if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
			width++;
		}
	}
	return width;
}

std::string TextUtil::Underline(const std::string &text, char rule_char) {
	size_t width = std::max<size_t>(DisplayWidth(text), 3);
	return text + "\n" + std::string(width, rule_char);
}

static void WrapLine(const std::string &line, size_t width, std::string &out) {
	std::vector<std::string> words;
	size_t pos = 0;
	while (pos < line.size()) {
		while (pos < line.size() && line[pos] == ' ') {
			pos++;
		}
		size_t end = line.find(' ', pos);
		if (end == std::string::npos) {
			end = line.size();
		}
		if (end > pos) {
			words.push_back(line.substr(pos, end - pos));
		}
		pos = end;
	}
	size_t current = 0;
	for (size_t i = 0; i < words.size(); i++) {
		size_t word_width = TextUtil::DisplayWidth(words[i]);
		if (i > 0) {
			if (current + 1 + word_width > width) {
				out += '\n';
				current = 0;
			} else {
				out += ' ';
				current++;
			}
		}
		out += words[i];
		current += word_width;
	}
}

std::string TextUtil::Wrap(const std::string &text, size_t width) {
	if (width == 0) {
		return text;
	}
	std::string result;
	size_t start = 0;
	while (start <= text.size()) {
		size_t end = text.find('\n', start);
		if (end == std::string::npos) {
			end = text.size();
		}
		std::string line = text.substr(start, end - start);
		// Hard breaks keep their trailing marker
		bool hard_break = line.size() >= 2 && line.compare(line.size() - 2, 2, "  ") == 0;
		if (DisplayWidth(line) > width && !hard_break) {
			WrapLine(line, width, result);
		} else {
			result += line;
		}
		if (end == text.size()) {
			break;
		}
		result += '\n';
		start = end + 1;
	}
	return result;
}

std::string TextUtil::FenceFor(const std::string &content, char fence_char, size_t min_length) {
	size_t longest = 0;
	size_t run = 0;
	for (char c : content) {
		if (c == fence_char) {
			run++;
			longest = std::max(longest, run);
		} else {
			run = 0;
		}
	}
	return std::string(std::max(min_length, longest + 1), fence_char);
}

//===--------------------------------------------------------------------===//
// Chunk joining
//===--------------------------------------------------------------------===//

void TextUtil::AppendChunk(std::string &output, const std::string &chunk) {
	if (chunk.empty()) {
		return;
	}
	if (output.empty()) {
		output = chunk;
		return;
	}
	size_t trailing = 0;
	while (trailing < output.size() && output[output.size() - 1 - trailing] == '\n') {
		trailing++;
	}
	size_t leading = 0;
	while (leading < chunk.size() && chunk[leading] == '\n') {
		leading++;
	}

	if (trailing == 0 && leading == 0) {
		// Inline seam: a single run of whitespace survives, taken from the right side
		if (IsInlineSpace(chunk[0])) {
			while (!output.empty() && IsInlineSpace(output.back())) {
				output.pop_back();
			}
		}
		output += chunk;
		return;
	}

	output.resize(output.size() - trailing);
	size_t chunk_start = leading;
	if (trailing == 0) {
		// Whitespace right before a block boundary is dropped
		while (!output.empty() && IsInlineSpace(output.back())) {
			output.pop_back();
		}
	} else if (leading == 0) {
		while (chunk_start < chunk.size() && IsInlineSpace(chunk[chunk_start])) {
			chunk_start++;
		}
	}
	if (output.empty()) {
		output.append(chunk, chunk_start, std::string::npos);
		return;
	}
	size_t separator = std::min<size_t>(std::max(trailing, leading), 2);
	output.append(separator, '\n');
	output.append(chunk, chunk_start, std::string::npos);
}

std::string TextUtil::JoinChunks(const std::string &left, const std::string &right) {
	std::string result = left;
	AppendChunk(result, right);
	return result;
}

} // namespace html_markdown

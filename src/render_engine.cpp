#include "render_engine.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <cstdlib>
#include <unordered_set>

namespace html_markdown {

static RenderStatus RenderNode(const Node &node, const Node *parent, size_t index, RenderState &state,
                               std::string &output);

//===--------------------------------------------------------------------===//
// Helpers
//===--------------------------------------------------------------------===//

static bool ContainsTag(const std::vector<std::string> &tags, const std::string &tag_name) {
	return std::find(tags.begin(), tags.end(), tag_name) != tags.end();
}

// Runs a per-type callback over the default output
template <class FUNC>
static RenderStatus Intercept(const RenderState &state, const Node &node, std::string &output, FUNC callback) {
	if (!state.dispatcher.HasVisitor()) {
		return RenderStatus::Ok();
	}
	return state.dispatcher.Resolve(callback(state.dispatcher.GetVisitor()), node, output);
}

static void ObserveChildren(const Node &node, RenderState &state) {
	for (const auto &child : node.children) {
		if (state.collector) {
			state.collector->ObserveSubtree(child, state.depth + 1);
		}
		if (state.images) {
			state.images->ObserveSubtree(child);
		}
	}
}

// Container start hooks: anything but Continue takes over the container without descent
template <class FUNC>
static bool InterceptStart(RenderState &state, const Node &node, std::string &output, RenderStatus &status,
                           FUNC callback) {
	if (!state.dispatcher.HasVisitor()) {
		return false;
	}
	auto result = callback(state.dispatcher.GetVisitor());
	if (result.GetAction() == VisitAction::CONTINUE) {
		return false;
	}
	status = state.dispatcher.Resolve(result, node, output);
	if (status.IsOk()) {
		ObserveChildren(node, state);
	}
	return true;
}

static RenderStatus RenderChildren(const Node &node, RenderState &state, std::string &output) {
	state.depth++;
	for (size_t i = 0; i < node.children.size(); i++) {
		std::string chunk;
		auto status = RenderNode(node.children[i], &node, i, state, chunk);
		if (status.IsAborted()) {
			state.depth--;
			return status;
		}
		if (state.in_code) {
			output += chunk;
		} else {
			TextUtil::AppendChunk(output, chunk);
		}
	}
	state.depth--;
	return RenderStatus::Ok();
}

// Leading inline spaces, then leading newlines; indentation after a newline is content
static std::string TrimBlock(const std::string &content) {
	size_t start = 0;
	while (start < content.size() && (content[start] == ' ' || content[start] == '\t')) {
		start++;
	}
	while (start < content.size() && content[start] == '\n') {
		start++;
	}
	return TextUtil::TrimTrailingWhitespace(content.substr(start));
}

static std::string CollapseNewlines(const std::string &text, const std::string &replacement) {
	std::string result;
	result.reserve(text.size());
	bool in_break = false;
	for (char c : text) {
		if (c == '\n') {
			if (!in_break) {
				while (!result.empty() && result.back() == ' ') {
					result.pop_back();
				}
				result += replacement;
				in_break = true;
			}
			continue;
		}
		if (in_break && c == ' ') {
			continue;
		}
		in_break = false;
		result += c;
	}
	return result;
}

static std::string Surround(const ChompedText &chomped, const std::string &open, const std::string &close) {
	if (chomped.text.empty()) {
		return chomped.prefix.empty() ? chomped.suffix : chomped.prefix;
	}
	return chomped.prefix + open + chomped.text + close + chomped.suffix;
}

//! "<sub>" closes as "</sub>", any other symbol closes as itself
static std::string ClosingSymbol(const std::string &symbol) {
	if (symbol.size() > 2 && symbol[0] == '<' && symbol[1] != '/') {
		return "</" + symbol.substr(1);
	}
	return symbol;
}

static std::string CodeLanguage(const Node &node) {
	for (const auto *candidate : {&node, node.children.size() == 1 ? &node.children[0] : nullptr}) {
		if (!candidate || candidate->IsText()) {
			continue;
		}
		const auto &classes = candidate->GetAttribute("class");
		size_t pos = 0;
		while (pos < classes.size()) {
			size_t end = classes.find(' ', pos);
			if (end == std::string::npos) {
				end = classes.size();
			}
			auto token = classes.substr(pos, end - pos);
			if (token.compare(0, 9, "language-") == 0 && token.size() > 9) {
				return token.substr(9);
			}
			if (token.compare(0, 5, "lang-") == 0 && token.size() > 5) {
				return token.substr(5);
			}
			pos = end + 1;
		}
	}
	return std::string();
}

static std::string InlineCodeSpan(const std::string &code) {
	size_t longest = 0;
	size_t run = 0;
	for (char c : code) {
		run = c == '`' ? run + 1 : 0;
		longest = std::max(longest, run);
	}
	std::string fence(longest + 1, '`');
	bool pad = code.front() == '`' || code.back() == '`';
	return fence + (pad ? " " : "") + code + (pad ? " " : "") + fence;
}

static std::string LinkDestination(const std::string &href) {
	if (href.find(' ') != std::string::npos || href.find(')') != std::string::npos) {
		return "<" + href + ">";
	}
	return href;
}

static std::string LinkTitle(const std::string &title) {
	if (title.empty()) {
		return std::string();
	}
	std::string escaped;
	for (char c : title) {
		if (c == '"') {
			escaped += '\\';
		}
		escaped += c;
	}
	return " \"" + escaped + "\"";
}

static std::string EscapePipes(const std::string &text) {
	std::string result;
	for (size_t i = 0; i < text.size(); i++) {
		if (text[i] == '|' && (i == 0 || text[i - 1] != '\\')) {
			result += '\\';
		}
		result += text[i];
	}
	return result;
}

//===--------------------------------------------------------------------===//
// Block layout
//===--------------------------------------------------------------------===//

static bool IsBlockGenericTag(const std::string &tag_name) {
	static const std::unordered_set<std::string> BLOCK_TAGS = {
	    "address", "center", "dialog", "hgroup", "search", "noscript", "caption", "listing", "xmp", "plaintext",
	    "frameset", "noframes"};
	return BLOCK_TAGS.count(tag_name) > 0;
}

// Newlines placed around a rendered node: 2 for blocks, 1 for line items, 0 inline
static size_t BlockSeparation(const Node &node, const Node *parent) {
	switch (node.type) {
	case NodeType::HEADING:
	case NodeType::PARAGRAPH:
	case NodeType::DIV:
	case NodeType::BLOCKQUOTE:
	case NodeType::PRE:
	case NodeType::HR:
	case NodeType::TABLE:
	case NodeType::DEFINITION_LIST:
	case NodeType::ARTICLE:
	case NodeType::SECTION:
	case NodeType::NAV:
	case NodeType::ASIDE:
	case NodeType::HEADER:
	case NodeType::FOOTER:
	case NodeType::MAIN:
	case NodeType::FIGURE:
	case NodeType::FIGCAPTION:
	case NodeType::DETAILS:
	case NodeType::SUMMARY:
	case NodeType::FORM:
	case NodeType::FIELDSET:
	case NodeType::LEGEND:
	case NodeType::SELECT:
	case NodeType::TEXTAREA:
	case NodeType::AUDIO:
	case NodeType::VIDEO:
	case NodeType::IFRAME:
		return 2;
	case NodeType::LIST:
		if (parent && (parent->type == NodeType::LIST_ITEM || parent->type == NodeType::LIST)) {
			return 1;
		}
		return 2;
	case NodeType::LIST_ITEM:
	case NodeType::DEFINITION_TERM:
	case NodeType::DEFINITION_DESCRIPTION:
	case NodeType::OPTION:
		return 1;
	case NodeType::ELEMENT:
		return IsBlockGenericTag(node.tag_name) ? 2 : 0;
	default:
		return 0;
	}
}

// hOCR text kept as text: one line per ocr_line, a paragraph per ocr_par or content area
static size_t HocrSeparation(const Node &node) {
	if (node.HasClass("ocr_line")) {
		return 1;
	}
	if (node.HasClass("ocr_par") || node.HasClass("ocr_carea")) {
		return 2;
	}
	return 0;
}

static void ApplyBlockSeparation(const Node &node, const Node *parent, const RenderState &state,
                                 std::string &output) {
	if (output.empty() || state.in_code) {
		return;
	}
	size_t lines = BlockSeparation(node, parent);
	if (state.hocr_layout) {
		lines = std::max(lines, HocrSeparation(node));
	}
	if (lines == 0) {
		return;
	}
	std::string content =
	    node.type == NodeType::PRE ? TextUtil::TrimNewlines(TextUtil::TrimTrailingWhitespace(output)) : TrimBlock(output);
	if (content.empty()) {
		output.clear();
		return;
	}
	if (state.inline_mode) {
		output = " " + content + " ";
		return;
	}
	std::string separator(lines, '\n');
	output = separator + content + separator;
}

//===--------------------------------------------------------------------===//
// Text and inline formatting
//===--------------------------------------------------------------------===//

static RenderStatus RenderText(const Node &node, const NodeContext &ctx, RenderState &state, std::string &output) {
	if (state.in_code) {
		output = node.text;
	} else {
		const auto &options = state.options;
		output = TextUtil::Escape(options.whitespace_mode == WhitespaceMode::NORMALIZED
		                              ? TextUtil::NormalizeWhitespace(node.text)
		                              : node.text,
		                          options);
	}
	return Intercept(state, node, output, [&](HtmlVisitor &visitor) { return visitor.VisitText(ctx, output); });
}

static RenderStatus RenderInlineFormat(const Node &node, const NodeContext &ctx, RenderState &state,
                                       std::string &output) {
	std::string content;
	auto status = RenderChildren(node, state, content);
	if (!status.IsOk()) {
		return status;
	}
	const auto &options = state.options;
	auto chomped = TextUtil::Chomp(content);
	const auto &text = chomped.text;
	switch (node.type) {
	case NodeType::STRONG: {
		std::string marker(2, options.strong_em_symbol);
		output = Surround(chomped, marker, marker);
		return Intercept(state, node, output, [&](HtmlVisitor &visitor) { return visitor.VisitStrong(ctx, text); });
	}
	case NodeType::EM: {
		std::string marker(1, options.strong_em_symbol);
		output = Surround(chomped, marker, marker);
		return Intercept(state, node, output,
		                 [&](HtmlVisitor &visitor) { return visitor.VisitEmphasis(ctx, text); });
	}
	case NodeType::STRIKETHROUGH:
	case NodeType::DEL:
		output = Surround(chomped, "~~", "~~");
		return Intercept(state, node, output,
		                 [&](HtmlVisitor &visitor) { return visitor.VisitStrikethrough(ctx, text); });
	case NodeType::UNDERLINE:
		output = content;
		return Intercept(state, node, output,
		                 [&](HtmlVisitor &visitor) { return visitor.VisitUnderline(ctx, text); });
	case NodeType::SUBSCRIPT:
		output = Surround(chomped, options.sub_symbol, ClosingSymbol(options.sub_symbol));
		return Intercept(state, node, output,
		                 [&](HtmlVisitor &visitor) { return visitor.VisitSubscript(ctx, text); });
	case NodeType::SUPERSCRIPT:
		output = Surround(chomped, options.sup_symbol, ClosingSymbol(options.sup_symbol));
		return Intercept(state, node, output,
		                 [&](HtmlVisitor &visitor) { return visitor.VisitSuperscript(ctx, text); });
	case NodeType::MARK:
		switch (options.highlight_style) {
		case HighlightStyle::DOUBLE_EQUAL:
			output = Surround(chomped, "==", "==");
			break;
		case HighlightStyle::HTML:
			output = Surround(chomped, "<mark>", "</mark>");
			break;
		case HighlightStyle::BOLD:
			output = Surround(chomped, "**", "**");
			break;
		case HighlightStyle::NONE:
			output = content;
			break;
		}
		return Intercept(state, node, output, [&](HtmlVisitor &visitor) { return visitor.VisitMark(ctx, text); });
	default:
		// ins
		output = content;
		return RenderStatus::Ok();
	}
}

static RenderStatus RenderInlineCode(const Node &node, const NodeContext &ctx, RenderState &state,
                                     std::string &output) {
	std::string raw;
	bool was_code = state.in_code;
	state.in_code = true;
	auto status = RenderChildren(node, state, raw);
	state.in_code = was_code;
	if (!status.IsOk() || was_code) {
		// Nested inside a code block: only the text counts
		output = raw;
		return status;
	}
	auto chomped = TextUtil::Chomp(TextUtil::NormalizeWhitespace(raw));
	if (chomped.text.empty()) {
		output = chomped.prefix;
		return RenderStatus::Ok();
	}
	const auto &code = chomped.text;
	output = chomped.prefix + InlineCodeSpan(code) + chomped.suffix;
	return Intercept(state, node, output, [&](HtmlVisitor &visitor) { return visitor.VisitCodeInline(ctx, code); });
}

static RenderStatus RenderLink(const Node &node, const NodeContext &ctx, RenderState &state, std::string &output) {
	std::string content;
	bool was_link = state.in_link;
	state.in_link = true;
	auto status = RenderChildren(node, state, content);
	state.in_link = was_link;
	if (!status.IsOk()) {
		return status;
	}
	if (!node.HasAttribute("href") || was_link) {
		output = content;
		return RenderStatus::Ok();
	}

	const auto &options = state.options;
	const auto &href = node.GetAttribute("href");
	std::string title = node.GetAttribute("title");
	if (title.empty() && options.default_title) {
		title = href;
	}
	auto chomped = TextUtil::Chomp(content);
	const auto &text = chomped.text;
	if (text.empty()) {
		output = href.empty() ? chomped.prefix : chomped.prefix + "<" + href + ">" + chomped.suffix;
	} else {
		std::string plain = TextUtil::Trim(TextUtil::NormalizeWhitespace(node.TextContent()));
		bool autolink = options.autolinks && !href.empty() && title.empty() &&
		                (plain == href || "mailto:" + plain == href);
		if (autolink) {
			output = chomped.prefix + "<" + href + ">" + chomped.suffix;
		} else {
			output = chomped.prefix + "[" + text + "](" + LinkDestination(href) + LinkTitle(title) + ")" +
			         chomped.suffix;
		}
	}
	return Intercept(state, node, output,
	                 [&](HtmlVisitor &visitor) { return visitor.VisitLink(ctx, href, text, title); });
}

static RenderStatus RenderImage(const Node &node, const NodeContext &ctx, RenderState &state, std::string &output) {
	const auto &src = node.GetAttribute("src");
	const auto &alt = node.GetAttribute("alt");
	const auto &title = node.GetAttribute("title");
	bool alt_only = state.image_context && !ContainsTag(state.options.keep_inline_images_in, *state.image_context);
	if (state.inline_mode && !state.image_context) {
		alt_only = !ContainsTag(state.options.keep_inline_images_in, "img");
	}
	if (alt_only) {
		output = alt;
	} else if (!src.empty() || !alt.empty()) {
		output = "![" + alt + "](" + LinkDestination(src) + LinkTitle(title) + ")";
	}
	return Intercept(state, node, output,
	                 [&](HtmlVisitor &visitor) { return visitor.VisitImage(ctx, src, alt, title); });
}

static RenderStatus RenderLineBreak(const Node &node, const NodeContext &ctx, RenderState &state,
                                    std::string &output) {
	if (state.in_code) {
		output = "\n";
		return RenderStatus::Ok();
	}
	if (state.in_table_cell) {
		output = state.options.br_in_tables ? "<br>" : " ";
	} else if (state.inline_mode || state.in_heading) {
		output = " ";
	} else {
		output = state.options.newline_style == NewlineStyle::BACKSLASH ? "\\\n" : "  \n";
	}
	return Intercept(state, node, output, [&](HtmlVisitor &visitor) { return visitor.VisitLineBreak(ctx); });
}

//===--------------------------------------------------------------------===//
// Blocks
//===--------------------------------------------------------------------===//

static RenderStatus RenderHeading(const Node &node, const NodeContext &ctx, RenderState &state,
                                  std::string &output) {
	uint32_t level = static_cast<uint32_t>(node.tag_name.size() == 2 ? node.tag_name[1] - '0' : 1);
	std::string content;
	bool was_heading = state.in_heading;
	auto previous_context = state.image_context;
	state.in_heading = true;
	state.image_context = &node.tag_name;
	auto status = RenderChildren(node, state, content);
	state.in_heading = was_heading;
	state.image_context = previous_context;
	if (!status.IsOk()) {
		return status;
	}
	std::string text = TextUtil::Trim(CollapseNewlines(content, " "));
	if (text.empty()) {
		return RenderStatus::Ok();
	}
	if (state.in_table_cell || state.inline_mode) {
		output = text;
	} else {
		switch (state.options.heading_style) {
		case HeadingStyle::UNDERLINED:
			if (level <= 2) {
				output = TextUtil::Underline(text, level == 1 ? '=' : '-');
				break;
			}
			output = std::string(level, '#') + " " + text;
			break;
		case HeadingStyle::ATX_CLOSED:
			output = std::string(level, '#') + " " + text + " " + std::string(level, '#');
			break;
		case HeadingStyle::ATX:
			output = std::string(level, '#') + " " + text;
			break;
		}
	}
	const auto &id = node.GetAttribute("id");
	return Intercept(state, node, output,
	                 [&](HtmlVisitor &visitor) { return visitor.VisitHeading(ctx, level, text, id); });
}

static RenderStatus RenderBlockquote(const Node &node, const NodeContext &ctx, RenderState &state,
                                     std::string &output) {
	std::string content;
	state.blockquote_depth++;
	auto status = RenderChildren(node, state, content);
	size_t depth = state.blockquote_depth;
	state.blockquote_depth--;
	if (!status.IsOk()) {
		return status;
	}
	content = TrimBlock(content);
	if (content.empty()) {
		return RenderStatus::Ok();
	}
	output = state.inline_mode ? content : TextUtil::PrefixLines(content, "> ");
	return Intercept(state, node, output,
	                 [&](HtmlVisitor &visitor) { return visitor.VisitBlockquote(ctx, content, depth); });
}

static RenderStatus RenderCodeBlock(const Node &node, const NodeContext &ctx, RenderState &state,
                                    std::string &output) {
	std::string code;
	bool was_code = state.in_code;
	state.in_code = true;
	auto status = RenderChildren(node, state, code);
	state.in_code = was_code;
	if (!status.IsOk()) {
		return status;
	}
	if (!code.empty() && code[0] == '\n') {
		code.erase(0, 1);
	}
	while (!code.empty() && (code.back() == '\n' || code.back() == ' ')) {
		code.pop_back();
	}
	if (code.empty()) {
		return RenderStatus::Ok();
	}
	const auto &options = state.options;
	std::string language = CodeLanguage(node);
	if (language.empty()) {
		language = options.code_language;
	}
	if (state.inline_mode || state.in_table_cell) {
		output = InlineCodeSpan(TextUtil::NormalizeWhitespace(code));
	} else {
		switch (options.code_block_style) {
		case CodeBlockStyle::INDENTED:
			output = TextUtil::Indent(code, "    ", false);
			break;
		case CodeBlockStyle::BACKTICKS:
		case CodeBlockStyle::TILDES: {
			char fence_char = options.code_block_style == CodeBlockStyle::TILDES ? '~' : '`';
			auto fence = TextUtil::FenceFor(code, fence_char, 3);
			output = fence + language + "\n" + code + "\n" + fence;
			break;
		}
		}
	}
	return Intercept(state, node, output,
	                 [&](HtmlVisitor &visitor) { return visitor.VisitCodeBlock(ctx, language, code); });
}

//===--------------------------------------------------------------------===//
// Lists
//===--------------------------------------------------------------------===//

static RenderStatus RenderList(const Node &node, const NodeContext &ctx, RenderState &state, std::string &output) {
	bool ordered = node.tag_name == "ol";
	RenderStatus status = RenderStatus::Ok();
	if (InterceptStart(state, node, output, status,
	                   [&](HtmlVisitor &visitor) { return visitor.VisitListStart(ctx, ordered); })) {
		return status;
	}
	ListFrame frame;
	frame.ordered = ordered;
	if (ordered && node.HasAttribute("start")) {
		const auto &start = node.GetAttribute("start");
		char *end = nullptr;
		long value = std::strtol(start.c_str(), &end, 10);
		if (end != start.c_str()) {
			frame.counter = value;
		}
	}
	state.lists.push_back(frame);
	status = RenderChildren(node, state, output);
	state.lists.pop_back();
	if (!status.IsOk()) {
		return status;
	}
	output = TrimBlock(output);
	return Intercept(state, node, output,
	                 [&](HtmlVisitor &visitor) { return visitor.VisitListEnd(ctx, ordered, output); });
}

static RenderStatus RenderListItem(const Node &node, const NodeContext &ctx, RenderState &state,
                                   std::string &output) {
	const auto &options = state.options;
	bool ordered = false;
	std::string marker;
	if (state.lists.empty()) {
		marker = std::string(1, options.bullets[0]);
	} else {
		auto &frame = state.lists.back();
		ordered = frame.ordered;
		if (ordered) {
			marker = std::to_string(frame.counter++) + ".";
		} else {
			marker = std::string(1, options.bullets[(state.lists.size() - 1) % options.bullets.size()]);
		}
	}

	std::string content;
	auto status = RenderChildren(node, state, content);
	if (!status.IsOk()) {
		return status;
	}
	content = TrimBlock(content);
	if (state.inline_mode) {
		output = content;
	} else {
		std::string indent = options.list_indent_type == ListIndentType::TABS
		                         ? std::string("\t")
		                         : std::string(options.list_indent_width, ' ');
		output = content.empty() ? marker : marker + " " + TextUtil::Indent(content, indent, true);
	}
	return Intercept(state, node, output,
	                 [&](HtmlVisitor &visitor) { return visitor.VisitListItem(ctx, ordered, marker, content); });
}

static RenderStatus RenderDefinition(const Node &node, const NodeContext &ctx, RenderState &state,
                                     std::string &output) {
	RenderStatus status = RenderStatus::Ok();
	if (node.type == NodeType::DEFINITION_LIST) {
		if (InterceptStart(state, node, output, status,
		                   [&](HtmlVisitor &visitor) { return visitor.VisitDefinitionListStart(ctx); })) {
			return status;
		}
		status = RenderChildren(node, state, output);
		if (!status.IsOk()) {
			return status;
		}
		return Intercept(state, node, output,
		                 [&](HtmlVisitor &visitor) { return visitor.VisitDefinitionListEnd(ctx, output); });
	}

	std::string content;
	status = RenderChildren(node, state, content);
	if (!status.IsOk()) {
		return status;
	}
	content = TrimBlock(content);
	if (content.empty()) {
		return RenderStatus::Ok();
	}
	if (node.type == NodeType::DEFINITION_TERM) {
		output = content;
		return Intercept(state, node, output,
		                 [&](HtmlVisitor &visitor) { return visitor.VisitDefinitionTerm(ctx, content); });
	}
	output = state.inline_mode ? content : ":   " + TextUtil::Indent(content, "    ", true);
	return Intercept(state, node, output,
	                 [&](HtmlVisitor &visitor) { return visitor.VisitDefinitionDescription(ctx, content); });
}

//===--------------------------------------------------------------------===//
// Tables
//===--------------------------------------------------------------------===//

static std::string FormatRow(std::vector<std::string> cells, size_t columns) {
	cells.resize(std::max(columns, cells.size()));
	std::string row = "|";
	for (const auto &cell : cells) {
		row += " " + cell + " |";
	}
	return row;
}

static std::string SeparatorCell(const std::string &alignment) {
	if (alignment == "center") {
		return ":---:";
	}
	if (alignment == "left") {
		return ":---";
	}
	if (alignment == "right") {
		return "---:";
	}
	return "---";
}

static std::string FormatTable(const TableFrame &frame) {
	if (frame.rows.empty()) {
		return frame.caption.empty() ? std::string() : "*" + frame.caption + "*";
	}
	size_t columns = 1;
	for (const auto &row : frame.rows) {
		columns = std::max(columns, row.cells.size());
	}
	std::string table;
	for (size_t i = 0; i < frame.rows.size(); i++) {
		const auto &row = frame.rows[i];
		if (i > 0) {
			table += '\n';
		}
		if (row.output == row.default_output && !row.cells.empty()) {
			table += FormatRow(row.cells, columns);
		} else {
			table += row.output;
		}
		if (i == 0) {
			table += "\n|";
			for (size_t column = 0; column < columns; column++) {
				table += " " + SeparatorCell(column < row.alignments.size() ? row.alignments[column] : "") + " |";
			}
		}
	}
	if (!frame.caption.empty()) {
		table = "*" + frame.caption + "*\n\n" + table;
	}
	return table;
}

// Walks table, thead, tbody and tfoot children, collecting rendered rows into the current frame
static RenderStatus CollectTableRows(const Node &container, RenderState &state) {
	state.depth++;
	for (size_t i = 0; i < container.children.size(); i++) {
		const auto &child = container.children[i];
		auto &rows = state.tables.back().rows;
		size_t before = rows.size();
		std::string chunk;
		RenderStatus status = RenderStatus::Ok();
		switch (child.type) {
		case NodeType::TABLE_ROW:
			status = RenderNode(child, &container, i, state, chunk);
			break;
		case NodeType::TABLE_HEAD:
		case NodeType::TABLE_BODY:
		case NodeType::TABLE_FOOT: {
			bool was_head = state.tables.back().in_head;
			state.tables.back().in_head = child.type == NodeType::TABLE_HEAD;
			status = RenderNode(child, &container, i, state, chunk);
			state.tables.back().in_head = was_head;
			chunk.clear();
			break;
		}
		default:
			if (child.tag_name == "caption") {
				status = RenderNode(child, &container, i, state, chunk);
				if (status.IsOk()) {
					state.tables.back().caption = TextUtil::Trim(CollapseNewlines(chunk, " "));
				}
				chunk.clear();
			}
			break;
		}
		if (status.IsAborted()) {
			state.depth--;
			return status;
		}
		auto &frame_rows = state.tables.back().rows;
		if (status.IsSkipped()) {
			frame_rows.resize(before);
		} else if (frame_rows.size() > before) {
			frame_rows.back().output = chunk;
		} else if (!chunk.empty()) {
			// Row replaced by the start hook
			TableRowInfo replaced;
			replaced.output = chunk;
			frame_rows.push_back(std::move(replaced));
		}
	}
	state.depth--;
	return RenderStatus::Ok();
}

static RenderStatus RenderTable(const Node &node, const NodeContext &ctx, RenderState &state, std::string &output) {
	RenderStatus status = RenderStatus::Ok();
	if (InterceptStart(state, node, output, status,
	                   [&](HtmlVisitor &visitor) { return visitor.VisitTableStart(ctx); })) {
		return status;
	}
	state.tables.emplace_back();
	status = CollectTableRows(node, state);
	TableFrame frame = std::move(state.tables.back());
	state.tables.pop_back();
	if (!status.IsOk()) {
		return status;
	}
	output = FormatTable(frame);
	return Intercept(state, node, output, [&](HtmlVisitor &visitor) { return visitor.VisitTableEnd(ctx, output); });
}

static RenderStatus RenderTableRow(const Node &node, const NodeContext &ctx, RenderState &state,
                                   std::string &output) {
	TableRowInfo row;
	bool all_header_cells = true;
	state.depth++;
	for (size_t i = 0; i < node.children.size(); i++) {
		const auto &child = node.children[i];
		if (child.type != NodeType::TABLE_CELL && child.type != NodeType::TABLE_HEADER) {
			continue;
		}
		std::string cell;
		auto status = RenderNode(child, &node, i, state, cell);
		if (status.IsAborted()) {
			state.depth--;
			return status;
		}
		if (status.IsSkipped()) {
			continue;
		}
		all_header_cells = all_header_cells && child.type == NodeType::TABLE_HEADER;
		row.cells.push_back(cell);
		row.alignments.push_back(TextUtil::ToLower(child.GetAttribute("align")));
		long colspan = std::strtol(child.GetAttribute("colspan").c_str(), nullptr, 10);
		for (long span = 1; span < colspan && span < 1000; span++) {
			row.cells.emplace_back();
			row.alignments.emplace_back();
		}
	}
	state.depth--;

	bool in_head = !state.tables.empty() && state.tables.back().in_head;
	row.is_header = in_head || (all_header_cells && !row.cells.empty());
	row.default_output = FormatRow(row.cells, row.cells.size());
	output = row.default_output;
	const auto &cells = row.cells;
	bool is_header = row.is_header;
	if (!state.tables.empty()) {
		state.tables.back().rows.push_back(row);
	}
	return Intercept(state, node, output,
	                 [&](HtmlVisitor &visitor) { return visitor.VisitTableRow(ctx, cells, is_header); });
}

static RenderStatus RenderTableCell(const Node &node, RenderState &state, std::string &output) {
	std::string content;
	bool was_cell = state.in_table_cell;
	auto previous_context = state.image_context;
	state.in_table_cell = true;
	state.image_context = &node.tag_name;
	auto status = RenderChildren(node, state, content);
	state.in_table_cell = was_cell;
	state.image_context = previous_context;
	if (!status.IsOk()) {
		return status;
	}
	auto replacement = state.options.br_in_tables ? "<br>" : " ";
	output = EscapePipes(TextUtil::Trim(CollapseNewlines(TrimBlock(content), replacement)));
	return RenderStatus::Ok();
}

//===--------------------------------------------------------------------===//
// Forms, media and interactive elements
//===--------------------------------------------------------------------===//

static RenderStatus RenderInput(const Node &node, const NodeContext &ctx, RenderState &state, std::string &output) {
	std::string input_type = TextUtil::ToLower(node.GetAttribute("type"));
	if (input_type.empty()) {
		input_type = "text";
	}
	const auto &name = node.GetAttribute("name");
	const auto &value = node.GetAttribute("value");
	if (input_type == "checkbox" || input_type == "radio") {
		output = node.HasAttribute("checked") ? "[x]" : "[ ]";
	} else if (input_type != "hidden") {
		output = TextUtil::Escape(value, state.options);
	}
	return Intercept(state, node, output,
	                 [&](HtmlVisitor &visitor) { return visitor.VisitInput(ctx, input_type, name, value); });
}

static std::string MediaSource(const Node &node) {
	if (!node.GetAttribute("src").empty()) {
		return node.GetAttribute("src");
	}
	for (const auto &child : node.children) {
		if (child.type == NodeType::SOURCE && !child.GetAttribute("src").empty()) {
			return child.GetAttribute("src");
		}
	}
	return std::string();
}

static RenderStatus RenderMedia(const Node &node, const NodeContext &ctx, RenderState &state, std::string &output) {
	std::string src = MediaSource(node);
	if (node.type == NodeType::IFRAME) {
		if (!src.empty()) {
			output = "[" + src + "](" + LinkDestination(src) + ")";
		}
		ObserveChildren(node, state);
		return Intercept(state, node, output, [&](HtmlVisitor &visitor) { return visitor.VisitIframe(ctx, src); });
	}

	std::string fallback;
	auto status = RenderChildren(node, state, fallback);
	if (!status.IsOk()) {
		return status;
	}
	fallback = TrimBlock(fallback);
	if (!src.empty()) {
		output = "[" + src + "](" + LinkDestination(src) + ")";
	}
	if (!fallback.empty()) {
		output += output.empty() ? fallback : "\n\n" + fallback;
	}
	if (node.type == NodeType::AUDIO) {
		return Intercept(state, node, output, [&](HtmlVisitor &visitor) { return visitor.VisitAudio(ctx, src); });
	}
	return Intercept(state, node, output, [&](HtmlVisitor &visitor) { return visitor.VisitVideo(ctx, src); });
}

// summary, figcaption and button: a single line of text with an optional wrapper
static RenderStatus RenderCaptionLike(const Node &node, const NodeContext &ctx, RenderState &state,
                                      std::string &output) {
	std::string content;
	auto status = RenderChildren(node, state, content);
	if (!status.IsOk()) {
		return status;
	}
	std::string text = TextUtil::Trim(CollapseNewlines(TrimBlock(content), " "));
	if (node.type == NodeType::SUMMARY) {
		output = text.empty() ? text : "**" + text + "**";
		return Intercept(state, node, output, [&](HtmlVisitor &visitor) { return visitor.VisitSummary(ctx, text); });
	}
	if (node.type == NodeType::FIGCAPTION) {
		output = text.empty() ? text : "*" + text + "*";
		return Intercept(state, node, output,
		                 [&](HtmlVisitor &visitor) { return visitor.VisitFigcaption(ctx, text); });
	}
	output = content;
	return Intercept(state, node, output, [&](HtmlVisitor &visitor) { return visitor.VisitButton(ctx, text); });
}

//===--------------------------------------------------------------------===//
// Element dispatch
//===--------------------------------------------------------------------===//

static RenderStatus RenderElement(const Node &node, const NodeContext &ctx, RenderState &state, std::string &output) {
	const auto &options = state.options;
	if (ContainsTag(options.preserve_tags, node.tag_name)) {
		output = SerializeHtml(node);
		ObserveChildren(node, state);
		return RenderStatus::Ok();
	}
	if (ContainsTag(options.strip_tags, node.tag_name)) {
		return RenderChildren(node, state, output);
	}
	if (state.in_code && node.type != NodeType::BR) {
		return RenderChildren(node, state, output);
	}

	RenderStatus status = RenderStatus::Ok();
	switch (node.type) {
	case NodeType::HEAD: {
		// Traversed for metadata only
		std::string discarded;
		return RenderChildren(node, state, discarded);
	}
	case NodeType::TITLE:
	case NodeType::META:
	case NodeType::LINK_TAG:
	case NodeType::STYLE:
	case NodeType::SCRIPT:
	case NodeType::BASE:
	case NodeType::TEMPLATE:
	case NodeType::SOURCE:
	case NodeType::RP:
		return RenderStatus::Ok();
	case NodeType::SVG:
		// Captured by the image extractor and metadata, never rendered
		return RenderStatus::Ok();

	case NodeType::HEADING:
		return RenderHeading(node, ctx, state, output);
	case NodeType::BLOCKQUOTE:
		return RenderBlockquote(node, ctx, state, output);
	case NodeType::PRE:
		return RenderCodeBlock(node, ctx, state, output);
	case NodeType::CODE:
	case NodeType::KBD:
	case NodeType::SAMP:
		return RenderInlineCode(node, ctx, state, output);
	case NodeType::HR:
		output = state.inline_mode ? std::string() : std::string("---");
		return Intercept(state, node, output,
		                 [&](HtmlVisitor &visitor) { return visitor.VisitHorizontalRule(ctx); });
	case NodeType::BR:
		return RenderLineBreak(node, ctx, state, output);

	case NodeType::LINK:
		return RenderLink(node, ctx, state, output);
	case NodeType::IMAGE:
		return RenderImage(node, ctx, state, output);
	case NodeType::STRONG:
	case NodeType::EM:
	case NodeType::STRIKETHROUGH:
	case NodeType::DEL:
	case NodeType::INS:
	case NodeType::UNDERLINE:
	case NodeType::SUBSCRIPT:
	case NodeType::SUPERSCRIPT:
	case NodeType::MARK:
		return RenderInlineFormat(node, ctx, state, output);

	case NodeType::LIST:
		return RenderList(node, ctx, state, output);
	case NodeType::LIST_ITEM:
		return RenderListItem(node, ctx, state, output);
	case NodeType::DEFINITION_LIST:
	case NodeType::DEFINITION_TERM:
	case NodeType::DEFINITION_DESCRIPTION:
		return RenderDefinition(node, ctx, state, output);

	case NodeType::TABLE:
		return RenderTable(node, ctx, state, output);
	case NodeType::TABLE_HEAD:
	case NodeType::TABLE_BODY:
	case NodeType::TABLE_FOOT:
		if (state.tables.empty()) {
			return RenderChildren(node, state, output);
		}
		return CollectTableRows(node, state);
	case NodeType::TABLE_ROW:
		return RenderTableRow(node, ctx, state, output);
	case NodeType::TABLE_CELL:
	case NodeType::TABLE_HEADER:
		return RenderTableCell(node, state, output);

	case NodeType::Q:
		status = RenderChildren(node, state, output);
		if (status.IsOk() && !output.empty()) {
			output = "\"" + output + "\"";
		}
		return status;
	case NodeType::ABBR:
		status = RenderChildren(node, state, output);
		if (status.IsOk() && !output.empty() && !node.GetAttribute("title").empty()) {
			output += " (" + node.GetAttribute("title") + ")";
		}
		return status;
	case NodeType::RT:
		status = RenderChildren(node, state, output);
		if (status.IsOk() && !output.empty()) {
			output = "(" + TextUtil::Trim(output) + ")";
		}
		return status;

	case NodeType::INPUT:
		return RenderInput(node, ctx, state, output);
	case NodeType::BUTTON:
	case NodeType::SUMMARY:
	case NodeType::FIGCAPTION:
		return RenderCaptionLike(node, ctx, state, output);
	case NodeType::FORM:
		if (InterceptStart(state, node, output, status, [&](HtmlVisitor &visitor) {
			    return visitor.VisitForm(ctx, node.GetAttribute("action"), node.GetAttribute("method"));
		    })) {
			return status;
		}
		return RenderChildren(node, state, output);
	case NodeType::DETAILS:
		if (InterceptStart(state, node, output, status, [&](HtmlVisitor &visitor) {
			    return visitor.VisitDetails(ctx, node.HasAttribute("open"));
		    })) {
			return status;
		}
		return RenderChildren(node, state, output);
	case NodeType::FIGURE:
		if (InterceptStart(state, node, output, status,
		                   [&](HtmlVisitor &visitor) { return visitor.VisitFigureStart(ctx); })) {
			return status;
		}
		status = RenderChildren(node, state, output);
		if (!status.IsOk()) {
			return status;
		}
		return Intercept(state, node, output,
		                 [&](HtmlVisitor &visitor) { return visitor.VisitFigureEnd(ctx, output); });

	case NodeType::AUDIO:
	case NodeType::VIDEO:
	case NodeType::IFRAME:
		return RenderMedia(node, ctx, state, output);

	case NodeType::CUSTOM:
		status = RenderChildren(node, state, output);
		if (!status.IsOk() || !state.dispatcher.HasVisitor()) {
			return status;
		}
		return Intercept(state, node, output, [&](HtmlVisitor &visitor) {
			return visitor.VisitCustomElement(ctx, node.tag_name, SerializeHtml(node));
		});

	default:
		// Containers and phrasing elements without markup of their own
		return RenderChildren(node, state, output);
	}
}

static RenderStatus RenderNode(const Node &node, const Node *parent, size_t index, RenderState &state,
                               std::string &output) {
	NodeContext ctx {node.type,   node.tag_name, node.attributes, state.depth, index,
	                 parent ? &parent->tag_name : nullptr, IsInlineType(node.type)};
	if (node.IsText()) {
		return RenderText(node, ctx, state, output);
	}

	MetadataCollector::Checkpoint metadata_mark {0};
	InlineImageExtractor::Checkpoint image_mark {0, 0, 0};
	if (state.collector) {
		metadata_mark = state.collector->Mark();
	}
	if (state.images) {
		image_mark = state.images->Mark();
	}
	auto rollback = [&]() {
		if (state.collector) {
			state.collector->Rollback(metadata_mark);
		}
		if (state.images) {
			state.images->Rollback(image_mark);
		}
	};

	bool descend = true;
	auto status = state.dispatcher.Enter(node, ctx, output, descend);
	if (!status.IsOk()) {
		return status;
	}
	if (state.collector) {
		state.collector->Observe(node, state.depth);
	}
	if (state.images) {
		state.images->Observe(node);
	}

	if (!descend) {
		ObserveChildren(node, state);
	} else {
		status = RenderElement(node, ctx, state, output);
		if (status.IsAborted()) {
			return status;
		}
		if (status.IsSkipped()) {
			output.clear();
			rollback();
			return status;
		}
	}

	status = state.dispatcher.Leave(node, ctx, output);
	if (status.IsAborted()) {
		return status;
	}
	if (status.IsSkipped()) {
		rollback();
		return status;
	}
	ApplyBlockSeparation(node, parent, state, output);
	return RenderStatus::Ok();
}

RenderStatus RenderTree(const Node &root, RenderState &state, std::string &output) {
	state.depth = 0;
	return RenderNode(root, nullptr, 0, state, output);
}

//===--------------------------------------------------------------------===//
// Finalization
//===--------------------------------------------------------------------===//

static bool IsFenceLine(const std::string &line) {
	return line.compare(0, 3, "```") == 0 || line.compare(0, 3, "~~~") == 0;
}

// Re-flows prose lines; code fences, indented code, tables, headings and quotes stay as they are
static std::string WrapParagraphs(const std::string &markdown, size_t width) {
	std::string result;
	bool in_fence = false;
	size_t start = 0;
	while (start <= markdown.size()) {
		size_t end = markdown.find('\n', start);
		if (end == std::string::npos) {
			end = markdown.size();
		}
		std::string line = markdown.substr(start, end - start);
		if (IsFenceLine(line)) {
			in_fence = !in_fence;
			result += line;
		} else if (in_fence || line.empty() || line[0] == '|' || line[0] == '#' || line[0] == '>' ||
		           line[0] == '\t' || line.compare(0, 4, "    ") == 0) {
			result += line;
		} else {
			result += TextUtil::Wrap(line, width);
		}
		if (end == markdown.size()) {
			break;
		}
		result += '\n';
		start = end + 1;
	}
	return result;
}

std::string FinalizeMarkdown(const std::string &raw, const ConversionOptions &options) {
	std::string markdown;
	if (options.convert_as_inline) {
		markdown = TextUtil::Trim(CollapseNewlines(raw, " "));
		return markdown;
	}
	markdown = TextUtil::TrimTrailingWhitespace(TrimBlock(raw));
	if (options.wrap) {
		markdown = WrapParagraphs(markdown, options.wrap_width);
	}
	if (!markdown.empty()) {
		markdown += '\n';
	}
	return markdown;
}

} // namespace html_markdown

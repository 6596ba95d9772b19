#include "node_tree.hpp"

#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace html_markdown {

static const std::string EMPTY_STRING;

bool Node::HasAttribute(const std::string &name) const {
	for (const auto &attr : attributes) {
		if (attr.first == name) {
			return true;
		}
	}
	return false;
}

const std::string &Node::GetAttribute(const std::string &name) const {
	for (const auto &attr : attributes) {
		if (attr.first == name) {
			return attr.second;
		}
	}
	return EMPTY_STRING;
}

bool Node::HasClass(const std::string &class_name) const {
	const auto &classes = GetAttribute("class");
	size_t pos = 0;
	while (pos < classes.size()) {
		while (pos < classes.size() && std::isspace(static_cast<unsigned char>(classes[pos]))) {
			pos++;
		}
		size_t end = pos;
		while (end < classes.size() && !std::isspace(static_cast<unsigned char>(classes[end]))) {
			end++;
		}
		if (end > pos && classes.compare(pos, end - pos, class_name) == 0 && end - pos == class_name.size()) {
			return true;
		}
		pos = end;
	}
	return false;
}

static void AppendText(const Node &node, std::string &out) {
	if (node.IsText()) {
		out += node.text;
		return;
	}
	for (const auto &child : node.children) {
		AppendText(child, out);
	}
}

std::string Node::TextContent() const {
	std::string result;
	AppendText(*this, result);
	return result;
}

//===--------------------------------------------------------------------===//
// Tag classification
//===--------------------------------------------------------------------===//

NodeType ClassifyTag(const std::string &tag_name) {
	static const std::unordered_map<std::string, NodeType> TAG_TYPES = {
	    {"h1", NodeType::HEADING},
	    {"h2", NodeType::HEADING},
	    {"h3", NodeType::HEADING},
	    {"h4", NodeType::HEADING},
	    {"h5", NodeType::HEADING},
	    {"h6", NodeType::HEADING},
	    {"p", NodeType::PARAGRAPH},
	    {"div", NodeType::DIV},
	    {"blockquote", NodeType::BLOCKQUOTE},
	    {"pre", NodeType::PRE},
	    {"hr", NodeType::HR},
	    {"ul", NodeType::LIST},
	    {"ol", NodeType::LIST},
	    {"menu", NodeType::LIST},
	    {"li", NodeType::LIST_ITEM},
	    {"dl", NodeType::DEFINITION_LIST},
	    {"dt", NodeType::DEFINITION_TERM},
	    {"dd", NodeType::DEFINITION_DESCRIPTION},
	    {"table", NodeType::TABLE},
	    {"tr", NodeType::TABLE_ROW},
	    {"td", NodeType::TABLE_CELL},
	    {"th", NodeType::TABLE_HEADER},
	    {"tbody", NodeType::TABLE_BODY},
	    {"thead", NodeType::TABLE_HEAD},
	    {"tfoot", NodeType::TABLE_FOOT},
	    {"a", NodeType::LINK},
	    {"img", NodeType::IMAGE},
	    {"strong", NodeType::STRONG},
	    {"b", NodeType::STRONG},
	    {"em", NodeType::EM},
	    {"i", NodeType::EM},
	    {"code", NodeType::CODE},
	    {"s", NodeType::STRIKETHROUGH},
	    {"strike", NodeType::STRIKETHROUGH},
	    {"u", NodeType::UNDERLINE},
	    {"sub", NodeType::SUBSCRIPT},
	    {"sup", NodeType::SUPERSCRIPT},
	    {"mark", NodeType::MARK},
	    {"small", NodeType::SMALL},
	    {"br", NodeType::BR},
	    {"span", NodeType::SPAN},
	    {"article", NodeType::ARTICLE},
	    {"section", NodeType::SECTION},
	    {"nav", NodeType::NAV},
	    {"aside", NodeType::ASIDE},
	    {"header", NodeType::HEADER},
	    {"footer", NodeType::FOOTER},
	    {"main", NodeType::MAIN},
	    {"figure", NodeType::FIGURE},
	    {"figcaption", NodeType::FIGCAPTION},
	    {"time", NodeType::TIME},
	    {"details", NodeType::DETAILS},
	    {"summary", NodeType::SUMMARY},
	    {"form", NodeType::FORM},
	    {"input", NodeType::INPUT},
	    {"select", NodeType::SELECT},
	    {"option", NodeType::OPTION},
	    {"button", NodeType::BUTTON},
	    {"textarea", NodeType::TEXTAREA},
	    {"label", NodeType::LABEL},
	    {"fieldset", NodeType::FIELDSET},
	    {"legend", NodeType::LEGEND},
	    {"audio", NodeType::AUDIO},
	    {"video", NodeType::VIDEO},
	    {"picture", NodeType::PICTURE},
	    {"source", NodeType::SOURCE},
	    {"iframe", NodeType::IFRAME},
	    {"svg", NodeType::SVG},
	    {"canvas", NodeType::CANVAS},
	    {"ruby", NodeType::RUBY},
	    {"rt", NodeType::RT},
	    {"rp", NodeType::RP},
	    {"abbr", NodeType::ABBR},
	    {"kbd", NodeType::KBD},
	    {"samp", NodeType::SAMP},
	    {"var", NodeType::VAR},
	    {"cite", NodeType::CITE},
	    {"q", NodeType::Q},
	    {"del", NodeType::DEL},
	    {"ins", NodeType::INS},
	    {"data", NodeType::DATA},
	    {"meter", NodeType::METER},
	    {"progress", NodeType::PROGRESS},
	    {"output", NodeType::OUTPUT},
	    {"template", NodeType::TEMPLATE},
	    {"slot", NodeType::SLOT},
	    {"html", NodeType::HTML},
	    {"head", NodeType::HEAD},
	    {"body", NodeType::BODY},
	    {"title", NodeType::TITLE},
	    {"meta", NodeType::META},
	    {"link", NodeType::LINK_TAG},
	    {"style", NodeType::STYLE},
	    {"script", NodeType::SCRIPT},
	    {"base", NodeType::BASE},
	};
	// Known HTML elements that render through the generic element rule
	static const std::unordered_set<std::string> GENERIC_TAGS = {
	    "address", "area",   "bdi",      "bdo",   "big",      "caption", "center", "col",    "colgroup",
	    "dfn",     "dialog", "embed",    "font",  "hgroup",   "map",     "noscript", "object", "optgroup",
	    "param",   "search", "tt",       "track", "wbr",      "xmp",     "listing",  "plaintext", "nobr",
	    "acronym", "marquee", "blink", "frame", "frameset", "noframes", "math", "portal"};

	auto entry = TAG_TYPES.find(tag_name);
	if (entry != TAG_TYPES.end()) {
		return entry->second;
	}
	if (GENERIC_TAGS.count(tag_name) > 0) {
		return NodeType::ELEMENT;
	}
	return NodeType::CUSTOM;
}

const char *NodeTypeToString(NodeType type) {
	switch (type) {
	case NodeType::TEXT:
		return "text";
	case NodeType::ELEMENT:
		return "element";
	case NodeType::HEADING:
		return "heading";
	case NodeType::PARAGRAPH:
		return "paragraph";
	case NodeType::DIV:
		return "div";
	case NodeType::BLOCKQUOTE:
		return "blockquote";
	case NodeType::PRE:
		return "pre";
	case NodeType::HR:
		return "hr";
	case NodeType::LIST:
		return "list";
	case NodeType::LIST_ITEM:
		return "list_item";
	case NodeType::DEFINITION_LIST:
		return "definition_list";
	case NodeType::DEFINITION_TERM:
		return "definition_term";
	case NodeType::DEFINITION_DESCRIPTION:
		return "definition_description";
	case NodeType::TABLE:
		return "table";
	case NodeType::TABLE_ROW:
		return "table_row";
	case NodeType::TABLE_CELL:
		return "table_cell";
	case NodeType::TABLE_HEADER:
		return "table_header";
	case NodeType::TABLE_BODY:
		return "table_body";
	case NodeType::TABLE_HEAD:
		return "table_head";
	case NodeType::TABLE_FOOT:
		return "table_foot";
	case NodeType::LINK:
		return "link";
	case NodeType::IMAGE:
		return "image";
	case NodeType::STRONG:
		return "strong";
	case NodeType::EM:
		return "em";
	case NodeType::CODE:
		return "code";
	case NodeType::STRIKETHROUGH:
		return "strikethrough";
	case NodeType::UNDERLINE:
		return "underline";
	case NodeType::SUBSCRIPT:
		return "subscript";
	case NodeType::SUPERSCRIPT:
		return "superscript";
	case NodeType::MARK:
		return "mark";
	case NodeType::SMALL:
		return "small";
	case NodeType::BR:
		return "br";
	case NodeType::SPAN:
		return "span";
	case NodeType::ARTICLE:
		return "article";
	case NodeType::SECTION:
		return "section";
	case NodeType::NAV:
		return "nav";
	case NodeType::ASIDE:
		return "aside";
	case NodeType::HEADER:
		return "header";
	case NodeType::FOOTER:
		return "footer";
	case NodeType::MAIN:
		return "main";
	case NodeType::FIGURE:
		return "figure";
	case NodeType::FIGCAPTION:
		return "figcaption";
	case NodeType::TIME:
		return "time";
	case NodeType::DETAILS:
		return "details";
	case NodeType::SUMMARY:
		return "summary";
	case NodeType::FORM:
		return "form";
	case NodeType::INPUT:
		return "input";
	case NodeType::SELECT:
		return "select";
	case NodeType::OPTION:
		return "option";
	case NodeType::BUTTON:
		return "button";
	case NodeType::TEXTAREA:
		return "textarea";
	case NodeType::LABEL:
		return "label";
	case NodeType::FIELDSET:
		return "fieldset";
	case NodeType::LEGEND:
		return "legend";
	case NodeType::AUDIO:
		return "audio";
	case NodeType::VIDEO:
		return "video";
	case NodeType::PICTURE:
		return "picture";
	case NodeType::SOURCE:
		return "source";
	case NodeType::IFRAME:
		return "iframe";
	case NodeType::SVG:
		return "svg";
	case NodeType::CANVAS:
		return "canvas";
	case NodeType::RUBY:
		return "ruby";
	case NodeType::RT:
		return "rt";
	case NodeType::RP:
		return "rp";
	case NodeType::ABBR:
		return "abbr";
	case NodeType::KBD:
		return "kbd";
	case NodeType::SAMP:
		return "samp";
	case NodeType::VAR:
		return "var";
	case NodeType::CITE:
		return "cite";
	case NodeType::Q:
		return "q";
	case NodeType::DEL:
		return "del";
	case NodeType::INS:
		return "ins";
	case NodeType::DATA:
		return "data";
	case NodeType::METER:
		return "meter";
	case NodeType::PROGRESS:
		return "progress";
	case NodeType::OUTPUT:
		return "output";
	case NodeType::TEMPLATE:
		return "template";
	case NodeType::SLOT:
		return "slot";
	case NodeType::HTML:
		return "html";
	case NodeType::HEAD:
		return "head";
	case NodeType::BODY:
		return "body";
	case NodeType::TITLE:
		return "title";
	case NodeType::META:
		return "meta";
	case NodeType::LINK_TAG:
		return "link_tag";
	case NodeType::STYLE:
		return "style";
	case NodeType::SCRIPT:
		return "script";
	case NodeType::BASE:
		return "base";
	case NodeType::CUSTOM:
		return "custom";
	}
	return "custom";
}

bool IsInlineType(NodeType type) {
	switch (type) {
	case NodeType::TEXT:
	case NodeType::LINK:
	case NodeType::IMAGE:
	case NodeType::STRONG:
	case NodeType::EM:
	case NodeType::CODE:
	case NodeType::STRIKETHROUGH:
	case NodeType::UNDERLINE:
	case NodeType::SUBSCRIPT:
	case NodeType::SUPERSCRIPT:
	case NodeType::MARK:
	case NodeType::SMALL:
	case NodeType::BR:
	case NodeType::SPAN:
	case NodeType::TIME:
	case NodeType::INPUT:
	case NodeType::BUTTON:
	case NodeType::LABEL:
	case NodeType::ABBR:
	case NodeType::KBD:
	case NodeType::SAMP:
	case NodeType::VAR:
	case NodeType::CITE:
	case NodeType::Q:
	case NodeType::DEL:
	case NodeType::INS:
	case NodeType::DATA:
	case NodeType::METER:
	case NodeType::PROGRESS:
	case NodeType::OUTPUT:
	case NodeType::RUBY:
	case NodeType::RT:
	case NodeType::RP:
	case NodeType::SLOT:
		return true;
	default:
		return false;
	}
}

Node MakeTextNode(const std::string &text) {
	Node node;
	node.type = NodeType::TEXT;
	node.text = text;
	return node;
}

Node MakeElement(const std::string &tag_name) {
	Node node;
	node.type = ClassifyTag(tag_name);
	node.tag_name = tag_name;
	return node;
}

//===--------------------------------------------------------------------===//
// Serialization
//===--------------------------------------------------------------------===//

static bool IsVoidElement(const std::string &tag) {
	static const std::unordered_set<std::string> VOID_TAGS = {"area", "base",  "br",   "col",   "embed",
	                                                          "hr",   "img",   "input", "link", "meta",
	                                                          "param", "source", "track", "wbr"};
	return VOID_TAGS.count(tag) > 0;
}

static void EscapeInto(const std::string &text, bool in_attribute, std::string &out) {
	for (char c : text) {
		switch (c) {
		case '&':
			out += "&amp;";
			break;
		case '<':
			out += "&lt;";
			break;
		case '>':
			out += "&gt;";
			break;
		case '"':
			if (in_attribute) {
				out += "&quot;";
			} else {
				out += c;
			}
			break;
		default:
			out += c;
		}
	}
}

static void SerializeInto(const Node &node, bool raw_text, std::string &out) {
	if (node.IsText()) {
		if (raw_text) {
			out += node.text;
		} else {
			EscapeInto(node.text, false, out);
		}
		return;
	}
	out += '<';
	out += node.tag_name;
	for (const auto &attr : node.attributes) {
		out += ' ';
		out += attr.first;
		out += "=\"";
		EscapeInto(attr.second, true, out);
		out += '"';
	}
	out += '>';
	if (IsVoidElement(node.tag_name)) {
		return;
	}
	bool children_raw = node.type == NodeType::SCRIPT || node.type == NodeType::STYLE;
	for (const auto &child : node.children) {
		SerializeInto(child, children_raw, out);
	}
	out += "</";
	out += node.tag_name;
	out += '>';
}

std::string SerializeHtml(const Node &node) {
	std::string result;
	SerializeInto(node, false, result);
	return result;
}

} // namespace html_markdown

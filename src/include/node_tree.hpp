#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace html_markdown {

// Coarse classification of a parsed node. The set is closed; tags without a
// dedicated rule map to ELEMENT (known HTML) or CUSTOM (anything else).
enum class NodeType : uint8_t {
	TEXT,
	ELEMENT,
	HEADING,
	PARAGRAPH,
	DIV,
	BLOCKQUOTE,
	PRE,
	HR,
	LIST,
	LIST_ITEM,
	DEFINITION_LIST,
	DEFINITION_TERM,
	DEFINITION_DESCRIPTION,
	TABLE,
	TABLE_ROW,
	TABLE_CELL,
	TABLE_HEADER,
	TABLE_BODY,
	TABLE_HEAD,
	TABLE_FOOT,
	LINK,
	IMAGE,
	STRONG,
	EM,
	CODE,
	STRIKETHROUGH,
	UNDERLINE,
	SUBSCRIPT,
	SUPERSCRIPT,
	MARK,
	SMALL,
	BR,
	SPAN,
	ARTICLE,
	SECTION,
	NAV,
	ASIDE,
	HEADER,
	FOOTER,
	MAIN,
	FIGURE,
	FIGCAPTION,
	TIME,
	DETAILS,
	SUMMARY,
	FORM,
	INPUT,
	SELECT,
	OPTION,
	BUTTON,
	TEXTAREA,
	LABEL,
	FIELDSET,
	LEGEND,
	AUDIO,
	VIDEO,
	PICTURE,
	SOURCE,
	IFRAME,
	SVG,
	CANVAS,
	RUBY,
	RT,
	RP,
	ABBR,
	KBD,
	SAMP,
	VAR,
	CITE,
	Q,
	DEL,
	INS,
	DATA,
	METER,
	PROGRESS,
	OUTPUT,
	TEMPLATE,
	SLOT,
	HTML,
	HEAD,
	BODY,
	TITLE,
	META,
	LINK_TAG,
	STYLE,
	SCRIPT,
	BASE,
	CUSTOM
};

using AttributeList = std::vector<std::pair<std::string, std::string>>;

struct Node {
	NodeType type = NodeType::ELEMENT;
	//! Lower-case tag name, empty for text nodes
	std::string tag_name;
	AttributeList attributes;
	std::vector<Node> children;
	//! Literal content of text nodes
	std::string text;
	//! Byte offset of the start tag in the source document
	size_t source_offset = 0;

	bool IsText() const {
		return type == NodeType::TEXT;
	}
	bool HasAttribute(const std::string &name) const;
	//! Returns the attribute value or an empty string
	const std::string &GetAttribute(const std::string &name) const;
	//! Whitespace-separated class list contains the given class
	bool HasClass(const std::string &class_name) const;
	//! Concatenated text of all descendant text nodes
	std::string TextContent() const;
};

NodeType ClassifyTag(const std::string &tag_name);
const char *NodeTypeToString(NodeType type);
//! Inline (phrasing) node types; used for NodeContext::is_inline
bool IsInlineType(NodeType type);

Node MakeTextNode(const std::string &text);
Node MakeElement(const std::string &tag_name);

//! Serializes a node back into HTML markup
std::string SerializeHtml(const Node &node);

} // namespace html_markdown

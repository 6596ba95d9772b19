#include "html_parser.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace html_markdown {

// RAII wrapper for xmlDoc
class XmlDocGuard {
public:
	explicit XmlDocGuard(xmlDocPtr doc) : doc_(doc) {
	}
	~XmlDocGuard() {
		if (doc_) {
			xmlFreeDoc(doc_);
		}
	}
	XmlDocGuard(const XmlDocGuard &) = delete;
	XmlDocGuard &operator=(const XmlDocGuard &) = delete;

	xmlDocPtr get() const {
		return doc_;
	}
	explicit operator bool() const {
		return doc_ != nullptr;
	}

private:
	xmlDocPtr doc_;
};

static void InitializeParser() {
	static std::once_flag init_flag;
	std::call_once(init_flag, []() { xmlInitParser(); });
}

static std::string ToLower(const char *str) {
	std::string result(str ? str : "");
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

// Locates start tags in the source text, in document order. Elements the
// parser implied (no start tag in the input) keep the last located offset.
class SourceOffsetLocator {
public:
	explicit SourceOffsetLocator(const std::string &source) : source_(source) {
	}

	size_t Locate(const std::string &tag_name) {
		size_t pos = cursor_;
		while (true) {
			pos = source_.find('<', pos);
			if (pos == std::string::npos || pos + 1 + tag_name.size() > source_.size()) {
				return last_offset_;
			}
			if (MatchesTag(pos + 1, tag_name)) {
				last_offset_ = pos;
				cursor_ = pos + 1;
				return pos;
			}
			pos++;
		}
	}

private:
	bool MatchesTag(size_t pos, const std::string &tag_name) const {
		for (size_t i = 0; i < tag_name.size(); i++) {
			if (std::tolower(static_cast<unsigned char>(source_[pos + i])) != tag_name[i]) {
				return false;
			}
		}
		size_t end = pos + tag_name.size();
		if (end >= source_.size()) {
			return true;
		}
		char next = source_[end];
		return next == '>' || next == '/' || std::isspace(static_cast<unsigned char>(next));
	}

	const std::string &source_;
	size_t cursor_ = 0;
	size_t last_offset_ = 0;
};

static void ConvertChildren(xmlNodePtr first, Node &parent, SourceOffsetLocator &locator);

static Node ConvertElement(xmlNodePtr element, SourceOffsetLocator &locator) {
	Node node = MakeElement(ToLower(reinterpret_cast<const char *>(element->name)));
	node.source_offset = locator.Locate(node.tag_name);
	for (xmlAttrPtr attr = element->properties; attr; attr = attr->next) {
		std::string name = ToLower(reinterpret_cast<const char *>(attr->name));
		std::string value;
		xmlChar *content = xmlNodeListGetString(element->doc, attr->children, 1);
		if (content) {
			value = reinterpret_cast<char *>(content);
			xmlFree(content);
		}
		node.attributes.emplace_back(std::move(name), std::move(value));
	}
	ConvertChildren(element->children, node, locator);
	return node;
}

static void ConvertChildren(xmlNodePtr first, Node &parent, SourceOffsetLocator &locator) {
	for (xmlNodePtr cur = first; cur; cur = cur->next) {
		switch (cur->type) {
		case XML_ELEMENT_NODE:
			parent.children.push_back(ConvertElement(cur, locator));
			break;
		case XML_TEXT_NODE:
		case XML_CDATA_SECTION_NODE: {
			if (!cur->content) {
				break;
			}
			std::string text(reinterpret_cast<const char *>(cur->content));
			// libxml2 splits text around entity references in some cases
			if (!parent.children.empty() && parent.children.back().IsText()) {
				parent.children.back().text += text;
			} else {
				parent.children.push_back(MakeTextNode(text));
			}
			break;
		}
		default:
			// Comments, processing instructions, DTD nodes
			break;
		}
	}
}

ParsedDocument ParseHtml(const std::string &html) {
	ParsedDocument result;
	result.root = MakeElement("html");

	size_t first_content = html.find_first_not_of(" \t\r\n\f");
	if (first_content == std::string::npos) {
		result.success = true;
		return result;
	}

	InitializeParser();
	XmlDocGuard doc(htmlReadMemory(html.c_str(), static_cast<int>(html.size()), nullptr, "UTF-8",
	                               HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
	                                   HTML_PARSE_NONET));
	if (!doc) {
		PLOGD << "html_markdown: libxml2 returned no document for " << html.size() << " bytes of input";
		return result;
	}

	xmlNodePtr root = xmlDocGetRootElement(doc.get());
	if (!root) {
		// Comment-only documents have no root element
		result.success = true;
		return result;
	}

	SourceOffsetLocator locator(html);
	if (xmlStrcasecmp(root->name, BAD_CAST "html") == 0) {
		result.root = ConvertElement(root, locator);
	} else {
		result.root.children.push_back(ConvertElement(root, locator));
	}
	result.success = true;
	return result;
}

} // namespace html_markdown

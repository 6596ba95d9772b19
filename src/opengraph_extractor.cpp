#include "opengraph_extractor.hpp"
#include "text_util.hpp"

#include <algorithm>

namespace html_markdown {

static bool StartsWith(const std::string &str, const char *prefix, size_t prefix_len) {
	return str.size() > prefix_len && str.compare(0, prefix_len, prefix) == 0;
}

static std::vector<std::string> SplitKeywords(const std::string &content) {
	std::vector<std::string> keywords;
	size_t pos = 0;
	while (pos <= content.size()) {
		size_t end = content.find(',', pos);
		if (end == std::string::npos) {
			end = content.size();
		}
		std::string keyword = TextUtil::Trim(content.substr(pos, end - pos));
		if (!keyword.empty()) {
			keywords.push_back(keyword);
		}
		pos = end + 1;
	}
	return keywords;
}

void RouteMetaTag(const Node &meta, DocumentMetadata &document) {
	if (!meta.HasAttribute("content")) {
		return;
	}
	const std::string &content = meta.GetAttribute("content");

	// Extract og:* properties (using property attribute)
	std::string property = TextUtil::ToLower(meta.GetAttribute("property"));
	if (StartsWith(property, "og:", 3)) {
		document.open_graph[property.substr(3)] = content;
		return;
	}

	std::string name = TextUtil::ToLower(meta.GetAttribute("name"));
	if (name.empty()) {
		// Some sites publish twitter:* through the property attribute
		if (StartsWith(property, "twitter:", 8)) {
			document.twitter_card[property.substr(8)] = content;
		} else if (!property.empty()) {
			document.meta_tags[property] = content;
		}
		return;
	}

	if (StartsWith(name, "twitter:", 8)) {
		document.twitter_card[name.substr(8)] = content;
	} else if (name == "description") {
		document.description = content;
	} else if (name == "keywords") {
		document.keywords = SplitKeywords(content);
	} else if (name == "author") {
		document.author = content;
	} else {
		document.meta_tags[name] = content;
	}
}

static const Node *FindHead(const Node &node) {
	if (node.type == NodeType::HEAD) {
		return &node;
	}
	for (const auto &child : node.children) {
		if (child.IsText()) {
			continue;
		}
		auto head = FindHead(child);
		if (head) {
			return head;
		}
	}
	return nullptr;
}

std::map<std::string, std::string> ExtractHeadMetadata(const Node &root) {
	std::map<std::string, std::string> metadata;
	auto head = FindHead(root);
	if (!head) {
		return metadata;
	}

	for (const auto &child : head->children) {
		switch (child.type) {
		case NodeType::TITLE: {
			std::string title = TextUtil::Trim(TextUtil::NormalizeWhitespace(child.TextContent()));
			if (!title.empty()) {
				metadata["title"] = title;
			}
			break;
		}
		case NodeType::BASE: {
			const auto &href = child.GetAttribute("href");
			if (!href.empty()) {
				metadata["base-href"] = href;
			}
			break;
		}
		case NodeType::META: {
			if (!child.HasAttribute("content")) {
				break;
			}
			const auto &content = child.GetAttribute("content");
			if (child.HasAttribute("name")) {
				metadata["meta-" + TextUtil::ToLower(child.GetAttribute("name"))] = content;
			} else if (child.HasAttribute("property")) {
				std::string key = TextUtil::ToLower(child.GetAttribute("property"));
				std::replace(key.begin(), key.end(), ':', '-');
				metadata["meta-" + key] = content;
			} else if (child.HasAttribute("http-equiv")) {
				metadata["meta-" + TextUtil::ToLower(child.GetAttribute("http-equiv"))] = content;
			}
			break;
		}
		case NodeType::LINK_TAG: {
			if (!child.HasAttribute("rel") || !child.HasAttribute("href")) {
				break;
			}
			std::string rel = TextUtil::ToLower(child.GetAttribute("rel"));
			if (rel == "canonical") {
				metadata["canonical"] = child.GetAttribute("href");
			} else if (rel == "author" || rel == "license" || rel == "alternate") {
				metadata["link-" + rel] = child.GetAttribute("href");
			}
			break;
		}
		default:
			break;
		}
	}
	return metadata;
}

std::string FormatMetadataComment(const std::map<std::string, std::string> &entries) {
	if (entries.empty()) {
		return "";
	}
	std::string result = "<!--\n";
	for (const auto &entry : entries) {
		std::string value = entry.second;
		size_t pos = 0;
		while ((pos = value.find("-->", pos)) != std::string::npos) {
			value.replace(pos, 3, "--&gt;");
			pos += 6;
		}
		result += entry.first + ": " + value + "\n";
	}
	result += "-->\n\n";
	return result;
}

} // namespace html_markdown

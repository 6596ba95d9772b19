#include "preprocessor.hpp"
#include "text_util.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace html_markdown {

static const char *NAVIGATION_FRAGMENTS[] = {"nav", "menu", "breadcrumb", "sidebar", "footer", "cookie", "banner"};

static bool HasNavigationFragment(const Node &node) {
	std::string haystack = TextUtil::ToLower(node.GetAttribute("class") + " " + node.GetAttribute("id"));
	for (const char *fragment : NAVIGATION_FRAGMENTS) {
		if (haystack.find(fragment) != std::string::npos) {
			return true;
		}
	}
	return false;
}

bool ShouldRemoveElement(const Node &node, const PreprocessingOptions &options, bool inside_content) {
	if (node.IsText()) {
		return false;
	}
	if (node.type == NodeType::SCRIPT) {
		// Structured data survives so metadata extraction still sees it
		return TextUtil::ToLower(node.GetAttribute("type")) != "application/ld+json";
	}
	if (node.type == NodeType::STYLE || node.tag_name == "noscript") {
		return true;
	}
	if (options.preset == PreprocessingPreset::MINIMAL) {
		return false;
	}

	if (options.remove_navigation) {
		if (node.type == NodeType::NAV || TextUtil::ToLower(node.GetAttribute("role")) == "navigation") {
			return true;
		}
		if ((node.type == NodeType::HEADER || node.type == NodeType::FOOTER) && !inside_content) {
			return true;
		}
	}
	if (options.remove_forms) {
		switch (node.type) {
		case NodeType::FORM:
		case NodeType::INPUT:
		case NodeType::SELECT:
		case NodeType::TEXTAREA:
		case NodeType::BUTTON:
			return true;
		default:
			break;
		}
	}

	if (options.preset == PreprocessingPreset::AGGRESSIVE) {
		if (node.type == NodeType::ASIDE || node.type == NodeType::IFRAME) {
			return true;
		}
		// Never drop the document skeleton on a class match
		bool skeleton = node.type == NodeType::HTML || node.type == NodeType::BODY || node.type == NodeType::MAIN ||
		                node.type == NodeType::ARTICLE;
		if (!skeleton && HasNavigationFragment(node)) {
			return true;
		}
	}
	return false;
}

static size_t PreprocessChildren(Node &node, const PreprocessingOptions &options, bool inside_content) {
	bool child_inside = inside_content || node.type == NodeType::MAIN || node.type == NodeType::ARTICLE;
	size_t removed = 0;
	auto &children = node.children;
	auto new_end = std::remove_if(children.begin(), children.end(), [&](const Node &child) {
		if (!ShouldRemoveElement(child, options, child_inside)) {
			return false;
		}
		PLOGV << "html_markdown: preprocessing removed <" << child.tag_name << "> at offset " << child.source_offset;
		removed++;
		return true;
	});
	children.erase(new_end, children.end());
	for (auto &child : children) {
		removed += PreprocessChildren(child, options, child_inside);
	}
	return removed;
}

size_t ApplyPreprocessing(Node &root, const PreprocessingOptions &options) {
	if (!options.enabled) {
		return 0;
	}
	size_t removed = PreprocessChildren(root, options, false);
	if (removed > 0) {
		PLOGD << "html_markdown: preprocessing removed " << removed << " elements";
	}
	return removed;
}

} // namespace html_markdown

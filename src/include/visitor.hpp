#pragma once

#include "node_tree.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace html_markdown {

//! Read-only view of the node being visited, valid only during the callback
struct NodeContext {
	NodeType node_type;
	const std::string &tag_name;
	const AttributeList &attributes;
	//! Tree depth, root element is 0
	size_t depth;
	size_t index_in_parent;
	//! Null for the root element
	const std::string *parent_tag;
	bool is_inline;

	bool HasParent() const {
		return parent_tag != nullptr;
	}
	//! Returns the attribute value or an empty string
	const std::string &GetAttribute(const std::string &name) const;
};

enum class VisitAction : uint8_t { CONTINUE, CUSTOM, SKIP, PRESERVE_HTML, ERROR };

class VisitResult {
public:
	static VisitResult Continue() {
		return VisitResult(VisitAction::CONTINUE, std::string());
	}
	//! Replace the node's whole output with output
	static VisitResult Custom(std::string output) {
		return VisitResult(VisitAction::CUSTOM, std::move(output));
	}
	//! Drop the node and its descendants from the output and from metadata
	static VisitResult Skip() {
		return VisitResult(VisitAction::SKIP, std::string());
	}
	//! Emit the node's HTML markup instead of converting it
	static VisitResult PreserveHtml() {
		return VisitResult(VisitAction::PRESERVE_HTML, std::string());
	}
	//! Abort the conversion with message
	static VisitResult Error(std::string message) {
		return VisitResult(VisitAction::ERROR, std::move(message));
	}

	VisitAction GetAction() const {
		return action_;
	}
	//! Custom output or error message
	const std::string &GetPayload() const {
		return payload_;
	}

private:
	VisitResult(VisitAction action, std::string payload) : action_(action), payload_(std::move(payload)) {
	}

	VisitAction action_;
	std::string payload_;
};

// Callback interface for intercepting the conversion. Every method defaults
// to Continue; override only what you need. An instance is used by a single
// conversion and is never retained after the call returns.
class HtmlVisitor {
public:
	virtual ~HtmlVisitor() = default;

	//! Before any element is entered; Skip prevents descent
	virtual VisitResult VisitElementStart(const NodeContext &ctx) {
		return VisitResult::Continue();
	}
	//! After an element is rendered, with its final output so far
	virtual VisitResult VisitElementEnd(const NodeContext &ctx, const std::string &output) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitText(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}

	virtual VisitResult VisitLink(const NodeContext &ctx, const std::string &href, const std::string &text,
	                              const std::string &title) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitImage(const NodeContext &ctx, const std::string &src, const std::string &alt,
	                               const std::string &title) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitHeading(const NodeContext &ctx, uint32_t level, const std::string &text,
	                                 const std::string &id) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitCodeBlock(const NodeContext &ctx, const std::string &language, const std::string &code) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitCodeInline(const NodeContext &ctx, const std::string &code) {
		return VisitResult::Continue();
	}

	virtual VisitResult VisitListStart(const NodeContext &ctx, bool ordered) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitListItem(const NodeContext &ctx, bool ordered, const std::string &marker,
	                                  const std::string &text) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitListEnd(const NodeContext &ctx, bool ordered, const std::string &output) {
		return VisitResult::Continue();
	}

	virtual VisitResult VisitTableStart(const NodeContext &ctx) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitTableRow(const NodeContext &ctx, const std::vector<std::string> &cells, bool is_header) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitTableEnd(const NodeContext &ctx, const std::string &output) {
		return VisitResult::Continue();
	}

	virtual VisitResult VisitBlockquote(const NodeContext &ctx, const std::string &content, size_t depth) {
		return VisitResult::Continue();
	}

	virtual VisitResult VisitStrong(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitEmphasis(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitStrikethrough(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitUnderline(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitSubscript(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitSuperscript(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitMark(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}

	virtual VisitResult VisitLineBreak(const NodeContext &ctx) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitHorizontalRule(const NodeContext &ctx) {
		return VisitResult::Continue();
	}
	//! Unknown tags; html is the element's serialized markup
	virtual VisitResult VisitCustomElement(const NodeContext &ctx, const std::string &tag_name,
	                                       const std::string &html) {
		return VisitResult::Continue();
	}

	virtual VisitResult VisitDefinitionListStart(const NodeContext &ctx) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitDefinitionTerm(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitDefinitionDescription(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitDefinitionListEnd(const NodeContext &ctx, const std::string &output) {
		return VisitResult::Continue();
	}

	virtual VisitResult VisitForm(const NodeContext &ctx, const std::string &action, const std::string &method) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitInput(const NodeContext &ctx, const std::string &input_type, const std::string &name,
	                               const std::string &value) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitButton(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}

	virtual VisitResult VisitAudio(const NodeContext &ctx, const std::string &src) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitVideo(const NodeContext &ctx, const std::string &src) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitIframe(const NodeContext &ctx, const std::string &src) {
		return VisitResult::Continue();
	}

	virtual VisitResult VisitDetails(const NodeContext &ctx, bool open) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitSummary(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}

	virtual VisitResult VisitFigureStart(const NodeContext &ctx) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitFigcaption(const NodeContext &ctx, const std::string &text) {
		return VisitResult::Continue();
	}
	virtual VisitResult VisitFigureEnd(const NodeContext &ctx, const std::string &output) {
		return VisitResult::Continue();
	}
};

} // namespace html_markdown

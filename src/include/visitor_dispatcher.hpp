#pragma once

#include "visitor.hpp"

#include <string>

namespace html_markdown {

// Outcome of rendering one node. Aborts carry the visitor's message and
// unwind the whole traversal; skipped nodes produce no output.
class RenderStatus {
public:
	static RenderStatus Ok() {
		return RenderStatus(Kind::OK, std::string());
	}
	static RenderStatus Skipped() {
		return RenderStatus(Kind::SKIPPED, std::string());
	}
	static RenderStatus Abort(std::string message) {
		return RenderStatus(Kind::ABORTED, std::move(message));
	}

	bool IsOk() const {
		return kind_ == Kind::OK;
	}
	bool IsSkipped() const {
		return kind_ == Kind::SKIPPED;
	}
	bool IsAborted() const {
		return kind_ == Kind::ABORTED;
	}
	const std::string &GetMessage() const {
		return message_;
	}

private:
	enum class Kind : uint8_t { OK, SKIPPED, ABORTED };

	RenderStatus(Kind kind, std::string message) : kind_(kind), message_(std::move(message)) {
	}

	Kind kind_;
	std::string message_;
};

// Interposes an optional HtmlVisitor between the traversal and the default
// Markdown rules. Without a visitor every entry point is a single null check.
class VisitorDispatcher {
public:
	explicit VisitorDispatcher(HtmlVisitor *visitor) : visitor_(visitor) {
	}

	bool HasVisitor() const {
		return visitor_ != nullptr;
	}
	HtmlVisitor &GetVisitor() const {
		return *visitor_;
	}

	//! Runs the generic start hook. descend is cleared when the hook replaced or removed the node.
	RenderStatus Enter(const Node &node, const NodeContext &ctx, std::string &output, bool &descend) const;
	//! Runs the generic end hook over the node's rendered output
	RenderStatus Leave(const Node &node, const NodeContext &ctx, std::string &output) const;
	//! Applies a callback result to the node's default output
	RenderStatus Resolve(const VisitResult &result, const Node &node, std::string &output) const;

private:
	HtmlVisitor *visitor_;
};

} // namespace html_markdown

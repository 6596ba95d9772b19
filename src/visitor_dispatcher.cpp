#include "visitor_dispatcher.hpp"

#include <plog/Log.h>

namespace html_markdown {

static const std::string EMPTY_ATTRIBUTE;

const std::string &NodeContext::GetAttribute(const std::string &name) const {
	for (const auto &attr : attributes) {
		if (attr.first == name) {
			return attr.second;
		}
	}
	return EMPTY_ATTRIBUTE;
}

RenderStatus VisitorDispatcher::Resolve(const VisitResult &result, const Node &node, std::string &output) const {
	switch (result.GetAction()) {
	case VisitAction::CONTINUE:
		return RenderStatus::Ok();
	case VisitAction::CUSTOM:
		output = result.GetPayload();
		return RenderStatus::Ok();
	case VisitAction::SKIP:
		output.clear();
		return RenderStatus::Skipped();
	case VisitAction::PRESERVE_HTML:
		output = SerializeHtml(node);
		return RenderStatus::Ok();
	case VisitAction::ERROR:
		PLOGD << "html_markdown: visitor aborted conversion at <" << node.tag_name << ">: " << result.GetPayload();
		return RenderStatus::Abort(result.GetPayload());
	}
	return RenderStatus::Ok();
}

RenderStatus VisitorDispatcher::Enter(const Node &node, const NodeContext &ctx, std::string &output,
                                      bool &descend) const {
	descend = true;
	if (!visitor_) {
		return RenderStatus::Ok();
	}
	auto result = visitor_->VisitElementStart(ctx);
	if (result.GetAction() == VisitAction::CONTINUE) {
		return RenderStatus::Ok();
	}
	descend = false;
	return Resolve(result, node, output);
}

RenderStatus VisitorDispatcher::Leave(const Node &node, const NodeContext &ctx, std::string &output) const {
	if (!visitor_) {
		return RenderStatus::Ok();
	}
	return Resolve(visitor_->VisitElementEnd(ctx, output), node, output);
}

} // namespace html_markdown

#pragma once

#include "duckdb.hpp"

namespace duckdb {

class HtmlMarkdownExtension : public Extension {
public:
	void Load(ExtensionLoader &loader) override;
	std::string Name() override;
	std::string Version() const override;
};

//===--------------------------------------------------------------------===//
// Function registration (defined in the *_function.cpp files)
//===--------------------------------------------------------------------===//

// html_to_markdown(), html_to_markdown_metadata(), html_markdown_version()
void RegisterMarkdownFunctions(ExtensionLoader &loader);

// html_inline_images() table function
void RegisterInlineImageFunction(ExtensionLoader &loader);

} // namespace duckdb

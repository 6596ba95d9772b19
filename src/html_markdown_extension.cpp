#define DUCKDB_EXTENSION_MAIN

#include "html_markdown_extension.hpp"
#include "html_markdown.hpp"
#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "duckdb/main/config.hpp"

#include <plog/Log.h>

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	auto &db = loader.GetDatabaseInstance();
	auto &config = DBConfig::GetConfig(db);

	// Default heading style when no options JSON is given
	config.AddExtensionOption("html_markdown_heading_style",
	                          "Heading style for html_to_markdown: atx, atx_closed or underlined",
	                          LogicalType::VARCHAR, Value("atx"));

	// Structured data entries above this size are dropped from metadata
	config.AddExtensionOption("html_markdown_max_structured_data_size",
	                          "Maximum size in bytes of one structured data entry in html_to_markdown_metadata",
	                          LogicalType::BIGINT, Value::BIGINT(1024 * 1024));

	RegisterMarkdownFunctions(loader);
	RegisterInlineImageFunction(loader);

	PLOGD << "html_markdown: extension " << HTML_MARKDOWN_VERSION << " loaded";
}

void HtmlMarkdownExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string HtmlMarkdownExtension::Name() {
	return "html_markdown";
}

std::string HtmlMarkdownExtension::Version() const {
#ifdef EXT_VERSION_HTML_MARKDOWN
	return EXT_VERSION_HTML_MARKDOWN;
#else
	return HTML_MARKDOWN_VERSION;
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(html_markdown, loader) {
	duckdb::LoadInternal(loader);
}

}

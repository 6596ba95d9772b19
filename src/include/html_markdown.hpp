#pragma once

#include "conversion_options.hpp"
#include "inline_image_extractor.hpp"
#include "metadata_collector.hpp"
#include "visitor.hpp"

#include <string>
#include <vector>

namespace html_markdown {

#define HTML_MARKDOWN_VERSION "0.1.0"

// Outcome of a conversion. On error the markdown is empty and error holds
// the message (a visitor's Error payload is passed through verbatim, an
// empty payload is reported with a fixed message).
struct ConversionResult {
	std::string markdown;
	std::string error;

	bool HasError() const {
		return !error.empty();
	}
	const std::string &GetError() const {
		return error;
	}
};

struct MetadataConversionResult : public ConversionResult {
	ExtendedMetadata metadata;
};

struct InlineImageConversionResult : public ConversionResult {
	std::vector<InlineImage> inline_images;
	std::vector<InlineImageWarning> warnings;
};

//! Convert an HTML document to Markdown
ConversionResult ConvertHtml(const std::string &html, const ConversionOptions &options = ConversionOptions(),
                             HtmlVisitor *visitor = nullptr);

//! Convert and collect document, header, link, image and structured data metadata in the same pass
MetadataConversionResult ConvertWithMetadata(const std::string &html, const ConversionOptions &options,
                                             const MetadataConfig &config, HtmlVisitor *visitor = nullptr);

//! Convert and capture data-URI images and inline SVG in the same pass
InlineImageConversionResult ConvertWithInlineImages(const std::string &html, const ConversionOptions &options,
                                                    const InlineImageConfig &config, HtmlVisitor *visitor = nullptr);

} // namespace html_markdown

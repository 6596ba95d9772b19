#include "html_markdown.hpp"
#include "hocr_table.hpp"
#include "html_parser.hpp"
#include "opengraph_extractor.hpp"
#include "preprocessor.hpp"
#include "render_engine.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace html_markdown {

namespace {

//! Observers requested by the entry point; both are optional
struct ConversionObservers {
	MetadataCollector *collector = nullptr;
	InlineImageExtractor *images = nullptr;
	//! Receives collector->Finish(); filled before the parsed tree is released
	ExtendedMetadata *metadata = nullptr;
};

const char *const EMPTY_ABORT_MESSAGE = "conversion aborted by visitor";

} // namespace

static void Convert(const std::string &html, const ConversionOptions &options, HtmlVisitor *visitor,
                    ConversionObservers observers, ConversionResult &result) {
	auto problem = ValidateOptions(options);
	if (!problem.empty()) {
		result.error = problem;
		return;
	}

	std::string input = html;
	if (options.strip_newlines) {
		std::replace(input.begin(), input.end(), '\r', ' ');
		std::replace(input.begin(), input.end(), '\n', ' ');
	}

	auto document = ParseHtml(input);
	if (!document.success) {
		result.error = "failed to parse HTML document";
		return;
	}
	auto &root = document.root;
	ApplyPreprocessing(root, options.preprocessing);

	bool is_hocr = SpatialTableReconstructor::IsHocrDocument(root);
	if (is_hocr && options.hocr_spatial_tables) {
		HocrTableConfig hocr_config;
		hocr_config.min_confidence = options.hocr_min_confidence;
		hocr_config.row_overlap_ratio = options.hocr_row_overlap_ratio;
		hocr_config.min_column_gap = options.hocr_min_column_gap;
		auto tables = SpatialTableReconstructor(hocr_config).Apply(root);
		PLOGD << "html_markdown: hOCR document detected, " << tables << " tables reconstructed";
	}

	VisitorDispatcher dispatcher(visitor);
	RenderState state(options, dispatcher);
	state.collector = observers.collector;
	state.images = observers.images;
	state.hocr_layout = is_hocr;

	std::string raw;
	auto status = RenderTree(root, state, raw);
	if (status.IsAborted()) {
		result.error = status.GetMessage().empty() ? EMPTY_ABORT_MESSAGE : status.GetMessage();
		return;
	}

	auto markdown = FinalizeMarkdown(raw, options);
	if (options.extract_metadata && !options.convert_as_inline && !is_hocr) {
		auto comment = FormatMetadataComment(ExtractHeadMetadata(root));
		if (!comment.empty()) {
			// The comment's blank line only separates it from following content
			markdown = markdown.empty() ? comment.substr(0, comment.size() - 1) : comment + markdown;
		}
	}
	result.markdown = std::move(markdown);
	if (observers.collector && observers.metadata) {
		*observers.metadata = observers.collector->Finish();
	}
}

ConversionResult ConvertHtml(const std::string &html, const ConversionOptions &options, HtmlVisitor *visitor) {
	ConversionResult result;
	Convert(html, options, visitor, ConversionObservers(), result);
	return result;
}

MetadataConversionResult ConvertWithMetadata(const std::string &html, const ConversionOptions &options,
                                             const MetadataConfig &config, HtmlVisitor *visitor) {
	MetadataConversionResult result;
	MetadataCollector collector(config, options.document_url);
	ConversionObservers observers;
	observers.collector = &collector;
	observers.metadata = &result.metadata;
	Convert(html, options, visitor, observers, result);
	return result;
}

InlineImageConversionResult ConvertWithInlineImages(const std::string &html, const ConversionOptions &options,
                                                    const InlineImageConfig &config, HtmlVisitor *visitor) {
	InlineImageConversionResult result;
	if (config.max_decoded_size_bytes == 0) {
		result.error = "max_decoded_size_bytes must be greater than zero";
		return result;
	}
	InlineImageExtractor extractor(config);
	ConversionObservers observers;
	observers.images = &extractor;
	Convert(html, options, visitor, observers, result);
	if (result.HasError()) {
		return result;
	}
	result.inline_images = extractor.TakeImages();
	result.warnings = extractor.TakeWarnings();
	return result;
}

} // namespace html_markdown

// html_inline_images() table function
// Converts one HTML document and returns the captured inline images as rows

#include "html_markdown_extension.hpp"
#include "html_markdown.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/table_function.hpp"

namespace duckdb {

//===--------------------------------------------------------------------===//
// Bind Data
//===--------------------------------------------------------------------===//

struct InlineImageBindData : public TableFunctionData {
	string html;
	html_markdown::InlineImageConfig config;
};

//===--------------------------------------------------------------------===//
// Global State
//===--------------------------------------------------------------------===//

struct InlineImageGlobalState : public GlobalTableFunctionState {
	vector<html_markdown::InlineImage> images;
	idx_t current_idx = 0;
	bool converted = false;

	idx_t MaxThreads() const override {
		return 1;
	}
};

//===--------------------------------------------------------------------===//
// Bind Function
//===--------------------------------------------------------------------===//

static unique_ptr<FunctionData> InlineImageBind(ClientContext &context, TableFunctionBindInput &input,
                                                vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<InlineImageBindData>();

	// First argument is the HTML document
	if (!input.inputs.empty() && !input.inputs[0].IsNull()) {
		bind_data->html = StringValue::Get(input.inputs[0]);
	} else {
		throw BinderException("html_inline_images() requires an HTML argument");
	}

	// Named parameters
	for (auto &kv : input.named_parameters) {
		if (kv.first == "filename_prefix") {
			bind_data->config.filename_prefix = StringValue::Get(kv.second);
		} else if (kv.first == "capture_svg") {
			bind_data->config.capture_svg = kv.second.GetValue<bool>();
		} else if (kv.first == "infer_dimensions") {
			bind_data->config.infer_dimensions = kv.second.GetValue<bool>();
		} else if (kv.first == "max_decoded_size") {
			auto size = kv.second.GetValue<int64_t>();
			if (size <= 0) {
				throw BinderException("html_inline_images(): max_decoded_size must be positive");
			}
			bind_data->config.max_decoded_size_bytes = static_cast<uint64_t>(size);
		}
	}

	// Return columns
	return_types.push_back(LogicalType::VARCHAR); // filename
	names.push_back("filename");

	return_types.push_back(LogicalType::VARCHAR); // format
	names.push_back("format");

	return_types.push_back(LogicalType::VARCHAR); // source
	names.push_back("source");

	return_types.push_back(LogicalType::VARCHAR); // description
	names.push_back("description");

	return_types.push_back(LogicalType::INTEGER); // width
	names.push_back("width");

	return_types.push_back(LogicalType::INTEGER); // height
	names.push_back("height");

	return_types.push_back(LogicalType::BLOB); // data
	names.push_back("data");

	return std::move(bind_data);
}

//===--------------------------------------------------------------------===//
// Init Global
//===--------------------------------------------------------------------===//

static unique_ptr<GlobalTableFunctionState> InlineImageInitGlobal(ClientContext &context,
                                                                  TableFunctionInitInput &input) {
	return make_uniq<InlineImageGlobalState>();
}

//===--------------------------------------------------------------------===//
// Table Function
//===--------------------------------------------------------------------===//

static void InlineImageFunction(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
	auto &bind_data = data.bind_data->Cast<InlineImageBindData>();
	auto &state = data.global_state->Cast<InlineImageGlobalState>();

	// Convert on first call
	if (!state.converted) {
		auto result = html_markdown::ConvertWithInlineImages(bind_data.html, html_markdown::ConversionOptions(),
		                                                     bind_data.config);
		if (result.HasError()) {
			throw InvalidInputException("html_inline_images: %s", result.GetError());
		}
		state.images = std::move(result.inline_images);
		state.converted = true;
	}

	idx_t count = 0;
	while (count < STANDARD_VECTOR_SIZE && state.current_idx < state.images.size()) {
		const auto &image = state.images[state.current_idx++];

		output.SetValue(0, count, image.filename ? Value(*image.filename) : Value());
		output.SetValue(1, count, Value(html_markdown::InlineImageFormatToString(image.format)));
		output.SetValue(2, count, Value(html_markdown::InlineImageSourceToString(image.source)));
		output.SetValue(3, count, image.description ? Value(*image.description) : Value());
		output.SetValue(4, count,
		                image.dimensions ? Value::INTEGER(static_cast<int32_t>(image.dimensions->width)) : Value());
		output.SetValue(5, count,
		                image.dimensions ? Value::INTEGER(static_cast<int32_t>(image.dimensions->height)) : Value());
		output.SetValue(6, count, Value::BLOB(reinterpret_cast<const_data_ptr_t>(image.data.data()), image.data.size()));

		count++;
	}

	output.SetCardinality(count);
}

//===--------------------------------------------------------------------===//
// Register Function
//===--------------------------------------------------------------------===//

void RegisterInlineImageFunction(ExtensionLoader &loader) {
	TableFunction images_func("html_inline_images", {LogicalType::VARCHAR}, InlineImageFunction, InlineImageBind,
	                          InlineImageInitGlobal);

	// Named parameters
	images_func.named_parameters["filename_prefix"] = LogicalType::VARCHAR;
	images_func.named_parameters["capture_svg"] = LogicalType::BOOLEAN;
	images_func.named_parameters["infer_dimensions"] = LogicalType::BOOLEAN;
	images_func.named_parameters["max_decoded_size"] = LogicalType::BIGINT;

	loader.RegisterFunction(images_func);
}

} // namespace duckdb

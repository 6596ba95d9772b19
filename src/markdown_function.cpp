// Scalar functions converting HTML columns to Markdown

#include "html_markdown_extension.hpp"
#include "html_markdown.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/planner/expression/bound_function_expression.hpp"

namespace duckdb {

//===--------------------------------------------------------------------===//
// Bind Data
//===--------------------------------------------------------------------===//

struct MarkdownBindData : public FunctionData {
	html_markdown::ConversionOptions options;
	html_markdown::MetadataConfig metadata_config;

	unique_ptr<FunctionData> Copy() const override {
		return make_uniq<MarkdownBindData>(*this);
	}

	bool Equals(const FunctionData &other_p) const override {
		auto &other = other_p.Cast<MarkdownBindData>();
		return options.heading_style == other.options.heading_style &&
		       metadata_config.max_structured_data_size == other.metadata_config.max_structured_data_size;
	}
};

static unique_ptr<FunctionData> MarkdownBind(ClientContext &context, ScalarFunction &bound_function,
                                             vector<unique_ptr<Expression>> &arguments) {
	auto bind_data = make_uniq<MarkdownBindData>();

	// Read extension settings as defaults
	Value setting_value;
	if (context.TryGetCurrentSetting("html_markdown_heading_style", setting_value) && !setting_value.IsNull()) {
		auto style = setting_value.ToString();
		if (!html_markdown::ParseHeadingStyle(style, bind_data->options.heading_style)) {
			throw InvalidInputException("html_markdown_heading_style: unknown heading style '%s'", style);
		}
	}
	if (context.TryGetCurrentSetting("html_markdown_max_structured_data_size", setting_value) &&
	    !setting_value.IsNull()) {
		auto size = setting_value.GetValue<int64_t>();
		if (size < 0) {
			throw InvalidInputException("html_markdown_max_structured_data_size must not be negative");
		}
		bind_data->metadata_config.max_structured_data_size = static_cast<size_t>(size);
	}
	return std::move(bind_data);
}

static const MarkdownBindData &GetBindData(ExpressionState &state) {
	auto &func_expr = state.expr.Cast<BoundFunctionExpression>();
	return func_expr.bind_info->Cast<MarkdownBindData>();
}

static string_t ConvertToVector(Vector &result, const string_t &html, const html_markdown::ConversionOptions &options) {
	auto converted = html_markdown::ConvertHtml(html.GetString(), options);
	if (converted.HasError()) {
		throw InvalidInputException("html_to_markdown: %s", converted.GetError());
	}
	return StringVector::AddString(result, converted.markdown);
}

//===--------------------------------------------------------------------===//
// Scalar Functions
//===--------------------------------------------------------------------===//

static void HtmlToMarkdownFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &bind_data = GetBindData(state);
	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t html) {
		return ConvertToVector(result, html, bind_data.options);
	});
}

static void HtmlToMarkdownWithOptionsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &bind_data = GetBindData(state);
	BinaryExecutor::Execute<string_t, string_t, string_t>(
	    args.data[0], args.data[1], result, args.size(), [&](string_t html, string_t options_json) {
		    auto options = bind_data.options;
		    std::string error;
		    if (!html_markdown::ParseOptionsJson(options_json.GetString(), options, error)) {
			    throw InvalidInputException("html_to_markdown: %s", error);
		    }
		    return ConvertToVector(result, html, options);
	    });
}

static void HtmlToMarkdownMetadataFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &bind_data = GetBindData(state);
	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t html) {
		auto converted =
		    html_markdown::ConvertWithMetadata(html.GetString(), bind_data.options, bind_data.metadata_config);
		if (converted.HasError()) {
			throw InvalidInputException("html_to_markdown_metadata: %s", converted.GetError());
		}
		return StringVector::AddString(result, html_markdown::MetadataToJson(converted.metadata));
	});
}

static void HtmlMarkdownVersionFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	result.Reference(Value(HTML_MARKDOWN_VERSION));
}

//===--------------------------------------------------------------------===//
// Register Functions
//===--------------------------------------------------------------------===//

void RegisterMarkdownFunctions(ExtensionLoader &loader) {
	ScalarFunctionSet to_markdown("html_to_markdown");
	to_markdown.AddFunction(
	    ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, HtmlToMarkdownFunction, MarkdownBind));
	// Second argument: options as a JSON object
	to_markdown.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                                       HtmlToMarkdownWithOptionsFunction, MarkdownBind));
	loader.RegisterFunction(to_markdown);

	ScalarFunction metadata_func("html_to_markdown_metadata", {LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                             HtmlToMarkdownMetadataFunction, MarkdownBind);
	loader.RegisterFunction(metadata_func);

	ScalarFunction version_func("html_markdown_version", {}, LogicalType::VARCHAR, HtmlMarkdownVersionFunction);
	loader.RegisterFunction(version_func);
}

} // namespace duckdb

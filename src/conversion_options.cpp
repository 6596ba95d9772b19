#include "conversion_options.hpp"
#include "yyjson_guard.hpp"

namespace html_markdown {

std::string ValidateOptions(const ConversionOptions &options) {
	if (options.bullets.empty()) {
		return "bullets must contain at least one character";
	}
	if (options.strong_em_symbol != '*' && options.strong_em_symbol != '_') {
		return "strong_em_symbol must be '*' or '_'";
	}
	if (options.list_indent_type == ListIndentType::SPACES && options.list_indent_width == 0) {
		return "list_indent_width must be greater than zero";
	}
	if (options.wrap && options.wrap_width == 0) {
		return "wrap_width must be greater than zero when wrap is enabled";
	}
	if (!(options.hocr_row_overlap_ratio > 0.0 && options.hocr_row_overlap_ratio <= 1.0)) {
		return "hocr_row_overlap_ratio must be in the range (0, 1]";
	}
	if (options.hocr_min_column_gap < 0.0) {
		return "hocr_min_column_gap must not be negative";
	}
	if (options.hocr_min_confidence < 0.0 || options.hocr_min_confidence > 100.0) {
		return "hocr_min_confidence must be between 0 and 100";
	}
	return "";
}

bool ParseHeadingStyle(const std::string &value, HeadingStyle &result) {
	if (value == "atx") {
		result = HeadingStyle::ATX;
	} else if (value == "atx_closed") {
		result = HeadingStyle::ATX_CLOSED;
	} else if (value == "underlined") {
		result = HeadingStyle::UNDERLINED;
	} else {
		return false;
	}
	return true;
}

const char *HeadingStyleToString(HeadingStyle style) {
	switch (style) {
	case HeadingStyle::ATX:
		return "atx";
	case HeadingStyle::ATX_CLOSED:
		return "atx_closed";
	case HeadingStyle::UNDERLINED:
		return "underlined";
	}
	return "atx";
}

//===--------------------------------------------------------------------===//
// JSON options
//===--------------------------------------------------------------------===//

static bool ReadBool(yyjson_val *val, const std::string &key, bool &out, std::string &error) {
	if (!yyjson_is_bool(val)) {
		error = "option '" + key + "' must be a boolean";
		return false;
	}
	out = yyjson_get_bool(val);
	return true;
}

static bool ReadString(yyjson_val *val, const std::string &key, std::string &out, std::string &error) {
	if (!yyjson_is_str(val)) {
		error = "option '" + key + "' must be a string";
		return false;
	}
	out = std::string(yyjson_get_str(val), yyjson_get_len(val));
	return true;
}

static bool ReadSize(yyjson_val *val, const std::string &key, size_t &out, std::string &error) {
	if (!yyjson_is_int(val) || (yyjson_is_sint(val) && yyjson_get_sint(val) < 0)) {
		error = "option '" + key + "' must be a non-negative integer";
		return false;
	}
	out = static_cast<size_t>(yyjson_get_uint(val));
	return true;
}

static bool ReadNumber(yyjson_val *val, const std::string &key, double &out, std::string &error) {
	if (!yyjson_is_num(val)) {
		error = "option '" + key + "' must be a number";
		return false;
	}
	out = yyjson_get_num(val);
	return true;
}

static bool ReadStringList(yyjson_val *val, const std::string &key, std::vector<std::string> &out,
                           std::string &error) {
	if (!yyjson_is_arr(val)) {
		error = "option '" + key + "' must be an array of strings";
		return false;
	}
	out.clear();
	size_t idx, max;
	yyjson_val *item;
	yyjson_arr_foreach(val, idx, max, item) {
		if (!yyjson_is_str(item)) {
			error = "option '" + key + "' must be an array of strings";
			return false;
		}
		out.emplace_back(yyjson_get_str(item), yyjson_get_len(item));
	}
	return true;
}

// Reads a string option and maps it through a fixed name table
template <class T>
static bool ReadEnum(yyjson_val *val, const std::string &key, const std::vector<std::pair<const char *, T>> &names,
                     T &out, std::string &error) {
	std::string value;
	if (!ReadString(val, key, value, error)) {
		return false;
	}
	for (const auto &entry : names) {
		if (value == entry.first) {
			out = entry.second;
			return true;
		}
	}
	error = "invalid value '" + value + "' for option '" + key + "'";
	return false;
}

static bool ParsePreprocessing(yyjson_val *obj, PreprocessingOptions &options, std::string &error) {
	if (!yyjson_is_obj(obj)) {
		error = "option 'preprocessing' must be an object";
		return false;
	}
	size_t idx, max;
	yyjson_val *key_val, *val;
	yyjson_obj_foreach(obj, idx, max, key_val, val) {
		std::string key(yyjson_get_str(key_val), yyjson_get_len(key_val));
		bool ok;
		if (key == "enabled") {
			ok = ReadBool(val, key, options.enabled, error);
		} else if (key == "preset") {
			ok = ReadEnum<PreprocessingPreset>(val, key,
			                                   {{"minimal", PreprocessingPreset::MINIMAL},
			                                    {"standard", PreprocessingPreset::STANDARD},
			                                    {"aggressive", PreprocessingPreset::AGGRESSIVE}},
			                                   options.preset, error);
		} else if (key == "remove_navigation") {
			ok = ReadBool(val, key, options.remove_navigation, error);
		} else if (key == "remove_forms") {
			ok = ReadBool(val, key, options.remove_forms, error);
		} else {
			error = "unknown preprocessing option '" + key + "'";
			ok = false;
		}
		if (!ok) {
			return false;
		}
	}
	return true;
}

static bool ApplyOption(const std::string &key, yyjson_val *val, ConversionOptions &options, std::string &error) {
	if (key == "heading_style") {
		return ReadEnum<HeadingStyle>(val, key,
		                              {{"atx", HeadingStyle::ATX},
		                               {"atx_closed", HeadingStyle::ATX_CLOSED},
		                               {"underlined", HeadingStyle::UNDERLINED}},
		                              options.heading_style, error);
	} else if (key == "list_indent_type") {
		return ReadEnum<ListIndentType>(val, key, {{"spaces", ListIndentType::SPACES}, {"tabs", ListIndentType::TABS}},
		                                options.list_indent_type, error);
	} else if (key == "list_indent_width") {
		return ReadSize(val, key, options.list_indent_width, error);
	} else if (key == "bullets") {
		return ReadString(val, key, options.bullets, error);
	} else if (key == "strong_em_symbol") {
		std::string symbol;
		if (!ReadString(val, key, symbol, error)) {
			return false;
		}
		if (symbol.size() != 1) {
			error = "option 'strong_em_symbol' must be a single character";
			return false;
		}
		options.strong_em_symbol = symbol[0];
		return true;
	} else if (key == "escape_asterisks") {
		return ReadBool(val, key, options.escape_asterisks, error);
	} else if (key == "escape_underscores") {
		return ReadBool(val, key, options.escape_underscores, error);
	} else if (key == "escape_misc") {
		return ReadBool(val, key, options.escape_misc, error);
	} else if (key == "escape_ascii") {
		return ReadBool(val, key, options.escape_ascii, error);
	} else if (key == "code_language") {
		return ReadString(val, key, options.code_language, error);
	} else if (key == "code_block_style") {
		return ReadEnum<CodeBlockStyle>(val, key,
		                                {{"indented", CodeBlockStyle::INDENTED},
		                                 {"backticks", CodeBlockStyle::BACKTICKS},
		                                 {"tildes", CodeBlockStyle::TILDES}},
		                                options.code_block_style, error);
	} else if (key == "autolinks") {
		return ReadBool(val, key, options.autolinks, error);
	} else if (key == "default_title") {
		return ReadBool(val, key, options.default_title, error);
	} else if (key == "br_in_tables") {
		return ReadBool(val, key, options.br_in_tables, error);
	} else if (key == "highlight_style") {
		return ReadEnum<HighlightStyle>(val, key,
		                                {{"double_equal", HighlightStyle::DOUBLE_EQUAL},
		                                 {"html", HighlightStyle::HTML},
		                                 {"bold", HighlightStyle::BOLD},
		                                 {"none", HighlightStyle::NONE}},
		                                options.highlight_style, error);
	} else if (key == "extract_metadata") {
		return ReadBool(val, key, options.extract_metadata, error);
	} else if (key == "whitespace_mode") {
		return ReadEnum<WhitespaceMode>(val, key,
		                                {{"normalized", WhitespaceMode::NORMALIZED}, {"strict", WhitespaceMode::STRICT}},
		                                options.whitespace_mode, error);
	} else if (key == "strip_newlines") {
		return ReadBool(val, key, options.strip_newlines, error);
	} else if (key == "wrap") {
		return ReadBool(val, key, options.wrap, error);
	} else if (key == "wrap_width") {
		return ReadSize(val, key, options.wrap_width, error);
	} else if (key == "convert_as_inline") {
		return ReadBool(val, key, options.convert_as_inline, error);
	} else if (key == "sub_symbol") {
		return ReadString(val, key, options.sub_symbol, error);
	} else if (key == "sup_symbol") {
		return ReadString(val, key, options.sup_symbol, error);
	} else if (key == "newline_style") {
		return ReadEnum<NewlineStyle>(val, key,
		                              {{"spaces", NewlineStyle::SPACES}, {"backslash", NewlineStyle::BACKSLASH}},
		                              options.newline_style, error);
	} else if (key == "keep_inline_images_in") {
		return ReadStringList(val, key, options.keep_inline_images_in, error);
	} else if (key == "preserve_tags") {
		return ReadStringList(val, key, options.preserve_tags, error);
	} else if (key == "strip_tags") {
		return ReadStringList(val, key, options.strip_tags, error);
	} else if (key == "preprocessing") {
		return ParsePreprocessing(val, options.preprocessing, error);
	} else if (key == "hocr_spatial_tables") {
		return ReadBool(val, key, options.hocr_spatial_tables, error);
	} else if (key == "hocr_min_confidence") {
		return ReadNumber(val, key, options.hocr_min_confidence, error);
	} else if (key == "hocr_row_overlap_ratio") {
		return ReadNumber(val, key, options.hocr_row_overlap_ratio, error);
	} else if (key == "hocr_min_column_gap") {
		return ReadNumber(val, key, options.hocr_min_column_gap, error);
	} else if (key == "document_url") {
		return ReadString(val, key, options.document_url, error);
	}
	error = "unknown option '" + key + "'";
	return false;
}

bool ParseOptionsJson(const std::string &json, ConversionOptions &options, std::string &error) {
	yyjson_read_err err;
	YyjsonDocGuard doc(yyjson_read_opts(const_cast<char *>(json.c_str()), json.size(),
	                                    YYJSON_READ_ALLOW_TRAILING_COMMAS | YYJSON_READ_ALLOW_COMMENTS, nullptr, &err));
	if (!doc) {
		error = std::string("invalid options JSON: ") + (err.msg ? err.msg : "parse error");
		return false;
	}
	yyjson_val *root = yyjson_doc_get_root(doc.get());
	if (!yyjson_is_obj(root)) {
		error = "options JSON must be an object";
		return false;
	}
	size_t idx, max;
	yyjson_val *key_val, *val;
	yyjson_obj_foreach(root, idx, max, key_val, val) {
		std::string key(yyjson_get_str(key_val), yyjson_get_len(key_val));
		if (!ApplyOption(key, val, options, error)) {
			return false;
		}
	}
	return true;
}

} // namespace html_markdown

#include "jsonld_extractor.hpp"
#include "text_util.hpp"
#include "yyjson_guard.hpp"

#include <utility>
#include <vector>

namespace html_markdown {

// Extract @type value from yyjson object
static std::string ExtractTypeFromVal(yyjson_val *obj) {
	if (!obj || !yyjson_is_obj(obj)) {
		return "";
	}

	yyjson_val *type_val = yyjson_obj_get(obj, "@type");
	if (!type_val) {
		return "";
	}

	// @type can be a string or array of strings
	if (yyjson_is_str(type_val)) {
		return yyjson_get_str(type_val);
	} else if (yyjson_is_arr(type_val)) {
		// Return first type in array
		yyjson_val *first = yyjson_arr_get_first(type_val);
		if (first && yyjson_is_str(first)) {
			return yyjson_get_str(first);
		}
	}
	return "";
}

// First @type found in the object itself or in its @graph members
static std::string ExtractTypeFromObject(yyjson_val *obj) {
	std::string type = ExtractTypeFromVal(obj);
	if (!type.empty()) {
		return type;
	}
	yyjson_val *graph = yyjson_obj_get(obj, "@graph");
	if (!graph || !yyjson_is_arr(graph)) {
		return "";
	}
	size_t idx, max;
	yyjson_val *item;
	yyjson_arr_foreach(graph, idx, max, item) {
		type = ExtractTypeFromVal(item);
		if (!type.empty()) {
			return type;
		}
	}
	return "";
}

bool ExtractJsonLdSchemaType(const std::string &json, std::string &schema_type) {
	schema_type.clear();
	if (json.empty()) {
		return false;
	}

	yyjson_read_err err;
	YyjsonDocGuard doc(yyjson_read_opts(const_cast<char *>(json.c_str()), json.size(),
	                                    YYJSON_READ_ALLOW_TRAILING_COMMAS | YYJSON_READ_ALLOW_COMMENTS,
	                                    nullptr, // allocator
	                                    &err));
	if (!doc) {
		return false;
	}

	yyjson_val *root = yyjson_doc_get_root(doc.get());
	if (yyjson_is_obj(root)) {
		schema_type = ExtractTypeFromObject(root);
	} else if (yyjson_is_arr(root)) {
		// Check each item, @graph included
		size_t idx, max;
		yyjson_val *item;
		yyjson_arr_foreach(root, idx, max, item) {
			if (yyjson_is_obj(item)) {
				schema_type = ExtractTypeFromObject(item);
				if (!schema_type.empty()) {
					break;
				}
			}
		}
	}
	return true;
}

//===--------------------------------------------------------------------===//
// Microdata and RDFa
//===--------------------------------------------------------------------===//

// Properties in first-seen order; repeated names collect into arrays
using PropertyList = std::vector<std::pair<std::string, std::vector<yyjson_mut_val *>>>;

static void AddProperty(PropertyList &properties, const std::string &name, yyjson_mut_val *value) {
	for (auto &entry : properties) {
		if (entry.first == name) {
			entry.second.push_back(value);
			return;
		}
	}
	properties.emplace_back(name, std::vector<yyjson_mut_val *> {value});
}

static void AddProperties(yyjson_mut_doc *doc, yyjson_mut_val *obj, const PropertyList &properties) {
	for (const auto &entry : properties) {
		yyjson_mut_val *key = yyjson_mut_strncpy(doc, entry.first.c_str(), entry.first.size());
		if (entry.second.size() == 1) {
			yyjson_mut_obj_add(obj, key, entry.second[0]);
			continue;
		}
		yyjson_mut_val *arr = yyjson_mut_arr(doc);
		for (auto value : entry.second) {
			yyjson_mut_arr_append(arr, value);
		}
		yyjson_mut_obj_add(obj, key, arr);
	}
}

static std::vector<std::string> SplitTokens(const std::string &value) {
	std::vector<std::string> tokens;
	std::string normalized = TextUtil::Trim(TextUtil::NormalizeWhitespace(value));
	size_t pos = 0;
	while (pos < normalized.size()) {
		size_t end = normalized.find(' ', pos);
		if (end == std::string::npos) {
			end = normalized.size();
		}
		tokens.push_back(normalized.substr(pos, end - pos));
		pos = end + 1;
	}
	return tokens;
}

// Last path segment of a type URL: https://schema.org/Product -> Product
static std::string ShortTypeName(const std::string &type) {
	auto tokens = SplitTokens(type);
	if (tokens.empty()) {
		return "";
	}
	const std::string &first = tokens[0];
	size_t cut = first.find_last_of("/#:");
	if (cut == std::string::npos) {
		return first;
	}
	return first.substr(cut + 1);
}

// Value of a property-bearing element, following the microdata value rules
static std::string ElementValue(const Node &node) {
	static const std::vector<std::pair<NodeType, const char *>> VALUE_ATTRIBUTES = {
	    {NodeType::META, "content"},   {NodeType::LINK, "href"},     {NodeType::LINK_TAG, "href"},
	    {NodeType::IMAGE, "src"},      {NodeType::AUDIO, "src"},     {NodeType::VIDEO, "src"},
	    {NodeType::SOURCE, "src"},     {NodeType::IFRAME, "src"},    {NodeType::DATA, "value"},
	    {NodeType::METER, "value"},    {NodeType::TIME, "datetime"},
	};
	if (node.HasAttribute("content")) {
		return node.GetAttribute("content");
	}
	for (const auto &entry : VALUE_ATTRIBUTES) {
		if (node.type == entry.first && node.HasAttribute(entry.second)) {
			return node.GetAttribute(entry.second);
		}
	}
	return TextUtil::Trim(TextUtil::NormalizeWhitespace(node.TextContent()));
}

static yyjson_mut_val *BuildItem(yyjson_mut_doc *doc, const Node &scope, const char *type_attr,
                                 const char *prop_attr, bool strip_prefix);

static void CollectProperties(yyjson_mut_doc *doc, const Node &node, const char *type_attr, const char *prop_attr,
                              bool strip_prefix, PropertyList &properties) {
	for (const auto &child : node.children) {
		if (child.IsText()) {
			continue;
		}
		bool nested_item = child.HasAttribute(type_attr) || (!strip_prefix && child.HasAttribute("itemscope"));
		if (child.HasAttribute(prop_attr)) {
			for (auto name : SplitTokens(child.GetAttribute(prop_attr))) {
				if (strip_prefix) {
					size_t colon = name.rfind(':');
					if (colon != std::string::npos) {
						name = name.substr(colon + 1);
					}
				}
				yyjson_mut_val *value;
				if (nested_item) {
					value = BuildItem(doc, child, type_attr, prop_attr, strip_prefix);
				} else {
					value = yyjson_mut_strcpy(doc, ElementValue(child).c_str());
				}
				AddProperty(properties, name, value);
			}
		}
		// Properties inside a nested item belong to that item
		if (!nested_item) {
			CollectProperties(doc, child, type_attr, prop_attr, strip_prefix, properties);
		}
	}
}

static yyjson_mut_val *BuildItem(yyjson_mut_doc *doc, const Node &scope, const char *type_attr,
                                 const char *prop_attr, bool strip_prefix) {
	yyjson_mut_val *obj = yyjson_mut_obj(doc);
	const auto &type = scope.GetAttribute(type_attr);
	if (!type.empty()) {
		yyjson_mut_obj_add_strcpy(doc, obj, "@type", ShortTypeName(type).c_str());
	}
	PropertyList properties;
	CollectProperties(doc, scope, type_attr, prop_attr, strip_prefix, properties);
	AddProperties(doc, obj, properties);
	return obj;
}

static std::string BuildJson(const Node &root, const char *type_attr, const char *prop_attr, bool strip_prefix,
                             std::string &schema_type) {
	schema_type = ShortTypeName(root.GetAttribute(type_attr));
	YyjsonMutDocGuard doc;
	if (!doc) {
		return "";
	}
	yyjson_mut_val *obj = BuildItem(doc.get(), root, type_attr, prop_attr, strip_prefix);
	yyjson_mut_doc_set_root(doc.get(), obj);
	return doc.Write();
}

std::string MicrodataToJson(const Node &item_scope, std::string &schema_type) {
	return BuildJson(item_scope, "itemtype", "itemprop", false, schema_type);
}

std::string RdfaToJson(const Node &typed_root, std::string &schema_type) {
	return BuildJson(typed_root, "typeof", "property", true, schema_type);
}

} // namespace html_markdown

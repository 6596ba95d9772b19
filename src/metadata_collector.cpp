#include "metadata_collector.hpp"
#include "jsonld_extractor.hpp"
#include "opengraph_extractor.hpp"
#include "text_util.hpp"
#include "yyjson_guard.hpp"

#include <plog/Log.h>

#include <cctype>

namespace html_markdown {

const char *StructuredDataTypeToString(StructuredDataType type) {
	switch (type) {
	case StructuredDataType::JSON_LD:
		return "json_ld";
	case StructuredDataType::MICRODATA:
		return "microdata";
	case StructuredDataType::RDFA:
		return "rdfa";
	}
	return "json_ld";
}

MetadataCollector::MetadataCollector(const MetadataConfig &config, const std::string &document_url)
    : config_(config), document_url_(document_url) {
}

void MetadataCollector::Observe(const Node &node, size_t depth) {
	if (node.IsText()) {
		return;
	}
	switch (node.type) {
	case NodeType::TITLE:
		// <title> inside <svg> names the graphic, not the document
		if (config_.extract_document && depth <= 2) {
			observations_.push_back({ObservationKind::DOCUMENT, &node, depth});
		}
		break;
	case NodeType::HTML:
	case NodeType::META:
	case NodeType::LINK_TAG:
	case NodeType::BASE:
		if (config_.extract_document) {
			observations_.push_back({ObservationKind::DOCUMENT, &node, depth});
		}
		break;
	case NodeType::HEADING:
		if (config_.extract_headers) {
			observations_.push_back({ObservationKind::HEADER, &node, depth});
		}
		break;
	case NodeType::LINK:
		if (config_.extract_links && node.HasAttribute("href")) {
			observations_.push_back({ObservationKind::LINK, &node, depth});
		}
		break;
	case NodeType::IMAGE:
		if (config_.extract_images && !node.GetAttribute("src").empty()) {
			observations_.push_back({ObservationKind::IMAGE, &node, depth});
		}
		break;
	case NodeType::SVG:
		if (config_.extract_images) {
			observations_.push_back({ObservationKind::SVG, &node, depth});
		}
		break;
	case NodeType::SCRIPT:
		if (config_.extract_structured_data &&
		    TextUtil::ToLower(TextUtil::Trim(node.GetAttribute("type"))) == "application/ld+json") {
			observations_.push_back({ObservationKind::JSON_LD, &node, depth});
		}
		break;
	default:
		break;
	}

	if (!config_.extract_structured_data) {
		return;
	}
	// Top-level items only; nested ones are serialized inside their parent
	if (node.HasAttribute("itemscope") && !node.HasAttribute("itemprop")) {
		observations_.push_back({ObservationKind::MICRODATA, &node, depth});
	} else if (node.HasAttribute("typeof") && !node.HasAttribute("property")) {
		observations_.push_back({ObservationKind::RDFA, &node, depth});
	}
}

void MetadataCollector::ObserveSubtree(const Node &node, size_t depth) {
	Observe(node, depth);
	for (const auto &child : node.children) {
		if (!child.IsText()) {
			ObserveSubtree(child, depth + 1);
		}
	}
}

void MetadataCollector::Rollback(const Checkpoint &checkpoint) {
	if (checkpoint.observations < observations_.size()) {
		observations_.resize(checkpoint.observations);
	}
}

//===--------------------------------------------------------------------===//
// Building
//===--------------------------------------------------------------------===//

static std::string NormalizedText(const Node &node) {
	return TextUtil::Trim(TextUtil::NormalizeWhitespace(node.TextContent()));
}

static std::optional<std::string> OptionalAttribute(const Node &node, const char *name) {
	if (!node.HasAttribute(name)) {
		return std::nullopt;
	}
	return node.GetAttribute(name);
}

static std::map<std::string, std::string> AttributeMap(const Node &node) {
	std::map<std::string, std::string> attributes;
	for (const auto &attr : node.attributes) {
		attributes.emplace(attr.first, attr.second);
	}
	return attributes;
}

// Leading decimal digits of a dimension attribute ("640", "640px")
static bool ParseDimension(const std::string &value, uint32_t &result) {
	std::string trimmed = TextUtil::Trim(value);
	if (trimmed.empty() || !std::isdigit(static_cast<unsigned char>(trimmed[0]))) {
		return false;
	}
	uint64_t parsed = 0;
	for (char c : trimmed) {
		if (!std::isdigit(static_cast<unsigned char>(c))) {
			break;
		}
		parsed = parsed * 10 + static_cast<uint64_t>(c - '0');
		if (parsed > UINT32_MAX) {
			return false;
		}
	}
	result = static_cast<uint32_t>(parsed);
	return true;
}

static std::optional<ImageDimensions> ParseDimensions(const Node &node) {
	ImageDimensions dimensions;
	if (!ParseDimension(node.GetAttribute("width"), dimensions.width) ||
	    !ParseDimension(node.GetAttribute("height"), dimensions.height)) {
		return std::nullopt;
	}
	return dimensions;
}

void MetadataCollector::BuildDocument(const Node &node, DocumentMetadata &document) const {
	switch (node.type) {
	case NodeType::HTML:
		if (node.HasAttribute("lang")) {
			document.language = node.GetAttribute("lang");
		}
		if (node.HasAttribute("dir")) {
			document.text_direction = TextUtil::ToLower(node.GetAttribute("dir"));
		}
		break;
	case NodeType::TITLE: {
		std::string title = NormalizedText(node);
		if (!title.empty() && !document.title) {
			document.title = title;
		}
		break;
	}
	case NodeType::META:
		RouteMetaTag(node, document);
		break;
	case NodeType::LINK_TAG:
		if (LinkParser::SplitRel(node.GetAttribute("rel")) == std::vector<std::string> {"canonical"} &&
		    node.HasAttribute("href")) {
			document.canonical_url = node.GetAttribute("href");
		}
		break;
	case NodeType::BASE:
		if (node.HasAttribute("href") && !document.base_href) {
			document.base_href = node.GetAttribute("href");
		}
		break;
	default:
		break;
	}
}

std::string MetadataCollector::DocumentHost(const DocumentMetadata &document) const {
	std::string host = LinkParser::ExtractDomain(document_url_);
	if (host.empty() && document.canonical_url) {
		host = LinkParser::ExtractDomain(*document.canonical_url);
	}
	if (host.empty() && document.base_href) {
		host = LinkParser::ExtractDomain(*document.base_href);
	}
	return host;
}

void MetadataCollector::AddStructuredData(StructuredData entry, std::vector<StructuredData> &out) const {
	if (entry.raw_json.size() > config_.max_structured_data_size) {
		PLOGD << "html_markdown: dropping " << StructuredDataTypeToString(entry.data_type) << " block of "
		      << entry.raw_json.size() << " bytes (limit " << config_.max_structured_data_size << ")";
		return;
	}
	out.push_back(std::move(entry));
}

ExtendedMetadata MetadataCollector::Finish() const {
	ExtendedMetadata metadata;
	for (const auto &observation : observations_) {
		if (observation.kind == ObservationKind::DOCUMENT) {
			BuildDocument(*observation.node, metadata.document);
		}
	}
	std::string document_host = DocumentHost(metadata.document);

	for (const auto &observation : observations_) {
		const Node &node = *observation.node;
		switch (observation.kind) {
		case ObservationKind::DOCUMENT:
			break;
		case ObservationKind::HEADER: {
			HeaderMetadata header;
			header.level = static_cast<uint32_t>(node.tag_name[1] - '0');
			header.text = NormalizedText(node);
			header.id = OptionalAttribute(node, "id");
			header.depth = observation.depth;
			header.html_offset = node.source_offset;
			metadata.headers.push_back(std::move(header));
			break;
		}
		case ObservationKind::LINK: {
			LinkMetadata link;
			link.href = node.GetAttribute("href");
			link.text = NormalizedText(node);
			link.title = OptionalAttribute(node, "title");
			link.link_type = LinkParser::ClassifyLink(link.href, document_host);
			link.rel = LinkParser::SplitRel(node.GetAttribute("rel"));
			link.attributes = AttributeMap(node);
			metadata.links.push_back(std::move(link));
			break;
		}
		case ObservationKind::IMAGE: {
			ImageMetadata image;
			image.src = node.GetAttribute("src");
			image.alt = OptionalAttribute(node, "alt");
			image.title = OptionalAttribute(node, "title");
			image.dimensions = ParseDimensions(node);
			image.image_type = LinkParser::ClassifyImage(image.src);
			image.attributes = AttributeMap(node);
			metadata.images.push_back(std::move(image));
			break;
		}
		case ObservationKind::SVG: {
			ImageMetadata image;
			image.src = SerializeHtml(node);
			if (node.HasAttribute("aria-label")) {
				image.alt = node.GetAttribute("aria-label");
			}
			for (const auto &child : node.children) {
				if (child.tag_name == "title") {
					image.title = NormalizedText(child);
					break;
				}
			}
			image.dimensions = ParseDimensions(node);
			image.image_type = ImageType::INLINE_SVG;
			image.attributes = AttributeMap(node);
			metadata.images.push_back(std::move(image));
			break;
		}
		case ObservationKind::JSON_LD: {
			StructuredData entry;
			entry.data_type = StructuredDataType::JSON_LD;
			entry.raw_json = TextUtil::Trim(node.TextContent());
			if (entry.raw_json.empty()) {
				break;
			}
			std::string schema_type;
			if (ExtractJsonLdSchemaType(entry.raw_json, schema_type) && !schema_type.empty()) {
				entry.schema_type = schema_type;
			}
			AddStructuredData(std::move(entry), metadata.structured_data);
			break;
		}
		case ObservationKind::MICRODATA:
		case ObservationKind::RDFA: {
			StructuredData entry;
			std::string schema_type;
			if (observation.kind == ObservationKind::MICRODATA) {
				entry.data_type = StructuredDataType::MICRODATA;
				entry.raw_json = MicrodataToJson(node, schema_type);
			} else {
				entry.data_type = StructuredDataType::RDFA;
				entry.raw_json = RdfaToJson(node, schema_type);
			}
			if (entry.raw_json.empty()) {
				break;
			}
			if (!schema_type.empty()) {
				entry.schema_type = schema_type;
			}
			AddStructuredData(std::move(entry), metadata.structured_data);
			break;
		}
		}
	}
	return metadata;
}

//===--------------------------------------------------------------------===//
// JSON serialization
//===--------------------------------------------------------------------===//

static void AddOptional(yyjson_mut_doc *doc, yyjson_mut_val *obj, const char *key,
                        const std::optional<std::string> &value) {
	if (value) {
		yyjson_mut_obj_add_strncpy(doc, obj, key, value->c_str(), value->size());
	} else {
		yyjson_mut_obj_add_null(doc, obj, key);
	}
}

static yyjson_mut_val *MapToJson(yyjson_mut_doc *doc, const std::map<std::string, std::string> &map) {
	yyjson_mut_val *obj = yyjson_mut_obj(doc);
	for (const auto &entry : map) {
		yyjson_mut_obj_add(obj, yyjson_mut_strncpy(doc, entry.first.c_str(), entry.first.size()),
		                   yyjson_mut_strncpy(doc, entry.second.c_str(), entry.second.size()));
	}
	return obj;
}

static yyjson_mut_val *StringListToJson(yyjson_mut_doc *doc, const std::vector<std::string> &values) {
	yyjson_mut_val *arr = yyjson_mut_arr(doc);
	for (const auto &value : values) {
		yyjson_mut_arr_add_strncpy(doc, arr, value.c_str(), value.size());
	}
	return arr;
}

static yyjson_mut_val *DimensionsToJson(yyjson_mut_doc *doc, const std::optional<ImageDimensions> &dimensions) {
	if (!dimensions) {
		return yyjson_mut_null(doc);
	}
	yyjson_mut_val *arr = yyjson_mut_arr(doc);
	yyjson_mut_arr_add_uint(doc, arr, dimensions->width);
	yyjson_mut_arr_add_uint(doc, arr, dimensions->height);
	return arr;
}

std::string MetadataToJson(const ExtendedMetadata &metadata) {
	YyjsonMutDocGuard guard;
	if (!guard) {
		return "";
	}
	yyjson_mut_doc *doc = guard.get();
	yyjson_mut_val *root = yyjson_mut_obj(doc);
	yyjson_mut_doc_set_root(doc, root);

	const auto &document = metadata.document;
	yyjson_mut_val *document_obj = yyjson_mut_obj(doc);
	AddOptional(doc, document_obj, "title", document.title);
	AddOptional(doc, document_obj, "description", document.description);
	yyjson_mut_obj_add_val(doc, document_obj, "keywords", StringListToJson(doc, document.keywords));
	AddOptional(doc, document_obj, "author", document.author);
	AddOptional(doc, document_obj, "canonical_url", document.canonical_url);
	AddOptional(doc, document_obj, "base_href", document.base_href);
	AddOptional(doc, document_obj, "language", document.language);
	AddOptional(doc, document_obj, "text_direction", document.text_direction);
	yyjson_mut_obj_add_val(doc, document_obj, "open_graph", MapToJson(doc, document.open_graph));
	yyjson_mut_obj_add_val(doc, document_obj, "twitter_card", MapToJson(doc, document.twitter_card));
	yyjson_mut_obj_add_val(doc, document_obj, "meta_tags", MapToJson(doc, document.meta_tags));
	yyjson_mut_obj_add_val(doc, root, "document", document_obj);

	yyjson_mut_val *headers = yyjson_mut_arr(doc);
	for (const auto &header : metadata.headers) {
		yyjson_mut_val *obj = yyjson_mut_arr_add_obj(doc, headers);
		yyjson_mut_obj_add_uint(doc, obj, "level", header.level);
		yyjson_mut_obj_add_strncpy(doc, obj, "text", header.text.c_str(), header.text.size());
		AddOptional(doc, obj, "id", header.id);
		yyjson_mut_obj_add_uint(doc, obj, "depth", header.depth);
		yyjson_mut_obj_add_uint(doc, obj, "html_offset", header.html_offset);
	}
	yyjson_mut_obj_add_val(doc, root, "headers", headers);

	yyjson_mut_val *links = yyjson_mut_arr(doc);
	for (const auto &link : metadata.links) {
		yyjson_mut_val *obj = yyjson_mut_arr_add_obj(doc, links);
		yyjson_mut_obj_add_strncpy(doc, obj, "href", link.href.c_str(), link.href.size());
		yyjson_mut_obj_add_strncpy(doc, obj, "text", link.text.c_str(), link.text.size());
		AddOptional(doc, obj, "title", link.title);
		yyjson_mut_obj_add_str(doc, obj, "link_type", LinkTypeToString(link.link_type));
		yyjson_mut_obj_add_val(doc, obj, "rel", StringListToJson(doc, link.rel));
		yyjson_mut_obj_add_val(doc, obj, "attributes", MapToJson(doc, link.attributes));
	}
	yyjson_mut_obj_add_val(doc, root, "links", links);

	yyjson_mut_val *images = yyjson_mut_arr(doc);
	for (const auto &image : metadata.images) {
		yyjson_mut_val *obj = yyjson_mut_arr_add_obj(doc, images);
		yyjson_mut_obj_add_strncpy(doc, obj, "src", image.src.c_str(), image.src.size());
		AddOptional(doc, obj, "alt", image.alt);
		AddOptional(doc, obj, "title", image.title);
		yyjson_mut_obj_add_val(doc, obj, "dimensions", DimensionsToJson(doc, image.dimensions));
		yyjson_mut_obj_add_str(doc, obj, "image_type", ImageTypeToString(image.image_type));
		yyjson_mut_obj_add_val(doc, obj, "attributes", MapToJson(doc, image.attributes));
	}
	yyjson_mut_obj_add_val(doc, root, "images", images);

	yyjson_mut_val *structured = yyjson_mut_arr(doc);
	for (const auto &entry : metadata.structured_data) {
		yyjson_mut_val *obj = yyjson_mut_arr_add_obj(doc, structured);
		yyjson_mut_obj_add_str(doc, obj, "data_type", StructuredDataTypeToString(entry.data_type));
		yyjson_mut_obj_add_strncpy(doc, obj, "raw_json", entry.raw_json.c_str(), entry.raw_json.size());
		AddOptional(doc, obj, "schema_type", entry.schema_type);
	}
	yyjson_mut_obj_add_val(doc, root, "structured_data", structured);

	return guard.Write();
}

} // namespace html_markdown

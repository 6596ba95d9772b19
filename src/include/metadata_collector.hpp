#pragma once

#include "link_parser.hpp"
#include "node_tree.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace html_markdown {

enum class StructuredDataType : uint8_t { JSON_LD, MICRODATA, RDFA };

const char *StructuredDataTypeToString(StructuredDataType type);

struct DocumentMetadata {
	std::optional<std::string> title;
	std::optional<std::string> description;
	std::vector<std::string> keywords;
	std::optional<std::string> author;
	std::optional<std::string> canonical_url;
	std::optional<std::string> base_href;
	std::optional<std::string> language;
	std::optional<std::string> text_direction;
	//! og:* properties, keyed without the prefix
	std::map<std::string, std::string> open_graph;
	//! twitter:* names, keyed without the prefix
	std::map<std::string, std::string> twitter_card;
	//! every other named meta tag
	std::map<std::string, std::string> meta_tags;
};

struct HeaderMetadata {
	uint32_t level = 1;
	std::string text;
	std::optional<std::string> id;
	size_t depth = 0;
	//! Byte offset of the heading's start tag in the source
	size_t html_offset = 0;
};

struct LinkMetadata {
	std::string href;
	std::string text;
	std::optional<std::string> title;
	LinkType link_type = LinkType::OTHER;
	std::vector<std::string> rel;
	std::map<std::string, std::string> attributes;
};

struct ImageDimensions {
	uint32_t width = 0;
	uint32_t height = 0;
};

struct ImageMetadata {
	std::string src;
	std::optional<std::string> alt;
	std::optional<std::string> title;
	std::optional<ImageDimensions> dimensions;
	ImageType image_type = ImageType::RELATIVE;
	std::map<std::string, std::string> attributes;
};

struct StructuredData {
	StructuredDataType data_type = StructuredDataType::JSON_LD;
	std::string raw_json;
	std::optional<std::string> schema_type;
};

struct ExtendedMetadata {
	DocumentMetadata document;
	std::vector<HeaderMetadata> headers;
	std::vector<LinkMetadata> links;
	std::vector<ImageMetadata> images;
	std::vector<StructuredData> structured_data;
};

// Configuration for what to extract
struct MetadataConfig {
	bool extract_document = true;
	bool extract_headers = true;
	bool extract_links = true;
	bool extract_images = true;
	bool extract_structured_data = true;
	//! Entries whose JSON exceeds this many bytes are dropped whole
	size_t max_structured_data_size = 1024 * 1024;
};

// Observes nodes during the render traversal and builds ExtendedMetadata.
// Observations are recorded as node references in document order and can be
// rolled back when a visitor removes the node that produced them; the
// metadata itself is derived once in Finish().
class MetadataCollector {
public:
	struct Checkpoint {
		size_t observations;
	};

	MetadataCollector(const MetadataConfig &config, const std::string &document_url);

	void Observe(const Node &node, size_t depth);
	//! Observe node and every descendant; used when the visitor replaced a subtree without descent
	void ObserveSubtree(const Node &node, size_t depth);

	Checkpoint Mark() const {
		return Checkpoint {observations_.size()};
	}
	void Rollback(const Checkpoint &checkpoint);

	//! Observations point into the rendered tree, which must still be alive
	ExtendedMetadata Finish() const;

private:
	enum class ObservationKind : uint8_t { DOCUMENT, HEADER, LINK, IMAGE, SVG, JSON_LD, MICRODATA, RDFA };

	struct Observation {
		ObservationKind kind;
		const Node *node;
		size_t depth;
	};

	void BuildDocument(const Node &node, DocumentMetadata &document) const;
	std::string DocumentHost(const DocumentMetadata &document) const;
	void AddStructuredData(StructuredData entry, std::vector<StructuredData> &out) const;

	MetadataConfig config_;
	std::string document_url_;
	std::vector<Observation> observations_;
};

//! Serialize the full metadata structure as a JSON object
std::string MetadataToJson(const ExtendedMetadata &metadata);

} // namespace html_markdown

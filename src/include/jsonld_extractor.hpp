#pragma once

#include "node_tree.hpp"

#include <string>

namespace html_markdown {

// Parse a JSON-LD block (comments and trailing commas allowed) and find its
// schema type: the first @type of the root object, of the first array
// member, or of the first @graph member. Returns false for invalid JSON.
bool ExtractJsonLdSchemaType(const std::string &json, std::string &schema_type);

// Convert a microdata item (an element carrying itemscope) into a JSON
// object: {"@type": ..., "<itemprop>": value | [values]}. Nested items
// become nested objects. schema_type receives the last path segment of
// itemtype.
std::string MicrodataToJson(const Node &item_scope, std::string &schema_type);

// Convert an RDFa resource (an element carrying typeof) into a JSON object
// keyed by property names with any vocabulary prefix removed.
std::string RdfaToJson(const Node &typed_root, std::string &schema_type);

} // namespace html_markdown

#pragma once

#include "metadata_collector.hpp"
#include "node_tree.hpp"

#include <map>
#include <string>

namespace html_markdown {

// Route a <meta> element into document metadata: og:* properties go to
// open_graph, twitter:* names to twitter_card, description/keywords/author
// to their fields and every other named tag to meta_tags.
void RouteMetaTag(const Node &meta, DocumentMetadata &document);

// Flat <head> summary used for the comment that prefixes converted output.
// Keys: title, base-href, canonical, meta-<name|property|http-equiv>,
// link-author, link-license, link-alternate.
std::map<std::string, std::string> ExtractHeadMetadata(const Node &root);

// "<!--\nkey: value\n-->\n\n", empty when there are no entries
std::string FormatMetadataComment(const std::map<std::string, std::string> &entries);

} // namespace html_markdown

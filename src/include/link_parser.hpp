#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace html_markdown {

enum class LinkType : uint8_t { ANCHOR, INTERNAL, EXTERNAL, EMAIL, PHONE, OTHER };
enum class ImageType : uint8_t { DATA_URI, INLINE_SVG, EXTERNAL, RELATIVE };

const char *LinkTypeToString(LinkType type);
const char *ImageTypeToString(ImageType type);

class LinkParser {
public:
	// Classify an href; first match wins: anchor, email, phone, external,
	// internal, other. document_host may be empty when unknown.
	static LinkType ClassifyLink(const std::string &href, const std::string &document_host);

	// Classify an <img> src (inline SVG elements are classified by the caller)
	static ImageType ClassifyImage(const std::string &src);

	// Absolute URL: has a "scheme://" prefix or is protocol-relative ("//host/path")
	static bool IsAbsoluteUrl(const std::string &url);

	// Extract base domain (removes www. prefix)
	static std::string ExtractBaseDomain(const std::string &hostname);

	// Extract lower-cased host from an absolute or protocol-relative URL, without port
	static std::string ExtractDomain(const std::string &url);

	// Split a rel attribute into its tokens
	static std::vector<std::string> SplitRel(const std::string &rel);
};

} // namespace html_markdown

#include "link_parser.hpp"
#include "text_util.hpp"

#include <cctype>

namespace html_markdown {

// URL starts with "<scheme>:" where scheme is ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
static bool HasScheme(const std::string &url) {
	if (url.empty() || !std::isalpha(static_cast<unsigned char>(url[0]))) {
		return false;
	}
	for (size_t i = 1; i < url.size(); i++) {
		char c = url[i];
		if (c == ':') {
			return true;
		}
		if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
			return false;
		}
	}
	return false;
}

const char *LinkTypeToString(LinkType type) {
	switch (type) {
	case LinkType::ANCHOR:
		return "anchor";
	case LinkType::INTERNAL:
		return "internal";
	case LinkType::EXTERNAL:
		return "external";
	case LinkType::EMAIL:
		return "email";
	case LinkType::PHONE:
		return "phone";
	case LinkType::OTHER:
		return "other";
	}
	return "other";
}

const char *ImageTypeToString(ImageType type) {
	switch (type) {
	case ImageType::DATA_URI:
		return "data_uri";
	case ImageType::INLINE_SVG:
		return "inline_svg";
	case ImageType::EXTERNAL:
		return "external";
	case ImageType::RELATIVE:
		return "relative";
	}
	return "relative";
}

bool LinkParser::IsAbsoluteUrl(const std::string &url) {
	if (url.size() >= 2 && url[0] == '/' && url[1] == '/') {
		return true;
	}
	size_t proto_end = url.find("://");
	return proto_end != std::string::npos && HasScheme(url) && url.find(':') == proto_end;
}

std::string LinkParser::ExtractDomain(const std::string &url) {
	size_t domain_start;
	if (url.size() >= 2 && url[0] == '/' && url[1] == '/') {
		domain_start = 2;
	} else {
		size_t proto_end = url.find("://");
		if (proto_end == std::string::npos) {
			return "";
		}
		domain_start = proto_end + 3;
	}

	size_t domain_end = url.find_first_of("/?#", domain_start);
	if (domain_end == std::string::npos) {
		domain_end = url.length();
	}

	std::string domain = url.substr(domain_start, domain_end - domain_start);

	// user:password@host:port
	size_t at = domain.rfind('@');
	if (at != std::string::npos) {
		domain.erase(0, at + 1);
	}
	size_t colon = domain.find(':');
	if (colon != std::string::npos) {
		domain.resize(colon);
	}
	return TextUtil::ToLower(domain);
}

std::string LinkParser::ExtractBaseDomain(const std::string &hostname) {
	std::string host = TextUtil::ToLower(hostname);
	if (host.size() > 4 && host.compare(0, 4, "www.") == 0) {
		host.erase(0, 4);
	}
	return host;
}

LinkType LinkParser::ClassifyLink(const std::string &href, const std::string &document_host) {
	std::string trimmed = TextUtil::Trim(href);
	std::string lower = TextUtil::ToLower(trimmed);

	if (!trimmed.empty() && trimmed[0] == '#') {
		return LinkType::ANCHOR;
	}
	if (lower.compare(0, 7, "mailto:") == 0) {
		return LinkType::EMAIL;
	}
	if (lower.compare(0, 4, "tel:") == 0) {
		return LinkType::PHONE;
	}
	if (IsAbsoluteUrl(trimmed)) {
		std::string host = ExtractBaseDomain(ExtractDomain(trimmed));
		if (document_host.empty() || host != ExtractBaseDomain(document_host)) {
			return LinkType::EXTERNAL;
		}
		return LinkType::INTERNAL;
	}
	if (HasScheme(trimmed)) {
		// javascript:, data:, ftp without authority and friends
		return LinkType::OTHER;
	}
	return LinkType::INTERNAL;
}

ImageType LinkParser::ClassifyImage(const std::string &src) {
	std::string lower = TextUtil::ToLower(TextUtil::Trim(src));
	if (lower.compare(0, 5, "data:") == 0) {
		return ImageType::DATA_URI;
	}
	if (IsAbsoluteUrl(lower)) {
		return ImageType::EXTERNAL;
	}
	return ImageType::RELATIVE;
}

std::vector<std::string> LinkParser::SplitRel(const std::string &rel) {
	std::vector<std::string> tokens;
	size_t pos = 0;
	while (pos < rel.size()) {
		while (pos < rel.size() && std::isspace(static_cast<unsigned char>(rel[pos]))) {
			pos++;
		}
		size_t end = pos;
		while (end < rel.size() && !std::isspace(static_cast<unsigned char>(rel[end]))) {
			end++;
		}
		if (end > pos) {
			tokens.push_back(TextUtil::ToLower(rel.substr(pos, end - pos)));
		}
		pos = end;
	}
	return tokens;
}

} // namespace html_markdown

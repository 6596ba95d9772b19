#include "inline_image_extractor.hpp"
#include "text_util.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace html_markdown {

const char *InlineImageFormatToString(InlineImageFormat format) {
	switch (format) {
	case InlineImageFormat::PNG:
		return "png";
	case InlineImageFormat::JPEG:
		return "jpeg";
	case InlineImageFormat::GIF:
		return "gif";
	case InlineImageFormat::BMP:
		return "bmp";
	case InlineImageFormat::WEBP:
		return "webp";
	case InlineImageFormat::SVG:
		return "svg";
	case InlineImageFormat::OTHER:
		return "other";
	}
	return "other";
}

const char *InlineImageSourceToString(InlineImageSource source) {
	switch (source) {
	case InlineImageSource::IMG_DATA_URI:
		return "img_data_uri";
	case InlineImageSource::SVG_ELEMENT:
		return "svg_element";
	}
	return "img_data_uri";
}

static const char *FileExtension(InlineImageFormat format) {
	switch (format) {
	case InlineImageFormat::JPEG:
		return "jpg";
	case InlineImageFormat::OTHER:
		return "bin";
	default:
		return InlineImageFormatToString(format);
	}
}

static InlineImageFormat FormatFromMimeType(const std::string &mime_type) {
	std::string lower = TextUtil::ToLower(mime_type);
	if (lower == "image/png") {
		return InlineImageFormat::PNG;
	} else if (lower == "image/jpeg" || lower == "image/jpg" || lower == "image/pjpeg") {
		return InlineImageFormat::JPEG;
	} else if (lower == "image/gif") {
		return InlineImageFormat::GIF;
	} else if (lower == "image/bmp" || lower == "image/x-ms-bmp") {
		return InlineImageFormat::BMP;
	} else if (lower == "image/webp") {
		return InlineImageFormat::WEBP;
	} else if (lower == "image/svg+xml") {
		return InlineImageFormat::SVG;
	}
	return InlineImageFormat::OTHER;
}

InlineImageExtractor::InlineImageExtractor(const InlineImageConfig &config) : config_(config) {
}

bool InlineImageExtractor::IsCandidate(const Node &node) const {
	if (node.type == NodeType::IMAGE) {
		std::string src = TextUtil::ToLower(TextUtil::Trim(node.GetAttribute("src")));
		return src.compare(0, 5, "data:") == 0;
	}
	return node.type == NodeType::SVG && config_.capture_svg;
}

void InlineImageExtractor::Observe(const Node &node) {
	if (node.IsText() || !IsCandidate(node)) {
		return;
	}
	size_t index = candidates_++;
	InlineImageWarning warning;
	auto image = Extract(node, index, warning);
	if (image) {
		images_.push_back(std::move(*image));
		return;
	}
	PLOGD << "html_markdown: inline image " << warning.index << " skipped: " << warning.message;
	warnings_.push_back(std::move(warning));
}

void InlineImageExtractor::ObserveSubtree(const Node &node) {
	Observe(node);
	// Markup inside a captured <svg> belongs to it
	if (node.type == NodeType::SVG) {
		return;
	}
	for (const auto &child : node.children) {
		if (!child.IsText()) {
			ObserveSubtree(child);
		}
	}
}

void InlineImageExtractor::Rollback(const Checkpoint &checkpoint) {
	if (checkpoint.images < images_.size()) {
		images_.resize(checkpoint.images);
	}
	if (checkpoint.warnings < warnings_.size()) {
		warnings_.resize(checkpoint.warnings);
	}
	candidates_ = checkpoint.candidates;
}

std::string InlineImageExtractor::MakeFilename(InlineImageFormat format) const {
	std::string prefix = config_.filename_prefix ? *config_.filename_prefix : "embedded_image";
	return prefix + "_" + std::to_string(images_.size() + 1) + "." + FileExtension(format);
}

std::optional<InlineImage> InlineImageExtractor::Extract(const Node &node, size_t index,
                                                         InlineImageWarning &warning) const {
	if (node.type == NodeType::SVG) {
		return ExtractSvg(node, index, warning);
	}
	return ExtractDataUri(node, index, warning);
}

static std::string PercentDecode(const std::string &input) {
	std::string result;
	result.reserve(input.size());
	for (size_t i = 0; i < input.size(); i++) {
		if (input[i] == '%' && i + 2 < input.size() && std::isxdigit(static_cast<unsigned char>(input[i + 1])) &&
		    std::isxdigit(static_cast<unsigned char>(input[i + 2]))) {
			char hex[3] = {input[i + 1], input[i + 2], '\0'};
			result += static_cast<char>(std::strtol(hex, nullptr, 16));
			i += 2;
		} else {
			result += input[i];
		}
	}
	return result;
}

std::optional<InlineImage> InlineImageExtractor::ExtractDataUri(const Node &node, size_t index,
                                                                InlineImageWarning &warning) const {
	warning.index = index;
	std::string src = TextUtil::Trim(node.GetAttribute("src"));
	size_t comma = src.find(',');
	if (comma == std::string::npos) {
		warning.message = "malformed data URI: missing ',' separator";
		return std::nullopt;
	}

	// data:[<mediatype>][;base64],<data>
	std::string header = src.substr(5, comma - 5);
	std::string payload = src.substr(comma + 1);
	bool is_base64 = false;
	std::string mime_type;
	size_t pos = 0;
	while (pos <= header.size()) {
		size_t end = header.find(';', pos);
		if (end == std::string::npos) {
			end = header.size();
		}
		std::string part = TextUtil::Trim(header.substr(pos, end - pos));
		if (pos == 0) {
			mime_type = part;
		} else if (TextUtil::ToLower(part) == "base64") {
			is_base64 = true;
		}
		pos = end + 1;
	}

	InlineImage image;
	if (is_base64) {
		// Upper bound of the decoded size, checked before allocating
		if (payload.size() / 4 * 3 > config_.max_decoded_size_bytes + 3) {
			warning.message = "decoded image exceeds max_decoded_size_bytes (" +
			                  std::to_string(config_.max_decoded_size_bytes) + ")";
			return std::nullopt;
		}
		if (!DecodeBase64(payload, image.data)) {
			warning.message = "invalid base64 payload in data URI";
			return std::nullopt;
		}
	} else {
		std::string decoded = PercentDecode(payload);
		image.data.assign(decoded.begin(), decoded.end());
	}
	if (image.data.empty()) {
		warning.message = "data URI has an empty payload";
		return std::nullopt;
	}
	if (image.data.size() > config_.max_decoded_size_bytes) {
		warning.message = "decoded image exceeds max_decoded_size_bytes (" +
		                  std::to_string(config_.max_decoded_size_bytes) + ")";
		return std::nullopt;
	}

	image.format = FormatFromMimeType(mime_type);
	InlineImageFormat sniffed = SniffFormat(image.data);
	if (sniffed != InlineImageFormat::OTHER) {
		image.format = sniffed;
	}
	image.source = InlineImageSource::IMG_DATA_URI;
	image.filename = MakeFilename(image.format);
	if (node.HasAttribute("alt") && !node.GetAttribute("alt").empty()) {
		image.description = node.GetAttribute("alt");
	} else if (node.HasAttribute("title")) {
		image.description = node.GetAttribute("title");
	}
	if (config_.infer_dimensions) {
		image.dimensions = InferDimensions(image.format, image.data);
	}
	for (const auto &attr : node.attributes) {
		if (attr.first != "src") {
			image.attributes.emplace(attr.first, attr.second);
		}
	}
	return image;
}

std::optional<InlineImage> InlineImageExtractor::ExtractSvg(const Node &node, size_t index,
                                                            InlineImageWarning &warning) const {
	warning.index = index;
	std::string markup = SerializeHtml(node);
	if (markup.size() > config_.max_decoded_size_bytes) {
		warning.message = "inline SVG exceeds max_decoded_size_bytes (" +
		                  std::to_string(config_.max_decoded_size_bytes) + ")";
		return std::nullopt;
	}

	InlineImage image;
	image.data.assign(markup.begin(), markup.end());
	image.format = InlineImageFormat::SVG;
	image.source = InlineImageSource::SVG_ELEMENT;
	image.filename = MakeFilename(image.format);
	if (node.HasAttribute("aria-label")) {
		image.description = node.GetAttribute("aria-label");
	} else {
		for (const auto &child : node.children) {
			if (child.tag_name == "title") {
				image.description = TextUtil::Trim(TextUtil::NormalizeWhitespace(child.TextContent()));
				break;
			}
		}
	}
	if (config_.infer_dimensions) {
		image.dimensions = InferDimensions(image.format, image.data);
	}
	for (const auto &attr : node.attributes) {
		image.attributes.emplace(attr.first, attr.second);
	}
	return image;
}

//===--------------------------------------------------------------------===//
// Decoding
//===--------------------------------------------------------------------===//

static int Base64Value(char c) {
	if (c >= 'A' && c <= 'Z') {
		return c - 'A';
	} else if (c >= 'a' && c <= 'z') {
		return c - 'a' + 26;
	} else if (c >= '0' && c <= '9') {
		return c - '0' + 52;
	} else if (c == '+' || c == '-') {
		return 62;
	} else if (c == '/' || c == '_') {
		return 63;
	}
	return -1;
}

bool InlineImageExtractor::DecodeBase64(const std::string &input, std::vector<uint8_t> &output) {
	output.clear();
	output.reserve(input.size() / 4 * 3);
	uint32_t buffer = 0;
	size_t bits = 0;
	size_t symbols = 0;
	size_t padding = 0;
	for (char c : input) {
		if (std::isspace(static_cast<unsigned char>(c))) {
			continue;
		}
		if (c == '=') {
			padding++;
			continue;
		}
		if (padding > 0) {
			// Data after padding
			return false;
		}
		int value = Base64Value(c);
		if (value < 0) {
			return false;
		}
		buffer = (buffer << 6) | static_cast<uint32_t>(value);
		bits += 6;
		symbols++;
		if (bits >= 8) {
			bits -= 8;
			output.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
		}
	}
	// A lone trailing symbol cannot encode a byte
	if (symbols % 4 == 1 || padding > 2) {
		output.clear();
		return false;
	}
	return true;
}

InlineImageFormat InlineImageExtractor::SniffFormat(const std::vector<uint8_t> &data) {
	auto starts_with = [&](const char *magic, size_t offset) {
		size_t len = std::strlen(magic);
		return data.size() >= offset + len && std::memcmp(data.data() + offset, magic, len) == 0;
	};
	if (starts_with("\x89PNG\r\n\x1a\n", 0)) {
		return InlineImageFormat::PNG;
	}
	if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
		return InlineImageFormat::JPEG;
	}
	if (starts_with("GIF87a", 0) || starts_with("GIF89a", 0)) {
		return InlineImageFormat::GIF;
	}
	if (starts_with("BM", 0) && data.size() >= 26) {
		return InlineImageFormat::BMP;
	}
	if (starts_with("RIFF", 0) && starts_with("WEBP", 8)) {
		return InlineImageFormat::WEBP;
	}
	// Text formats: skip a BOM and leading whitespace
	size_t pos = 0;
	if (starts_with("\xEF\xBB\xBF", 0)) {
		pos = 3;
	}
	while (pos < data.size() && std::isspace(data[pos])) {
		pos++;
	}
	if (starts_with("<svg", pos) || starts_with("<?xml", pos)) {
		std::string head(data.begin() + pos, data.begin() + std::min<size_t>(data.size(), pos + 1024));
		if (head.find("<svg") != std::string::npos) {
			return InlineImageFormat::SVG;
		}
	}
	return InlineImageFormat::OTHER;
}

static uint32_t ReadBigEndian16(const std::vector<uint8_t> &data, size_t offset) {
	return (static_cast<uint32_t>(data[offset]) << 8) | data[offset + 1];
}

static uint32_t ReadBigEndian32(const std::vector<uint8_t> &data, size_t offset) {
	return (static_cast<uint32_t>(data[offset]) << 24) | (static_cast<uint32_t>(data[offset + 1]) << 16) |
	       (static_cast<uint32_t>(data[offset + 2]) << 8) | data[offset + 3];
}

static uint32_t ReadLittleEndian16(const std::vector<uint8_t> &data, size_t offset) {
	return data[offset] | (static_cast<uint32_t>(data[offset + 1]) << 8);
}

static uint32_t ReadLittleEndian24(const std::vector<uint8_t> &data, size_t offset) {
	return data[offset] | (static_cast<uint32_t>(data[offset + 1]) << 8) |
	       (static_cast<uint32_t>(data[offset + 2]) << 16);
}

static int32_t ReadLittleEndian32(const std::vector<uint8_t> &data, size_t offset) {
	return static_cast<int32_t>(data[offset] | (static_cast<uint32_t>(data[offset + 1]) << 8) |
	                            (static_cast<uint32_t>(data[offset + 2]) << 16) |
	                            (static_cast<uint32_t>(data[offset + 3]) << 24));
}

//! |value| without overflow for INT32_MIN
static uint32_t Magnitude(int32_t value) {
	return value < 0 ? 0u - static_cast<uint32_t>(value) : static_cast<uint32_t>(value);
}

static std::optional<ImageDimensions> JpegDimensions(const std::vector<uint8_t> &data) {
	size_t pos = 2;
	while (pos + 9 < data.size()) {
		if (data[pos] != 0xFF) {
			pos++;
			continue;
		}
		uint8_t marker = data[pos + 1];
		if (marker == 0xFF) {
			pos++;
			continue;
		}
		// Markers without a length field
		if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
			pos += 2;
			continue;
		}
		bool start_of_frame = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
		if (start_of_frame) {
			ImageDimensions dimensions;
			dimensions.height = ReadBigEndian16(data, pos + 5);
			dimensions.width = ReadBigEndian16(data, pos + 7);
			return dimensions;
		}
		pos += 2 + ReadBigEndian16(data, pos + 2);
	}
	return std::nullopt;
}

static std::optional<ImageDimensions> WebpDimensions(const std::vector<uint8_t> &data) {
	if (data.size() < 30) {
		return std::nullopt;
	}
	std::string chunk(data.begin() + 12, data.begin() + 16);
	ImageDimensions dimensions;
	if (chunk == "VP8 ") {
		dimensions.width = ReadLittleEndian16(data, 26) & 0x3FFF;
		dimensions.height = ReadLittleEndian16(data, 28) & 0x3FFF;
	} else if (chunk == "VP8L") {
		dimensions.width = 1 + (((static_cast<uint32_t>(data[22]) & 0x3F) << 8) | data[21]);
		dimensions.height = 1 + (((static_cast<uint32_t>(data[24]) & 0x0F) << 10) |
		                         (static_cast<uint32_t>(data[23]) << 2) | ((data[22] & 0xC0) >> 6));
	} else if (chunk == "VP8X") {
		dimensions.width = 1 + ReadLittleEndian24(data, 24);
		dimensions.height = 1 + ReadLittleEndian24(data, 27);
	} else {
		return std::nullopt;
	}
	return dimensions;
}

// Value of a quoted attribute inside the first <svg ...> start tag
static std::string SvgAttribute(const std::string &tag, const std::string &name) {
	size_t pos = 0;
	while ((pos = tag.find(name, pos)) != std::string::npos) {
		bool boundary = pos == 0 || std::isspace(static_cast<unsigned char>(tag[pos - 1]));
		size_t eq = pos + name.size();
		if (boundary && eq + 1 < tag.size() && tag[eq] == '=' && (tag[eq + 1] == '"' || tag[eq + 1] == '\'')) {
			size_t end = tag.find(tag[eq + 1], eq + 2);
			if (end != std::string::npos) {
				return tag.substr(eq + 2, end - eq - 2);
			}
		}
		pos = eq;
	}
	return "";
}

static std::optional<ImageDimensions> SvgDimensions(const std::vector<uint8_t> &data) {
	std::string text(data.begin(), data.end());
	size_t start = text.find("<svg");
	if (start == std::string::npos) {
		return std::nullopt;
	}
	size_t end = text.find('>', start);
	std::string tag = text.substr(start, end == std::string::npos ? std::string::npos : end - start);

	double width = std::atof(SvgAttribute(tag, "width").c_str());
	double height = std::atof(SvgAttribute(tag, "height").c_str());
	if (width <= 0 || height <= 0) {
		// viewBox="min-x min-y width height"
		std::string view_box = TextUtil::NormalizeWhitespace(SvgAttribute(tag, "viewBox"));
		std::replace(view_box.begin(), view_box.end(), ',', ' ');
		double values[4] = {0, 0, 0, 0};
		const char *cursor = view_box.c_str();
		for (double &value : values) {
			char *next = nullptr;
			value = std::strtod(cursor, &next);
			if (next == cursor) {
				return std::nullopt;
			}
			cursor = next;
		}
		width = values[2];
		height = values[3];
	}
	// Also rejects NaN and anything a uint32_t cannot hold
	constexpr double max_dimension = std::numeric_limits<uint32_t>::max();
	if (!(width > 0 && width <= max_dimension) || !(height > 0 && height <= max_dimension)) {
		return std::nullopt;
	}
	ImageDimensions dimensions;
	dimensions.width = static_cast<uint32_t>(width);
	dimensions.height = static_cast<uint32_t>(height);
	return dimensions;
}

std::optional<ImageDimensions> InlineImageExtractor::InferDimensions(InlineImageFormat format,
                                                                      const std::vector<uint8_t> &data) {
	ImageDimensions dimensions;
	switch (format) {
	case InlineImageFormat::PNG:
		if (data.size() < 24) {
			return std::nullopt;
		}
		dimensions.width = ReadBigEndian32(data, 16);
		dimensions.height = ReadBigEndian32(data, 20);
		return dimensions;
	case InlineImageFormat::GIF:
		if (data.size() < 10) {
			return std::nullopt;
		}
		dimensions.width = ReadLittleEndian16(data, 6);
		dimensions.height = ReadLittleEndian16(data, 8);
		return dimensions;
	case InlineImageFormat::BMP:
		if (data.size() < 26) {
			return std::nullopt;
		}
		dimensions.width = Magnitude(ReadLittleEndian32(data, 18));
		// Negative height marks a top-down bitmap
		dimensions.height = Magnitude(ReadLittleEndian32(data, 22));
		return dimensions;
	case InlineImageFormat::JPEG:
		return JpegDimensions(data);
	case InlineImageFormat::WEBP:
		return WebpDimensions(data);
	case InlineImageFormat::SVG:
		return SvgDimensions(data);
	case InlineImageFormat::OTHER:
		return std::nullopt;
	}
	return std::nullopt;
}

} // namespace html_markdown

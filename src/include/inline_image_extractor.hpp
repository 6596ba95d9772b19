#pragma once

#include "metadata_collector.hpp"
#include "node_tree.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace html_markdown {

enum class InlineImageFormat : uint8_t { PNG, JPEG, GIF, BMP, WEBP, SVG, OTHER };
enum class InlineImageSource : uint8_t { IMG_DATA_URI, SVG_ELEMENT };

const char *InlineImageFormatToString(InlineImageFormat format);
const char *InlineImageSourceToString(InlineImageSource source);

struct InlineImage {
	std::vector<uint8_t> data;
	InlineImageFormat format = InlineImageFormat::OTHER;
	std::optional<std::string> filename;
	//! alt text for <img>, aria-label or <title> for <svg>
	std::optional<std::string> description;
	std::optional<ImageDimensions> dimensions;
	InlineImageSource source = InlineImageSource::IMG_DATA_URI;
	std::map<std::string, std::string> attributes;
};

struct InlineImageWarning {
	//! 0-based position of the candidate image in document order
	size_t index = 0;
	std::string message;
};

struct InlineImageConfig {
	uint64_t max_decoded_size_bytes = 5 * 1024 * 1024;
	std::optional<std::string> filename_prefix;
	bool capture_svg = true;
	bool infer_dimensions = false;
};

// Collects data-URI <img> payloads and inline <svg> markup seen during the
// render traversal. Failures become warnings; they never stop a conversion.
class InlineImageExtractor {
public:
	struct Checkpoint {
		size_t images;
		size_t warnings;
		size_t candidates;
	};

	explicit InlineImageExtractor(const InlineImageConfig &config);

	void Observe(const Node &node);
	void ObserveSubtree(const Node &node);

	Checkpoint Mark() const {
		return Checkpoint {images_.size(), warnings_.size(), candidates_};
	}
	void Rollback(const Checkpoint &checkpoint);

	std::vector<InlineImage> TakeImages() {
		return std::move(images_);
	}
	std::vector<InlineImageWarning> TakeWarnings() {
		return std::move(warnings_);
	}

	//! Whether the node is an extraction candidate under the current config
	bool IsCandidate(const Node &node) const;
	//! Extract one candidate; on failure returns nullopt and fills warning
	std::optional<InlineImage> Extract(const Node &node, size_t index, InlineImageWarning &warning) const;

	//! Standard base64 (padding optional, whitespace ignored). Returns false on malformed input.
	static bool DecodeBase64(const std::string &input, std::vector<uint8_t> &output);
	static InlineImageFormat SniffFormat(const std::vector<uint8_t> &data);
	//! Reads dimensions from the format header without decoding pixels
	static std::optional<ImageDimensions> InferDimensions(InlineImageFormat format, const std::vector<uint8_t> &data);

private:
	std::optional<InlineImage> ExtractDataUri(const Node &node, size_t index, InlineImageWarning &warning) const;
	std::optional<InlineImage> ExtractSvg(const Node &node, size_t index, InlineImageWarning &warning) const;
	std::string MakeFilename(InlineImageFormat format) const;

	InlineImageConfig config_;
	std::vector<InlineImage> images_;
	std::vector<InlineImageWarning> warnings_;
	size_t candidates_ = 0;
};

} // namespace html_markdown

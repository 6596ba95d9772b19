#pragma once

#include "node_tree.hpp"

#include <string>
#include <vector>

namespace html_markdown {

struct HocrBoundingBox {
	double x0 = 0;
	double y0 = 0;
	double x1 = 0;
	double y1 = 0;

	double Height() const {
		return y1 - y0;
	}
	double MidX() const {
		return (x0 + x1) / 2;
	}
};

//! A positioned piece of recognized text (ocrx_word or ocr_line)
struct HocrWord {
	std::string text;
	HocrBoundingBox bbox;
	double confidence = 100.0;
};

struct HocrTableConfig {
	//! Words below this x_wconf are ignored
	double min_confidence = 0.0;
	double row_overlap_ratio = 0.5;
	double min_column_gap = 50.0;
	//! A cell whose first word starts this close to its column start is aligned
	double column_alignment = 10.0;
};

//! Rows of cells, top to bottom and left to right
using CellGrid = std::vector<std::vector<std::string>>;

// Infers table geometry from hOCR bounding boxes and rewrites content areas
// that have no <table> markup into synthetic table nodes.
class SpatialTableReconstructor {
public:
	explicit SpatialTableReconstructor(const HocrTableConfig &config);

	//! ocr-system / ocr-capabilities meta tags or any ocr_* class
	static bool IsHocrDocument(const Node &root);
	//! Parses "bbox x0 y0 x1 y1; x_wconf 95". Returns false without a bbox.
	static bool ParseTitle(const std::string &title, HocrBoundingBox &bbox, double &confidence);
	//! Positioned text elements of a subtree: ocrx_word spans, or ocr_line when there are no words
	static std::vector<HocrWord> CollectWords(const Node &subtree);

	//! Row/column clustering. Empty when fewer than two columns are found. aligned_columns receives
	//! the number of columns whose cells start at the column edge in at least two rows.
	CellGrid BuildGrid(std::vector<HocrWord> words, size_t *aligned_columns = nullptr) const;
	static Node MakeTableNode(const CellGrid &grid, size_t source_offset);

	//! Synthetic table for one subtree; false unless two or more columns line up across rows
	bool Reconstruct(const Node &subtree, Node &table) const;
	//! Rewrites every candidate content area under root, returns the number of tables built
	size_t Apply(Node &root) const;

private:
	HocrTableConfig config_;
};

} // namespace html_markdown

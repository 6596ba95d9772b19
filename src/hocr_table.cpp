#include "hocr_table.hpp"
#include "text_util.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace html_markdown {

static const char *HOCR_CLASSES[] = {"ocr_page", "ocr_carea", "ocr_par", "ocr_line", "ocrx_word"};

SpatialTableReconstructor::SpatialTableReconstructor(const HocrTableConfig &config) : config_(config) {
}

static bool HasHocrMarkers(const Node &node) {
	if (node.IsText()) {
		return false;
	}
	if (node.type == NodeType::META) {
		std::string name = TextUtil::ToLower(node.GetAttribute("name"));
		if (name == "ocr-system" || name == "ocr-capabilities") {
			return true;
		}
	}
	for (const char *hocr_class : HOCR_CLASSES) {
		if (node.HasClass(hocr_class)) {
			return true;
		}
	}
	for (const auto &child : node.children) {
		if (HasHocrMarkers(child)) {
			return true;
		}
	}
	return false;
}

bool SpatialTableReconstructor::IsHocrDocument(const Node &root) {
	return HasHocrMarkers(root);
}

bool SpatialTableReconstructor::ParseTitle(const std::string &title, HocrBoundingBox &bbox, double &confidence) {
	bool found_bbox = false;
	size_t pos = 0;
	while (pos <= title.size()) {
		size_t end = title.find(';', pos);
		if (end == std::string::npos) {
			end = title.size();
		}
		std::istringstream property(TextUtil::Trim(title.substr(pos, end - pos)));
		std::string key;
		property >> key;
		if (key == "bbox") {
			double x0, y0, x1, y1;
			if (property >> x0 >> y0 >> x1 >> y1) {
				bbox.x0 = x0;
				bbox.y0 = y0;
				bbox.x1 = x1;
				bbox.y1 = y1;
				found_bbox = true;
			}
		} else if (key == "x_wconf") {
			double value;
			if (property >> value) {
				confidence = value;
			}
		}
		pos = end + 1;
	}
	return found_bbox;
}

static void CollectByClass(const Node &node, const char *class_name, std::vector<HocrWord> &words) {
	if (node.IsText()) {
		return;
	}
	if (node.HasClass(class_name)) {
		HocrWord word;
		if (SpatialTableReconstructor::ParseTitle(node.GetAttribute("title"), word.bbox, word.confidence)) {
			word.text = TextUtil::Trim(TextUtil::NormalizeWhitespace(node.TextContent()));
			if (!word.text.empty()) {
				words.push_back(std::move(word));
			}
		}
		return;
	}
	for (const auto &child : node.children) {
		CollectByClass(child, class_name, words);
	}
}

std::vector<HocrWord> SpatialTableReconstructor::CollectWords(const Node &subtree) {
	std::vector<HocrWord> words;
	CollectByClass(subtree, "ocrx_word", words);
	if (words.empty()) {
		CollectByClass(subtree, "ocr_line", words);
	}
	return words;
}

//===--------------------------------------------------------------------===//
// Clustering
//===--------------------------------------------------------------------===//

namespace {

struct RowGroup {
	double y0;
	double y1;
	std::vector<const HocrWord *> words;
};

struct ColumnRange {
	double start;
	double end;
};

} // namespace

CellGrid SpatialTableReconstructor::BuildGrid(std::vector<HocrWord> words, size_t *aligned_columns) const {
	CellGrid grid;
	if (aligned_columns) {
		*aligned_columns = 0;
	}
	words.erase(std::remove_if(words.begin(), words.end(),
	                           [&](const HocrWord &word) {
		                           return word.confidence < config_.min_confidence || word.text.empty();
	                           }),
	            words.end());
	if (words.empty()) {
		return grid;
	}

	std::stable_sort(words.begin(), words.end(), [](const HocrWord &a, const HocrWord &b) {
		if (a.bbox.y0 != b.bbox.y0) {
			return a.bbox.y0 < b.bbox.y0;
		}
		return a.bbox.x0 < b.bbox.x0;
	});

	// Rows: merge while the vertical overlap exceeds ratio * shorter height
	std::vector<RowGroup> rows;
	for (const auto &word : words) {
		if (!rows.empty()) {
			auto &row = rows.back();
			double overlap = std::min(row.y1, word.bbox.y1) - std::max(row.y0, word.bbox.y0);
			double shorter = std::min(row.y1 - row.y0, word.bbox.Height());
			if (overlap > 0 && overlap > config_.row_overlap_ratio * shorter) {
				row.y0 = std::min(row.y0, word.bbox.y0);
				row.y1 = std::max(row.y1, word.bbox.y1);
				row.words.push_back(&word);
				continue;
			}
		}
		rows.push_back(RowGroup {word.bbox.y0, word.bbox.y1, {&word}});
	}

	// Columns: gap-based split of all left edges
	std::vector<double> lefts;
	for (const auto &word : words) {
		lefts.push_back(word.bbox.x0);
	}
	std::sort(lefts.begin(), lefts.end());
	std::vector<ColumnRange> columns;
	for (double x : lefts) {
		if (columns.empty() || x - columns.back().end > config_.min_column_gap) {
			columns.push_back(ColumnRange {x, x});
		} else {
			columns.back().end = x;
		}
	}
	if (columns.size() < 2) {
		return grid;
	}

	auto column_of = [&](const HocrWord &word) -> size_t {
		size_t column = 0;
		for (size_t i = 0; i < columns.size(); i++) {
			if (word.bbox.x0 >= columns[i].start) {
				column = i;
			}
		}
		// Spanning into the next column: the midpoint decides
		if (column + 1 < columns.size() && word.bbox.x1 > columns[column + 1].start) {
			double mid = word.bbox.MidX();
			for (size_t i = column; i < columns.size(); i++) {
				if (mid >= columns[i].start) {
					column = i;
				}
			}
		}
		return column;
	};

	std::vector<size_t> aligned_rows(columns.size(), 0);
	for (auto &row : rows) {
		std::stable_sort(row.words.begin(), row.words.end(),
		                 [](const HocrWord *a, const HocrWord *b) { return a->bbox.x0 < b->bbox.x0; });
		std::vector<std::string> cells(columns.size());
		bool has_content = false;
		for (auto word : row.words) {
			auto column = column_of(*word);
			auto &cell = cells[column];
			if (cell.empty() && std::fabs(word->bbox.x0 - columns[column].start) <= config_.column_alignment) {
				aligned_rows[column]++;
			}
			if (!cell.empty()) {
				cell += ' ';
			}
			cell += word->text;
			has_content = true;
		}
		if (has_content) {
			grid.push_back(std::move(cells));
		}
	}
	if (aligned_columns) {
		*aligned_columns = std::count_if(aligned_rows.begin(), aligned_rows.end(), [](size_t n) { return n >= 2; });
	}
	return grid;
}

Node SpatialTableReconstructor::MakeTableNode(const CellGrid &grid, size_t source_offset) {
	Node table = MakeElement("table");
	table.source_offset = source_offset;
	for (const auto &row : grid) {
		Node tr = MakeElement("tr");
		tr.source_offset = source_offset;
		for (const auto &cell : row) {
			Node td = MakeElement("td");
			td.source_offset = source_offset;
			if (!cell.empty()) {
				td.children.push_back(MakeTextNode(cell));
			}
			tr.children.push_back(std::move(td));
		}
		table.children.push_back(std::move(tr));
	}
	return table;
}

bool SpatialTableReconstructor::Reconstruct(const Node &subtree, Node &table) const {
	size_t aligned_columns = 0;
	auto grid = BuildGrid(CollectWords(subtree), &aligned_columns);
	if (grid.empty()) {
		return false;
	}
	// Wrapped prose also splits into columns, but only its left margin lines up
	if (aligned_columns < 2) {
		PLOGD << "html_markdown: hOCR area at offset " << subtree.source_offset << " kept as text, "
		      << aligned_columns << " aligned columns";
		return false;
	}
	table = MakeTableNode(grid, subtree.source_offset);
	return true;
}

//===--------------------------------------------------------------------===//
// Tree rewriting
//===--------------------------------------------------------------------===//

static bool ContainsTable(const Node &node) {
	for (const auto &child : node.children) {
		if (child.type == NodeType::TABLE || ContainsTable(child)) {
			return true;
		}
	}
	return false;
}

static void FindCandidates(Node &node, const char *class_name, std::vector<Node *> &candidates) {
	if (node.IsText()) {
		return;
	}
	if (node.HasClass(class_name)) {
		candidates.push_back(&node);
		return;
	}
	for (auto &child : node.children) {
		FindCandidates(child, class_name, candidates);
	}
}

size_t SpatialTableReconstructor::Apply(Node &root) const {
	std::vector<Node *> candidates;
	FindCandidates(root, "ocr_carea", candidates);
	if (candidates.empty()) {
		FindCandidates(root, "ocr_page", candidates);
	}

	size_t tables = 0;
	for (auto candidate : candidates) {
		if (ContainsTable(*candidate)) {
			continue;
		}
		Node table;
		if (!Reconstruct(*candidate, table)) {
			continue;
		}
		PLOGD << "html_markdown: hOCR area at offset " << candidate->source_offset << " rebuilt as a "
		      << table.children.size() << "-row table";
		candidate->children.clear();
		candidate->children.push_back(std::move(table));
		tables++;
	}
	return tables;
}

} // namespace html_markdown

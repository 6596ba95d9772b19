#pragma once

#include "conversion_options.hpp"
#include "node_tree.hpp"

namespace html_markdown {

//! Removes boilerplate subtrees according to the preset. Returns the number of removed elements.
size_t ApplyPreprocessing(Node &root, const PreprocessingOptions &options);

//! Whether the preset would drop this element; inside_content is true below <main> or <article>
bool ShouldRemoveElement(const Node &node, const PreprocessingOptions &options, bool inside_content);

} // namespace html_markdown

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace netoverlay {

// Minimal scanning over KiCad s-expression text. A "block" is a view of a
// balanced "(head ...)" expression including both parentheses. Quoted
// strings are skipped so parentheses inside them do not count.

// Index of the ')' matching the '(' at open_pos, or npos if unbalanced
size_t find_block_end(std::string_view text, size_t open_pos);

// Head token of a block: "(wire (pts ..." -> "wire"
std::string_view block_head(std::string_view block);

// Direct children of block whose head equals head
std::vector<std::string_view> child_blocks(std::string_view block, std::string_view head);

// First direct child with the given head, or an empty view
std::string_view first_child(std::string_view block, std::string_view head);

// All blocks with the given head anywhere inside block (not nested in each other)
std::vector<std::string_view> descendant_blocks(std::string_view block, std::string_view head);

} // namespace netoverlay

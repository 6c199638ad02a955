#include "sexpr_scan.h"

namespace netoverlay {

// Index of the closing quote of the string opening at pos, or npos
static size_t skip_string(std::string_view text, size_t pos) {
    for (size_t i = pos + 1; i < text.size(); i++) {
        if (text[i] == '\\') {
            i++; // skip escaped char
        } else if (text[i] == '"') {
            return i;
        }
    }
    return std::string_view::npos;
}

static bool is_token_end(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '(' || c == ')';
}

size_t find_block_end(std::string_view text, size_t open_pos) {
    if (open_pos >= text.size() || text[open_pos] != '(') return std::string_view::npos;
    int depth = 0;
    for (size_t i = open_pos; i < text.size(); i++) {
        char c = text[i];
        if (c == '"') {
            i = skip_string(text, i);
            if (i == std::string_view::npos) return i;
        } else if (c == '(') {
            depth++;
        } else if (c == ')') {
            depth--;
            if (depth == 0) return i;
        }
    }
    return std::string_view::npos;
}

std::string_view block_head(std::string_view block) {
    if (block.empty() || block[0] != '(') return {};
    size_t start = 1;
    while (start < block.size() && (block[start] == ' ' || block[start] == '\t' ||
                                    block[start] == '\r' || block[start] == '\n')) {
        start++;
    }
    size_t end = start;
    while (end < block.size() && !is_token_end(block[end])) end++;
    return block.substr(start, end - start);
}

std::vector<std::string_view> child_blocks(std::string_view block, std::string_view head) {
    std::vector<std::string_view> out;
    if (block.size() < 2 || block[0] != '(') return out;

    // Scan the interior at depth 1 only; each '(' found here opens a child
    for (size_t i = 1; i < block.size(); i++) {
        char c = block[i];
        if (c == '"') {
            i = skip_string(block, i);
            if (i == std::string_view::npos) break;
        } else if (c == '(') {
            size_t end = find_block_end(block, i);
            if (end == std::string_view::npos) break; // truncated child
            std::string_view child = block.substr(i, end - i + 1);
            if (block_head(child) == head) out.push_back(child);
            i = end;
        } else if (c == ')') {
            break;
        }
    }
    return out;
}

std::string_view first_child(std::string_view block, std::string_view head) {
    auto children = child_blocks(block, head);
    return children.empty() ? std::string_view() : children.front();
}

std::vector<std::string_view> descendant_blocks(std::string_view block, std::string_view head) {
    std::vector<std::string_view> out;
    for (size_t i = 1; i < block.size(); i++) {
        char c = block[i];
        if (c == '"') {
            i = skip_string(block, i);
            if (i == std::string_view::npos) break;
        } else if (c == '(') {
            size_t end = find_block_end(block, i);
            if (end == std::string_view::npos) break;
            std::string_view candidate = block.substr(i, end - i + 1);
            if (block_head(candidate) == head) {
                out.push_back(candidate);
                i = end;
            }
            // otherwise keep scanning inside this block
        }
    }
    return out;
}

} // namespace netoverlay

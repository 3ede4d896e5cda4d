// Textual resolution of `// @platform "<tag>"` ... `// @platform end` regions.
#pragma once
#include "ppass/platform.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ppass {

inline constexpr std::string_view directive_start = "// @platform \"";
inline constexpr std::string_view directive_end = "// @platform end";

struct DirectiveBlock {
    std::string tag;
    std::size_t begin=0;        // offset of the start marker
    std::size_t end=0;          // one past the end marker
    std::size_t inner_begin=0;  // first byte after the start marker's closing quote
    std::size_t inner_end=0;    // offset of the end marker
};

// First-match, non-overlapping scan in source order. Blocks do not nest: the first end
// marker after a start marker closes it.
std::vector<DirectiveBlock> scan_blocks(std::string_view source);

// Offsets of start or end markers that are not part of any block.
std::vector<std::size_t> unmatched_markers(std::string_view source);

// Keeps the inner text of accepted blocks and replaces rejected blocks with their newlines.
// The line count of the result always equals the input's.
std::string resolve_blocks(std::string_view source, PlatformTarget target);

} // namespace ppass

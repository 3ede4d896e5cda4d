#pragma once
#include "ppass/syntax/ast.hpp"
#include <string>
#include <string_view>

namespace ppass::syntax {

// Regenerates source from a (possibly mutated) tree. Parsed nodes print their original bytes,
// with children spliced in; synthetic nodes are generated. A replacement keeps the line count
// of the text it replaced by emitting the missing newlines after itself (or inside `{}` for
// blocks and erased statements).
std::string generate(const node& root, std::string_view source);

} // namespace ppass::syntax

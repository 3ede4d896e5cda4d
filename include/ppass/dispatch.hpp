// Compile-time resolution of `NAMESPACE.runOn("<tag>", action)` calls.
#pragma once
#include "ppass/diagnostics.hpp"
#include "ppass/options.hpp"
#include "ppass/platform.hpp"
#include "ppass/syntax/ast.hpp"
#include <string>
#include <string_view>

namespace ppass {

enum class DispatchOutcome
{
    InlineInvoke, // runOn(tag, cb) -> cb()
    NeutralValue  // runOn(tag, cb) -> undefined
};

DispatchOutcome resolve_outcome(PlatformTarget target, std::string_view tag) noexcept;

// Cheap pre-check: "<ns>.runOn(" appears somewhere in the text.
bool has_dispatch_token(std::string_view source, std::string_view ns);

// Builds the node that takes the place of a matched call. `action` is the second argument.
syntax::node_ptr make_dispatch_replacement(DispatchOutcome outcome, const syntax::node_ptr& action);

// Matches `ns.runOn(<string literal>, <expr>, ...)` exactly and returns the tag, or nullptr.
const syntax::node* match_dispatch_call(const syntax::node& call, std::string_view ns);

struct DispatchStats {
    int inlined{0};
    int neutralized{0};
};

// Rewrites every matched call in the tree. Returns the counts.
DispatchStats rewrite_dispatch_calls(syntax::node_ptr& program, PlatformTarget target, std::string_view ns);

// Parse, rewrite and regenerate. On a parse failure reports W3101 and returns `source`.
std::string rewrite_dispatch(std::string_view source, PlatformTarget target,
                             const TransformOptions& options, Reporter& reporter);

} // namespace ppass

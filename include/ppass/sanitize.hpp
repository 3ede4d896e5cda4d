// Removal of server-only declarations from modules bound for client targets.
#pragma once
#include "ppass/diagnostics.hpp"
#include "ppass/options.hpp"
#include "ppass/syntax/ast.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace ppass {

inline constexpr std::array<std::string_view, 4> server_api_names{
    "createServerState", "createServerStates", "createServerAction", "createServerActions"};

enum class ServerDeclKind
{
    State,   // createServerState / createServerStates: whole declaration goes
    Action,  // createServerAction(key, config?, handler): handler becomes a no-op
    Actions  // createServerActions({ name: handler }): handler bodies emptied
};

struct ServerCall {
    ServerDeclKind kind;
    bool namespaced;       // api.server.createServerX(...) rather than api.createServerX(...)
    syntax::node* call;    // the CallExpression
};

// Pre-check for any of the server API names.
bool has_server_tokens(std::string_view source);

// Classifies a declarator initializer, looking through one `await`.
std::optional<ServerCall> classify_server_call(syntax::node& init);

struct SanitizeStats {
    int states_removed{0};
    int actions_redacted{0};
    int handlers_emptied{0};
    int namespaced{0};
};

// Applies all edits to the tree, in reverse source order.
SanitizeStats sanitize_program(syntax::node_ptr& program);

// Parse, sanitize and regenerate. Does nothing when server declarations are preserved.
// On a parse failure reports W3201 (E3201 in strict mode) and returns `source`.
std::string sanitize_server_boundary(std::string_view source, const TransformOptions& options, Reporter& reporter);

} // namespace ppass

// Lossless syntax tree for TypeScript/TSX modules.
//
// Nodes keep the byte range they were parsed from. Only the shapes the passes inspect get a
// dedicated kind; everything else is a generic Statement/Expression that still owns its
// sub-expressions, so traversal reaches every nested function, block and class body.
// Type annotations are never materialized: they live in the gaps between children and are
// printed verbatim.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ppass::syntax {

enum class node_kind : std::uint8_t
{
    Erased,            // removed statement, printed as its newlines
    Program,
    Block,
    ModuleBlock,       // namespace/module body
    CaseClause,
    ClassBody,
    StaticBlock,
    VariableStatement, // value = var/let/const/using
    VariableDeclarator,// [binding, init?]
    ExportDeclaration,
    FunctionDeclaration,
    ClassDeclaration,
    Statement,         // any other statement; value = leading keyword
    ExpressionStatement,
    ParameterList,
    Parameter,         // [binding, default?]
    Decorator,
    Identifier,
    PrivateName,
    StringLiteral,     // value = cooked string
    Literal,           // number, regex, ...
    TemplateLiteral,
    TaggedTemplate,
    ArrayLiteral,
    ObjectLiteral,
    Property,          // [key, value]
    ShorthandProperty, // [name, default?]
    Method,            // [key, ParameterList, Block]
    Spread,
    FunctionExpression,
    ArrowFunction,
    ClassExpression,
    ClassMember,
    CallExpression,    // [callee, args...]
    NewExpression,     // [callee, args...]
    MemberExpression,  // [object, property]
    AwaitExpression,   // [argument]
    Parenthesized,
    Expression,        // any other expression; value = operator or form
    JsxElement
};

const char* kind_name(node_kind k) noexcept;

struct source_range
{
    std::uint32_t begin = 0;
    std::uint32_t end = 0;
};

struct node;
using node_ptr = std::shared_ptr<node>;

struct node
{
    node_kind kind{node_kind::Expression};
    source_range range{};
    std::vector<node_ptr> children;
    std::string value;

    bool synthetic = false;        // built by a pass; printed from its fields rather than the source
    bool preserve_lines = false;   // pad the printed text with the newlines its range held
    bool is_async = false;
    bool computed = false;         // a[b], [key]: value
    bool optional = false;         // a?.b, a?.()
    bool for_head = false;         // declaration inside for(...)
    bool leading_semicolon = false;
    bool braces = false;           // Erased in a single-statement position prints as {}

    // Function-like nodes keep their body last.
    node_ptr& body() { return children.back(); }
};

// Builders for synthetic nodes.
node_ptr make_identifier(std::string name);
node_ptr make_call(node_ptr callee);
node_ptr make_parenthesized(node_ptr inner);
node_ptr make_empty_block();
node_ptr make_async_noop();
node_ptr make_erased(bool braces);

// Puts `replacement` into `slot`, taking over the old node's range so the printer keeps the
// line count of the replaced text.
void replace(node_ptr& slot, node_ptr replacement);

// Cooked value of a quoted string literal (without the quotes).
std::string unescape_string(std::string_view quoted);

std::size_t count_newlines(std::string_view text) noexcept;

// Innermost expression under any number of `( ... )` wrappers.
node& unwrap_parens(node& n) noexcept;
const node& unwrap_parens(const node& n) noexcept;

} // namespace ppass::syntax

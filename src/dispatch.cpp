#include "ppass/dispatch.hpp"
#include "ppass/syntax/parser.hpp"
#include "ppass/syntax/printer.hpp"
#include "ppass/syntax/traverse.hpp"
#include <unordered_set>

namespace ppass {

using syntax::node;
using syntax::node_kind;
using syntax::node_ptr;

DispatchOutcome resolve_outcome(PlatformTarget target, std::string_view tag) noexcept {
    return accepts(target, tag) ? DispatchOutcome::InlineInvoke : DispatchOutcome::NeutralValue;
}

bool has_dispatch_token(std::string_view source, std::string_view ns){
    std::string needle(ns);
    needle += ".runOn(";
    return source.find(needle) != std::string_view::npos;
}

// `a?.b` as a callee would short-circuit; `(a?.b)()` throws like the unresolved call did.
static bool in_optional_chain(const node& n){
    const node* p = &n;
    while(p->kind == node_kind::MemberExpression || p->kind == node_kind::CallExpression){
        if(p->optional) return true;
        p = p->children.front().get();
    }
    return false;
}

static bool callee_needs_parens(const node& n){
    switch(n.kind){
        case node_kind::Identifier:
        case node_kind::Parenthesized:
            return false;
        case node_kind::MemberExpression:
        case node_kind::CallExpression:
            return in_optional_chain(n);
        default:
            return true;
    }
}

// Text that could continue the previous line when a statement begins with it.
static bool starts_with_asi_hazard(const node& n){
    switch(n.kind){
        case node_kind::Parenthesized:
        case node_kind::ArrayLiteral:
        case node_kind::TemplateLiteral:
            return true;
        case node_kind::CallExpression:
        case node_kind::MemberExpression:
        case node_kind::TaggedTemplate:
            return starts_with_asi_hazard(*n.children.front());
        default:
            return false;
    }
}

node_ptr make_dispatch_replacement(DispatchOutcome outcome, const node_ptr& action){
    if(outcome == DispatchOutcome::NeutralValue) return syntax::make_identifier("undefined");
    node_ptr callee = action;
    if(callee_needs_parens(*action)) callee = syntax::make_parenthesized(action);
    return syntax::make_call(std::move(callee));
}

const node* match_dispatch_call(const node& call, std::string_view ns){
    if(call.kind != node_kind::CallExpression || call.optional || call.children.size() < 3) return nullptr;
    const node& callee = syntax::unwrap_parens(*call.children[0]);
    if(callee.kind != node_kind::MemberExpression || callee.computed || callee.optional) return nullptr;
    const node& object = syntax::unwrap_parens(*callee.children[0]);
    const node& property = *callee.children[1];
    if(object.kind != node_kind::Identifier || object.value != ns) return nullptr;
    if(property.kind != node_kind::Identifier || property.value != "runOn") return nullptr;
    const node& tag = syntax::unwrap_parens(*call.children[1]);
    if(tag.kind != node_kind::StringLiteral) return nullptr;
    if(call.children[2]->kind == node_kind::Spread) return nullptr;
    return &tag;
}

DispatchStats rewrite_dispatch_calls(node_ptr& program, PlatformTarget target, std::string_view ns){
    DispatchStats stats;

    std::unordered_set<std::uint32_t> statement_starts;
    syntax::Transformer scan;
    scan.add_visitor(node_kind::ExpressionStatement, [&](node_ptr& slot, node*){
        statement_starts.insert(slot->range.begin);
    });
    scan.traverse(program);

    syntax::Transformer rewrite;
    rewrite.add_visitor(node_kind::CallExpression, [&](node_ptr& slot, node*){
        if(slot->synthetic) return;
        const node* tag = match_dispatch_call(*slot, ns);
        if(!tag) return;
        auto outcome = resolve_outcome(target, tag->value);
        if(outcome == DispatchOutcome::InlineInvoke) ++stats.inlined;
        else ++stats.neutralized;

        bool starts_statement = statement_starts.count(slot->range.begin) > 0;
        auto replacement = make_dispatch_replacement(outcome, slot->children[2]);
        replacement->leading_semicolon = starts_statement && starts_with_asi_hazard(*replacement);
        syntax::replace(slot, std::move(replacement));
    });
    rewrite.traverse(program);
    return stats;
}

std::string rewrite_dispatch(std::string_view source, PlatformTarget target,
                             const TransformOptions& options, Reporter& reporter){
    if(!has_dispatch_token(source, options.dispatch_namespace)) return std::string(source);

    // An unresolved runOn() keeps every branch, server callbacks included.
    const bool fail_closed = options.strict && is_client_target(target);
    Diagnostic d;
    d.code = std::string(fail_closed ? "E" : "W") + codes::dispatch_parse;
    d.path = options.path;
    d.hint = fail_closed ? "fix the syntax error; server-side runOn() callbacks would reach the client bundle"
                         : "runOn() calls in this module are left unresolved";
    try {
        syntax::Parser parser(options.language == SourceLanguage::Tsx);
        auto program = parser.parse(source);
        auto stats = rewrite_dispatch_calls(program, target, options.dispatch_namespace);
        reporter.debug(options.path, "runOn: " + std::to_string(stats.inlined) + " inlined, " +
                                     std::to_string(stats.neutralized) + " neutralized for " +
                                     std::string(target_name(target)));
        if(stats.inlined + stats.neutralized == 0) return std::string(source);
        return syntax::generate(*program, source);
    } catch(const syntax::syntax_error& e) {
        d.message = std::string("runOn rewrite skipped: ") + e.what();
        d.line = e.line;
        d.col = e.col;
    } catch(const std::exception& e) {
        d.message = std::string("runOn rewrite skipped: internal error: ") + e.what();
    }
    if(fail_closed) reporter.emit_error(d);
    else reporter.emit_warning(d);
    return std::string(source);
}

} // namespace ppass

#include "ppass/sanitize.hpp"
#include "ppass/syntax/parser.hpp"
#include "ppass/syntax/printer.hpp"
#include "ppass/syntax/traverse.hpp"
#include <algorithm>
#include <vector>

namespace ppass {

using syntax::node;
using syntax::node_kind;
using syntax::node_ptr;

bool has_server_tokens(std::string_view source){
    return source.find("createServerState") != std::string_view::npos ||
           source.find("createServerAction") != std::string_view::npos;
}

std::optional<ServerCall> classify_server_call(node& init){
    node* expr = &syntax::unwrap_parens(init);
    if(expr->kind == node_kind::AwaitExpression && !expr->children.empty())
        expr = &syntax::unwrap_parens(*expr->children.front());
    if(expr->kind != node_kind::CallExpression || expr->optional || expr->synthetic) return std::nullopt;
    node& callee = *expr->children.front();
    if(callee.kind != node_kind::MemberExpression || callee.computed || callee.optional) return std::nullopt;
    const node& method = *callee.children[1];
    if(method.kind != node_kind::Identifier) return std::nullopt;

    ServerDeclKind kind;
    if(method.value == "createServerState" || method.value == "createServerStates") kind = ServerDeclKind::State;
    else if(method.value == "createServerAction") kind = ServerDeclKind::Action;
    else if(method.value == "createServerActions") kind = ServerDeclKind::Actions;
    else return std::nullopt;

    const node& object = syntax::unwrap_parens(*callee.children[0]);
    bool namespaced = object.kind == node_kind::MemberExpression && !object.computed &&
                      object.children[1]->kind == node_kind::Identifier && object.children[1]->value == "server";
    return ServerCall{kind, namespaced, expr};
}

static bool is_statement_list(const node* parent){
    if(!parent) return true;
    switch(parent->kind){
        case node_kind::Program:
        case node_kind::Block:
        case node_kind::ModuleBlock:
        case node_kind::CaseClause:
        case node_kind::StaticBlock:
            return true;
        default:
            return false;
    }
}

static bool declares_state(node& stmt){
    for(auto& decl : stmt.children){
        if(decl->kind != node_kind::VariableDeclarator || decl->children.size() < 2) continue;
        auto c = classify_server_call(*decl->children[1]);
        if(c && c->kind == ServerDeclKind::State) return true;
    }
    return false;
}

namespace {

struct pending_edit {
    std::uint32_t begin;
    node_ptr* slot;
    node_ptr replacement;
};

} // namespace

SanitizeStats sanitize_program(node_ptr& program){
    SanitizeStats stats;
    std::vector<pending_edit> edits;

    auto redact_actions = [&](node& stmt){
        for(auto& decl : stmt.children){
            if(decl->kind != node_kind::VariableDeclarator || decl->children.size() < 2) continue;
            auto c = classify_server_call(*decl->children[1]);
            if(!c) continue;
            if(c->namespaced) ++stats.namespaced;
            node& call = *c->call;
            if(c->kind == ServerDeclKind::Action){
                if(call.children.size() < 3) continue; // callee, key, handler
                node_ptr& handler = call.children.back();
                if(handler->kind == node_kind::Spread) continue;
                edits.push_back({handler->range.begin, &handler, syntax::make_async_noop()});
                ++stats.actions_redacted;
            } else if(c->kind == ServerDeclKind::Actions){
                if(call.children.size() < 2) continue;
                node& map = syntax::unwrap_parens(*call.children[1]);
                if(map.kind != node_kind::ObjectLiteral) continue;
                for(auto& member : map.children){
                    node_ptr* body = nullptr;
                    if(member->kind == node_kind::Property){
                        node& value = syntax::unwrap_parens(*member->children.back());
                        if(value.kind == node_kind::ArrowFunction || value.kind == node_kind::FunctionExpression)
                            body = &value.body();
                    } else if(member->kind == node_kind::Method) {
                        body = &member->body();
                    }
                    if(!body) continue;
                    edits.push_back({(*body)->range.begin, body, syntax::make_empty_block()});
                    ++stats.handlers_emptied;
                }
            }
        }
    };

    syntax::Transformer t;
    t.add_visitor(node_kind::ExportDeclaration, [&](node_ptr& slot, node* parent){
        for(auto& c : slot->children){
            if(c && c->kind == node_kind::VariableStatement && declares_state(*c)){
                edits.push_back({slot->range.begin, &slot, syntax::make_erased(!is_statement_list(parent))});
                ++stats.states_removed;
                return;
            }
        }
    });
    t.add_visitor(node_kind::VariableStatement, [&](node_ptr& slot, node* parent){
        node& stmt = *slot;
        if(!declares_state(stmt)){
            redact_actions(stmt);
            return;
        }
        if(parent && parent->kind == node_kind::ExportDeclaration) return; // erased with the export
        if(stmt.for_head){
            // for-in/of heads carry no initializer
            if(!parent || parent->value != "for") return;
            edits.push_back({stmt.range.begin, &slot, syntax::make_erased(false)});
        } else {
            edits.push_back({stmt.range.begin, &slot, syntax::make_erased(!is_statement_list(parent))});
        }
        ++stats.states_removed;
    });
    t.traverse(program);

    std::stable_sort(edits.begin(), edits.end(), [](const pending_edit& a, const pending_edit& b){
        return a.begin > b.begin;
    });
    // Replaced subtrees may still own slots of later edits.
    std::vector<node_ptr> detached;
    detached.reserve(edits.size());
    for(auto& e : edits){
        detached.push_back(*e.slot);
        syntax::replace(*e.slot, std::move(e.replacement));
    }
    return stats;
}

std::string sanitize_server_boundary(std::string_view source, const TransformOptions& options, Reporter& reporter){
    if(options.preserve_server_declarations || !has_server_tokens(source)) return std::string(source);

    Diagnostic d;
    d.code = std::string(options.strict ? "E" : "W") + codes::sanitize_parse;
    d.path = options.path;
    d.hint = options.strict ? "fix the syntax error; the module was not sanitized"
                            : "server-only declarations in this module were not removed";
    try {
        syntax::Parser parser(options.language == SourceLanguage::Tsx);
        auto program = parser.parse(source);
        auto stats = sanitize_program(program);
        reporter.debug(options.path, "server boundary: " + std::to_string(stats.states_removed) + " states removed, " +
                                     std::to_string(stats.actions_redacted) + " actions redacted, " +
                                     std::to_string(stats.handlers_emptied) + " handlers emptied (" +
                                     std::to_string(stats.namespaced) + " via .server)");
        if(stats.states_removed + stats.actions_redacted + stats.handlers_emptied == 0) return std::string(source);
        return syntax::generate(*program, source);
    } catch(const syntax::syntax_error& e) {
        d.message = std::string("server boundary sanitizer skipped: ") + e.what();
        d.line = e.line;
        d.col = e.col;
    } catch(const std::exception& e) {
        d.message = std::string("server boundary sanitizer skipped: internal error: ") + e.what();
    }
    if(options.strict) reporter.emit_error(d);
    else reporter.emit_warning(d);
    return std::string(source);
}

} // namespace ppass

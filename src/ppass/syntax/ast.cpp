#include "ppass/syntax/ast.hpp"
#include <algorithm>

namespace ppass::syntax {

const char* kind_name(node_kind k) noexcept {
    switch(k){
        case node_kind::Erased: return "Erased";
        case node_kind::Program: return "Program";
        case node_kind::Block: return "Block";
        case node_kind::ModuleBlock: return "ModuleBlock";
        case node_kind::CaseClause: return "CaseClause";
        case node_kind::ClassBody: return "ClassBody";
        case node_kind::StaticBlock: return "StaticBlock";
        case node_kind::VariableStatement: return "VariableStatement";
        case node_kind::VariableDeclarator: return "VariableDeclarator";
        case node_kind::ExportDeclaration: return "ExportDeclaration";
        case node_kind::FunctionDeclaration: return "FunctionDeclaration";
        case node_kind::ClassDeclaration: return "ClassDeclaration";
        case node_kind::Statement: return "Statement";
        case node_kind::ExpressionStatement: return "ExpressionStatement";
        case node_kind::ParameterList: return "ParameterList";
        case node_kind::Parameter: return "Parameter";
        case node_kind::Decorator: return "Decorator";
        case node_kind::Identifier: return "Identifier";
        case node_kind::PrivateName: return "PrivateName";
        case node_kind::StringLiteral: return "StringLiteral";
        case node_kind::Literal: return "Literal";
        case node_kind::TemplateLiteral: return "TemplateLiteral";
        case node_kind::TaggedTemplate: return "TaggedTemplate";
        case node_kind::ArrayLiteral: return "ArrayLiteral";
        case node_kind::ObjectLiteral: return "ObjectLiteral";
        case node_kind::Property: return "Property";
        case node_kind::ShorthandProperty: return "ShorthandProperty";
        case node_kind::Method: return "Method";
        case node_kind::Spread: return "Spread";
        case node_kind::FunctionExpression: return "FunctionExpression";
        case node_kind::ArrowFunction: return "ArrowFunction";
        case node_kind::ClassExpression: return "ClassExpression";
        case node_kind::ClassMember: return "ClassMember";
        case node_kind::CallExpression: return "CallExpression";
        case node_kind::NewExpression: return "NewExpression";
        case node_kind::MemberExpression: return "MemberExpression";
        case node_kind::AwaitExpression: return "AwaitExpression";
        case node_kind::Parenthesized: return "Parenthesized";
        case node_kind::Expression: return "Expression";
        case node_kind::JsxElement: return "JsxElement";
    }
    return "?";
}

static node_ptr make_synthetic(node_kind k){
    auto n = std::make_shared<node>();
    n->kind = k;
    n->synthetic = true;
    return n;
}

node_ptr make_identifier(std::string name){
    auto n = make_synthetic(node_kind::Identifier);
    n->value = std::move(name);
    return n;
}

node_ptr make_call(node_ptr callee){
    auto n = make_synthetic(node_kind::CallExpression);
    n->children.push_back(std::move(callee));
    return n;
}

node_ptr make_parenthesized(node_ptr inner){
    auto n = make_synthetic(node_kind::Parenthesized);
    n->children.push_back(std::move(inner));
    return n;
}

node_ptr make_empty_block(){
    return make_synthetic(node_kind::Block);
}

node_ptr make_async_noop(){
    auto n = make_synthetic(node_kind::ArrowFunction);
    n->is_async = true;
    n->children.push_back(make_synthetic(node_kind::ParameterList));
    n->children.push_back(make_empty_block());
    return n;
}

node_ptr make_erased(bool braces){
    auto n = make_synthetic(node_kind::Erased);
    n->braces = braces;
    return n;
}

void replace(node_ptr& slot, node_ptr replacement){
    if(slot){
        replacement->range = slot->range;
        replacement->preserve_lines = true;
    }
    slot = std::move(replacement);
}

static void append_utf8(std::string& out, std::uint32_t cp){
    if(cp < 0x80){ out.push_back(static_cast<char>(cp)); }
    else if(cp < 0x800){
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if(cp < 0x10000){
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

static int hex_value(char c){
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string unescape_string(std::string_view quoted){
    std::string out;
    if(quoted.size() < 2) return out;
    std::string_view s = quoted.substr(1, quoted.size() - 2);
    out.reserve(s.size());
    for(std::size_t i = 0; i < s.size(); ++i){
        char c = s[i];
        if(c != '\\' || i + 1 >= s.size()){ out.push_back(c); continue; }
        char e = s[++i];
        switch(e){
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'v': out.push_back('\v'); break;
            case '0': out.push_back('\0'); break;
            case '\r': if(i + 1 < s.size() && s[i+1] == '\n') ++i; break; // line continuation
            case '\n': break;
            case 'x': {
                int hi = i + 2 < s.size() ? hex_value(s[i+1]) : -1;
                int lo = i + 2 < s.size() ? hex_value(s[i+2]) : -1;
                if(hi < 0 || lo < 0){ out.push_back('x'); break; }
                append_utf8(out, static_cast<std::uint32_t>(hi * 16 + lo));
                i += 2;
                break;
            }
            case 'u': {
                std::uint32_t cp = 0;
                if(i + 1 < s.size() && s[i+1] == '{'){
                    std::size_t j = i + 2;
                    while(j < s.size() && s[j] != '}' && hex_value(s[j]) >= 0){ cp = cp * 16 + hex_value(s[j]); ++j; }
                    i = j;
                } else {
                    std::size_t j = i + 1;
                    for(; j < s.size() && j < i + 5 && hex_value(s[j]) >= 0; ++j) cp = cp * 16 + hex_value(s[j]);
                    i = j - 1;
                }
                append_utf8(out, cp);
                break;
            }
            default: out.push_back(e); break;
        }
    }
    return out;
}

std::size_t count_newlines(std::string_view text) noexcept {
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
}

node& unwrap_parens(node& n) noexcept {
    node* p = &n;
    while(p->kind == node_kind::Parenthesized && !p->children.empty()) p = p->children.front().get();
    return *p;
}

const node& unwrap_parens(const node& n) noexcept {
    const node* p = &n;
    while(p->kind == node_kind::Parenthesized && !p->children.empty()) p = p->children.front().get();
    return *p;
}

} // namespace ppass::syntax

#include "ppass/syntax/parser.hpp"
#include "parser_impl.hpp"

namespace ppass::syntax {

node_ptr Parser::parse(std::string_view src) const {
    try {
        ParserImpl impl(src, jsx_);
        return impl.parse_program();
    } catch(syntax_error& e) {
        e.locate(src);
        throw;
    }
}

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    ParseResult r;
    try {
        r.program = parse(src);
        r.success = true;
    } catch(const syntax_error& e) {
        r.error_message = std::string(filename) + ":" + std::to_string(e.line) + ":" + std::to_string(e.col) + ": " + e.what();
        r.line = e.line;
        r.column = e.col;
    }
    return r;
}

// ---------------------------------------------------------------------------
// token helpers

ParserImpl::ParserImpl(std::string_view src, bool jsx) : lex_(src), jsx_(jsx) {
    tok_ = lex_.scan(0);
}

void ParserImpl::next(){
    prev_end_ = tok_.end;
    tok_ = lex_.scan(tok_.end);
}

bool ParserImpl::eat(std::string_view p){
    if(!is_punct(p)) return false;
    next();
    return true;
}

void ParserImpl::expect(std::string_view p){
    if(eat(p)) return;
    lex_.fail("'" + std::string(p) + "' expected", tok_.begin);
}

void ParserImpl::unexpected() const {
    if(tok_.kind == token_kind::Eof) lex_.fail("unexpected end of input", tok_.begin);
    lex_.fail("unexpected token '" + std::string(text()) + "'", tok_.begin);
}

// Automatic semicolon insertion: a missing ';' is fine before '}', at the end of input, or
// when the next token starts a new line.
void ParserImpl::consume_semicolon(){
    if(eat(";")) return;
    if(is_punct("}") || tok_.kind == token_kind::Eof || tok_.newline_before) return;
    lex_.fail("';' expected", tok_.begin);
}

node_ptr ParserImpl::open(node_kind k, std::uint32_t begin, std::string value) const {
    auto n = std::make_shared<node>();
    n->kind = k;
    n->range.begin = begin;
    n->value = std::move(value);
    return n;
}

node_ptr ParserImpl::close(node_ptr n) const {
    n->range.end = prev_end_;
    return n;
}

// ---------------------------------------------------------------------------
// statements

node_ptr ParserImpl::parse_program(){
    auto prog = open(node_kind::Program, 0);
    while(tok_.kind != token_kind::Eof)
        prog->children.push_back(parse_statement_list_item());
    prog->range.end = static_cast<std::uint32_t>(lex_.source().size());
    return prog;
}

node_ptr ParserImpl::parse_statement_list_item(){
    std::uint32_t begin = tok_.begin;
    if(is_punct("@")){
        auto decorators = parse_decorators();
        if(is_ident("export")) return parse_export_declaration(begin, std::move(decorators));
        if(is_ident("abstract")) next();
        if(!is_ident("class")) unexpected();
        return parse_class(begin, node_kind::ClassDeclaration, std::move(decorators));
    }
    if(is_ident("import")){
        token p = peek();
        if(!is_punct(p, "(") && !is_punct(p, ".")) return parse_import_declaration(begin);
    }
    if(is_ident("export")) return parse_export_declaration(begin, {});
    return parse_statement();
}

void ParserImpl::parse_statements_until_brace(node& parent){
    while(!is_punct("}")){
        if(tok_.kind == token_kind::Eof) unexpected();
        parent.children.push_back(parse_statement_list_item());
    }
}

node_ptr ParserImpl::parse_block(node_kind kind){
    auto n = open(kind, tok_.begin);
    expect("{");
    InScope in(allow_in_, true);
    parse_statements_until_brace(*n);
    expect("}");
    return close(n);
}

bool ParserImpl::at_variable_start() const {
    if(is_ident("var") || is_ident("const")) return true;
    if(is_ident("let")){
        token p = peek();
        return p.kind == token_kind::Identifier || is_punct(p, "[") || is_punct(p, "{");
    }
    if(is_ident("using")){
        token p = peek();
        return p.kind == token_kind::Identifier && !p.newline_before && !is_ident(p, "in") && !is_ident(p, "of");
    }
    return false;
}

// TypeScript-only declarations introduced by a contextual keyword.
bool ParserImpl::at_declaration_start() const {
    if(!is_ident()) return false;
    token p = peek();
    if(p.newline_before) return false;
    auto kw = text();
    if(kw == "interface" || kw == "type" || kw == "enum")
        return p.kind == token_kind::Identifier;
    if(kw == "namespace")
        return p.kind == token_kind::Identifier;
    if(kw == "module")
        return p.kind == token_kind::Identifier || p.kind == token_kind::String;
    if(kw == "global")
        return is_punct(p, "{");
    if(kw == "declare")
        return p.kind == token_kind::Identifier;
    return false;
}

node_ptr ParserImpl::parse_statement(){
    std::uint32_t begin = tok_.begin;
    if(is_punct("{")) return parse_block();
    if(is_punct(";")){
        next();
        return close(open(node_kind::Statement, begin, "empty"));
    }

    if(is_ident()){
        if(is_ident("const") && is_ident(peek(), "enum")){
            next();
            return parse_enum(begin);
        }
        if(at_variable_start()) return parse_variable_statement(begin, false);
        if(is_ident("function")) return parse_function(begin, node_kind::FunctionDeclaration, false);
        if(is_ident("async")){
            token p = peek();
            if(is_ident(p, "function") && !p.newline_before){
                next();
                return parse_function(begin, node_kind::FunctionDeclaration, true);
            }
        }
        if(is_ident("class")) return parse_class(begin, node_kind::ClassDeclaration, {});
        if(is_ident("abstract") && is_ident(peek(), "class")){
            next();
            return parse_class(begin, node_kind::ClassDeclaration, {});
        }
        if(is_ident("if")) return parse_if_statement();
        if(is_ident("for")) return parse_for_statement();
        if(is_ident("switch")) return parse_switch_statement();
        if(is_ident("try")) return parse_try_statement();
        if(is_ident("while")){
            auto n = open(node_kind::Statement, begin, "while");
            next();
            expect("(");
            {
                InScope in(allow_in_, true);
                n->children.push_back(parse_expression());
            }
            expect(")");
            n->children.push_back(parse_statement());
            return close(n);
        }
        if(is_ident("do")){
            auto n = open(node_kind::Statement, begin, "do");
            next();
            n->children.push_back(parse_statement());
            if(!is_ident("while")) unexpected();
            next();
            expect("(");
            {
                InScope in(allow_in_, true);
                n->children.push_back(parse_expression());
            }
            expect(")");
            eat(";");
            return close(n);
        }
        if(is_ident("with")){
            auto n = open(node_kind::Statement, begin, "with");
            next();
            expect("(");
            {
                InScope in(allow_in_, true);
                n->children.push_back(parse_expression());
            }
            expect(")");
            n->children.push_back(parse_statement());
            return close(n);
        }
        if(is_ident("return") || is_ident("throw")){
            auto n = open(node_kind::Statement, begin, std::string(text()));
            bool is_throw = is_ident("throw");
            next();
            if(is_throw || (!is_punct(";") && !is_punct("}") && tok_.kind != token_kind::Eof && !tok_.newline_before)){
                InScope in(allow_in_, true);
                n->children.push_back(parse_expression());
            }
            consume_semicolon();
            return close(n);
        }
        if(is_ident("break") || is_ident("continue")){
            auto n = open(node_kind::Statement, begin, std::string(text()));
            next();
            if(is_ident() && !tok_.newline_before) next();
            consume_semicolon();
            return close(n);
        }
        if(is_ident("debugger")){
            auto n = open(node_kind::Statement, begin, "debugger");
            next();
            consume_semicolon();
            return close(n);
        }
        if(at_declaration_start()){
            auto kw = text();
            if(kw == "interface" || kw == "type") return parse_ts_declaration(begin);
            if(kw == "enum") return parse_enum(begin);
            if(kw == "declare"){
                auto n = open(node_kind::Statement, begin, "declare");
                next();
                n->children.push_back(parse_statement());
                return close(n);
            }
            return parse_namespace(begin);
        }
        if(is_punct(peek(), ":")){
            auto n = open(node_kind::Statement, begin, "label");
            next();
            next();
            n->children.push_back(parse_statement());
            return close(n);
        }
    }

    auto n = open(node_kind::ExpressionStatement, begin);
    {
        InScope in(allow_in_, true);
        n->children.push_back(parse_expression());
    }
    consume_semicolon();
    return close(n);
}

node_ptr ParserImpl::parse_variable_statement(std::uint32_t begin, bool for_head){
    auto n = open(node_kind::VariableStatement, begin, std::string(text()));
    n->for_head = for_head;
    next();
    do {
        n->children.push_back(parse_variable_declarator());
    } while(eat(","));
    if(!for_head) consume_semicolon();
    return close(n);
}

node_ptr ParserImpl::parse_variable_declarator(){
    auto d = open(node_kind::VariableDeclarator, tok_.begin);
    d->children.push_back(parse_binding_target());
    eat("!");
    skip_type_annotation();
    if(eat("=")) d->children.push_back(parse_assignment());
    return close(d);
}

node_ptr ParserImpl::parse_binding_target(){
    if(is_ident()) return parse_identifier();
    if(is_punct("[")) return parse_array_literal();
    if(is_punct("{")) return parse_object_literal();
    unexpected();
}

node_ptr ParserImpl::parse_if_statement(){
    auto n = open(node_kind::Statement, tok_.begin, "if");
    next();
    expect("(");
    {
        InScope in(allow_in_, true);
        n->children.push_back(parse_expression());
    }
    expect(")");
    n->children.push_back(parse_statement());
    if(is_ident("else")){
        next();
        n->children.push_back(parse_statement());
    }
    return close(n);
}

// value: "for", "for-in" or "for-of"
node_ptr ParserImpl::parse_for_statement(){
    auto n = open(node_kind::Statement, tok_.begin, "for");
    next();
    if(is_ident("await")) next();
    expect("(");
    {
        InScope in(allow_in_, false);
        if(is_punct(";")){
        } else if(at_variable_start()){
            n->children.push_back(parse_variable_statement(tok_.begin, true));
        } else {
            n->children.push_back(parse_expression());
        }
    }
    if(is_ident("of") || is_ident("in")){
        bool of = is_ident("of");
        n->value = of ? "for-of" : "for-in";
        next();
        InScope in(allow_in_, true);
        n->children.push_back(of ? parse_assignment() : parse_expression());
    } else {
        InScope in(allow_in_, true);
        expect(";");
        if(!is_punct(";")) n->children.push_back(parse_expression());
        expect(";");
        if(!is_punct(")")) n->children.push_back(parse_expression());
    }
    expect(")");
    n->children.push_back(parse_statement());
    return close(n);
}

node_ptr ParserImpl::parse_switch_statement(){
    auto n = open(node_kind::Statement, tok_.begin, "switch");
    next();
    expect("(");
    InScope in(allow_in_, true);
    n->children.push_back(parse_expression());
    expect(")");
    expect("{");
    while(!is_punct("}")){
        auto c = open(node_kind::CaseClause, tok_.begin);
        if(is_ident("case")){
            next();
            c->children.push_back(parse_expression());
        } else if(is_ident("default")){
            next();
        } else {
            unexpected();
        }
        expect(":");
        while(!is_punct("}") && !is_ident("case") && !is_ident("default")){
            if(tok_.kind == token_kind::Eof) unexpected();
            c->children.push_back(parse_statement_list_item());
        }
        n->children.push_back(close(c));
    }
    expect("}");
    return close(n);
}

node_ptr ParserImpl::parse_try_statement(){
    auto n = open(node_kind::Statement, tok_.begin, "try");
    next();
    n->children.push_back(parse_block());
    if(is_ident("catch")){
        next();
        if(eat("(")){
            n->children.push_back(parse_binding_target());
            skip_type_annotation();
            expect(")");
        }
        n->children.push_back(parse_block());
    }
    if(is_ident("finally")){
        next();
        n->children.push_back(parse_block());
    }
    return close(n);
}

std::vector<node_ptr> ParserImpl::parse_decorators(){
    std::vector<node_ptr> out;
    while(is_punct("@")){
        auto d = open(node_kind::Decorator, tok_.begin);
        next();
        std::uint32_t begin = tok_.begin;
        d->children.push_back(parse_suffixes(begin, parse_primary(), true));
        out.push_back(close(d));
    }
    return out;
}

node_ptr ParserImpl::parse_function(std::uint32_t begin, node_kind kind, bool is_async){
    auto n = open(kind, begin);
    n->is_async = is_async;
    next(); // function
    eat("*");
    if(is_ident()) n->children.push_back(parse_identifier());
    if(is_punct("<")) skip_type_parameters();
    n->children.push_back(parse_parameter_list());
    skip_return_type();
    if(is_punct("{")) n->children.push_back(parse_function_body());
    else consume_semicolon(); // overload signature or ambient declaration
    return close(n);
}

node_ptr ParserImpl::parse_function_body(){
    return parse_block(node_kind::Block);
}

node_ptr ParserImpl::parse_parameter_list(){
    auto n = open(node_kind::ParameterList, tok_.begin);
    expect("(");
    InScope in(allow_in_, true);
    while(!is_punct(")")){
        n->children.push_back(parse_parameter());
        if(!eat(",")) break;
    }
    expect(")");
    return close(n);
}

static bool is_parameter_modifier(std::string_view t){
    return t == "public" || t == "private" || t == "protected" || t == "readonly" || t == "override";
}

node_ptr ParserImpl::parse_parameter(){
    auto p = open(node_kind::Parameter, tok_.begin);
    for(auto& d : parse_decorators()) p->children.push_back(std::move(d));
    while(is_ident() && is_parameter_modifier(text())){
        token nx = peek();
        if(nx.kind != token_kind::Identifier && !is_punct(nx, "{") && !is_punct(nx, "[") && !is_punct(nx, "...")) break;
        next();
    }
    eat("...");
    p->children.push_back(parse_binding_target());
    eat("?");
    skip_type_annotation();
    if(eat("=")) p->children.push_back(parse_assignment());
    return close(p);
}

node_ptr ParserImpl::parse_class(std::uint32_t begin, node_kind kind, std::vector<node_ptr> decorators){
    auto n = open(kind, begin);
    for(auto& d : decorators) n->children.push_back(std::move(d));
    next(); // class
    if(is_ident() && !is_ident("extends") && !is_ident("implements")) n->children.push_back(parse_identifier());
    if(is_punct("<")) skip_type_parameters();
    if(is_ident("extends")){
        next();
        std::uint32_t b = tok_.begin;
        n->children.push_back(parse_suffixes(b, parse_primary(), true));
        if(is_punct("<")) skip_type_arguments();
    }
    if(is_ident("implements")){
        next();
        skip_type();
        while(eat(",")) skip_type();
    }
    auto body = open(node_kind::ClassBody, tok_.begin);
    expect("{");
    InScope in(allow_in_, true);
    while(!is_punct("}")){
        if(tok_.kind == token_kind::Eof) unexpected();
        if(eat(";")) continue;
        body->children.push_back(parse_class_member());
    }
    expect("}");
    n->children.push_back(close(body));
    return close(n);
}

static bool is_member_modifier(std::string_view t){
    return t == "static" || t == "public" || t == "private" || t == "protected" || t == "readonly" ||
           t == "abstract" || t == "override" || t == "declare" || t == "accessor" || t == "async" ||
           t == "get" || t == "set";
}

static bool starts_property_name(const Lexer& lex, const token& t){
    switch(t.kind){
        case token_kind::Identifier:
        case token_kind::String:
        case token_kind::Number:
        case token_kind::PrivateName:
            return true;
        case token_kind::Punct:
            return lex.text(t) == "[" || lex.text(t) == "*";
        default:
            return false;
    }
}

node_ptr ParserImpl::parse_class_member(){
    std::uint32_t begin = tok_.begin;
    if(is_ident("static") && is_punct(peek(), "{")){
        auto sb = open(node_kind::StaticBlock, begin);
        next();
        expect("{");
        parse_statements_until_brace(*sb);
        expect("}");
        return close(sb);
    }

    auto m = open(node_kind::ClassMember, begin);
    for(auto& d : parse_decorators()) m->children.push_back(std::move(d));
    while(is_ident() && is_member_modifier(text())){
        token p = peek();
        if(!starts_property_name(lex_, p)) break;
        if(is_ident("async")){
            if(p.newline_before) break;
            m->is_async = true;
        }
        next();
    }
    eat("*");

    // index signature: [key: K]: V;
    if(is_punct("[")){
        token p = peek();
        if(p.kind == token_kind::Identifier && is_punct(lex_.scan(p.end), ":")){
            skip_balanced();
            skip_type_annotation();
            consume_semicolon();
            return close(m);
        }
    }

    bool computed = false;
    m->children.push_back(parse_property_name(computed));
    m->computed = computed;
    if(!eat("?")) eat("!");

    if(is_punct("(") || is_punct("<")){
        if(is_punct("<")) skip_type_parameters();
        m->children.push_back(parse_parameter_list());
        skip_return_type();
        if(is_punct("{")) m->children.push_back(parse_function_body());
        else consume_semicolon();
        return close(m);
    }

    skip_type_annotation();
    if(eat("=")) m->children.push_back(parse_assignment());
    consume_semicolon();
    return close(m);
}

node_ptr ParserImpl::parse_property_name(bool& computed){
    computed = false;
    std::uint32_t begin = tok_.begin;
    switch(tok_.kind){
        case token_kind::Identifier:
            return parse_identifier();
        case token_kind::PrivateName: {
            auto n = open(node_kind::PrivateName, begin, std::string(text()));
            next();
            return close(n);
        }
        case token_kind::String: {
            auto n = open(node_kind::StringLiteral, begin, unescape_string(text()));
            next();
            return close(n);
        }
        case token_kind::Number: {
            auto n = open(node_kind::Literal, begin, std::string(text()));
            next();
            return close(n);
        }
        default:
            break;
    }
    if(is_punct("[")){
        computed = true;
        next();
        InScope in(allow_in_, true);
        auto key = parse_assignment();
        expect("]");
        return key;
    }
    unexpected();
}

void ParserImpl::skip_import_attributes(){
    if((is_ident("with") || is_ident("assert")) && !tok_.newline_before){
        next();
        if(!is_punct("{")) unexpected();
        skip_balanced();
    }
}

node_ptr ParserImpl::parse_import_declaration(std::uint32_t begin){
    auto n = open(node_kind::Statement, begin, "import");
    next(); // import
    if(tok_.kind == token_kind::String){
        next();
        skip_import_attributes();
        consume_semicolon();
        return close(n);
    }
    // import x = require("m") / import x = A.B
    if(is_ident("type")){
        token p = peek();
        if(p.kind == token_kind::Identifier && is_punct(lex_.scan(p.end), "=")) next();
    }
    if(is_ident() && is_punct(peek(), "=")){
        next();
        next();
        InScope in(allow_in_, true);
        n->children.push_back(parse_assignment());
        consume_semicolon();
        return close(n);
    }
    for(;;){
        if(tok_.kind == token_kind::Eof) unexpected();
        if(is_punct("{")){ skip_balanced(); continue; }
        if(is_ident("from") && peek().kind == token_kind::String){
            next();
            next();
            break;
        }
        if(is_punct(";")) unexpected();
        next();
    }
    skip_import_attributes();
    consume_semicolon();
    return close(n);
}

node_ptr ParserImpl::parse_export_declaration(std::uint32_t begin, std::vector<node_ptr> decorators){
    auto n = open(node_kind::ExportDeclaration, begin);
    for(auto& d : decorators) n->children.push_back(std::move(d));
    next(); // export

    if(is_ident("default")){
        next();
        std::uint32_t b = tok_.begin;
        if(is_ident("function")){
            n->children.push_back(parse_function(b, node_kind::FunctionDeclaration, false));
        } else if(is_ident("async") && is_ident(peek(), "function") && !peek().newline_before){
            next();
            n->children.push_back(parse_function(b, node_kind::FunctionDeclaration, true));
        } else if(is_ident("class")){
            n->children.push_back(parse_class(b, node_kind::ClassDeclaration, {}));
        } else if(is_ident("abstract") && is_ident(peek(), "class")){
            next();
            n->children.push_back(parse_class(b, node_kind::ClassDeclaration, {}));
        } else if(is_punct("@")){
            auto decs = parse_decorators();
            if(!is_ident("class")) unexpected();
            n->children.push_back(parse_class(b, node_kind::ClassDeclaration, std::move(decs)));
        } else if(is_ident("interface") && peek().kind == token_kind::Identifier){
            n->children.push_back(parse_ts_declaration(b));
        } else {
            InScope in(allow_in_, true);
            n->children.push_back(parse_assignment());
            consume_semicolon();
        }
        return close(n);
    }
    if(is_punct("=")){
        next();
        InScope in(allow_in_, true);
        n->children.push_back(parse_expression());
        consume_semicolon();
        return close(n);
    }
    if(is_ident("as") && is_ident(peek(), "namespace")){
        next();
        next();
        if(!is_ident()) unexpected();
        next();
        consume_semicolon();
        return close(n);
    }
    if(is_ident("type")){
        token p = peek();
        if(is_punct(p, "{") || is_punct(p, "*")) next();
    }
    if(is_punct("*") || is_punct("{")){
        if(eat("*")){
            if(is_ident("as")){
                next();
                next(); // name or string
            }
        } else {
            skip_balanced();
        }
        if(is_ident("from")){
            next();
            if(tok_.kind != token_kind::String) unexpected();
            next();
            skip_import_attributes();
        }
        consume_semicolon();
        return close(n);
    }
    if(is_ident("import")){
        n->children.push_back(parse_import_declaration(tok_.begin));
        return close(n);
    }
    if(is_punct("@")){
        std::uint32_t b = tok_.begin;
        auto decs = parse_decorators();
        if(is_ident("abstract")) next();
        if(!is_ident("class")) unexpected();
        n->children.push_back(parse_class(b, node_kind::ClassDeclaration, std::move(decs)));
        return close(n);
    }
    n->children.push_back(parse_statement());
    return close(n);
}

node_ptr ParserImpl::parse_enum(std::uint32_t begin){
    auto n = open(node_kind::Statement, begin, "enum");
    next(); // enum
    if(!is_ident()) unexpected();
    next();
    expect("{");
    InScope in(allow_in_, true);
    while(!is_punct("}")){
        bool computed = false;
        parse_property_name(computed);
        if(eat("=")) n->children.push_back(parse_assignment());
        if(!eat(",")) break;
    }
    expect("}");
    return close(n);
}

node_ptr ParserImpl::parse_namespace(std::uint32_t begin){
    auto n = open(node_kind::Statement, begin, "namespace");
    bool global = is_ident("global");
    next(); // namespace / module / global
    if(!global){
        if(tok_.kind == token_kind::String){
            next();
        } else {
            if(!is_ident()) unexpected();
            next();
            while(eat(".")){
                if(!is_ident()) unexpected();
                next();
            }
        }
    }
    if(is_punct("{")){
        auto body = open(node_kind::ModuleBlock, tok_.begin);
        next();
        parse_statements_until_brace(*body);
        expect("}");
        n->children.push_back(close(body));
    } else {
        consume_semicolon();
    }
    return close(n);
}

// interface X<T> extends A, B { ... }  /  type X<T> = ...;
node_ptr ParserImpl::parse_ts_declaration(std::uint32_t begin){
    auto n = open(node_kind::Statement, begin, std::string(text()));
    bool alias = is_ident("type");
    next(); // keyword
    if(!is_ident()) unexpected();
    next(); // name
    if(is_punct("<")) skip_type_parameters();
    if(alias){
        expect("=");
        skip_type();
        consume_semicolon();
        return close(n);
    }
    if(is_ident("extends")){
        next();
        skip_type();
        while(eat(",")) skip_type();
    }
    if(!is_punct("{")) unexpected();
    skip_balanced();
    return close(n);
}

} // namespace ppass::syntax

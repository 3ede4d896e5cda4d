#include "parser_impl.hpp"

namespace ppass::syntax {

static bool is_assignment_op(std::string_view t){
    return t == "=" || t == "+=" || t == "-=" || t == "*=" || t == "/=" || t == "%=" || t == "**=" ||
           t == "<<=" || t == ">>=" || t == ">>>=" || t == "&=" || t == "|=" || t == "^=" ||
           t == "&&=" || t == "||=" || t == "??=";
}

// Words that can never start an expression.
static bool is_reserved_word(std::string_view t){
    static constexpr std::string_view words[] = {
        "break", "case", "catch", "const", "continue", "debugger", "default", "do", "else", "enum",
        "export", "extends", "finally", "for", "if", "in", "instanceof", "return", "switch", "throw",
        "try", "var", "while", "with"};
    for(auto w : words) if(w == t) return true;
    return false;
}

bool ParserImpl::starts_expression(const token& t) const {
    switch(t.kind){
        case token_kind::Identifier: {
            auto s = lex_.text(t);
            return s != "in" && s != "of" && s != "instanceof" && s != "as" && s != "satisfies";
        }
        case token_kind::PrivateName:
        case token_kind::Number:
        case token_kind::String:
        case token_kind::NoSubstitutionTemplate:
        case token_kind::TemplateHead:
            return true;
        case token_kind::Punct: {
            auto s = lex_.text(t);
            return s == "(" || s == "[" || s == "{" || s == "!" || s == "~" || s == "+" || s == "-" ||
                   s == "++" || s == "--" || s == "/" || s == "/=" || s == "<" || s == "@";
        }
        default:
            return false;
    }
}

node_ptr ParserImpl::parse_expression(){
    std::uint32_t begin = tok_.begin;
    auto first = parse_assignment();
    if(!is_punct(",")) return first;
    auto seq = open(node_kind::Expression, begin, ",");
    seq->children.push_back(first);
    while(eat(",")) seq->children.push_back(parse_assignment());
    return close(seq);
}

node_ptr ParserImpl::parse_assignment(){
    if(is_ident("yield") && yield_is_keyword()) return parse_yield();
    if(auto arrow = try_parse_arrow()) return arrow;

    std::uint32_t begin = tok_.begin;
    auto lhs = parse_conditional();
    if(is_punct(">")) tok_ = lex_.rescan_greater(tok_);
    if(tok_.kind == token_kind::Punct && is_assignment_op(text())){
        auto n = open(node_kind::Expression, begin, std::string(text()));
        n->children.push_back(lhs);
        next();
        n->children.push_back(parse_assignment());
        return close(n);
    }
    return lhs;
}

bool ParserImpl::yield_is_keyword() const {
    token p = peek();
    if(p.newline_before || p.kind == token_kind::Eof) return true;
    if(is_punct(p, "*") || starts_expression(p)) return true;
    return is_punct(p, ")") || is_punct(p, "]") || is_punct(p, "}") || is_punct(p, ",") ||
           is_punct(p, ";") || is_punct(p, ":");
}

node_ptr ParserImpl::parse_yield(){
    auto n = open(node_kind::Expression, tok_.begin, "yield");
    next();
    if(!tok_.newline_before){
        if(eat("*")) n->value = "yield*";
        if(starts_expression(tok_)) n->children.push_back(parse_assignment());
    }
    return close(n);
}

// Arrow functions are recognized by parsing the head speculatively: a parameter list (with
// optional type parameters and return type) followed by '=>' on the same line.
node_ptr ParserImpl::try_parse_arrow(){
    std::uint32_t begin = tok_.begin;
    bool is_async = false;

    if(is_ident()){
        token p = peek();
        if(is_ident("async") && !p.newline_before && p.kind == token_kind::Identifier){
            token p2 = lex_.scan(p.end);
            if(!is_punct(p2, "=>") || p2.newline_before) return nullptr;
            next(); // async
            is_async = true;
        } else if(is_ident("async") && !p.newline_before && (is_punct(p, "(") || is_punct(p, "<"))){
            is_async = true;
        } else if(!is_punct(p, "=>") || p.newline_before){
            return nullptr;
        }

        if(tok_.kind == token_kind::Identifier && !(is_async && tok_.begin == begin)){
            // x => ...
            auto fn = open(node_kind::ArrowFunction, begin);
            fn->is_async = is_async;
            auto params = open(node_kind::ParameterList, tok_.begin);
            auto param = open(node_kind::Parameter, tok_.begin);
            param->children.push_back(parse_identifier());
            params->children.push_back(close(param));
            fn->children.push_back(close(params));
            expect("=>");
            fn->children.push_back(parse_arrow_body());
            return close(fn);
        }
    } else if(!is_punct("(") && !is_punct("<")) {
        return nullptr;
    }

    if(is_punct("<") && jsx_){
        // In TSX only `<T,>` and `<T extends ...>` start a generic arrow; anything else is JSX.
        token p = peek();
        if(p.kind != token_kind::Identifier) return nullptr;
        token p2 = lex_.scan(p.end);
        if(!is_punct(p2, ",") && !is_ident(p2, "extends")) return nullptr;
    }

    if(not_arrow_.count(begin)) return nullptr;
    auto saved = save();
    node_ptr params;
    try {
        if(is_async) next();
        if(is_punct("<")) skip_type_parameters();
        params = parse_parameter_list();
        skip_return_type();
    } catch(const syntax_error&) {
        params = nullptr;
    }
    if(!params || !is_punct("=>") || tok_.newline_before){
        not_arrow_.insert(begin);
        restore(saved);
        return nullptr;
    }

    auto fn = open(node_kind::ArrowFunction, begin);
    fn->is_async = is_async;
    fn->children.push_back(params);
    next(); // =>
    fn->children.push_back(parse_arrow_body());
    return close(fn);
}

node_ptr ParserImpl::parse_arrow_body(){
    if(is_punct("{")) return parse_function_body();
    return parse_assignment();
}

node_ptr ParserImpl::parse_conditional(){
    std::uint32_t begin = tok_.begin;
    auto test = parse_binary(0);
    if(!is_punct("?")) return test;
    auto n = open(node_kind::Expression, begin, "?:");
    n->children.push_back(test);
    next();
    {
        InScope in(allow_in_, true);
        n->children.push_back(parse_assignment());
    }
    expect(":");
    n->children.push_back(parse_assignment());
    return close(n);
}

static constexpr int relational_precedence = 8;

int ParserImpl::binary_precedence() const {
    if(tok_.kind == token_kind::Identifier){
        if(is_ident("instanceof")) return relational_precedence;
        if(is_ident("in")) return allow_in_ ? relational_precedence : 0;
        return 0;
    }
    if(tok_.kind != token_kind::Punct) return 0;
    auto t = text();
    if(t == "??") return 1;
    if(t == "||") return 2;
    if(t == "&&") return 3;
    if(t == "|") return 4;
    if(t == "^") return 5;
    if(t == "&") return 6;
    if(t == "==" || t == "!=" || t == "===" || t == "!==") return 7;
    if(t == "<" || t == ">" || t == "<=" || t == ">=") return relational_precedence;
    if(t == "<<" || t == ">>" || t == ">>>") return 9;
    if(t == "+" || t == "-") return 10;
    if(t == "*" || t == "/" || t == "%") return 11;
    if(t == "**") return 12;
    return 0;
}

node_ptr ParserImpl::parse_binary(int min_prec){
    std::uint32_t begin = tok_.begin;
    auto left = parse_unary();
    for(;;){
        if(is_punct(">")) tok_ = lex_.rescan_greater(tok_);
        if((is_ident("as") || is_ident("satisfies")) && !tok_.newline_before && relational_precedence > min_prec){
            auto n = open(node_kind::Expression, begin, std::string(text()));
            n->children.push_back(left);
            next();
            if(is_ident("const")) next();
            else skip_type();
            left = close(n);
            continue;
        }
        int prec = binary_precedence();
        if(prec == 0 || prec <= min_prec) break;
        auto n = open(node_kind::Expression, begin, std::string(text()));
        bool right_assoc = is_punct("**");
        n->children.push_back(left);
        next();
        n->children.push_back(parse_binary(right_assoc ? prec - 1 : prec));
        left = close(n);
    }
    return left;
}

node_ptr ParserImpl::parse_unary(){
    std::uint32_t begin = tok_.begin;
    if(tok_.kind == token_kind::Punct){
        auto t = text();
        if(t == "!" || t == "~" || t == "+" || t == "-" || t == "++" || t == "--"){
            auto n = open(node_kind::Expression, begin, std::string(t));
            next();
            n->children.push_back(parse_unary());
            return close(n);
        }
        if(t == "<" && !jsx_){
            // <Type>expr
            auto n = open(node_kind::Expression, begin, "<>");
            skip_type_arguments();
            n->children.push_back(parse_unary());
            return close(n);
        }
    } else if(tok_.kind == token_kind::Identifier){
        auto t = text();
        if(t == "typeof" || t == "void" || t == "delete"){
            auto n = open(node_kind::Expression, begin, std::string(t));
            next();
            n->children.push_back(parse_unary());
            return close(n);
        }
        if(t == "await" && starts_expression(peek())){
            auto n = open(node_kind::AwaitExpression, begin);
            next();
            n->children.push_back(parse_unary());
            return close(n);
        }
    }
    return parse_postfix();
}

node_ptr ParserImpl::parse_postfix(){
    std::uint32_t begin = tok_.begin;
    auto e = parse_suffixes(begin, parse_primary(), true);
    if((is_punct("++") || is_punct("--")) && !tok_.newline_before){
        auto n = open(node_kind::Expression, begin, std::string(text()));
        n->children.push_back(e);
        next();
        return close(n);
    }
    return e;
}

node_ptr ParserImpl::parse_member_name(){
    if(tok_.kind == token_kind::PrivateName){
        auto n = open(node_kind::PrivateName, tok_.begin, std::string(text()));
        next();
        return close(n);
    }
    return parse_identifier();
}

node_ptr ParserImpl::parse_suffixes(std::uint32_t begin, node_ptr e, bool allow_call){
    for(;;){
        if(is_punct(".")){
            next();
            auto m = open(node_kind::MemberExpression, begin);
            m->children.push_back(e);
            m->children.push_back(parse_member_name());
            e = close(m);
            continue;
        }
        if(is_punct("?.")){
            if(!allow_call) break;
            next();
            if(is_punct("(")){
                auto c = open(node_kind::CallExpression, begin);
                c->optional = true;
                c->children.push_back(e);
                parse_arguments(*c);
                e = close(c);
            } else if(is_punct("[")){
                auto m = open(node_kind::MemberExpression, begin);
                m->optional = true;
                m->computed = true;
                m->children.push_back(e);
                next();
                InScope in(allow_in_, true);
                m->children.push_back(parse_expression());
                expect("]");
                e = close(m);
            } else {
                auto m = open(node_kind::MemberExpression, begin);
                m->optional = true;
                m->children.push_back(e);
                m->children.push_back(parse_member_name());
                e = close(m);
            }
            continue;
        }
        if(is_punct("[")){
            auto m = open(node_kind::MemberExpression, begin);
            m->computed = true;
            m->children.push_back(e);
            next();
            InScope in(allow_in_, true);
            m->children.push_back(parse_expression());
            expect("]");
            e = close(m);
            continue;
        }
        if(is_punct("(")){
            if(!allow_call) break;
            auto c = open(node_kind::CallExpression, begin);
            c->children.push_back(e);
            parse_arguments(*c);
            e = close(c);
            continue;
        }
        if(is_punct("!") && !tok_.newline_before){
            // non-null assertion
            auto n = open(node_kind::Expression, begin, "!");
            n->children.push_back(e);
            next();
            e = close(n);
            continue;
        }
        if(tok_.kind == token_kind::NoSubstitutionTemplate || tok_.kind == token_kind::TemplateHead){
            auto t = open(node_kind::TaggedTemplate, begin);
            t->children.push_back(e);
            t->children.push_back(parse_template());
            e = close(t);
            continue;
        }
        if(is_punct("<")){
            // f<T>(...) or tag<T>`...`; otherwise '<' is a comparison
            auto saved = save();
            bool ok = false;
            try {
                skip_type_arguments();
                ok = is_punct("(") || tok_.kind == token_kind::NoSubstitutionTemplate ||
                     tok_.kind == token_kind::TemplateHead;
            } catch(const syntax_error&) {
                ok = false;
            }
            if(!ok){
                restore(saved);
                break;
            }
            continue;
        }
        break;
    }
    return e;
}

node_ptr ParserImpl::parse_new(){
    std::uint32_t begin = tok_.begin;
    next(); // new
    if(eat(".")){
        auto n = open(node_kind::Expression, begin, "new.target");
        parse_identifier();
        return close(n);
    }
    auto n = open(node_kind::NewExpression, begin);
    std::uint32_t callee_begin = tok_.begin;
    n->children.push_back(parse_suffixes(callee_begin, parse_primary(), false));
    if(is_punct("(")) parse_arguments(*n);
    return close(n);
}

void ParserImpl::parse_arguments(node& call){
    expect("(");
    InScope in(allow_in_, true);
    while(!is_punct(")")){
        if(is_punct("...")) call.children.push_back(parse_spread());
        else call.children.push_back(parse_assignment());
        if(!eat(",")) break;
    }
    expect(")");
}

node_ptr ParserImpl::parse_spread(){
    auto s = open(node_kind::Spread, tok_.begin);
    next(); // ...
    s->children.push_back(parse_assignment());
    return close(s);
}

node_ptr ParserImpl::parse_identifier(){
    if(!is_ident()) unexpected();
    auto n = open(node_kind::Identifier, tok_.begin, std::string(text()));
    next();
    return close(n);
}

node_ptr ParserImpl::parse_primary(){
    std::uint32_t begin = tok_.begin;
    switch(tok_.kind){
        case token_kind::Identifier: {
            auto t = text();
            if(t == "function") return parse_function(begin, node_kind::FunctionExpression, false);
            if(t == "async"){
                token p = peek();
                if(is_ident(p, "function") && !p.newline_before){
                    next();
                    return parse_function(begin, node_kind::FunctionExpression, true);
                }
            }
            if(t == "class") return parse_class(begin, node_kind::ClassExpression, {});
            if(t == "new") return parse_new();
            if(is_reserved_word(t)) lex_.fail("unexpected keyword '" + std::string(t) + "'", begin);
            return parse_identifier();
        }
        case token_kind::PrivateName:
            return parse_member_name();
        case token_kind::Number: {
            auto n = open(node_kind::Literal, begin, std::string(text()));
            next();
            return close(n);
        }
        case token_kind::String: {
            auto n = open(node_kind::StringLiteral, begin, unescape_string(text()));
            next();
            return close(n);
        }
        case token_kind::NoSubstitutionTemplate:
        case token_kind::TemplateHead:
            return parse_template();
        case token_kind::Punct: {
            if(is_punct("/") || is_punct("/=")){
                tok_ = lex_.rescan_regex(tok_);
                auto n = open(node_kind::Literal, begin, std::string(text()));
                next();
                return close(n);
            }
            if(is_punct("(")){
                auto n = open(node_kind::Parenthesized, begin);
                next();
                InScope in(allow_in_, true);
                n->children.push_back(parse_expression());
                expect(")");
                return close(n);
            }
            if(is_punct("[")) return parse_array_literal();
            if(is_punct("{")) return parse_object_literal();
            if(is_punct("<") && jsx_) return parse_jsx_element(false);
            if(is_punct("@")){
                auto decs = parse_decorators();
                if(!is_ident("class")) unexpected();
                return parse_class(begin, node_kind::ClassExpression, std::move(decs));
            }
            break;
        }
        default:
            break;
    }
    unexpected();
}

node_ptr ParserImpl::parse_template(){
    auto n = open(node_kind::TemplateLiteral, tok_.begin);
    if(tok_.kind == token_kind::NoSubstitutionTemplate){
        next();
        return close(n);
    }
    for(;;){
        next(); // head or middle
        {
            InScope in(allow_in_, true);
            n->children.push_back(parse_expression());
        }
        if(!is_punct("}")) lex_.fail("'}' expected in template literal", tok_.begin);
        tok_ = lex_.rescan_template_continuation(tok_);
        if(tok_.kind == token_kind::TemplateTail){
            next();
            break;
        }
    }
    return close(n);
}

node_ptr ParserImpl::parse_array_literal(){
    auto n = open(node_kind::ArrayLiteral, tok_.begin);
    next(); // [
    InScope in(allow_in_, true);
    while(!is_punct("]")){
        if(eat(",")) continue; // hole
        if(is_punct("...")) n->children.push_back(parse_spread());
        else n->children.push_back(parse_assignment());
        if(!is_punct("]")) expect(",");
    }
    expect("]");
    return close(n);
}

node_ptr ParserImpl::parse_object_literal(){
    auto n = open(node_kind::ObjectLiteral, tok_.begin);
    next(); // {
    InScope in(allow_in_, true);
    while(!is_punct("}")){
        n->children.push_back(parse_object_member());
        if(!eat(",")) break;
    }
    expect("}");
    return close(n);
}

node_ptr ParserImpl::parse_object_member(){
    std::uint32_t begin = tok_.begin;
    if(is_punct("...")) return parse_spread();

    bool is_async = false;
    if(is_ident("async") || is_ident("get") || is_ident("set")){
        token p = peek();
        bool name_follows = p.kind == token_kind::Identifier || p.kind == token_kind::String ||
                            p.kind == token_kind::Number || p.kind == token_kind::PrivateName ||
                            is_punct(p, "[") || is_punct(p, "*");
        if(name_follows && !(is_ident("async") && p.newline_before)){
            is_async = is_ident("async");
            next();
        }
    }
    eat("*");

    bool computed = false;
    auto key = parse_property_name(computed);

    if(is_punct("(") || is_punct("<")){
        auto m = open(node_kind::Method, begin);
        m->is_async = is_async;
        m->computed = computed;
        m->children.push_back(key);
        if(is_punct("<")) skip_type_parameters();
        m->children.push_back(parse_parameter_list());
        skip_return_type();
        m->children.push_back(parse_function_body());
        return close(m);
    }
    if(is_punct(":")){
        auto p = open(node_kind::Property, begin);
        p->computed = computed;
        p->children.push_back(key);
        next();
        p->children.push_back(parse_assignment());
        return close(p);
    }
    if(computed || key->kind != node_kind::Identifier) unexpected();
    auto s = open(node_kind::ShorthandProperty, begin);
    s->children.push_back(key);
    if(eat("=")) s->children.push_back(parse_assignment());
    return close(s);
}

} // namespace ppass::syntax

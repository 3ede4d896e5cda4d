// Type syntax is only consumed: annotations stay in the source text between nodes.
#include "parser_impl.hpp"

namespace ppass::syntax {

void ParserImpl::skip_type_annotation(){
    if(eat(":")) skip_type();
}

void ParserImpl::skip_return_type(){
    if(!eat(":")) return;
    if(is_ident("asserts")){
        token p = peek();
        if(p.kind == token_kind::Identifier && !p.newline_before) next();
    }
    skip_type();
}

// Skips from an opening '(' '[' '{' or template head to its matching close.
void ParserImpl::skip_balanced(){
    std::vector<char> stack;
    do {
        if(tok_.kind == token_kind::Eof) unexpected();
        if(tok_.kind == token_kind::TemplateHead){
            stack.push_back('`');
            next();
            continue;
        }
        if(tok_.kind == token_kind::Punct){
            auto t = text();
            if(t == "(" || t == "[" || t == "{"){
                stack.push_back(t[0]);
            } else if(t == ")" || t == "]" || t == "}"){
                if(stack.empty()) unexpected();
                if(t == "}" && stack.back() == '`'){
                    tok_ = lex_.rescan_template_continuation(tok_);
                    if(tok_.kind == token_kind::TemplateTail) stack.pop_back();
                    next();
                    continue;
                }
                char open = stack.back();
                if((open == '(' && t != ")") || (open == '[' && t != "]") || (open == '{' && t != "}")) unexpected();
                stack.pop_back();
            }
        }
        next();
    } while(!stack.empty());
}

void ParserImpl::skip_type(){
    if(is_ident("abstract") && is_ident(peek(), "new")) next();
    if(is_ident("new")){
        next();
        if(is_punct("<")) skip_type_parameters();
        if(!is_punct("(")) unexpected();
        skip_balanced();
        expect("=>");
        skip_type();
        return;
    }
    if(is_punct("<")){
        skip_type_parameters();
        if(!is_punct("(")) unexpected();
        skip_balanced();
        expect("=>");
        skip_type();
        return;
    }
    if(is_punct("(")){
        auto saved = save();
        bool fn = false;
        try {
            skip_balanced();
            fn = is_punct("=>");
        } catch(const syntax_error&) {
            fn = false;
        }
        if(fn){
            next();
            skip_type();
            return;
        }
        restore(saved);
    }
    skip_union_type();
    // conditional type
    if(is_ident("extends") && !tok_.newline_before){
        next();
        skip_union_type();
        expect("?");
        skip_type();
        expect(":");
        skip_type();
    }
}

void ParserImpl::skip_union_type(){
    if(!eat("|")) eat("&");
    skip_type_operand();
    while(is_punct("|") || is_punct("&")){
        next();
        skip_type_operand();
    }
}

void ParserImpl::skip_type_operand(){
    if(is_ident("keyof") || is_ident("unique") || is_ident("readonly")){
        token p = peek();
        if(p.kind == token_kind::Identifier || is_punct(p, "(") || is_punct(p, "[") || is_punct(p, "{")){
            next();
            skip_type_operand();
            return;
        }
    }
    if(is_ident("infer")){
        next();
        if(!is_ident()) unexpected();
        next();
        return;
    }
    if(is_ident("typeof")){
        next();
        if(is_ident("import")){
            next();
            if(!is_punct("(")) unexpected();
            skip_balanced();
        } else {
            if(!is_ident()) unexpected();
            next();
        }
        while(eat(".")){
            if(!is_ident() && tok_.kind != token_kind::PrivateName) unexpected();
            next();
        }
        if(is_punct("<") && !tok_.newline_before) skip_type_arguments();
    } else {
        skip_primary_type();
    }
    // T[] and T[K]
    while(is_punct("[") && !tok_.newline_before) skip_balanced();
}

void ParserImpl::skip_primary_type(){
    switch(tok_.kind){
        case token_kind::Identifier: {
            if(is_ident("import") && is_punct(peek(), "(")){
                next();
                skip_balanced();
            } else {
                next();
            }
            while(eat(".")){
                if(!is_ident()) unexpected();
                next();
            }
            if(is_punct("<") && !tok_.newline_before) skip_type_arguments();
            if(is_ident("is") && !tok_.newline_before){
                next();
                skip_type();
            }
            return;
        }
        case token_kind::String:
        case token_kind::Number:
        case token_kind::NoSubstitutionTemplate:
            next();
            return;
        case token_kind::TemplateHead:
            for(;;){
                next();
                skip_type();
                if(!is_punct("}")) unexpected();
                tok_ = lex_.rescan_template_continuation(tok_);
                if(tok_.kind == token_kind::TemplateTail){
                    next();
                    return;
                }
            }
        case token_kind::Punct:
            if(is_punct("-")){
                next();
                if(tok_.kind != token_kind::Number) unexpected();
                next();
                return;
            }
            if(is_punct("{") || is_punct("[")){
                skip_balanced();
                return;
            }
            if(is_punct("(")){
                next();
                skip_type();
                expect(")");
                return;
            }
            if(is_punct("*") || is_punct("?")){
                next();
                return;
            }
            break;
        default:
            break;
    }
    unexpected();
}

void ParserImpl::skip_type_arguments(){
    expect("<");
    while(!is_punct(">")){
        skip_type();
        if(!eat(",")) break;
    }
    expect(">");
}

void ParserImpl::skip_type_parameters(){
    expect("<");
    while(!is_punct(">")){
        while((is_ident("const") || is_ident("in") || is_ident("out")) && peek().kind == token_kind::Identifier) next();
        if(!is_ident()) unexpected();
        next();
        if(is_ident("extends")){
            next();
            skip_type();
        }
        if(eat("=")) skip_type();
        if(!eat(",")) break;
    }
    expect(">");
}

} // namespace ppass::syntax

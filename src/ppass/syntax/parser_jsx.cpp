// JSX elements. Attribute values and children need their own scanning modes, so this part of
// the parser drives the lexer directly instead of going through next().
#include "parser_impl.hpp"

namespace ppass::syntax {

void ParserImpl::parse_jsx_name(){
    if(!is_ident()) unexpected();
    tok_ = lex_.rescan_jsx_identifier(tok_);
    next();
    while(is_punct(".") || is_punct(":")){
        next();
        if(!is_ident()) unexpected();
        tok_ = lex_.rescan_jsx_identifier(tok_);
        next();
    }
}

// Called on the final '>' of an element. Children of an enclosing element continue in JSX
// child mode, so the caller rescans; otherwise scanning resumes normally.
void ParserImpl::finish_jsx_tag(bool as_child){
    if(!is_punct(">")) unexpected();
    prev_end_ = tok_.end;
    if(!as_child) tok_ = lex_.scan(tok_.end);
}

node_ptr ParserImpl::parse_jsx_element(bool as_child){
    std::uint32_t begin = tok_.begin;
    auto el = open(node_kind::JsxElement, begin);
    next(); // <

    if(!is_punct(">")){
        parse_jsx_name();
        if(is_punct("<")) skip_type_arguments();
        while(!is_punct(">") && !is_punct("/")){
            if(is_punct("{")){
                next();
                if(!is_punct("...")) unexpected();
                InScope in(allow_in_, true);
                el->children.push_back(parse_spread());
                expect("}");
                continue;
            }
            parse_jsx_name();
            if(!is_punct("=")) continue;
            prev_end_ = tok_.end;
            tok_ = lex_.scan_jsx_attribute_value(tok_.end);
            if(tok_.kind == token_kind::String){
                auto v = open(node_kind::Literal, tok_.begin, std::string(text()));
                next();
                el->children.push_back(close(v));
            } else if(is_punct("{")){
                next();
                InScope in(allow_in_, true);
                el->children.push_back(parse_assignment());
                expect("}");
            } else if(is_punct("<")){
                el->children.push_back(parse_jsx_element(false));
            } else {
                unexpected();
            }
        }
        if(eat("/")){
            finish_jsx_tag(as_child);
            return close(el);
        }
    }

    // children
    std::uint32_t pos = tok_.end;
    for(;;){
        token t = lex_.scan_jsx_child(pos);
        if(t.kind == token_kind::Eof) lex_.fail("unterminated JSX element", begin);
        if(t.kind == token_kind::JsxText){
            pos = t.end;
            continue;
        }
        if(lex_.text(t) == "{"){
            prev_end_ = t.end;
            tok_ = lex_.scan(t.end);
            if(!is_punct("}")){
                InScope in(allow_in_, true);
                if(is_punct("...")) el->children.push_back(parse_spread());
                else el->children.push_back(parse_expression());
            }
            if(!is_punct("}")) lex_.fail("'}' expected in JSX expression", tok_.begin);
            pos = tok_.end;
            continue;
        }
        token after = lex_.scan(t.end);
        if(is_punct(after, "/")){
            // closing tag
            prev_end_ = after.end;
            tok_ = lex_.scan(after.end);
            if(!is_punct(">")) parse_jsx_name();
            finish_jsx_tag(as_child);
            return close(el);
        }
        tok_ = t;
        el->children.push_back(parse_jsx_element(true));
        pos = prev_end_;
    }
}

} // namespace ppass::syntax

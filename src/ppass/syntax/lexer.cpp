#include "ppass/syntax/lexer.hpp"
#include "token_grammar.hpp"

namespace ppass::syntax {

namespace pegtl = tao::pegtl;

template<class Rule>
bool Lexer::match(std::uint32_t pos, std::uint32_t& end, const char* what) const {
    pegtl::memory_input<pegtl::tracking_mode::lazy> in(src_.data() + pos, src_.data() + src_.size(), "ppass");
    try {
        if(!pegtl::parse<Rule>(in)) return false;
    } catch(const pegtl::parse_error&) {
        fail(what, pos);
    }
    end = static_cast<std::uint32_t>(in.current() - src_.data());
    return true;
}

void line_col_at(std::string_view src, std::size_t offset, int& line, int& col){
    line = 1; col = 1;
    if(offset > src.size()) offset = src.size();
    for(std::size_t i = 0; i < offset; ++i){
        if(src[i] == '\n'){ ++line; col = 1; }
        else ++col;
    }
}

void syntax_error::locate(std::string_view src){
    line_col_at(src, offset, line, col);
}

void Lexer::fail(const std::string& msg, std::uint32_t offset) const {
    throw syntax_error(msg, offset);
}

std::uint32_t Lexer::skip_trivia(std::uint32_t pos, bool& newline) const {
    newline = false;
    std::uint32_t start = pos;
    if(pos == 0 && src_.size() >= 2 && src_[0] == '#' && src_[1] == '!'){
        while(pos < src_.size() && src_[pos] != '\n') ++pos;
    }
    std::uint32_t end = pos;
    if(match<grammar::trivia>(pos, end, "unterminated comment")) pos = end;
    for(std::uint32_t i = start; i < pos; ++i){
        char c = src_[i];
        if(c == '\n' || c == '\r'){ newline = true; break; }
        // U+2028 / U+2029
        if(static_cast<unsigned char>(c) == 0xE2 && i + 2 < pos && static_cast<unsigned char>(src_[i+1]) == 0x80 &&
           (static_cast<unsigned char>(src_[i+2]) == 0xA8 || static_cast<unsigned char>(src_[i+2]) == 0xA9)){
            newline = true; break;
        }
    }
    return pos;
}

static bool is_ident_start_byte(char c){
    unsigned char u = static_cast<unsigned char>(c);
    return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || u == '_' || u == '$' || u == '\\' || u >= 0x80;
}

token Lexer::scan(std::uint32_t pos) const {
    bool nl = false;
    pos = skip_trivia(pos, nl);
    const auto size = static_cast<std::uint32_t>(src_.size());
    if(pos >= size) return make(token_kind::Eof, size, size, nl);

    char c = src_[pos];
    std::uint32_t end = pos;
    bool next_digit = pos + 1 < size && src_[pos+1] >= '0' && src_[pos+1] <= '9';

    if((c >= '0' && c <= '9') || (c == '.' && next_digit)){
        if(!match<grammar::numeric_literal>(pos, end, "invalid numeric literal")) fail("invalid numeric literal", pos);
        return make(token_kind::Number, pos, end, nl);
    }
    if(c == '"' || c == '\''){
        match<grammar::string_literal>(pos, end, "unterminated string literal");
        return make(token_kind::String, pos, end, nl);
    }
    if(c == '`'){
        match<grammar::template_start>(pos, end, "unterminated template literal");
        return make(src_[end-1] == '`' ? token_kind::NoSubstitutionTemplate : token_kind::TemplateHead, pos, end, nl);
    }
    if(c == '#' && match<grammar::private_name>(pos, end, "invalid private name")){
        return make(token_kind::PrivateName, pos, end, nl);
    }
    if(is_ident_start_byte(c)){
        if(!match<grammar::identifier>(pos, end, "invalid identifier")) fail("invalid character", pos);
        return make(token_kind::Identifier, pos, end, nl);
    }
    if(!match<grammar::punctuator>(pos, end, "unexpected character")) fail("unexpected character", pos);
    return make(token_kind::Punct, pos, end, nl);
}

token Lexer::rescan_greater(const token& t) const {
    std::uint32_t end = t.end;
    if(!match<grammar::greater_op>(t.begin, end, "'>' expected")) return t;
    return make(token_kind::Punct, t.begin, end, t.newline_before);
}

token Lexer::rescan_regex(const token& t) const {
    std::uint32_t end = t.end;
    if(!match<grammar::regex_literal>(t.begin, end, "unterminated regular expression"))
        fail("unterminated regular expression", t.begin);
    return make(token_kind::Regex, t.begin, end, t.newline_before);
}

token Lexer::rescan_template_continuation(const token& t) const {
    std::uint32_t end = t.end;
    if(!match<grammar::template_continue>(t.begin, end, "unterminated template literal"))
        fail("'}' expected", t.begin);
    return make(src_[end-1] == '`' ? token_kind::TemplateTail : token_kind::TemplateMiddle, t.begin, end, t.newline_before);
}

token Lexer::rescan_jsx_identifier(const token& t) const {
    std::uint32_t end = t.end;
    if(t.kind != token_kind::Identifier || !match<grammar::jsx_identifier>(t.begin, end, "invalid JSX name")) return t;
    return make(token_kind::Identifier, t.begin, end, t.newline_before);
}

token Lexer::scan_jsx_child(std::uint32_t pos) const {
    const auto size = static_cast<std::uint32_t>(src_.size());
    if(pos >= size) return make(token_kind::Eof, size, size, false);
    char c = src_[pos];
    if(c == '{' || c == '<') return make(token_kind::Punct, pos, pos + 1, false);
    std::uint32_t end = pos;
    match<grammar::jsx_text>(pos, end, "invalid JSX text");
    return make(token_kind::JsxText, pos, end, false);
}

token Lexer::scan_jsx_attribute_value(std::uint32_t pos) const {
    bool nl = false;
    std::uint32_t p = skip_trivia(pos, nl);
    if(p < src_.size() && (src_[p] == '"' || src_[p] == '\'')){
        std::uint32_t end = p;
        match<grammar::jsx_string>(p, end, "unterminated JSX attribute string");
        return make(token_kind::String, p, end, nl);
    }
    return scan(pos);
}

} // namespace ppass::syntax

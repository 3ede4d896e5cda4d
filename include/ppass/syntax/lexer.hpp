// Parser-driven TypeScript/JSX scanner. The parser asks for a token at an offset and, where the
// grammar is context dependent (regex vs '/', '>' runs, template continuations, JSX text),
// re-scans the current token in the right mode.
#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ppass::syntax {

// Thrown with the byte offset only. The parser backtracks through many of these, so line
// and column stay -1 until locate() runs where the error leaves the parser.
struct syntax_error : std::runtime_error
{
    syntax_error(const std::string& msg, std::uint32_t off)
        : std::runtime_error(msg), offset(off) {}

    void locate(std::string_view src);

    std::uint32_t offset;
    int line=-1;
    int col=-1;
};

// 1-based line and column of a byte offset; offsets past the end clamp to it.
void line_col_at(std::string_view src, std::size_t offset, int& line, int& col);

enum class token_kind : std::uint8_t
{
    Eof,
    Identifier,   // identifiers and every keyword; the parser compares text
    PrivateName,  // #name
    Number,
    String,
    NoSubstitutionTemplate,
    TemplateHead,
    TemplateMiddle,
    TemplateTail,
    Regex,
    Punct,
    JsxText
};

struct token
{
    token_kind kind{token_kind::Eof};
    std::uint32_t begin = 0;
    std::uint32_t end = 0;
    bool newline_before = false;
};

class Lexer {
public:
    explicit Lexer(std::string_view src) : src_(src) {}

    // Skips trivia from `pos` and scans one token. '>' is always a single-character token.
    token scan(std::uint32_t pos) const;

    // '>' followed by '>' / '=' combinations: >>, >>>, >=, >>=, >>>=.
    token rescan_greater(const token& t) const;
    // '/' or '/=' at the start of an expression.
    token rescan_regex(const token& t) const;
    // '}' that closes a template substitution: yields TemplateMiddle or TemplateTail.
    token rescan_template_continuation(const token& t) const;
    // Identifier extended with '-' parts (JSX tag and attribute names).
    token rescan_jsx_identifier(const token& t) const;
    // Inside element children: '{', '<' or a JsxText run. No trivia is skipped.
    token scan_jsx_child(std::uint32_t pos) const;
    // After '=' in a JSX attribute: a JSX string (no escapes, may span lines) or a normal token.
    token scan_jsx_attribute_value(std::uint32_t pos) const;

    std::string_view text(const token& t) const { return src_.substr(t.begin, t.end - t.begin); }
    std::string_view source() const { return src_; }

    [[noreturn]] void fail(const std::string& msg, std::uint32_t offset) const;

private:
    template<class Rule>
    bool match(std::uint32_t pos, std::uint32_t& end, const char* what) const;
    std::uint32_t skip_trivia(std::uint32_t pos, bool& newline) const;
    token make(token_kind k, std::uint32_t b, std::uint32_t e, bool nl) const { return token{k, b, e, nl}; }

    std::string_view src_;
};

} // namespace ppass::syntax

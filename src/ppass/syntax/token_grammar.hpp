#pragma once
#include <tao/pegtl.hpp>

namespace ppass::syntax::grammar {
using namespace tao::pegtl;

// Trivia
struct line_terminator : sor< one<'\n'>, one<'\r'>, utf8::one<0x2028, 0x2029> > {};
struct ws_char : sor< one<' ', '\t', '\v', '\f'>,
                      utf8::one<0xA0, 0xFEFF, 0x1680, 0x202F, 0x205F, 0x3000>,
                      utf8::range<0x2000, 0x200A> > {};
struct line_comment : seq< two<'/'>, star< not_at< line_terminator >, any > > {};
struct block_comment : if_must< string<'/','*'>, until< string<'*','/'> > > {};
struct trivia : star< sor< ws_char, line_terminator, line_comment, block_comment > > {};

// Identifiers. Any non-ASCII code point may appear; non-ASCII whitespace is consumed as trivia first.
struct unicode_escape : seq< one<'\\'>, one<'u'>, sor< seq< one<'{'>, plus< xdigit >, one<'}'> >, rep< 4, xdigit > > > {};
struct ident_start : sor< ranges<'a','z','A','Z'>, one<'_','$'>, unicode_escape, utf8::range<0x80, 0x10FFFF> > {};
struct ident_part : sor< ident_start, digit > {};
struct identifier : seq< ident_start, star< ident_part > > {};
struct private_name : seq< one<'#'>, identifier > {};
struct jsx_identifier : seq< ident_start, star< sor< ident_part, one<'-'> > > > {};

// Numbers: 0x / 0o / 0b, decimals with '_' separators, exponent, bigint suffix
struct digits : list< plus< digit >, one<'_'> > {};
struct hex_int : seq< one<'0'>, one<'x','X'>, list< plus< xdigit >, one<'_'> > > {};
struct oct_int : seq< one<'0'>, one<'o','O'>, list< plus< range<'0','7'> >, one<'_'> > > {};
struct bin_int : seq< one<'0'>, one<'b','B'>, list< plus< one<'0','1'> >, one<'_'> > > {};
struct exponent : seq< one<'e','E'>, opt< one<'+','-'> >, digits > {};
struct decimal : seq< sor< seq< digits, opt< one<'.'>, opt< digits > > >, seq< one<'.'>, digits > >, opt< exponent > > {};
struct numeric_literal : seq< sor< hex_int, oct_int, bin_int, decimal >, opt< one<'n'> >, not_at< ident_part > > {};

// Strings and templates
struct escape_seq : seq< one<'\\'>, sor< string<'\r','\n'>, any > > {};
template< char Q >
struct quoted : if_must< one<Q>, until< one<Q>, sor< escape_seq, not_one<'\n','\r'> > > > {};
struct string_literal : sor< quoted<'"'>, quoted<'\''> > {};

struct template_chars : star< sor< escape_seq, seq< one<'$'>, not_at< one<'{'> > >, not_one<'`','\\','$'> > > {};
struct template_span_end : sor< one<'`'>, string<'$','{'> > {};
struct template_start : if_must< one<'`'>, template_chars, template_span_end > {};
struct template_continue : if_must< one<'}'>, template_chars, template_span_end > {};

// Regular expressions: only tried where an expression may start
struct regex_escape : seq< one<'\\'>, not_one<'\n','\r'> > {};
struct regex_class : if_must< one<'['>, until< one<']'>, sor< regex_escape, not_one<'\n','\r'> > > > {};
struct regex_char : sor< regex_escape, regex_class, not_one<'/','\n','\r'> > {};
struct regex_literal : if_must< one<'/'>, plus< regex_char >, one<'/'>, star< ident_part > > {};

// Punctuators. '>' runs are never joined here; the parser asks for greater_op where they apply.
struct optional_chain : seq< one<'?'>, one<'.'>, not_at< digit > > {};
struct punctuator : sor<
    string<'.','.','.'>, optional_chain,
    string<'?','?','='>, string<'?','?'>,
    string<'=','=','='>, string<'!','=','='>, string<'*','*','='>, string<'<','<','='>,
    string<'&','&','='>, string<'|','|','='>,
    string<'=','>'>, string<'=','='>, string<'!','='>, string<'<','='>, string<'<','<'>,
    string<'&','&'>, string<'|','|'>, string<'+','+'>, string<'-','-'>, string<'*','*'>,
    string<'+','='>, string<'-','='>, string<'*','='>, string<'/','='>, string<'%','='>,
    string<'&','='>, string<'|','='>, string<'^','='>,
    one<'{','}','(',')','[',']',';',',','<','>','+','-','*','/','%','&','|','^','!','~','?',':','=','.','@','#'> > {};

struct greater_op : sor< string<'>','>','>','='>, string<'>','>','>'>, string<'>','>','='>,
                         string<'>','>'>, string<'>','='>, one<'>'> > {};

// JSX
struct jsx_text : plus< not_one<'{','<'> > {};
template< char Q >
struct jsx_quoted : if_must< one<Q>, until< one<Q> > > {};
struct jsx_string : sor< jsx_quoted<'"'>, jsx_quoted<'\''> > {};

} // namespace ppass::syntax::grammar

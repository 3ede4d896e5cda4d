#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "ppass/syntax/lexer.hpp"

using namespace ppass::syntax;

static std::vector<std::string> texts(const std::string& src){
    Lexer lex(src);
    std::vector<std::string> out;
    for(token t = lex.scan(0); t.kind != token_kind::Eof; t = lex.scan(t.end)) out.emplace_back(lex.text(t));
    return out;
}

TEST(Lexer, SplitsPunctuationAndSkipsComments){
    auto toks = texts("a?.b ?? c /* note */ // tail\n x ||= y...z");
    std::vector<std::string> expected{"a", "?.", "b", "??", "c", "x", "||=", "y", "...", "z"};
    EXPECT_EQ(toks, expected);
}

TEST(Lexer, GreaterThanIsAlwaysSingle){
    std::string src = "a >>>= b";
    Lexer lex(src);
    token a = lex.scan(0);
    token gt = lex.scan(a.end);
    EXPECT_EQ(lex.text(gt), ">");
    token merged = lex.rescan_greater(gt);
    EXPECT_EQ(lex.text(merged), ">>>=");
    EXPECT_EQ(merged.kind, token_kind::Punct);
}

TEST(Lexer, NewlineBeforeFlag){
    std::string src = "a\n/* x\n */ b c";
    Lexer lex(src);
    token a = lex.scan(0);
    token b = lex.scan(a.end);
    token c = lex.scan(b.end);
    EXPECT_FALSE(a.newline_before);
    EXPECT_TRUE(b.newline_before);
    EXPECT_FALSE(c.newline_before);
}

TEST(Lexer, NumbersStringsAndPrivateNames){
    std::string src = "1_000n 0x1F .5e-3 'it\\'s' \"q\" #secret";
    Lexer lex(src);
    std::vector<token_kind> kinds;
    for(token t = lex.scan(0); t.kind != token_kind::Eof; t = lex.scan(t.end)) kinds.push_back(t.kind);
    std::vector<token_kind> expected{token_kind::Number, token_kind::Number, token_kind::Number,
                                     token_kind::String, token_kind::String, token_kind::PrivateName};
    EXPECT_EQ(kinds, expected);
    EXPECT_EQ(texts(src)[3], "'it\\'s'");
}

TEST(Lexer, RegexAndTemplateRescans){
    std::string src = "/ab+c/gi `x${y}z`";
    Lexer lex(src);
    token slash = lex.scan(0);
    EXPECT_EQ(lex.text(slash), "/");
    token re = lex.rescan_regex(slash);
    EXPECT_EQ(re.kind, token_kind::Regex);
    EXPECT_EQ(lex.text(re), "/ab+c/gi");

    token head = lex.scan(re.end);
    EXPECT_EQ(head.kind, token_kind::TemplateHead);
    EXPECT_EQ(lex.text(head), "`x${");
    token y = lex.scan(head.end);
    token close = lex.scan(y.end);
    EXPECT_EQ(lex.text(close), "}");
    token tail = lex.rescan_template_continuation(close);
    EXPECT_EQ(tail.kind, token_kind::TemplateTail);
    EXPECT_EQ(lex.text(tail), "}z`");
}

TEST(Lexer, HashbangIsTrivia){
    auto toks = texts("#!/usr/bin/env node\nrun()");
    std::vector<std::string> expected{"run", "(", ")"};
    EXPECT_EQ(toks, expected);
}

TEST(Lexer, JsxModes){
    std::string src = "aria-label=\"a\nb\">text {x}";
    Lexer lex(src);
    token name = lex.scan(0);
    EXPECT_EQ(lex.text(name), "aria");
    token full = lex.rescan_jsx_identifier(name);
    EXPECT_EQ(lex.text(full), "aria-label");
    token eq = lex.scan(full.end);
    token value = lex.scan_jsx_attribute_value(eq.end);
    EXPECT_EQ(value.kind, token_kind::String);
    EXPECT_EQ(lex.text(value), "\"a\nb\"");
    token gt = lex.scan(value.end);
    token text = lex.scan_jsx_child(gt.end);
    EXPECT_EQ(text.kind, token_kind::JsxText);
    EXPECT_EQ(lex.text(text), "text ");
    token brace = lex.scan_jsx_child(text.end);
    EXPECT_EQ(lex.text(brace), "{");
}

TEST(Lexer, ErrorsCarryPosition){
    std::string src = "ok;\n  \"unterminated\n";
    Lexer lex(src);
    token ok = lex.scan(0);
    token semi = lex.scan(ok.end);
    try {
        (void)lex.scan(semi.end);
        FAIL() << "expected syntax_error";
    } catch(syntax_error& e) {
        EXPECT_EQ(e.offset, 6u);
        EXPECT_EQ(e.line, -1);
        e.locate(src);
        EXPECT_EQ(e.line, 2);
        EXPECT_EQ(e.col, 3);
    }
    EXPECT_THROW(Lexer("/* open").scan(0), syntax_error);
    EXPECT_THROW(Lexer("a \x01").scan(1), syntax_error);
}

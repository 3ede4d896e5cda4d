// Recursive-descent TypeScript/TSX parser behind ppass::syntax::Parser.
// Split across parser.cpp (statements), parser_expressions.cpp, parser_types.cpp and parser_jsx.cpp.
#pragma once
#include "ppass/syntax/ast.hpp"
#include "ppass/syntax/lexer.hpp"
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace ppass::syntax {

class ParserImpl {
public:
    ParserImpl(std::string_view src, bool jsx);

    node_ptr parse_program();

private:
    struct InScope {
        InScope(bool& flag, bool v) : flag_(flag), saved_(flag) { flag_ = v; }
        ~InScope(){ flag_ = saved_; }
        InScope(const InScope&) = delete;
        InScope& operator=(const InScope&) = delete;
        bool& flag_;
        bool saved_;
    };

    struct state {
        token tok;
        std::uint32_t prev_end;
        bool allow_in;
    };

    // token stream
    void next();
    std::string_view text() const { return lex_.text(tok_); }
    bool is_punct(std::string_view p) const { return tok_.kind == token_kind::Punct && text() == p; }
    bool is_ident() const { return tok_.kind == token_kind::Identifier; }
    bool is_ident(std::string_view kw) const { return tok_.kind == token_kind::Identifier && text() == kw; }
    bool is_punct(const token& t, std::string_view p) const { return t.kind == token_kind::Punct && lex_.text(t) == p; }
    bool is_ident(const token& t, std::string_view kw) const { return t.kind == token_kind::Identifier && lex_.text(t) == kw; }
    token peek() const { return lex_.scan(tok_.end); }
    bool eat(std::string_view p);
    void expect(std::string_view p);
    [[noreturn]] void unexpected() const;
    void consume_semicolon();

    state save() const { return state{tok_, prev_end_, allow_in_}; }
    void restore(const state& s){ tok_ = s.tok; prev_end_ = s.prev_end; allow_in_ = s.allow_in; }

    node_ptr open(node_kind k, std::uint32_t begin, std::string value = {}) const;
    node_ptr close(node_ptr n) const;

    // statements
    node_ptr parse_statement_list_item();
    node_ptr parse_statement();
    node_ptr parse_block(node_kind kind = node_kind::Block);
    void parse_statements_until_brace(node& parent);
    node_ptr parse_variable_statement(std::uint32_t begin, bool for_head);
    node_ptr parse_variable_declarator();
    node_ptr parse_binding_target();
    node_ptr parse_function(std::uint32_t begin, node_kind kind, bool is_async);
    node_ptr parse_function_body();
    node_ptr parse_parameter_list();
    node_ptr parse_parameter();
    node_ptr parse_class(std::uint32_t begin, node_kind kind, std::vector<node_ptr> decorators);
    node_ptr parse_class_member();
    std::vector<node_ptr> parse_decorators();
    node_ptr parse_property_name(bool& computed);
    node_ptr parse_import_declaration(std::uint32_t begin);
    node_ptr parse_export_declaration(std::uint32_t begin, std::vector<node_ptr> decorators);
    void skip_import_attributes();
    node_ptr parse_if_statement();
    node_ptr parse_for_statement();
    node_ptr parse_switch_statement();
    node_ptr parse_try_statement();
    node_ptr parse_enum(std::uint32_t begin);
    node_ptr parse_namespace(std::uint32_t begin);
    node_ptr parse_ts_declaration(std::uint32_t begin);
    bool at_declaration_start() const;
    bool at_variable_start() const;

    // expressions
    node_ptr parse_expression();
    node_ptr parse_assignment();
    node_ptr try_parse_arrow();
    node_ptr parse_arrow_body();
    node_ptr parse_yield();
    node_ptr parse_conditional();
    node_ptr parse_binary(int min_prec);
    int binary_precedence() const;
    node_ptr parse_unary();
    node_ptr parse_postfix();
    node_ptr parse_suffixes(std::uint32_t begin, node_ptr expr, bool allow_call);
    node_ptr parse_new();
    node_ptr parse_primary();
    node_ptr parse_identifier();
    node_ptr parse_member_name();
    node_ptr parse_template();
    node_ptr parse_array_literal();
    node_ptr parse_object_literal();
    node_ptr parse_object_member();
    node_ptr parse_spread();
    void parse_arguments(node& call);
    bool starts_expression(const token& t) const;
    bool yield_is_keyword() const;

    // types: consumed, never materialized
    void skip_type();
    void skip_union_type();
    void skip_type_operand();
    void skip_primary_type();
    void skip_type_arguments();
    void skip_type_parameters();
    void skip_type_annotation();
    void skip_return_type();
    void skip_balanced();

    // jsx
    node_ptr parse_jsx_element(bool as_child);
    void parse_jsx_name();
    void finish_jsx_tag(bool as_child);

    Lexer lex_;
    bool jsx_;
    token tok_{};
    std::uint32_t prev_end_ = 0;
    bool allow_in_ = true;
    std::unordered_set<std::uint32_t> not_arrow_;
};

} // namespace ppass::syntax

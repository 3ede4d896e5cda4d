#pragma once
#include "ppass/syntax/ast.hpp"
#include "ppass/syntax/lexer.hpp"
#include <string>
#include <string_view>

namespace ppass::syntax {

struct ParseResult {
    bool success{false};
    node_ptr program;          // Program node when success
    std::string error_message; // If !success, human-readable message
    int line{0};
    int column{0};
};

class Parser {
public:
    // jsx=false parses plain TypeScript, where `<T>expr` is a type assertion.
    explicit Parser(bool jsx = true) : jsx_(jsx) {}

    // Throws syntax_error on the first error.
    node_ptr parse(std::string_view src) const;

    // Non-throwing form.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;

private:
    bool jsx_;
};

} // namespace ppass::syntax

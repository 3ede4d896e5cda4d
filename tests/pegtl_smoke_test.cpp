#include <cassert>
#include <iostream>
#include <string>
#include <tao/pegtl.hpp>
#include "token_grammar.hpp"

namespace pegtl = tao::pegtl;
namespace grammar = ppass::syntax::grammar;

template<class Rule>
static std::size_t consumed(const std::string& text){
    pegtl::memory_input in(text, "pegtl-smoke");
    if(!pegtl::parse<Rule>(in)) return std::string::npos;
    return static_cast<std::size_t>(in.current() - text.data());
}

void run_pegtl_smoke_test(){
    std::cout << "[smoke] token grammar...\n";
    assert(consumed<grammar::identifier>("runOn(") == 5);
    assert(consumed<grammar::identifier>("$el_2 x") == 5);
    assert(consumed<grammar::identifier>("9abc") == std::string::npos);
    assert(consumed<grammar::numeric_literal>("1_000n;") == 6);
    assert(consumed<grammar::numeric_literal>("0xFFp") == std::string::npos);
    assert(consumed<grammar::string_literal>("\"a\\\"b\" rest") == 6);
    assert(consumed<grammar::trivia>("  // c\n/* d */x") == 14);
    assert(consumed<grammar::punctuator>("?.x") == 2);
    assert(consumed<grammar::punctuator>("?.5") == 1);
    assert(consumed<grammar::greater_op>(">>>=") == 4);
    {
        bool threw = false;
        try {
            (void)consumed<grammar::string_literal>("\"open\nnext\"");
        } catch(const pegtl::parse_error&) {
            threw = true; // a string may not run past the end of its line
        }
        assert(threw);
    }
    {
        bool threw = false;
        try {
            (void)consumed<grammar::block_comment>("/* never closed");
        } catch(const pegtl::parse_error&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "[smoke] token grammar passed\n";
}

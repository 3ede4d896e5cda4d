#include "ppass/syntax/printer.hpp"
#include <stdexcept>

namespace ppass::syntax {

namespace {

class Printer {
public:
    explicit Printer(std::string_view src) : src_(src) { out_.reserve(src.size()); }

    void emit(const node& n){
        if(n.synthetic) emit_synthetic(n);
        else emit_parsed(n);
    }

    std::string take(){ return std::move(out_); }

private:
    void emit_parsed(const node& n){
        std::uint32_t cursor = n.range.begin;
        for(const auto& c : n.children){
            if(!c) continue;
            if(c->range.begin > cursor) out_.append(src_.substr(cursor, c->range.begin - cursor));
            emit(*c);
            if(c->range.end > cursor) cursor = c->range.end;
        }
        if(n.range.end > cursor) out_.append(src_.substr(cursor, n.range.end - cursor));
    }

    std::size_t original_newlines(const node& n) const {
        if(!n.preserve_lines || n.range.end <= n.range.begin) return 0;
        return count_newlines(src_.substr(n.range.begin, n.range.end - n.range.begin));
    }

    void emit_list(const node& n, std::size_t first, const char* open, const char* close){
        out_ += open;
        for(std::size_t i = first; i < n.children.size(); ++i){
            if(i > first) out_ += ", ";
            emit(*n.children[i]);
        }
        out_ += close;
    }

    void emit_synthetic(const node& n){
        if(n.leading_semicolon) out_ += ';';
        std::size_t start = out_.size();
        switch(n.kind){
            case node_kind::Erased:
                if(n.braces) out_ += '{';
                out_.append(original_newlines(n), '\n');
                if(n.braces) out_ += '}';
                return;
            case node_kind::Block:
                out_ += '{';
                out_.append(original_newlines(n), '\n');
                out_ += '}';
                return;
            case node_kind::Identifier:
                out_ += n.value;
                break;
            case node_kind::CallExpression:
                emit(*n.children.front());
                emit_list(n, 1, "(", ")");
                break;
            case node_kind::Parenthesized:
                out_ += '(';
                emit(*n.children.front());
                out_ += ')';
                break;
            case node_kind::ParameterList:
                emit_list(n, 0, "(", ")");
                break;
            case node_kind::ArrowFunction:
                if(n.is_async) out_ += "async ";
                emit(*n.children.front());
                out_ += " => ";
                emit(*n.children.back());
                break;
            default:
                throw std::logic_error(std::string("no code generation for synthetic ") + kind_name(n.kind));
        }
        std::size_t produced = count_newlines(std::string_view(out_).substr(start));
        std::size_t wanted = original_newlines(n);
        if(wanted > produced) out_.append(wanted - produced, '\n');
    }

    std::string_view src_;
    std::string out_;
};

} // namespace

std::string generate(const node& root, std::string_view source){
    Printer p(source);
    p.emit(root);
    return p.take();
}

} // namespace ppass::syntax

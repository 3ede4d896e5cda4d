#include "ppass/directives.hpp"
#include <algorithm>

namespace ppass {

std::vector<DirectiveBlock> scan_blocks(std::string_view source){
    std::vector<DirectiveBlock> out;
    std::size_t pos = 0;
    while(pos < source.size()){
        auto s = source.find(directive_start, pos);
        if(s == std::string_view::npos) break;
        auto tag_begin = s + directive_start.size();
        auto quote = source.find('"', tag_begin);
        if(quote == std::string_view::npos) break;     // no later start can close its tag either
        if(quote == tag_begin){ pos = s + 1; continue; } // empty tag is not a marker
        auto e = source.find(directive_end, quote + 1);
        if(e == std::string_view::npos) break;          // MarkerMismatch: rest passes through
        DirectiveBlock b;
        b.tag = std::string(source.substr(tag_begin, quote - tag_begin));
        b.begin = s;
        b.inner_begin = quote + 1;
        b.inner_end = e;
        b.end = e + directive_end.size();
        out.push_back(std::move(b));
        pos = out.back().end;
    }
    return out;
}

std::vector<std::size_t> unmatched_markers(std::string_view source){
    auto blocks = scan_blocks(source);
    std::vector<std::size_t> out;
    auto is_boundary = [&](std::size_t off){
        return std::any_of(blocks.begin(), blocks.end(), [&](const DirectiveBlock& b){ return b.begin == off || b.inner_end == off; });
    };
    for(auto p = source.find(directive_start); p != std::string_view::npos; p = source.find(directive_start, p + 1))
        if(!is_boundary(p)) out.push_back(p);
    for(auto p = source.find(directive_end); p != std::string_view::npos; p = source.find(directive_end, p + 1))
        if(!is_boundary(p)) out.push_back(p);
    std::sort(out.begin(), out.end());
    return out;
}

std::string resolve_blocks(std::string_view source, PlatformTarget target){
    auto blocks = scan_blocks(source);
    if(blocks.empty()) return std::string(source);
    std::string out;
    out.reserve(source.size());
    std::size_t cursor = 0;
    for(const auto& b : blocks){
        out.append(source.substr(cursor, b.begin - cursor));
        if(accepts(target, b.tag)){
            // a tag can only span lines when it is malformed, and then it never matches
            out.append(source.substr(b.inner_begin, b.inner_end - b.inner_begin));
        } else {
            auto region = source.substr(b.begin, b.end - b.begin);
            out.append(static_cast<std::size_t>(std::count(region.begin(), region.end(), '\n')), '\n');
        }
        cursor = b.end;
    }
    out.append(source.substr(cursor));
    return out;
}

} // namespace ppass

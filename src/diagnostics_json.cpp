#include "ppass/diagnostics_json.hpp"
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string_view>

namespace ppass {

namespace {

const char hex_digits[] = "0123456789abcdef";

// Quoted JSON string. Bytes >= 0x80 pass through; sources are UTF-8.
void put_string(std::ostream& os, std::string_view s){
    os << '"';
    for(char c : s){
        switch(c){
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default: {
                auto u = static_cast<unsigned char>(c);
                if(u < 0x20 || u == 0x7f) os << "\\u00" << hex_digits[u >> 4] << hex_digits[u & 0xf];
                else os << c;
            }
        }
    }
    os << '"';
}

void put_diagnostic(std::ostream& os, const Diagnostic& d){
    os << "{\"code\":";    put_string(os, d.code);
    os << ",\"message\":"; put_string(os, d.message);
    os << ",\"hint\":";    put_string(os, d.hint);
    os << ",\"path\":";    put_string(os, d.path);
    os << ",\"line\":" << d.line << ",\"col\":" << d.col << "}";
}

void put_list(std::ostream& os, const std::vector<Diagnostic>& list){
    os << "[";
    for(std::size_t i = 0; i < list.size(); ++i){
        if(i) os << ",";
        put_diagnostic(os, list[i]);
    }
    os << "]";
}

} // namespace

std::string json_escape(const std::string& s){
    std::ostringstream os;
    put_string(os, s);
    return os.str();
}

std::string diagnostic_to_json(const Diagnostic& d){
    std::ostringstream os;
    put_diagnostic(os, d);
    return os.str();
}

std::string diagnostics_to_json(const TransformResult& r){
    std::ostringstream os;
    os << "{\"success\":" << (r.success ? "true" : "false") << ",\"errors\":";
    put_list(os, r.errors);
    os << ",\"warnings\":";
    put_list(os, r.warnings);
    os << "}";
    return os.str();
}

void maybe_print_json(const TransformResult& r){
    const char* env = std::getenv("PPASS_DIAG_JSON");
    if(!env || env[0] != '1') return;
    std::fprintf(stderr, "%s\n", diagnostics_to_json(r).c_str());
}

} // namespace ppass

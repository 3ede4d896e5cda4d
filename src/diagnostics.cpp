#include "ppass/diagnostics.hpp"
#include <cstdio>
#include <sstream>

namespace ppass {

std::string format_diagnostic(Severity s, const Diagnostic& d){
    std::ostringstream os;
    os << "[ppass]";
    switch(s){
        case Severity::Debug: os << "[debug] "; break;
        case Severity::Warning: os << "[warn] "; break;
        case Severity::Error: os << "[error] "; break;
    }
    if(!d.path.empty()){
        os << d.path;
        if(d.line >= 0) os << ":" << d.line << ":" << d.col;
        os << ": ";
    }
    os << d.message;
    if(!d.code.empty()) os << " (" << d.code << ")";
    if(!d.hint.empty()) os << "\n  hint: " << d.hint;
    return os.str();
}

void DiagnosticSink::print_to_stderr(Severity s, const Diagnostic& d){
    auto line = format_diagnostic(s, d);
    std::fprintf(stderr, "%s\n", line.c_str());
}

void DiagnosticSink::emit(Severity s, const Diagnostic& d) const {
    if(s == Severity::Debug && !debug_) return;
    if(handler_) handler_(s, d);
    else print_to_stderr(s, d);
}

void DiagnosticSink::debug(const std::string& path, const std::string& message) const {
    if(!debug_) return;
    Diagnostic d; d.path = path; d.message = message;
    emit(Severity::Debug, d);
}

} // namespace ppass

// Diagnostics shared by every phase: structured records, a reporter, and the host-facing sink.
#pragma once
#include <functional>
#include <string>
#include <vector>

namespace ppass {

enum class Severity { Debug, Warning, Error };

struct Diagnostic {
    std::string code;    // e.g. W3101
    std::string message;
    std::string hint;
    std::string path;
    int line=-1;
    int col=-1;
};

// Codes:
//   W3101 / E3101 dispatch rewrite skipped: parse failure
//   W3201 / E3201 server sanitizer skipped: parse failure
//   E3002        unmatched @platform marker (strict mode only)
namespace codes {
inline constexpr const char* dispatch_parse = "3101";
inline constexpr const char* sanitize_parse = "3201";
inline constexpr const char* unmatched_marker = "3002";
} // namespace codes

// Host logging channel. The default forwards to stderr; hosts may install their own.
class DiagnosticSink {
public:
    using Handler = std::function<void(Severity, const Diagnostic&)>;

    DiagnosticSink() = default;
    explicit DiagnosticSink(Handler h) : handler_(std::move(h)) {}

    void emit(Severity s, const Diagnostic& d) const;
    void debug(const std::string& path, const std::string& message) const;

    bool debug_enabled() const { return debug_; }
    DiagnosticSink& set_debug(bool on){ debug_ = on; return *this; }

    // Prints "[ppass][warn] path:line:col: message (code)" style lines to stderr.
    static void print_to_stderr(Severity s, const Diagnostic& d);

private:
    Handler handler_{};
    bool debug_{false};
};

// Collects into the result vectors and forwards to the sink, mirroring how the type
// checker's ErrorReporter fills TypeCheckResult.
struct Reporter {
    std::vector<Diagnostic>* errors=nullptr;
    std::vector<Diagnostic>* warnings=nullptr;
    const DiagnosticSink* sink=nullptr;

    void emit_error(const Diagnostic& d){ if(errors) errors->push_back(d); if(sink) sink->emit(Severity::Error, d); }
    void emit_warning(const Diagnostic& d){ if(warnings) warnings->push_back(d); if(sink) sink->emit(Severity::Warning, d); }
    void debug(const std::string& path, const std::string& message) const { if(sink) sink->debug(path, message); }
};

std::string format_diagnostic(Severity s, const Diagnostic& d);

} // namespace ppass

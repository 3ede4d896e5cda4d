#include "ppass/pipeline.hpp"
#include "ppass/directives.hpp"
#include "ppass/dispatch.hpp"
#include "ppass/sanitize.hpp"
#include "ppass/syntax/lexer.hpp"
#include <chrono>

namespace ppass {

static bool has_directive_marker(std::string_view source){
    return source.find("@platform \"") != std::string_view::npos;
}

static bool sanitizer_applies(std::string_view source, PlatformTarget target, const TransformOptions& options){
    return is_client_target(target) && !options.preserve_server_declarations && has_server_tokens(source);
}

bool needs_transform(std::string_view source, PlatformTarget target, const TransformOptions& options){
    return has_directive_marker(source) || has_dispatch_token(source, options.dispatch_namespace) ||
           sanitizer_applies(source, target, options);
}

TransformResult transform_module(std::string_view source, PlatformTarget target,
                                 const TransformOptions& options, const DiagnosticSink& sink){
    TransformResult r;
    DiagnosticSink local = sink;
    local.set_debug(sink.debug_enabled() || options.debug);
    Reporter reporter{&r.errors, &r.warnings, &local};

    if(!needs_transform(source, target, options)){
        r.code = std::string(source);
        return r;
    }

    auto started = std::chrono::steady_clock::now();
    try {
        std::string code(source);
        if(has_directive_marker(code)){
            if(options.strict){
                for(auto off : unmatched_markers(code)){
                    Diagnostic d;
                    d.code = std::string("E") + codes::unmatched_marker;
                    d.message = "@platform marker without a matching partner";
                    d.hint = "every // @platform \"<tag>\" needs a // @platform end after it";
                    d.path = options.path;
                    syntax::line_col_at(code, off, d.line, d.col);
                    reporter.emit_error(d);
                }
            }
            code = resolve_blocks(code, target);
        }
        code = rewrite_dispatch(code, target, options, reporter);
        if(sanitizer_applies(code, target, options)) code = sanitize_server_boundary(code, options, reporter);
        r.code = std::move(code);
    } catch(const std::exception& e) {
        Diagnostic d;
        d.code = std::string(options.strict ? "E" : "W") + codes::sanitize_parse;
        d.message = std::string("transform skipped: ") + e.what();
        d.path = options.path;
        if(options.strict) reporter.emit_error(d);
        else reporter.emit_warning(d);
        r.code = std::string(source);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    reporter.debug(options.path, std::string("transformed for ") + std::string(target_name(target)) + " in " +
                                 std::to_string(elapsed.count()) + "us");
    r.success = r.errors.empty();
    return r;
}

std::string transform(std::string_view source, PlatformTarget target){
    TransformOptions options;
    try {
        return transform_module(source, target, options).code;
    } catch(const std::exception& e) {
        DiagnosticSink::print_to_stderr(Severity::Warning, Diagnostic{"", std::string("transform failed: ") + e.what(), "", options.path});
        return std::string(source);
    }
}

} // namespace ppass

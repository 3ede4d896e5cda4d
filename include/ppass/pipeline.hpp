// Public entry point: resolve platform blocks, then runOn() calls, then strip server
// declarations for client targets.
#pragma once
#include "ppass/diagnostics.hpp"
#include "ppass/options.hpp"
#include "ppass/platform.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace ppass {

struct TransformResult {
    bool success{true};
    std::string code;
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;
};

// Default options, fail-open. Never throws.
std::string transform(std::string_view source, PlatformTarget target);

// Same pipeline with explicit options; diagnostics are collected in the result and forwarded
// to `sink`. `success` is false only for errors (strict mode).
TransformResult transform_module(std::string_view source, PlatformTarget target,
                                 const TransformOptions& options,
                                 const DiagnosticSink& sink = DiagnosticSink{});

// True when at least one phase could change `source` for `target`.
bool needs_transform(std::string_view source, PlatformTarget target, const TransformOptions& options);

} // namespace ppass

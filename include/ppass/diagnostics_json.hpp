// diagnostics_json.hpp - JSON serialization for TransformResult diagnostics
#pragma once
#include "ppass/pipeline.hpp"
#include <string>

namespace ppass {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"code":..,"message":..,"hint":..,"path":..,"line":..,"col":..}
std::string diagnostic_to_json(const Diagnostic& d);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const TransformResult& r);

// If PPASS_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const TransformResult& r);

} // namespace ppass

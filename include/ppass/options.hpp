#pragma once
#include <optional>
#include <string>

namespace ppass {

enum class SourceLanguage { Ts, Tsx };

struct TransformOptions {
    std::string path{"<memory>"};                 // only used in diagnostics
    SourceLanguage language{SourceLanguage::Tsx};
    std::string dispatch_namespace{"springboard"};
    bool preserve_server_declarations{false};
    bool strict{false};                           // parse failures and stray markers become errors
    bool debug{false};
};

// Reads process env vars and constructs TransformOptions:
//   PPASS_DEBUG=1, PPASS_STRICT=1, PPASS_PRESERVE_SERVER=1,
//   PPASS_DISPATCH_NAMESPACE=<ident>, PPASS_LANG=ts|tsx
TransformOptions detect_options();

// "ts" or "tsx", any case.
std::optional<SourceLanguage> parse_language(std::string name);

// .ts/.mts/.cts parse without JSX; everything else with it.
SourceLanguage language_for_path(const std::string& path);

// A valid PPASS_LANG wins over the file extension.
SourceLanguage language_for_input(const std::string& path);

} // namespace ppass

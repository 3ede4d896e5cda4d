#include "ppass/options.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace ppass {

static bool ends_with(const std::string& s, const char* suffix){
    std::string suf(suffix);
    return s.size() >= suf.size() && s.compare(s.size()-suf.size(), suf.size(), suf) == 0;
}

static bool truthy(const char* v){
    return v[0]=='1'||v[0]=='y'||v[0]=='Y'||v[0]=='t'||v[0]=='T';
}

static const char* get_env(const char* k){
    const char* v = std::getenv(k);
    return (v && *v) ? v : nullptr;
}

std::optional<SourceLanguage> parse_language(std::string name){
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (name == "ts") return SourceLanguage::Ts;
    if (name == "tsx") return SourceLanguage::Tsx;
    return std::nullopt;
}

TransformOptions detect_options(){
    TransformOptions o{};

    if (const char* v = get_env("PPASS_DEBUG")) o.debug = truthy(v);
    if (const char* v = get_env("PPASS_STRICT")) o.strict = truthy(v);
    if (const char* v = get_env("PPASS_PRESERVE_SERVER")) o.preserve_server_declarations = truthy(v);
    if (const char* v = get_env("PPASS_DISPATCH_NAMESPACE")) o.dispatch_namespace = v;

    if (const char* v = get_env("PPASS_LANG")) {
        if (auto lang = parse_language(v)) o.language = *lang;
    }
    return o;
}

SourceLanguage language_for_path(const std::string& path){
    if(ends_with(path, ".ts") || ends_with(path, ".mts") || ends_with(path, ".cts")) return SourceLanguage::Ts;
    return SourceLanguage::Tsx;
}

SourceLanguage language_for_input(const std::string& path){
    if (const char* v = get_env("PPASS_LANG")) {
        if (auto lang = parse_language(v)) return *lang;
    }
    return language_for_path(path);
}

} // namespace ppass

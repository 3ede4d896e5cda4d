#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "ppass/diagnostics_json.hpp"
#include "ppass/pipeline.hpp"

static std::string read_all(std::istream& is){
    std::ostringstream ss; ss << is.rdbuf(); return ss.str();
}

static bool ends_with(const std::string& s, const std::string& suffix){
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// .js .jsx .ts .tsx .mts .cts
static bool is_script_path(const std::string& path){
    for(const char* ext : {".js", ".jsx", ".ts", ".tsx", ".mts", ".cts"})
        if(ends_with(path, ext)) return true;
    return false;
}

static void usage(){
    std::cerr << "usage: ppassc --target <name> [--out <file>] [--strict] [--preserve-server]\n"
                 "              [--namespace <ident>] [--lang ts|tsx] [--debug] <input-file>\n"
                 "targets:";
    for(auto t : ppass::all_targets) std::cerr << " " << ppass::target_name(t);
    std::cerr << "\n";
}

int main(int argc, char** argv){
    try{
        ppass::TransformOptions options = ppass::detect_options();
        std::string target_arg, out_path, input, lang_arg;
        for(int i = 1; i < argc; ++i){
            std::string a = argv[i];
            auto value = [&](const char* flag) -> std::string {
                if(i + 1 >= argc){ std::cerr << "ppassc: " << flag << " needs a value\n"; return {}; }
                return argv[++i];
            };
            if(a == "--target") target_arg = value("--target");
            else if(a == "--out") out_path = value("--out");
            else if(a == "--namespace") options.dispatch_namespace = value("--namespace");
            else if(a == "--lang") lang_arg = value("--lang");
            else if(a == "--strict") options.strict = true;
            else if(a == "--preserve-server") options.preserve_server_declarations = true;
            else if(a == "--debug") options.debug = true;
            else if(a == "--help" || a == "-h"){ usage(); return 0; }
            else if(!a.empty() && a[0] == '-'){ std::cerr << "ppassc: unknown option '" << a << "'\n"; usage(); return 2; }
            else if(input.empty()) input = a;
            else { std::cerr << "ppassc: more than one input file\n"; return 2; }
        }
        if(input.empty() || target_arg.empty()){ usage(); return 2; }
        auto target = ppass::parse_target(target_arg);
        if(!target){ std::cerr << "ppassc: unknown target '" << target_arg << "'\n"; usage(); return 2; }
        if(options.dispatch_namespace.empty()){ std::cerr << "ppassc: empty --namespace\n"; return 2; }

        std::ifstream f(input, std::ios::binary);
        if(!f){ std::cerr << "ppassc: cannot open '" << input << "'\n"; return 2; }
        const auto src = read_all(f);

        options.path = input;
        if(lang_arg.empty()){
            options.language = ppass::language_for_input(input);
        } else if(auto lang = ppass::parse_language(lang_arg)){
            options.language = *lang;
        } else {
            std::cerr << "ppassc: --lang must be ts or tsx\n";
            return 2;
        }

        ppass::TransformResult res;
        if(is_script_path(input)) res = ppass::transform_module(src, *target, options);
        else res.code = src;
        ppass::maybe_print_json(res);

        if(out_path.empty()){
            std::cout << res.code;
        } else {
            std::ofstream out(out_path, std::ios::binary);
            if(!out){ std::cerr << "ppassc: cannot write '" << out_path << "'\n"; return 2; }
            out << res.code;
        }
        return res.success ? 0 : 1;
    } catch(const std::exception& e){
        std::cerr << "ppassc: exception: " << e.what() << "\n";
        return 2;
    }
}

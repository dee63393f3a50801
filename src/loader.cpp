#include "flashdeck/loader.hpp"
#include "flashdeck/diagnostics_json.hpp"
#include "pegtl/grammar.hpp"
#include <tao/pegtl.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace flashdeck {

std::optional<std::string> read_text_file(const std::string& path){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) return std::nullopt;
    std::ostringstream oss;
    if(ifs.peek()!=std::ifstream::traits_type::eof()) oss << ifs.rdbuf();
    if(ifs.bad()) return std::nullopt;
    return oss.str();
}

bool is_valid_utf8(const std::string& bytes){
    tao::pegtl::memory_input<> in(bytes, "utf8");
    return tao::pegtl::parse< grammar::utf8_text >(in);
}

ParseResult load_deck_file(const std::string& path, const ParseOptions& opts){
    auto bytes = read_text_file(path);
    if(!bytes){
        ParseResult r; r.failure = FailureKind::IoError; r.error_message = "cannot open '" + path + "'";
        if(opts.trace) std::fprintf(stderr, "[dbg][load] path=%s error=open\n", path.c_str());
        return r;
    }
    static const std::string bom = "\xEF\xBB\xBF";
    if(bytes->compare(0, bom.size(), bom)==0) bytes->erase(0, bom.size());
    if(!is_valid_utf8(*bytes)){
        ParseResult r; r.failure = FailureKind::IoError; r.error_message = "'" + path + "' is not valid UTF-8";
        if(opts.trace) std::fprintf(stderr, "[dbg][load] path=%s error=encoding\n", path.c_str());
        return r;
    }
    if(opts.trace) std::fprintf(stderr, "[dbg][load] path=%s bytes=%zu partial=%d\n", path.c_str(), bytes->size(), opts.partial_load? 1:0);

    LineParser parser(opts);
    ParseResult r = parser.parse_string(*bytes);
    maybe_print_json(r);
    return r;
}

} // namespace flashdeck

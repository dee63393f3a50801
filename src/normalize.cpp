#include "flashdeck/normalize.hpp"
#include "pegtl/actions.hpp"
#include "pegtl/grammar.hpp"
#include <tao/pegtl.hpp>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace flashdeck {

namespace pegtl = tao::pegtl;
using namespace flashdeck::pegtl_front;

namespace {

const char* code_point_name(std::uint32_t cp){
    switch(cp){
        case 0x0009: return "tab";
        case 0x00A0: return "non-breaking space";
        case 0x202F: return "narrow non-breaking space";
        case 0x3000: return "ideographic space";
        case 0x200B: return "zero-width space";
        case 0x200C: return "zero-width non-joiner";
        case 0x200D: return "zero-width joiner";
        case 0x2060: return "word joiner";
        case 0xFEFF: return "byte order mark";
        case 0x2010: return "hyphen";
        case 0x2011: return "non-breaking hyphen";
        case 0x2012: return "figure dash";
        case 0x2013: return "en dash";
        case 0x2014: return "em dash";
        case 0x2015: return "horizontal bar";
        case 0x2212: return "minus sign";
        case 0x2E3A: return "two-em dash";
        case 0x2E3B: return "three-em dash";
        case 0xFE63: return "small hyphen-minus";
        case 0xFF0D: return "full-width hyphen-minus";
        default: return (cp>=0x2000 && cp<=0x200A)? "unicode space" : "character";
    }
}

std::string describe(const std::vector<std::uint32_t>& cps){
    std::ostringstream os;
    for(size_t i=0;i<cps.size();++i){
        if(i) os<<", ";
        char buf[16]; std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cps[i]));
        os<<code_point_name(cps[i])<<" ("<<buf<<")";
    }
    return os.str();
}

template<typename Rule, template<typename...> class Action>
rewrite_state rewrite(const std::string& line){
    rewrite_state st; st.out.reserve(line.size());
    pegtl::memory_input<> in(line, "line");
    if(!pegtl::parse< Rule, Action >(in, st)){
        st.out = line; st.replaced.clear(); st.count = 0;
    }
    return st;
}

template<typename Rule>
size_t prefix_length(const std::string& line){
    prefix_state st;
    pegtl::memory_input<> in(line, "line");
    return pegtl::parse< Rule, actions::prefix_action >(in, st)? st.length : 0;
}

bool is_space(char c){ return c==' ' || c=='\t'; }

} // namespace

std::string trim_copy(std::string_view s){
    size_t i=0, j=s.size();
    while(i<j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while(j>i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
    return std::string(s.substr(i, j-i));
}

RuleOutcome fix_unicode_spaces(const std::string& line){
    auto st = rewrite< grammar::space_scan, actions::space_action >(line);
    if(st.count==0) return RuleOutcome{line, std::nullopt, {}};
    std::string detail = "replaced " + describe(st.replaced) + " with regular spaces";
    return RuleOutcome{trim_copy(st.out), Issue::UnicodeSpaceFixed, std::move(detail)};
}

RuleOutcome normalize_dashes(const std::string& line){
    auto st = rewrite< grammar::dash_scan, actions::dash_action >(line);
    if(st.count==0) return RuleOutcome{line, std::nullopt, {}};
    std::string detail = "replaced " + describe(st.replaced) + " with '-'";
    return RuleOutcome{std::move(st.out), Issue::DashNormalized, std::move(detail)};
}

size_t leading_numbering_length(const std::string& line){ return prefix_length< grammar::numbering >(line); }
size_t leading_punctuated_numbering_length(const std::string& line){ return prefix_length< grammar::punctuated_numbering >(line); }

RuleOutcome strip_numbering(const std::string& line){
    size_t n = leading_numbering_length(line);
    if(n==0) return RuleOutcome{line, std::nullopt, {}};
    std::string prefix = trim_copy(std::string_view(line).substr(0, n));
    return RuleOutcome{line.substr(n), Issue::NumberingStripped, "removed leading numbering '" + prefix + "'"};
}

std::vector<size_t> separator_positions(const std::string& line){
    separator_state st;
    pegtl::memory_input<> in(line, "line");
    if(!pegtl::parse< grammar::separator_scan, actions::separator_action >(in, st)) return {};
    return st.positions;
}

SeparatorCandidates separator_candidates(const std::string& line){
    SeparatorCandidates c;
    size_t first = line.find_first_not_of(" \t");
    size_t last = line.find_last_not_of(" \t");
    if(first==std::string::npos) return c;
    for(size_t i=first+1;i<last;++i){
        if(line[i]!='-') continue;
        bool left = is_space(line[i-1]);
        bool right = is_space(line[i+1]);
        if(left && right) continue; // already " - "
        if(left || right){
            c.loose.push_back(i);
        }else{
            c.bare.push_back(i);
        }
    }
    return c;
}

RuleOutcome fix_separator_spacing(const std::string& line){
    if(!separator_positions(line).empty()) return RuleOutcome{line, std::nullopt, {}};
    auto c = separator_candidates(line);
    size_t pos = std::string::npos;
    if(c.loose.size()==1) pos = c.loose.front();
    else if(c.loose.empty() && c.bare.size()==1) pos = c.bare.front();
    if(pos==std::string::npos) return RuleOutcome{line, std::nullopt, {}};
    std::string left = trim_copy(std::string_view(line).substr(0, pos));
    std::string right = trim_copy(std::string_view(line).substr(pos+1));
    if(left.empty() || right.empty()) return RuleOutcome{line, std::nullopt, {}};
    std::string fixed = left + " - " + right;
    return RuleOutcome{fixed, Issue::SpacingFixed, "inserted spaces around separator hyphen: '" + fixed + "'"};
}

const std::vector<NormalizationRule>& normalization_rules(){
    static const std::vector<NormalizationRule> rules = {
        {"unicode-spaces", &fix_unicode_spaces},
        {"dashes", &normalize_dashes},
        {"numbering", &strip_numbering},
        {"separator-spacing", &fix_separator_spacing},
    };
    return rules;
}

bool is_skippable_line(const std::string& line){
    auto st = rewrite< grammar::space_scan, actions::space_action >(line);
    std::string t = trim_copy(st.out);
    return t.empty() || t.front()=='#';
}

} // namespace flashdeck

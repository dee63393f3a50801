#pragma once
#include "grammar.hpp"
#include <tao/pegtl.hpp>
#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace flashdeck::pegtl_front {

struct rewrite_state {
    std::string out;
    std::vector<std::uint32_t> replaced; // distinct code points, in order of first appearance
    size_t count{0};
    void note(std::uint32_t cp){
        ++count;
        if(std::find(replaced.begin(), replaced.end(), cp)==replaced.end()) replaced.push_back(cp);
    }
};

struct prefix_state { size_t length{0}; };

struct separator_state { std::vector<size_t> positions; };

// Decodes the first code point of a well-formed UTF-8 sequence (grammar already validated it).
inline std::uint32_t decode_utf8(std::string_view s){
    if(s.empty()) return 0;
    const auto b0 = static_cast<unsigned char>(s[0]);
    auto cont = [&](size_t i){ return static_cast<std::uint32_t>(static_cast<unsigned char>(s[i]) & 0x3F); };
    if(b0 < 0x80) return b0;
    if((b0 & 0xE0)==0xC0 && s.size()>=2) return ((b0 & 0x1Fu)<<6) | cont(1);
    if((b0 & 0xF0)==0xE0 && s.size()>=3) return ((b0 & 0x0Fu)<<12) | (cont(1)<<6) | cont(2);
    if((b0 & 0xF8)==0xF0 && s.size()>=4) return ((b0 & 0x07u)<<18) | (cont(1)<<12) | (cont(2)<<6) | cont(3);
    return b0;
}

namespace actions {
using namespace tao::pegtl;

template<typename Rule>
struct space_action : nothing<Rule> {};

template<> struct space_action< grammar::unicode_space > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, rewrite_state& st){ st.out += ' '; st.note(decode_utf8(in.string_view())); }
};
template<> struct space_action< grammar::invisible > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, rewrite_state& st){ st.note(decode_utf8(in.string_view())); }
};
template<> struct space_action< grammar::other_char > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, rewrite_state& st){ st.out.append(in.begin(), in.end()); }
};

template<typename Rule>
struct dash_action : nothing<Rule> {};

template<> struct dash_action< grammar::dash_variant > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, rewrite_state& st){ st.out += '-'; st.note(decode_utf8(in.string_view())); }
};
template<> struct dash_action< grammar::other_char > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, rewrite_state& st){ st.out.append(in.begin(), in.end()); }
};

template<typename Rule>
struct prefix_action : nothing<Rule> {};

template<> struct prefix_action< grammar::numbering > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, prefix_state& st){ st.length = in.size(); }
};
template<> struct prefix_action< grammar::punctuated_numbering > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, prefix_state& st){ st.length = in.size(); }
};

template<typename Rule>
struct separator_action : nothing<Rule> {};

template<> struct separator_action< grammar::separator > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, separator_state& st){ st.positions.push_back(in.position().byte); }
};

} // namespace actions
} // namespace flashdeck::pegtl_front

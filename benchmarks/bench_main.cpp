#include "flashdeck/line_parser.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_parse; size_t cards; size_t diagnostics; };

static RunResult bench_case(const char* name, const std::string &text){
    flashdeck::LineParser parser;
    auto t0 = Clock::now();
    auto r = parser.parse_string(text);
    auto t1 = Clock::now();
    if(!r.success){
        std::cerr << "[bench] case '" << name << "' failed: " << r.error_message << "\n";
        return {0.0, 0, 0};
    }
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    return { ms, r.deck.size(), r.diagnostics.size() };
}

int main(int argc, char** argv){
    int lines = argc > 1 ? std::atoi(argv[1]) : 5000;
    if(lines <= 0) lines = 5000;

    struct Case { const char* name; std::string text; };
    std::vector<Case> cases;

    std::string canonical, messy;
    for(int i=0;i<lines;++i){
        canonical += "terme " + std::to_string(i) + " - definition " + std::to_string(i) + "\n";
        // numbering, non-breaking spaces, en dashes and glued hyphens on every line
        messy += std::to_string(i+1) + ".\xC2\xA0mot" + std::to_string(i) + " \xE2\x80\x93 word" + std::to_string(i) + "\n";
        if(i % 50 == 0) messy += "# section " + std::to_string(i/50) + "\n\n";
    }
    cases.push_back({"canonical", canonical});
    cases.push_back({"auto_fixed", messy});

    for(auto &c : cases){
        auto r = bench_case(c.name, c.text);
        std::cout << c.name << ": " << r.ms_parse << " ms, cards=" << r.cards << ", diagnostics=" << r.diagnostics << "\n";
    }
    return 0;
}

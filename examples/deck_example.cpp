#include <iostream>
#include <random>
#include "flashdeck/diagnostics.hpp"
#include "flashdeck/diagnostics_json.hpp"
#include "flashdeck/line_parser.hpp"

// Parses an in-memory deck, prints the auto-corrections, then shows a shuffled order.
int main(){
    const char* text =
        "# greetings\n"
        "bonjour - hello\n"
        "1. merci - thank you\n"
        "au revoir-goodbye\n"
        "salut \xE2\x80\x94 hi\n";

    flashdeck::LineParser parser;
    auto r = parser.parse_string(text);
    std::cout << flashdeck::summary_message(r) << "\n\n";
    std::cout << flashdeck::format_console(r.diagnostics) << "\n";
    if(!r.success) return 1;

    std::mt19937 rng(2025);
    auto deck = flashdeck::shuffled(r.deck, rng);
    for(const auto& card : deck.cards()) std::cout << card.term << " -> " << card.definition << "\n";

    // Rejections are collected for every line before the load is refused
    auto bad = parser.parse_string("ok - fine\nterm - with - many - separators\nno separator\n");
    std::cout << "\n" << flashdeck::diagnostics_to_json(bad) << "\n";
    return 0;
}

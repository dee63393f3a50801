// session.hpp - the application session owning the single loaded Deck
#pragma once
#include "flashdeck/diagnostics.hpp"
#include "flashdeck/flashcard.hpp"
#include "flashdeck/line_parser.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace flashdeck {

class Session {
public:
    explicit Session(ParseOptions opts = ParseOptions::from_env());
    Session(ParseOptions opts, std::uint32_t seed);

    // Load a file. The deck is replaced on success and cleared on failure;
    // diagnostics always reflect this load.
    const ParseResult& open(const std::string& path);
    // Re-parse the last opened file so the debug console sees its full diagnostics.
    const ParseResult& reload();
    void shuffle();

    const Deck& deck() const { return deck_; }
    size_t size() const { return deck_.size(); }
    std::vector<std::string> terms() const { return deck_.terms(); }
    const Flashcard* card(size_t index) const { return deck_.at(index); }

    const ParseResult& last_result() const { return last_; }
    const std::vector<ParseDiagnostic>& diagnostics() const { return last_.diagnostics; }
    const std::string& last_path() const { return last_path_; }

private:
    ParseOptions opts_;
    std::mt19937 rng_;
    Deck deck_;
    ParseResult last_;
    std::string last_path_;
};

} // namespace flashdeck

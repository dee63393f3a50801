// flashcard.hpp - Flashcard and Deck value types
#pragma once
#include <cstddef>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace flashdeck {

struct Flashcard {
    std::string term;
    std::string definition;
};

inline bool operator==(const Flashcard& a, const Flashcard& b){ return a.term==b.term && a.definition==b.definition; }
inline bool operator!=(const Flashcard& a, const Flashcard& b){ return !(a==b); }
inline bool operator<(const Flashcard& a, const Flashcard& b){
    return a.term<b.term || (a.term==b.term && a.definition<b.definition);
}

// Ordered collection of cards currently loaded. Replaced wholesale on load or shuffle.
class Deck {
public:
    Deck() = default;
    explicit Deck(std::vector<Flashcard> cards): cards_(std::move(cards)) {}

    size_t size() const { return cards_.size(); }
    bool empty() const { return cards_.empty(); }
    // nullptr when index is out of range
    const Flashcard* at(size_t index) const { return index<cards_.size()? &cards_[index] : nullptr; }
    const std::vector<Flashcard>& cards() const { return cards_; }
    std::vector<std::string> terms() const;

    void push_back(Flashcard card){ cards_.push_back(std::move(card)); }
    void clear(){ cards_.clear(); }

private:
    std::vector<Flashcard> cards_;
};

// Uniform random permutation of the deck's cards. Content is never modified.
Deck shuffled(const Deck& deck, std::mt19937& rng);

} // namespace flashdeck

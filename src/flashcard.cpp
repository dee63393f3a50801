#include "flashdeck/flashcard.hpp"
#include <algorithm>

namespace flashdeck {

std::vector<std::string> Deck::terms() const {
    std::vector<std::string> out;
    out.reserve(cards_.size());
    for(const auto& c: cards_) out.push_back(c.term);
    return out;
}

Deck shuffled(const Deck& deck, std::mt19937& rng){
    std::vector<Flashcard> cards = deck.cards();
    std::shuffle(cards.begin(), cards.end(), rng);
    return Deck(std::move(cards));
}

} // namespace flashdeck

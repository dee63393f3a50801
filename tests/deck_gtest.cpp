#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>
#include "flashdeck/flashcard.hpp"

using flashdeck::Deck;
using flashdeck::Flashcard;

static Deck make_deck(int n){
    Deck d;
    for(int i=0;i<n;++i) d.push_back(Flashcard{"term" + std::to_string(i), "definition " + std::to_string(i)});
    return d;
}

static std::vector<Flashcard> sorted_cards(const Deck& d){
    auto v = d.cards();
    std::sort(v.begin(), v.end());
    return v;
}

TEST(DeckTest, IndexAccessAndTerms){
    Deck d = make_deck(3);
    ASSERT_EQ(d.size(), 3u);
    ASSERT_NE(d.at(2), nullptr);
    EXPECT_EQ(d.at(2)->definition, "definition 2");
    EXPECT_EQ(d.at(3), nullptr);
    EXPECT_EQ(d.terms(), (std::vector<std::string>{"term0", "term1", "term2"}));
}

TEST(DeckShuffleTest, IsPermutationOfSameCards){
    std::mt19937 rng(1234);
    Deck d = make_deck(20);
    d.push_back(Flashcard{"term0", "definition 0"}); // duplicates survive too
    for(int round=0; round<50; ++round){
        Deck s = flashdeck::shuffled(d, rng);
        ASSERT_EQ(s.size(), d.size());
        EXPECT_EQ(sorted_cards(s), sorted_cards(d));
    }
    // source deck is untouched
    EXPECT_EQ(d.at(0)->term, "term0");
    EXPECT_EQ(d.at(19)->term, "term19");
}

TEST(DeckShuffleTest, TrivialDecksAreFixedPoints){
    std::mt19937 rng(7);
    EXPECT_TRUE(flashdeck::shuffled(Deck{}, rng).empty());
    Deck one = make_deck(1);
    Deck s = flashdeck::shuffled(one, rng);
    ASSERT_EQ(s.size(), 1u);
    EXPECT_EQ(*s.at(0), *one.at(0));
}

TEST(DeckShuffleTest, RepeatedShufflesProduceDifferentOrders){
    std::mt19937 rng(42);
    Deck d = make_deck(8);
    std::set<std::vector<std::string>> orders;
    for(int i=0;i<20;++i) orders.insert(flashdeck::shuffled(d, rng).terms());
    EXPECT_GT(orders.size(), 10u);
}

TEST(DeckShuffleTest, RoughlyUniformOverPermutations){
    std::mt19937 rng(2024);
    Deck d = make_deck(3);
    std::map<std::vector<std::string>, int> counts;
    const int rounds = 6000;
    for(int i=0;i<rounds;++i) ++counts[flashdeck::shuffled(d, rng).terms()];
    ASSERT_EQ(counts.size(), 6u);
    for(const auto& kv : counts){
        EXPECT_GT(kv.second, 800);
        EXPECT_LT(kv.second, 1200);
    }
}

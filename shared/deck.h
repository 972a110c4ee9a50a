#pragma once

#include <cstddef>
#include <random>
#include <vector>

#include "cards.h"

// std::mt19937_64 has an extremely long period (2^19937 - 1), far beyond
// anything a Monte Carlo run will consume.
using RandomEngine = std::mt19937_64;

// Some number of full 52-card decks shuffled together with some jokers.
class Deck {
 public:
  // Throws std::invalid_argument if either count is negative.
  Deck(int decks, int jokers);

  std::size_t size() const { return items_.size(); }
  int decks() const { return decks_; }
  int jokers() const { return jokers_; }

  // Draws hand_size items uniformly without replacement.  The deck is
  // not depleted; every deal draws from the whole deck.
  // Throws std::invalid_argument if hand_size is larger than max_cards
  // or than the deck.
  Hand deal(int hand_size, RandomEngine &engine);

 private:
  int decks_;
  int jokers_;

  // Reordered in place by every deal.
  std::vector<Card> items_;
};

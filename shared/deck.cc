#include "deck.h"

#include <format>
#include <stdexcept>
#include <utility>

Deck::Deck(int decks, int jokers) : decks_(decks), jokers_(jokers) {
  if (decks < 0) {
    throw std::invalid_argument("number of decks is negative");
  }
  if (jokers < 0) {
    throw std::invalid_argument("number of jokers is negative");
  }

  items_.reserve(static_cast<std::size_t>(decks) * cards_per_deck + jokers);
  for (int d = 0; d < decks; ++d) {
    for (int s = 0; s < num_suits; ++s) {
      for (int r = 0; r < num_ranks; ++r) {
        items_.push_back(make_card(r, s));
      }
    }
  }
  for (int j = 0; j < jokers; ++j) {
    items_.push_back(Card::joker());
  }
}

Hand Deck::deal(int hand_size, RandomEngine &engine) {
  if (hand_size < 0 || hand_size > max_cards) {
    throw std::invalid_argument(
        std::format("hand size {} is outside 0..{}", hand_size, max_cards));
  }
  if (static_cast<std::size_t>(hand_size) > items_.size()) {
    throw std::invalid_argument(std::format(
        "cannot deal {} cards from a deck of {}", hand_size, items_.size()));
  }

  // Partial Fisher-Yates: after step i, items_[0..i] is a uniform sample
  // of i+1 items, and the whole vector is still a permutation of the deck.
  Hand result;
  const std::size_t n = items_.size();
  for (std::size_t i = 0; i < static_cast<std::size_t>(hand_size); ++i) {
    std::uniform_int_distribution<std::size_t> pick(i, n - 1);
    std::swap(items_[i], items_[pick(engine)]);

    const Card c = items_[i];
    if (c.is_joker()) {
      result.add_joker();
    } else {
      result.push_back(c);
    }
  }
  return result;
}

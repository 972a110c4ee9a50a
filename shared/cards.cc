#include "cards.h"

#include <stdexcept>
#include <string>

const char rank_image[] = "23456789TJQKA";

const char suit_image[] = "shcd";

void Hand::push_back(Card c) {
  if (size_ >= cards_.size()) {
    throw std::length_error("hand holds at most 12 cards");
  }
  cards_[size_++] = c;
}

RankCounts rank_counts(std::span<const Card> cards) {
  RankCounts result{/*init to */};
  for (const Card &c : cards) {
    ++result[c.rank];
  }
  return result;
}

SuitCounts suit_counts(std::span<const Card> cards) {
  SuitCounts result{/*init to */};
  for (const Card &c : cards) {
    ++result[c.suit];
  }
  return result;
}

StraightBitmap ranks_for_straight(std::span<const Card> cards) {
  StraightBitmap result{/*init to */};
  for (const Card &c : cards) {
    result[c.rank + 1] = 1;
  }
  result[0] = result[num_ranks];
  return result;
}

std::array<Hand, num_suits> split_by_suit(std::span<const Card> cards) {
  std::array<Hand, num_suits> result;
  for (const Card &c : cards) {
    result[c.suit].push_back(c);
  }
  return result;
}

std::string card_image(Card c) {
  if (c.is_joker()) {
    return "Jk";
  }
  std::string result;
  result.push_back(rank_image[c.rank]);
  result.push_back(suit_image[c.suit]);
  return result;
}

std::string hand_image(const Hand &hand) {
  std::string result;
  for (const Card &c : hand) {
    if (!result.empty()) {
      result.push_back(' ');
    }
    result.append(card_image(c));
  }
  for (int j = 0; j < hand.jokers(); ++j) {
    if (!result.empty()) {
      result.push_back(' ');
    }
    result.append(card_image(Card::joker()));
  }
  return result;
}

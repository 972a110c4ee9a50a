#pragma once

#include <span>

#include "cards.h"

// Hand category predicates.
//
// Every predicate answers one question: can the jokers be given ranks
// and suits so that cards plus jokers contain the category?  The
// predicates are independent; a hand may satisfy several of them, and
// each one sees the full joker count.  None of them enumerates joker
// assignments and none of them allocates.

// Some rank reaches n copies.
bool is_n_of_a_kind(std::span<const Card> cards, int n, int jokers);

// At least n disjoint pairs.  Four of a kind counts as two pairs.
bool is_n_pairs(std::span<const Card> cards, int n, int jokers);

inline bool is_two_pair(std::span<const Card> cards, int jokers) {
  return is_n_pairs(cards, 2, jokers);
}

inline bool is_three_pair(std::span<const Card> cards, int jokers) {
  return is_n_pairs(cards, 3, jokers);
}

// One group of n and a second group of m cards, n >= m.
// The second group may share the rank of the first if enough copies
// remain after the first group is set aside.
bool is_n_and_m_of_a_kind(std::span<const Card> cards, int n, int m,
                          int jokers);

inline bool is_full_house(std::span<const Card> cards, int jokers) {
  return is_n_and_m_of_a_kind(cards, 3, 2, jokers);
}

inline bool is_full_mansion(std::span<const Card> cards, int jokers) {
  return is_n_and_m_of_a_kind(cards, 4, 2, jokers);
}

inline bool is_two_triplet(std::span<const Card> cards, int jokers) {
  return is_n_and_m_of_a_kind(cards, 3, 3, jokers);
}

// size cards of one suit.
bool is_flush(std::span<const Card> cards, int jokers, int size);

// size cards of consecutive ranks.  The ace plays high or low, but a
// run never wraps through it (K-A-2 is not consecutive).
bool is_straight(std::span<const Card> cards, int jokers, int size);

// A straight of the given size inside a single suit.
bool is_straight_flush(std::span<const Card> cards, int jokers, int size);

// A full house inside a single suit.
bool is_flush_house(std::span<const Card> cards, int jokers);

// n of a kind inside a single suit.
bool is_flush_n(std::span<const Card> cards, int n, int jokers);

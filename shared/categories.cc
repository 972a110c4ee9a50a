#include "categories.h"

#include <algorithm>
#include <array>

#include "cards.h"

// Returns the number of jokers needed to lift count up to target.
static inline int shortfall(int count, int target) {
  return count >= target ? 0 : target - count;
}

bool is_n_of_a_kind(std::span<const Card> cards, int n, int jokers) {
  if (jokers >= n) {
    return true;
  }

  RankCounts counts{/*init to */};
  for (const Card &c : cards) {
    if (++counts[c.rank] + jokers >= n) {
      return true;
    }
  }
  return false;
}

bool is_n_pairs(std::span<const Card> cards, int n, int jokers) {
  // A joker that completes an odd card buys a pair; two jokers on their
  // own also buy a pair.  Completing odd cards first can never do worse.
  int pairs = 0;
  for (int count : rank_counts(cards)) {
    if ((count & 1) != 0 && jokers > 0) {
      --jokers;
      ++count;
    }
    pairs += count / 2;
  }
  pairs += jokers / 2;

  return pairs >= n;
}

bool is_n_and_m_of_a_kind(std::span<const Card> cards, int n, int m,
                          int jokers) {
  // Only the two tallest ranks matter.  Wild cards are interchangeable,
  // so building the larger group on the taller rank uses the fewest.
  int first = 0;
  int second = 0;
  for (const int count : rank_counts(cards)) {
    if (count > first) {
      second = first;
      first = count;
    } else if (count > second) {
      second = count;
    }
  }

  const int first_need = shortfall(first, n);
  if (first_need > jokers) {
    return false;
  }
  jokers -= first_need;

  // Whatever is left on the first rank may still back the second group.
  const int leftover = first + first_need - n;
  return shortfall(leftover, m) <= jokers || shortfall(second, m) <= jokers;
}

bool is_flush(std::span<const Card> cards, int jokers, int size) {
  const SuitCounts counts = suit_counts(cards);
  return std::any_of(counts.begin(), counts.end(),
                     [=](int count) { return count + jokers >= size; });
}

bool is_straight(std::span<const Card> cards, int jokers, int size) {
  const StraightBitmap ranks = ranks_for_straight(cards);
  const int cells = static_cast<int>(ranks.size());
  if (size > cells) {
    return false;
  }

  int window_sum = 0;
  for (int i = 0; i < size; ++i) {
    window_sum += ranks[i];
  }
  if (window_sum + jokers >= size) {
    return true;
  }

  for (int i = size; i < cells; ++i) {
    window_sum += ranks[i] - ranks[i - size];
    if (window_sum + jokers >= size) {
      return true;
    }
  }
  return false;
}

// The jokers are wild in both rank and suit, so every suit gets the
// whole joker count.
bool is_straight_flush(std::span<const Card> cards, int jokers, int size) {
  for (const Hand &suited : split_by_suit(cards)) {
    if (is_straight(suited.cards(), jokers, size)) {
      return true;
    }
  }
  return false;
}

bool is_flush_house(std::span<const Card> cards, int jokers) {
  for (const Hand &suited : split_by_suit(cards)) {
    if (is_full_house(suited.cards(), jokers)) {
      return true;
    }
  }
  return false;
}

bool is_flush_n(std::span<const Card> cards, int n, int jokers) {
  for (const Hand &suited : split_by_suit(cards)) {
    if (is_n_of_a_kind(suited.cards(), n, jokers)) {
      return true;
    }
  }
  return false;
}

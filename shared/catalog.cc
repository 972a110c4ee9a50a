#include "catalog.h"

#include <format>
#include <stdexcept>

#include "categories.h"

static Predicate n_of_a_kind(int n) {
  return [n](std::span<const Card> cards, int jokers) {
    return is_n_of_a_kind(cards, n, jokers);
  };
}

static Predicate straight(int size) {
  return [size](std::span<const Card> cards, int jokers) {
    return is_straight(cards, jokers, size);
  };
}

static Predicate flush(int size) {
  return [size](std::span<const Card> cards, int jokers) {
    return is_flush(cards, jokers, size);
  };
}

static Predicate straight_flush(int size) {
  return [size](std::span<const Card> cards, int jokers) {
    return is_straight_flush(cards, jokers, size);
  };
}

static Predicate flush_n(int n) {
  return [n](std::span<const Card> cards, int jokers) {
    return is_flush_n(cards, n, jokers);
  };
}

std::vector<Category> build_catalog(int hand_size) {
  std::vector<Category> result;
  result.emplace_back("Pair", n_of_a_kind(2));
  result.emplace_back("3 of a kind", n_of_a_kind(3));
  result.emplace_back("4 of a kind", n_of_a_kind(4));
  result.emplace_back("5 of a kind", n_of_a_kind(5));
  result.emplace_back("Two pair", is_two_pair);

  switch (hand_size) {
    case 5:
      result.emplace_back("Straight", straight(5));
      result.emplace_back("Flush", flush(5));
      result.emplace_back("Full house", is_full_house);
      result.emplace_back("Flush house", is_flush_house);
      result.emplace_back("Straight flush", straight_flush(5));
      result.emplace_back("Flush five", flush_n(5));
      break;

    case 6:
      result.emplace_back("Three pair", is_three_pair);
      result.emplace_back("6 of a kind", n_of_a_kind(6));
      result.emplace_back("Two triplet", is_two_triplet);
      result.emplace_back("Straight", straight(6));
      result.emplace_back("Flush", flush(6));
      result.emplace_back("Full mansion", is_full_mansion);
      result.emplace_back("Straight flush", straight_flush(6));
      result.emplace_back("Flush six", flush_n(6));
      break;

    default:
      throw std::invalid_argument(
          std::format("unsupported hand size {} (expected 5 or 6)", hand_size));
  }

  return result;
}

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

const int num_ranks = 13;
const int num_suits = 4;
const int cards_per_deck = num_ranks * num_suits;

// The largest number of items (cards plus jokers) in a hand.
const int max_cards = 12;

// Ranks run from the deuce (0) up to the ace (12).
enum rank_value {
  deuce,
  three,
  four,
  five,
  six,
  seven,
  eight,
  nine,
  ten,
  jack,
  queen,
  king,
  ace
};

extern const char rank_image[];
extern const char suit_image[];

struct Card {
  std::uint8_t suit;
  std::uint8_t rank;

  // Jokers live in the deck as a card with out-of-range suit and rank.
  // They never reach the predicates; a hand only counts them.
  static constexpr Card joker() {
    return Card{static_cast<std::uint8_t>(num_suits),
                static_cast<std::uint8_t>(num_ranks)};
  }
  bool is_joker() const { return suit == num_suits; }

  friend bool operator==(const Card &lhs, const Card &rhs) {
    return lhs.suit == rhs.suit && lhs.rank == rhs.rank;
  }
};

inline Card make_card(int rank, int suit) {
  return Card{static_cast<std::uint8_t>(suit),
              static_cast<std::uint8_t>(rank)};
}

// A drawn hand: up to max_cards real cards, plus the jokers that were
// drawn alongside them.  Storage is inline so dealing never allocates.
class Hand {
 public:
  Hand() : cards_{}, size_(0), jokers_(0) {}

  // Throws std::length_error if the hand is already full.
  void push_back(Card c);
  void add_joker() { ++jokers_; }
  void clear() {
    size_ = 0;
    jokers_ = 0;
  }

  std::span<const Card> cards() const { return {cards_.data(), size_}; }
  std::size_t size() const { return size_; }
  int jokers() const { return jokers_; }

  const Card *begin() const { return cards_.data(); }
  const Card *end() const { return cards_.data() + size_; }

 private:
  std::array<Card, max_cards> cards_;
  std::size_t size_;
  int jokers_;
};

using RankCounts = std::array<std::uint8_t, num_ranks>;
using SuitCounts = std::array<std::uint8_t, num_suits>;

// Cell i+1 is set iff some card has rank i.  Cell 0 repeats the ace so
// that A-2-3-4-5 is an ordinary run of adjacent cells.
using StraightBitmap = std::array<std::uint8_t, num_ranks + 1>;

RankCounts rank_counts(std::span<const Card> cards);
SuitCounts suit_counts(std::span<const Card> cards);
StraightBitmap ranks_for_straight(std::span<const Card> cards);

// One hand per suit, each holding only the cards of that suit.
// The jokers are not copied; callers pass their own joker count along.
std::array<Hand, num_suits> split_by_suit(std::span<const Card> cards);

// "As", "Td", ... and "Jk" for the joker.
std::string card_image(Card c);

// The cards followed by one "Jk" per joker, separated by spaces.
std::string hand_image(const Hand &hand);

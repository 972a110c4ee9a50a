#include <algorithm>
#include <cmath>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "cards.h"
#include "catalog.h"
#include "deck.h"
#include "estimate.h"
#include "gtest/gtest.h"

using Cards = std::vector<Card>;

static RandomEngine seeded(std::uint64_t seed) {
  RandomEngine engine;
  engine.seed(seed);
  return engine;
}

TEST(DeckTest, Construction) {
  EXPECT_EQ(Deck(1, 0).size(), 52);
  EXPECT_EQ(Deck(2, 3).size(), 107);
  EXPECT_EQ(Deck(2, 3).jokers(), 3);
  EXPECT_EQ(Deck(0, 4).size(), 4);
  EXPECT_THROW(Deck(-1, 0), std::invalid_argument);
  EXPECT_THROW(Deck(1, -2), std::invalid_argument);
}

TEST(DeckTest, DealSizes) {
  RandomEngine engine = seeded(1);
  Deck deck(1, 2);
  for (int i = 0; i < 1000; ++i) {
    const Hand hand = deck.deal(7, engine);
    EXPECT_EQ(hand.size() + hand.jokers(), 7);
    EXPECT_LE(hand.jokers(), 2);
  }

  Deck jokers_only(0, 3);
  const Hand hand = jokers_only.deal(3, engine);
  EXPECT_EQ(hand.size(), 0);
  EXPECT_EQ(hand.jokers(), 3);

  EXPECT_THROW(deck.deal(max_cards + 1, engine), std::invalid_argument);
  EXPECT_THROW(jokers_only.deal(4, engine), std::invalid_argument);
}

TEST(DeckTest, NoReplacement) {
  RandomEngine engine = seeded(2);
  Deck deck(1, 0);
  for (int i = 0; i < 1000; ++i) {
    const Hand hand = deck.deal(max_cards, engine);
    Cards cards(hand.begin(), hand.end());
    std::sort(cards.begin(), cards.end(), [](Card lhs, Card rhs) {
      return lhs.suit != rhs.suit ? lhs.suit < rhs.suit : lhs.rank < rhs.rank;
    });
    EXPECT_EQ(std::adjacent_find(cards.begin(), cards.end()), cards.end());
  }
}

TEST(DeckTest, RoughlyUniform) {
  RandomEngine engine = seeded(3);
  Deck deck(1, 0);
  int counts[num_ranks][num_suits] = {};
  const int draws = 52000;
  for (int i = 0; i < draws; ++i) {
    const Card c = *deck.deal(1, engine).begin();
    ++counts[c.rank][c.suit];
  }
  // Each card expects 1000 hits with a standard deviation near 31.
  for (int r = 0; r < num_ranks; ++r) {
    for (int s = 0; s < num_suits; ++s) {
      EXPECT_NEAR(counts[r][s], 1000, 200);
    }
  }
}

TEST(DeckTest, SameSeedSameHands) {
  RandomEngine first = seeded(99);
  RandomEngine second = seeded(99);
  Deck deck1(2, 2);
  Deck deck2(2, 2);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(hand_image(deck1.deal(9, first)),
              hand_image(deck2.deal(9, second)));
  }
}

static std::vector<std::string> names(const std::vector<Category> &catalog) {
  std::vector<std::string> result;
  for (const Category &category : catalog) {
    result.push_back(category.name);
  }
  return result;
}

TEST(Catalog, FiveCardHands) {
  const std::vector<std::string> expected = {
      "Pair",     "3 of a kind", "4 of a kind", "5 of a kind",
      "Two pair", "Straight",    "Flush",       "Full house",
      "Flush house", "Straight flush", "Flush five"};
  EXPECT_EQ(names(build_catalog(5)), expected);
}

TEST(Catalog, SixCardHands) {
  const std::vector<std::string> expected = {
      "Pair",        "3 of a kind", "4 of a kind",    "5 of a kind",
      "Two pair",    "Three pair",  "6 of a kind",    "Two triplet",
      "Straight",    "Flush",       "Full mansion",   "Straight flush",
      "Flush six"};
  EXPECT_EQ(names(build_catalog(6)), expected);
}

TEST(Catalog, UnsupportedSize) {
  EXPECT_THROW(build_catalog(4), std::invalid_argument);
  EXPECT_THROW(build_catalog(7), std::invalid_argument);
}

TEST(Catalog, PredicatesUseTheHandSize) {
  const Cards five_high{{0, ace}, {1, deuce}, {2, three}, {3, four}, {0, five}};
  for (const Category &category : build_catalog(5)) {
    EXPECT_EQ(category.count, 0);
    if (category.name == "Straight") {
      EXPECT_TRUE(category.predicate(five_high, 0));
    }
  }
  for (const Category &category : build_catalog(6)) {
    if (category.name == "Straight") {
      EXPECT_FALSE(category.predicate(five_high, 0));
      EXPECT_TRUE(category.predicate(five_high, 1));
    }
  }
}

TEST(WaldInterval, Wald) {
  const Interval none = wald_interval(0, 0);
  EXPECT_EQ(none.p, 0.0);
  EXPECT_EQ(none.ci, 0.0);

  const Interval half = wald_interval(50, 100);
  EXPECT_DOUBLE_EQ(half.p, 0.5);
  EXPECT_NEAR(half.ci, 0.15, 1e-12);

  const Interval all = wald_interval(100, 100);
  EXPECT_DOUBLE_EQ(all.p, 1.0);
  EXPECT_EQ(all.ci, 0.0);
}

TEST(WaldInterval, Overlaps) {
  // Binary fractions keep the endpoints exact.
  EXPECT_TRUE(overlaps({0.5, 0.125}, {0.75, 0.125}));
  EXPECT_TRUE(overlaps({0.75, 0.125}, {0.5, 0.125}));
  EXPECT_FALSE(overlaps({0.5, 0.125}, {0.75, 0.0625}));
  EXPECT_FALSE(overlaps({0.75, 0.0625}, {0.5, 0.125}));
  EXPECT_TRUE(overlaps({0.5, 0.0}, {0.5, 0.0}));
  EXPECT_TRUE(overlaps({0.5, 0.25}, {0.5, 0.0625}));
}

static Predicate constant(bool value) {
  return [value](std::span<const Card>, int) { return value; };
}

TEST(WaldInterval, AnyOverlapSkipsZeroCounts) {
  std::vector<Category> categories;
  categories.emplace_back("a", constant(true));
  categories.emplace_back("b", constant(true));
  categories.emplace_back("c", constant(true));

  categories[0].count = 900;
  categories[1].count = 100;
  categories[2].count = 0;
  EXPECT_FALSE(any_overlap(categories, 1000));

  categories[2].count = 890;
  EXPECT_TRUE(any_overlap(categories, 1000));
}

TEST(EstimatorTest, StopsWhenIntervalsSeparate) {
  std::vector<Category> categories;
  categories.emplace_back("always", constant(true));
  categories.emplace_back("never", constant(false));

  Estimator estimator(Deck(1, 0), 5, std::move(categories), seeded(7));
  std::ostringstream progress;
  const RunResult result = estimator.run(1000, 0, progress);

  EXPECT_TRUE(result.converged);
  EXPECT_EQ(result.iterations, 1000);
  EXPECT_EQ(progress.str(), "1000 iterations...\n");
  EXPECT_EQ(estimator.categories()[0].count, 1000);
  EXPECT_EQ(estimator.categories()[1].count, 0);
}

TEST(EstimatorTest, StopsAtIterationLimit) {
  // Identical categories never separate.
  std::vector<Category> categories;
  categories.emplace_back("one", constant(true));
  categories.emplace_back("other", constant(true));

  Estimator estimator(Deck(1, 0), 5, std::move(categories), seeded(7));
  std::ostringstream progress;
  const RunResult result = estimator.run(1000, 2500, progress);

  EXPECT_FALSE(result.converged);
  EXPECT_EQ(result.iterations, 2500);
  EXPECT_EQ(progress.str(),
            "1000 iterations...\n2000 iterations...\n2500 iterations...\n");
}

TEST(EstimatorTest, BadArguments) {
  EXPECT_THROW(Estimator(Deck(0, 3), 5, build_catalog(5), seeded(1)),
               std::invalid_argument);
  EXPECT_THROW(Estimator(Deck(1, 0), max_cards + 1, build_catalog(5),
                         seeded(1)),
               std::invalid_argument);

  Estimator estimator(Deck(1, 0), 5, build_catalog(5), seeded(1));
  std::ostringstream progress;
  EXPECT_THROW(estimator.run(0, 0, progress), std::invalid_argument);
}

TEST(EstimatorTest, SameSeedSameCounts) {
  Estimator first(Deck(2, 2), 7, build_catalog(6), seeded(2024));
  Estimator second(Deck(2, 2), 7, build_catalog(6), seeded(2024));
  first.sample(20000);
  second.sample(20000);

  ASSERT_EQ(first.categories().size(), second.categories().size());
  for (std::size_t i = 0; i < first.categories().size(); ++i) {
    EXPECT_EQ(first.categories()[i].count, second.categories()[i].count)
        << first.categories()[i].name;
  }
}

TEST(EstimatorTest, MatchesExactFiveCardOdds) {
  // Exact probabilities for five cards from one deck without jokers.
  const double pair = 1.0 - 1317888.0 / 2598960.0;
  const double trips = (54912.0 + 3744.0 + 624.0) / 2598960.0;
  const double flush = 5148.0 / 2598960.0;

  Estimator estimator(Deck(1, 0), 5, build_catalog(5), seeded(31415));
  estimator.sample(200000);

  for (const Category &category : estimator.categories()) {
    const Interval interval =
        wald_interval(category.count, estimator.iterations());
    if (category.name == "Pair") {
      EXPECT_LE(std::abs(interval.p - pair), interval.ci);
    } else if (category.name == "3 of a kind") {
      EXPECT_LE(std::abs(interval.p - trips), interval.ci);
    } else if (category.name == "Flush") {
      EXPECT_LE(std::abs(interval.p - flush), interval.ci);
    } else if (category.name == "5 of a kind" ||
               category.name == "Flush house" ||
               category.name == "Flush five") {
      // Impossible from a single deck without jokers.
      EXPECT_EQ(category.count, 0) << category.name;
    }
  }
}

TEST(Report, Format) {
  std::vector<Category> categories;
  categories.emplace_back("Pair", constant(true));
  categories.emplace_back("Flush", constant(true));
  categories.emplace_back("Straight", constant(true));
  categories.emplace_back("Two pair", constant(true));
  categories[0].count = 500;
  categories[1].count = 20;
  categories[2].count = 20;
  categories[3].count = 0;

  std::ostringstream out;
  report(RunResult{true, 1000}, categories, out);
  EXPECT_EQ(out.str(),
            "--------------\n"
            "(no overlapping 99% confidence intervals)\n"
            "total iterations: 1000\n"
            "    Pair: 0.500000 (500)\n"
            "Straight: 0.020000 (20)\n"
            "   Flush: 0.020000 (20)\n"
            "Two pair: 0.000000 (0)\n");
}

TEST(Report, IterationLimit) {
  std::vector<Category> categories;
  categories.emplace_back("x", constant(true));
  categories[0].count = 3;

  std::ostringstream out;
  report(RunResult{false, 4}, categories, out);
  EXPECT_EQ(out.str(),
            "--------------\n"
            "(iteration limit reached; some 99% confidence intervals overlap)\n"
            "total iterations: 4\n"
            "x: 0.750000 (3)\n");
}

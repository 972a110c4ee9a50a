#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "catalog.h"
#include "deck.h"

// A probability estimate p with half-width ci: the interval is
// [p - ci, p + ci].
struct Interval {
  double p;
  double ci;
};

// The 3-sigma (about 99.73%) Wald interval for count successes in
// iterations trials.  Zero trials yield {0, 0}.
Interval wald_interval(std::uint64_t count, std::uint64_t iterations);

// True if the two closed intervals share at least one point.
bool overlaps(const Interval &a, const Interval &b);

// True if any two categories with nonzero counts have overlapping
// intervals.  Categories nobody has hit yet never overlap.
bool any_overlap(const std::vector<Category> &categories,
                 std::uint64_t iterations);

struct RunResult {
  bool converged;
  std::uint64_t iterations;
};

// Deals hands and tallies every category against each one.
class Estimator {
 public:
  // Throws std::invalid_argument if hands of cards_per_hand cannot be
  // dealt from deck.
  Estimator(Deck deck, int cards_per_hand, std::vector<Category> categories,
            RandomEngine engine);

  // Deals n more hands.
  void sample(std::uint64_t n);

  // Samples in batches of batch_size until no two intervals overlap.
  // A nonzero max_iterations stops the run once that many hands have
  // been dealt, converged or not.  One progress line per batch goes to
  // progress.
  RunResult run(std::uint64_t batch_size, std::uint64_t max_iterations,
                std::ostream &progress);

  const std::vector<Category> &categories() const { return categories_; }
  std::uint64_t iterations() const { return iterations_; }

 private:
  Deck deck_;
  int cards_per_hand_;
  std::vector<Category> categories_;
  RandomEngine engine_;
  std::uint64_t iterations_;
};

// Writes the results table, most frequent category first.
void report(const RunResult &result, const std::vector<Category> &categories,
            std::ostream &out);

#include "estimate.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <utility>

#include "cards.h"

// Three standard deviations.
static constexpr double kZ = 3.0;

Interval wald_interval(std::uint64_t count, std::uint64_t iterations) {
  if (iterations == 0) {
    return {0.0, 0.0};
  }
  const double n = static_cast<double>(iterations);
  const double p = static_cast<double>(count) / n;
  return {p, kZ * std::sqrt(p * (1.0 - p) / n)};
}

bool overlaps(const Interval &a, const Interval &b) {
  return a.p - a.ci <= b.p + b.ci && b.p - b.ci <= a.p + a.ci;
}

bool any_overlap(const std::vector<Category> &categories,
                 std::uint64_t iterations) {
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (categories[i].count == 0) {
      continue;
    }
    const Interval a = wald_interval(categories[i].count, iterations);
    for (std::size_t j = i + 1; j < categories.size(); ++j) {
      if (categories[j].count == 0) {
        continue;
      }
      if (overlaps(a, wald_interval(categories[j].count, iterations))) {
        return true;
      }
    }
  }
  return false;
}

Estimator::Estimator(Deck deck, int cards_per_hand,
                     std::vector<Category> categories, RandomEngine engine)
    : deck_(std::move(deck)),
      cards_per_hand_(cards_per_hand),
      categories_(std::move(categories)),
      engine_(std::move(engine)),
      iterations_(0) {
  if (cards_per_hand < 0 || cards_per_hand > max_cards) {
    throw std::invalid_argument(std::format(
        "cards per hand must be between 0 and {}, got {}", max_cards,
        cards_per_hand));
  }
  if (static_cast<std::size_t>(cards_per_hand) > deck_.size()) {
    throw std::invalid_argument(
        std::format("cannot deal {} cards from a deck of {}", cards_per_hand,
                    deck_.size()));
  }
}

void Estimator::sample(std::uint64_t n) {
  for (std::uint64_t i = 0; i < n; ++i) {
    const Hand hand = deck_.deal(cards_per_hand_, engine_);
    for (Category &category : categories_) {
      if (category.predicate(hand.cards(), hand.jokers())) {
        ++category.count;
      }
    }
  }
  iterations_ += n;
}

RunResult Estimator::run(std::uint64_t batch_size,
                         std::uint64_t max_iterations,
                         std::ostream &progress) {
  if (batch_size == 0) {
    throw std::invalid_argument("batch size must be positive");
  }

  for (;;) {
    if (max_iterations != 0 && iterations_ >= max_iterations) {
      return {false, iterations_};
    }

    std::uint64_t batch = batch_size;
    if (max_iterations != 0) {
      batch = std::min(batch, max_iterations - iterations_);
    }
    sample(batch);
    progress << iterations_ << " iterations...\n";
    progress.flush();

    if (!any_overlap(categories_, iterations_)) {
      return {true, iterations_};
    }
  }
}

void report(const RunResult &result, const std::vector<Category> &categories,
            std::ostream &out) {
  std::vector<const Category *> rows;
  rows.reserve(categories.size());
  std::size_t width = 0;
  for (const Category &category : categories) {
    rows.push_back(&category);
    width = std::max(width, category.name.size());
  }

  std::sort(rows.begin(), rows.end(),
            [](const Category *lhs, const Category *rhs) {
              if (lhs->count != rhs->count) {
                return lhs->count > rhs->count;
              }
              return lhs->name > rhs->name;
            });

  out << "--------------\n";
  if (result.converged) {
    out << "(no overlapping 99% confidence intervals)\n";
  } else {
    out << "(iteration limit reached; some 99% confidence intervals overlap)\n";
  }
  out << "total iterations: " << result.iterations << "\n";

  for (const Category *row : rows) {
    const Interval interval = wald_interval(row->count, result.iterations);
    out << std::format("{:>{}}: {:.6f} ({})\n", row->name, width, interval.p,
                       row->count);
  }
}

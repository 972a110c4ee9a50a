#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "cards.h"

using Predicate = std::function<bool(std::span<const Card>, int)>;

// One line of the results table: a named predicate and the number of
// sampled hands that satisfied it.
struct Category {
  Category(std::string n, Predicate p)
      : name(std::move(n)), predicate(std::move(p)) {}

  std::string name;
  Predicate predicate;
  std::uint64_t count = 0;
};

// The categories reported for a given poker hand size.  Sizes 5 and 6
// add their size-specific categories to the common ones.
// Throws std::invalid_argument for any other size.
std::vector<Category> build_catalog(int hand_size);

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct Options {
  int cards = 7;       // Items drawn per hand, jokers included.
  int decks = 1;       // Full 52-card decks.
  int jokers = 0;      // Jokers added to the deck.
  int hand_size = 5;   // Selects the category set: 5 or 6.
  std::uint64_t batch = 1000000;
  std::uint64_t max_iterations = 0;  // 0 means run until converged.
  std::optional<std::uint64_t> seed;
  bool help = false;
};

// Parses the command line arguments (not including the program name).
// Accepts "--flag value" and "--flag=value".
// Throws std::invalid_argument with a one-line message on unknown flags,
// missing or malformed values, and configurations that cannot be run.
Options parse_options(const std::vector<std::string> &args);

extern const char usage_text[];

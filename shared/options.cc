#include "options.h"

#include <cstddef>
#include <format>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "cards.h"

const char usage_text[] =
    "usage: hand_odds [--cards N] [--decks N] [--jokers N] [--hand-size 5|6]\n"
    "                 [--batch N] [--max-iterations N] [--seed N]\n";

// Reads a whole nonnegative integer out of text.  std::istringstream
// happily stops at the first bad character, so check that it consumed
// everything, and reject a leading minus sign that unsigned extraction
// would otherwise wrap around.
static std::uint64_t parse_count(const std::string &flag,
                                 const std::string &text) {
  std::uint64_t value = 0;
  std::istringstream iss(text);
  if (text.empty() || text[0] == '-' || !(iss >> value) || !iss.eof()) {
    throw std::invalid_argument(
        std::format("{} expects a nonnegative integer, got '{}'", flag, text));
  }
  return value;
}

static int parse_small(const std::string &flag, const std::string &text) {
  const std::uint64_t value = parse_count(flag, text);
  if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
    throw std::invalid_argument(std::format("{} {} is too large", flag, text));
  }
  return static_cast<int>(value);
}

static bool takes_value(const std::string &flag) {
  return flag == "--cards" || flag == "--decks" || flag == "--jokers" ||
         flag == "--hand-size" || flag == "--batch" ||
         flag == "--max-iterations" || flag == "--seed";
}

static void validate(const Options &options) {
  if (options.cards > max_cards) {
    throw std::invalid_argument(std::format(
        "--cards {} exceeds the maximum of {}", options.cards, max_cards));
  }
  if (options.cards < 1) {
    throw std::invalid_argument("--cards must be at least 1");
  }
  if (options.hand_size != 5 && options.hand_size != 6) {
    throw std::invalid_argument(std::format(
        "--hand-size {} is not supported (expected 5 or 6)",
        options.hand_size));
  }
  if (options.batch == 0) {
    throw std::invalid_argument("--batch must be at least 1");
  }

  const std::uint64_t deck_size =
      static_cast<std::uint64_t>(options.decks) * cards_per_deck +
      static_cast<std::uint64_t>(options.jokers);
  if (deck_size < static_cast<std::uint64_t>(options.cards)) {
    throw std::invalid_argument(
        std::format("cannot deal {} cards from a deck of {}", options.cards,
                    deck_size));
  }
}

Options parse_options(const std::vector<std::string> &args) {
  Options result;

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string flag = args[i];
    std::optional<std::string> value;

    const std::size_t equals = flag.find('=');
    if (equals != std::string::npos) {
      value = flag.substr(equals + 1);
      flag.erase(equals);
    }

    if (flag == "--help" || flag == "-h") {
      if (value) {
        throw std::invalid_argument(flag + " takes no value");
      }
      result.help = true;
      continue;
    }

    if (!takes_value(flag)) {
      throw std::invalid_argument("unknown option " + flag);
    }
    if (!value) {
      if (i + 1 >= args.size()) {
        throw std::invalid_argument(flag + " requires a value");
      }
      value = args[++i];
    }

    if (flag == "--cards") {
      result.cards = parse_small(flag, *value);
    } else if (flag == "--decks") {
      result.decks = parse_small(flag, *value);
    } else if (flag == "--jokers") {
      result.jokers = parse_small(flag, *value);
    } else if (flag == "--hand-size") {
      result.hand_size = parse_small(flag, *value);
    } else if (flag == "--batch") {
      result.batch = parse_count(flag, *value);
    } else if (flag == "--max-iterations") {
      result.max_iterations = parse_count(flag, *value);
    } else if (flag == "--seed") {
      result.seed = parse_count(flag, *value);
    }
  }

  if (!result.help) {
    validate(result);
  }
  return result;
}

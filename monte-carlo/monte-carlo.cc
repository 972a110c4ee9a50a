// Estimates how often a random hand contains each poker category, for
// hands dealt from one or more decks with optional jokers.  Runs until
// the 99.73% confidence intervals of all the categories are disjoint.

#include <exception>
#include <iostream>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "catalog.h"
#include "deck.h"
#include "estimate.h"
#include "options.h"

int run(const Options &options) {
  RandomEngine engine;
  if (options.seed) {
    engine.seed(*options.seed);
  } else {
    engine.seed(std::random_device{}());
  }

  Estimator estimator(Deck(options.decks, options.jokers), options.cards,
                      build_catalog(options.hand_size), std::move(engine));
  const RunResult result =
      estimator.run(options.batch, options.max_iterations, std::cout);
  report(result, estimator.categories(), std::cout);
  return 0;
}

int main(int argc, char *argv[]) {
  try {
    const Options options =
        parse_options(std::vector<std::string>(argv + 1, argv + argc));
    if (options.help) {
      std::cout << usage_text;
      return 0;
    }
    return run(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    std::cerr << usage_text;
    return 1;
  } catch (...) {  // Catch-all handler (MUST be last)
    std::cerr << "Unknown exception occurred\n";
    return 1;
  }
}

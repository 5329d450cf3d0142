#include "move_selector.hpp"
#include <vector>

namespace sweeper_ai {

using sweeper::Cell;
using sweeper::KnowledgeBase;

std::optional<Cell> make_safe_move(const KnowledgeBase& kb) {
  for (const Cell& c : kb.safes()) {
    if (!kb.moves_made().count(c)) return c;
  }
  return std::nullopt;
}

std::optional<Cell> make_random_move(const KnowledgeBase& kb, std::mt19937& rng) {
  std::vector<Cell> candidates;
  for (int r = 0; r < kb.height(); ++r) {
    for (int k = 0; k < kb.width(); ++k) {
      const Cell c{r, k};
      if (kb.moves_made().count(c) || kb.mines().count(c)) continue;
      candidates.push_back(c);
    }
  }
  if (candidates.empty()) {
    return std::nullopt;
  }

  std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
  return candidates[dist(rng)];
}

} // namespace sweeper_ai

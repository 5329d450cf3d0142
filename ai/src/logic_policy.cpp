#include "logic_policy.hpp"
#include "move_selector.hpp"
#include <chrono>

namespace sweeper_ai {

LogicPolicy::LogicPolicy()
  : rng_(std::chrono::steady_clock::now().time_since_epoch().count()) {
}

LogicPolicy::LogicPolicy(uint32_t seed) : rng_(seed) {
}

Pick LogicPolicy::pick(const sweeper::KnowledgeBase& kb) {
  if (auto safe = make_safe_move(kb)) {
    return {safe, MoveKind::Safe};
  }
  if (auto guess = make_random_move(kb, rng_)) {
    return {guess, MoveKind::Random};
  }
  return {}; // Nothing left to reveal
}

} // namespace sweeper_ai

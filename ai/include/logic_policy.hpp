#pragma once
#include "sweeper/knowledge_base.hpp"
#include "sweeper/types.hpp"
#include <cstdint>
#include <optional>
#include <random>

namespace sweeper_ai {

enum class MoveKind : uint8_t { None = 0, Safe = 1, Random = 2 };

struct Pick {
  std::optional<sweeper::Cell> cell;
  MoveKind kind = MoveKind::None;
};

// Plays a known-safe cell whenever one exists and guesses otherwise.
class LogicPolicy {
public:
  LogicPolicy();
  explicit LogicPolicy(uint32_t seed);
  Pick pick(const sweeper::KnowledgeBase& kb);

private:
  std::mt19937 rng_;
};

} // namespace sweeper_ai

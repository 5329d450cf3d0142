#pragma once
#include "sweeper/knowledge_base.hpp"
#include "sweeper/types.hpp"
#include <optional>
#include <random>

namespace sweeper_ai {

// Smallest cell in safes() that has not been revealed yet.
std::optional<sweeper::Cell> make_safe_move(const sweeper::KnowledgeBase& kb);

// Uniform choice among cells neither revealed nor known to be mines.
std::optional<sweeper::Cell> make_random_move(const sweeper::KnowledgeBase& kb, std::mt19937& rng);

} // namespace sweeper_ai

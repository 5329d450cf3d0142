#pragma once
#include "sweeper/board.hpp"
#include "sweeper/types.hpp"
#include <cstdint>
#include <optional>

namespace sweeper {

enum class Outcome : uint8_t { Ongoing = 0, Won = 1, Lost = 2 };

class GameState {
public:
  explicit GameState(Board board);

  const Board& board() const { return board_; }
  const CellSet& revealed() const { return revealed_; }
  Outcome outcome() const { return outcome_; }
  bool finished() const { return outcome_ != Outcome::Ongoing; }

  // Neighbor mine count of a safe cell, std::nullopt when `c` is a mine.
  std::optional<int> reveal(const Cell& c);

  // Ends the game as won when `flags` are exactly the mines.
  bool check_flags(const CellSet& flags);

private:
  Board board_;
  CellSet revealed_;
  Outcome outcome_ = Outcome::Ongoing;
};

const char* to_string(Outcome o);

} // namespace sweeper

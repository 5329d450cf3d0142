#pragma once
#include "sweeper/types.hpp"
#include <ostream>
#include <random>
#include <vector>

namespace sweeper {

// Clipped Moore neighborhood of `c` on a height x width grid, excluding `c`.
std::vector<Cell> neighbors_of(const Cell& c, int height, int width);

class Board {
public:
  // Places `mine_count` distinct mines using `rng`.
  Board(int height, int width, int mine_count, std::mt19937& rng);
  Board(int height, int width, const CellSet& mines);

  int height() const { return height_; }
  int width() const { return width_; }
  int mine_count() const { return static_cast<int>(mines_.size()); }
  const CellSet& mines() const { return mines_; }

  bool in_bounds(const Cell& c) const {
    return c.row >= 0 && c.row < height_ && c.col >= 0 && c.col < width_;
  }

  bool is_mine(const Cell& c) const;
  int nearby_mine_count(const Cell& c) const;
  std::vector<Cell> neighbors(const Cell& c) const;
  bool won(const CellSet& flagged) const { return flagged == mines_; }

  void print(std::ostream& os) const;

private:
  void check_dimensions() const;
  void check_cell(const Cell& c) const;

  int height_;
  int width_;
  CellSet mines_;
  std::vector<bool> grid_;
};

} // namespace sweeper

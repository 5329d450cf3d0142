#include "sweeper/board.hpp"
#include <stdexcept>

namespace sweeper {

std::vector<Cell> neighbors_of(const Cell& c, int height, int width) {
  std::vector<Cell> out;
  out.reserve(8);
  for (int r = c.row - 1; r <= c.row + 1; ++r) {
    for (int k = c.col - 1; k <= c.col + 1; ++k) {
      if (r == c.row && k == c.col) continue;
      if (r < 0 || r >= height || k < 0 || k >= width) continue;
      out.push_back(Cell{r, k});
    }
  }
  return out;
}

Board::Board(int height, int width, int mine_count, std::mt19937& rng)
  : height_(height), width_(width) {
  check_dimensions();
  if (mine_count < 0 || mine_count > height_ * width_) {
    throw std::invalid_argument("mine count " + std::to_string(mine_count) +
                                " does not fit a " + std::to_string(height_) + "x" +
                                std::to_string(width_) + " board");
  }
  grid_.assign(height_ * width_, false);

  std::uniform_int_distribution<int> row_dist(0, height_ - 1);
  std::uniform_int_distribution<int> col_dist(0, width_ - 1);
  while (static_cast<int>(mines_.size()) != mine_count) {
    Cell c{row_dist(rng), col_dist(rng)};
    if (grid_[c.row * width_ + c.col]) continue;
    grid_[c.row * width_ + c.col] = true;
    mines_.insert(c);
  }
}

Board::Board(int height, int width, const CellSet& mines)
  : height_(height), width_(width), mines_(mines) {
  check_dimensions();
  grid_.assign(height_ * width_, false);
  for (const Cell& m : mines_) {
    if (!in_bounds(m)) {
      throw std::invalid_argument("mine " + to_string(m) + " is outside the board");
    }
    grid_[m.row * width_ + m.col] = true;
  }
}

void Board::check_dimensions() const {
  if (height_ <= 0 || width_ <= 0) {
    throw std::invalid_argument("board dimensions must be positive, got " +
                                std::to_string(height_) + "x" + std::to_string(width_));
  }
}

void Board::check_cell(const Cell& c) const {
  if (!in_bounds(c)) {
    throw std::out_of_range("cell " + to_string(c) + " is outside the board");
  }
}

bool Board::is_mine(const Cell& c) const {
  check_cell(c);
  return grid_[c.row * width_ + c.col];
}

int Board::nearby_mine_count(const Cell& c) const {
  check_cell(c);
  int count = 0;
  for (const Cell& n : neighbors_of(c, height_, width_)) {
    if (grid_[n.row * width_ + n.col]) ++count;
  }
  return count;
}

std::vector<Cell> Board::neighbors(const Cell& c) const {
  check_cell(c);
  return neighbors_of(c, height_, width_);
}

void Board::print(std::ostream& os) const {
  const std::string rule(2 * width_ + 1, '-');
  for (int r = 0; r < height_; ++r) {
    os << rule << "\n";
    for (int k = 0; k < width_; ++k) {
      os << (grid_[r * width_ + k] ? "|X" : "| ");
    }
    os << "|\n";
  }
  os << rule << "\n";
}

} // namespace sweeper

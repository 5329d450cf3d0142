#pragma once
#include <ostream>
#include <set>
#include <stdexcept>
#include <string>

namespace sweeper {

constexpr int DEFAULT_HEIGHT = 8;
constexpr int DEFAULT_WIDTH = 8;
constexpr int DEFAULT_MINES = 8;

struct Cell {
  int row = -1;
  int col = -1;
};

inline bool operator==(const Cell& a, const Cell& b) {
  return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Cell& a, const Cell& b) {
  return !(a == b);
}

// lexicographic (row, col); every CellSet iterates in this order
inline bool operator<(const Cell& a, const Cell& b) {
  return (a.row != b.row) ? a.row < b.row : a.col < b.col;
}

using CellSet = std::set<Cell>;

inline std::string to_string(const Cell& c) {
  return "(" + std::to_string(c.row) + "," + std::to_string(c.col) + ")";
}

inline std::ostream& operator<<(std::ostream& os, const Cell& c) {
  return os << to_string(c);
}

// Raised when the engine detects knowledge that cannot all be true.
struct InferenceError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace sweeper

#include "sweeper/constraint.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace sweeper {

Constraint::Constraint(CellSet cells, int count)
  : cells_(std::move(cells)), count_(count) {
  if (count_ < 0 || count_ > static_cast<int>(cells_.size())) {
    throw std::invalid_argument("constraint count " + std::to_string(count_) +
                                " is not within [0, " + std::to_string(cells_.size()) + "]");
  }
}

CellSet Constraint::known_mines() const {
  if (count_ == static_cast<int>(cells_.size())) return cells_;
  return {};
}

CellSet Constraint::known_safes() const {
  if (count_ == 0) return cells_;
  return {};
}

void Constraint::mark_mine(const Cell& c) {
  if (cells_.erase(c) > 0) {
    --count_;
  }
}

void Constraint::mark_safe(const Cell& c) {
  cells_.erase(c);
}

std::string Constraint::to_string() const {
  std::ostringstream oss;
  oss << *this;
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Constraint& c) {
  os << "{";
  bool first = true;
  for (const Cell& cell : c.cells()) {
    if (!first) os << ", ";
    os << cell;
    first = false;
  }
  return os << "} = " << c.count();
}

} // namespace sweeper

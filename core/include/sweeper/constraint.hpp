#pragma once
#include "sweeper/types.hpp"
#include <ostream>
#include <string>

namespace sweeper {

// "Exactly count() of cells() are mines."
// Resolved cells are removed in place via mark_mine / mark_safe.
class Constraint {
public:
  Constraint(CellSet cells, int count);

  const CellSet& cells() const { return cells_; }
  int count() const { return count_; }
  bool empty() const { return cells_.empty(); }

  // Only reachable by marking cells against inconsistent knowledge.
  bool is_contradictory() const {
    return count_ < 0 || count_ > static_cast<int>(cells_.size());
  }

  // All cells when count == |cells|, otherwise empty.
  CellSet known_mines() const;
  // All cells when count == 0, otherwise empty.
  CellSet known_safes() const;

  void mark_mine(const Cell& c);
  void mark_safe(const Cell& c);

  std::string to_string() const;

private:
  CellSet cells_;
  int count_;
};

inline bool operator==(const Constraint& a, const Constraint& b) {
  return a.count() == b.count() && a.cells() == b.cells();
}

inline bool operator!=(const Constraint& a, const Constraint& b) {
  return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const Constraint& c);

} // namespace sweeper

#pragma once
#include "sweeper/constraint.hpp"
#include "sweeper/types.hpp"
#include <cstddef>
#include <vector>

namespace sweeper {

/**
 * Inference engine.
 * Holds the constraints learned from revealed cells and derives which
 * unrevealed cells are certainly safe or certainly mines.
 *
 * After every public call returns:
 *   - safes() and mines() are disjoint, moves_made() is a subset of safes()
 *   - no constraint mentions a cell in safes() or mines()
 *   - no two constraints are equal
 */
class KnowledgeBase {
public:
  KnowledgeBase(int height = DEFAULT_HEIGHT, int width = DEFAULT_WIDTH);

  int height() const { return height_; }
  int width() const { return width_; }
  bool in_bounds(const Cell& c) const {
    return c.row >= 0 && c.row < height_ && c.col >= 0 && c.col < width_;
  }

  // Record a fact and strip the cell from every constraint.
  // Neither runs inference; call infer() to propagate.
  void mark_mine(const Cell& c);
  void mark_safe(const Cell& c);

  // Called once per revealed safe cell with its neighbor mine count.
  // Runs inference to a fixpoint before returning.
  void add_knowledge(const Cell& c, int count);

  // Direct resolution, subset resolution and cleanup, repeated until a
  // pass changes nothing.
  void infer();

  const CellSet& moves_made() const { return moves_made_; }
  const CellSet& safes() const { return safes_; }
  const CellSet& mines() const { return mines_; }
  const std::vector<Constraint>& knowledge() const { return knowledge_; }

  void set_verbose(bool v) { verbose_ = v; }

  struct Stats {
    int passes;
    int derived;
    int dropped;
    int inferred_safes;
    int inferred_mines;

    void reset() {
      passes = 0;
      derived = 0;
      dropped = 0;
      inferred_safes = 0;
      inferred_mines = 0;
    }
  };

  const Stats& get_stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

private:
  void check_cell(const Cell& c) const;
  void record_mine(const Cell& c);
  void record_safe(const Cell& c);
  bool contains(const Constraint& k) const;
  void check_consistency() const;

  // One pass each; the return value counts what changed.
  std::size_t resolve_direct();
  std::size_t resolve_subsets();
  std::size_t clean_up();

  int height_;
  int width_;
  CellSet moves_made_;
  CellSet safes_;
  CellSet mines_;
  std::vector<Constraint> knowledge_;
  bool verbose_;
  Stats stats_;
};

} // namespace sweeper

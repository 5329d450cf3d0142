#include "sweeper/knowledge_base.hpp"
#include "sweeper/board.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace sweeper {

namespace {

bool debug_enabled() { return std::getenv("SWEEPER_DEBUG") != nullptr; }

} // namespace

KnowledgeBase::KnowledgeBase(int height, int width)
  : height_(height), width_(width), verbose_(debug_enabled()) {
  if (height_ <= 0 || width_ <= 0) {
    throw std::invalid_argument("board dimensions must be positive, got " +
                                std::to_string(height_) + "x" + std::to_string(width_));
  }
  stats_.reset();
}

void KnowledgeBase::check_cell(const Cell& c) const {
  if (!in_bounds(c)) {
    throw std::out_of_range("cell " + to_string(c) + " is outside the " +
                            std::to_string(height_) + "x" + std::to_string(width_) + " board");
  }
}

void KnowledgeBase::record_mine(const Cell& c) {
  if (safes_.count(c)) {
    throw InferenceError("cell " + to_string(c) + " is already known to be safe");
  }
  mines_.insert(c);
  for (Constraint& k : knowledge_) {
    k.mark_mine(c);
  }
}

void KnowledgeBase::record_safe(const Cell& c) {
  if (mines_.count(c)) {
    throw InferenceError("cell " + to_string(c) + " is already known to be a mine");
  }
  safes_.insert(c);
  for (Constraint& k : knowledge_) {
    k.mark_safe(c);
  }
}

void KnowledgeBase::mark_mine(const Cell& c) {
  check_cell(c);
  record_mine(c);
  clean_up();
}

void KnowledgeBase::mark_safe(const Cell& c) {
  check_cell(c);
  record_safe(c);
  clean_up();
}

bool KnowledgeBase::contains(const Constraint& k) const {
  return std::find(knowledge_.begin(), knowledge_.end(), k) != knowledge_.end();
}

void KnowledgeBase::add_knowledge(const Cell& c, int count) {
  check_cell(c);
  if (mines_.count(c)) {
    throw InferenceError("revealed cell " + to_string(c) + " is a known mine");
  }
  const std::vector<Cell> nbrs = neighbors_of(c, height_, width_);
  if (count < 0 || count > static_cast<int>(nbrs.size())) {
    throw std::invalid_argument("cell " + to_string(c) + " cannot border " +
                                std::to_string(count) + " mines");
  }

  // Resolved neighbors leave the constraint, known mines also leave the count.
  CellSet unresolved;
  int known_mines = 0;
  for (const Cell& n : nbrs) {
    if (mines_.count(n)) {
      ++known_mines;
    } else if (!safes_.count(n)) {
      unresolved.insert(n);
    }
  }
  const int remaining = count - known_mines;
  if (remaining < 0 || remaining > static_cast<int>(unresolved.size())) {
    throw InferenceError("count " + std::to_string(count) + " at " + to_string(c) +
                         " contradicts " + std::to_string(known_mines) + " known mines and " +
                         std::to_string(unresolved.size()) + " unresolved neighbors");
  }

  moves_made_.insert(c);
  record_safe(c);

  if (!unresolved.empty()) {
    Constraint k(std::move(unresolved), remaining);
    if (!contains(k)) {
      if (verbose_) std::cerr << "[KnowledgeBase] learned " << k << std::endl;
      knowledge_.push_back(std::move(k));
    }
  }

  infer();
}

void KnowledgeBase::infer() {
  for (;;) {
    ++stats_.passes;
    const std::size_t marked = resolve_direct();
    const std::size_t derived = resolve_subsets();
    const std::size_t dropped = clean_up();

    if (verbose_) {
      std::cerr << "[KnowledgeBase] pass " << stats_.passes << ": marked " << marked
                << " | derived " << derived << " | dropped " << dropped
                << " | knowledge " << knowledge_.size() << std::endl;
    }
    if (marked == 0 && derived == 0 && dropped == 0) break;
  }
}

std::size_t KnowledgeBase::resolve_direct() {
  CellSet mines_to_mark;
  CellSet safes_to_mark;
  for (const Constraint& k : knowledge_) {
    for (const Cell& c : k.known_mines()) {
      if (!mines_.count(c)) mines_to_mark.insert(c);
    }
    for (const Cell& c : k.known_safes()) {
      if (!safes_.count(c)) safes_to_mark.insert(c);
    }
  }

  for (const Cell& c : mines_to_mark) {
    if (safes_to_mark.count(c)) {
      throw InferenceError("cell " + to_string(c) + " is concluded to be both safe and a mine");
    }
  }

  // Each mark is applied to every constraint, including the ones that
  // produced it, before cleanup runs.
  for (const Cell& c : mines_to_mark) {
    record_mine(c);
    ++stats_.inferred_mines;
  }
  for (const Cell& c : safes_to_mark) {
    record_safe(c);
    ++stats_.inferred_safes;
  }
  return mines_to_mark.size() + safes_to_mark.size();
}

std::size_t KnowledgeBase::resolve_subsets() {
  check_consistency();

  std::vector<Constraint> derived;
  for (std::size_t i = 0; i < knowledge_.size(); ++i) {
    const Constraint& a = knowledge_[i];
    if (a.empty()) continue;
    for (std::size_t j = 0; j < knowledge_.size(); ++j) {
      if (i == j) continue;
      const Constraint& b = knowledge_[j];
      if (b.cells().size() <= a.cells().size()) continue;
      if (!std::includes(b.cells().begin(), b.cells().end(),
                         a.cells().begin(), a.cells().end())) {
        continue;
      }

      CellSet rest;
      std::set_difference(b.cells().begin(), b.cells().end(),
                          a.cells().begin(), a.cells().end(),
                          std::inserter(rest, rest.end()));
      const int count = b.count() - a.count();
      if (count < 0 || count > static_cast<int>(rest.size())) {
        throw InferenceError("subset " + a.to_string() + " of " + b.to_string() +
                             " leaves a contradictory remainder");
      }

      Constraint k(std::move(rest), count);
      if (contains(k)) continue;
      if (std::find(derived.begin(), derived.end(), k) != derived.end()) continue;
      derived.push_back(std::move(k));
    }
  }

  for (Constraint& k : derived) {
    if (verbose_) std::cerr << "[KnowledgeBase] derived " << k << std::endl;
    knowledge_.push_back(std::move(k));
  }
  stats_.derived += static_cast<int>(derived.size());
  return derived.size();
}

void KnowledgeBase::check_consistency() const {
  for (const Constraint& k : knowledge_) {
    if (k.is_contradictory()) {
      throw InferenceError("contradictory constraint " + k.to_string());
    }
  }
}

// Drops emptied and duplicate constraints. A zero-count constraint that
// still has cells is kept: its cells are marked safe by the next pass's
// direct resolution, which empties it.
std::size_t KnowledgeBase::clean_up() {
  check_consistency();

  std::vector<Constraint> kept;
  kept.reserve(knowledge_.size());
  for (Constraint& k : knowledge_) {
    if (k.empty()) continue;
    if (std::find(kept.begin(), kept.end(), k) != kept.end()) continue;
    kept.push_back(std::move(k));
  }

  const std::size_t dropped = knowledge_.size() - kept.size();
  knowledge_ = std::move(kept);
  stats_.dropped += static_cast<int>(dropped);
  return dropped;
}

} // namespace sweeper

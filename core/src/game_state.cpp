#include "sweeper/game_state.hpp"
#include <stdexcept>
#include <utility>

namespace sweeper {

GameState::GameState(Board board) : board_(std::move(board)) {
  if (board_.mine_count() == board_.height() * board_.width()) {
    outcome_ = Outcome::Won;
  }
}

std::optional<int> GameState::reveal(const Cell& c) {
  if (finished()) {
    throw std::logic_error("reveal " + to_string(c) + " after the game is over");
  }
  if (board_.is_mine(c)) {
    outcome_ = Outcome::Lost;
    return std::nullopt;
  }
  revealed_.insert(c);
  const int safe_cells = board_.height() * board_.width() - board_.mine_count();
  if (static_cast<int>(revealed_.size()) == safe_cells) {
    outcome_ = Outcome::Won;
  }
  return board_.nearby_mine_count(c);
}

bool GameState::check_flags(const CellSet& flags) {
  if (outcome_ == Outcome::Ongoing && board_.won(flags)) {
    outcome_ = Outcome::Won;
  }
  return outcome_ == Outcome::Won;
}

const char* to_string(Outcome o) {
  switch (o) {
    case Outcome::Won: return "won";
    case Outcome::Lost: return "lost";
    default: return "ongoing";
  }
}

} // namespace sweeper

#pragma once
#include <optional>
#include <vector>

#include "../constants.hpp"
#include "board.hpp"
#include "check_evaluator.hpp"
#include "move.hpp"
#include "player.hpp"
#include "rules_config.hpp"

namespace tetra::model {

struct TurnState {
  int activeIndex = 0;      // index into the roster, never an eliminated player while ongoing
  core::Outcome outcome{};
  int noProgressPlies = 0;  // plies since the last capture or pawn move
};

inline bool operator==(const TurnState& a, const TurnState& b) noexcept {
  return a.activeIndex == b.activeIndex && a.outcome == b.outcome &&
         a.noProgressPlies == b.noProgressPlies;
}
inline bool operator!=(const TurnState& a, const TurnState& b) noexcept {
  return !(a == b);
}

struct PlyReport {
  std::optional<core::Position> clearedEnPassant;
  std::vector<core::PlayerColor> eliminated;  // in the order they were checkmated
};

class TurnManager {
 public:
  explicit TurnManager(const RulesConfig& cfg = {}) : m_config(cfg) {}

  const RulesConfig& config() const noexcept { return m_config; }
  void setConfig(const RulesConfig& cfg) noexcept { m_config = cfg; }

  // First non-eliminated player after `from` in cyclic order; `from` itself if nobody else is
  // left.
  static int nextActiveIndex(const Roster& players, int from) noexcept;

  // Plays a legal move and completes the ply: board update, material score, checkmate
  // eliminations (evaluated in turn order after the mover), turn advance, terminal detection.
  PlyReport playMove(Board& b, Roster& players, TurnState& turn, const Move& m) const;

  // Ends the game by repetition once `occurrences` reaches the configured limit.
  void applyRepetitionRule(TurnState& turn, int occurrences) const;

  const CheckEvaluator& checks() const noexcept { return m_checks; }

 private:
  RulesConfig m_config;
  CheckEvaluator m_checks;
};

}  // namespace tetra::model

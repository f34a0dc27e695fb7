#include "tetra/model/turn_manager.hpp"

#include <iostream>

#include "tetra/model/move_helper.hpp"

namespace tetra::model {

int TurnManager::nextActiveIndex(const Roster& players, int from) noexcept {
  for (int step = 1; step <= core::NUM_PLAYERS; ++step) {
    const int idx = (from + step) % core::NUM_PLAYERS;
    if (!players[idx].eliminated) return idx;
  }
  return from;
}

PlyReport TurnManager::playMove(Board& b, Roster& players, TurnState& turn, const Move& m) const {
  PlyReport report;
  const int moverIdx = core::pi(m.piece.owner);
  Player& mover = players[moverIdx];

  report.clearedEnPassant = makeMove(b, m);

  if (m.captured) mover.score += core::pieceValue(m.captured->type);

  if (m.captured || m.piece.type == core::PieceType::Pawn)
    turn.noProgressPlies = 0;
  else
    ++turn.noProgressPlies;

  // Each elimination removes an attacker, so later players are judged on the updated roster.
  for (int step = 1; step < core::NUM_PLAYERS; ++step) {
    Player& p = players[(moverIdx + step) % core::NUM_PLAYERS];
    if (p.eliminated) continue;
    if (m_checks.isCheckmated(b, players, p.color)) {
      p.eliminated = true;
      mover.score += m_config.checkmateBonus;
      report.eliminated.push_back(p.color);
      if (m_config.verbose)
        std::cerr << "[TurnManager] " << colorName(p.color) << " checkmated by "
                  << colorName(mover.color) << "\n";
    }
  }

  turn.activeIndex = nextActiveIndex(players, moverIdx);

  if (activePlayerCount(players) <= 1) {
    turn.outcome.result = core::LAST_STANDING;
    turn.outcome.winner = players[turn.activeIndex].color;
  } else if (m_checks.isStalemated(b, players, core::playerFromIndex(turn.activeIndex))) {
    turn.outcome.result = core::STALEMATE;
  } else if (m_config.noProgressPlyLimit > 0 &&
             turn.noProgressPlies >= m_config.noProgressPlyLimit) {
    turn.outcome.result = core::MOVERULE;
  }

  if (m_config.verbose && turn.outcome.finished())
    std::cerr << "[TurnManager] game over, result=" << turn.outcome.result << "\n";
  return report;
}

void TurnManager::applyRepetitionRule(TurnState& turn, int occurrences) const {
  if (turn.outcome.finished() || m_config.repetitionLimit <= 0) return;
  if (occurrences >= m_config.repetitionLimit) {
    turn.outcome.result = core::REPETITION;
    if (m_config.verbose) std::cerr << "[TurnManager] draw by repetition\n";
  }
}

}  // namespace tetra::model

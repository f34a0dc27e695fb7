#include "tetra/model/check_evaluator.hpp"

#include "tetra/model/attack_map.hpp"

namespace tetra::model {

bool CheckEvaluator::inCheck(const Board& b, const Roster& players, core::PlayerColor p) const {
  if (players[core::pi(p)].eliminated) return false;
  const auto king = b.kingPosition(p);
  return king && isAttackedByOpponents(b, players, *king, p);
}

bool CheckEvaluator::isCheckmated(const Board& b, const Roster& players,
                                  core::PlayerColor p) const {
  return inCheck(b, players, p) && !m_move_gen.hasLegalMove(b, players, p);
}

bool CheckEvaluator::isStalemated(const Board& b, const Roster& players,
                                  core::PlayerColor p) const {
  if (players[core::pi(p)].eliminated) return false;
  return !inCheck(b, players, p) && !m_move_gen.hasLegalMove(b, players, p);
}

}  // namespace tetra::model

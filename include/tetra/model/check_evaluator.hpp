#pragma once

#include "board.hpp"
#include "move_generator.hpp"
#include "player.hpp"

namespace tetra::model {

// Check status of one player on a given board. Only non-eliminated opponents give check.
class CheckEvaluator {
 public:
  bool inCheck(const Board& b, const Roster& players, core::PlayerColor p) const;
  bool isCheckmated(const Board& b, const Roster& players, core::PlayerColor p) const;
  bool isStalemated(const Board& b, const Roster& players, core::PlayerColor p) const;

 private:
  MoveGenerator m_move_gen;
};

}  // namespace tetra::model

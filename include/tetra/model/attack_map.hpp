#pragma once
#include <unordered_set>

#include "board.hpp"
#include "player.hpp"

namespace tetra::model {

using SquareSet = std::unordered_set<core::Position, core::PositionHash>;

// ---------------- Attack queries ----------------
// Built on PieceRules::attackTargets only; never asks the MoveGenerator.

// Union of the attack targets of every piece owned by `attacker`.
SquareSet attackedSquares(const Board& b, core::PlayerColor attacker);

// Same semantics as attackedSquares(b, attacker).count(sq), answered by looking outwards
// from `sq` instead of enumerating all of the attacker's pieces.
bool isSquareAttacked(const Board& b, core::Position sq, core::PlayerColor attacker);

// Attacked by any non-eliminated player other than `defender`.
bool isAttackedByOpponents(const Board& b, const Roster& players, core::Position sq,
                           core::PlayerColor defender);

}  // namespace tetra::model

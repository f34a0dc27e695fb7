#pragma once

#include <string>
#include <string_view>

#include "../chess_types.hpp"
#include "move.hpp"

namespace tetra::model {

// Square = file letter 'a'..'n' + rank 1..14, e.g. "d2", "k14"
std::string squareToString(core::Position p);
bool parseSquare(std::string_view text, core::Position& out);

char pieceChar(core::PieceType t) noexcept;  // 'P','N','B','R','Q','K'
core::PieceType pieceFromChar(char c) noexcept;  // case-insensitive, None if unknown

// Coordinate notation: "d2d4", promotions append the piece letter ("h13h14q").
std::string moveToString(const Move& m);
// Fills from/to/promotion only; the game resolves the rest against its legal moves.
bool parseMove(std::string_view text, Move& out);

}  // namespace tetra::model

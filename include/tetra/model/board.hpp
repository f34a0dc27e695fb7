#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../chess_types.hpp"
#include "piece.hpp"

namespace tetra::model {

// Write to a square outside the cross. Callers pre-filter with onBoard(), so this is a
// programming error and not part of the move-validation path.
class InvalidPosition : public std::out_of_range {
 public:
  explicit InvalidPosition(core::Position p);
  core::Position position() const noexcept { return m_pos; }

 private:
  core::Position m_pos;
};

class Board {
 public:
  using Map = std::unordered_map<core::Position, Piece, core::PositionHash>;

  Board() = default;

  void clear() noexcept { m_pieces.clear(); }

  static bool onBoard(core::Position p) noexcept;

  std::optional<Piece> pieceAt(core::Position p) const;
  // std::nullopt empties the square
  void set(core::Position p, std::optional<Piece> piece);
  bool occupied(core::Position p) const { return m_pieces.count(p) != 0; }

  // Squares strictly between a and b on a rank, file or diagonal, ordered from a
  // towards b. Empty if a and b are not aligned (or equal / adjacent).
  static std::vector<core::Position> squaresBetween(core::Position a, core::Position b);

  std::optional<core::Position> kingPosition(core::PlayerColor c) const;
  std::vector<std::pair<core::Position, Piece>> piecesOf(core::PlayerColor c) const;

  const Map& pieces() const noexcept { return m_pieces; }
  std::size_t size() const noexcept { return m_pieces.size(); }

  // standard four-player starting layout
  void setupInitial();

 private:
  Map m_pieces;
};

bool operator==(const Board& a, const Board& b);
inline bool operator!=(const Board& a, const Board& b) {
  return !(a == b);
}

}  // namespace tetra::model

#include "tetra/model/board.hpp"

#include <cstdlib>

#include "tetra/model/notation.hpp"
#include "tetra/model/player.hpp"

namespace tetra::model {

namespace {

using core::PieceType;
using PT = core::PieceType;

// back rows read with increasing file (Red/Yellow) or rank (Blue/Green)
constexpr PieceType kBackRow[core::NUM_PLAYERS][8] = {
    {PT::Rook, PT::Knight, PT::Bishop, PT::Queen, PT::King, PT::Bishop, PT::Knight, PT::Rook},
    {PT::Rook, PT::Knight, PT::Bishop, PT::Queen, PT::King, PT::Bishop, PT::Knight, PT::Rook},
    {PT::Rook, PT::Knight, PT::Bishop, PT::King, PT::Queen, PT::Bishop, PT::Knight, PT::Rook},
    {PT::Rook, PT::Knight, PT::Bishop, PT::King, PT::Queen, PT::Bishop, PT::Knight, PT::Rook}};

constexpr int kBackLine[core::NUM_PLAYERS] = {0, 0, core::BOARD_SIZE - 1, core::BOARD_SIZE - 1};

inline int sign(int v) noexcept {
  return (v > 0) - (v < 0);
}

}  // namespace

InvalidPosition::InvalidPosition(core::Position p)
    : std::out_of_range("InvalidPosition: " + squareToString(p) + " (" + std::to_string(p.file) +
                        "," + std::to_string(p.rank) + ") is not on the board"),
      m_pos(p) {}

bool Board::onBoard(core::Position p) noexcept {
  constexpr int lo = core::CORNER_SIZE;
  constexpr int hi = core::BOARD_SIZE - core::CORNER_SIZE - 1;
  if (p.file < 0 || p.file >= core::BOARD_SIZE || p.rank < 0 || p.rank >= core::BOARD_SIZE)
    return false;
  const bool fileInArm = p.file >= lo && p.file <= hi;
  const bool rankInArm = p.rank >= lo && p.rank <= hi;
  return fileInArm || rankInArm;
}

std::optional<Piece> Board::pieceAt(core::Position p) const {
  auto it = m_pieces.find(p);
  if (it == m_pieces.end()) return std::nullopt;
  return it->second;
}

void Board::set(core::Position p, std::optional<Piece> piece) {
  if (!onBoard(p)) throw InvalidPosition(p);
  if (piece.has_value())
    m_pieces[p] = *piece;
  else
    m_pieces.erase(p);
}

std::vector<core::Position> Board::squaresBetween(core::Position a, core::Position b) {
  std::vector<core::Position> out;
  const int df = b.file - a.file;
  const int dr = b.rank - a.rank;
  if (df == 0 && dr == 0) return out;
  if (df != 0 && dr != 0 && std::abs(df) != std::abs(dr)) return out;

  const core::Position step{sign(df), sign(dr)};
  for (core::Position cur = a + step; cur != b; cur = cur + step) out.push_back(cur);
  return out;
}

std::optional<core::Position> Board::kingPosition(core::PlayerColor c) const {
  for (const auto& [pos, piece] : m_pieces)
    if (piece.owner == c && piece.type == PT::King) return pos;
  return std::nullopt;
}

std::vector<std::pair<core::Position, Piece>> Board::piecesOf(core::PlayerColor c) const {
  std::vector<std::pair<core::Position, Piece>> out;
  out.reserve(16);
  for (const auto& entry : m_pieces)
    if (entry.second.owner == c) out.push_back(entry);
  return out;
}

void Board::setupInitial() {
  clear();
  for (int ci = 0; ci < core::NUM_PLAYERS; ++ci) {
    const auto color = core::playerFromIndex(ci);
    const Orientation& o = orientation(color);
    for (int i = 0; i < 8; ++i) {
      const int along = core::CORNER_SIZE + i;
      const core::Position back =
          o.alongRanks() ? core::Position{along, kBackLine[ci]} : core::Position{kBackLine[ci], along};
      const core::Position pawn =
          o.alongRanks() ? core::Position{along, o.pawnLine} : core::Position{o.pawnLine, along};
      set(back, Piece{kBackRow[ci][i], color});
      set(pawn, Piece{PT::Pawn, color});
    }
  }
}

bool operator==(const Board& a, const Board& b) {
  return a.pieces() == b.pieces();
}

}  // namespace tetra::model

#include "tetra/model/notation.hpp"

#include <cctype>

namespace tetra::model {

namespace {

// Parses one square at text[pos..], advancing pos.
bool readSquare(std::string_view text, std::size_t& pos, core::Position& out) {
  if (pos >= text.size()) return false;
  const char f = static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos])));
  if (f < 'a' || f >= 'a' + core::BOARD_SIZE) return false;
  ++pos;

  int rank = 0;
  int digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) && digits < 2) {
    rank = rank * 10 + (text[pos] - '0');
    ++pos;
    ++digits;
  }
  if (digits == 0 || rank < 1 || rank > core::BOARD_SIZE) return false;

  out = core::Position{f - 'a', rank - 1};
  return true;
}

}  // namespace

std::string squareToString(core::Position p) {
  std::string s;
  s.push_back(static_cast<char>('a' + p.file));
  s += std::to_string(p.rank + 1);
  return s;
}

bool parseSquare(std::string_view text, core::Position& out) {
  std::size_t pos = 0;
  core::Position p;
  if (!readSquare(text, pos, p) || pos != text.size()) return false;
  out = p;
  return true;
}

char pieceChar(core::PieceType t) noexcept {
  switch (t) {
    case core::PieceType::Pawn:
      return 'P';
    case core::PieceType::Knight:
      return 'N';
    case core::PieceType::Bishop:
      return 'B';
    case core::PieceType::Rook:
      return 'R';
    case core::PieceType::Queen:
      return 'Q';
    case core::PieceType::King:
      return 'K';
    case core::PieceType::None:
      break;
  }
  return '?';
}

core::PieceType pieceFromChar(char c) noexcept {
  switch (std::toupper(static_cast<unsigned char>(c))) {
    case 'P':
      return core::PieceType::Pawn;
    case 'N':
      return core::PieceType::Knight;
    case 'B':
      return core::PieceType::Bishop;
    case 'R':
      return core::PieceType::Rook;
    case 'Q':
      return core::PieceType::Queen;
    case 'K':
      return core::PieceType::King;
    default:
      return core::PieceType::None;
  }
}

std::string moveToString(const Move& m) {
  std::string s = squareToString(m.from) + squareToString(m.to);
  if (m.promotion != core::PieceType::None)
    s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(pieceChar(m.promotion)))));
  return s;
}

bool parseMove(std::string_view text, Move& out) {
  std::size_t pos = 0;
  core::Position from, to;
  if (!readSquare(text, pos, from)) return false;
  if (!readSquare(text, pos, to)) return false;

  core::PieceType promo = core::PieceType::None;
  if (pos < text.size()) {
    promo = pieceFromChar(text[pos++]);
    if (promo == core::PieceType::None || promo == core::PieceType::Pawn ||
        promo == core::PieceType::King)
      return false;
  }
  if (pos != text.size()) return false;

  out = Move(from, to, promo);
  return true;
}

}  // namespace tetra::model

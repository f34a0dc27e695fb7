#include "tetra/model/move_error.hpp"

namespace tetra::model {

const char* toString(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::None:
      return "None";
    case ErrorCode::IllegalMove:
      return "IllegalMove";
    case ErrorCode::NoHistory:
      return "NoHistory";
    case ErrorCode::GameAlreadyFinished:
      return "GameAlreadyFinished";
  }
  return "Unknown";
}

const char* toString(IllegalReason reason) noexcept {
  switch (reason) {
    case IllegalReason::None:
      return "none";
    case IllegalReason::OutOfBounds:
      return "out-of-bounds";
    case IllegalReason::NoPieceAtSource:
      return "no-piece-at-source";
    case IllegalReason::WrongTurn:
      return "wrong-turn";
    case IllegalReason::OccupiedByOwnPiece:
      return "occupied-by-own-piece";
    case IllegalReason::NotPiecePattern:
      return "not-this-piece's-pattern";
    case IllegalReason::LeavesKingInCheck:
      return "leaves-king-in-check";
    case IllegalReason::CastlesThroughCheck:
      return "castles-through-check";
    case IllegalReason::KingCapture:
      return "king-capture";
  }
  return "unknown";
}

}  // namespace tetra::model

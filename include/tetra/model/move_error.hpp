#pragma once
#include <cstdint>
#include <string>

namespace tetra::model {

enum class ErrorCode : std::uint8_t { None, IllegalMove, NoHistory, GameAlreadyFinished };

// Which rule an IllegalMove violated.
enum class IllegalReason : std::uint8_t {
  None,
  OutOfBounds,
  NoPieceAtSource,
  WrongTurn,
  OccupiedByOwnPiece,
  NotPiecePattern,
  LeavesKingInCheck,
  CastlesThroughCheck,
  KingCapture
};

struct MoveError {
  ErrorCode code = ErrorCode::None;
  IllegalReason reason = IllegalReason::None;
  std::string message;
};

const char* toString(ErrorCode code) noexcept;
const char* toString(IllegalReason reason) noexcept;

}  // namespace tetra::model

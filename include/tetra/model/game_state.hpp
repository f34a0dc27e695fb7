#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "../constants.hpp"
#include "board.hpp"
#include "move.hpp"
#include "move_error.hpp"
#include "move_generator.hpp"
#include "player.hpp"
#include "rules_config.hpp"
#include "turn_manager.hpp"

namespace tetra::model {

// Everything needed to resume play from a position: board, players and turn bookkeeping.
struct PositionRecord {
  Board board;
  Roster players = makeRoster();
  TurnState turn;
};

inline bool operator==(const PositionRecord& a, const PositionRecord& b) {
  return a.board == b.board && a.players == b.players && a.turn == b.turn;
}
inline bool operator!=(const PositionRecord& a, const PositionRecord& b) {
  return !(a == b);
}

// One history entry: the move plus what undo needs beyond the move's own snapshots.
struct StateInfo {
  Move move{};
  std::optional<core::Position> clearedEnPassant;  // pawn whose eligibility expired
  Roster prevPlayers{};
  TurnState prevTurn{};
};

struct PlayerStatus {
  core::PlayerColor color = core::PlayerColor::Red;
  bool inCheck = false;
  bool eliminated = false;
  int score = 0;
};

struct GameStatus {
  core::PlayerColor active = core::PlayerColor::Red;
  std::array<PlayerStatus, core::NUM_PLAYERS> players{};
  core::Outcome outcome{};
};

/**
 * @brief GameState: facade over board, turn sequencing and history.
 *
 * - Legal move queries for the player to move or a single square (move hints)
 * - applyMove/undoLastMove with explicit error reporting; a rejected call changes nothing
 * - status() summary for views and search layers
 *
 * Not thread-safe for mutation; const queries never touch the board.
 */
class GameState {
 public:
  explicit GameState(const RulesConfig& cfg = {});

  static GameState newGame(const RulesConfig& cfg = {});

  // standard layout, Red to move, empty history
  void reset();
  // arbitrary position; the history starts over from here
  void setPosition(const PositionRecord& pos);

  const Board& board() const noexcept { return m_pos.board; }
  const Roster& players() const noexcept { return m_pos.players; }
  const TurnState& turn() const noexcept { return m_pos.turn; }
  const PositionRecord& position() const noexcept { return m_pos; }
  const PositionRecord& startPosition() const noexcept { return m_start; }
  core::PlayerColor activePlayer() const noexcept {
    return core::playerFromIndex(m_pos.turn.activeIndex);
  }
  const core::Outcome& outcome() const noexcept { return m_pos.turn.outcome; }

  const RulesConfig& config() const noexcept { return m_turns.config(); }
  void setConfig(const RulesConfig& cfg) noexcept { m_turns.setConfig(cfg); }

  // Legal moves of the player to move (empty once the game is over).
  std::vector<Move> legalMoves() const;
  std::vector<Move> legalMoves(core::PlayerColor side) const;
  // Moves of the piece on `from`; only the player to move gets any.
  std::vector<Move> legalMovesFrom(core::Position from) const;
  std::optional<Move> findMove(core::Position from, core::Position to,
                               core::PieceType promotion = core::PieceType::None) const;

  bool inCheck(core::PlayerColor p) const;
  bool isCheckmated(core::PlayerColor p) const;
  bool isStalemated(core::PlayerColor p) const;

  // The move is matched against the legal moves by from/to/promotion.
  bool applyMove(const Move& m, MoveError* error = nullptr);
  bool undoLastMove(MoveError* error = nullptr);

  GameStatus status() const;

  const std::vector<StateInfo>& history() const noexcept { return m_history; }
  std::vector<Move> moveHistory() const;

  std::uint64_t positionKey() const;

 private:
  PositionRecord m_pos;
  PositionRecord m_start;
  TurnManager m_turns;
  MoveGenerator m_move_gen;
  std::vector<StateInfo> m_history;
  std::vector<std::uint64_t> m_keys;  // position keys, start position included

  bool reject(MoveError* error, ErrorCode code, IllegalReason reason, std::string message) const;
  bool validate(const Move& m, Move& resolved, MoveError* error) const;
};

}  // namespace tetra::model

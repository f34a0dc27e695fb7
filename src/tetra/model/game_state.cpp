#include "tetra/model/game_state.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

#include "tetra/model/move_helper.hpp"
#include "tetra/model/notation.hpp"
#include "tetra/model/piece_rules.hpp"
#include "tetra/model/zobrist.hpp"

namespace tetra::model {

namespace {

inline bool sameRequest(const Move& candidate, const Move& request) noexcept {
  return candidate.from == request.from && candidate.to == request.to &&
         candidate.promotion == request.promotion;
}

IllegalReason toReason(MoveGenerator::Rejection r) noexcept {
  switch (r) {
    case MoveGenerator::Rejection::KingCapture:
      return IllegalReason::KingCapture;
    case MoveGenerator::Rejection::CastlesThroughCheck:
      return IllegalReason::CastlesThroughCheck;
    case MoveGenerator::Rejection::LeavesKingInCheck:
      return IllegalReason::LeavesKingInCheck;
    case MoveGenerator::Rejection::None:
      break;
  }
  return IllegalReason::None;
}

}  // namespace

GameState::GameState(const RulesConfig& cfg) : m_turns(cfg) {
  reset();
}

GameState GameState::newGame(const RulesConfig& cfg) {
  return GameState(cfg);
}

void GameState::reset() {
  PositionRecord start;
  start.board.setupInitial();
  setPosition(start);
}

void GameState::setPosition(const PositionRecord& pos) {
  m_pos = pos;
  m_start = pos;
  m_history.clear();
  m_keys.clear();
  m_keys.push_back(positionKey());
}

std::vector<Move> GameState::legalMoves() const {
  if (outcome().finished()) return {};
  return legalMoves(activePlayer());
}

std::vector<Move> GameState::legalMoves(core::PlayerColor side) const {
  std::vector<Move> out;
  m_move_gen.generateLegalMoves(m_pos.board, m_pos.players, side, out);
  return out;
}

std::vector<Move> GameState::legalMovesFrom(core::Position from) const {
  std::vector<Move> out;
  if (outcome().finished()) return out;
  auto occ = m_pos.board.pieceAt(from);
  if (!occ || occ->owner != activePlayer()) return out;
  m_move_gen.generateLegalMovesFrom(m_pos.board, m_pos.players, from, out);
  return out;
}

std::optional<Move> GameState::findMove(core::Position from, core::Position to,
                                        core::PieceType promotion) const {
  const Move request(from, to, promotion);
  for (const auto& m : legalMovesFrom(from))
    if (sameRequest(m, request)) return m;
  return std::nullopt;
}

bool GameState::inCheck(core::PlayerColor p) const {
  return m_turns.checks().inCheck(m_pos.board, m_pos.players, p);
}

bool GameState::isCheckmated(core::PlayerColor p) const {
  return m_turns.checks().isCheckmated(m_pos.board, m_pos.players, p);
}

bool GameState::isStalemated(core::PlayerColor p) const {
  return m_turns.checks().isStalemated(m_pos.board, m_pos.players, p);
}

bool GameState::reject(MoveError* error, ErrorCode code, IllegalReason reason,
                       std::string message) const {
  if (config().verbose) std::cerr << "[GameState] rejected: " << message << "\n";
  if (error) {
    error->code = code;
    error->reason = reason;
    error->message = std::move(message);
  }
  return false;
}

bool GameState::validate(const Move& m, Move& resolved, MoveError* error) const {
  const std::string text = moveToString(m);

  if (!Board::onBoard(m.from) || !Board::onBoard(m.to))
    return reject(error, ErrorCode::IllegalMove, IllegalReason::OutOfBounds,
                  text + ": square is not on the board");

  const auto piece = m_pos.board.pieceAt(m.from);
  if (!piece)
    return reject(error, ErrorCode::IllegalMove, IllegalReason::NoPieceAtSource,
                  text + ": no piece on " + squareToString(m.from));

  if (piece->owner != activePlayer())
    return reject(error, ErrorCode::IllegalMove, IllegalReason::WrongTurn,
                  text + ": " + colorName(activePlayer()) + " is to move, not " +
                      colorName(piece->owner));

  if (auto target = m_pos.board.pieceAt(m.to); target && target->owner == piece->owner)
    return reject(error, ErrorCode::IllegalMove, IllegalReason::OccupiedByOwnPiece,
                  text + ": " + squareToString(m.to) + " is occupied by an own piece");

  std::vector<Move> pseudo;
  PieceRules::pseudoLegalMoves(m_pos.board, m.from, pseudo);
  auto it = std::find_if(pseudo.begin(), pseudo.end(),
                         [&](const Move& c) { return sameRequest(c, m); });
  if (it == pseudo.end())
    return reject(error, ErrorCode::IllegalMove, IllegalReason::NotPiecePattern,
                  text + ": not a move of the " + std::string(1, pieceChar(piece->type)) +
                      " on " + squareToString(m.from));

  const auto rejection = m_move_gen.classify(m_pos.board, m_pos.players, *it);
  if (rejection != MoveGenerator::Rejection::None) {
    const IllegalReason reason = toReason(rejection);
    return reject(error, ErrorCode::IllegalMove, reason, text + ": " + toString(reason));
  }

  resolved = *it;
  return true;
}

bool GameState::applyMove(const Move& m, MoveError* error) {
  if (outcome().finished())
    return reject(error, ErrorCode::GameAlreadyFinished, IllegalReason::None,
                  "game is already finished");

  Move resolved;
  if (!validate(m, resolved, error)) return false;

  StateInfo info;
  info.move = resolved;
  info.prevPlayers = m_pos.players;
  info.prevTurn = m_pos.turn;

  const PlyReport report = m_turns.playMove(m_pos.board, m_pos.players, m_pos.turn, resolved);
  info.clearedEnPassant = report.clearedEnPassant;
  m_history.push_back(info);

  const std::uint64_t key = positionKey();
  m_keys.push_back(key);
  const int occurrences = static_cast<int>(std::count(m_keys.begin(), m_keys.end(), key));
  m_turns.applyRepetitionRule(m_pos.turn, occurrences);

  if (error) *error = MoveError{};
  return true;
}

bool GameState::undoLastMove(MoveError* error) {
  if (m_history.empty())
    return reject(error, ErrorCode::NoHistory, IllegalReason::None, "no move to undo");

  const StateInfo info = m_history.back();
  m_history.pop_back();
  m_keys.pop_back();

  unmakeMove(m_pos.board, info.move, info.clearedEnPassant);
  m_pos.players = info.prevPlayers;
  m_pos.turn = info.prevTurn;

  if (error) *error = MoveError{};
  return true;
}

GameStatus GameState::status() const {
  GameStatus st;
  st.active = activePlayer();
  st.outcome = outcome();
  for (int i = 0; i < core::NUM_PLAYERS; ++i) {
    const Player& p = m_pos.players[i];
    st.players[i] = PlayerStatus{p.color, inCheck(p.color), p.eliminated, p.score};
  }
  return st;
}

std::vector<Move> GameState::moveHistory() const {
  std::vector<Move> out;
  out.reserve(m_history.size());
  for (const auto& st : m_history) out.push_back(st.move);
  return out;
}

std::uint64_t GameState::positionKey() const {
  return Zobrist::compute(m_pos.board, m_pos.players, activePlayer());
}

}  // namespace tetra::model

#include "tetra/model/snapshot.hpp"

#include <charconv>
#include <sstream>
#include <string_view>
#include <vector>

#include "tetra/model/notation.hpp"

namespace tetra::model {

namespace {

constexpr std::string_view kMagic = "tetra-snapshot";
constexpr int kVersion = 1;

std::vector<std::string> split(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::string cur;
  for (char ch : s) {
    if (ch == sep) {
      out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(ch);
    }
  }
  out.push_back(cur);
  return out;
}

bool parseInt(std::string_view text, int& out) {
  if (text.empty()) return false;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto res = std::from_chars(first, last, out);
  return res.ec == std::errc() && res.ptr == last;
}

bool fail(std::string* error, const std::string& msg) {
  if (error) *error = msg;
  return false;
}

// ---------------- Board ----------------

std::string pieceToken(const Piece& p) {
  std::string t;
  t.push_back(colorChar(p.owner));
  t.push_back(pieceChar(p.type));
  if (p.hasMoved) t.push_back('+');
  if (p.enPassant) t.push_back('^');
  return t;
}

bool parsePieceToken(const std::string& t, Piece& out) {
  if (t.size() < 2 || t.size() > 4) return false;
  core::PlayerColor owner;
  if (!colorFromChar(t[0], owner)) return false;
  const core::PieceType type = pieceFromChar(t[1]);
  if (type == core::PieceType::None || t[1] != pieceChar(type)) return false;

  Piece p{type, owner};
  for (std::size_t i = 2; i < t.size(); ++i) {
    if (t[i] == '+' && !p.hasMoved)
      p.hasMoved = true;
    else if (t[i] == '^' && !p.enPassant)
      p.enPassant = true;
    else
      return false;
  }
  if (p.enPassant && p.type != core::PieceType::Pawn) return false;
  out = p;
  return true;
}

std::string writeBoard(const Board& b) {
  std::string out;
  for (int rank = core::BOARD_SIZE - 1; rank >= 0; --rank) {
    std::vector<std::string> cells;
    int run = 0;
    for (int file = 0; file < core::BOARD_SIZE; ++file) {
      auto p = b.pieceAt(core::Position{file, rank});
      if (!p) {
        ++run;
        continue;
      }
      if (run) cells.push_back(std::to_string(run));
      run = 0;
      cells.push_back(pieceToken(*p));
    }
    if (run) cells.push_back(std::to_string(run));

    for (std::size_t i = 0; i < cells.size(); ++i) {
      if (i) out.push_back(',');
      out += cells[i];
    }
    if (rank) out.push_back('/');
  }
  return out;
}

bool readBoard(const std::string& text, Board& out, std::string* error) {
  const auto rows = split(text, '/');
  if (rows.size() != static_cast<std::size_t>(core::BOARD_SIZE))
    return fail(error, "board: expected 14 rows, got " + std::to_string(rows.size()));

  Board b;
  int epCount = 0;
  for (int r = 0; r < core::BOARD_SIZE; ++r) {
    const int rank = core::BOARD_SIZE - 1 - r;
    int file = 0;
    for (const auto& cell : split(rows[r], ',')) {
      int run = 0;
      if (parseInt(cell, run)) {
        if (run <= 0 || run > core::BOARD_SIZE - file)
          return fail(error, "board: bad empty run '" + cell + "'");
        file += run;
        continue;
      }
      Piece p;
      if (!parsePieceToken(cell, p)) return fail(error, "board: bad piece token '" + cell + "'");
      const core::Position pos{file, rank};
      if (file >= core::BOARD_SIZE || !Board::onBoard(pos))
        return fail(error, "board: piece '" + cell + "' outside the board");
      if (p.enPassant) ++epCount;
      b.set(pos, p);
      ++file;
    }
    if (file != core::BOARD_SIZE)
      return fail(error, "board: rank " + std::to_string(rank + 1) + " has " +
                             std::to_string(file) + " squares");
  }
  if (epCount > 1) return fail(error, "board: more than one pawn flagged en passant");
  out = std::move(b);
  return true;
}

// ---------------- Players / outcome ----------------

std::string writePlayers(const Roster& players) {
  std::string out;
  for (int i = 0; i < core::NUM_PLAYERS; ++i) {
    if (i) out.push_back(',');
    out.push_back(colorChar(players[i].color));
    out += ':';
    out += players[i].eliminated ? '1' : '0';
    out += ':' + std::to_string(players[i].score);
  }
  return out;
}

bool readPlayers(const std::string& text, Roster& out, std::string* error) {
  const auto entries = split(text, ',');
  if (entries.size() != static_cast<std::size_t>(core::NUM_PLAYERS))
    return fail(error, "players: expected 4 entries");

  Roster r = makeRoster();
  for (int i = 0; i < core::NUM_PLAYERS; ++i) {
    const auto fields = split(entries[i], ':');
    core::PlayerColor c;
    if (fields.size() != 3 || fields[0].size() != 1 || !colorFromChar(fields[0][0], c) ||
        c != r[i].color)
      return fail(error, "players: bad entry '" + entries[i] + "'");
    if (fields[1] != "0" && fields[1] != "1")
      return fail(error, "players: bad elimination flag in '" + entries[i] + "'");
    int score = 0;
    if (!parseInt(fields[2], score)) return fail(error, "players: bad score in '" + entries[i] + "'");
    r[i].eliminated = fields[1] == "1";
    r[i].score = score;
  }
  out = r;
  return true;
}

std::string writeOutcome(const core::Outcome& o) {
  switch (o.result) {
    case core::ONGOING:
      return "*";
    case core::LAST_STANDING:
      return std::string("win-") + colorChar(o.winner);
    case core::STALEMATE:
      return "stalemate";
    case core::MOVERULE:
      return "moverule";
    case core::REPETITION:
      return "repetition";
  }
  return "*";
}

bool readOutcome(const std::string& text, core::Outcome& out) {
  core::Outcome o;
  if (text == "*") {
    o.result = core::ONGOING;
  } else if (text.size() == 5 && text.compare(0, 4, "win-") == 0) {
    if (!colorFromChar(text[4], o.winner)) return false;
    o.result = core::LAST_STANDING;
  } else if (text == "stalemate") {
    o.result = core::STALEMATE;
  } else if (text == "moverule") {
    o.result = core::MOVERULE;
  } else if (text == "repetition") {
    o.result = core::REPETITION;
  } else {
    return false;
  }
  out = o;
  return true;
}

// ---------------- Rules ----------------

std::string writeRules(const RulesConfig& cfg) {
  return std::to_string(cfg.checkmateBonus) + ' ' + std::to_string(cfg.noProgressPlyLimit) + ' ' +
         std::to_string(cfg.repetitionLimit);
}

// verbose is a property of the loading session, not of the game
bool readRules(const std::string& text, RulesConfig& out, std::string* error) {
  std::istringstream iss(text);
  std::string bonus, noProgress, repetition, extra;
  if (!(iss >> bonus >> noProgress >> repetition) || (iss >> extra))
    return fail(error, "rules: expected 3 fields");
  RulesConfig cfg = out;
  if (!parseInt(bonus, cfg.checkmateBonus) || cfg.checkmateBonus < 0)
    return fail(error, "rules: bad checkmate bonus '" + bonus + "'");
  if (!parseInt(noProgress, cfg.noProgressPlyLimit) || cfg.noProgressPlyLimit < 0)
    return fail(error, "rules: bad no-progress limit '" + noProgress + "'");
  if (!parseInt(repetition, cfg.repetitionLimit) || cfg.repetitionLimit < 0)
    return fail(error, "rules: bad repetition limit '" + repetition + "'");
  out = cfg;
  return true;
}

// every non-eliminated player needs exactly one king, nobody more than one
bool kingsValid(const PositionRecord& pos, std::string* error) {
  int kings[core::NUM_PLAYERS] = {0, 0, 0, 0};
  for (const auto& [sq, p] : pos.board.pieces())
    if (p.type == core::PieceType::King) ++kings[core::pi(p.owner)];
  for (int i = 0; i < core::NUM_PLAYERS; ++i) {
    const bool ok = pos.players[i].eliminated ? kings[i] <= 1 : kings[i] == 1;
    if (!ok)
      return fail(error, "position: " + colorName(core::playerFromIndex(i)) + " has " +
                             std::to_string(kings[i]) + " kings");
  }
  return true;
}

}  // namespace

std::string writePositionRecord(const PositionRecord& pos) {
  std::ostringstream oss;
  oss << colorChar(core::playerFromIndex(pos.turn.activeIndex)) << ' '
      << writePlayers(pos.players) << ' ' << writeOutcome(pos.turn.outcome) << ' '
      << pos.turn.noProgressPlies << ' ' << writeBoard(pos.board);
  return oss.str();
}

bool readPositionRecord(const std::string& text, PositionRecord& out, std::string* error) {
  std::istringstream iss(text);
  std::string active, players, outcome, counter, board, extra;
  if (!(iss >> active >> players >> outcome >> counter >> board))
    return fail(error, "record: expected 5 fields");
  if (iss >> extra) return fail(error, "record: unexpected trailing field '" + extra + "'");

  PositionRecord pos;
  core::PlayerColor side;
  if (active.size() != 1 || !colorFromChar(active[0], side))
    return fail(error, "record: bad active player '" + active + "'");
  pos.turn.activeIndex = core::pi(side);

  if (!readPlayers(players, pos.players, error)) return false;
  if (!readOutcome(outcome, pos.turn.outcome))
    return fail(error, "record: bad outcome '" + outcome + "'");
  if (!parseInt(counter, pos.turn.noProgressPlies) || pos.turn.noProgressPlies < 0)
    return fail(error, "record: bad ply counter '" + counter + "'");
  if (!readBoard(board, pos.board, error)) return false;

  if (!pos.turn.outcome.finished() && pos.players[pos.turn.activeIndex].eliminated)
    return fail(error, "record: eliminated player is to move");
  if (!kingsValid(pos, error)) return false;

  out = std::move(pos);
  return true;
}

std::string writeSnapshot(const GameState& game) {
  std::ostringstream oss;
  oss << kMagic << ' ' << kVersion << '\n';
  oss << "rules " << writeRules(game.config()) << '\n';
  oss << "start " << writePositionRecord(game.startPosition()) << '\n';
  oss << "moves";
  for (const auto& st : game.history()) oss << ' ' << moveToString(st.move);
  oss << '\n';
  oss << "current " << writePositionRecord(game.position()) << '\n';
  return oss.str();
}

bool readSnapshot(const std::string& text, GameState& game, std::string* error) {
  std::istringstream in(text);
  std::string line;

  if (!std::getline(in, line)) return fail(error, "snapshot: empty input");
  {
    std::istringstream hdr(line);
    std::string magic;
    int version = 0;
    if (!(hdr >> magic >> version) || magic != kMagic)
      return fail(error, "snapshot: missing header");
    if (version != kVersion)
      return fail(error, "snapshot: unsupported version " + std::to_string(version));
  }

  std::string rulesLine, startLine, movesLine, currentLine;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    const auto sp = line.find(' ');
    const std::string key = line.substr(0, sp);
    const std::string rest = (sp == std::string::npos) ? "" : line.substr(sp + 1);
    if (key == "rules")
      rulesLine = rest;
    else if (key == "start")
      startLine = rest;
    else if (key == "moves")
      movesLine = rest;
    else if (key == "current")
      currentLine = rest;
    else
      return fail(error, "snapshot: unknown section '" + key + "'");
  }
  if (startLine.empty() || currentLine.empty())
    return fail(error, "snapshot: start and current sections are required");

  PositionRecord start, current;
  if (!readPositionRecord(startLine, start, error)) return false;
  if (!readPositionRecord(currentLine, current, error)) return false;

  // snapshots without a rules line replay under the target's rules
  RulesConfig rules = game.config();
  if (!rulesLine.empty() && !readRules(rulesLine, rules, error)) return false;

  GameState replay(rules);
  replay.setPosition(start);

  std::istringstream moves(movesLine);
  std::string tok;
  while (moves >> tok) {
    Move m;
    if (!parseMove(tok, m)) return fail(error, "snapshot: bad move '" + tok + "'");
    MoveError err;
    if (!replay.applyMove(m, &err))
      return fail(error, "snapshot: move " + std::to_string(replay.history().size() + 1) + " " +
                             err.message);
  }

  if (replay.position() != current)
    return fail(error, "snapshot: replayed moves do not reach the current position");

  game = std::move(replay);
  return true;
}

}  // namespace tetra::model

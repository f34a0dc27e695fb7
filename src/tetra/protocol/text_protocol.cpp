#include "tetra/protocol/text_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "tetra/model/notation.hpp"
#include "tetra/model/perft.hpp"
#include "tetra/model/snapshot.hpp"

namespace tetra {

namespace {

std::vector<std::string> split_ws(const std::string& s) {
  std::istringstream iss(s);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

std::string rest_after(const std::string& line, const std::string& cmd) {
  auto pos = line.find(cmd);
  if (pos == std::string::npos) return "";
  pos += cmd.size();
  while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
  return line.substr(pos);
}

const char* resultName(core::GameResult r) {
  switch (r) {
    case core::ONGOING:
      return "ongoing";
    case core::LAST_STANDING:
      return "win";
    case core::STALEMATE:
      return "stalemate";
    case core::MOVERULE:
      return "moverule";
    case core::REPETITION:
      return "repetition";
  }
  return "unknown";
}

}  // namespace

void TextProtocol::showOptions(std::ostream& out) const {
  out << "option name CheckmateBonus type spin default " << m_options.checkmateBonus
      << " min 0 max 1000\n";
  out << "option name NoProgressPlies type spin default " << m_options.noProgressPlyLimit
      << " min 0 max 10000\n";
  out << "option name RepetitionLimit type spin default " << m_options.repetitionLimit
      << " min 0 max 100\n";
  out << "option name Verbose type check default " << (m_options.verbose ? "true" : "false")
      << "\n";
}

void TextProtocol::setOption(const std::string& line) {
  auto tokens = split_ws(line);
  std::string name;
  std::string value;
  for (std::size_t i = 1; i + 1 < tokens.size(); ++i) {
    if (tokens[i] == "name") name = tokens[i + 1];
    if (tokens[i] == "value") value = tokens[i + 1];
  }
  if (name.empty()) return;

  try {
    if (name == "CheckmateBonus") {
      m_options.checkmateBonus = std::clamp(std::stoi(value), 0, 1000);
    } else if (name == "NoProgressPlies") {
      m_options.noProgressPlyLimit = std::clamp(std::stoi(value), 0, 10000);
    } else if (name == "RepetitionLimit") {
      m_options.repetitionLimit = std::clamp(std::stoi(value), 0, 100);
    } else if (name == "Verbose") {
      std::string vl = value;
      std::transform(vl.begin(), vl.end(), vl.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      m_options.verbose = (vl == "true" || vl == "1" || vl == "on");
    } else {
      std::cerr << "[Protocol] warning: unknown option " << name << "\n";
      return;
    }
  } catch (const std::exception& e) {
    std::cerr << "[Protocol] warning: bad value '" << value << "' for " << name << ": "
              << e.what() << "\n";
    return;
  }
  m_game.setConfig(m_options);
}

void TextProtocol::showBoard(std::ostream& out) const {
  const auto& board = m_game.board();
  for (int rank = core::BOARD_SIZE - 1; rank >= 0; --rank) {
    out << (rank + 1 < 10 ? " " : "") << (rank + 1) << ' ';
    for (int file = 0; file < core::BOARD_SIZE; ++file) {
      const core::Position p{file, rank};
      if (!model::Board::onBoard(p)) {
        out << "   ";
      } else if (auto piece = board.pieceAt(p)) {
        out << model::colorChar(piece->owner) << model::pieceChar(piece->type) << ' ';
      } else {
        out << " . ";
      }
    }
    out << "\n";
  }
  out << "   ";
  for (int file = 0; file < core::BOARD_SIZE; ++file)
    out << ' ' << static_cast<char>('a' + file) << ' ';
  out << "\n";
}

void TextProtocol::showStatus(std::ostream& out) const {
  const auto st = m_game.status();
  out << "active " << model::colorName(st.active) << "\n";
  for (const auto& p : st.players) {
    out << "player " << model::colorName(p.color) << " score " << p.score
        << (p.inCheck ? " check" : "") << (p.eliminated ? " eliminated" : "") << "\n";
  }
  out << "outcome " << resultName(st.outcome.result);
  if (st.outcome.result == core::LAST_STANDING) out << ' ' << model::colorName(st.outcome.winner);
  out << "\n";
}

void TextProtocol::listMoves(const std::string& square, std::ostream& out) const {
  std::vector<model::Move> moves;
  if (square.empty()) {
    moves = m_game.legalMoves();
  } else {
    core::Position from;
    if (!model::parseSquare(square, from)) {
      out << "error bad square " << square << "\n";
      return;
    }
    moves = m_game.legalMovesFrom(from);
  }

  std::vector<std::string> names;
  names.reserve(moves.size());
  for (const auto& m : moves) names.push_back(model::moveToString(m));
  std::sort(names.begin(), names.end());

  out << "moves";
  for (const auto& n : names) out << ' ' << n;
  out << "\n";
}

void TextProtocol::playMoves(const std::string& line, std::ostream& out) {
  for (const auto& tok : split_ws(line)) {
    model::Move m;
    if (!model::parseMove(tok, m)) {
      out << "error bad move " << tok << "\n";
      return;
    }
    model::MoveError err;
    if (!m_game.applyMove(m, &err)) {
      out << "error " << model::toString(err.code) << ' ' << model::toString(err.reason) << ' '
          << err.message << "\n";
      return;
    }
  }
  out << "ok\n";
}

void TextProtocol::runPerft(const std::string& arg, std::ostream& out) {
  int depth = 1;
  try {
    depth = std::stoi(arg);
  } catch (const std::exception&) {
    out << "error bad depth " << arg << "\n";
    return;
  }
  std::vector<std::pair<model::Move, std::uint64_t>> divide;
  try {
    divide = model::perftDivide(m_game, depth);
  } catch (const std::logic_error& e) {
    std::cerr << "[Protocol] " << e.what() << "\n";
    out << "error " << e.what() << "\n";
    return;
  }
  std::uint64_t total = 0;
  for (const auto& [m, nodes] : divide) {
    out << model::moveToString(m) << ": " << nodes << "\n";
    total += nodes;
  }
  out << "nodes " << total << "\n";
}

void TextProtocol::save(const std::string& path, std::ostream& out) const {
  std::ofstream file(path);
  if (!file) {
    out << "error cannot write " << path << "\n";
    return;
  }
  file << model::writeSnapshot(m_game);
  out << (file ? "ok\n" : "error write failed\n");
}

void TextProtocol::load(const std::string& path, std::ostream& out) {
  std::ifstream file(path);
  if (!file) {
    out << "error cannot read " << path << "\n";
    return;
  }
  std::string content((std::istreambuf_iterator<char>(file)), {});
  std::string error;
  if (!model::readSnapshot(content, m_game, &error)) {
    out << "error " << error << "\n";
    return;
  }
  m_options = m_game.config();
  out << "ok\n";
}

int TextProtocol::run(std::istream& in, std::ostream& out) {
  m_game.setConfig(m_options);
  std::string line;

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;

    auto tokens = split_ws(line);
    if (tokens.empty()) continue;
    const std::string& cmd = tokens[0];
    const std::string arg = tokens.size() > 1 ? tokens[1] : "";

    if (cmd == "tetra") {
      out << "id name " << m_name << "\n";
      out << "id version " << m_version << "\n";
      showOptions(out);
      out << "tetraok\n";
    } else if (cmd == "isready") {
      out << "readyok\n";
    } else if (cmd == "setoption") {
      setOption(line);
    } else if (cmd == "newgame") {
      m_game.reset();
      out << "ok\n";
    } else if (cmd == "moves") {
      listMoves(arg, out);
    } else if (cmd == "move") {
      playMoves(rest_after(line, "move"), out);
    } else if (cmd == "undo") {
      model::MoveError err;
      if (m_game.undoLastMove(&err))
        out << "ok\n";
      else
        out << "error " << model::toString(err.code) << ' ' << err.message << "\n";
    } else if (cmd == "status") {
      showStatus(out);
    } else if (cmd == "show") {
      showBoard(out);
    } else if (cmd == "perft") {
      runPerft(arg, out);
    } else if (cmd == "save") {
      save(arg, out);
    } else if (cmd == "load") {
      load(arg, out);
    } else if (cmd == "quit") {
      break;
    } else {
      std::cerr << "[Protocol] unknown command: " << cmd << "\n";
      out << "error unknown command " << cmd << "\n";
    }
    out.flush();
  }
  return 0;
}

}  // namespace tetra

#pragma once
#include <iostream>
#include <string>

#include "tetra/model/game_state.hpp"
#include "tetra/model/rules_config.hpp"

namespace tetra {

// Line-oriented command loop around one GameState (stdin/stdout by default).
class TextProtocol {
 public:
  TextProtocol() = default;
  int run(std::istream& in = std::cin, std::ostream& out = std::cout);

  const model::GameState& game() const noexcept { return m_game; }

 private:
  void showOptions(std::ostream& out) const;
  void setOption(const std::string& line);
  void showBoard(std::ostream& out) const;
  void showStatus(std::ostream& out) const;
  void listMoves(const std::string& square, std::ostream& out) const;
  void playMoves(const std::string& line, std::ostream& out);
  void runPerft(const std::string& arg, std::ostream& out);
  void save(const std::string& path, std::ostream& out) const;
  void load(const std::string& path, std::ostream& out);

  model::RulesConfig m_options;

  std::string m_name = "Tetra";
  std::string m_version = "1.0";

  model::GameState m_game;
};

}  // namespace tetra

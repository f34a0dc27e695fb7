#include "tetra/model/player.hpp"

namespace tetra::model {

namespace {
constexpr char kColorChars[core::NUM_PLAYERS] = {'r', 'b', 'y', 'g'};
}

Roster makeRoster() noexcept {
  Roster r{};
  for (int i = 0; i < core::NUM_PLAYERS; ++i) r[i].color = core::playerFromIndex(i);
  return r;
}

int activePlayerCount(const Roster& players) noexcept {
  int n = 0;
  for (const Player& p : players)
    if (!p.eliminated) ++n;
  return n;
}

char colorChar(core::PlayerColor c) noexcept {
  return kColorChars[core::pi(c)];
}

bool colorFromChar(char ch, core::PlayerColor& out) noexcept {
  for (int i = 0; i < core::NUM_PLAYERS; ++i) {
    if (kColorChars[i] == ch) {
      out = core::playerFromIndex(i);
      return true;
    }
  }
  return false;
}

std::string colorName(core::PlayerColor c) {
  switch (c) {
    case core::PlayerColor::Red:
      return "Red";
    case core::PlayerColor::Blue:
      return "Blue";
    case core::PlayerColor::Yellow:
      return "Yellow";
    case core::PlayerColor::Green:
      return "Green";
  }
  return "?";
}

}  // namespace tetra::model

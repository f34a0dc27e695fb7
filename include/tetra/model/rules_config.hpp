#pragma once

namespace tetra::model {

struct RulesConfig {
  int checkmateBonus = 20;     // points for the player whose move checkmates an opponent
  int noProgressPlyLimit = 0;  // plies without capture or pawn move -> draw; 0 = off
  int repetitionLimit = 0;     // occurrences of the same position -> draw; 0 = off
  bool verbose = false;        // log eliminations and game end to std::cerr
};

}  // namespace tetra::model

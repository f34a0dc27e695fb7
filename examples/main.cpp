#include "tetra/protocol/text_protocol.hpp"

int main() {
  tetra::TextProtocol protocol;
  return protocol.run();
}

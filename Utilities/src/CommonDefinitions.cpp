#include "CommonDefinitions.hpp"

namespace utl {

std::string_view getMoveCode(const EMoveType moveType) {
  switch (moveType) {
    case EMoveType::Rapid:
      return "G0";
    case EMoveType::Linear:
      return "G1";
  }
  return "G1";
}

}  // namespace utl

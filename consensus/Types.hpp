#pragma once

#include <cstdint>
#include <string>

namespace mc {
namespace consensus {

struct Stakeholder {
  std::string address; // hex Ed25519 public key
  uint64_t stake{ 0 };
};

} // namespace consensus
} // namespace mc

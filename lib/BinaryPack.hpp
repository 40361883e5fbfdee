#ifndef MOCKCHAIN_BINARY_PACK_HPP
#define MOCKCHAIN_BINARY_PACK_HPP

#include "Serialize.hpp"
#include <sstream>
#include <string>

namespace mc {
namespace utl {

/**
 * Pack a struct/object to its canonical binary string using OutputArchive
 */
template <typename T> std::string binaryPack(const T &t) {
  std::ostringstream oss;
  OutputArchive ar(oss);
  ar &t;
  return oss.str();
}

} // namespace utl
} // namespace mc

#endif // MOCKCHAIN_BINARY_PACK_HPP

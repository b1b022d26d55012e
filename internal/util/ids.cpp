#include "ids.hpp"

#include <iomanip>
#include <sstream>

namespace netmap::util {

uint64_t Fnv1a64(std::string_view data, uint64_t seed) {
  uint64_t hash = seed;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

std::string MakeId(std::string_view prefix, std::string_view key) {
  std::ostringstream oss;
  oss << prefix << '-' << std::hex << std::setw(16) << std::setfill('0') << Fnv1a64(key);
  return oss.str();
}

IdBuilder::IdBuilder(std::string_view prefix) : prefix_(prefix) {
}

IdBuilder& IdBuilder::Add(std::string_view field) {
  key_ += std::to_string(field.size());
  key_ += ':';
  key_.append(field.data(), field.size());
  key_ += '|';
  return *this;
}

IdBuilder& IdBuilder::Add(uint64_t field) {
  return Add(std::to_string(field));
}

std::string IdBuilder::Build() const {
  return MakeId(prefix_, key_);
}

} // namespace netmap::util

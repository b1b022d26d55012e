#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace netmap::util {

/*
  Deterministic entity ids.

  Ids are derived from the identifying content of an entity, never from
  arrival order, so the same evidence always lands on the same id no matter
  which batch (or which process) saw it first.

    <prefix>-<16 lowercase hex digits of FNV-1a 64>
*/

uint64_t Fnv1a64(std::string_view data, uint64_t seed = 0xcbf29ce484222325ULL);

std::string MakeId(std::string_view prefix, std::string_view key);

// Field-separated digest builder; fields cannot alias each other ("a|bc" != "ab|c").
class IdBuilder {
 public:
  explicit IdBuilder(std::string_view prefix);

  IdBuilder& Add(std::string_view field);
  IdBuilder& Add(uint64_t field);

  std::string Build() const;

 private:
  std::string prefix_;
  std::string key_;
};

} // namespace netmap::util

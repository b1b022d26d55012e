#pragma once

#include <cstdint>
#include <vector>

namespace netmap::identity {

/*
  Index-based disjoint set (union by rank, path compression).

  Elements are dense indices handed out by Add(); callers keep their own
  arena mapping indices to ids. Each root carries the member list of its
  set so a whole cluster can be enumerated without a scan.
*/
class DisjointSet {
 public:
  using Index = std::uint32_t;

  Index Add();

  Index Find(Index x);
  Index FindConst(Index x) const;

  // Returns the root of the merged set. Merging a set with itself is a no-op.
  Index Union(Index a, Index b);

  bool Connected(Index a, Index b) {
    return Find(a) == Find(b);
  }

  const std::vector<Index>& Members(Index x);

  std::size_t Size() const {
    return parent_.size();
  }

 private:
  std::vector<Index>              parent_;
  std::vector<std::uint8_t>       rank_;
  std::vector<std::vector<Index>> members_;  // non-empty only at roots
};

} // namespace netmap::identity

#include "disjoint_set.hpp"

#include <stdexcept>
#include <utility>

namespace netmap::identity {

DisjointSet::Index DisjointSet::Add() {
  const auto index = static_cast<Index>(parent_.size());
  parent_.push_back(index);
  rank_.push_back(0);
  members_.push_back({index});
  return index;
}

DisjointSet::Index DisjointSet::Find(Index x) {
  if (x >= parent_.size()) throw std::out_of_range("disjoint set index out of range");
  Index root = x;
  while (parent_[root] != root) root = parent_[root];
  while (parent_[x] != root) {
    const Index next = parent_[x];
    parent_[x]       = root;
    x                = next;
  }
  return root;
}

DisjointSet::Index DisjointSet::FindConst(Index x) const {
  if (x >= parent_.size()) throw std::out_of_range("disjoint set index out of range");
  while (parent_[x] != x) x = parent_[x];
  return x;
}

DisjointSet::Index DisjointSet::Union(Index a, Index b) {
  Index ra = Find(a);
  Index rb = Find(b);
  if (ra == rb) return ra;

  if (rank_[ra] < rank_[rb]) std::swap(ra, rb);
  parent_[rb] = ra;
  if (rank_[ra] == rank_[rb]) ++rank_[ra];

  auto& into = members_[ra];
  auto& from = members_[rb];
  into.insert(into.end(), from.begin(), from.end());
  from.clear();
  from.shrink_to_fit();
  return ra;
}

const std::vector<DisjointSet::Index>& DisjointSet::Members(Index x) {
  return members_[Find(x)];
}

} // namespace netmap::identity

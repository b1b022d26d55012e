#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace netmap::db::model {

/*
  Provenance lists are kept sorted and unique so that two records built from
  the same evidence in different orders compare equal.
*/
using IdList = std::vector<std::string>;

// Returns true if the list changed.
inline bool AddId(IdList& ids, const std::string& id) {
  auto it = std::lower_bound(ids.begin(), ids.end(), id);
  if (it != ids.end() && *it == id) return false;
  ids.insert(it, id);
  return true;
}

inline bool AddIds(IdList& ids, const IdList& more) {
  bool changed = false;
  for (const auto& id : more) {
    changed = AddId(ids, id) || changed;
  }
  return changed;
}

inline bool ContainsId(const IdList& ids, const std::string& id) {
  return std::binary_search(ids.begin(), ids.end(), id);
}

/*
  First/last seen window. Empty until the first observation lands.
*/
struct SeenWindow {
  uint64_t first_seen_ms = 0;
  uint64_t last_seen_ms  = 0;

  bool Empty() const {
    return first_seen_ms == 0 && last_seen_ms == 0;
  }

  // Returns true if the window grew.
  bool Extend(uint64_t at_ms) {
    if (Empty()) {
      first_seen_ms = last_seen_ms = at_ms;
      return true;
    }
    bool changed = false;
    if (at_ms < first_seen_ms) {
      first_seen_ms = at_ms;
      changed       = true;
    }
    if (at_ms > last_seen_ms) {
      last_seen_ms = at_ms;
      changed      = true;
    }
    return changed;
  }

  bool Extend(const SeenWindow& other) {
    if (other.Empty()) return false;
    const bool a = Extend(other.first_seen_ms);
    const bool b = Extend(other.last_seen_ms);
    return a || b;
  }

  bool operator==(const SeenWindow&) const = default;
};

} // namespace netmap::db::model

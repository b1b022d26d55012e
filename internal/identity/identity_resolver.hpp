#pragma once

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/interface_record.hpp"
#include "internal/identity/cluster_state.hpp"
#include "internal/model/observation.hpp"

namespace netmap::identity {

// Deterministic ids for the identity keys the engine derives.
std::string SourceHostId(std::string_view source_host_id);
std::string LinkHostId(const model::LinkAddress& link);
std::string LinkInterfaceId(const model::LinkAddress& link);
std::string LocalInterfaceId(std::string_view source_host_id, std::string_view local_name);

/*
  IdentityResolver

  Owns the committed interface clusters of the process. Batches never touch
  them directly: each batch works in a Session (a private copy plus an
  operation log), and the log is replayed into the committed clusters only
  once the batch's store transaction has committed. A batch that is rolled
  back, cancelled or retried leaves the committed clusters as they were.
*/
class IdentityResolver {
 public:
  class Session {
   public:
    std::vector<MergeEvent> AddSeed(const std::string& interface_id, const std::string& seed, std::string_view reason,
                                    const std::string& observation_id);

    std::optional<MergeEvent> Union(const std::string& a, const std::string& b, std::string_view reason,
                                    const std::string& observation_id);

    std::string HostOf(const std::string& interface_id) const {
      return state_.HostOf(interface_id);
    }

    std::vector<std::string> Members(const std::string& interface_id) {
      return state_.Members(interface_id);
    }

    // Drops every cluster (store recreated in the same batch).
    void Reset();

   private:
    friend class IdentityResolver;

    struct Op {
      enum class Kind {
        kSeed,
        kUnion,
      };
      Kind        kind;
      std::string a;
      std::string b;  // seed or second interface
    };

    ClusterState    state_;
    std::vector<Op> ops_;
    bool            reset_        = false;
    std::uint64_t   base_version_ = 0;
  };

  Session BeginSession() const;

  // False once anything was published after the session was taken. A batch
  // takes its session, then its store transaction, then checks this: a
  // commit that landed in between is in the transaction but not in the
  // session, and the batch has to take both again.
  bool IsCurrent(const Session& session) const;

  // Applies a committed session. Must run inside the store commit hook.
  void Publish(const Session& session);

  // Rebuilds the clusters from persisted interface rows.
  void Hydrate(const std::vector<db::model::InterfaceRecord>& interfaces);

  std::string HostOf(const std::string& interface_id) const;

  std::size_t InterfaceCount() const;

 private:
  mutable std::shared_mutex mutex_;
  ClusterState              committed_;
  std::uint64_t             version_ = 0;
};

} // namespace netmap::identity

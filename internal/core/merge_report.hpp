#pragma once

#include <cstddef>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/fusion/topology_engine.hpp"
#include "internal/normalize/raw_record.hpp"

namespace netmap::core {

struct IngestOptions {
  // Drop every row and every identity cluster before applying the batch.
  bool force_recreate = false;

  // Run the batch and roll it back; the report shows what would change.
  bool dry_run = false;

  // Checked between records and before commit. Once the batch has
  // committed, cancellation has no effect.
  std::stop_token cancel;
};

/*
  Outcome of one ingested batch.

  accepted + rejected + duplicates == number of records submitted.
*/
struct MergeReport {
  std::string source_host_id;

  std::size_t accepted   = 0;
  std::size_t rejected   = 0;
  std::size_t duplicates = 0;

  std::vector<normalize::NormalizationError> errors;
  std::vector<fusion::CreatedEntity>         created;
  std::vector<fusion::ConflictRaised>        conflicts;
  std::vector<fusion::HostMerged>            merges;

  std::size_t attempts = 0;
  bool        dry_run  = false;
};

} // namespace netmap::core

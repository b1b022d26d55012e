#pragma once

#include <future>
#include <string>
#include <variant>
#include <vector>

#include "internal/core/merge_report.hpp"
#include "internal/model/observation.hpp"
#include "internal/normalize/raw_record.hpp"

namespace netmap::ingest {

/*
  One queued batch and the promise its submitter waits on.
*/
struct IngestTask {
  using Records = std::variant<std::vector<normalize::RawRecord>, std::vector<model::ObservationRecord>>;

  std::string         source_host_id;
  Records             records;
  core::IngestOptions options;

  std::promise<core::MergeReport> promise;
};

} // namespace netmap::ingest

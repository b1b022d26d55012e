#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "internal/model/observation.hpp"
#include "internal/normalize/raw_record.hpp"

namespace netmap::normalize {

using NormalizeResult = std::variant<model::ObservationRecord, NormalizationError>;

/*
  RecordNormalizer

  Turns raw text fields into a closed ObservationRecord variant. Pure: no
  identity decisions, no store access. Anything that does not fit a known
  record shape is rejected with the offending field named.

  batch_source is the sourceHostId of the batch the record arrived in; a
  record naming a different source is rejected, a record naming none
  inherits it.
*/
class RecordNormalizer {
 public:
  explicit RecordNormalizer(std::string batch_source);

  NormalizeResult Normalize(const RawRecord& raw, std::size_t index) const;

 private:
  std::string batch_source_;
};

// Interface identifier rules shared with the parsers: a link address, an IP
// (a named interface that also claims it) or a plain local name.
std::optional<model::InterfaceRef> ParseInterfaceRef(std::string_view text);

std::string_view Trim(std::string_view text);

} // namespace netmap::normalize

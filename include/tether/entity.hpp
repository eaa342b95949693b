#pragma once

// tether/entity.hpp: Canonical entities and offline operations.
//
// FIELD TYPES:
//   lww      scalar value, last writer wins by WriteStamp (logical ts, node id)
//   counter  monotonic counter, merged by max
//   set      grow-only set of strings, merged by union
//
// An Entity carries one WriteStamp per field, a version vector over the
// origins whose operations it reflects, a tombstone and the ids of delete
// operations awaiting review.
//
// WIRE/DISK FORMAT: every type below round-trips through jsonlite. The JSON
// produced is canonical, so record checksums and entity digests computed over
// it are stable across processes.

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "tether/clock.hpp"
#include "tether/jsonlite.hpp"
#include "tether/types.hpp"

namespace tether {

enum class FieldType { lww, counter, set };

std::string to_string(FieldType t);
std::optional<FieldType> field_type_from_string(const std::string& s);

struct WriteStamp {
  uint64_t    ts{0};
  std::string node;

  bool operator<(const WriteStamp& o) const {
    if (ts != o.ts) return ts < o.ts;
    return node < o.node;
  }
  bool operator==(const WriteStamp& o) const { return ts == o.ts && node == o.node; }
  bool operator!=(const WriteStamp& o) const { return !(*this == o); }
};

struct FieldValue {
  FieldType             type{FieldType::lww};
  std::string           scalar;
  uint64_t              counter{0};
  std::set<std::string> members;
  WriteStamp            stamp;

  bool operator==(const FieldValue& o) const {
    return type == o.type && scalar == o.scalar && counter == o.counter && members == o.members &&
           stamp == o.stamp;
  }
};

struct Entity {
  std::string                       id;
  std::map<std::string, FieldValue> fields;
  VersionVector                     vv;
  bool                              deleted{false};
  std::string                       deleted_by;  // op id of the delete behind the tombstone
  WriteStamp                        deleted_stamp;
  std::set<std::string>             pending_review;
  std::string                       pending_delete;  // delete op awaiting review, if any
  WriteStamp                        pending_delete_stamp;

  bool operator==(const Entity& o) const {
    return id == o.id && fields == o.fields && vv == o.vv && deleted == o.deleted &&
           deleted_by == o.deleted_by && deleted_stamp == o.deleted_stamp &&
           pending_review == o.pending_review && pending_delete == o.pending_delete &&
           pending_delete_stamp == o.pending_delete_stamp;
  }
};

// One field change carried by an operation. lww uses scalar, counter uses
// counter (the new absolute value), set uses members (elements to add).
struct FieldDelta {
  FieldType             type{FieldType::lww};
  std::string           scalar;
  uint64_t              counter{0};
  std::set<std::string> members;
};

// Catch-up work submitted to the distributor once the operation is applied.
struct FollowUpTask {
  std::string           kind;
  std::string           payload;
  std::set<std::string> required_capabilities;
  int32_t               priority{0};
};

struct OfflineOperation {
  std::string                       id;      // "<origin>:<sequence>"
  std::string                       origin;
  std::string                       entity_id;
  OpKind                            kind{OpKind::update};
  std::map<std::string, FieldDelta> delta;
  uint64_t                          sequence{0};
  VersionVector                     captured_vv;
  uint64_t                          logical_ts{0};
  uint64_t                          captured_at_ms{0};
  OpState                           state{OpState::captured};
  std::optional<FollowUpTask>       follow_up;
};

enum class ResolutionStrategy { fast_forward, field_merge, pending_review, deadline_expired, operator_decision };

std::string to_string(ResolutionStrategy s);
std::optional<ResolutionStrategy> resolution_strategy_from_string(const std::string& s);

struct ConflictResolution {
  std::string              entity_id;
  std::vector<std::string> op_ids;
  ResolutionStrategy       strategy{ResolutionStrategy::field_merge};
  VersionVector            resulting_vv;
  std::string              resolver;
  bool                     resolved{true};  // false = pending_review
  uint64_t                 at_ms{0};
  std::string              detail;
};

// Outcome of replaying one operation into canonical state.
struct ApplyResult {
  bool        ok{false};
  ErrorCode   code{ErrorCode::none};
  std::string detail;
  OpState     state{OpState::queued};  // applied | resolved | conflicted on success
  bool        duplicate{false};
  std::optional<ResolutionStrategy> strategy;
  uint64_t    revision{0};
};

jsonlite::Object entity_to_object(const Entity& e);
Status entity_from_object(const jsonlite::Object& obj, Entity* out);
std::string entity_to_json(const Entity& e);
Status entity_from_json(const std::string& json, Entity* out);

jsonlite::Object op_to_object(const OfflineOperation& op);
Status op_from_object(const jsonlite::Object& obj, OfflineOperation* out);

jsonlite::Object resolution_to_object(const ConflictResolution& r);

}  // namespace tether

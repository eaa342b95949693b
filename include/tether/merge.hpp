#pragma once

// tether/merge.hpp: Per-field-type merge functions.
//
//   lww      keep the value with the greater WriteStamp (ts, then node id)
//   counter  max(a, b); stamp = max stamp
//   set      a ∪ b;     stamp = max stamp
//
// Every merge is commutative, associative and idempotent, so the converged
// entity does not depend on replay order. Fields of different types resolve
// to the one with the greater stamp, which keeps the same properties.

#include <map>
#include <string>
#include <vector>

#include "tether/entity.hpp"

namespace tether {

using FieldMergeFn = FieldValue (*)(const FieldValue& a, const FieldValue& b);

const std::map<FieldType, FieldMergeFn>& merge_table();

FieldValue merge_field(const FieldValue& a, const FieldValue& b);

FieldValue field_from_delta(const FieldDelta& d, const WriteStamp& stamp);

// Merges every field of delta into fields. Returns the names of fields whose
// stored value changed.
std::vector<std::string> merge_delta(std::map<std::string, FieldValue>& fields,
                                     const std::map<std::string, FieldDelta>& delta,
                                     const WriteStamp& stamp);

}  // namespace tether

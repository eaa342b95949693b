#include "tether/merge.hpp"

#include <algorithm>

namespace tether {

namespace {

FieldValue merge_lww(const FieldValue& a, const FieldValue& b) {
  return a.stamp < b.stamp ? b : a;
}

FieldValue merge_counter(const FieldValue& a, const FieldValue& b) {
  FieldValue out = a;
  out.counter = std::max(a.counter, b.counter);
  out.stamp   = std::max(a.stamp, b.stamp);
  return out;
}

FieldValue merge_set(const FieldValue& a, const FieldValue& b) {
  FieldValue out = a;
  out.members.insert(b.members.begin(), b.members.end());
  out.stamp = std::max(a.stamp, b.stamp);
  return out;
}

}  // namespace

const std::map<FieldType, FieldMergeFn>& merge_table() {
  static const std::map<FieldType, FieldMergeFn> table = {
      {FieldType::lww, &merge_lww},
      {FieldType::counter, &merge_counter},
      {FieldType::set, &merge_set},
  };
  return table;
}

FieldValue merge_field(const FieldValue& a, const FieldValue& b) {
  if (a.type != b.type) return merge_lww(a, b);
  return merge_table().at(a.type)(a, b);
}

FieldValue field_from_delta(const FieldDelta& d, const WriteStamp& stamp) {
  FieldValue f;
  f.type    = d.type;
  f.scalar  = d.scalar;
  f.counter = d.counter;
  f.members = d.members;
  f.stamp   = stamp;
  return f;
}

std::vector<std::string> merge_delta(std::map<std::string, FieldValue>& fields,
                                     const std::map<std::string, FieldDelta>& delta,
                                     const WriteStamp& stamp) {
  std::vector<std::string> changed;
  for (const auto& [name, d] : delta) {
    FieldValue incoming = field_from_delta(d, stamp);
    auto it = fields.find(name);
    if (it == fields.end()) {
      fields.emplace(name, std::move(incoming));
      changed.push_back(name);
      continue;
    }
    FieldValue merged = merge_field(it->second, incoming);
    if (!(merged == it->second)) {
      it->second = std::move(merged);
      changed.push_back(name);
    }
  }
  return changed;
}

}  // namespace tether

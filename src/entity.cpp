#include "tether/entity.hpp"

#include "tether/version.hpp"

namespace tether {

std::string to_string(FieldType t) {
  switch (t) {
    case FieldType::lww: return "lww";
    case FieldType::counter: return "counter";
    case FieldType::set: return "set";
  }
  return "lww";
}

std::optional<FieldType> field_type_from_string(const std::string& s) {
  if (s == "lww" || s == "scalar") return FieldType::lww;
  if (s == "counter") return FieldType::counter;
  if (s == "set") return FieldType::set;
  return std::nullopt;
}

std::string to_string(ResolutionStrategy s) {
  switch (s) {
    case ResolutionStrategy::fast_forward: return "fast_forward";
    case ResolutionStrategy::field_merge: return "field_merge";
    case ResolutionStrategy::pending_review: return "pending_review";
    case ResolutionStrategy::deadline_expired: return "deadline_expired";
    case ResolutionStrategy::operator_decision: return "operator_decision";
  }
  return "field_merge";
}

std::optional<ResolutionStrategy> resolution_strategy_from_string(const std::string& s) {
  if (s == "fast_forward") return ResolutionStrategy::fast_forward;
  if (s == "field_merge") return ResolutionStrategy::field_merge;
  if (s == "pending_review") return ResolutionStrategy::pending_review;
  if (s == "deadline_expired") return ResolutionStrategy::deadline_expired;
  if (s == "operator_decision") return ResolutionStrategy::operator_decision;
  return std::nullopt;
}

namespace {

jsonlite::Object stamp_to_object(const WriteStamp& s) {
  jsonlite::Object o;
  o["ts"]   = s.ts;
  o["node"] = s.node;
  return o;
}

WriteStamp stamp_from_object(const jsonlite::Object& o) {
  WriteStamp s;
  s.ts   = jsonlite::get_u64(o, "ts");
  s.node = jsonlite::get_string(o, "node");
  return s;
}

// Shared by FieldValue and FieldDelta: {"type", "value" | "members"}.
void put_typed(jsonlite::Object& o, FieldType type, const std::string& scalar, uint64_t counter,
               const std::set<std::string>& members) {
  o["type"] = to_string(type);
  switch (type) {
    case FieldType::lww: o["value"] = scalar; break;
    case FieldType::counter: o["value"] = counter; break;
    case FieldType::set: o["members"] = jsonlite::to_array(members); break;
  }
}

bool get_typed(const jsonlite::Object& o, FieldType* type, std::string* scalar, uint64_t* counter,
               std::set<std::string>* members) {
  auto t = field_type_from_string(jsonlite::get_string(o, "type"));
  if (!t) return false;
  *type = *t;
  switch (*t) {
    case FieldType::lww: *scalar = jsonlite::get_string(o, "value"); break;
    case FieldType::counter: *counter = jsonlite::get_u64(o, "value"); break;
    case FieldType::set: {
      auto items = jsonlite::get_string_array(o, "members");
      members->clear();
      members->insert(items.begin(), items.end());
      break;
    }
  }
  return true;
}

std::set<std::string> string_set(const jsonlite::Object& o, const std::string& key) {
  auto items = jsonlite::get_string_array(o, key);
  return std::set<std::string>(items.begin(), items.end());
}

}  // namespace

jsonlite::Object entity_to_object(const Entity& e) {
  jsonlite::Object fields;
  for (const auto& [name, f] : e.fields) {
    jsonlite::Object fo;
    put_typed(fo, f.type, f.scalar, f.counter, f.members);
    fo["stamp"]  = stamp_to_object(f.stamp);
    fields[name] = std::move(fo);
  }
  jsonlite::Object o;
  o["format"]         = version::ENTITY_FORMAT_VERSION;
  o["id"]             = e.id;
  o["fields"]         = std::move(fields);
  o["vv"]             = jsonlite::to_object(e.vv);
  o["deleted"]        = e.deleted;
  o["deleted_by"]     = e.deleted_by;
  o["deleted_stamp"]  = stamp_to_object(e.deleted_stamp);
  o["pending_review"] = jsonlite::to_array(e.pending_review);
  o["pending_delete"] = e.pending_delete;
  o["pending_delete_stamp"] = stamp_to_object(e.pending_delete_stamp);
  return o;
}

Status entity_from_object(const jsonlite::Object& obj, Entity* out) {
  const uint64_t format = jsonlite::get_u64(obj, "format");
  auto compat = version::check_format("entity", static_cast<uint32_t>(format),
                                      version::ENTITY_FORMAT_VERSION);
  if (!compat.ok) return Status::failure(ErrorCode::storage_corrupt, compat.description);

  Entity e;
  e.id = jsonlite::get_string(obj, "id");
  if (e.id.empty()) return Status::failure(ErrorCode::storage_corrupt, "entity without id");
  for (const auto& [name, v] : jsonlite::get_object(obj, "fields")) {
    const auto* fo = std::get_if<jsonlite::Object>(&v.v);
    if (!fo) return Status::failure(ErrorCode::storage_corrupt, "field '" + name + "' is not an object");
    FieldValue f;
    if (!get_typed(*fo, &f.type, &f.scalar, &f.counter, &f.members)) {
      return Status::failure(ErrorCode::storage_corrupt, "field '" + name + "' has unknown type");
    }
    f.stamp        = stamp_from_object(jsonlite::get_object(*fo, "stamp"));
    e.fields[name] = std::move(f);
  }
  e.vv             = jsonlite::get_u64_map(obj, "vv");
  e.deleted        = jsonlite::get_bool(obj, "deleted");
  e.deleted_by     = jsonlite::get_string(obj, "deleted_by");
  e.deleted_stamp  = stamp_from_object(jsonlite::get_object(obj, "deleted_stamp"));
  e.pending_review = string_set(obj, "pending_review");
  e.pending_delete = jsonlite::get_string(obj, "pending_delete");
  e.pending_delete_stamp = stamp_from_object(jsonlite::get_object(obj, "pending_delete_stamp"));
  *out = std::move(e);
  return Status::success();
}

std::string entity_to_json(const Entity& e) {
  return jsonlite::to_json(jsonlite::Value{entity_to_object(e)});
}

Status entity_from_json(const std::string& json, Entity* out) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  if (err) return Status::failure(ErrorCode::storage_corrupt, "entity json: " + err->message);
  return entity_from_object(obj, out);
}

jsonlite::Object op_to_object(const OfflineOperation& op) {
  jsonlite::Object delta;
  for (const auto& [name, d] : op.delta) {
    jsonlite::Object dobj;
    put_typed(dobj, d.type, d.scalar, d.counter, d.members);
    delta[name] = std::move(dobj);
  }
  jsonlite::Object o;
  o["id"]          = op.id;
  o["origin"]      = op.origin;
  o["entity"]      = op.entity_id;
  o["kind"]        = to_string(op.kind);
  o["delta"]       = std::move(delta);
  o["seq"]         = op.sequence;
  o["vv"]          = jsonlite::to_object(op.captured_vv);
  o["ts"]          = op.logical_ts;
  o["captured_at"] = op.captured_at_ms;
  o["state"]       = to_string(op.state);
  if (op.follow_up) {
    jsonlite::Object f;
    f["kind"]         = op.follow_up->kind;
    f["payload"]      = op.follow_up->payload;
    f["capabilities"] = jsonlite::to_array(op.follow_up->required_capabilities);
    f["priority"]     = op.follow_up->priority;
    o["follow_up"]    = std::move(f);
  }
  return o;
}

Status op_from_object(const jsonlite::Object& obj, OfflineOperation* out) {
  OfflineOperation op;
  op.id        = jsonlite::get_string(obj, "id");
  op.origin    = jsonlite::get_string(obj, "origin");
  op.entity_id = jsonlite::get_string(obj, "entity");
  if (op.id.empty() || op.origin.empty() || op.entity_id.empty()) {
    return Status::failure(ErrorCode::storage_corrupt, "operation missing id, origin or entity");
  }
  auto kind = op_kind_from_string(jsonlite::get_string(obj, "kind"));
  if (!kind) return Status::failure(ErrorCode::storage_corrupt, "operation " + op.id + " has unknown kind");
  op.kind = *kind;
  for (const auto& [name, v] : jsonlite::get_object(obj, "delta")) {
    const auto* dobj = std::get_if<jsonlite::Object>(&v.v);
    FieldDelta d;
    if (!dobj || !get_typed(*dobj, &d.type, &d.scalar, &d.counter, &d.members)) {
      return Status::failure(ErrorCode::storage_corrupt,
                             "operation " + op.id + " has a malformed delta for '" + name + "'");
    }
    op.delta[name] = std::move(d);
  }
  op.sequence       = jsonlite::get_u64(obj, "seq");
  op.captured_vv    = jsonlite::get_u64_map(obj, "vv");
  op.logical_ts     = jsonlite::get_u64(obj, "ts");
  op.captured_at_ms = jsonlite::get_u64(obj, "captured_at");
  auto state = op_state_from_string(jsonlite::get_string(obj, "state", "queued"));
  if (!state) return Status::failure(ErrorCode::storage_corrupt, "operation " + op.id + " has unknown state");
  op.state = *state;
  auto it = obj.find("follow_up");
  if (it != obj.end()) {
    const auto* f = std::get_if<jsonlite::Object>(&it->second.v);
    if (!f) return Status::failure(ErrorCode::storage_corrupt, "operation " + op.id + " follow_up is not an object");
    FollowUpTask t;
    t.kind                  = jsonlite::get_string(*f, "kind");
    t.payload               = jsonlite::get_string(*f, "payload");
    t.required_capabilities = string_set(*f, "capabilities");
    t.priority              = static_cast<int32_t>(jsonlite::get_i64(*f, "priority"));
    op.follow_up            = std::move(t);
  }
  *out = std::move(op);
  return Status::success();
}

jsonlite::Object resolution_to_object(const ConflictResolution& r) {
  jsonlite::Array ids;
  for (const auto& id : r.op_ids) ids.push_back(id);
  jsonlite::Object o;
  o["entity"]   = r.entity_id;
  o["ops"]      = std::move(ids);
  o["strategy"] = to_string(r.strategy);
  o["vv"]       = jsonlite::to_object(r.resulting_vv);
  o["resolver"] = r.resolver;
  o["status"]   = r.resolved ? "resolved" : "pending_review";
  o["at"]       = r.at_ms;
  o["detail"]   = r.detail;
  return o;
}

}  // namespace tether

#pragma once

// tether/jsonlite.hpp: Small strict JSON reader/writer.
//
// Output is canonical: object keys are emitted in sorted order (std::map),
// doubles go through format_double(). Two equal values always serialize to
// the same bytes, which is what record checksums and entity digests rely on.
//
// Duplicate keys, NaN/Infinity and trailing data are parse errors.

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace tether::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(int n) {
    if (n < 0) v = static_cast<double>(n);
    else v = static_cast<std::uint64_t>(n);
  }
  Value(unsigned n) : v(static_cast<std::uint64_t>(n)) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

std::optional<JsonError> validate_strict(const std::string& text);

// Parse any JSON value.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. Returns an empty object on error or non-object input.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);

std::string format_double(double d);
std::string escape(const std::string& s);

// Type-safe extractors. Missing or mistyped keys return the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def = 0);
std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::uint64_t> get_u64_map(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);
Array get_array(const Object& obj, const std::string& key);

Array to_array(const std::set<std::string>& items);
Object to_object(const std::map<std::string, std::uint64_t>& m);

}  // namespace tether::jsonlite

#include "tether/jsonlite.hpp"

// DETERMINISM:
//   to_json() sorts object keys (std::map iteration) and formats doubles with
//   "%.6f" trimmed of trailing zeros. snprintf digit output does not depend on
//   the locale. std::stod is used for input only.

#include <cctype>
#include <cstdio>
#include <sstream>

namespace tether::jsonlite {

namespace {

void append_utf8(std::string& o, unsigned cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  std::string parse_string() {
    if (!eat('"')) { err = JsonError{"json_parse_error", "expected string"}; return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      switch (n) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'u': {
          if (i + 4 > s.size()) { err = JsonError{"json_parse_error", "short \\u escape"}; return {}; }
          unsigned cp = 0;
          for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
            else { err = JsonError{"json_parse_error", "bad \\u escape"}; return {}; }
          }
          append_utf8(o, cp);
          break;
        }
        default: o += n; break;
      }
    }
    err = JsonError{"json_parse_error", "unterminated string"};
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 ||
        s.compare(i, 9, "-Infinity") == 0) {
      err = JsonError{"json_parse_error", "NaN/Infinity unsupported"};
      return false;
    }
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool is_real = false;
    if (i < s.size() && s[i] == '.') {
      is_real = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid number format"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_real = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid exponent"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num = s.substr(start, i - start);
    try {
      if (is_real || num[0] == '-') {
        out_val = Value{std::stod(num)};
      } else {
        out_val = Value{static_cast<std::uint64_t>(std::stoull(num))};
      }
      return true;
    } catch (const std::exception&) {
      err = JsonError{"json_parse_error", "number out of range"};
      return false;
    }
  }

  Value parse_any() {
    ws();
    if (i >= s.size()) { err = JsonError{"json_parse_error", "unexpected eof"}; return {}; }
    if (s[i] == '{') return Value{parse_object()};
    if (s[i] == '[') return Value{parse_array()};
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num;
    if (parse_number(num)) return num;
    if (!err) err = JsonError{"json_parse_error", "unexpected token"};
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    ws();
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { err = JsonError{"json_parse_error", "expected :"}; break; }
      out[k] = parse_any();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    ws();
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_any());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }

  Value parse_document() {
    Value v = parse_any();
    ws();
    if (!err && i != s.size()) err = JsonError{"json_parse_error", "trailing data"};
    return v;
  }
};

}  // namespace

std::string escape(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    } else {
      o += c;
    }
  }
  return o;
}

std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::uint64_t>(v.v)) return std::to_string(std::get<std::uint64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) return format_double(std::get<double>(v.v));
  std::ostringstream oss;
  bool first = true;
  if (std::holds_alternative<Object>(v.v)) {
    oss << "{";
    for (const auto& [k, item] : std::get<Object>(v.v)) {
      if (!first) oss << ",";
      first = false;
      oss << "\"" << escape(k) << "\":" << to_json(item);
    }
    oss << "}";
    return oss.str();
  }
  oss << "[";
  for (const auto& item : std::get<Array>(v.v)) {
    if (!first) oss << ",";
    first = false;
    oss << to_json(item);
  }
  oss << "]";
  return oss.str();
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Parser p{text};
  p.parse_document();
  return p.err;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_document();
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_document();
  if (!p.err && !std::holds_alternative<Object>(v.v)) {
    p.err = JsonError{"json_type_error", "expected object"};
  }
  if (error) *error = p.err;
  if (p.err) return {};
  return std::get<Object>(v.v);
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}

std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    return static_cast<std::int64_t>(std::get<std::uint64_t>(it->second.v));
  }
  if (std::holds_alternative<double>(it->second.v)) {
    return static_cast<std::int64_t>(std::get<double>(it->second.v));
  }
  return def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    return static_cast<double>(std::get<std::uint64_t>(it->second.v));
  }
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) out.push_back(std::get<std::string>(item.v));
  }
  return out;
}

std::map<std::string, std::uint64_t> get_u64_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::uint64_t> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return out;
  for (const auto& [k, v] : std::get<Object>(it->second.v)) {
    if (std::holds_alternative<std::uint64_t>(v.v)) out[k] = std::get<std::uint64_t>(v.v);
  }
  return out;
}

Object get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return {};
  return std::get<Object>(it->second.v);
}

Array get_array(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return {};
  return std::get<Array>(it->second.v);
}

Array to_array(const std::set<std::string>& items) {
  Array out;
  out.reserve(items.size());
  for (const auto& s : items) out.emplace_back(s);
  return out;
}

Object to_object(const std::map<std::string, std::uint64_t>& m) {
  Object out;
  for (const auto& [k, n] : m) out[k] = Value{n};
  return out;
}

}  // namespace tether::jsonlite

#pragma once

// energybench/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// Used for workload spec files, harness config, JSONL events and summary
// reports. Strict: duplicate keys, NaN/Infinity and trailing data are errors.
// Objects are std::map, so serialization is key-sorted and deterministic.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace energybench::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}

  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_number() const {
    return std::holds_alternative<std::uint64_t>(v) || std::holds_alternative<double>(v);
  }
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
  std::size_t offset{0};
};

// Parse a document whose root must be an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Parse any JSON value.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. A missing key or a value of the wrong type yields def.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

const Value* find(const Object& obj, const std::string& key);

}  // namespace energybench::jsonlite

#pragma once

// symlinkio/jsonlite.hpp: minimal strict JSON value model.
//
// Used for split descriptor serialization, planner config files and the
// event log. Objects are std::map, so to_json() always emits keys in sorted
// order and the output is canonical: same value, same bytes.
//
// Numbers: a non-negative integer literal that fits is held as uint64_t;
// every other number (negative, fractional, exponent) is held as double.
// Callers that need a count must check for uint64_t, not "is a number".

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace symlinkio::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}

  template <typename T>
  bool is() const { return std::holds_alternative<T>(v); }
};

struct JsonError {
  std::string code;     // "json_parse_error" or "json_duplicate_key"
  std::string message;  // includes the byte offset of the failure
};

// Parse a document whose top level must be an object. On failure *error is
// set and an empty object returned.
Object parse(const std::string& text, std::optional<JsonError>* error);

// nullopt if text is one well-formed JSON value of any kind.
std::optional<JsonError> validate(const std::string& text);

std::string to_json(const Value& v);

// Type-safe extractors. A missing key or a value of the wrong type yields def.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);

// String elements of an array value; other elements are skipped.
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

}  // namespace symlinkio::jsonlite

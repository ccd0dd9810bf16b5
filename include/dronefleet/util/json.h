#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dronefleet::json {

struct Value;
using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

// JSON value (null, bool, number, string, array, object).
//
// Used for the request/response wire contract, config files and scenario
// files. Objects are unordered; stringify() emits keys sorted so output is
// stable across runs.
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  Value() : variant(nullptr) {}

  // Without these, string literals would bind to bool.
  Value(const char* s) : variant(std::string(s)) {}
  Value(int n) : variant(static_cast<double>(n)) {}
  Value(std::int64_t n) : variant(static_cast<double>(n)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool* as_bool() const;
  const double* as_number() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;

  Array* as_array();
  Object* as_object();

  // Throws std::runtime_error if not present / wrong type.
  const Value& at(const std::string& key) const;
  const Value& at(std::size_t index) const;

  // Returns nullptr when this is not an object or the key is absent.
  const Value* find(const std::string& key) const;

  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;

  // Throw on wrong type.
  const Object& object() const;
  const Array& array() const;
};

// Parse a JSON document. Throws std::runtime_error with line/column on error.
Value parse(const std::string& text);

// indent <= 0 produces a single line (used for line-delimited responses).
std::string stringify(const Value& v, int indent = 2);

// Short name of the held type ("null", "bool", "number", ...), for error messages.
const char* type_name(const Value& v);

} // namespace dronefleet::json

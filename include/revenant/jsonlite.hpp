#pragma once

// revenant/jsonlite.hpp — Minimal strict JSON value model.
//
// Used for the prover wire protocol, session cache metadata and the config
// file. Objects are std::map so serialization is key-sorted and canonical.
//
// NUMBERS:
//   - Non-negative integers parse as uint64_t.
//   - Negative integers parse as int64_t (logical session ids are negative).
//   - Anything with a fraction or exponent parses as double.
//   - NaN / Infinity are rejected.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace revenant::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, std::int64_t, double, std::string, Array, Object> v;
};

// Parse any JSON value. On failure *error is set and a null Value returned.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. Non-object documents are reported as an error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

// Compact, key-sorted serialization.
std::string serialize(const Value& value);
std::string serialize(const Object& object);

std::string escape(const std::string& s);

// Type-safe extractors. Missing keys and type mismatches yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def);
bool get_bool(const Object& obj, const std::string& key, bool def);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def);
std::optional<std::int64_t> get_i64(const Object& obj, const std::string& key);
double get_double(const Object& obj, const std::string& key, double def);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

// Integer view of a value (uint64 within range or int64).
std::optional<std::int64_t> as_i64(const Value& value);

}  // namespace revenant::jsonlite

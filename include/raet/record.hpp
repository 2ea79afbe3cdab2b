/**
 * @file record.hpp
 * @brief RAET Record - an ordered tag -> value store used for meta and header fields.
 *
 * A `Record` holds the fields of one packet part keyed by their two-character
 * wire tag ("hk", "bl", "sd", ...). Values are JSON scalars, which is exactly
 * what the JSON header carries on the wire, so no conversion layer is needed
 * between the in-memory record and the encoded header.
 *
 * ## Design choices
 * - **Absent vs default**: a field that was never set is *absent* (`has()`
 *   returns false). `fill_missing()` (defaults.hpp) turns absent fields into
 *   their defaults; a present field is never overwritten.
 * - **Insertion order kept**: iteration follows the order fields were set.
 *   Header emission does not rely on it (it walks the default table), but
 *   diagnostic dumps stay stable.
 * - **Typed reads with fallback**: `get_uint()`, `get_string()`,
 *   `get_double()` never throw. A value of the wrong type yields the fallback.
 *
 * ## Example
 * @code
 * raet::Record r;
 * r.set("sk", 1);
 * r.set("sd", "alpha");
 * r.has("sk");            // true
 * r.get_uint("sk", 0);    // 1
 * r.get_uint("pk", 255);  // 255 (absent)
 * @endcode
 */
#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string>
#include "nlohmann/json.hpp"

namespace raet {

/// Field value type. ordered_json keeps field order wherever it is wire-visible.
using Value = nlohmann::ordered_json;

class Record {
public:
  Record() : items_(Value::object()) {}

  /// @brief Check if a tag is present (null values count as present).
  bool has(const std::string& tag) const { return items_.find(tag) != items_.end(); }

  /// @brief Stored value for a tag, or nullptr when absent.
  const Value* get(const std::string& tag) const {
    auto it = items_.find(tag);
    return it == items_.end() ? nullptr : &(*it);
  }

  /// @brief Set or replace a tag's value.
  void set(const std::string& tag, Value v) { items_[tag] = std::move(v); }

  /// @brief Remove a tag. Returns false if it was not present.
  bool remove(const std::string& tag) { return items_.erase(tag) > 0; }

  size_t size() const { return items_.size(); }
  bool   empty() const { return items_.empty(); }
  void   clear() { items_ = Value::object(); }

  /// @brief Underlying JSON object (read-only), for iteration and dumps.
  const Value& items() const { return items_; }

  /**
   * @brief Read a non-negative integer.
   * Booleans read as 0/1 and in-range non-negative floats are truncated;
   * anything else (absent, null, string, negative, too large) yields `fallback`.
   */
  uint64_t get_uint(const std::string& tag, uint64_t fallback = 0) const {
    const Value* v = get(tag);
    if (!v) return fallback;
    if (v->is_number_unsigned()) return v->get<uint64_t>();
    if (v->is_number_integer()) {
      int64_t i = v->get<int64_t>();
      return i < 0 ? fallback : static_cast<uint64_t>(i);
    }
    if (v->is_boolean()) return v->get<bool>() ? 1 : 0;
    if (v->is_number_float()) {
      double d = v->get<double>();
      // 2^64; NaN fails both comparisons
      if (!(d >= 0.0 && d < 18446744073709551616.0)) return fallback;
      return static_cast<uint64_t>(d);
    }
    return fallback;
  }

  /// @brief Read a string; non-string values yield `fallback`.
  std::string get_string(const std::string& tag, const std::string& fallback = "") const {
    const Value* v = get(tag);
    if (!v || !v->is_string()) return fallback;
    return v->get<std::string>();
  }

  /// @brief Read any number as double; non-numbers yield `fallback`.
  double get_double(const std::string& tag, double fallback = 0.0) const {
    const Value* v = get(tag);
    if (!v || !v->is_number()) return fallback;
    return v->get<double>();
  }

  /// @brief Truthiness of a flag field: non-zero number or true.
  bool get_flag(const std::string& tag) const {
    const Value* v = get(tag);
    if (!v) return false;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_number()) return v->get<double>() != 0.0;
    return false;
  }

private:
  Value items_;
};

} // namespace raet

/**
 * @file status.hpp
 * @brief Stage results for the RAET pack/parse pipelines.
 *
 * @details
 * Nothing in the codec throws across `pack()` / `parse()`. Each pipeline stage
 * produces a `StageResult` (ok, or an error kind plus message) and the driver
 * collects them in the packet's `StageReport`. The most recent failure is also
 * published to `Meta::error` for callers that only want the final status.
 *
 * | ErrorKind              | Raised by          | Terminal?                 |
 * |------------------------|--------------------|---------------------------|
 * | unrecognized_head      | parse_head/pack    | yes                       |
 * | malformed_head         | parse_head         | yes                       |
 * | head_length_mismatch   | parse_head         | no                        |
 * | head_kind_mismatch     | parse_head         | no                        |
 * | head_too_long          | pack_head          | yes (no packet produced)  |
 * | unrecognized_neck      | neck strategy      | no                        |
 * | unrecognized_body      | body strategy      | no                        |
 * | malformed_body         | body strategy      | no                        |
 * | unrecognized_tail      | tail strategy      | no                        |
 * | rejected_head          | vouch hook         | yes                       |
 * | rejected_body          | verify hook        | yes                       |
 */
#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string>
#include "etl/vector.h"

namespace raet {

enum class Stage : uint8_t {
  pack_body,
  pack_tail,
  pack_head,
  pack_neck,
  parse_head,
  parse_neck,
  vouch,
  parse_body,
  parse_tail,
  verify,
};

enum class ErrorKind : uint8_t {
  ok = 0,
  unrecognized_head,
  malformed_head,
  head_length_mismatch,
  head_kind_mismatch,
  head_too_long,
  unrecognized_neck,
  unrecognized_body,
  malformed_body,
  unrecognized_tail,
  rejected_head,
  rejected_body,
};

const char* to_string(Stage stage);
const char* to_string(ErrorKind kind);

/// Outcome of one stage.
struct StageResult {
  Stage       stage{Stage::pack_body};
  ErrorKind   kind{ErrorKind::ok};
  std::string message;

  bool ok() const { return kind == ErrorKind::ok; }

  static StageResult success(Stage s) { return StageResult{s, ErrorKind::ok, {}}; }
  static StageResult failure(Stage s, ErrorKind k, std::string msg) {
    return StageResult{s, k, std::move(msg)};
  }
};

/**
 * @brief Per-call list of stage outcomes, bounded by the number of stages.
 *
 * Cleared at the start of every pack or parse call.
 */
class StageReport {
public:
  static constexpr size_t CAPACITY = 10;  ///< one slot per Stage

  void clear() { results_.clear(); }

  /// Append a result; a full report drops its oldest entry.
  void record(const StageResult& r) {
    if (results_.full()) results_.erase(results_.begin());
    results_.push_back(r);
  }

  /// Result for `stage` in this call, or nullptr if the stage did not run.
  const StageResult* find(Stage stage) const {
    for (const auto& r : results_) if (r.stage == stage) return &r;
    return nullptr;
  }

  bool ran(Stage stage) const { return find(stage) != nullptr; }

  bool failed(Stage stage) const {
    const StageResult* r = find(stage);
    return r && !r->ok();
  }

  /// Most recent failed stage, or nullptr when every stage succeeded.
  const StageResult* last_failure() const {
    for (size_t i = results_.size(); i > 0; --i) {
      if (!results_[i - 1].ok()) return &results_[i - 1];
    }
    return nullptr;
  }

  /// Message of the most recent failure; empty when all is well.
  std::string last_error() const {
    const StageResult* r = last_failure();
    return r ? r->message : std::string();
  }

  bool   all_ok() const { return last_failure() == nullptr; }
  size_t size()   const { return results_.size(); }
  bool   empty()  const { return results_.empty(); }

  const StageResult& operator[](size_t i) const { return results_[i]; }
  auto begin() const { return results_.begin(); }
  auto end()   const { return results_.end(); }

private:
  etl::vector<StageResult, CAPACITY> results_;
};

} // namespace raet

/**
 * @file strategies.hpp
 * @brief Kind-code -> {encode, decode} dispatch for the neck, body and tail parts.
 *
 * @details
 * The packer and parser never branch on a kind by name. They look the part's
 * kind code up in a `Strategies` table and call the returned codec:
 *
 * | Part | Implemented                   | Everything else            |
 * |------|-------------------------------|----------------------------|
 * | neck | nada (no-op)                  | unrecognized               |
 * | body | json; nada (encode only)      | unrecognized               |
 * | tail | nada (no-op)                  | unrecognized               |
 *
 * The unrecognized strategy is shared by every declared-but-unimplemented kind
 * (sodium, sha2, crc64, crc16, binary, unknown) and by any code the registries
 * do not know. Both of its directions clear the part's pack, zero the part
 * length in meta, set the part kind to `unknown` and fail with
 * "Unrecognizible packet <part>.".
 *
 * Codec contract:
 *  - **encode** reads the decoded part (and, for the neck, the finalized
 *    `head.pack`) and fills `<part>.pack`. The packer sets the meta length.
 *  - **decode** finds the part's bytes already sliced into `<part>.pack` and
 *    fills the decoded view.
 *  - The returned StageResult's `stage` is overwritten by the caller.
 *
 * `Strategies::defaults()` is built once and never modified. To plug in a real
 * signature or checksum, copy it and register the codec on the copy:
 * @code
 * raet::Strategies s = raet::Strategies::defaults();
 * s.register_tail(raet::TailKind::crc16, my_crc16_codec);
 * raet::pack(packet, s);
 * @endcode
 */
#pragma once

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <map>
#include <utility>
#include "raet/kinds.hpp"
#include "raet/status.hpp"

namespace raet {

struct Packet;

using PartFn = std::function<StageResult(Packet&)>;

/// One encode/decode pair.
struct PartCodec {
  PartFn encode;
  PartFn decode;
};

/// Built-in codecs, exposed so callers can compose their own tables.
namespace codecs {
PartCodec nada_neck();
PartCodec nada_tail();
PartCodec nada_body();
PartCodec json_body();
PartCodec unrecognized_neck();
PartCodec unrecognized_body();
PartCodec unrecognized_tail();
} // namespace codecs

/// Code -> codec map for one part, with a fallback for unregistered codes.
class StrategyTable {
public:
  explicit StrategyTable(PartCodec fallback) : fallback_(std::move(fallback)) {}

  void set(uint64_t code, PartCodec codec) { table_[code] = std::move(codec); }
  bool has(uint64_t code) const { return table_.find(code) != table_.end(); }
  size_t size() const { return table_.size(); }

  const PartCodec& get(uint64_t code) const {
    auto it = table_.find(code);
    return it == table_.end() ? fallback_ : it->second;
  }

private:
  std::map<uint64_t, PartCodec> table_;
  PartCodec                     fallback_;
};

class Strategies {
public:
  /// Table with the built-in codecs; every other declared kind is unrecognized.
  Strategies();

  /// Shared immutable default table.
  static const Strategies& defaults();

  void register_neck(NeckKind kind, PartCodec codec) { neck_.set(code(kind), std::move(codec)); }
  void register_body(BodyKind kind, PartCodec codec) { body_.set(code(kind), std::move(codec)); }
  void register_tail(TailKind kind, PartCodec codec) { tail_.set(code(kind), std::move(codec)); }

  const PartCodec& neck(uint64_t kind_code) const { return neck_.get(kind_code); }
  const PartCodec& body(uint64_t kind_code) const { return body_.get(kind_code); }
  const PartCodec& tail(uint64_t kind_code) const { return tail_.get(kind_code); }

private:
  StrategyTable neck_;
  StrategyTable body_;
  StrategyTable tail_;
};

} // namespace raet

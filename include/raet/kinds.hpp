/**
 * @file kinds.hpp
 * @brief RAET kind registries - closed sets of {name -> code} with an `unknown` sentinel.
 *
 * @details
 * Every part of a RAET packet is tagged with a small integer "kind" that selects
 * the encoding or algorithm used for that part. The same code space is shared by
 * the wire (header fields `hk`, `nk`, `bk`, `tk`, `sk`, `pk`, `vn`) and by the
 * strategy dispatch table.
 *
 * | Registry     | Members                                              |
 * |--------------|------------------------------------------------------|
 * | HeadKind     | json=0 binary=1 unknown=255                          |
 * | NeckKind     | nada=0 sodium=1 sha2=2 crc64=3 unknown=255           |
 * | BodyKind     | nada=0 json=1 binary=2 unknown=255                   |
 * | TailKind     | nada=0 crc16=1 crc64=2 unknown=255                   |
 * | ServiceKind  | fireforget=0 ackretry=1 unknown=255                  |
 * | PacketKind   | data=0 req=1 ack=8 nack=9 unknown=255                |
 * | Version      | "0.1"=0 unknown=255                                  |
 *
 * Lookups are total: a name or code outside the set resolves to `unknown`,
 * never to a fault. Registries are immutable after process start and safe to
 * read from any thread.
 */
#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string_view>

namespace raet {

/// Reserved code for anything the current build does not recognize.
static constexpr uint8_t UNKNOWN_CODE = 255;

enum class HeadKind : uint8_t { json = 0, binary = 1, unknown = UNKNOWN_CODE };

enum class NeckKind : uint8_t { nada = 0, sodium = 1, sha2 = 2, crc64 = 3, unknown = UNKNOWN_CODE };

enum class BodyKind : uint8_t { nada = 0, json = 1, binary = 2, unknown = UNKNOWN_CODE };

enum class TailKind : uint8_t { nada = 0, crc16 = 1, crc64 = 2, unknown = UNKNOWN_CODE };

enum class ServiceKind : uint8_t { fireforget = 0, ackretry = 1, unknown = UNKNOWN_CODE };

enum class PacketKind : uint8_t { data = 0, req = 1, ack = 8, nack = 9, unknown = UNKNOWN_CODE };

enum class Version : uint8_t { v0_1 = 0, unknown = UNKNOWN_CODE };

/// Numeric wire code of any kind enumerator.
template <typename Kind>
constexpr uint8_t code(Kind k) { return static_cast<uint8_t>(k); }

/// Fixed neck size in bytes for a neck kind. Signature necks are sized by their strategy.
constexpr size_t neck_size(NeckKind k) {
  switch (k) {
    case NeckKind::crc64: return 8;
    default:              return 0;
  }
}

/// Fixed tail size in bytes for a tail kind.
constexpr size_t tail_size(TailKind k) {
  switch (k) {
    case TailKind::crc16: return 2;
    case TailKind::crc64: return 8;
    default:              return 0;
  }
}

/// One registry row.
template <typename Kind>
struct KindEntry {
  const char* name;
  Kind        kind;
};

/**
 * @brief Read-only view over a static table of KindEntry rows.
 *
 * The table must contain exactly one row for `Kind::unknown`; it is used as the
 * answer for every out-of-set lookup.
 */
template <typename Kind>
class KindRegistry {
public:
  template <size_t N>
  constexpr explicit KindRegistry(const KindEntry<Kind> (&entries)[N])
  : entries_(entries), count_(N) {}

  /// Code for `name`; names outside the set map to UNKNOWN_CODE.
  uint8_t code_of(std::string_view name) const {
    for (size_t i = 0; i < count_; ++i) {
      if (name == entries_[i].name) return code(entries_[i].kind);
    }
    return UNKNOWN_CODE;
  }

  /// Name for `code`; codes outside the set map to "unknown".
  const char* name_of(uint64_t c) const {
    for (size_t i = 0; i < count_; ++i) {
      if (code(entries_[i].kind) == c) return entries_[i].name;
    }
    return "unknown";
  }

  Kind from_code(uint64_t c) const {
    for (size_t i = 0; i < count_; ++i) {
      if (code(entries_[i].kind) == c) return entries_[i].kind;
    }
    return Kind::unknown;
  }

  Kind from_name(std::string_view name) const { return from_code(code_of(name)); }

  bool contains(uint64_t c) const {
    for (size_t i = 0; i < count_; ++i) {
      if (code(entries_[i].kind) == c) return true;
    }
    return false;
  }

  size_t size() const { return count_; }
  const KindEntry<Kind>& operator[](size_t i) const { return entries_[i]; }

  const KindEntry<Kind>* begin() const { return entries_; }
  const KindEntry<Kind>* end()   const { return entries_ + count_; }

private:
  const KindEntry<Kind>* entries_;
  size_t                 count_;
};

const KindRegistry<HeadKind>&    head_kinds();
const KindRegistry<NeckKind>&    neck_kinds();
const KindRegistry<BodyKind>&    body_kinds();
const KindRegistry<TailKind>&    tail_kinds();
const KindRegistry<ServiceKind>& service_kinds();
const KindRegistry<PacketKind>&  packet_kinds();
const KindRegistry<Version>&     versions();

} // namespace raet

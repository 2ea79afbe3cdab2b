/**
 * @file packet.hpp
 * @brief RAET packet model - meta view plus the four framed parts head, neck, body, tail.
 *
 * @details
 * A logical packet is composed of four ordered parts:
 *
 * ```
 *   packet := head neck body tail
 *   head   := '{"hk":0,' <fields> '}' CR LF CR LF      (JSON header, <= 255 bytes)
 *   neck   := <nl bytes>                                (authentication, empty for nada)
 *   body   := <bl bytes>                                (JSON value when bk == json)
 *   tail   := <tl bytes>                                (integrity, empty for nada)
 * ```
 *
 * plus a transient **meta** view: host/port of both ends, the kind and length
 * of every part and the last error. Meta is the working copy during a pack or
 * parse call; the header record is the wire-visible copy of the same kind and
 * length fields. After a successful header decode the neck/body/tail kind and
 * length in meta mirror the header's.
 *
 * Each part keeps a decoded view and its packed (wire) form. The whole-packet
 * `pack` holds the concatenated wire form on send, and the raw received buffer
 * on receive, which the parser consumes as it goes.
 *
 * A Packet is built fresh for every send or receive and is never reused.
 */
#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string>
#include "etl/string.h"
#include "raet/record.hpp"
#include "raet/defaults.hpp"
#include "raet/kinds.hpp"
#include "raet/status.hpp"

namespace raet {

/// Largest encoded header accepted or produced, end marker included.
static constexpr size_t MAX_HEAD_LENGTH = 255;

/// Header end marker.
static constexpr char HEAD_END[] = "\r\n\r\n";
static constexpr size_t HEAD_END_LENGTH = 4;

/// Leading bytes of every JSON header.
static constexpr char JSON_HEAD_LEAD[] = "{\"hk\":0,";

/// Packed header text; capacity matches MAX_HEAD_LENGTH.
using HeadText = etl::string<MAX_HEAD_LENGTH>;

/**
 * @brief Working view of per-packet state (lengths, kinds, host/port, last error).
 *
 * Kind getters come in two flavors: `*_code()` returns the raw wire number
 * (used for strategy dispatch, so unregistered codes still route somewhere),
 * the plain getter maps it through the registry.
 */
class Meta {
public:
  Record      fields;
  std::string error;  ///< last error; empty when the latest call succeeded

  std::string source_host() const { return fields.get_string(tag::source_host); }
  uint64_t    source_port() const { return fields.get_uint(tag::source_port, DEFAULT_PORT); }
  std::string dest_host()   const { return fields.get_string(tag::dest_host, "127.0.0.1"); }
  uint64_t    dest_port()   const { return fields.get_uint(tag::dest_port, DEFAULT_PORT); }

  void set_source_host(const std::string& h) { fields.set(tag::source_host, h); }
  void set_source_port(uint64_t p)           { fields.set(tag::source_port, p); }
  void set_dest_host(const std::string& h)   { fields.set(tag::dest_host, h); }
  void set_dest_port(uint64_t p)             { fields.set(tag::dest_port, p); }

  uint64_t head_kind_code() const { return fields.get_uint(tag::head_kind, UNKNOWN_CODE); }
  HeadKind head_kind()      const { return head_kinds().from_code(head_kind_code()); }
  uint64_t head_length()    const { return fields.get_uint(tag::head_length, 0); }

  uint64_t neck_kind_code() const { return fields.get_uint(tag::neck_kind, code(NeckKind::nada)); }
  NeckKind neck_kind()      const { return neck_kinds().from_code(neck_kind_code()); }
  uint64_t neck_length()    const { return fields.get_uint(tag::neck_length, 0); }

  uint64_t body_kind_code() const { return fields.get_uint(tag::body_kind, code(BodyKind::nada)); }
  BodyKind body_kind()      const { return body_kinds().from_code(body_kind_code()); }
  uint64_t body_length()    const { return fields.get_uint(tag::body_length, 0); }

  uint64_t tail_kind_code() const { return fields.get_uint(tag::tail_kind, code(TailKind::nada)); }
  TailKind tail_kind()      const { return tail_kinds().from_code(tail_kind_code()); }
  uint64_t tail_length()    const { return fields.get_uint(tag::tail_length, 0); }

  void set_head_kind(HeadKind k)     { fields.set(tag::head_kind, code(k)); }
  void set_head_length(uint64_t n)   { fields.set(tag::head_length, n); }
  void set_neck_kind(NeckKind k)     { fields.set(tag::neck_kind, code(k)); }
  void set_neck_length(uint64_t n)   { fields.set(tag::neck_length, n); }
  void set_body_kind(BodyKind k)     { fields.set(tag::body_kind, code(k)); }
  void set_body_length(uint64_t n)   { fields.set(tag::body_length, n); }
  void set_tail_kind(TailKind k)     { fields.set(tag::tail_kind, code(k)); }
  void set_tail_length(uint64_t n)   { fields.set(tag::tail_length, n); }
};

/**
 * @brief Wire header: 24 tagged fields plus the packed text.
 *
 * Device ids and the datetime stamp are opaque to the codec and are read
 * back through `fields` directly.
 */
class Head {
public:
  Record   fields;
  HeadText pack;

  uint64_t head_kind_code() const { return fields.get_uint(tag::head_kind, UNKNOWN_CODE); }
  HeadKind kind()           const { return head_kinds().from_code(head_kind_code()); }

  /**
   * @brief Header length as carried on the wire (two lowercase hex digits).
   * @return the decoded length, or -1 when the field is absent, not exactly two
   *         hex digits, or an integer outside 0..MAX_HEAD_LENGTH.
   */
  int32_t length() const;

  Version  version()        const { return versions().from_code(fields.get_uint(tag::version, 0)); }
  bool     corresponder()   const { return fields.get_flag(tag::corresponder); }
  bool     multicast()      const { return fields.get_flag(tag::multicast); }
  uint64_t session_id()     const { return fields.get_uint(tag::session_id); }
  uint64_t transaction_id() const { return fields.get_uint(tag::transaction_id); }
  bool     burst()          const { return fields.get_flag(tag::burst); }
  uint64_t order_index()    const { return fields.get_uint(tag::order_index); }
  double   datetime()       const { return fields.get_double(tag::datetime); }
  uint64_t segment_number() const { return fields.get_uint(tag::segment_number); }
  uint64_t segment_count()  const { return fields.get_uint(tag::segment_count, 1); }
  bool     pending()        const { return fields.get_flag(tag::pending); }
  bool     all()            const { return fields.get_flag(tag::all); }

  ServiceKind service_kind() const {
    return service_kinds().from_code(fields.get_uint(tag::service_kind, UNKNOWN_CODE));
  }
  PacketKind packet_kind() const {
    return packet_kinds().from_code(fields.get_uint(tag::packet_kind, UNKNOWN_CODE));
  }

  void set_kind(HeadKind k)            { fields.set(tag::head_kind, code(k)); }
  void set_version(Version v)          { fields.set(tag::version, code(v)); }
  void set_source_device(Value id)     { fields.set(tag::source_device, std::move(id)); }
  void set_dest_device(Value id)       { fields.set(tag::dest_device, std::move(id)); }
  void set_corresponder(bool on)       { fields.set(tag::corresponder, on ? 1 : 0); }
  void set_multicast(bool on)          { fields.set(tag::multicast, on ? 1 : 0); }
  void set_session_id(uint64_t id)     { fields.set(tag::session_id, id); }
  void set_transaction_id(uint64_t id) { fields.set(tag::transaction_id, id); }
  void set_service_kind(ServiceKind k) { fields.set(tag::service_kind, code(k)); }
  void set_packet_kind(PacketKind k)   { fields.set(tag::packet_kind, code(k)); }
  void set_burst(bool on)              { fields.set(tag::burst, on ? 1 : 0); }
  void set_order_index(uint64_t i)     { fields.set(tag::order_index, i); }
  void set_datetime(double stamp)      { fields.set(tag::datetime, stamp); }
  void set_segment_number(uint64_t n)  { fields.set(tag::segment_number, n); }
  void set_segment_count(uint64_t n)   { fields.set(tag::segment_count, n); }
  void set_pending(bool on)            { fields.set(tag::pending, on ? 1 : 0); }
  void set_all(bool on)                { fields.set(tag::all, on ? 1 : 0); }

  /// Packed header as a std::string (for concatenation and I/O).
  std::string pack_str() const { return std::string(pack.data(), pack.size()); }
};

/// Authentication part.
struct Neck {
  std::string pack;
};

/// Payload part: structured `data` (an object) or a `raw` scalar.
struct Body {
  Value       data = Value::object();
  Value       raw;   ///< null unless the payload is not a mapping
  std::string pack;
};

/// Integrity trailer.
struct Tail {
  std::string pack;
};

/// The aggregate packet.
struct Packet {
  Meta        meta;
  Head        head;
  Neck        neck;
  Body        body;
  Tail        tail;
  std::string pack;    ///< wire form (outbound) or raw buffer (inbound)
  StageReport report;  ///< per-stage outcomes of the latest pack/parse call
};

/**
 * @brief Fresh outbound packet with every part present.
 *
 * The header kind is preset to json, the only implemented head encoding.
 */
Packet make_packet();

/// Fresh inbound packet holding the raw received buffer.
Packet make_packet(std::string raw);

/**
 * @brief Append a stage outcome to `packet.report` and refresh `meta.error`.
 *
 * `meta.error` always shows the message of the most recent failed stage of
 * the current call, so a later successful stage does not hide an earlier
 * failure.
 */
void record_stage(Packet& packet, const StageResult& result);

} // namespace raet

/**
 * @file defaults.hpp
 * @brief Field tags and default tables for the RAET meta view and JSON header.
 *
 * @details
 * The default tables do double duty:
 *  - **fill**: on receive, absent fields are filled from the table;
 *  - **elide**: on send, a header field whose value equals its default is not
 *    written to the wire. This is the main space optimization of the JSON head.
 *
 * Rows marked *mandatory* have no usable default (the receiver cannot safely
 * assume them) and are always emitted: header kind, header length, source and
 * destination device ids, service kind and packet kind.
 *
 * ### Head fields (wire order)
 * | Tag | Field             | Default   | Tag | Field             | Default |
 * |-----|-------------------|-----------|-----|-------------------|---------|
 * | hk  | head kind         | mandatory | sn  | segment number    | 0       |
 * | hl  | head length       | mandatory | sc  | segment count     | 1       |
 * | vn  | version           | 0         | pf  | pending flag      | 0       |
 * | sd  | source device     | mandatory | af  | all flag          | 0       |
 * | dd  | dest device       | mandatory | nk  | neck kind         | 0       |
 * | cf  | corresponder flag | 0         | nl  | neck length       | 0       |
 * | mf  | multicast flag    | 0         | bk  | body kind         | 0       |
 * | si  | session id        | 0         | bl  | body length       | 0       |
 * | ti  | transaction id    | 0         | tk  | tail kind         | 0       |
 * | sk  | service kind      | mandatory | tl  | tail length       | 0       |
 * | pk  | packet kind       | mandatory |     |                   |         |
 * | bf  | burst flag        | 0         |     |                   |         |
 * | oi  | order index       | 0         |     |                   |         |
 * | dt  | datetime stamp    | 0         |     |                   |         |
 *
 * @note The packed flags field `fg` is not part of the table and is never
 *       emitted or consumed.
 */
#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string>
#include "raet/record.hpp"

namespace raet {

/// Two-character wire tags.
namespace tag {
inline constexpr char source_host[]    = "sh";
inline constexpr char source_port[]    = "sp";
inline constexpr char dest_host[]      = "dh";
inline constexpr char dest_port[]      = "dp";
inline constexpr char head_kind[]      = "hk";
inline constexpr char head_length[]    = "hl";
inline constexpr char version[]        = "vn";
inline constexpr char source_device[]  = "sd";
inline constexpr char dest_device[]    = "dd";
inline constexpr char corresponder[]   = "cf";
inline constexpr char multicast[]      = "mf";
inline constexpr char session_id[]     = "si";
inline constexpr char transaction_id[] = "ti";
inline constexpr char service_kind[]   = "sk";
inline constexpr char packet_kind[]    = "pk";
inline constexpr char burst[]          = "bf";
inline constexpr char order_index[]    = "oi";
inline constexpr char datetime[]       = "dt";
inline constexpr char segment_number[] = "sn";
inline constexpr char segment_count[]  = "sc";
inline constexpr char pending[]        = "pf";
inline constexpr char all[]            = "af";
inline constexpr char neck_kind[]      = "nk";
inline constexpr char neck_length[]    = "nl";
inline constexpr char body_kind[]      = "bk";
inline constexpr char body_length[]    = "bl";
inline constexpr char tail_kind[]      = "tk";
inline constexpr char tail_length[]    = "tl";
} // namespace tag

/// Default port for both ends when the transport does not supply one.
static constexpr uint16_t DEFAULT_PORT = 7530;

/// One default-table row.
struct FieldDefault {
  const char* tag;        ///< two-character wire tag
  const char* name;       ///< human-readable field name
  Value       value;      ///< default value; null for mandatory rows
  bool        mandatory;  ///< always emitted, never elided
};

/// Read-only view over a static default table.
struct DefaultTable {
  const FieldDefault* rows;
  size_t              count;

  const FieldDefault* begin() const { return rows; }
  const FieldDefault* end()   const { return rows + count; }
  size_t size() const { return count; }
  const FieldDefault& operator[](size_t i) const { return rows[i]; }
};

/// Meta view defaults (13 rows).
const DefaultTable& meta_defaults();

/// Header defaults in wire order (24 rows).
const DefaultTable& head_defaults();

/// Row for `tag` in `table`, or nullptr.
const FieldDefault* find_default(const DefaultTable& table, const std::string& tag);

/**
 * @brief Set every absent field of `record` to its table default.
 *
 * Present fields are never overwritten, so the call is idempotent and the
 * order of rows does not matter. Mandatory rows fill with JSON null.
 */
void fill_missing(Record& record, const DefaultTable& table);

/// True when `value` may be left off the wire for this row.
bool is_elidable(const FieldDefault& row, const Value& value);

} // namespace raet

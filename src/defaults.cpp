// -----------------------------------------------------------------------------
// defaults.cpp - meta and head default tables, fill and elision rules.
//
// Table layout and semantics: see include/raet/defaults.hpp
// -----------------------------------------------------------------------------
#include "raet/defaults.hpp"
#include "raet/kinds.hpp"

namespace raet {

namespace {

// Rows are built on first use; nlohmann values are not constexpr.
const FieldDefault* meta_rows() {
  static const FieldDefault rows[] = {
    {tag::source_host, "source host",      "",                      false},
    {tag::source_port, "source port",      DEFAULT_PORT,            false},
    {tag::dest_host,   "destination host", "127.0.0.1",             false},
    {tag::dest_port,   "destination port", DEFAULT_PORT,            false},
    {tag::version,     "version",          code(Version::v0_1),     false},
    {tag::head_kind,   "head kind",        nullptr,                 true},
    {tag::head_length, "head length",      nullptr,                 true},
    {tag::neck_kind,   "neck kind",        code(NeckKind::nada),    false},
    {tag::neck_length, "neck length",      0,                       false},
    {tag::body_kind,   "body kind",        code(BodyKind::nada),    false},
    {tag::body_length, "body length",      0,                       false},
    {tag::tail_kind,   "tail kind",        code(TailKind::nada),    false},
    {tag::tail_length, "tail length",      0,                       false},
  };
  return rows;
}

const FieldDefault* head_rows() {
  static const FieldDefault rows[] = {
    {tag::head_kind,      "head kind",          nullptr,              true},
    {tag::head_length,    "head length",        nullptr,              true},
    {tag::version,        "version",            code(Version::v0_1),  false},
    {tag::source_device,  "source device id",   nullptr,              true},
    {tag::dest_device,    "destination device", nullptr,              true},
    {tag::corresponder,   "corresponder flag",  0,                    false},
    {tag::multicast,      "multicast flag",     0,                    false},
    {tag::session_id,     "session id",         0,                    false},
    {tag::transaction_id, "transaction id",     0,                    false},
    {tag::service_kind,   "service kind",       nullptr,              true},
    {tag::packet_kind,    "packet kind",        nullptr,              true},
    {tag::burst,          "burst flag",         0,                    false},
    {tag::order_index,    "order index",        0,                    false},
    {tag::datetime,       "datetime stamp",     0,                    false},
    {tag::segment_number, "segment number",     0,                    false},
    {tag::segment_count,  "segment count",      1,                    false},
    {tag::pending,        "pending flag",       0,                    false},
    {tag::all,            "all flag",           0,                    false},
    {tag::neck_kind,      "neck kind",          code(NeckKind::nada), false},
    {tag::neck_length,    "neck length",        0,                    false},
    {tag::body_kind,      "body kind",          code(BodyKind::nada), false},
    {tag::body_length,    "body length",        0,                    false},
    {tag::tail_kind,      "tail kind",          code(TailKind::nada), false},
    {tag::tail_length,    "tail length",        0,                    false},
  };
  return rows;
}

} // namespace

const DefaultTable& meta_defaults() {
  static const DefaultTable table{meta_rows(), 13};
  return table;
}

const DefaultTable& head_defaults() {
  static const DefaultTable table{head_rows(), 24};
  return table;
}

const FieldDefault* find_default(const DefaultTable& table, const std::string& t) {
  for (const auto& row : table) {
    if (t == row.tag) return &row;
  }
  return nullptr;
}

void fill_missing(Record& record, const DefaultTable& table) {
  for (const auto& row : table) {
    if (!record.has(row.tag)) record.set(row.tag, row.value);
  }
}

bool is_elidable(const FieldDefault& row, const Value& value) {
  if (row.mandatory) return false;
  // flags may be given as booleans; the defaults are numeric 0
  if (value.is_boolean() && row.value.is_number()) {
    return (value.get<bool>() ? 1.0 : 0.0) == row.value.get<double>();
  }
  return value == row.value;
}

} // namespace raet

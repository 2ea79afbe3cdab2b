/**
 * @file packet_json.cpp
 * @brief Conversion between JSON packet descriptions and Packet objects.
 *
 * @details
 *   Parsing never throws. nlohmann::json errors are caught by type and turned
 *   into std::nullopt, so untrusted files can be fed straight in.
 */
#include "raet/packet_json.hpp"
#include "raet/defaults.hpp"
#include "raet/kinds.hpp"

namespace raet {

namespace {

template <typename Kind>
uint64_t resolve(const KindRegistry<Kind>& registry, const Value& v) {
  if (v.is_string()) return registry.code_of(v.get<std::string>());
  if (v.is_number_unsigned()) return v.get<uint64_t>();
  if (v.is_number_integer() && v.get<int64_t>() >= 0) return v.get<uint64_t>();
  return UNKNOWN_CODE;
}

// Copy known tags from `src` into `dst`, resolving kind names.
void copy_fields(const Value& src, const DefaultTable& table, Record& dst) {
  for (auto it = src.begin(); it != src.end(); ++it) {
    if (!find_default(table, it.key())) continue;
    if (auto c = kind_code(it.key(), it.value())) dst.set(it.key(), *c);
    else                                          dst.set(it.key(), it.value());
  }
}

Value report_json(const StageReport& report) {
  Value out = Value::array();
  for (const auto& r : report) {
    Value row = Value::object();
    row["stage"]  = to_string(r.stage);
    row["status"] = r.ok() ? "ok" : to_string(r.kind);
    if (!r.message.empty()) row["message"] = r.message;
    out.push_back(std::move(row));
  }
  return out;
}

} // namespace

std::optional<uint64_t> kind_code(const std::string& t, const Value& v) {
  if (t == tag::head_kind)    return resolve(head_kinds(), v);
  if (t == tag::neck_kind)    return resolve(neck_kinds(), v);
  if (t == tag::body_kind)    return resolve(body_kinds(), v);
  if (t == tag::tail_kind)    return resolve(tail_kinds(), v);
  if (t == tag::service_kind) return resolve(service_kinds(), v);
  if (t == tag::packet_kind)  return resolve(packet_kinds(), v);
  if (t == tag::version)      return resolve(versions(), v);
  return std::nullopt;
}

std::optional<Packet> packet_from_json(const std::string& text) {
  Value doc;
  try {
    doc = Value::parse(text);
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
  if (!doc.is_object()) return std::nullopt;

  Packet packet = make_packet();

  if (auto it = doc.find("meta"); it != doc.end() && it->is_object()) {
    copy_fields(*it, meta_defaults(), packet.meta.fields);
  }
  if (auto it = doc.find("head"); it != doc.end() && it->is_object()) {
    copy_fields(*it, head_defaults(), packet.head.fields);
  }
  if (auto it = doc.find("body"); it != doc.end() && it->is_object()) {
    if (auto d = it->find("data"); d != it->end()) {
      if (!d->is_object()) return std::nullopt;
      packet.body.data = *d;
    }
    if (auto r = it->find("raw"); r != it->end()) packet.body.raw = *r;
    if (!packet.meta.fields.has(tag::body_kind)) packet.meta.set_body_kind(BodyKind::json);
  }
  return packet;
}

Value packet_to_json(const Packet& packet) {
  const Meta& meta = packet.meta;
  Value out = Value::object();

  Value m = meta.fields.items();
  m["error"] = meta.error;
  out["meta"] = std::move(m);
  out["head"] = packet.head.fields.items();

  Value body = Value::object();
  body["data"] = packet.body.data;
  if (!packet.body.raw.is_null()) body["raw"] = packet.body.raw;
  out["body"] = std::move(body);

  out["kinds"] = {
    {"head", head_kinds().name_of(meta.head_kind_code())},
    {"neck", neck_kinds().name_of(meta.neck_kind_code())},
    {"body", body_kinds().name_of(meta.body_kind_code())},
    {"tail", tail_kinds().name_of(meta.tail_kind_code())},
  };
  out["lengths"] = {
    {"head", packet.head.pack.size()},
    {"neck", packet.neck.pack.size()},
    {"body", packet.body.pack.size()},
    {"tail", packet.tail.pack.size()},
  };
  out["report"] = report_json(packet.report);
  return out;
}

} // namespace raet

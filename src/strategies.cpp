// -----------------------------------------------------------------------------
// strategies.cpp - built-in part codecs and the default dispatch table.
//
// PRE (decode): <part>.pack holds exactly the bytes sliced for this part.
// OUT (encode): <part>.pack holds the wire form; meta length is set by packer.
// -----------------------------------------------------------------------------
#include "raet/strategies.hpp"
#include "raet/packet.hpp"

namespace raet {

namespace {

// Stage is stamped by the pipeline driver.
StageResult ok() { return StageResult::success(Stage::pack_body); }

StageResult fail(ErrorKind kind, std::string message) {
  return StageResult::failure(Stage::pack_body, kind, std::move(message));
}

StageResult no_op(Packet&) { return ok(); }

StageResult clear_neck(Packet& p) { p.neck.pack.clear(); return ok(); }
StageResult clear_tail(Packet& p) { p.tail.pack.clear(); return ok(); }
StageResult clear_body(Packet& p) { p.body.pack.clear(); return ok(); }

StageResult reject_neck(Packet& p) {
  p.neck.pack.clear();
  p.meta.set_neck_length(0);
  p.meta.set_neck_kind(NeckKind::unknown);
  return fail(ErrorKind::unrecognized_neck, "Unrecognizible packet neck.");
}

StageResult reject_body(Packet& p) {
  p.body.pack.clear();
  p.meta.set_body_length(0);
  p.meta.set_body_kind(BodyKind::unknown);
  return fail(ErrorKind::unrecognized_body, "Unrecognizible packet body.");
}

StageResult reject_tail(Packet& p) {
  p.tail.pack.clear();
  p.meta.set_tail_length(0);
  p.meta.set_tail_kind(TailKind::unknown);
  return fail(ErrorKind::unrecognized_tail, "Unrecognizible packet tail.");
}

// raw wins over data when set
StageResult encode_json_body(Packet& p) {
  const Value& v = p.body.raw.is_null() ? p.body.data : p.body.raw;
  try {
    p.body.pack = v.dump(-1, ' ', true);
  } catch (const nlohmann::json::exception& e) {
    p.body.pack.clear();
    return fail(ErrorKind::malformed_body,
                std::string("Failed to encode packet body: ") + e.what());
  }
  return ok();
}

// object -> data, anything else -> raw
StageResult decode_json_body(Packet& p) {
  p.body.raw = nullptr;
  if (p.body.pack.empty()) return ok();

  Value v;
  try {
    v = Value::parse(p.body.pack);
  } catch (const nlohmann::json::exception& e) {
    return fail(ErrorKind::malformed_body,
                std::string("Malformed packet body: ") + e.what());
  }
  if (v.is_object()) p.body.data = std::move(v);
  else               p.body.raw = std::move(v);
  return ok();
}

} // namespace

namespace codecs {

PartCodec nada_neck()         { return PartCodec{clear_neck, no_op}; }
PartCodec nada_tail()         { return PartCodec{clear_tail, no_op}; }
PartCodec nada_body()         { return PartCodec{clear_body, reject_body}; }
PartCodec json_body()         { return PartCodec{encode_json_body, decode_json_body}; }
PartCodec unrecognized_neck() { return PartCodec{reject_neck, reject_neck}; }
PartCodec unrecognized_body() { return PartCodec{reject_body, reject_body}; }
PartCodec unrecognized_tail() { return PartCodec{reject_tail, reject_tail}; }

} // namespace codecs

Strategies::Strategies()
: neck_(codecs::unrecognized_neck()),
  body_(codecs::unrecognized_body()),
  tail_(codecs::unrecognized_tail()) {
  // Declared kinds without an implementation are registered explicitly so the
  // table lists every kind the registries know.
  for (const auto& e : neck_kinds()) neck_.set(code(e.kind), codecs::unrecognized_neck());
  for (const auto& e : body_kinds()) body_.set(code(e.kind), codecs::unrecognized_body());
  for (const auto& e : tail_kinds()) tail_.set(code(e.kind), codecs::unrecognized_tail());

  register_neck(NeckKind::nada, codecs::nada_neck());
  register_body(BodyKind::nada, codecs::nada_body());
  register_body(BodyKind::json, codecs::json_body());
  register_tail(TailKind::nada, codecs::nada_tail());
}

const Strategies& Strategies::defaults() {
  static const Strategies table;
  return table;
}

} // namespace raet

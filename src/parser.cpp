// -----------------------------------------------------------------------------
// parser.cpp - wire bytes -> Packet.
//
// PRE:
//   - packet.pack holds the received buffer, starting at a header.
// OUT:
//   - head/neck/body/tail filled as far as the pipeline got.
//   - packet.pack holds whatever followed the tail.
// -----------------------------------------------------------------------------
#include "raet/parser.hpp"
#include "raet/defaults.hpp"

#include <algorithm>
#include <cstring>

namespace raet {

namespace {

// Cut up to `n` bytes off the front of `buf`.
std::string take(std::string& buf, uint64_t n) {
  size_t count = static_cast<size_t>(std::min<uint64_t>(n, buf.size()));
  std::string out = buf.substr(0, count);
  buf.erase(0, count);
  return out;
}

StageResult run(const PartFn& fn, Packet& packet, Stage stage) {
  StageResult r = fn(packet);
  r.stage = stage;
  return r;
}

// Header cannot be framed; nothing after it is touched.
bool refuse_head(Packet& packet, ErrorKind kind, const std::string& message) {
  packet.meta.set_head_kind(HeadKind::unknown);
  packet.meta.set_head_length(0);
  record_stage(packet, StageResult::failure(Stage::parse_head, kind, message));
  return false;
}

void sync_meta_from_head(Packet& packet) {
  const Record& h = packet.head.fields;
  Meta& meta = packet.meta;
  meta.fields.set(tag::neck_kind,   h.get_uint(tag::neck_kind,   code(NeckKind::nada)));
  meta.fields.set(tag::neck_length, h.get_uint(tag::neck_length, 0));
  meta.fields.set(tag::body_kind,   h.get_uint(tag::body_kind,   code(BodyKind::nada)));
  meta.fields.set(tag::body_length, h.get_uint(tag::body_length, 0));
  meta.fields.set(tag::tail_kind,   h.get_uint(tag::tail_kind,   code(TailKind::nada)));
  meta.fields.set(tag::tail_length, h.get_uint(tag::tail_length, 0));
}

/**
 * Frame and decode the header.
 * @return false when the header is unrecognizable (terminal).
 */
bool parse_head(Packet& packet) {
  std::string& buf = packet.pack;
  const size_t lead = std::strlen(JSON_HEAD_LEAD);

  size_t end = std::string::npos;
  if (buf.compare(0, lead, JSON_HEAD_LEAD) == 0) end = buf.find(HEAD_END, lead);
  if (end == std::string::npos) {
    return refuse_head(packet, ErrorKind::unrecognized_head, "Unrecognizible packet head.");
  }

  const size_t hl = end + HEAD_END_LENGTH;
  if (hl > MAX_HEAD_LENGTH) {
    return refuse_head(packet, ErrorKind::unrecognized_head,
                       "Packed head length of " + std::to_string(hl) +
                       " exceeds max of " + std::to_string(MAX_HEAD_LENGTH) + ".");
  }

  Value decoded;
  try {
    decoded = Value::parse(buf.begin(), buf.begin() + end);
  } catch (const nlohmann::json::exception& e) {
    return refuse_head(packet, ErrorKind::malformed_head,
                       std::string("Malformed packet head: ") + e.what());
  }
  if (!decoded.is_object()) {
    return refuse_head(packet, ErrorKind::malformed_head, "Malformed packet head: not an object.");
  }

  Head& head = packet.head;
  fill_missing(head.fields, head_defaults());
  for (auto it = decoded.begin(); it != decoded.end(); ++it) {
    if (find_default(head_defaults(), it.key())) head.fields.set(it.key(), it.value());
  }
  head.pack.assign(buf.data(), hl);
  buf.erase(0, hl);

  StageResult result = StageResult::success(Stage::parse_head);
  const int32_t declared = head.length();
  if (declared < 0 || static_cast<size_t>(declared) != hl) {
    result = StageResult::failure(Stage::parse_head, ErrorKind::head_length_mismatch,
                                  "Actual head length '" + std::to_string(hl) +
                                  "' does not match head field value '" +
                                  head.fields.get(tag::head_length)->dump() + "'.");
  }
  if (head.head_kind_code() != code(HeadKind::json)) {
    result = StageResult::failure(Stage::parse_head, ErrorKind::head_kind_mismatch,
                                  "Invalid head kind '" +
                                  head.fields.get(tag::head_kind)->dump() + "'.");
  }

  packet.meta.set_head_kind(HeadKind::json);
  packet.meta.set_head_length(hl);
  sync_meta_from_head(packet);
  record_stage(packet, result);
  return true;
}

// Run a hook with a clean error slot; a rejection keeps the hook's message.
bool checkpoint(Packet& packet, Stage stage, ErrorKind kind, const char* fallback,
                bool accepted) {
  if (accepted) {
    record_stage(packet, StageResult::success(stage));
    return true;
  }
  std::string message = packet.meta.error.empty() ? std::string(fallback) : packet.meta.error;
  record_stage(packet, StageResult::failure(stage, kind, message));
  return false;
}

} // namespace

std::optional<std::string> parse(Packet& packet, const Validators& validators,
                                 const Strategies& strategies) {
  Meta& meta = packet.meta;
  packet.report.clear();
  meta.error.clear();
  fill_missing(meta.fields, meta_defaults());

  // ---- head ----
  if (!parse_head(packet)) return std::nullopt;

  // ---- neck ----
  packet.neck.pack = take(packet.pack, meta.neck_length());
  record_stage(packet, run(strategies.neck(meta.neck_kind_code()).decode, packet, Stage::parse_neck));

  // ---- vouch ----
  meta.error.clear();
  bool vouched = !validators.vouch || validators.vouch(meta, packet.head, packet.neck);
  if (!checkpoint(packet, Stage::vouch, ErrorKind::rejected_head,
                  "Head failed authentication.", vouched)) {
    return std::nullopt;
  }

  // ---- body ----
  packet.body.pack = take(packet.pack, meta.body_length());
  record_stage(packet, run(strategies.body(meta.body_kind_code()).decode, packet, Stage::parse_body));

  // ---- tail ----
  packet.tail.pack = take(packet.pack, meta.tail_length());
  record_stage(packet, run(strategies.tail(meta.tail_kind_code()).decode, packet, Stage::parse_tail));

  // ---- verify ----
  meta.error.clear();
  bool verified = !validators.verify || validators.verify(meta, packet.body, packet.tail);
  if (!checkpoint(packet, Stage::verify, ErrorKind::rejected_body,
                  "Body failed verification.", verified)) {
    return std::nullopt;
  }

  return packet.pack;
}

} // namespace raet

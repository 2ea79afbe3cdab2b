// -----------------------------------------------------------------------------
// packer.cpp - Packet -> wire bytes.
//
// Header layout produced here:
//   {"hk":0,"hl":"xx",<mandatory and non-default fields in table order>}\r\n\r\n
//
// POLICY:
//   - Header text is built once. The length field is written as the fixed
//     placeholder "00" at a recorded offset and patched in place afterwards.
//   - A header over MAX_HEAD_LENGTH is never truncated; the packet is refused.
// -----------------------------------------------------------------------------
#include "raet/packer.hpp"
#include "raet/defaults.hpp"

#include <stdio.h>
#include <cstring>

namespace raet {

namespace {

constexpr char HL_PLACEHOLDER[] = "\"00\"";

// Run one part codec and stamp the stage.
StageResult run(const PartFn& fn, Packet& packet, Stage stage) {
  StageResult r = fn(packet);
  r.stage = stage;
  return r;
}

// Copy part kinds and lengths from the working meta into the header.
void sync_head_from_meta(Packet& packet) {
  const Meta& meta = packet.meta;
  Record& h = packet.head.fields;
  h.set(tag::neck_kind,   meta.neck_kind_code());
  h.set(tag::neck_length, meta.neck_length());
  h.set(tag::body_kind,   meta.body_kind_code());
  h.set(tag::body_length, meta.body_length());
  h.set(tag::tail_kind,   meta.tail_kind_code());
  h.set(tag::tail_length, meta.tail_length());
}

} // namespace

StageResult pack_head(Packet& packet) {
  Meta& meta = packet.meta;
  Head& head = packet.head;

  head.pack.clear();
  if (head.kind() != HeadKind::json) {
    meta.set_head_length(0);
    return StageResult::failure(Stage::pack_head, ErrorKind::unrecognized_head,
                                "Unrecognizible packet head.");
  }
  head.set_kind(HeadKind::json);  // normalized so the text starts with {"hk":0,
  meta.set_head_kind(HeadKind::json);
  sync_head_from_meta(packet);

  std::string text = "{";
  size_t hl_offset = 0;
  try {
    bool first = true;
    for (const auto& row : head_defaults()) {
      const Value* current = head.fields.get(row.tag);
      const Value& value = current ? *current : row.value;
      if (is_elidable(row, value)) continue;

      if (!first) text += ',';
      first = false;
      text += '"';
      text += row.tag;
      text += "\":";
      if (std::strcmp(row.tag, tag::head_length) == 0) {
        hl_offset = text.size() + 1;  // first digit, after the opening quote
        text += HL_PLACEHOLDER;
      } else {
        text += value.dump(-1, ' ', true);
      }
    }
  } catch (const nlohmann::json::exception& e) {
    meta.set_head_length(0);
    return StageResult::failure(Stage::pack_head, ErrorKind::malformed_head,
                                std::string("Failed to encode packet head: ") + e.what());
  }
  text += '}';
  text += HEAD_END;

  if (text.size() > MAX_HEAD_LENGTH) {
    meta.set_head_length(0);
    return StageResult::failure(Stage::pack_head, ErrorKind::head_too_long,
                                "Packed head length of " + std::to_string(text.size()) +
                                " exceeds max of " + std::to_string(MAX_HEAD_LENGTH) + ".");
  }

  char hex[3];
  snprintf(hex, sizeof(hex), "%02x", static_cast<unsigned>(text.size()));
  text[hl_offset]     = hex[0];
  text[hl_offset + 1] = hex[1];

  head.fields.set(tag::head_length, std::string(hex, 2));
  head.pack.assign(text.data(), text.size());
  meta.set_head_length(text.size());
  return StageResult::success(Stage::pack_head);
}

std::string pack(Packet& packet, const Strategies& strategies) {
  Meta& meta = packet.meta;
  packet.report.clear();
  meta.error.clear();
  packet.pack.clear();

  // ---- body ----
  record_stage(packet, run(strategies.body(meta.body_kind_code()).encode, packet, Stage::pack_body));
  meta.set_body_length(packet.body.pack.size());

  // ---- tail ----
  record_stage(packet, run(strategies.tail(meta.tail_kind_code()).encode, packet, Stage::pack_tail));
  meta.set_tail_length(packet.tail.pack.size());

  // ---- head ----
  StageResult head = pack_head(packet);
  record_stage(packet, head);
  if (!head.ok()) return std::string();

  // ---- neck (over finalized head bytes) ----
  record_stage(packet, run(strategies.neck(meta.neck_kind_code()).encode, packet, Stage::pack_neck));
  meta.set_neck_length(packet.neck.pack.size());

  packet.pack = packet.head.pack_str();
  packet.pack += packet.neck.pack;
  packet.pack += packet.body.pack;
  packet.pack += packet.tail.pack;
  return packet.pack;
}

} // namespace raet

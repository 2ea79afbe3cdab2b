// -----------------------------------------------------------------------------
// packet.cpp - packet construction and header length decoding.
// -----------------------------------------------------------------------------
#include "raet/packet.hpp"

#include <cctype>
#include <cstdlib>
#include <utility>

namespace raet {

int32_t Head::length() const {
  const Value* v = fields.get(tag::head_length);
  if (!v) return -1;
  if (v->is_number_unsigned()) {
    uint64_t n = v->get<uint64_t>();
    return n > MAX_HEAD_LENGTH ? -1 : static_cast<int32_t>(n);
  }
  if (v->is_number_integer()) {
    int64_t n = v->get<int64_t>();
    return (n < 0 || n > static_cast<int64_t>(MAX_HEAD_LENGTH)) ? -1 : static_cast<int32_t>(n);
  }
  if (!v->is_string()) return -1;

  // exactly two hex digits, as written by the packer
  const std::string s = v->get<std::string>();
  if (s.size() != 2) return -1;
  if (!std::isxdigit(static_cast<unsigned char>(s[0])) ||
      !std::isxdigit(static_cast<unsigned char>(s[1]))) {
    return -1;
  }
  return static_cast<int32_t>(std::strtoul(s.c_str(), nullptr, 16));
}

Packet make_packet() {
  Packet p;
  p.head.set_kind(HeadKind::json);
  p.meta.set_head_kind(HeadKind::json);
  return p;
}

Packet make_packet(std::string raw) {
  Packet p;
  p.pack = std::move(raw);
  return p;
}

void record_stage(Packet& packet, const StageResult& result) {
  packet.report.record(result);
  packet.meta.error = packet.report.last_error();
}

} // namespace raet

// -----------------------------------------------------------------------------
// kinds.cpp - static tables behind the RAET kind registries.
//
// API & code tables: see include/raet/kinds.hpp
// -----------------------------------------------------------------------------
#include "raet/kinds.hpp"

namespace raet {

namespace {

const KindEntry<HeadKind> HEAD_KIND_TABLE[] = {
  {"json",    HeadKind::json},
  {"binary",  HeadKind::binary},
  {"unknown", HeadKind::unknown},
};

const KindEntry<NeckKind> NECK_KIND_TABLE[] = {
  {"nada",    NeckKind::nada},
  {"sodium",  NeckKind::sodium},
  {"sha2",    NeckKind::sha2},
  {"crc64",   NeckKind::crc64},
  {"unknown", NeckKind::unknown},
};

const KindEntry<BodyKind> BODY_KIND_TABLE[] = {
  {"nada",    BodyKind::nada},
  {"json",    BodyKind::json},
  {"binary",  BodyKind::binary},
  {"unknown", BodyKind::unknown},
};

const KindEntry<TailKind> TAIL_KIND_TABLE[] = {
  {"nada",    TailKind::nada},
  {"crc16",   TailKind::crc16},
  {"crc64",   TailKind::crc64},
  {"unknown", TailKind::unknown},
};

const KindEntry<ServiceKind> SERVICE_KIND_TABLE[] = {
  {"fireforget", ServiceKind::fireforget},
  {"ackretry",   ServiceKind::ackretry},
  {"unknown",    ServiceKind::unknown},
};

const KindEntry<PacketKind> PACKET_KIND_TABLE[] = {
  {"data",    PacketKind::data},
  {"req",     PacketKind::req},
  {"ack",     PacketKind::ack},
  {"nack",    PacketKind::nack},
  {"unknown", PacketKind::unknown},
};

const KindEntry<Version> VERSION_TABLE[] = {
  {"0.1",     Version::v0_1},
  {"unknown", Version::unknown},
};

} // namespace

const KindRegistry<HeadKind>& head_kinds() {
  static const KindRegistry<HeadKind> reg(HEAD_KIND_TABLE);
  return reg;
}

const KindRegistry<NeckKind>& neck_kinds() {
  static const KindRegistry<NeckKind> reg(NECK_KIND_TABLE);
  return reg;
}

const KindRegistry<BodyKind>& body_kinds() {
  static const KindRegistry<BodyKind> reg(BODY_KIND_TABLE);
  return reg;
}

const KindRegistry<TailKind>& tail_kinds() {
  static const KindRegistry<TailKind> reg(TAIL_KIND_TABLE);
  return reg;
}

const KindRegistry<ServiceKind>& service_kinds() {
  static const KindRegistry<ServiceKind> reg(SERVICE_KIND_TABLE);
  return reg;
}

const KindRegistry<PacketKind>& packet_kinds() {
  static const KindRegistry<PacketKind> reg(PACKET_KIND_TABLE);
  return reg;
}

const KindRegistry<Version>& versions() {
  static const KindRegistry<Version> reg(VERSION_TABLE);
  return reg;
}

} // namespace raet

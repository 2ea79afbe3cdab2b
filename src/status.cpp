// -----------------------------------------------------------------------------
// status.cpp - printable names for stages and error kinds.
// -----------------------------------------------------------------------------
#include "raet/status.hpp"

namespace raet {

const char* to_string(Stage stage) {
  switch (stage) {
    case Stage::pack_body:  return "pack_body";
    case Stage::pack_tail:  return "pack_tail";
    case Stage::pack_head:  return "pack_head";
    case Stage::pack_neck:  return "pack_neck";
    case Stage::parse_head: return "parse_head";
    case Stage::parse_neck: return "parse_neck";
    case Stage::vouch:      return "vouch";
    case Stage::parse_body: return "parse_body";
    case Stage::parse_tail: return "parse_tail";
    case Stage::verify:     return "verify";
  }
  return "unknown";
}

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ok:                   return "ok";
    case ErrorKind::unrecognized_head:    return "unrecognized_head";
    case ErrorKind::malformed_head:       return "malformed_head";
    case ErrorKind::head_length_mismatch: return "head_length_mismatch";
    case ErrorKind::head_kind_mismatch:   return "head_kind_mismatch";
    case ErrorKind::head_too_long:        return "head_too_long";
    case ErrorKind::unrecognized_neck:    return "unrecognized_neck";
    case ErrorKind::unrecognized_body:    return "unrecognized_body";
    case ErrorKind::malformed_body:       return "malformed_body";
    case ErrorKind::unrecognized_tail:    return "unrecognized_tail";
    case ErrorKind::rejected_head:        return "rejected_head";
    case ErrorKind::rejected_body:        return "rejected_body";
  }
  return "unknown";
}

} // namespace raet

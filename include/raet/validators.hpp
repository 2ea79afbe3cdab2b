/**
 * @file validators.hpp
 * @brief Authentication (vouch) and integrity (verify) checkpoints used by parse().
 *
 * @details
 * Both hooks are predicates the parser trusts as final:
 *  - **vouch** runs after the neck is parsed and decides whether the header
 *    may be trusted. On rejection body and tail are never inspected.
 *  - **verify** runs after the tail is parsed and decides whether the body
 *    may be trusted.
 *
 * A hook must not modify anything but `meta.error`, which it may set to
 * explain a rejection. The defaults accept everything.
 */
#pragma once

#include <functional>
#include "raet/packet.hpp"

namespace raet {

using VouchFn  = std::function<bool(Meta&, const Head&, const Neck&)>;
using VerifyFn = std::function<bool(Meta&, const Body&, const Tail&)>;

inline bool accept_head(Meta&, const Head&, const Neck&) { return true; }
inline bool accept_body(Meta&, const Body&, const Tail&) { return true; }

struct Validators {
  VouchFn  vouch  = accept_head;
  VerifyFn verify = accept_body;
};

} // namespace raet

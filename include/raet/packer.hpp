/**
 * @file packer.hpp
 * @brief Serialize a Packet into RAET wire bytes.
 *
 * @details
 * Stage order is fixed:
 *
 * 1. **body**: encode through the body strategy, `meta.bl = len(body.pack)`
 * 2. **tail**: encode through the tail strategy, `meta.tl = len(tail.pack)`
 * 3. **head**: sync the neck/body/tail kind and length fields from meta into
 *    the header, emit every mandatory or non-default field in table order with
 *    `"hl":"00"` as placeholder, append CR LF CR LF, then patch the two
 *    placeholder characters in place with the lowercase hex total length
 * 4. **neck**: encode through the neck strategy over the finalized head bytes,
 *    `meta.nl = len(neck.pack)`
 * 5. `packet.pack = head + neck + body + tail`
 *
 * Body and tail come first because the header carries their lengths; the
 * header is finalized before the neck because the neck authenticates it.
 *
 * A header longer than MAX_HEAD_LENGTH fails the call: `meta.hl` becomes 0,
 * `head.pack` and `packet.pack` stay empty and the neck is not built.
 */
#pragma once

#include <string>
#include "raet/packet.hpp"
#include "raet/strategies.hpp"

namespace raet {

/**
 * @brief Pack `packet` and return its wire form.
 *
 * Never throws. Per-stage outcomes land in `packet.report`; the latest failure
 * message is mirrored in `packet.meta.error`.
 *
 * @return the wire bytes (also stored in `packet.pack`), or an empty string
 *         when the header could not be built.
 */
std::string pack(Packet& packet, const Strategies& strategies = Strategies::defaults());

/**
 * @brief Build and finalize only the header (stage 3).
 *
 * Exposed for tools that need the header bytes alone. Updates `head.pack`,
 * the `hl` field and `meta.hl`.
 */
StageResult pack_head(Packet& packet);

} // namespace raet

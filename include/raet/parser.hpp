/**
 * @file parser.hpp
 * @brief Decode RAET wire bytes held in `Packet::pack` into the packet parts.
 *
 * @details
 * `packet.pack` is consumed front to back; each stage removes the bytes it
 * owns and leaves the rest for the next one:
 *
 * ```
 *  AwaitHead --no marker--> Rejected
 *      |
 *  AwaitNeck -> Vouching --false--> Rejected
 *                   |
 *              AwaitBody -> AwaitTail -> Verifying --false--> Rejected
 *                                            |
 *                                          Done (returns remainder)
 * ```
 *
 * Non-terminal problems (length or kind mismatch in the header, unrecognized
 * neck/body/tail kind, undecodable JSON body) are recorded in the report and
 * `meta.error`; parsing continues with best-effort state. An unrecognized part
 * kind forces that part's meta length to 0 and its kind to `unknown`.
 */
#pragma once

#include <optional>
#include <string>
#include "raet/packet.hpp"
#include "raet/strategies.hpp"
#include "raet/validators.hpp"

namespace raet {

/**
 * @brief Parse `packet.pack` in place.
 *
 * Meta defaults are filled once before the header is read. Never throws.
 *
 * @return the unconsumed remainder of the buffer (normally empty; also left
 *         in `packet.pack`), or std::nullopt when the header cannot be framed
 *         or a validation hook rejects the packet.
 */
std::optional<std::string> parse(Packet& packet,
                                 const Validators& validators = Validators{},
                                 const Strategies& strategies = Strategies::defaults());

} // namespace raet

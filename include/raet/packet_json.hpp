/**
 * @file packet_json.hpp
 * @brief JSON documents <-> Packet, for tools and fixtures.
 *
 * @details
 * This is not the wire format. It is the human-editable description of a
 * packet that `raet-tool pack` reads and `raet-tool parse` prints:
 *
 * @code
 * {
 *   "meta": { "dh": "10.0.0.2", "bk": "json" },
 *   "head": { "sd": "alpha", "dd": "beta", "sk": "ackretry", "pk": "data" },
 *   "body": { "data": { "a": 1 } }
 * }
 * @endcode
 *
 * Kind fields (`hk nk bk tk sk pk vn`) accept either the numeric code or the
 * registry name; an unknown name maps to the `unknown` code. Tags that are not
 * in the meta or head default tables are ignored.
 *
 * Like the rest of the codec these functions never throw: malformed input
 * yields std::nullopt.
 */
#pragma once

#include <stdint.h>
#include <optional>
#include <string>
#include "raet/packet.hpp"

namespace raet {

/**
 * @brief Build an outbound packet from a JSON description.
 *
 * Starts from make_packet(). When a body is given and `meta.bk` is absent, the
 * body kind defaults to json.
 *
 * @return std::nullopt if the text is not a JSON object, or if `body.data` is
 *         present but not an object.
 */
std::optional<Packet> packet_from_json(const std::string& text);

/**
 * @brief Decoded view of a packet: meta, head fields, body, part lengths,
 *        kind names and the stage report of the last pack/parse call.
 */
Value packet_to_json(const Packet& packet);

/// Numeric code for a kind field given as code or name; nullopt if `tag` is not a kind field.
std::optional<uint64_t> kind_code(const std::string& tag, const Value& value);

} // namespace raet

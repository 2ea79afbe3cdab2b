/**
 * @file config.hpp
 * @brief Transport defaults for the codec, persisted as a small JSON file.
 *
 * @details
 * The codec itself only needs host/port values for the meta view; the
 * transport layer normally supplies them. Tools that run without a transport
 * read them from a JSON file under the XDG config directory:
 *
 * ```
 * $XDG_CONFIG_HOME/raet/codec.json      (or ~/.config/raet/codec.json)
 * { "source_host": "", "source_port": 7530,
 *   "dest_host": "127.0.0.1", "dest_port": 7530 }
 * ```
 *
 * Missing keys keep their defaults. Writes go through a temp file and a
 * rename so a crash never leaves a half-written file behind.
 */
#pragma once

#include <stdint.h>
#include <filesystem>
#include <optional>
#include <string>
#include "raet/defaults.hpp"

namespace raet {

struct CodecConfig {
  std::string source_host;
  uint16_t    source_port{DEFAULT_PORT};
  std::string dest_host{"127.0.0.1"};
  uint16_t    dest_port{DEFAULT_PORT};
};

class Meta;

/// $XDG_CONFIG_HOME/raet/codec.json, falling back to $HOME/.config/raet/codec.json.
std::filesystem::path default_config_path();

/**
 * @brief Load a config file.
 * @return defaults when the file does not exist; std::nullopt when it exists
 *         but cannot be read, is not a JSON object, or has a field of the
 *         wrong type.
 */
std::optional<CodecConfig> load_config(const std::filesystem::path& path);

/// Write `cfg` atomically, creating parent directories. False on any I/O error.
bool save_config(const std::filesystem::path& path, const CodecConfig& cfg);

/// Fill `sh sp dh dp` in meta from `cfg` where the caller left them absent.
void apply(const CodecConfig& cfg, Meta& meta);

} // namespace raet

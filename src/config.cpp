// -----------------------------------------------------------------------------
// config.cpp - XDG JSON config for codec transport defaults.
// -----------------------------------------------------------------------------
#include "raet/config.hpp"
#include "raet/packet.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include "nlohmann/json.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace raet {

namespace {

bool read_port(const json& j, const char* key, uint16_t& out) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_unsigned() || it->get<uint64_t>() > 0xFFFFu) return false;
  out = static_cast<uint16_t>(it->get<uint64_t>());
  return true;
}

bool read_host(const json& j, const char* key, std::string& out) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) return false;
  out = it->get<std::string>();
  return true;
}

} // namespace

fs::path default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home ? home : ".") / ".config";
  return base / "raet" / "codec.json";
}

std::optional<CodecConfig> load_config(const fs::path& path) {
  CodecConfig cfg;
  std::error_code ec;
  if (!fs::exists(path, ec)) return cfg;

  std::ifstream in(path);
  if (!in) return std::nullopt;

  json j;
  try {
    in >> j;
  } catch (const json::exception&) {
    return std::nullopt;
  }
  if (!j.is_object()) return std::nullopt;

  if (!read_host(j, "source_host", cfg.source_host) ||
      !read_port(j, "source_port", cfg.source_port) ||
      !read_host(j, "dest_host",   cfg.dest_host)   ||
      !read_port(j, "dest_port",   cfg.dest_port)) {
    return std::nullopt;
  }
  return cfg;
}

bool save_config(const fs::path& path, const CodecConfig& cfg) {
  json j = {
    {"source_host", cfg.source_host},
    {"source_port", cfg.source_port},
    {"dest_host",   cfg.dest_host},
    {"dest_port",   cfg.dest_port},
  };

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) return false;
  }
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return false;
    out << j.dump(2);
    out.flush();
    if (!out) return false;
  }
  fs::rename(tmp, path, ec);
  return !ec;
}

void apply(const CodecConfig& cfg, Meta& meta) {
  if (!meta.fields.has(tag::source_host)) meta.set_source_host(cfg.source_host);
  if (!meta.fields.has(tag::source_port)) meta.set_source_port(cfg.source_port);
  if (!meta.fields.has(tag::dest_host))   meta.set_dest_host(cfg.dest_host);
  if (!meta.fields.has(tag::dest_port))   meta.set_dest_port(cfg.dest_port);
}

} // namespace raet

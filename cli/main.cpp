/**
 * @file main.cpp
 * @brief raet-tool - Linux one-shot runner around the RAET packet codec.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): one subcommand per run (pack, parse, kinds, config).
 *  - Load transport defaults from the XDG config (~/.config/raet/codec.json).
 *  - pack:  JSON packet description -> wire bytes (file or stdout).
 *  - parse: wire bytes -> decoded packet, printed pretty or as JSON.
 *  - kinds: list every kind registry.
 *  - config: show the effective config, optionally write it back.
 *
 * Notes:
 *  - Failures are reported on stderr as single `status=error reason=...` lines.
 *  - Exit codes: 0 ok, 1 I/O failure, 2 usage/config error, 3 codec error.
 */

#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <optional>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "raet/config.hpp"
#include "raet/kinds.hpp"
#include "raet/packer.hpp"
#include "raet/packet.hpp"
#include "raet/packet_json.hpp"
#include "raet/parser.hpp"

namespace fs = std::filesystem;
using namespace raet;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static std::optional<std::string> read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static bool write_file(const std::string& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(out);
}

// Header bytes with CR/LF made visible.
static std::string printable(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c == '\r')      out += "\\r";
    else if (c == '\n') out += "\\n";
    else                out += c;
  }
  return out;
}

static void print_record_pretty(std::ostream& os, const Record& rec, const Ansi& ansi) {
  const Value& items = rec.items();
  for (auto it = items.begin(); it != items.end(); ++it) {
    os << "    " << std::left << std::setw(4) << it.key() << " ";
    if (it.value().is_null()) os << ansi.dim("(null)") << "\n";
    else                      os << it.value().dump() << "\n";
  }
}

static void print_report_pretty(std::ostream& os, const StageReport& report, const Ansi& ansi) {
  for (const auto& r : report) {
    os << "    " << std::left << std::setw(12) << to_string(r.stage) << " ";
    if (r.ok()) os << "ok\n";
    else        os << ansi.red(to_string(r.kind)) << "  " << r.message << "\n";
  }
}

static void print_packet_pretty(std::ostream& os, const Packet& p, const Ansi& ansi) {
  const Meta& m = p.meta;
  os << ansi.bold("HEAD") << "  " << head_kinds().name_of(m.head_kind_code())
     << "  " << m.head_length() << " bytes\n";
  if (!p.head.pack.empty()) os << "    " << ansi.dim(printable(p.head.pack_str())) << "\n";
  print_record_pretty(os, p.head.fields, ansi);
  os << ansi.bold("NECK") << "  " << neck_kinds().name_of(m.neck_kind_code())
     << "  " << m.neck_length() << " bytes\n";
  os << ansi.bold("BODY") << "  " << body_kinds().name_of(m.body_kind_code())
     << "  " << m.body_length() << " bytes\n";
  os << "    data " << p.body.data.dump() << "\n";
  if (!p.body.raw.is_null()) os << "    raw  " << p.body.raw.dump() << "\n";
  os << ansi.bold("TAIL") << "  " << tail_kinds().name_of(m.tail_kind_code())
     << "  " << m.tail_length() << " bytes\n";
  os << ansi.bold("STAGES") << "\n";
  print_report_pretty(os, p.report, ansi);
}

template <typename Kind>
static void print_registry(const char* title, const KindRegistry<Kind>& reg, nlohmann::ordered_json* out) {
  if (out) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& e : reg) j[e.name] = code(e.kind);
    (*out)[title] = j;
    return;
  }
  std::cout << title << "\n";
  for (const auto& e : reg) {
    std::cout << "    " << std::left << std::setw(12) << e.name << " " << unsigned(code(e.kind)) << "\n";
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  std::string opt_format = "pretty"; // pretty|json
  bool opt_no_color = false;

  std::string opt_in;
  std::string opt_out;
  bool opt_print = false;
  bool opt_write = false;

  CLI::App app{"RAET packet codec tool"};
  app.require_subcommand(1);
  app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/raet/codec.json)");
  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty","json"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  CLI::App* pack_cmd = app.add_subcommand("pack", "Pack a JSON packet description into wire bytes");
  pack_cmd->add_option("--in", opt_in, "Packet description (JSON)")->required();
  pack_cmd->add_option("--out", opt_out, "Write wire bytes here (default: stdout)");
  pack_cmd->add_flag("--print", opt_print, "Print the packed packet");

  CLI::App* parse_cmd = app.add_subcommand("parse", "Parse wire bytes and print the packet");
  parse_cmd->add_option("--in", opt_in, "Wire bytes")->required();

  CLI::App* kinds_cmd = app.add_subcommand("kinds", "List kind registries");

  CLI::App* config_cmd = app.add_subcommand("config", "Show the effective config");
  config_cmd->add_flag("--write", opt_write, "Write the effective config back to the config file");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && (opt_format=="pretty");

  fs::path config_path = opt_config.empty() ? default_config_path() : fs::path(opt_config);
  std::optional<CodecConfig> cfg = load_config(config_path);
  if (!cfg) {
    std::cerr << "status=error reason=bad_config path=" << config_path.string() << "\n";
    return 2;
  }

  // ---- kinds ----
  if (*kinds_cmd) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    nlohmann::ordered_json* out = (opt_format=="json") ? &j : nullptr;
    print_registry("head",    head_kinds(),    out);
    print_registry("neck",    neck_kinds(),    out);
    print_registry("body",    body_kinds(),    out);
    print_registry("tail",    tail_kinds(),    out);
    print_registry("service", service_kinds(), out);
    print_registry("packet",  packet_kinds(),  out);
    print_registry("version", versions(),      out);
    if (out) std::cout << j.dump(2) << "\n";
    return 0;
  }

  // ---- config ----
  if (*config_cmd) {
    nlohmann::ordered_json j = {
      {"source_host", cfg->source_host},
      {"source_port", cfg->source_port},
      {"dest_host",   cfg->dest_host},
      {"dest_port",   cfg->dest_port},
    };
    if (opt_format=="json") std::cout << j.dump(2) << "\n";
    else std::cout << ansi.dim("config: " + config_path.string()) << "\n" << j.dump(2) << "\n";
    if (opt_write && !save_config(config_path, *cfg)) {
      std::cerr << "status=error reason=write_failed path=" << config_path.string() << "\n";
      return 1;
    }
    return 0;
  }

  // ---- pack ----
  if (*pack_cmd) {
    std::optional<std::string> text = read_file(opt_in);
    if (!text) {
      std::cerr << "status=error reason=read_failed path=" << opt_in << "\n";
      return 1;
    }
    std::optional<Packet> packet = packet_from_json(*text);
    if (!packet) {
      std::cerr << "status=error reason=bad_packet_json path=" << opt_in << "\n";
      return 2;
    }
    apply(*cfg, packet->meta);

    std::string wire = pack(*packet);
    if (wire.empty()) {
      std::cerr << "status=error reason=pack_failed detail=\"" << packet->meta.error << "\"\n";
      return 3;
    }
    if (!packet->meta.error.empty()) {
      std::cerr << "status=warn reason=\"" << packet->meta.error << "\"\n";
    }

    // wire bytes own stdout unless --out is given
    if (opt_print) {
      std::ostream& os = opt_out.empty() ? std::cerr : std::cout;
      if (opt_format=="json") os << packet_to_json(*packet).dump(2) << "\n";
      else                    print_packet_pretty(os, *packet, ansi);
    }

    if (opt_out.empty()) {
      std::cout.write(wire.data(), static_cast<std::streamsize>(wire.size()));
      std::cout.flush();
    } else if (!write_file(opt_out, wire)) {
      std::cerr << "status=error reason=write_failed path=" << opt_out << "\n";
      return 1;
    }
    return 0;
  }

  // ---- parse ----
  if (*parse_cmd) {
    std::optional<std::string> wire = read_file(opt_in);
    if (!wire) {
      std::cerr << "status=error reason=read_failed path=" << opt_in << "\n";
      return 1;
    }
    Packet packet = make_packet(*wire);
    apply(*cfg, packet.meta);
    std::optional<std::string> rest = parse(packet);

    if (opt_format=="json") {
      nlohmann::ordered_json j = packet_to_json(packet);
      j["remainder"] = rest ? nlohmann::ordered_json(rest->size()) : nlohmann::ordered_json(nullptr);
      std::cout << j.dump(2) << "\n";
    } else {
      print_packet_pretty(std::cout, packet, ansi);
      if (rest && !rest->empty()) std::cout << ansi.dim(std::to_string(rest->size()) + " trailing byte(s)") << "\n";
    }

    if (!rest) {
      std::cerr << "status=error reason=parse_rejected detail=\"" << packet.meta.error << "\"\n";
      return 3;
    }
    if (!packet.meta.error.empty()) {
      std::cerr << "status=warn reason=\"" << packet.meta.error << "\"\n";
    }
    return 0;
  }

  return 2;
}

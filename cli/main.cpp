/**
 * @file main.cpp
 * @brief lorabroker CLI: one-shot runner around lorabroker::Broker.
 *
 * Responsibilities:
 *  - Parse subcommands and options (CLI11).
 *  - Load the config file (XDG), let command line options override it.
 *  - Open the registry snapshot, build a Broker, run one Register or HandleUp.
 *  - Print the outcome (`status=ack` / `status=nack kind=.. reason=..`) on stdout
 *    and turn it into the exit status.
 *  - Tooling around the wire format: encode-up, decode, dump.
 *
 * Exit status:
 *  | code | meaning                   |
 *  |------|---------------------------|
 *  | 0    | ack / tool succeeded      |
 *  | 1    | usage or config error     |
 *  | 2    | structural                |
 *  | 3    | behavioural               |
 *  | 4    | operational               |
 *  | 70   | MIC matched several devices (internal invariant) |
 *
 * Notes:
 *  - A recipient of `-` writes SLIP frames to stdout, on the same stream as the
 *    status line; point it at a file when scripting.
 *  - Logs go to stderr, level from --log-level or the config file.
 */

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"

#include "lorabroker/ack_reporter.hpp"
#include "lorabroker/app_packet.hpp"
#include "lorabroker/broker.hpp"
#include "lorabroker/config.hpp"
#include "lorabroker/device_registry.hpp"
#include "lorabroker/log.hpp"
#include "lorabroker/mic.hpp"
#include "lorabroker/registration.hpp"
#include "lorabroker/slip_adapter.hpp"
#include "lorabroker/uplink_packet.hpp"

namespace fs = std::filesystem;
using namespace lorabroker;

// ---------- small utilities ----------

static bool is_tty_stderr() { return ::isatty(fileno(stderr)); }

struct Ansi {
  bool enabled{true};
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static int usage_error(const Ansi& ansi, const std::string& msg) {
  std::cerr << ansi.red("error: " + msg) << "\n";
  return 1;
}

static RawRecipient recipient_bytes(const std::string& s) {
  return RawRecipient(s.begin(), s.end());
}

static bool read_binary_file(const fs::path& p, std::vector<uint8_t>& out) {
  std::ifstream in(p, std::ios::binary);
  if (!in) return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

// Fixed-width hex option: "--devaddr 02030203" etc.
template <size_t N>
static bool parse_hex_opt(const Ansi& ansi, const char* name, const std::string& v, std::array<uint8_t, N>& out) {
  if (from_hex(v, out)) return true;
  std::cerr << ansi.red(std::string("error: ") + name + " needs " + std::to_string(N * 2) + " hex digits") << "\n";
  return false;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  std::string opt_registry;
  std::string opt_log_level;
  bool        opt_no_color = false;

  CLI::App app{"lorabroker: LoRaWAN uplink broker"};
  app.require_subcommand(1);
  app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/lorabroker/config.json)");
  app.add_option("--registry", opt_registry, "Registry snapshot (overrides registry_path)");
  app.add_option("--log-level", opt_log_level, "debug|info|warn|error|off")
     ->check(CLI::IsMember({"debug","info","warn","error","off"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors on stderr");

  // register-device
  std::string rd_devaddr, rd_appeui, rd_deveui, rd_nwkskey, rd_recipient;
  auto* reg_dev = app.add_subcommand("register-device", "Register a device session");
  reg_dev->add_option("--devaddr", rd_devaddr, "DevAddr, 8 hex digits")->required();
  reg_dev->add_option("--appeui",  rd_appeui,  "AppEUI, 16 hex digits")->required();
  reg_dev->add_option("--deveui",  rd_deveui,  "DevEUI, 16 hex digits")->required();
  reg_dev->add_option("--nwkskey", rd_nwkskey, "NwkSKey, 32 hex digits")->required();
  reg_dev->add_option("--recipient", rd_recipient, "Handler path or '-' (default: handler_fallback)");

  // register-app
  std::string ra_appeui, ra_recipient;
  auto* reg_app = app.add_subcommand("register-app", "Register an application handler");
  reg_app->add_option("--appeui", ra_appeui, "AppEUI, 16 hex digits")->required();
  reg_app->add_option("--recipient", ra_recipient, "Handler path or '-' (default: handler_fallback)");

  // up
  std::string up_hex, up_file;
  auto* up = app.add_subcommand("up", "Handle one uplink frame");
  auto* up_hex_opt  = up->add_option("--hex", up_hex, "Frame as hex");
  auto* up_file_opt = up->add_option("--file", up_file, "File holding the raw frame")->check(CLI::ExistingFile);
  up_hex_opt->excludes(up_file_opt);
  up->require_option(1);

  // encode-up
  std::string eu_devaddr, eu_payload, eu_payload_hex, eu_nwkskey, eu_datr;
  uint32_t eu_fcnt = 0;
  bool     eu_confirmed = false;
  int      eu_rssi = 0;
  double   eu_lsnr = 0.0;
  uint32_t eu_freq = 0;
  auto* enc = app.add_subcommand("encode-up", "Build and sign an uplink frame, print it as hex");
  enc->add_option("--devaddr", eu_devaddr, "DevAddr, 8 hex digits")->required();
  enc->add_option("--fcnt", eu_fcnt, "Frame counter")->capture_default_str();
  auto* pl_txt = enc->add_option("--payload", eu_payload, "Payload text");
  auto* pl_hex = enc->add_option("--payload-hex", eu_payload_hex, "Payload as hex");
  pl_txt->excludes(pl_hex);
  enc->add_option("--nwkskey", eu_nwkskey, "NwkSKey, 32 hex digits")->required();
  enc->add_flag("--confirmed", eu_confirmed, "Confirmed data up");
  auto* o_rssi = enc->add_option("--rssi", eu_rssi, "RSSI in dBm")->check(CLI::Range(-32768, 32767));
  auto* o_lsnr = enc->add_option("--lsnr", eu_lsnr, "SNR in dB")->check(CLI::Range(-3276.8, 3276.7));
  auto* o_freq = enc->add_option("--freq", eu_freq, "Frequency in Hz");
  auto* o_datr = enc->add_option("--datr", eu_datr, "Data rate, e.g. SF7BW125");

  // decode
  std::string dec_hex;
  auto* dec = app.add_subcommand("decode", "Decode an uplink frame");
  dec->add_option("--hex", dec_hex, "Frame as hex")->required();

  // dump
  std::string dump_file;
  auto* dump = app.add_subcommand("dump", "Print the application packets in a handler file");
  dump->add_option("--file", dump_file, "SLIP stream written by the broker")->required()->check(CLI::ExistingFile);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stderr();

  // ---------- tooling: no config, no registry ----------

  if (*enc) {
    UplinkPacket pkt;
    AES128Key key{};
    if (!parse_hex_opt(ansi, "--devaddr", eu_devaddr, pkt.devaddr)) return 1;
    if (!parse_hex_opt(ansi, "--nwkskey", eu_nwkskey, key)) return 1;
    pkt.mhdr = eu_confirmed ? MHDR_CONFIRMED_DATA_UP : MHDR_UNCONFIRMED_DATA_UP;
    pkt.fcnt = eu_fcnt;

    std::vector<uint8_t> body;
    if (*pl_hex) {
      if (!hex_to_bytes(eu_payload_hex, body)) return usage_error(ansi, "--payload-hex is not hex");
    } else {
      body.assign(eu_payload.begin(), eu_payload.end());
    }
    if (body.size() > LB_PAYLOAD_MAX) return usage_error(ansi, "payload longer than 255 bytes");
    pkt.payload.assign(body.begin(), body.end());

    bool ok = true;
    if (*o_freq) ok = ok && pkt.metadata.set_freq_hz(eu_freq);
    if (*o_datr) ok = ok && pkt.metadata.set_datr(eu_datr);
    if (*o_rssi) ok = ok && pkt.metadata.set_rssi_dbm(static_cast<int16_t>(eu_rssi));
    if (*o_lsnr) ok = ok && pkt.metadata.set_lsnr_c10(static_cast<int16_t>(eu_lsnr * 10.0 + (eu_lsnr < 0 ? -0.5 : 0.5)));
    if (!ok) return usage_error(ansi, "metadata value too long");

    if (!sign_uplink(key, pkt)) {
      std::cerr << ansi.red("error: MIC computation failed") << "\n";
      return 4;
    }
    std::vector<uint8_t> frame;
    encode_uplink(pkt, frame);
    std::cout << bytes_to_hex(frame.data(), frame.size()) << "\n";
    return 0;
  }

  if (*dec) {
    std::vector<uint8_t> frame;
    if (!hex_to_bytes(dec_hex, frame)) return usage_error(ansi, "--hex is not hex");
    UplinkPacket pkt;
    if (Error err = decode_uplink(frame, pkt)) {
      std::cout << "status=error " << to_pretty(err) << "\n";
      return exit_code(err);
    }
    std::cout << to_pretty(pkt) << "\n";
    return 0;
  }

  if (*dump) {
    std::vector<std::vector<uint8_t>> frames;
    Error rerr = read_frames(dump_file, frames);
    size_t idx = 1;
    for (const auto& f : frames) {
      AppPacket pkt;
      if (Error err = decode_app_packet(f.data(), f.size(), pkt)) {
        std::cout << "#" << idx++ << " status=error " << to_pretty(err) << "\n";
        continue;
      }
      std::cout << "#" << idx++ << " " << to_pretty(pkt) << "\n";
    }
    if (rerr) {
      std::cerr << ansi.red("error: " + to_pretty(rerr)) << "\n";
      return exit_code(rerr);
    }
    return 0;
  }

  // ---------- broker commands: config + registry ----------

  BrokerConfig cfg;
  fs::path cfg_path = opt_config.empty() ? default_config_path() : fs::path(opt_config);
  if (!opt_config.empty() && !fs::exists(cfg_path))
    return usage_error(ansi, "config file not found: " + cfg_path.string());
  if (Error err = load_config(cfg_path, cfg))
    return usage_error(ansi, to_pretty(err));

  if (!opt_log_level.empty() && !parse_log_level(opt_log_level, cfg.log_level))
    return usage_error(ansi, "bad --log-level");
  if (!opt_registry.empty()) cfg.registry_path = opt_registry;
  if (cfg.registry_path.empty()) cfg.registry_path = default_config_dir() / "registry.json";

  Logger log(std::cerr, cfg.log_level, "lorabroker");
  log.debug("config=" + cfg_path.string() + " registry=" + cfg.registry_path.string()
            + " log_level=" + to_string(cfg.log_level));

  DeviceRegistry registry(cfg.registry_path);
  if (Error err = registry.load()) {
    log.error("registry load failed " + to_pretty(err));
    return exit_code(err);
  }

  Broker broker(registry, log);
  StreamAckNacker an(std::cout);

  if (*reg_dev) {
    DeviceRegistration r;
    if (!parse_hex_opt(ansi, "--devaddr", rd_devaddr, r.devaddr)) return 1;
    if (!parse_hex_opt(ansi, "--appeui",  rd_appeui,  r.app_eui)) return 1;
    if (!parse_hex_opt(ansi, "--deveui",  rd_deveui,  r.dev_eui)) return 1;
    if (!parse_hex_opt(ansi, "--nwkskey", rd_nwkskey, r.nwk_skey)) return 1;
    r.recipient = recipient_bytes(rd_recipient.empty() ? cfg.handler_fallback : rd_recipient);
    Error err = broker.register_entry(Registration{r}, an);
    return exit_code(err);
  }

  if (*reg_app) {
    ApplicationRegistration r;
    if (!parse_hex_opt(ansi, "--appeui", ra_appeui, r.app_eui)) return 1;
    r.recipient = recipient_bytes(ra_recipient.empty() ? cfg.handler_fallback : ra_recipient);
    Error err = broker.register_entry(Registration{r}, an);
    return exit_code(err);
  }

  if (*up) {
    std::vector<uint8_t> frame;
    if (*up_hex_opt) {
      if (!hex_to_bytes(up_hex, frame)) return usage_error(ansi, "--hex is not hex");
    } else if (!read_binary_file(up_file, frame)) {
      return usage_error(ansi, "cannot read " + up_file);
    }

    SlipFileAdapter adapter(std::cout, log);
    try {
      Error err = broker.handle_up(frame, an, adapter);
      return exit_code(err);
    } catch (const InvariantViolation& ex) {
      // Already logged by the broker; no outcome was reported.
      std::cerr << ansi.red(std::string("fatal: ") + ex.what()) << "\n";
      return 70;
    }
  }

  return 1;
}

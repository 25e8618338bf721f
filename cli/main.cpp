/**
 * @file main.cpp
 * @brief linkstation-cli: one-shot front end over linkstation::Api.
 *
 * Responsibilities:
 *  - Load configuration: JSON file (--config), LINKSTATION_* environment, then flags.
 *  - Run exactly one subcommand against the modem or the media service.
 *  - Print the JSON reply on stdout; log lines go to stderr.
 *
 * Subcommands:
 *  - live [--raw]                       one poll cycle, then the telemetry response
 *  - info                               modem / SIM identity
 *  - ctrl <action> [--body JSON] [--dry-run]
 *  - roaming | network-mode | band-pref current preference state
 *  - stream playlist|segment|file|camera|live-hls|cameras|recordings|days|segments|health
 *
 * Exit status:
 *  - 0 success (including a gate preview)
 *  - 1 the reply carried ok=false or an HTTP-style status >= 400
 *  - 2 usage or configuration error
 *
 * Notes:
 *  - Control requests go through the same gate as the service; --allow-dangerous
 *    only flips the switch for this process.
 *  - `stream` writes the body to --out (or stdout) and the status/headers to stderr.
 *    `stream file` relays the recording as it arrives instead of buffering it.
 */

#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "linkstation/api.hpp"
#include "linkstation/config.hpp"
#include "linkstation/context.hpp"
#include "linkstation/log.hpp"

using json = nlohmann::json;
using namespace linkstation;

// ---------- small utilities ----------

static int emit(const ApiReply& r, bool compact) {
  std::cout << (compact ? r.body.dump() : r.body.dump(2)) << "\n";
  const bool ok = r.body.is_object() && r.body.value("ok", false);
  return (r.status < 400 && ok) ? 0 : 1;
}

static int emit_stream(const stream::GatewayResponse& r, const std::string& out_path) {
  std::cerr << "status=" << r.status;
  if (!r.ok()) std::cerr << " error=" << stream::to_string(r.error) << " reason=" << r.detail;
  std::cerr << "\n";
  for (const auto& h : r.headers) std::cerr << h.first << ": " << h.second << "\n";

  if (out_path.empty() || out_path == "-") {
    std::cout.write(r.body.data(), static_cast<std::streamsize>(r.body.size()));
    if (!r.body.empty() && r.body.back() != '\n' && !r.ok()) std::cout << "\n";
  } else {
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out) { std::cerr << "status=error reason=open_failed path=" << out_path << "\n"; return 1; }
    out.write(r.body.data(), static_cast<std::streamsize>(r.body.size()));
  }
  return (r.ok() && r.status < 400) ? 0 : 1;
}

// Recording relay target: headers to stderr, body to --out or stdout.
class OutputSink : public stream::IResponseSink {
public:
  explicit OutputSink(const std::string& out_path) : path_(out_path) {}

  bool begin(int status, const std::vector<std::pair<std::string, std::string>>& headers) override {
    std::cerr << "status=" << status << "\n";
    for (const auto& h : headers) std::cerr << h.first << ": " << h.second << "\n";
    if (path_.empty() || path_ == "-") return true;
    file_.open(path_, std::ios::binary | std::ios::trunc);
    if (!file_) {
      std::cerr << "status=error reason=open_failed path=" << path_ << "\n";
      failed_ = true;
      return false;
    }
    return true;
  }
  bool write(const char* data, std::size_t n) override {
    std::ostream& os = file_.is_open() ? static_cast<std::ostream&>(file_) : std::cout;
    os.write(data, static_cast<std::streamsize>(n));
    return static_cast<bool>(os);
  }
  bool failed() const { return failed_; }

private:
  std::string path_;
  std::ofstream file_;
  bool failed_{false};
};

static int relay_file(stream::StreamGateway& gw, const std::string& id, const std::string& date,
                      const std::string& file, const std::optional<std::string>& range,
                      const std::optional<std::string>& if_range, const std::string& out_path) {
  OutputSink sink(out_path);
  auto r = gw.stream_recording_file(id, date, file, range, if_range, sink);
  if (!r.streamed) return emit_stream(r, out_path);
  if (sink.failed()) return 1;
  if (!r.ok()) {
    std::cerr << "status=error error=" << stream::to_string(r.error) << " reason=" << r.detail << "\n";
    return 1;
  }
  return r.status < 400 ? 0 : 1;
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"LinkStation modem and media gateway CLI"};
  app.require_subcommand(1);

  // ---- configuration ----
  std::string opt_config;
  std::string opt_port;
  int opt_baud = 0;
  std::string opt_log_level;
  std::string opt_nvr_url;
  bool opt_allow_dangerous = false;
  bool opt_disable_control = false;
  bool opt_compact = false;

  app.add_option("--config", opt_config, "JSON configuration file");
  app.add_option("--port", opt_port, "AT serial port (default /dev/ttyUSB2)");
  app.add_option("--baud", opt_baud, "Baud rate (default 115200)");
  app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|off")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
  app.add_option("--nvr-url", opt_nvr_url, "Media service base URL");
  app.add_flag("--allow-dangerous", opt_allow_dangerous, "Allow dangerous control actions for this run");
  app.add_flag("--disable-control", opt_disable_control, "Force preview-only control");
  app.add_flag("--compact", opt_compact, "Single-line JSON output");

  // ---- live / info / state ----
  bool live_raw = false;
  auto* live = app.add_subcommand("live", "Run one poll cycle and print telemetry");
  live->add_flag("--raw", live_raw, "Include raw reply lines");

  auto* info = app.add_subcommand("info", "Print modem and SIM identity");
  auto* roaming = app.add_subcommand("roaming", "Print roaming preference");
  auto* netmode = app.add_subcommand("network-mode", "Print network mode preference");
  auto* bandpref = app.add_subcommand("band-pref", "Print band search preference");

  // ---- ctrl ----
  std::string ctrl_action;
  std::string ctrl_body;
  bool ctrl_dry_run = false;
  auto* ctrl = app.add_subcommand("ctrl", "Plan or run a control action");
  ctrl->add_option("action", ctrl_action, "reboot|usbnet|apn|roaming|band|cell_lock|ca|gnss|network_mode|band_preference|reset_profile")
      ->required();
  ctrl->add_option("--body", ctrl_body, "Request body as JSON, e.g. '{\"enable\":true}'");
  ctrl->add_flag("--dry-run", ctrl_dry_run, "Force dry_run=true");

  // ---- stream ----
  std::string s_kind, s_id, s_profile = "sub", s_date, s_file, s_range, s_if_range, s_out, s_public_base;
  auto* st = app.add_subcommand("stream", "Query the media service through the gateway");
  st->add_option("kind", s_kind, "playlist|segment|file|camera|live-hls|cameras|recordings|days|segments|health")
      ->required()
      ->check(CLI::IsMember({"playlist", "segment", "file", "camera", "live-hls", "cameras",
                             "recordings", "days", "segments", "health"}));
  st->add_option("--id", s_id, "Camera identifier (IPv4 address)");
  st->add_option("--profile", s_profile, "sub|main")->capture_default_str();
  st->add_option("--date", s_date, "Recording date (YYYY-MM-DD)");
  st->add_option("--file", s_file, "Segment or recording file name");
  st->add_option("--range", s_range, "Range header, e.g. bytes=0-1023");
  st->add_option("--if-range", s_if_range, "If-Range header");
  st->add_option("--public-base", s_public_base, "Public scheme://host[:port] for segment URLs");
  st->add_option("-o,--out", s_out, "Write body to file instead of stdout");

  CLI11_PARSE(app, argc, argv);

  // -------- configuration layers --------
  Config cfg;
  std::string err;
  if (!load_config_file(opt_config, cfg, err) || !apply_env(cfg, err)) {
    std::cerr << "status=error reason=config detail=" << err << "\n";
    return 2;
  }
  if (!opt_port.empty()) cfg.serial.port = opt_port;
  if (opt_baud > 0) cfg.serial.baud = opt_baud;
  if (!opt_log_level.empty()) cfg.log.level = opt_log_level;
  if (!opt_nvr_url.empty()) cfg.gateway.base_url = normalize_base_url(opt_nvr_url);
  if (opt_allow_dangerous) cfg.control.allow_dangerous = true;
  if (opt_disable_control) cfg.control.enabled = false;

  if (!log::init(cfg.log.level, err)) {
    std::cerr << "status=error reason=log detail=" << err << "\n";
    return 2;
  }

  Context ctx(cfg);
  Api api(ctx);

  // -------- dispatch --------
  if (*live) {
    ctx.cache().poll_once();
    return emit(api.live(live_raw), opt_compact);
  }
  if (*info)     return emit(api.info(), opt_compact);
  if (*roaming)  return emit(api.roaming_state(), opt_compact);
  if (*netmode)  return emit(api.network_mode_state(), opt_compact);
  if (*bandpref) return emit(api.band_preference_state(), opt_compact);

  if (*ctrl) {
    json body = json::object();
    if (!ctrl_body.empty()) {
      body = json::parse(ctrl_body, nullptr, false);
      if (body.is_discarded()) {
        std::cerr << "status=error reason=body_not_json\n";
        return 2;
      }
    }
    if (ctrl_dry_run && body.is_object()) body["dry_run"] = true;
    return emit(api.control(ctrl_action, body), opt_compact);
  }

  if (*st) {
    auto& gw = ctx.gateway();
    std::optional<std::string> range, if_range;
    if (!s_range.empty()) range = s_range;
    if (!s_if_range.empty()) if_range = s_if_range;

    if (s_kind == "playlist")   return emit_stream(gw.playlist(s_id, s_profile), s_out);
    if (s_kind == "segment")    return emit_stream(gw.segment(s_id, s_profile, s_file), s_out);
    if (s_kind == "file")       return relay_file(gw, s_id, s_date, s_file, range, if_range, s_out);
    if (s_kind == "camera")     return emit_stream(gw.camera_stream(s_id), s_out);
    if (s_kind == "live-hls")   return emit_stream(gw.live_hls(s_id, s_profile), s_out);
    if (s_kind == "cameras")    return emit_stream(gw.cameras(), s_out);
    if (s_kind == "recordings") return emit_stream(gw.recordings(), s_out);
    if (s_kind == "days")       return emit_stream(gw.recording_days(s_id), s_out);
    if (s_kind == "segments")   return emit_stream(gw.recording_segments(s_id, s_date, s_public_base), s_out);
    return emit_stream(gw.health(), s_out);
  }

  std::cerr << "status=error reason=need_exactly_one_command\n";
  return 2;
}

/**
 * @file main.cpp
 * @brief pushwire CLI - Linux entry point around pushwire::Client.
 *
 * Responsibilities:
 *  - Parse subcommands and global options (CLI11).
 *  - Resolve the state directory (XDG, ~/.config/pushwire) and config.json;
 *    command-line options win over the file.
 *  - `run`: start the client, print notifications to stdout, relay stdin
 *    commands (login, ack <receipt>, logout, status, quit) into it.
 *  - `login`, `logout`, `ack`, `status`: one-shot actions on the same state.
 *    `run` owns the state directory while it is up; the one-shot writers are
 *    refused then and the same actions go through its stdin instead.
 *
 * Exit codes: 0 ok, 1 runtime/network error, 2 usage error, 3 auth error.
 */

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include <poll.h>
#include <unistd.h> // isatty

#include <CLI/CLI.hpp>

#include "pushwire/client.hpp"
#include "pushwire/config.hpp"
#include "pushwire/log.hpp"
#include "pushwire/notification_sink.hpp"
#include "pushwire/state_store.hpp"

namespace fs = std::filesystem;
using namespace pushwire;

namespace {

constexpr int EXIT_OK      = 0;
constexpr int EXIT_RUNTIME = 1;
constexpr int EXIT_USAGE   = 2;
constexpr int EXIT_AUTH    = 3;

std::atomic<bool> g_quit{false};

void on_signal(int) { g_quit = true; }

bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

int exit_code_for(const Error& err) {
  return err.code == ErrorCode::AuthError ? EXIT_AUTH : EXIT_RUNTIME;
}

int report(const char* what, const Error& err) {
  std::cerr << "status=error op=" << what << " code=" << to_string(err.code)
            << " reason=\"" << err.reason << "\"\n";
  return exit_code_for(err);
}

void print_status(const ClientStatus& s) {
  std::cout << "logged_in=" << (s.logged_in ? "yes" : "no")
            << " device_id=" << (s.device_id.empty() ? "-" : s.device_id)
            << " last_message_id=" << s.last_message_id
            << " pending_acks=" << s.pending_acks
            << " state=" << to_string(s.state)
            << " retry_count=" << s.retry_count << "\n";
}

// One line from stdin, waiting at most timeout_ms. False on timeout or EOF.
bool read_line(std::string& line, int timeout_ms, bool& eof) {
  pollfd p{};
  p.fd = STDIN_FILENO;
  p.events = POLLIN;
  if (::poll(&p, 1, timeout_ms) <= 0) return false;
  if (!std::getline(std::cin, line)) { eof = true; return false; }
  return true;
}

// ---------------------------------------------------------------------------
// run_loop()
// ----------
// stdin commands stand in for the tray/UI. EOF on stdin does not stop the
// client (service mode); SIGINT/SIGTERM or "quit" does.
// ---------------------------------------------------------------------------
int run_loop(Client& client) {
  Error err;
  if (!client.start(err)) return report("start", err);

  bool eof = false;
  while (!g_quit) {
    std::string line;
    if (eof) { ::usleep(200 * 1000); continue; }
    if (!read_line(line, 200, eof)) continue;

    std::istringstream in(line);
    std::string cmd, arg, arg2, arg3;
    in >> cmd >> arg >> arg2 >> arg3;
    if (cmd.empty()) continue;

    if (cmd == "quit" || cmd == "exit") {
      break;
    } else if (cmd == "status") {
      print_status(client.status());
    } else if (cmd == "ack") {
      if (arg.empty()) { std::cerr << "usage: ack <receipt>\n"; continue; }
      if (!client.acknowledge_async(arg)) std::cerr << "status=error op=ack reason=queue_full\n";
    } else if (cmd == "login") {
      if (arg.empty() || arg2.empty()) { std::cerr << "usage: login <email> <password> [twofa]\n"; continue; }
      Error lerr;
      if (!client.login(arg, arg2, arg3, lerr)) report("login", lerr);
      else std::cout << "status=ok op=login device_id=" << client.status().device_id << "\n";
    } else if (cmd == "logout") {
      Error lerr;
      if (!client.logout(lerr)) report("logout", lerr);
      else std::cout << "status=ok op=logout\n";
    } else {
      std::cerr << "unknown command: " << cmd << " (login <email> <password> [twofa] | ack <receipt> | logout | status | quit)\n";
    }
  }

  client.stop();
  return EXIT_OK;
}

// `status` while another process runs: read the file, write nothing.
int print_stored_status(const fs::path& state_dir) {
  StateStore store(state_dir / "state.json");
  Error err;
  if (!store.load(err)) return report("status", err);
  const PersistedState st = store.snapshot();
  ClientStatus s;
  s.logged_in       = !st.device_id.empty() && !st.secret.empty();
  s.device_id       = st.device_id;
  s.last_message_id = st.last_message_id;
  s.pending_acks    = st.pending_acks.size();
  print_status(s);
  std::cout << "run=active\n";
  return EXIT_OK;
}

} // namespace

int main(int argc, char** argv) {
  std::string opt_state_dir;
  std::string opt_api_url;
  std::string opt_push_url;
  int         opt_verbose = 0;
  bool        opt_quiet = false;

  std::string opt_format = "pretty";
  bool        opt_no_color = false;
  std::string opt_email, opt_password, opt_twofa, opt_receipt;

  CLI::App app{"pushwire: push-notification relay client"};
  app.require_subcommand(1);
  app.add_option("--state-dir", opt_state_dir, "Override state directory");
  app.add_option("--api-url", opt_api_url, "Relay REST base URL");
  app.add_option("--push-url", opt_push_url, "Relay push channel URL");
  app.add_flag("-v,--verbose", opt_verbose, "More log output, one level per repeat");
  app.add_flag("-q,--quiet", opt_quiet, "Only log errors");

  auto* run = app.add_subcommand("run", "Connect and deliver notifications until quit");
  run->add_option("--format", opt_format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty", "json", "raw"}));
  run->add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  auto* login = app.add_subcommand("login", "Log in and register this device");
  login->add_option("--email", opt_email, "Account e-mail")->required();
  login->add_option("--password", opt_password, "Account password")->required();
  login->add_option("--twofa", opt_twofa, "Two-factor code");

  app.add_subcommand("logout", "Forget credentials and pending state");

  auto* ack = app.add_subcommand("ack", "Acknowledge an emergency receipt");
  ack->add_option("receipt", opt_receipt, "Receipt id")->required();

  app.add_subcommand("status", "Show login state and delivery position");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int rc = app.exit(e);
    return rc == 0 ? EXIT_OK : EXIT_USAGE;
  }

  const fs::path state_dir = opt_state_dir.empty() ? default_state_dir() : fs::path(opt_state_dir);

  Config cfg;
  Error err;
  if (!load_config(state_dir / "config.json", cfg, err)) return report("config", err);
  if (!opt_api_url.empty())  cfg.api_url = opt_api_url;
  if (!opt_push_url.empty()) cfg.push_url = opt_push_url;

  log::set_level(opt_quiet ? log::Level::Error : log::lower_level(cfg.log_level, opt_verbose));

  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  SinkFormat fmt = SinkFormat::Pretty;
  parse_sink_format(opt_format, fmt);
  ConsoleNotificationSink sink(std::cout, fmt, !opt_no_color && is_tty_stdout());

  Client client(cfg, state_dir, sink);
  client.set_event_callback([](const Event& e) {
    std::cerr << "status=terminal event=" << to_string(e.kind) << " detail=\"" << e.detail << "\"";
    if (e.kind != EventKind::EmergencyExpired) std::cerr << " action=\"login <email> <password> [twofa]\"";
    std::cerr << "\n";
  });
  if (!client.open(err)) {
    if (err.reason != "state_locked") return report("open", err);
    if (app.got_subcommand("status")) return print_stored_status(state_dir);
    std::cerr << "pushwire run is active on " << state_dir.string()
              << "; type the command on its stdin instead\n";
    return report("open", err);
  }

  if (run->parsed()) {
    if (!client.status().logged_in) {
      std::cerr << "status=error op=run code=auth_error reason=\"not logged in; run pushwire login\"\n";
      return EXIT_AUTH;
    }
    return run_loop(client);
  }

  if (login->parsed()) {
    if (!client.login(opt_email, opt_password, opt_twofa, err)) {
      if (err.reason == "twofa_required") std::cerr << "two-factor code required: retry with --twofa <code>\n";
      return report("login", err);
    }
    std::cout << "status=ok op=login device_id=" << client.status().device_id << "\n";
    return EXIT_OK;
  }

  if (ack->parsed()) {
    if (!client.acknowledge(opt_receipt, err)) return report("ack", err);
    std::cout << "status=ok op=ack receipt=" << opt_receipt << "\n";
    return EXIT_OK;
  }

  if (app.got_subcommand("logout")) {
    if (!client.logout(err)) return report("logout", err);
    std::cout << "status=ok op=logout\n";
    return EXIT_OK;
  }

  print_status(client.status());
  return EXIT_OK;
}

/**
 * @file main.cpp
 * @brief hf2-cli — Linux one-shot runner around hf2::Host over /dev/hidraw.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and turn `--cmd NAME --arg V...` into one hf2::Command
 *    via the dispatcher (command_dispatch.hpp).
 *  - Open the hidraw node, issue the command, pump reports until the request
 *    resolves, and print the result as a key=value line (or JSON with --json).
 *  - Stream stdout/stderr serial output from the device while waiting, and for
 *    --listen milliseconds afterwards.
 *  - Print engine diagnostics (dropped packets, stray tags) to stderr as
 *    `event=...` lines.
 *
 * Exit codes:
 *  0 ok, 1 open/transport failure, 2 usage or argument error,
 *  3 timeout, 4 device returned a failure status or an undecodable reply.
 *
 * Examples:
 *  hf2-cli --dev /dev/hidraw3 --cmd bininfo
 *  hf2-cli --dev /dev/hidraw3 --cmd read-words --arg 0x20000000 --arg 4 --json
 *  hf2-cli --dev /dev/hidraw3 --listen 5000
 */

#include <cstdio>
#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <iostream>

#include "CLI/CLI11.hpp"

#include "hf2/host.hpp"
#include "hf2/json_report.hpp"
#include "hf2/transport/transport_linux_hidraw.hpp"
#include "command_dispatch.hpp"
#include "hidraw_io.hpp"
#include "pretty.hpp"

using namespace hf2;

// ---------- small utilities ----------

static uint32_t now_ms_steady32() {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
  return static_cast<uint32_t>(ms & 0xFFFFFFFFu);
}

// Serial sink: device stdout → our stdout, device stderr → our stderr, unbuffered.
static void serial_to_stdio(void* user, Channel channel, const uint8_t* data, size_t len) {
  (void)user;
  FILE* f = (channel == Channel::Stderr) ? stderr : stdout;
  std::fwrite(data, 1, len, f);
  std::fflush(f);
}

static void drain_events(Host& host, bool as_json) {
  DiagnosticEvent evt;
  while (host.diagnostics().get_event(evt)) {
    std::cerr << (as_json ? event_json(evt) : event_pretty(evt)) << "\n";
  }
}

// Wait briefly for a report, feed it, then let the host drain the rest and
// check its deadline. False on a dead link.
static bool pump(transport::LinuxHidraw& link, Host& host, int wait_ms) {
  uint8_t buf[PACKET_SIZE];
  size_t n = 0;
  const transport::RxResult r = link.wait_report(buf, sizeof(buf), n, wait_ms);
  if (r == transport::RxResult::Error) return false;
  if (r == transport::RxResult::Ok) host.feed_report(buf, n);
  host.poll(now_ms_steady32());
  return true;
}

static int exit_code_for(const Result& res) {
  if (res.error == Error::Timeout) return 3;
  if (res.error == Error::TransportError) return 1;
  if (res.error != Error::Ok) return 4;
  return res.response.status == ResponseStatus::Ok ? 0 : 4;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_dev;
  std::string opt_cmd;
  std::vector<std::string> opt_args;
  uint32_t opt_timeout = DEFAULT_TIMEOUT_MS;
  uint32_t opt_listen = 0;
  bool opt_json = false;
  bool opt_show_dev = false;
  bool opt_list = false;

  CLI::App app{"hf2 HID command-line client"};
  app.add_option("--dev", opt_dev, "hidraw node, e.g. /dev/hidraw3");
  app.add_option("--cmd", opt_cmd, "Command: bininfo, info, dmesg, reset-app, reset-bootloader, "
                                   "start-flash, write-page, checksum, read-words, write-words");
  app.add_option("--arg", opt_args, "Positional command argument (repeatable)");
  app.add_option("--timeout", opt_timeout, "Response timeout in ms")->capture_default_str();
  app.add_option("--listen", opt_listen, "Keep printing device serial output for N ms");
  app.add_flag("--json", opt_json, "Print results and events as JSON");
  app.add_flag("--show-dev", opt_show_dev, "Print vendor/product of the hidraw node");
  app.add_flag("--list-commands", opt_list, "List command names and their arguments");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  if (opt_list) {
    static const CommandId ALL[] = {
      CommandId::BinInfo, CommandId::Info, CommandId::ResetIntoApp, CommandId::ResetIntoBootloader,
      CommandId::StartFlash, CommandId::WriteFlashPage, CommandId::ChecksumPages,
      CommandId::ReadWords, CommandId::WriteWords, CommandId::Dmesg
    };
    for (CommandId id : ALL) {
      std::cout << command_name(id) << " " << command_usage(id) << "\n";
    }
    return 0;
  }

  if (opt_dev.empty()) {
    std::cerr << "status=error reason=missing_arg:dev\n";
    return 2;
  }
  if (opt_cmd.empty() && opt_listen == 0 && !opt_show_dev) {
    std::cerr << "status=error reason=nothing_to_do (use --cmd, --listen or --show-dev)\n";
    return 2;
  }

  // Build the command before touching the device, so typos never reach it.
  Command cmd;
  if (!opt_cmd.empty()) {
    std::string err;
    if (!build_command(opt_cmd, opt_args, cmd, err)) {
      std::cerr << "status=error reason=" << err << "\n";
      CommandId id;
      if (name_to_id(opt_cmd, id) && command_usage(id)[0]) {
        std::cerr << "usage: --cmd " << opt_cmd << " " << command_usage(id) << "\n";
      }
      return 2;
    }
  }

  transport::LinuxHidraw link(opt_dev);
  if (!link.open()) {
    std::cerr << "status=error reason=open_failed dev=" << opt_dev << "\n";
    return 1;
  }

  if (opt_show_dev) {
    HidrawInfo info;
    if (read_hidraw_info(link.fd(), info)) {
      char ids[32];
      std::snprintf(ids, sizeof(ids), "%04x:%04x", info.vendor, info.product);
      std::cout << "dev=" << opt_dev << " id=" << ids << " name=\"" << info.name << "\"\n";
    } else {
      std::cerr << "status=error reason=hidraw_info_failed dev=" << opt_dev << "\n";
    }
  }

  Host host(link, opt_timeout);
  host.set_serial_sink(Channel::Stdout, serial_to_stdio, nullptr);
  host.set_serial_sink(Channel::Stderr, serial_to_stdio, nullptr);

  int rc = 0;

  if (!opt_cmd.empty()) {
    const Error err = host.issue(cmd, now_ms_steady32());
    if (err != Error::Ok) {
      drain_events(host, opt_json);
      std::cerr << "status=error reason=" << error_name(err) << "\n";
      return err == Error::TransportError ? 1 : 2;
    }

    Result res;
    while (!host.take_result(res)) {
      if (!pump(link, host, 20)) {
        drain_events(host, opt_json);
        std::cerr << "status=error reason=transport_error dev=" << opt_dev << "\n";
        return 1;
      }
      drain_events(host, opt_json);
    }
    drain_events(host, opt_json);

    if (opt_json) {
      std::cout << to_json(res) << "\n";
    } else {
      std::cout << decode_pretty(res) << "\n";
      if (const results::Text* t = etl::get_if<results::Text>(&res.response.data)) {
        if (res.error == Error::Ok && !t->text.empty()) {
          std::cout << std::string(t->text.c_str(), t->text.size());
          if (t->text.back() != '\n') std::cout << "\n";
        }
      }
    }
    rc = exit_code_for(res);
  }

  if (opt_listen > 0) {
    const uint32_t start = now_ms_steady32();
    while (now_ms_steady32() - start < opt_listen) {
      if (!pump(link, host, 50)) {
        std::cerr << "status=error reason=transport_error dev=" << opt_dev << "\n";
        return 1;
      }
      drain_events(host, opt_json);
    }
  }

  return rc;
}

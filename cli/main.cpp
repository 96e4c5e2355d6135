/**
 * @file main.cpp
 * @brief netway-sim, a soak runner: a server and a client Filter over a lossy in-process link.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): link misbehavior, request count, Filter config file.
 *  - Start a server Filter, a client Filter and the LossyLink between them.
 *  - Server application: accept every Connect, answer each ChatMessage with OK.
 *  - Client application: log in, send N ChatMessages (at most 16 unanswered),
 *    wait for N answers, Disconnect.
 *  - Shut both Filters down gracefully and print a report (text or JSON).
 *
 * Exit status: 0 when every request was answered exactly once, 1 otherwise,
 * 2 on bad arguments or an unreadable config file.
 *
 * Example:
 * @code
 *   netway-sim --requests 200 --loss 0.2 --dup 0.1 --reorder 0.1 --json
 * @endcode
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <variant>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "netway/config.hpp"
#include "netway/filter.hpp"
#include "netway/log.hpp"

#include "lossy_link.hpp"

using json = nlohmann::json;
using namespace netway;
using namespace std::chrono_literals;

// ---------- run options ----------

struct SimOptions {
  uint32_t    requests{50};
  uint32_t    timeout_s{30};
  std::string config_path;
  std::string log_level{"warn"};
  bool        as_json{false};
  sim::LinkConfig link;
};

struct ServerTally {
  std::atomic<uint64_t> connects{0};
  std::atomic<uint64_t> chats{0};
  std::atomic<uint64_t> repeated_chats{0};   // same text surfaced twice: must stay 0
  std::atomic<uint64_t> disconnects{0};
  std::atomic<uint64_t> failures{0};
};

struct ClientTally {
  bool     logged_in{false};
  uint64_t answered{0};
  uint64_t refused{0};
  bool     failed{false};
};

// A closed command channel means the filter is already shutting down.
static bool submit(Filter& filter, FilterCmd cmd) {
  if (filter.cmd_channel()->send(std::move(cmd))) return true;
  NW_DEBUG("sim: {} filter no longer takes commands", to_string(filter.mode()));
  return false;
}

static json stats_to_json(const FilterStats& s) {
  return json{
      {"packets_sent",     s.packets_sent},
      {"retransmissions",  s.retransmissions},
      {"duplicates",       s.duplicates},
      {"out_of_order",     s.out_of_order},
      {"packets_acked",    s.packets_acked},
      {"malformed",        s.malformed},
      {"peer_rejections",  s.peer_rejections},
      {"endpoints_failed", s.endpoints_failed},
  };
}

// -----------------------------------------------------------------------------
// server_app(): the game server's side: answers until its notice channel closes.
// -----------------------------------------------------------------------------
static void server_app(Filter& server, ServerTally& tally) {
  auto notices = server.notice_channel();
  std::set<std::string> seen;

  FilterNotice n;
  while (notices->recv(n)) {
    if (const auto* req = std::get_if<filter_notice::NewRequestAction>(&n)) {
      if (std::holds_alternative<action::Connect>(req->action)) {
        ++tally.connects;
        submit(server, filter_cmd::SendResponseCode{req->endpoint, code::LoggedIn{"", ""}});
      } else if (const auto* chat = std::get_if<action::ChatMessage>(&req->action)) {
        ++tally.chats;
        if (!seen.insert(chat->message).second) ++tally.repeated_chats;
        submit(server, filter_cmd::SendResponseCode{req->endpoint, code::OK{}});
      } else if (std::holds_alternative<action::Disconnect>(req->action)) {
        ++tally.disconnects;
      } else {
        submit(server, filter_cmd::SendResponseCode{req->endpoint, code::BadRequest{"unsupported"}});
      }
    } else if (std::holds_alternative<filter_notice::EndpointFailed>(n)) {
      ++tally.failures;
    }
  }
}

// -----------------------------------------------------------------------------
// client_app(): log in, send N chats, wait for N answers (bounded by deadline).
// -----------------------------------------------------------------------------
static ClientTally client_app(Filter& client, const Endpoint& server_ep, const SimOptions& opt) {
  ClientTally tally;
  auto notices = client.notice_channel();
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(opt.timeout_s);

  auto next_notice = [&](FilterNotice& n) {
    while (std::chrono::steady_clock::now() < deadline) {
      if (notices->recv(n, 50ms)) return true;
      if (notices->is_closed()) return false;
    }
    return false;
  };

  if (!submit(client, filter_cmd::SendRequestAction{server_ep, action::Connect{"sim-client", "0.3.2"}})) {
    return tally;
  }

  // keep at most kWindow chats unanswered so neither side's channels fill up
  constexpr uint32_t kWindow = 16;
  uint32_t sent = 0;
  auto send_chat = [&] {
    submit(client, filter_cmd::SendRequestAction{
        server_ep, action::ChatMessage{"chat #" + std::to_string(sent)}});
    ++sent;
  };

  FilterNotice n;
  while (tally.answered < opt.requests && next_notice(n)) {
    if (const auto* f = std::get_if<filter_notice::EndpointFailed>(&n)) {
      NW_ERROR("client: server {} failed ({})", f->endpoint.to_string(), to_string(f->reason));
      tally.failed = true;
      break;
    }
    const auto* rsp = std::get_if<filter_notice::NewResponseCode>(&n);
    if (!rsp) continue;

    if (std::holds_alternative<code::LoggedIn>(rsp->code)) {
      tally.logged_in = true;
      while (sent < opt.requests && sent < kWindow) send_chat();
    } else if (std::holds_alternative<code::OK>(rsp->code)) {
      ++tally.answered;
      if (sent < opt.requests) send_chat();
    } else {
      ++tally.refused;
      NW_WARN("client: server answered {}", to_string(rsp->code));
      if (!tally.logged_in) break;
    }
  }

  if (tally.logged_in && !tally.failed) {
    submit(client, filter_cmd::SendRequestAction{server_ep, action::Disconnect{}});
  }
  return tally;
}

static void print_report(const json& report, bool as_json) {
  if (as_json) {
    std::cout << report.dump(2) << "\n";
    return;
  }
  const auto& c = report.at("client");
  std::cout << "requests  : " << report.at("requests") << "\n"
            << "answered  : " << c.at("answered") << (c.at("logged_in").get<bool>() ? "" : " (login failed)") << "\n"
            << "server    : " << report.at("server_app").dump() << "\n"
            << "link      : " << report.at("link").dump() << "\n"
            << "filter(s) : " << report.at("server_filter").dump() << "\n"
            << "filter(c) : " << report.at("client_filter").dump() << "\n"
            << "result    : " << (report.at("ok").get<bool>() ? "OK" : "FAILED") << "\n";
}

int main(int argc, char** argv) {
  SimOptions opt;

  CLI::App app{"netway-sim: drive a server and a client Filter over a lossy link"};
  app.add_option("-n,--requests", opt.requests, "Chat requests the client sends")->check(CLI::PositiveNumber);
  app.add_option("--loss", opt.link.loss, "Probability a datagram is lost")->check(CLI::Range(0.0, 1.0));
  app.add_option("--dup", opt.link.duplicate, "Probability a datagram is delivered twice")->check(CLI::Range(0.0, 1.0));
  app.add_option("--reorder", opt.link.reorder, "Probability a datagram is held back one slot")->check(CLI::Range(0.0, 1.0));
  app.add_option("--corrupt", opt.link.corrupt, "Probability a datagram is corrupted")->check(CLI::Range(0.0, 1.0));
  app.add_option("--seed", opt.link.seed, "Link random seed");
  app.add_option("-c,--config", opt.config_path, "FilterConfig JSON file")->check(CLI::ExistingFile);
  app.add_option("--timeout", opt.timeout_s, "Seconds to wait for all answers");
  app.add_option("--log-level", opt.log_level, "trace|debug|info|warn|error|off");
  app.add_flag("--json", opt.as_json, "Print the report as JSON");

  CLI11_PARSE(app, argc, argv);

  log::init(log::level_from_string(opt.log_level));

  FilterConfig cfg;
  if (!opt.config_path.empty()) {
    auto loaded = load_config(opt.config_path);
    if (!loaded) {
      std::cerr << "netway-sim: cannot use config '" << opt.config_path << "'\n";
      return 2;
    }
    cfg = *loaded;
  }
  NW_INFO("config: {}", config_to_json(cfg).dump());

  const Endpoint server_ep{"127.0.0.1", 7000};
  const Endpoint client_ep{"127.0.0.1", 7001};

  sim::LinkSide server_side{server_ep,
                            std::make_shared<TransportCmdChannel>(),
                            std::make_shared<TransportRspChannel>(),
                            std::make_shared<TransportNoticeChannel>()};
  sim::LinkSide client_side{client_ep,
                            std::make_shared<TransportCmdChannel>(),
                            std::make_shared<TransportRspChannel>(),
                            std::make_shared<TransportNoticeChannel>()};

  Filter server(server_side.cmd, server_side.rsp, server_side.notice, FilterMode::Server, cfg);
  Filter client(client_side.cmd, client_side.rsp, client_side.notice, FilterMode::Client, cfg);
  auto server_done = server.get_shutdown_watcher();
  auto client_done = client.get_shutdown_watcher();

  sim::LossyLink link(server_side, client_side, opt.link);
  link.start();

  ServerTally server_tally;
  std::thread server_engine([&server] { server.run(); });
  std::thread client_engine([&client] { client.run(); });
  std::thread server_thread([&server, &server_tally] { server_app(server, server_tally); });

  const ClientTally client_tally = client_app(client, server_ep, opt);

  submit(client, filter_cmd::Shutdown{true});
  client_done.wait();
  submit(server, filter_cmd::Shutdown{true});
  server_done.wait();

  client_engine.join();
  server_engine.join();
  server_thread.join();
  link.stop();

  const bool ok = client_tally.logged_in && !client_tally.failed &&
                  client_tally.answered == opt.requests &&
                  server_tally.repeated_chats.load() == 0;

  json report{
      {"requests", opt.requests},
      {"ok", ok},
      {"client", {{"logged_in", client_tally.logged_in},
                  {"answered", client_tally.answered},
                  {"refused", client_tally.refused},
                  {"failed", client_tally.failed}}},
      {"server_app", {{"connects", server_tally.connects.load()},
                      {"chats", server_tally.chats.load()},
                      {"repeated_chats", server_tally.repeated_chats.load()},
                      {"disconnects", server_tally.disconnects.load()},
                      {"failures", server_tally.failures.load()}}},
      {"link", link.report()},
      {"server_filter", stats_to_json(server.stats())},
      {"client_filter", stats_to_json(client.stats())},
  };
  print_report(report, opt.as_json);
  return ok ? 0 : 1;
}

#include <fmt/core.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/json.hpp>
#include <csignal>
#include <cstdio>
#include <exception>
#include <future>
#include <iostream>
#include <span>
#include <thread>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "stdio.hpp"
#include "tether/agent.hpp"
#include "tether/coordinator.hpp"
#include "tether/dispatcher.hpp"
#include "tether/local_client.hpp"
#include "tether/model.hpp"
#include "web.hpp"

namespace net = boost::asio;
namespace json = boost::json;

namespace {

auto log_failure(const char* what) {
  return [what](std::exception_ptr e) {
    if (!e) return;
    try {
      std::rethrow_exception(e);
    } catch (const std::exception& ex) {
      LOG_ERROR("{} failed: {}", what, ex.what());
    }
  };
}

/// Prints what a local session would have streamed to an editor.
void print_update(const std::string& /*session_id*/, const json::object& update) {
  auto kind = tether::get_string(update, "sessionUpdate").value_or("");
  if (kind == "agent_message_chunk") {
    if (const auto* content = tether::get_object(update, "content"))
      fmt::print("{}", tether::get_string(*content, "text").value_or(""));
    std::fflush(stdout);
  } else if (kind == "tool_call") {
    fmt::println(stderr, "[{}] {}", tether::get_string(update, "toolCallId").value_or("?"),
                 tether::get_string(update, "title").value_or(""));
  } else if (kind == "tool_call_update") {
    if (auto status = tether::get_string(update, "status"); status && *status != "in_progress")
      fmt::println(stderr, "[{}] {}", tether::get_string(update, "toolCallId").value_or("?"),
                   *status);
  }
}

int run_ask(const tether::server_config& cfg) {
  net::io_context io{1};
  auto work = net::make_work_guard(io);
  std::thread io_thread{[&io] { io.run(); }};

  int retval = 0;
  try {
    tether::coordinator coord{cfg.coordinator()};
    tether::agent ag{io.get_executor(), coord, tether::make_model(cfg.model), cfg.agent()};

    auto local = std::make_shared<tether::local_client>(cfg.workspace, print_update);
    auto client_id = coord.register_client(local);
    auto created = coord.new_session(tether::fs::absolute(cfg.workspace).string(), client_id);

    net::signal_set signals{io, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code& ec, int) {
      if (ec) return;
      try {
        ag.cancel(created.session_id, client_id);
      } catch (const std::exception& e) {
        LOG_WARN("cancel: {}", e.what());
      }
    });

    std::promise<std::string> finished;
    ag.prompt(
        created.session_id, client_id, *cfg.ask_prompt,
        [&finished](std::string reason, std::exception_ptr error) {
          if (error)
            finished.set_exception(error);
          else
            finished.set_value(std::move(reason));
        });
    auto reason = finished.get_future().get();
    fmt::println("");
    LOG_INFO("stop reason: {}", reason);
    if (reason == tether::stop_reason::cancelled) retval = 130;

    signals.cancel();
    coord.unregister_client(client_id, false);
  } catch (const std::exception& e) {
    fmt::println(stderr, "Error: {}", e.what());
    retval = 1;
  }

  work.reset();
  io.stop();
  io_thread.join();
  return retval;
}

int run_server(const tether::server_config& cfg) {
  net::io_context io{1};
  tether::coordinator coord{cfg.coordinator()};
  tether::agent ag{io.get_executor(), coord, tether::make_model(cfg.model), cfg.agent()};
  tether::dispatcher disp{coord, ag};

  // stdout may be the stdio transport
  fmt::println(stderr, "{} {}: model {}", tether::server_name, tether::server_version,
               ag.model_name());

  net::co_spawn(io, coord.run_sweeper(), log_failure("sweeper"));

  int retval = 0;
  if (cfg.web) {
    tether::web_options wopts{
      {net::ip::make_address(cfg.host), cfg.port},
      std::chrono::seconds{cfg.idle_timeout},
    };
    fmt::println(stderr, "  listening on ws://{}:{}/ws", cfg.host, cfg.port);
    fmt::println(stderr, "  status at    http://{}:{}/api/status", cfg.host, cfg.port);
    net::co_spawn(
        io, tether::serve_web(io, coord, disp, wopts),
        [&](std::exception_ptr e) {
          log_failure("web server")(e);
          if (e) {
            retval = 1;
            io.stop();
          }
        });
  }
  if (cfg.stdio) {
    fmt::println(stderr, "  serving one client on stdio");
    net::co_spawn(
        io, tether::serve_stdio(io, coord, disp),
        [&](std::exception_ptr e) {
          log_failure("stdio")(e);
          // Without a listener there is nobody left to serve
          if (!cfg.web) io.stop();
        });
  }
  fmt::println(stderr, "  press Ctrl-C to stop");

  net::signal_set signals{io, SIGINT, SIGTERM};
  signals.async_wait([&](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    LOG_INFO("caught signal {}, stopping", sig);
    io.stop();
  });

  io.run();
  ag.shutdown();
  LOG_INFO("{} sessions left at exit", coord.stats().sessions);
  return retval;
}

}  // namespace

int main(int argc, char* argv[]) {
  tether::server_config cfg{};

  auto done = tether::parse_options(std::span(argv, argc), cfg);
  if (done) return done.value();

  tether::logger::set_level(static_cast<tether::logger::level>(cfg.loglevel));
  LOG_DEBUG("loglevel={}", cfg.loglevel);

  try {
    if (cfg.ask_prompt) return run_ask(cfg);
    return run_server(cfg);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
}

#include "options.hpp"

#include <CLI/CLI.hpp>
#include <iostream>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tether {

coordinator_config server_config::coordinator() const {
  coordinator_config c;
  c.grace = std::chrono::seconds{grace_period};
  c.sweep_interval = std::chrono::seconds{sweep_interval};
  return c;
}

agent_config server_config::agent() const {
  agent_config a;
  a.max_steps = max_steps;
  a.turn_threads = turn_threads;
  a.limits.wall_clock = std::chrono::seconds{execution_timeout};
  a.host_call_timeout = std::chrono::seconds{host_call_timeout};
  return a;
}

std::optional<int> parse_options(std::span<char*> args, server_config& cfg) {
  CLI::App app{"Coding agent server speaking JSONRPC over stdio and WebSocket"};

  app.set_config("--config", "", "Read options from an INI or TOML file");

  app.add_flag(
      "--stdio,!--no-stdio", cfg.stdio,
      "Serve one client on stdin/stdout")
    ->envname("TETHER_STDIO")
    ->capture_default_str();
  app.add_flag(
      "--web", cfg.web,
      "Serve WebSocket clients on /ws and status on /api/status")
    ->envname("TETHER_WEB")
    ->capture_default_str();
  app.add_option(
      "--host", cfg.host,
      "HTTP bind address")
    ->envname("TETHER_HOST")
    ->capture_default_str();
  app.add_option(
      "-p,--port", cfg.port,
      "HTTP port")
    ->envname("TETHER_PORT")
    ->capture_default_str();
  app.add_option(
      "--idle-timeout", cfg.idle_timeout,
      "Close WebSocket connections idle for this many seconds (0=never)")
    ->envname("TETHER_IDLE_TIMEOUT")
    ->check(CLI::NonNegativeNumber)
    ->capture_default_str();

  app.add_option(
      "--grace-period", cfg.grace_period,
      "Seconds a disconnected client may take to resume its sessions")
    ->envname("TETHER_GRACE_PERIOD")
    ->check(CLI::NonNegativeNumber)
    ->capture_default_str();
  app.add_option(
      "--sweep-interval", cfg.sweep_interval,
      "Seconds between sweeps of expired disconnected clients")
    ->envname("TETHER_SWEEP_INTERVAL")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();

  app.add_option(
      "-m,--model", cfg.model.kind,
      "Model backend")
    ->envname("TETHER_MODEL")
    ->check(CLI::IsMember({"echo", "openai"}))
    ->capture_default_str();
  app.add_option(
      "--model-url", cfg.model.openai.base_url,
      "Base URL of the OpenAI-compatible endpoint")
    ->envname("TETHER_MODEL_URL")
    ->capture_default_str();
  app.add_option(
      "--model-name", cfg.model.openai.model,
      "Model name sent to the endpoint")
    ->envname("TETHER_MODEL_NAME")
    ->capture_default_str();
  app.add_option(
      "--api-key", cfg.model.openai.api_key,
      "Bearer token for the endpoint")
    ->envname("TETHER_API_KEY");
  app.add_option(
      "--temperature", cfg.model.openai.temperature,
      "Sampling temperature")
    ->envname("TETHER_TEMPERATURE")
    ->capture_default_str();

  app.add_option(
      "--max-steps", cfg.max_steps,
      "Model requests per turn")
    ->envname("TETHER_MAX_STEPS")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  app.add_option(
      "--turn-threads", cfg.turn_threads,
      "Turns that may run at once")
    ->envname("TETHER_TURN_THREADS")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  app.add_option(
      "--execution-timeout", cfg.execution_timeout,
      "Seconds one code block may run")
    ->envname("TETHER_EXECUTION_TIMEOUT")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  app.add_option(
      "--host-call-timeout", cfg.host_call_timeout,
      "Seconds to wait for a client to answer a request")
    ->envname("TETHER_HOST_CALL_TIMEOUT")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();

  app.add_option(
      "-d, --debug",
      cfg.loglevel,
      "Debug log level (3=INFO)")
    ->envname("TETHER_LOG_LEVEL")
    ->capture_default_str();

  auto* ask = app.add_subcommand("ask", "Answer one prompt against a local workspace and exit");
  std::string prompt;
  ask->add_option("prompt", prompt, "Question or instruction")->required();
  ask->add_option(
      "-w,--workspace", cfg.workspace,
      "Workspace directory")
    ->check(CLI::ExistingDirectory)
    ->capture_default_str();

  try {
    app.parse(std::vector<std::string>(args.begin() + 1, args.end()));
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  if (ask->parsed()) cfg.ask_prompt = prompt;
  if (!cfg.ask_prompt && !cfg.stdio && !cfg.web) {
    std::cerr << "nothing to serve: pass --stdio or --web\n";
    return 2;
  }
  return std::nullopt;
}

}  // namespace tether

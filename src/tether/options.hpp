#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

#include "tether/agent.hpp"
#include "tether/coordinator.hpp"
#include "tether/model.hpp"

namespace tether {

namespace fs = std::filesystem;

struct server_config {
  bool stdio{true};
  bool web{false};
  std::string host{"127.0.0.1"};
  std::uint16_t port{8000};
  int idle_timeout{300};  // seconds, 0 disables

  int grace_period{300};
  int sweep_interval{60};

  model_options model{};

  std::size_t max_steps{8};
  std::size_t turn_threads{4};
  int execution_timeout{60};
  int host_call_timeout{30};

  int loglevel{3};

  // tether ask PROMPT
  std::optional<std::string> ask_prompt{};
  fs::path workspace{fs::current_path()};

  [[nodiscard]] coordinator_config coordinator() const;
  [[nodiscard]] agent_config agent() const;
};

/// Fill @p cfg from @p args, the environment and an optional config
/// file.  Returns an exit code when the program should stop right away.
std::optional<int> parse_options(std::span<char*> args, server_config& cfg);

}  // namespace tether

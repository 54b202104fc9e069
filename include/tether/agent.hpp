#pragma once

/**
 * @file agent.hpp
 * @brief The prompt turn loop.
 *
 * A turn alternates between the model and the sandbox: the model's text
 * is streamed to the session owner, code blocks found in it are run with
 * the session's toolset, and their output is fed back as the next user
 * message.  Turns run on a private thread pool, never on the protocol
 * thread; the only way they reach a client is through the coordinator's
 * routing and the host bridge.
 */

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "tether/cancellation.hpp"
#include "tether/coordinator.hpp"
#include "tether/model.hpp"
#include "tether/sandbox.hpp"
#include "tether/toolset.hpp"

namespace tether {

namespace net = boost::asio;

struct agent_config {
  std::size_t max_steps{8};
  std::size_t turn_threads{4};
  sandbox::limits limits{};
  std::chrono::milliseconds host_call_timeout{std::chrono::seconds{30}};
  std::chrono::milliseconds cancel_grace{std::chrono::seconds{5}};
};

/// A second prompt arrived while the session's turn was still running.
struct turn_in_progress : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Stop reasons
namespace stop_reason {
inline constexpr std::string_view end_turn{"end_turn"};
inline constexpr std::string_view max_turn_requests{"max_turn_requests"};
inline constexpr std::string_view cancelled{"cancelled"};
}  // namespace stop_reason

class agent {
 public:
  using done_fn = std::function<void(std::string stop_reason, std::exception_ptr error)>;

  agent(
      net::io_context::executor_type io, coordinator& coord,
      std::shared_ptr<model> m, agent_config config = {},
      std::shared_ptr<code_navigator> navigator = {});

  agent(const agent&) = delete;
  agent& operator=(const agent&) = delete;
  ~agent();

  /** @brief Start a turn for @p client_id's session.
   *
   * Throws session_error or turn_in_progress right away; otherwise @p done
   * is called from a turn thread with the stop reason once the turn ends.
   */
  void prompt(
      const std::string& session_id, const std::string& client_id,
      std::string text, done_fn done);

  /// Trip the running turn, if any.  Throws session_error.
  bool cancel(const std::string& session_id, const std::string& client_id);

  /// Run one turn on the calling thread and return its stop reason.
  std::string run_turn(
      const std::shared_ptr<session_state>& session, const std::string& text,
      const cancel_token& token);

  /// Cancel every running turn and wait for the pool.
  void shutdown();

  [[nodiscard]] std::string model_name() const { return model_->name(); }
  [[nodiscard]] const agent_config& config() const { return config_; }

  /// Code blocks in a model reply, in order.
  static std::vector<std::string> extract_code(std::string_view reply);

  /// The system message that opens every conversation.
  static std::string system_prompt();

 private:
  void execute_block(
      const std::shared_ptr<session_state>& session, tool_call_reporter& reporter,
      const std::string& code, const cancel_token& token, std::string& feedback,
      bool& cancelled);

  /// Coordinator handle captured by sandbox workers.  Closed on shutdown,
  /// so a worker abandoned past its grace routes to nobody.
  struct route_link {
    explicit route_link(coordinator& c) : coord{&c} {}
    std::shared_ptr<client> route(const std::string& session_id);
    void close();

    std::mutex mutex;
    coordinator* coord;
  };

  net::io_context::executor_type io_;
  coordinator& coord_;
  std::shared_ptr<route_link> link_;
  std::shared_ptr<model> model_;
  agent_config config_;
  std::shared_ptr<code_navigator> navigator_;
  sandbox::executor executor_;
  std::mutex active_mutex_;
  std::map<std::string, cancel_token> active_;
  bool stopped_{false};
  net::thread_pool pool_;
};

/// The history entry a user prompt becomes.
json::object user_message(std::string_view text);

}  // namespace tether

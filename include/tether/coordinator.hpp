#pragma once

/**
 * @file coordinator.hpp
 * @brief Connections, sessions, ownership and resume tokens.
 *
 * The coordinator is the single source of truth for which connection
 * owns which session.  Every transport registers its connections here,
 * and every notification is routed through @ref coordinator::route at
 * send time, so a session that has been resumed on a new connection
 * streams to the new owner from then on.
 *
 * A connection that drops may leave its sessions behind for a grace
 * period.  During that window a client holding a session's resume token
 * can claim it from another connection; afterwards the background sweep
 * deletes it.  All state sits behind one mutex.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "tether/cancellation.hpp"
#include "tether/client.hpp"

namespace tether {

namespace json = boost::json;

/// Errors

enum class session_errc {
  session_not_found = 1,
  invalid_token,
  not_disconnected,
  grace_period_expired,
  access_denied,
  unknown_client,
};

std::string_view to_string(session_errc e);

class session_error : public std::runtime_error {
 public:
  session_error(session_errc code, const std::string& what)
      : std::runtime_error{what}, code_{code} {}

  [[nodiscard]] session_errc code() const { return code_; }
  [[nodiscard]] std::string_view kind() const { return to_string(code_); }

  /// JSONRPC server error code, -32001 .. -32006
  [[nodiscard]] int rpc_code() const { return -32000 - static_cast<int>(code_); }

 private:
  session_errc code_;
};

/// Session state

/// Mutable per-session data shared with the agent turn loop.  Guarded by
/// its own mutex, never by the coordinator's.
struct session_state {
  std::string id;
  std::string cwd;
  std::chrono::system_clock::time_point created;

  std::mutex mutex;
  std::string mode_id{"default"};
  json::array history;
  std::optional<cancel_token> turn;
  std::uint64_t tool_calls{0};
  bool greeted{false};
};

struct new_session_result {
  std::string session_id;
  std::string resume_token;
  std::shared_ptr<session_state> state;
};

struct session_info {
  std::string session_id;
  std::string cwd;
  std::string mode_id;
  std::string owner;
};

struct coordinator_stats {
  std::size_t clients{0};
  std::size_t disconnected{0};
  std::size_t sessions{0};
};

struct coordinator_config {
  std::chrono::seconds grace{300};
  std::chrono::seconds sweep_interval{60};
};

/** @brief Session registry.
 *
 * Thread-safe.  Connections are held as @c shared_ptr<client> and
 * dropped when their client unregisters.
 */
class coordinator {
 public:
  using clock = std::chrono::steady_clock;
  using now_fn = std::function<clock::time_point()>;

  explicit coordinator(coordinator_config config = {}, now_fn now = {});

  coordinator(const coordinator&) = delete;
  coordinator& operator=(const coordinator&) = delete;

  /// Returns a fresh "client-N" id.
  std::string register_client(std::shared_ptr<client> connection);

  /// Throws session_error(unknown_client).
  new_session_result new_session(std::string cwd, const std::string& client_id);

  /// The connection currently entitled to notifications for @p session_id,
  /// or nullptr while its owner is disconnected or the session is gone.
  std::shared_ptr<client> route(const std::string& session_id) const;

  /** @brief Forget a connection.
   *
   * With @p allow_reconnect its sessions are kept for the grace period;
   * otherwise they are deleted now.  Unknown ids are logged and ignored.
   */
  void unregister_client(const std::string& client_id, bool allow_reconnect = true);

  /** @brief Move a disconnected owner's session to @p new_client_id.
   *
   * Throws session_error with session_not_found, invalid_token,
   * unknown_client, not_disconnected or grace_period_expired.  On
   * success the former owner's other sessions are released.
   */
  std::shared_ptr<session_state> resume_session(
      const std::string& session_id, std::string_view token,
      const std::string& new_client_id);

  /// Delete everything left by clients whose grace has run out.  Returns
  /// the number of sessions removed.
  std::size_t sweep_expired();

  /// Sweep every sweep_interval until the executor stops.
  boost::asio::awaitable<void> run_sweeper();

  /// Ownership check; throws session_not_found or access_denied.
  std::shared_ptr<session_state> authorize(
      const std::string& session_id, const std::string& client_id) const;

  std::vector<session_info> list_sessions(const std::string& client_id) const;

  void set_session_mode(
      const std::string& session_id, const std::string& client_id,
      std::string mode_id);

  std::shared_ptr<session_state> find_session(const std::string& session_id) const;

  [[nodiscard]] bool is_registered(const std::string& client_id) const;

  coordinator_stats stats() const;

  [[nodiscard]] const coordinator_config& config() const { return config_; }

 private:
  struct session_record {
    std::shared_ptr<session_state> state;
    std::string owner;
    std::string token;
  };

  /// Caller holds mutex_
  std::size_t drop_sessions_of(const std::string& client_id);
  std::size_t expire_locked(const std::string& client_id);

  coordinator_config config_;
  now_fn now_;

  mutable std::mutex mutex_;
  std::uint64_t next_client_{0};
  std::uint64_t next_session_{0};
  std::map<std::string, std::shared_ptr<client>> clients_;
  std::map<std::string, clock::time_point> disconnected_;
  std::map<std::string, session_record> sessions_;
};

/// 32 random bytes, base64url without padding.
std::string make_resume_token();

}  // namespace tether

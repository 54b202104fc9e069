#pragma once

/**
 * @file dispatcher.hpp
 * @brief JSONRPC method dispatch shared by every transport.
 *
 * Transports hand each received text frame to @ref dispatcher::handle_frame
 * together with the connection it came from.  Responses go back on that
 * connection; responses to requests the server sent resolve the
 * connection's pending map instead.  Errors never close a connection.
 */

#include <boost/json.hpp>
#include <memory>
#include <string_view>

#include "tether/agent.hpp"
#include "tether/connection.hpp"
#include "tether/coordinator.hpp"

namespace tether {

namespace json = boost::json;

inline constexpr std::string_view server_name{"tether"};
inline constexpr std::string_view server_version{"0.1.0"};
inline constexpr int protocol_version{1};

class dispatcher {
 public:
  dispatcher(coordinator& coord, agent& ag) : coord_{coord}, agent_{ag} {}

  /// Returns false once the peer has asked to shut down.
  bool handle_frame(const std::shared_ptr<connection>& conn, std::string_view text);

  /// Summary served at @c /api/status.
  [[nodiscard]] json::object status() const;

 private:
  json::value handle_initialize(const json::object& params);
  json::value handle_new_session(const connection& conn, const json::object& params);
  json::value handle_resume_session(const connection& conn, const json::object& params);
  json::value handle_cancel(const connection& conn, const json::object& params);
  json::value handle_list_sessions(const connection& conn);
  json::value handle_set_session_mode(const connection& conn, const json::object& params);
  void handle_prompt(
      const std::shared_ptr<connection>& conn, const json::value& id,
      const json::object& params);

  coordinator& coord_;
  agent& agent_;
};

}  // namespace tether

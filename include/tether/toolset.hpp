#pragma once

/**
 * @file toolset.hpp
 * @brief Host functions handed to sandboxed code for one session.
 *
 * @ref make_toolset binds the tool surface to a session: file access and
 * commands go to whichever client currently owns it, through a
 * @ref host_bridge; the typed tools run their binaries in a client
 * terminal and parse the output with the parsers in tools.hpp.  Every
 * call is reported to the owner as a tool call.
 */

#include <boost/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "tether/bridge.hpp"
#include "tether/client.hpp"
#include "tether/coordinator.hpp"
#include "tether/sandbox.hpp"

namespace tether {

namespace json = boost::json;

/// Language-server queries.  Positions are 1-based; results are the raw
/// LSP response payloads.
class code_navigator {
 public:
  code_navigator() = default;
  code_navigator(const code_navigator&) = delete;
  code_navigator& operator=(const code_navigator&) = delete;
  virtual ~code_navigator() = default;

  virtual json::value definition(const std::string& file, int line, int column) = 0;
  virtual json::value references(const std::string& file, int line, int column) = 0;
  virtual json::value hover(const std::string& file, int line, int column) = 0;
  virtual json::value document_symbols(const std::string& file) = 0;
  virtual json::value workspace_symbols(const std::string& query) = 0;
};

/// The session's current owner, or nullptr while it is disconnected.
using owner_fn = std::function<std::shared_ptr<client>()>;

/** @brief Emits the tool call lifecycle of one session.
 *
 * Every update is routed at send time, so a resumed session reports to
 * its new owner.  Updates for a session without an owner are dropped.
 */
class tool_call_reporter {
 public:
  tool_call_reporter(std::shared_ptr<session_state> session, owner_fn owner)
      : session_{std::move(session)}, owner_{std::move(owner)} {}

  /// Announce a call as pending and return its id.
  std::string start(std::string_view title, std::string_view kind, json::value raw_input);

  void in_progress(const std::string& id);
  void completed(const std::string& id, json::value raw_output);
  void failed(const std::string& id, std::string_view message);

  /// Free-form message to the session, e.g. model text.
  void message_chunk(std::string_view text);

  [[nodiscard]] const std::string& session_id() const { return session_->id; }

 private:
  void emit(json::object update);

  std::shared_ptr<session_state> session_;
  owner_fn owner_;
};

struct toolset_context {
  std::shared_ptr<session_state> session;
  owner_fn owner;
  host_bridge bridge;
  std::shared_ptr<code_navigator> navigator{};
};

/// The full host function bundle for one execution in @p ctx's session.
sandbox::external_functions make_toolset(const toolset_context& ctx);

/// Python stubs of the host functions, shown to the model.
std::string_view toolset_stubs();

}  // namespace tether

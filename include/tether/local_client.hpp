#pragma once

/**
 * @file local_client.hpp
 * @brief The client capability served from this machine.
 *
 * Used when there is no driving client, e.g. @c tether @c ask: files are
 * read and written under a workspace root, which paths may not escape,
 * and terminals are child processes whose stdout and stderr are merged.
 * Session updates go to an optional sink.
 */

#include <boost/json.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "tether/client.hpp"

namespace tether {

namespace json = boost::json;

struct workspace_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

class local_client : public client {
 public:
  using update_sink = std::function<void(const std::string& session_id, const json::object& update)>;

  explicit local_client(
      std::filesystem::path workspace, update_sink sink = {},
      std::size_t output_byte_limit = 1U << 20U);
  ~local_client() override;

  /// Absolute path of @p path inside the workspace.  Throws
  /// workspace_error when it resolves outside.
  [[nodiscard]] std::filesystem::path resolve(const std::string& path) const;

  void session_update(const std::string& session_id, json::object update) override;

  pending<std::string> read_text_file(
      const std::string& session_id, const std::string& path) override;

  pending<void> write_text_file(
      const std::string& session_id, const std::string& path,
      const std::string& content) override;

  pending<std::string> create_terminal(
      const std::string& session_id, const command_spec& cmd) override;

  pending<terminal_exit> wait_for_terminal_exit(
      const std::string& session_id, const std::string& terminal_id) override;

  pending<terminal_output> read_terminal_output(
      const std::string& session_id, const std::string& terminal_id) override;

  pending<void> release_terminal(
      const std::string& session_id, const std::string& terminal_id) override;

  pending<void> kill_terminal(
      const std::string& session_id, const std::string& terminal_id) override;

  [[nodiscard]] std::size_t terminal_count() const;

 private:
  struct terminal;

  std::shared_ptr<terminal> find(const std::string& terminal_id) const;

  std::filesystem::path workspace_;
  update_sink sink_;
  std::size_t output_byte_limit_;

  mutable std::mutex mutex_;
  std::uint64_t next_terminal_{0};
  std::map<std::string, std::shared_ptr<terminal>> terminals_;
};

}  // namespace tether

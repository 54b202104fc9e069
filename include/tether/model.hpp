#pragma once

/**
 * @file model.hpp
 * @brief Language models that drive a turn.
 *
 * A conversation is a JSON array of @c {"role", "content"} objects in
 * the chat-completions shape.  Models are shared between sessions and
 * must be callable from several turn threads at once.
 */

#include <boost/json.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "tether/cancellation.hpp"

namespace tether {

namespace json = boost::json;

struct model_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

class model {
 public:
  model() = default;
  model(const model&) = delete;
  model& operator=(const model&) = delete;
  virtual ~model() = default;

  [[nodiscard]] virtual std::string name() const = 0;

  /// Next assistant message for @p messages.  Throws model_error.
  virtual std::string complete(const json::array& messages, const cancel_token& token) = 0;
};

/// Answers with the last message it was given.
class echo_model : public model {
 public:
  [[nodiscard]] std::string name() const override { return "echo"; }
  std::string complete(const json::array& messages, const cancel_token& token) override;
};

struct openai_config {
  std::string base_url{"http://127.0.0.1:8080"};
  std::string model{"default"};
  std::string api_key{};
  double temperature{0.0};
  std::chrono::seconds timeout{120};
};

/// Plain-HTTP client for an OpenAI-compatible @c /v1/chat/completions
/// endpoint, such as a local inference server.
class openai_model : public model {
 public:
  explicit openai_model(openai_config config);

  [[nodiscard]] std::string name() const override;
  std::string complete(const json::array& messages, const cancel_token& token) override;

  /// The request body sent for @p messages.
  [[nodiscard]] json::object make_request_body(const json::array& messages) const;

  /// The assistant text of a chat-completions response body.
  static std::string parse_response_body(std::string_view body);

 private:
  openai_config config_;
  std::string host_;
  std::string port_;
  std::string path_;
};

struct model_options {
  std::string kind{"echo"};
  openai_config openai{};
};

/// Throws std::invalid_argument for an unknown kind.
std::shared_ptr<model> make_model(const model_options& opts);

}  // namespace tether

#include "tether/dispatcher.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "tether/jsonrpc.hpp"

namespace tether {

namespace {

struct bad_params : std::runtime_error {
  using std::runtime_error::runtime_error;
};

std::string required(const json::object& params, std::string_view key) {
  auto v = get_string(params, key);
  if (!v) throw bad_params{fmt::format("missing string parameter '{}'", key)};
  return *v;
}

/// Text of a prompt: a plain string or a list of content blocks.
std::string prompt_text(const json::object& params) {
  const auto* prompt = find_value(params, "prompt");
  if (!prompt) throw bad_params{"missing parameter 'prompt'"};
  if (const auto* s = prompt->if_string()) return std::string{*s};

  const auto* blocks = prompt->if_array();
  if (!blocks) throw bad_params{"'prompt' must be a string or a list of content blocks"};
  std::string text;
  for (const auto& b : *blocks) {
    const auto* block = b.if_object();
    if (!block) continue;
    auto type = get_string(*block, "type").value_or("text");
    if (type == "text") {
      if (!text.empty()) text += "\n";
      text += get_string(*block, "text").value_or("");
    } else if (type == "resource") {
      // Embedded file contents
      if (const auto* res = get_object(*block, "resource")) {
        if (auto t = get_string(*res, "text")) {
          if (!text.empty()) text += "\n";
          text += fmt::format(
              "<file uri=\"{}\">\n{}\n</file>", get_string(*res, "uri").value_or(""), *t);
        }
      }
    } else if (type == "resource_link") {
      if (auto uri = get_string(*block, "uri")) {
        if (!text.empty()) text += "\n";
        text += fmt::format("@{}", *uri);
      }
    }
  }
  return text;
}

json::object session_error_data(const session_error& e) {
  json::object data;
  data["kind"] = e.kind();
  return data;
}

json::object modes(const std::string& current) {
  json::array available;
  for (std::string_view id : {"default", "plan"}) {
    json::object m;
    m["id"] = id;
    m["name"] = id == "default" ? "Default" : "Plan";
    available.push_back(std::move(m));
  }
  json::object o;
  o["current_mode_id"] = current;
  o["available_modes"] = std::move(available);
  return o;
}

}  // namespace

/// Handlers

json::value dispatcher::handle_initialize(const json::object& params) {
  auto requested = get_int(params, "protocol_version");
  if (const auto* caps = get_object(params, "client_capabilities"))
    LOG_DEBUG("client capabilities: {}", json::serialize(*caps));

  json::object info;
  info["name"] = server_name;
  info["version"] = server_version;

  json::object prompt_caps;
  prompt_caps["image"] = false;
  prompt_caps["audio"] = false;
  prompt_caps["embedded_context"] = true;

  json::object caps;
  caps["load_session"] = false;
  caps["resume_session"] = true;
  caps["prompt_capabilities"] = std::move(prompt_caps);

  json::object result;
  result["protocol_version"] =
      requested ? std::min<std::int64_t>(*requested, protocol_version) : protocol_version;
  result["agent_info"] = std::move(info);
  result["agent_capabilities"] = std::move(caps);
  result["model"] = agent_.model_name();
  return result;
}

json::value dispatcher::handle_new_session(const connection& conn, const json::object& params) {
  auto cwd = required(params, "cwd");
  if (const auto* servers = get_array(params, "tool_servers"); servers && !servers->empty())
    LOG_INFO("ignoring {} tool server(s) offered by {}", servers->size(), conn.client_id());

  auto created = coord_.new_session(cwd, conn.client_id());
  json::object result;
  result["session_id"] = created.session_id;
  result["resume_token"] = created.resume_token;
  result["modes"] = modes("default");
  return result;
}

json::value dispatcher::handle_resume_session(
    const connection& conn, const json::object& params) {
  auto session_id = required(params, "session_id");
  auto token = required(params, "resume_token");
  auto cwd = get_string(params, "cwd");

  auto state = coord_.resume_session(session_id, token, conn.client_id());
  std::lock_guard lock{state->mutex};
  if (cwd && *cwd != state->cwd)
    LOG_WARN("{}: resumed with cwd {}, keeping {}", session_id, *cwd, state->cwd);

  json::object result;
  result["session_id"] = state->id;
  result["cwd"] = state->cwd;
  result["resumed"] = true;
  result["modes"] = modes(state->mode_id);
  return result;
}

json::value dispatcher::handle_cancel(const connection& conn, const json::object& params) {
  auto session_id = required(params, "session_id");
  json::object result;
  result["cancelled"] = agent_.cancel(session_id, conn.client_id());
  return result;
}

json::value dispatcher::handle_list_sessions(const connection& conn) {
  json::array sessions;
  for (const auto& s : coord_.list_sessions(conn.client_id())) {
    json::object o;
    o["session_id"] = s.session_id;
    o["cwd"] = s.cwd;
    o["mode_id"] = s.mode_id;
    sessions.push_back(std::move(o));
  }
  json::object result;
  result["sessions"] = std::move(sessions);
  return result;
}

json::value dispatcher::handle_set_session_mode(
    const connection& conn, const json::object& params) {
  auto session_id = required(params, "session_id");
  auto mode_id = required(params, "mode_id");
  coord_.set_session_mode(session_id, conn.client_id(), mode_id);
  return json::object{};
}

void dispatcher::handle_prompt(
    const std::shared_ptr<connection>& conn, const json::value& id,
    const json::object& params) {
  auto session_id = required(params, "session_id");
  auto text = prompt_text(params);

  std::weak_ptr<connection> weak = conn;
  agent_.prompt(
      session_id, conn->client_id(), std::move(text),
      [weak, id](std::string reason, std::exception_ptr error) {
        auto c = weak.lock();
        if (!c || id.is_null()) return;
        if (!error) {
          json::object result;
          result["stop_reason"] = reason;
          c->send(jsonrpc::make_result(id, std::move(result)));
          return;
        }
        try {
          std::rethrow_exception(error);
        } catch (const std::exception& e) {
          c->send(jsonrpc::make_error(id, jsonrpc::internal_error, e.what()));
        }
      });
}

/// Frames

bool dispatcher::handle_frame(const std::shared_ptr<connection>& conn, std::string_view text) {
  json::value msg_val{};
  {
    std::error_code jec{};
    msg_val = json::parse(text, jec);
    if (jec) {
      conn->send(jsonrpc::make_error(nullptr, jsonrpc::parse_error, "Parse error"));
      return true;
    }
  }

  auto* msg = msg_val.if_object();
  if (!msg) {
    conn->send(jsonrpc::make_error(nullptr, jsonrpc::invalid_request, "Invalid Request"));
    return true;
  }

  if (jsonrpc::is_response(*msg)) {
    conn->handle_response(*msg);
    return true;
  }

  const json::value* id_ptr = find_value(*msg, "id");
  bool notification = id_ptr == nullptr;
  json::value id = id_ptr ? *id_ptr : json::value{nullptr};

  auto method_opt = get_string(*msg, "method");
  if (!method_opt || get_string(*msg, "jsonrpc") != jsonrpc::version) {
    conn->send(jsonrpc::make_error(id, jsonrpc::invalid_request, "Invalid Request"));
    return true;
  }
  const auto& method = *method_opt;

  json::object empty_params{};
  const json::object* params_ptr = get_object(*msg, "params");
  const json::object& params = params_ptr ? *params_ptr : empty_params;

  LOG_INFO("{} rpc: {}", conn->client_id(), method);

  auto reply = [&](json::object response) {
    if (!notification) conn->send(std::move(response));
  };

  try {
    if (method == "initialize") {
      reply(jsonrpc::make_result(id, handle_initialize(params)));
    } else if (method == "new_session") {
      reply(jsonrpc::make_result(id, handle_new_session(*conn, params)));
    } else if (method == "resume_session") {
      reply(jsonrpc::make_result(id, handle_resume_session(*conn, params)));
    } else if (method == "prompt") {
      handle_prompt(conn, id, params);
    } else if (method == "cancel") {
      reply(jsonrpc::make_result(id, handle_cancel(*conn, params)));
    } else if (method == "list_sessions") {
      reply(jsonrpc::make_result(id, handle_list_sessions(*conn)));
    } else if (method == "set_session_mode") {
      reply(jsonrpc::make_result(id, handle_set_session_mode(*conn, params)));
    } else if (method == "shutdown") {
      reply(jsonrpc::make_result(id, nullptr));
      return false;
    } else {
      reply(jsonrpc::make_error(
          id, jsonrpc::internal_error, fmt::format("Unknown method: {}", method)));
    }
  } catch (const session_error& e) {
    LOG_INFO("{} {}: {}", conn->client_id(), method, e.what());
    reply(jsonrpc::make_error(id, e.rpc_code(), e.what(), session_error_data(e)));
  } catch (const bad_params& e) {
    reply(jsonrpc::make_error(id, jsonrpc::invalid_params, e.what()));
  } catch (const std::exception& e) {
    LOG_WARN("{} {} failed: {}", conn->client_id(), method, e.what());
    reply(jsonrpc::make_error(id, jsonrpc::internal_error, e.what()));
  }
  return true;
}

json::object dispatcher::status() const {
  auto s = coord_.stats();
  json::object o;
  o["name"] = server_name;
  o["version"] = server_version;
  o["model"] = agent_.model_name();
  o["clients"] = s.clients;
  o["disconnected_clients"] = s.disconnected;
  o["sessions"] = s.sessions;
  return o;
}

}  // namespace tether

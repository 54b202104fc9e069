#include "tether/coordinator.hpp"

#include <fmt/format.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logger.hpp"
#include "utils.hpp"

namespace tether {

namespace net = boost::asio;

std::string_view to_string(session_errc e) {
  switch (e) {
    case session_errc::session_not_found: return "SessionNotFound";
    case session_errc::invalid_token: return "InvalidToken";
    case session_errc::not_disconnected: return "NotDisconnected";
    case session_errc::grace_period_expired: return "GracePeriodExpired";
    case session_errc::access_denied: return "AccessDenied";
    case session_errc::unknown_client: return "UnknownClient";
  }
  return "SessionError";
}

std::string make_resume_token() {
  std::array<unsigned char, 32> raw{};
  if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1)
    utils::throwf("RAND_bytes failed to produce a resume token");

  // 4 * ceil(32 / 3) characters plus the terminator
  std::array<unsigned char, 45> encoded{};
  int n = EVP_EncodeBlock(encoded.data(), raw.data(), static_cast<int>(raw.size()));

  std::string token;
  token.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    auto c = static_cast<char>(encoded[static_cast<std::size_t>(i)]);
    if (c == '=') break;
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
    token.push_back(c);
  }
  return token;
}

namespace {

bool token_matches(std::string_view expected, std::string_view given) {
  if (expected.size() != given.size()) return false;
  return CRYPTO_memcmp(expected.data(), given.data(), expected.size()) == 0;
}

session_error err(session_errc code, const std::string& what) {
  return session_error{code, what};
}

}  // namespace

coordinator::coordinator(coordinator_config config, now_fn now)
    : config_{config}, now_{std::move(now)} {
  if (!now_) now_ = [] { return clock::now(); };
}

/// Clients

std::string coordinator::register_client(std::shared_ptr<client> connection) {
  std::lock_guard lock{mutex_};
  auto id = fmt::format("client-{}", ++next_client_);
  clients_.emplace(id, std::move(connection));
  LOG_INFO("registered {}", id);
  return id;
}

bool coordinator::is_registered(const std::string& client_id) const {
  std::lock_guard lock{mutex_};
  return clients_.contains(client_id);
}

void coordinator::unregister_client(const std::string& client_id, bool allow_reconnect) {
  std::lock_guard lock{mutex_};
  if (!clients_.erase(client_id)) {
    LOG_WARN("unregister of unknown client {} ignored", client_id);
    return;
  }

  bool owns_sessions = std::ranges::any_of(
      sessions_, [&](const auto& kv) { return kv.second.owner == client_id; });

  if (allow_reconnect && owns_sessions) {
    disconnected_[client_id] = now_();
    LOG_INFO(
        "{} disconnected, sessions kept for {}s", client_id,
        config_.grace.count());
    return;
  }
  auto n = drop_sessions_of(client_id);
  LOG_INFO("{} unregistered, {} session(s) deleted", client_id, n);
}

/// Sessions

new_session_result coordinator::new_session(std::string cwd, const std::string& client_id) {
  auto token = make_resume_token();

  std::lock_guard lock{mutex_};
  if (!clients_.contains(client_id))
    throw err(session_errc::unknown_client, fmt::format("Unknown client: {}", client_id));

  auto state = std::make_shared<session_state>();
  state->id = fmt::format("session-{}", ++next_session_);
  state->cwd = std::move(cwd);
  state->created = std::chrono::system_clock::now();

  sessions_.emplace(state->id, session_record{state, client_id, token});
  LOG_INFO("{} created {} in {}", client_id, state->id, state->cwd);
  return {state->id, std::move(token), state};
}

std::shared_ptr<client> coordinator::route(const std::string& session_id) const {
  std::lock_guard lock{mutex_};
  auto s = sessions_.find(session_id);
  if (s == sessions_.end()) return nullptr;
  auto c = clients_.find(s->second.owner);
  if (c == clients_.end()) return nullptr;
  return c->second;
}

std::shared_ptr<session_state> coordinator::resume_session(
    const std::string& session_id, std::string_view token,
    const std::string& new_client_id) {
  std::lock_guard lock{mutex_};

  auto s = sessions_.find(session_id);
  if (s == sessions_.end())
    throw err(
        session_errc::session_not_found,
        fmt::format("Session not found: {}", session_id));

  if (!token_matches(s->second.token, token))
    throw err(session_errc::invalid_token, "Invalid resume token");

  if (!clients_.contains(new_client_id))
    throw err(
        session_errc::unknown_client,
        fmt::format("Unknown client: {}", new_client_id));

  auto former = s->second.owner;
  auto d = disconnected_.find(former);
  if (d == disconnected_.end())
    throw err(
        session_errc::not_disconnected,
        fmt::format("Session {} is still owned by a connected client", session_id));

  if (now_() - d->second > config_.grace) {
    auto n = expire_locked(former);
    LOG_INFO("{}: grace expired on resume, {} session(s) deleted", former, n);
    throw err(
        session_errc::grace_period_expired,
        fmt::format("Grace period expired for session {}", session_id));
  }

  auto state = s->second.state;
  s->second.owner = new_client_id;
  disconnected_.erase(d);

  // The former owner is gone for good: release what it left behind
  auto released = drop_sessions_of(former);
  LOG_INFO(
      "{} resumed by {} (released {} other session(s) of {})", session_id,
      new_client_id, released, former);
  return state;
}

std::size_t coordinator::drop_sessions_of(const std::string& client_id) {
  std::size_t n = 0;
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->second.owner != client_id) {
      ++it;
      continue;
    }
    {
      std::lock_guard slock{it->second.state->mutex};
      if (it->second.state->turn) it->second.state->turn->request();
    }
    it = sessions_.erase(it);
    ++n;
  }
  return n;
}

std::size_t coordinator::expire_locked(const std::string& client_id) {
  disconnected_.erase(client_id);
  return drop_sessions_of(client_id);
}

std::size_t coordinator::sweep_expired() {
  std::lock_guard lock{mutex_};
  auto now = now_();
  std::vector<std::string> expired;
  for (const auto& [id, since] : disconnected_)
    if (now - since > config_.grace) expired.push_back(id);

  std::size_t n = 0;
  for (const auto& id : expired) n += expire_locked(id);
  if (!expired.empty())
    LOG_INFO(
        "sweep: {} client(s) expired, {} session(s) deleted", expired.size(), n);
  return n;
}

net::awaitable<void> coordinator::run_sweeper() {
  net::steady_timer timer{co_await net::this_coro::executor};
  for (;;) {
    timer.expires_after(config_.sweep_interval);
    co_await timer.async_wait(net::use_awaitable);
    try {
      sweep_expired();
    } catch (const std::exception& e) {
      LOG_ERROR("sweep failed: {}", e.what());
    }
  }
}

/// Queries

std::shared_ptr<session_state> coordinator::authorize(
    const std::string& session_id, const std::string& client_id) const {
  std::lock_guard lock{mutex_};
  auto s = sessions_.find(session_id);
  if (s == sessions_.end())
    throw err(
        session_errc::session_not_found,
        fmt::format("Session not found: {}", session_id));
  if (s->second.owner != client_id)
    throw err(
        session_errc::access_denied,
        fmt::format("Session {} is not owned by {}", session_id, client_id));
  return s->second.state;
}

std::vector<session_info> coordinator::list_sessions(const std::string& client_id) const {
  std::vector<std::shared_ptr<session_state>> owned;
  {
    std::lock_guard lock{mutex_};
    for (const auto& [id, rec] : sessions_)
      if (rec.owner == client_id) owned.push_back(rec.state);
  }
  std::vector<session_info> out;
  for (const auto& st : owned) {
    std::lock_guard slock{st->mutex};
    out.push_back({st->id, st->cwd, st->mode_id, client_id});
  }
  return out;
}

void coordinator::set_session_mode(
    const std::string& session_id, const std::string& client_id,
    std::string mode_id) {
  auto st = authorize(session_id, client_id);
  std::lock_guard slock{st->mutex};
  LOG_DEBUG("{} mode {} -> {}", session_id, st->mode_id, mode_id);
  st->mode_id = std::move(mode_id);
}

std::shared_ptr<session_state> coordinator::find_session(const std::string& session_id) const {
  std::lock_guard lock{mutex_};
  auto s = sessions_.find(session_id);
  return s == sessions_.end() ? nullptr : s->second.state;
}

coordinator_stats coordinator::stats() const {
  std::lock_guard lock{mutex_};
  return {clients_.size(), disconnected_.size(), sessions_.size()};
}

}  // namespace tether

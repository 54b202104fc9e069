#include "tether/local_client.hpp"

#include <fmt/format.h>
#include <sys/wait.h>

#define BOOST_PROCESS_USE_STD_FS 1

#include <array>
#include <boost/asio/buffer.hpp>
#include <boost/asio/connect_pipe.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/error_code.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>

#include "logger.hpp"
#include "utils.hpp"

namespace tether {

namespace fs = std::filesystem;
namespace p2 = boost::process::v2;
namespace asio = boost::asio;

namespace {

std::string signal_name(int sig) {
  // clang-format off
  switch (sig) {
  case SIGKILL: return "SIGKILL";
  case SIGTERM: return "SIGTERM";
  case SIGINT:  return "SIGINT";
  case SIGHUP:  return "SIGHUP";
  case SIGSEGV: return "SIGSEGV";
  case SIGABRT: return "SIGABRT";
  case SIGPIPE: return "SIGPIPE";
  default: return fmt::format("SIG{}", sig);
  }
  // clang-format on
}

fs::path find_program(const std::string& command) {
  if (command.find('/') != std::string::npos) return fs::path{command};
  auto exe = p2::environment::find_executable(command);
  if (exe.empty()) utils::throwf("{}: command not found", command);
  return exe;
}

}  // namespace

/// Terminals

struct local_client::terminal {
  asio::io_context ctx;
  asio::readable_pipe out{ctx};
  std::optional<p2::process> proc;
  std::thread reader;

  std::mutex mutex;
  std::string output;
  bool truncated{false};
  std::optional<terminal_exit> exit;
  std::vector<std::promise<terminal_exit>> waiters;

  terminal() = default;
  terminal(const terminal&) = delete;
  terminal& operator=(const terminal&) = delete;

  ~terminal() {
    kill();
    if (reader.joinable()) reader.join();
  }

  /// SIGKILL only; reaping is left to @ref pump.
  void kill() {
    std::lock_guard lock{mutex};
    if (exit || !proc) return;
    if (::kill(proc->id(), SIGKILL) != 0)
      LOG_DEBUG("kill {}: {}", proc->id(), std::strerror(errno));
  }

  /// Runs on @c reader until the child exits.
  void pump(std::size_t limit) {
    std::array<char, 4096> buf{};
    for (;;) {
      boost::system::error_code ec;
      auto n = out.read_some(asio::buffer(buf), ec);
      if (n > 0) {
        std::lock_guard lock{mutex};
        auto room = output.size() < limit ? limit - output.size() : 0;
        output.append(buf.data(), std::min(n, room));
        if (n > room) truncated = true;
      }
      if (ec) break;
    }

    boost::system::error_code ec;
    proc->wait(ec);
    terminal_exit result;
    if (ec) {
      LOG_WARN("wait for child failed: {}", ec.message());
      result.exit_code = -1;
    } else {
      auto status = proc->native_exit_code();
      if (WIFSIGNALED(status)) {
        result.signal = signal_name(WTERMSIG(status));
      } else {
        result.exit_code = WEXITSTATUS(status);
      }
    }

    std::vector<std::promise<terminal_exit>> ready_waiters;
    {
      std::lock_guard lock{mutex};
      exit = result;
      ready_waiters.swap(waiters);
    }
    for (auto& w : ready_waiters) w.set_value(result);
  }
};

local_client::local_client(fs::path workspace, update_sink sink, std::size_t output_byte_limit)
    : workspace_{fs::weakly_canonical(fs::absolute(workspace))},
      sink_{std::move(sink)},
      output_byte_limit_{output_byte_limit} {}

local_client::~local_client() {
  std::map<std::string, std::shared_ptr<terminal>> doomed;
  {
    std::lock_guard lock{mutex_};
    doomed.swap(terminals_);
  }
  if (!doomed.empty()) LOG_DEBUG("killing {} leftover terminal(s)", doomed.size());
}

fs::path local_client::resolve(const std::string& path) const {
  fs::path p{path};
  std::error_code ec;
  auto full = fs::weakly_canonical(p.is_absolute() ? p : workspace_ / p, ec);
  if (ec) utils::throwf<workspace_error>("cannot resolve {}: {}", path, ec.message());

  // Component-wise, so that /work/tree2 is not inside /work/tree
  auto [ws_end, full_end] =
      std::mismatch(workspace_.begin(), workspace_.end(), full.begin(), full.end());
  if (ws_end != workspace_.end())
    utils::throwf<workspace_error>(
        "Path {} is outside workspace {}", path, workspace_.string());
  return full;
}

std::shared_ptr<local_client::terminal> local_client::find(const std::string& terminal_id) const {
  std::lock_guard lock{mutex_};
  auto it = terminals_.find(terminal_id);
  if (it == terminals_.end())
    utils::throwf<std::out_of_range>("Terminal {} not found", terminal_id);
  return it->second;
}

std::size_t local_client::terminal_count() const {
  std::lock_guard lock{mutex_};
  return terminals_.size();
}

/// client

void local_client::session_update(const std::string& session_id, json::object update) {
  if (sink_) sink_(session_id, update);
}

pending<std::string> local_client::read_text_file(
    const std::string& /*session_id*/, const std::string& path) {
  try {
    auto full = resolve(path);
    std::ifstream f{full};
    if (!f) utils::throwf("cannot open {}", path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ready(ss.str());
  } catch (const std::exception& e) {
    return failed<std::string>(std::runtime_error{e.what()});
  }
}

pending<void> local_client::write_text_file(
    const std::string& /*session_id*/, const std::string& path, const std::string& content) {
  try {
    auto full = resolve(path);
    fs::create_directories(full.parent_path());
    std::ofstream f{full, std::ios::binary | std::ios::trunc};
    if (!f) utils::throwf("cannot open {} for writing", path);
    f << content;
    if (!f) utils::throwf("failed writing {}", path);
    return ready();
  } catch (const std::exception& e) {
    return failed<void>(std::runtime_error{e.what()});
  }
}

pending<std::string> local_client::create_terminal(
    const std::string& session_id, const command_spec& cmd) {
  try {
    auto exe = find_program(cmd.command);
    auto dir = cmd.cwd ? resolve(*cmd.cwd) : workspace_;

    auto t = std::make_shared<terminal>();
    asio::writable_pipe sink{t->ctx};
    asio::connect_pipe(t->out, sink);
    t->proc.emplace(
        t->ctx, exe, cmd.args,
        p2::process_stdio{.in = nullptr, .out = sink, .err = sink},
        p2::process_start_dir{dir});
    // The child holds its own copies
    sink.close();

    t->reader = std::thread{[raw = t.get(), limit = output_byte_limit_] { raw->pump(limit); }};

    std::string id;
    {
      std::lock_guard lock{mutex_};
      id = fmt::format("term-{}", ++next_terminal_);
      terminals_.emplace(id, t);
    }
    LOG_DEBUG("{}: {} started {} in {}", session_id, id, exe.string(), dir.string());
    return ready(std::move(id));
  } catch (const std::exception& e) {
    return failed<std::string>(std::runtime_error{e.what()});
  }
}

pending<terminal_exit> local_client::wait_for_terminal_exit(
    const std::string& /*session_id*/, const std::string& terminal_id) {
  try {
    auto t = find(terminal_id);
    std::lock_guard lock{t->mutex};
    if (t->exit) return ready(*t->exit);
    auto& w = t->waiters.emplace_back();
    return {w.get_future()};
  } catch (const std::exception& e) {
    return failed<terminal_exit>(std::runtime_error{e.what()});
  }
}

pending<terminal_output> local_client::read_terminal_output(
    const std::string& /*session_id*/, const std::string& terminal_id) {
  try {
    auto t = find(terminal_id);
    std::lock_guard lock{t->mutex};
    return ready(terminal_output{t->output, t->truncated, t->exit});
  } catch (const std::exception& e) {
    return failed<terminal_output>(std::runtime_error{e.what()});
  }
}

pending<void> local_client::release_terminal(
    const std::string& /*session_id*/, const std::string& terminal_id) {
  std::shared_ptr<terminal> t;
  {
    std::lock_guard lock{mutex_};
    auto it = terminals_.find(terminal_id);
    if (it == terminals_.end())
      return failed<void>(std::runtime_error{fmt::format("Terminal {} not found", terminal_id)});
    t = std::move(it->second);
    terminals_.erase(it);
  }
  // Kills the child if it is still running and reaps the reader
  t.reset();
  return ready();
}

pending<void> local_client::kill_terminal(
    const std::string& /*session_id*/, const std::string& terminal_id) {
  try {
    find(terminal_id)->kill();
    return ready();
  } catch (const std::exception& e) {
    return failed<void>(std::runtime_error{e.what()});
  }
}

}  // namespace tether

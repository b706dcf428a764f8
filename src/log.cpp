#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <memory>
#include <vector>

namespace {

constexpr const char* kDecoratedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kPlainPattern = "%v";

struct ConsoleSinks {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::once_flag g_sinks_once;
ConsoleSinks g_sinks;
std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name,
                                                    bool to_stderr,
                                                    const char* pattern) {
  spdlog::sink_ptr sink;
  if(to_stderr) {
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  // A second registration under the same name throws; reuse if present.
  if(auto existing = spdlog::get(name)) return existing;
  spdlog::register_logger(logger);
  return logger;
}

const ConsoleSinks& sinks() {
  std::call_once(g_sinks_once, [](){
    g_sinks.info = make_console_logger("roomshare.info", false, kDecoratedPattern);
    g_sinks.error = make_console_logger("roomshare.error", true, kDecoratedPattern);
    g_sinks.print = make_console_logger("roomshare.print", false, kPlainPattern);
    g_sinks.print_err = make_console_logger("roomshare.print_err", true, kPlainPattern);

    g_sinks.info->flush_on(spdlog::level::warn);
    g_sinks.error->flush_on(spdlog::level::err);
    g_sinks.print->flush_on(spdlog::level::info);
    g_sinks.print_err->flush_on(spdlog::level::err);
  });
  return g_sinks;
}

} // namespace

void init(bool verbose) {
  const auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.info->set_level(level);
  s.error->set_level(spdlog::level::info);
  s.print->set_level(spdlog::level::info);
  s.print_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(s.info);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard lock(listener_mutex_);
  listeners_.clear();
}

std::size_t Logger::listener_count() const {
  std::lock_guard lock(listener_mutex_);
  return listeners_.size();
}

bool Logger::notify_listeners(const std::string& channel,
                              spdlog::level::level_enum level,
                              const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard lock(listener_mutex_);
    if(listeners_.empty()) return false;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_console("error", name_, spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(const char* channel,
                  spdlog::level::level_enum level,
                  const std::string& message) const {
  detail::emit_to_console(channel, name_, level, message);
}

namespace detail {

void emit_to_console(const char* channel,
                     const std::string& source,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  if(!log_passthrough()) return;
  const auto& s = sinks();

  spdlog::logger* sink = s.info.get();
  bool plain = false;
  if(std::strcmp(channel, "print") == 0) {
    sink = s.print.get();
    plain = true;
  } else if(std::strcmp(channel, "print_err") == 0) {
    sink = s.print_err.get();
    plain = true;
  } else if(std::strcmp(channel, "error") == 0) {
    sink = s.error.get();
  }

  if(plain || source.empty()) {
    sink->log(level, message);
  } else {
    sink->log(level, fmt::format("[{}] {}", source, message));
  }
}

} // namespace detail

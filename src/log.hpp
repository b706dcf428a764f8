#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Sets up the shared sinks. Safe to call more than once; the last call wins
// for the verbosity level.
void init(bool verbose = false);

// When disabled nothing reaches the console sinks. Listeners still fire.
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Return true to mark the line as handled and keep it off the console.
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  void set_name(std::string name);
  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();
  std::size_t listener_count() const;

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("debug", spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("info", spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("warn", spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("error", spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  // Plain user-facing output, no timestamp or level decoration.
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("print", spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("print_err", spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

private:
  template<typename... Args>
  void write(const char* channel,
             spdlog::level::level_enum level,
             spdlog::format_string_t<Args...> fmt,
             Args&&... args) {
    auto text = fmt::format(fmt, std::forward<Args>(args)...);
    std::string qualified = name_.empty() ? std::string(channel) : name_ + ":" + channel;
    if(notify_listeners(qualified, level, text)) return;
    emit(channel, level, text);
  }

  bool notify_listeners(const std::string& channel,
                        spdlog::level::level_enum level,
                        const std::string& message);
  void emit(const char* channel,
            spdlog::level::level_enum level,
            const std::string& message) const;

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  mutable std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {

// Routes a formatted line to the console sink that matches `channel`.
// `source` is prefixed in brackets when non-empty.
void emit_to_console(const char* channel,
                     const std::string& source,
                     spdlog::level::level_enum level,
                     const std::string& message);

template<typename... Args>
void log_unowned(const char* channel,
                 spdlog::level::level_enum level,
                 spdlog::format_string_t<Args...> fmt,
                 Args&&... args) {
  emit_to_console(channel, std::string(), level, fmt::format(fmt, std::forward<Args>(args)...));
}

} // namespace detail

// Free helpers for code that may or may not hold a Logger.

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->debug(fmt, std::forward<Args>(args)...);
  else detail::log_unowned("debug", spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->info(fmt, std::forward<Args>(args)...);
  else detail::log_unowned("info", spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->warn(fmt, std::forward<Args>(args)...);
  else detail::log_unowned("warn", spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->error(fmt, std::forward<Args>(args)...);
  else detail::log_unowned("error", spdlog::level::err, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->print(fmt, std::forward<Args>(args)...);
  else detail::log_unowned("print", spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->print_err(fmt, std::forward<Args>(args)...);
  else detail::log_unowned("print_err", spdlog::level::err, fmt, std::forward<Args>(args)...);
}

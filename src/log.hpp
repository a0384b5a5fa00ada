#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

void init(bool verbose = false);
void set_log_passthrough(bool enabled);
bool log_passthrough();

enum class LogChannel {
  Info,
  Warn,
  Error,
  Debug,
  Print,
  PrintErr
};

const char* to_string(LogChannel channel);
spdlog::level::level_enum level_for(LogChannel channel);

using LogListenerHandle = std::size_t;

// Named log channel for one node or one of its components. Listeners see
// every message first (the node's listeners also see its components');
// anything no listener claims goes to the process-wide spdlog sinks.
class Logger : public std::enable_shared_from_this<Logger> {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  void set_name(std::string name);
  std::string name() const;

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  // Logger for a sub-component, named "<this>/<component>". The name follows
  // later renames of this logger.
  std::shared_ptr<Logger> component(std::string component_name);

  void write(LogChannel channel, const std::string& message);

  template<typename... Args>
  void emit(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

private:
  bool notify(const std::string& channel_name,
              spdlog::level::level_enum level,
              const std::string& message);

  struct Subscription {
    void* user_data = nullptr;
    Listener callback;
  };

  mutable std::mutex mutex_;
  std::string name_;
  std::shared_ptr<Logger> parent_;
  std::map<LogListenerHandle, Subscription> listeners_;
  std::atomic<LogListenerHandle> next_handle_{1};
};

// Writes straight to the process-wide sinks, prefixing the channel name.
void write_to_sinks(LogChannel channel, const std::string& channel_name, const std::string& message);

template<typename... Args>
void log_to(Logger* logger, LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->write(channel, message);
  } else {
    write_to_sinks(channel, std::string(), message);
  }
}

template<typename... Args>
void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

// Console output for the interactive shell; no timestamp or level prefix.
template<typename... Args>
void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}

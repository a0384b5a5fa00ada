#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::atomic<bool> g_passthrough{true};

struct SinkTable {
  std::shared_ptr<spdlog::logger> stamped_out;
  std::shared_ptr<spdlog::logger> stamped_err;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;

  SinkTable() {
    stamped_out = make("adaptermesh", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), kStampedPattern);
    stamped_err = make("adaptermesh.err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), kStampedPattern);
    plain_out = make("adaptermesh.console", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v");
    plain_err = make("adaptermesh.console_err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v");

    stamped_out->flush_on(spdlog::level::warn);
    stamped_err->flush_on(spdlog::level::err);
    plain_out->flush_on(spdlog::level::info);
    plain_err->flush_on(spdlog::level::err);
  }

  spdlog::logger& route(LogChannel channel) const {
    switch(channel) {
      case LogChannel::Print: return *plain_out;
      case LogChannel::PrintErr: return *plain_err;
      case LogChannel::Error: return *stamped_err;
      default: return *stamped_out;
    }
  }

private:
  static std::shared_ptr<spdlog::logger> make(const std::string& name,
                                              spdlog::sink_ptr sink,
                                              const char* pattern) {
    sink->set_pattern(pattern);
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    spdlog::register_logger(logger);
    return logger;
  }
};

SinkTable& sinks() {
  static SinkTable table;
  return table;
}

} // namespace

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

void init(bool verbose) {
  auto& table = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  table.stamped_out->set_level(level);
  table.stamped_err->set_level(spdlog::level::info);
  table.plain_out->set_level(spdlog::level::info);
  table.plain_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(table.stamped_out);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

void write_to_sinks(LogChannel channel, const std::string& channel_name, const std::string& message) {
  if(!log_passthrough()) return;
  auto& target = sinks().route(channel);
  if(channel_name.empty()) {
    target.log(level_for(channel), message);
  } else {
    target.log(level_for(channel), "[{}] {}", channel_name, message);
  }
}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::shared_ptr<Logger> parent;
  std::string own;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    parent = parent_;
    own = name_;
  }
  if(!parent) return own;
  auto prefix = parent->name();
  return prefix.empty() ? own : prefix + "/" + own;
}

std::shared_ptr<Logger> Logger::component(std::string component_name) {
  auto child = std::make_shared<Logger>(std::move(component_name));
  child->parent_ = shared_from_this();
  return child;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(mutex_);
  auto handle = next_handle_++;
  listeners_[handle] = Subscription{user_data, std::move(listener)};
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
}

void Logger::write(LogChannel channel, const std::string& message) {
  auto full_name = name();
  auto channel_name = full_name.empty()
    ? std::string(to_string(channel))
    : full_name + ":" + to_string(channel);
  if(notify(channel_name, level_for(channel), message)) return;
  write_to_sinks(channel, full_name, message);
}

bool Logger::notify(const std::string& channel_name,
                    spdlog::level::level_enum level,
                    const std::string& message) {
  std::vector<Subscription> subscribers;
  std::shared_ptr<Logger> parent;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    parent = parent_;
    subscribers.reserve(listeners_.size());
    for(const auto& entry : listeners_) subscribers.push_back(entry.second);
  }

  bool claimed = false;
  for(auto& sub : subscribers) {
    try {
      claimed = sub.callback(sub.user_data, channel_name, level, message) || claimed;
    } catch(const std::exception& ex) {
      write_to_sinks(LogChannel::Error, "log-listener",
                     fmt::format("listener threw on '{}': {}", channel_name, ex.what()));
    }
  }
  if(parent) {
    claimed = parent->notify(channel_name, level, message) || claimed;
  }
  return claimed;
}

#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "log.hpp"
#include "swarm_membership.hpp"

class AdapterCLI;
class Coordinator;
class SettingsManager;
class TcpSwarm;

// Host process: owns the io_context, the TCP overlay and the Coordinator,
// and wires the console to them.
class AdapterEngine {
public:
  struct Options {
    bool start_cli_thread = false;
    bool handle_signals = false;
    std::size_t worker_threads = 2;
    std::filesystem::path workspace_root = std::filesystem::current_path();
  };

  AdapterEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~AdapterEngine();

  AdapterEngine(const AdapterEngine&) = delete;
  AdapterEngine& operator=(const AdapterEngine&) = delete;

  // Throws std::runtime_error for unusable settings or when the overlay
  // cannot be started.
  void start();
  void run();
  void start_background();
  void stop();

  // Runs one console command on the io_context thread.
  void execute_command(const std::string& line);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<Coordinator> coordinator() const { return coordinator_; }
  asio::io_context& io() { return io_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

  struct Stats {
    std::size_t connected_peers = 0;
    std::size_t local_adapters = 0;
    std::size_t remote_adapters = 0;
    RoomState room_state = RoomState::Disconnected;
    std::string room_code;
  };

  // Safe from any thread; waits for the io_context when it runs elsewhere.
  Stats stats();

  uint16_t listen_port() const { return listen_port_; }
  const std::string& public_key() const { return public_key_; }
  std::string peer_id() const { return peer_id_from_key(public_key_); }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

private:
  SwarmConfig swarm_config() const;
  Stats collect_stats() const;
  void auto_join();
  void watch_signals();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::unique_ptr<asio::signal_set> signals_;
  std::thread io_thread_;
  std::shared_ptr<TcpSwarm> swarm_;
  std::shared_ptr<Coordinator> coordinator_;
  std::unique_ptr<AdapterCLI> cli_;
  bool started_ = false;
  std::string public_key_;
  uint16_t listen_port_ = 0;
};

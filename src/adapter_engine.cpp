#include "adapter_engine.hpp"

#include <csignal>
#include <future>
#include <stdexcept>

#include "AdapterCLI.hpp"
#include "coordinator.hpp"
#include "settings_manager.hpp"
#include "tcp_swarm.hpp"
#include "utils.hpp"

namespace {

void log_room_result(Logger* logger, const std::string& what, const RoomResult& r) {
  if(r.success) {
    log_info(logger, "Auto-joined {} room {} ({})", what, r.code, classification_name(r.classification));
  } else {
    log_warn(logger, "Auto-join of {} failed: {}", what, r.error);
  }
}

} // namespace

AdapterEngine::AdapterEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("adaptermesh")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
  if(options_.worker_threads == 0) {
    options_.worker_threads = 1;
  }
  settings_->set_workspace(options_.workspace_root);
}

AdapterEngine::~AdapterEngine() {
  stop();
}

SwarmConfig AdapterEngine::swarm_config() const {
  SwarmConfig config;
  config.heartbeat_interval = std::chrono::seconds(settings_->get<int>("heartbeat_interval_s"));
  config.health_check_interval = std::chrono::seconds(settings_->get<int>("health_check_interval_s"));
  config.reconnect_base_delay = std::chrono::milliseconds(settings_->get<int>("reconnect_base_delay_ms"));
  config.max_reconnect_attempts = settings_->get<int>("max_reconnect_attempts");
  config.keep_alive = std::chrono::seconds(settings_->get<int>("keep_alive_s"));
  config.socket_timeout = std::chrono::seconds(settings_->get<int>("socket_timeout_s"));
  return config;
}

void AdapterEngine::start() {
  if(started_) return;

  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
  if(ec) {
    throw std::runtime_error("cannot create workspace " + options_.workspace_root.string() + ": " + ec.message());
  }

  init(settings_->get<bool>("verbose"));

  public_key_ = settings_->get<std::string>("public_key");
  if(public_key_.empty()) {
    public_key_ = random_hex(32);
    std::string error;
    if(!settings_->set_from_string("public_key", public_key_, error)) {
      throw std::runtime_error("cannot record generated identity: " + error);
    }
    logger_->info("Generated identity {}", peer_id());
  }
  if(!is_hex_string(public_key_)) {
    throw std::runtime_error("public_key must be a hex string");
  }
  logger_->set_name(peer_id());

  TcpSwarm::Options overlay;
  overlay.listen_ip = settings_->get<std::string>("listen_ip");
  overlay.listen_port = static_cast<uint16_t>(settings_->get<int>("listen_port"));
  overlay.bootstrap_peers = settings_->get_list("bootstrap_peers");
  overlay.public_key = public_key_;

  CoordinatorConfig config;
  config.swarm = swarm_config();
  config.storage_root = settings_->storage_root();
  config.chunk_send_delay = std::chrono::milliseconds(settings_->get<int>("chunk_send_delay_ms"));
  config.transfer_debug = settings_->get<bool>("transfer_debug");
  config.max_artifact_size = static_cast<uint64_t>(settings_->get<int>("max_artifact_size_mb")) * 1024 * 1024;
  config.worker_threads = options_.worker_threads;

  std::filesystem::create_directories(config.storage_root, ec);
  if(ec) {
    throw std::runtime_error("cannot create artifact store " + config.storage_root.string() + ": " + ec.message());
  }

  auto overlay_logger = logger_->component("overlay");
  SwarmFactory factory = [this, overlay, overlay_logger]() -> std::shared_ptr<Swarm> {
    swarm_ = TcpSwarm::create(io_, overlay, overlay_logger);
    return swarm_;
  };

  coordinator_ = std::make_shared<Coordinator>(io_, config, std::move(factory), logger_->component("coordinator"));
  auto result = coordinator_->initialize();
  if(!result.success) {
    coordinator_.reset();
    throw std::runtime_error("P2P initialization failed: " + result.error);
  }
  listen_port_ = swarm_ ? swarm_->listen_port() : 0;
  logger_->info("Listening on {}:{} with {} bootstrap peer(s)",
                overlay.listen_ip, listen_port_, overlay.bootstrap_peers.size());

  work_.emplace(asio::make_work_guard(io_));
  started_ = true;

  cli_ = std::make_unique<AdapterCLI>(io_, coordinator_, settings_, logger_,
                                      [this]() {
                                        work_.reset();
                                        io_.stop();
                                      });
  cli_->attach_notifications();

  if(options_.handle_signals) {
    watch_signals();
  }

  asio::post(io_, [this]() { auto_join(); });

  if(options_.start_cli_thread) {
    cli_->start();
  }
}

void AdapterEngine::watch_signals() {
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  signals_->async_wait([this](const std::error_code& ec, int signal_number) {
    if(ec) return;
    logger_->info("Signal {} received, shutting down", signal_number);
    work_.reset();
    io_.stop();
  });
}

void AdapterEngine::auto_join() {
  if(!coordinator_) return;
  auto target = trim_copy(settings_->get<std::string>("auto_join"));
  auto lowered = to_lower(target);
  if(lowered.empty() || lowered == "none") return;

  auto* logger = logger_.get();
  if(lowered == "general") {
    coordinator_->join_general_room([logger](const RoomResult& r) { log_room_result(logger, "general", r); });
  } else if(lowered == "local") {
    coordinator_->join_local_room([logger](const RoomResult& r) { log_room_result(logger, "local", r); });
  } else if(is_hex_string(target, Topic::kHexSize)) {
    coordinator_->join_room(target, [logger](const RoomResult& r) { log_room_result(logger, "topic", r); });
  } else {
    coordinator_->join_room_by_code(target, [logger, target](const RoomResult& r) {
      log_room_result(logger, target, r);
    });
  }
}

void AdapterEngine::run() {
  if(!started_) start();
  io_.run();
}

void AdapterEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this]() {
    io_.run();
  });
}

void AdapterEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(cli_) {
    cli_->stop();
  }

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }

  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  cli_.reset();
  if(coordinator_) {
    coordinator_->destroy();
  }
  // Let socket and timer handlers observe the shutdown before teardown.
  io_.restart();
  io_.poll();
  coordinator_.reset();
  swarm_.reset();
  signals_.reset();
  io_.restart();
}

void AdapterEngine::execute_command(const std::string& line) {
  if(cli_) {
    cli_->execute_command(line);
  }
}

LogListenerHandle AdapterEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void AdapterEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

AdapterEngine::Stats AdapterEngine::collect_stats() const {
  Stats s;
  if(!coordinator_) return s;
  const auto& membership = coordinator_->membership();
  s.connected_peers = membership.peers_count();
  s.room_state = membership.state();
  if(const auto& room = membership.current_room()) s.room_code = room->code;
  s.local_adapters = coordinator_->local_inventory().size();
  for(const auto& kv : coordinator_->remote_inventory()) s.remote_adapters += kv.second.size();
  return s;
}

AdapterEngine::Stats AdapterEngine::stats() {
  if(!io_thread_.joinable() || std::this_thread::get_id() == io_thread_.get_id()) {
    return collect_stats();
  }
  auto promise = std::make_shared<std::promise<Stats>>();
  auto future = promise->get_future();
  asio::post(io_, [this, promise]() { promise->set_value(collect_stats()); });
  if(future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
    throw std::runtime_error("io_context did not answer the stats request");
  }
  return future.get();
}

#include "coordinator.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string iso_timestamp_now() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

RoomResult room_failure(ErrorKind kind, std::string error) {
  RoomResult r;
  r.success = false;
  r.kind = kind;
  r.error = std::move(error);
  return r;
}

ShareResult share_failure(ErrorKind kind, std::string error) {
  ShareResult r;
  r.success = false;
  r.kind = kind;
  r.error = std::move(error);
  return r;
}

std::string file_type_for(const fs::path& payload) {
  auto ext = payload.extension().string();
  if(ext == ".bin" || ext == ".pt") return "pytorch";
  return "safetensors";
}

void write_file(const fs::path& path, const std::string& data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if(!out) throw std::runtime_error("cannot open " + path.string() + " for writing");
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  out.close();
  if(!out) throw std::runtime_error("failed writing " + path.string());
}

} // namespace

SavedAdapter persist_received_adapter(const fs::path& storage_root,
                                      const AdapterDescriptor& descriptor,
                                      const std::string& buffer,
                                      const std::string& from_peer) {
  auto name = ContentRegistry::sanitize_name(descriptor.name);
  if(!name) {
    throw std::runtime_error("refusing unsafe adapter name '" + descriptor.name + "'");
  }

  AdapterMetadata metadata = descriptor.metadata ? *descriptor.metadata : AdapterMetadata{};
  const auto dir = storage_root / "weights" / *name;
  const auto registry = storage_root / "registry";

  std::error_code ec;
  fs::create_directories(dir, ec);
  if(ec) throw std::runtime_error("cannot create " + dir.string() + ": " + ec.message());
  fs::create_directories(registry, ec);
  if(ec) throw std::runtime_error("cannot create " + registry.string() + ": " + ec.message());

  SavedAdapter saved;
  saved.name = *name;
  saved.topic = descriptor.topic;
  saved.from = from_peer;
  saved.size = buffer.size();
  saved.path = dir / payload_file_name(metadata.file_type);
  saved.record = registry / (*name + ".json");

  write_file(saved.path, buffer);

  json record = metadata;
  record["adapter_path"] = saved.path.string();
  record["checksum"] = descriptor.checksum;
  record["size"] = buffer.size();
  record["received_from"] = from_peer;
  record["received_at"] = iso_timestamp_now();
  record["source"] = "p2p";
  if(!record.contains("adapter_id")) record["adapter_id"] = *name;
  write_file(saved.record, record.dump(2));
  return saved;
}

Coordinator::Coordinator(asio::io_context& io,
                         CoordinatorConfig config,
                         SwarmFactory factory,
                         std::shared_ptr<Logger> logger)
  : io_(io),
    config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("coordinator")),
    pool_(config_.worker_threads == 0 ? 1 : config_.worker_threads) {
  membership_ = std::make_unique<SwarmMembershipManager>(io_, std::move(factory), config_.swarm,
                                                         logger_->component("swarm"));
  transfer_ = std::make_shared<ChunkedTransfer>(io_, pool_, logger_->component("transfer"),
                                                config_.chunk_send_delay);
  transfer_->set_debug(config_.transfer_debug);
  transfer_->set_max_artifact_size(config_.max_artifact_size);
  registry_ = std::make_shared<ContentRegistry>(io_, pool_, config_.storage_root,
                                                logger_->component("registry"));
  wire_events();
}

Coordinator::~Coordinator() {
  room_events_ = RoomEvents{};
  transfer_events_ = TransferEvents{};
  inventory_events_ = InventoryEvents{};
  destroy();
  pool_.join();
}

void Coordinator::wire_events() {
  RoomEvents room;
  room.on_joined = [this](const RoomInfo& info) {
    if(room_events_.on_joined) room_events_.on_joined(info);
  };
  room.on_left = [this]() {
    remote_inventory_.clear();
    if(room_events_.on_left) room_events_.on_left();
  };
  room.on_peers_updated = [this](std::size_t count) {
    if(room_events_.on_peers_updated) room_events_.on_peers_updated(count);
  };
  room.on_state_changed = [this](RoomState state) {
    if(room_events_.on_state_changed) room_events_.on_state_changed(state);
  };
  membership_->set_room_events(std::move(room));

  PeerEvents peers;
  peers.on_connected = [this](const std::string& peer_id) {
    auto adapters = registry_->all_adapters();
    membership_->send_message(make_adapter_list(adapters), peer_id);
  };
  peers.on_disconnected = [this](const std::string& peer_id) {
    transfer_->abandon_peer(peer_id);
    if(remote_inventory_.erase(peer_id) && inventory_events_.on_adapters_available) {
      inventory_events_.on_adapters_available(RemoteInventory{peer_id, {}});
    }
  };
  peers.on_message = [this](const std::string& peer_id, const Frame& frame) {
    handle_peer_message(peer_id, frame);
  };
  membership_->set_peer_events(std::move(peers));

  TransferEvents transfer;
  transfer.on_progress = [this](const TransferProgress& p) {
    if(transfer_events_.on_progress) transfer_events_.on_progress(p);
  };
  transfer.on_complete = [this](const TransferComplete& done) {
    if(transfer_events_.on_complete) transfer_events_.on_complete(done);
    if(done.direction == TransferDirection::Receive) handle_transfer_complete(done);
  };
  transfer.on_error = [this](const TransferError& error) {
    if(transfer_events_.on_error) transfer_events_.on_error(error);
  };
  transfer_->set_events(std::move(transfer));
}

OperationResult Coordinator::initialize() {
  if(initialized_) return OperationResult::ok();
  try {
    membership_->initialize();
  } catch(const InitError& ex) {
    log_error(logger_.get(), "P2P initialization failed: {}", ex.what());
    return OperationResult::failure(ErrorKind::Init, ex.what());
  }
  registry_->start();
  initialized_ = true;
  log_info(logger_.get(), "Initialized as {} (store {})", membership_->local_peer_id(),
           config_.storage_root.string());
  return OperationResult::ok();
}

void Coordinator::join_with(const Topic& topic, std::string code,
                            std::optional<RoomClassification> classification, RoomHandler done) {
  if(!initialized_) {
    if(done) done(room_failure(ErrorKind::NotFound, "P2P not initialized"));
    return;
  }
  std::weak_ptr<Coordinator> weak = weak_from_this();
  membership_->join_room(topic, [weak, topic, done](bool joined) {
    auto self = weak.lock();
    if(!self || !done) return;
    if(!joined) {
      done(room_failure(ErrorKind::Connection, "join of room " + topic.room_code() + " was abandoned"));
      return;
    }
    RoomResult r;
    r.success = true;
    r.topic = topic.hex();
    if(const auto& room = self->membership_->current_room()) {
      r.code = room->code;
      r.classification = room->classification;
    }
    done(r);
  }, std::move(code), classification);
}

void Coordinator::join_room(const Topic& topic, RoomHandler done) {
  join_with(topic, {}, std::nullopt, std::move(done));
}

void Coordinator::join_room(const std::string& topic_hex, RoomHandler done) {
  auto topic = Topic::from_hex(trim_copy(topic_hex));
  if(!topic) {
    if(done) done(room_failure(ErrorKind::InvalidArgument, "topic must be 64 hex characters"));
    return;
  }
  join_room(*topic, std::move(done));
}

void Coordinator::join_room_by_code(const std::string& code, RoomHandler done) {
  auto normalized = trim_copy(code);
  if(normalized.empty()) {
    if(done) done(room_failure(ErrorKind::InvalidArgument, "room code is empty"));
    return;
  }
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  join_with(topic_for_room_code(normalized), normalized, RoomClassification::Private, std::move(done));
}

void Coordinator::join_general_room(RoomHandler done) {
  join_with(general_room_topic(), "general", RoomClassification::General, std::move(done));
}

void Coordinator::join_local_room(RoomHandler done) {
  join_with(local_network_topic(), "local", RoomClassification::LocalNetwork, std::move(done));
}

void Coordinator::create_room(RoomHandler done) {
  join_room(Topic::random(), std::move(done));
}

OperationResult Coordinator::leave_room() {
  if(!initialized_) return OperationResult::failure(ErrorKind::NotFound, "P2P not initialized");
  membership_->leave_room();
  return OperationResult::ok();
}

void Coordinator::share_adapter(const std::string& name, ShareHandler done) {
  if(!initialized_) {
    if(done) done(share_failure(ErrorKind::NotFound, "P2P not initialized"));
    return;
  }
  std::weak_ptr<Coordinator> weak = weak_from_this();
  registry_->find_path(name, [weak, name, done](std::optional<fs::path> path) {
    auto self = weak.lock();
    if(!self) return;
    if(!path) {
      if(done) done(share_failure(ErrorKind::NotFound, "Adapter " + name + " not found"));
      return;
    }
    auto payload = *path;
    self->transfer_->calculate_file_info(payload,
      [weak, name, payload, done](std::optional<FileInfo> info, const std::string& error) {
        auto self = weak.lock();
        if(!self) return;
        if(!info) {
          if(done) done(share_failure(ErrorKind::NotFound, "cannot read " + payload.string() + ": " + error));
          return;
        }
        if(info->size == 0) {
          if(done) done(share_failure(ErrorKind::NotFound, "Adapter " + name + " is empty"));
          return;
        }

        AdapterDescriptor descriptor;
        descriptor.name = name;
        descriptor.topic = Topic::random().hex();
        descriptor.size = info->size;
        descriptor.checksum = info->checksum;
        descriptor.timestamp = unix_time_ms();
        auto metadata = self->registry_->get_metadata(name);
        if(!metadata) {
          metadata = AdapterMetadata{};
          metadata->adapter_id = name;
          metadata->file_type = file_type_for(payload);
        }
        descriptor.metadata = metadata;

        self->registry_->register_adapter(descriptor);
        log_info(self->logger_.get(), "Sharing {} as {} ({})", name, descriptor.topic.substr(0, 8),
                 format_file_size(descriptor.size));
        self->broadcast_inventory();

        ShareResult r;
        r.success = true;
        r.descriptor = descriptor;
        if(done) done(r);
      });
  });
}

OperationResult Coordinator::unshare_adapter(const std::string& topic) {
  if(!registry_->unregister_adapter(topic)) {
    return OperationResult::failure(ErrorKind::NotFound, "no shared adapter with topic " + topic);
  }
  log_info(logger_.get(), "Stopped sharing {}", topic.substr(0, 8));
  broadcast_inventory();
  return OperationResult::ok();
}

OperationResult Coordinator::request_adapter(const std::string& topic,
                                             const std::optional<std::string>& from_peer) {
  if(!initialized_) return OperationResult::failure(ErrorKind::NotFound, "P2P not initialized");
  if(topic.empty()) return OperationResult::failure(ErrorKind::InvalidArgument, "topic is empty");
  if(from_peer && !membership_->get_peer(*from_peer)) {
    return OperationResult::failure(ErrorKind::NotFound, "peer " + *from_peer + " is not connected");
  }
  if(!membership_->send_message(make_adapter_request(topic), from_peer)) {
    return OperationResult::failure(ErrorKind::NotFound, "no connected peer accepted the request");
  }
  log_info(logger_.get(), "Requested {} from {}", topic.substr(0, 8), from_peer ? *from_peer : "all peers");
  return OperationResult::ok();
}

void Coordinator::check_adapter_exists(const std::string& name, ExistsHandler done) {
  registry_->find_path(name, [done](std::optional<fs::path> path) {
    if(done) done(path.has_value());
  });
}

OperationResult Coordinator::refresh_registry() {
  registry_->refresh_cache();
  return OperationResult::ok();
}

OperationResult Coordinator::destroy() {
  membership_->destroy();
  transfer_->cancel_all();
  registry_->clear();
  remote_inventory_.clear();
  if(initialized_) {
    log_info(logger_.get(), "Destroyed");
  }
  initialized_ = false;
  return OperationResult::ok();
}

std::vector<AdapterDescriptor> Coordinator::local_inventory() const {
  return registry_->all_adapters();
}

void Coordinator::handle_peer_message(const std::string& peer_id, const Frame& frame) {
  if(auto list = std::get_if<AdapterListFrame>(&frame)) {
    handle_adapter_list(peer_id, *list);
  } else if(auto request = std::get_if<AdapterRequestFrame>(&frame)) {
    handle_adapter_request(peer_id, *request);
  } else if(auto chunk = std::get_if<AdapterChunkFrame>(&frame)) {
    transfer_->handle_received_chunk(*chunk, peer_id);
  }
}

void Coordinator::handle_adapter_list(const std::string& peer_id, const AdapterListFrame& frame) {
  if(frame.malformed > 0) {
    log_warn(logger_.get(), "Ignored {} malformed adapter entr{} from {}",
             frame.malformed, frame.malformed == 1 ? "y" : "ies", peer_id);
  }
  remote_inventory_[peer_id] = frame.adapters;
  log_debug(logger_.get(), "Peer {} offers {} adapter(s)", peer_id, frame.adapters.size());
  if(inventory_events_.on_adapters_available) {
    inventory_events_.on_adapters_available(RemoteInventory{peer_id, frame.adapters});
  }
}

void Coordinator::handle_adapter_request(const std::string& peer_id, const AdapterRequestFrame& frame) {
  auto descriptor = registry_->get_adapter(frame.topic);
  if(!descriptor) {
    log_warn(logger_.get(), "Peer {} asked for unknown adapter {}", peer_id, frame.topic.substr(0, 8));
    return;
  }
  std::weak_ptr<Coordinator> weak = weak_from_this();
  registry_->find_path(descriptor->name, [weak, peer_id, descriptor](std::optional<fs::path> path) {
    auto self = weak.lock();
    if(!self) return;
    if(!path) {
      log_warn(self->logger_.get(), "Adapter {} vanished before it could be sent", descriptor->name);
      return;
    }
    auto peer = self->membership_->get_peer(peer_id);
    if(!peer) {
      log_debug(self->logger_.get(), "Peer {} left before {} could be sent", peer_id, descriptor->name);
      return;
    }
    self->transfer_->send_file(peer, peer_id, *path, *descriptor);
  });
}

void Coordinator::handle_transfer_complete(const TransferComplete& done) {
  if(!done.descriptor) return;
  auto descriptor = *done.descriptor;
  auto buffer = std::make_shared<std::string>(done.buffer);
  auto root = config_.storage_root;
  auto from = done.peer_id;
  auto* io = &io_;
  std::weak_ptr<Coordinator> weak = weak_from_this();

  asio::post(pool_, [weak, io, root, descriptor, buffer, from]() {
    std::optional<SavedAdapter> saved;
    std::string error;
    try {
      saved = persist_received_adapter(root, descriptor, *buffer, from);
    } catch(const std::exception& ex) {
      error = ex.what();
    }
    asio::post(*io, [weak, descriptor, from, saved = std::move(saved), error = std::move(error)]() {
      auto self = weak.lock();
      if(!self) return;
      if(!saved) {
        log_error(self->logger_.get(), "Saving {} failed: {}", descriptor.name, error);
        if(self->inventory_events_.on_save_failed) {
          self->inventory_events_.on_save_failed(TransferError{descriptor.topic, from, error, ErrorKind::NotFound});
        }
        return;
      }
      self->registry_->remember(saved->name, saved->path);
      if(saved->name != descriptor.name) self->registry_->remember(descriptor.name, saved->path);
      log_info(self->logger_.get(), "Saved {} to {}", saved->name, saved->path.string());
      if(self->inventory_events_.on_adapter_saved) self->inventory_events_.on_adapter_saved(*saved);
    });
  });
}

void Coordinator::broadcast_inventory() {
  auto adapters = registry_->all_adapters();
  membership_->send_message(make_adapter_list(adapters));
  if(inventory_events_.on_inventory_changed) inventory_events_.on_inventory_changed(adapters);
}

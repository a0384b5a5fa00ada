#include "swarm_membership.hpp"
#include "errors.hpp"
#include "log.hpp"

const char* room_state_name(RoomState state) {
  switch(state) {
    case RoomState::Disconnected: return "disconnected";
    case RoomState::Joining: return "joining";
    case RoomState::Joined: return "joined";
    case RoomState::Leaving: return "leaving";
    case RoomState::Recovering: return "recovering";
  }
  return "unknown";
}

std::optional<std::chrono::milliseconds> reconnect_delay(std::chrono::milliseconds base,
                                                         int attempt,
                                                         int max_attempts) {
  if(attempt < 1 || attempt > max_attempts) return std::nullopt;
  return base * attempt;
}

SwarmMembershipManager::SwarmMembershipManager(asio::io_context& io,
                                               SwarmFactory factory,
                                               SwarmConfig config,
                                               std::shared_ptr<Logger> logger)
  : io_(io),
    factory_(std::move(factory)),
    config_(config),
    logger_(std::move(logger)),
    health_timer_(io),
    recovery_timer_(io) {
}

SwarmMembershipManager::~SwarmMembershipManager() {
  room_events_ = RoomEvents{};
  peer_events_ = PeerEvents{};
  destroy();
}

void SwarmMembershipManager::initialize() {
  if(swarm_) return;
  if(!factory_) {
    throw InitError("no swarm factory configured");
  }

  std::shared_ptr<Swarm> swarm;
  try {
    swarm = factory_();
  } catch(const InitError&) {
    throw;
  } catch(const std::exception& ex) {
    throw InitError(std::string("swarm creation failed: ") + ex.what());
  }
  if(!swarm) {
    throw InitError("swarm factory returned nothing");
  }

  try {
    swarm->start([this](std::shared_ptr<SwarmSocket> socket){
      handle_connection(std::move(socket));
    });
  } catch(const InitError&) {
    throw;
  } catch(const std::exception& ex) {
    throw InitError(std::string("swarm start failed: ") + ex.what());
  }

  swarm_ = std::move(swarm);
  log_info(logger_.get(), "Swarm initialized as {}", local_peer_id());
}

std::string SwarmMembershipManager::local_peer_id() const {
  if(!swarm_) return "";
  return peer_id_from_key(swarm_->public_key());
}

bool SwarmMembershipManager::join_room(const Topic& topic,
                                       JoinHandler on_done,
                                       std::string code,
                                       std::optional<RoomClassification> classification) {
  if(!swarm_) {
    log_error(logger_.get(), "join_room({}) before initialize", topic.room_code());
    if(on_done) on_done(false);
    return false;
  }

  if(current_room_ && current_room_->topic == topic &&
     (state_ == RoomState::Joined || state_ == RoomState::Recovering)) {
    log_info(logger_.get(), "Already in room {}", topic.room_code());
    if(on_done) on_done(true);
    return true;
  }

  if(current_room_ && current_room_->topic != topic) {
    log_warn(logger_.get(), "Joining room {} while room {} is still current; leave it first",
             topic.room_code(), current_room_->topic.room_code());
  }

  finish_pending_join(false);
  recovery_timer_.cancel();

  RoomInfo info;
  info.topic = topic;
  info.code = code.empty() ? topic.room_code() : code;
  info.classification = classification ? *classification : classify_topic(topic);
  current_room_ = info;
  pending_join_ = std::move(on_done);
  joined_topics_.insert(topic);
  set_state(RoomState::Joining);

  const auto generation = ++join_generation_;
  log_info(logger_.get(), "Joining room {} ({})", info.code, classification_name(info.classification));
  swarm_->join(topic, [this, generation](){
    if(generation != join_generation_ || !current_room_) return;
    reconnect_attempts_ = 0;
    set_state(RoomState::Joined);
    schedule_health_check();
    log_info(logger_.get(), "Joined room {} with {} peer(s)", current_room_->code, connections_.size());
    auto room = *current_room_;
    if(room_events_.on_joined) room_events_.on_joined(room);
    finish_pending_join(true);
  });
  return true;
}

void SwarmMembershipManager::leave_room() {
  if(!current_room_ && joined_topics_.empty()) return;

  set_state(RoomState::Leaving);
  ++join_generation_;
  health_timer_.cancel();
  recovery_timer_.cancel();

  if(swarm_) {
    for(const auto& topic : joined_topics_) {
      swarm_->leave(topic);
    }
  }
  joined_topics_.clear();

  const bool had_peers = !connections_.empty();
  close_all_peers();

  auto code = current_room_ ? current_room_->code : std::string();
  current_room_.reset();
  set_state(RoomState::Disconnected);
  finish_pending_join(false);

  log_info(logger_.get(), "Left room {}", code);
  if(had_peers) emit_peers_updated();
  if(room_events_.on_left) room_events_.on_left();
}

bool SwarmMembershipManager::send_message(const Frame& frame, const std::optional<std::string>& peer_id) {
  const auto line = encode_frame_line(frame);

  if(peer_id) {
    auto it = connections_.find(*peer_id);
    if(it == connections_.end()) {
      log_debug(logger_.get(), "No peer {} for {}", *peer_id, frame_type(frame));
      return false;
    }
    auto socket = it->second.socket;
    if(!socket->write(line)) {
      log_debug(logger_.get(), "Write to {} failed; dropping peer", *peer_id);
      remove_peer(*peer_id, socket);
      return false;
    }
    return true;
  }

  std::vector<std::pair<std::string, std::shared_ptr<SwarmSocket>>> targets;
  for(const auto& kv : connections_) {
    targets.emplace_back(kv.first, kv.second.socket);
  }
  bool any = false;
  for(const auto& target : targets) {
    if(target.second->write(line)) {
      any = true;
    } else {
      log_debug(logger_.get(), "Write to {} failed; dropping peer", target.first);
      remove_peer(target.first, target.second);
    }
  }
  return any;
}

void SwarmMembershipManager::destroy() {
  leave_room();
  close_all_peers();
  health_timer_.cancel();
  recovery_timer_.cancel();
  if(swarm_) {
    auto swarm = std::move(swarm_);
    swarm_.reset();
    swarm->destroy();
    log_info(logger_.get(), "Swarm destroyed");
  }
  set_state(RoomState::Disconnected);
}

std::shared_ptr<SwarmSocket> SwarmMembershipManager::get_peer(const std::string& peer_id) const {
  auto it = connections_.find(peer_id);
  if(it == connections_.end()) return nullptr;
  return it->second.socket;
}

std::vector<std::string> SwarmMembershipManager::peer_ids() const {
  std::vector<std::string> out;
  out.reserve(connections_.size());
  for(const auto& kv : connections_) out.push_back(kv.first);
  return out;
}

std::optional<std::chrono::steady_clock::time_point>
SwarmMembershipManager::last_heartbeat(const std::string& peer_id) const {
  auto it = connections_.find(peer_id);
  if(it == connections_.end()) return std::nullopt;
  return it->second.last_heartbeat_at;
}

void SwarmMembershipManager::handle_connection(std::shared_ptr<SwarmSocket> socket) {
  if(!socket) return;
  if(!current_room_ || state_ == RoomState::Leaving || state_ == RoomState::Disconnected) {
    log_debug(logger_.get(), "Refusing connection outside a room");
    socket->close();
    return;
  }

  socket->configure(config_.keep_alive, config_.socket_timeout);
  const auto peer_id = peer_id_from_key(socket->remote_public_key());

  auto existing = connections_.find(peer_id);
  if(existing != connections_.end()) {
    auto old = existing->second.socket;
    connections_.erase(existing);
    if(old != socket) old->close();
  }

  PeerConnection pc;
  pc.peer_id = peer_id;
  pc.socket = socket;
  pc.connected_at = std::chrono::steady_clock::now();
  pc.last_heartbeat_at = pc.connected_at;
  pc.heartbeat_timer = std::make_unique<asio::steady_timer>(io_);
  connections_.emplace(peer_id, std::move(pc));
  log_info(logger_.get(), "Peer {} connected ({} total)", peer_id, connections_.size());

  std::weak_ptr<SwarmSocket> weak = socket;
  socket->start(
    [this, peer_id, weak](const std::string& line){
      if(auto s = weak.lock()) handle_line(peer_id, s, line);
    },
    [this, peer_id, weak](const std::error_code& ec){
      auto s = weak.lock();
      if(!s) return;
      if(ec && ec != asio::error::operation_aborted && ec != asio::error::eof) {
        log_debug(logger_.get(), "Peer {} socket error: {}", peer_id, ec.message());
      }
      remove_peer(peer_id, s);
    });

  // the socket may have closed inside start()
  if(!connections_.count(peer_id)) return;

  schedule_heartbeat(peer_id);

  if(state_ == RoomState::Recovering) {
    recovery_timer_.cancel();
    reconnect_attempts_ = 0;
    set_state(RoomState::Joined);
    log_info(logger_.get(), "Room {} recovered by inbound peer", current_room_->code);
  }

  emit_peers_updated();
  if(peer_events_.on_connected) peer_events_.on_connected(peer_id);
}

void SwarmMembershipManager::handle_line(const std::string& peer_id,
                                         const std::shared_ptr<SwarmSocket>& socket,
                                         const std::string& line) {
  Frame frame;
  try {
    frame = decode_frame_line(line);
  } catch(const ProtocolError& ex) {
    log_warn(logger_.get(), "Dropping frame from {}: {}", peer_id, ex.what());
    return;
  }

  auto it = connections_.find(peer_id);
  if(it == connections_.end() || it->second.socket != socket) return;

  if(std::holds_alternative<HeartbeatFrame>(frame)) {
    it->second.last_heartbeat_at = std::chrono::steady_clock::now();
    if(!socket->write(encode_frame_line(make_heartbeat_response(local_peer_id())))) {
      remove_peer(peer_id, socket);
    }
    return;
  }
  if(std::holds_alternative<HeartbeatResponseFrame>(frame)) {
    it->second.last_heartbeat_at = std::chrono::steady_clock::now();
    return;
  }

  if(!peer_events_.on_message) return;
  try {
    peer_events_.on_message(peer_id, frame);
  } catch(const ProtocolError& ex) {
    log_warn(logger_.get(), "Dropping {} from {}: {}", frame_type(frame), peer_id, ex.what());
  } catch(const std::exception& ex) {
    log_error(logger_.get(), "Handling {} from {} failed: {}", frame_type(frame), peer_id, ex.what());
  }
}

void SwarmMembershipManager::remove_peer(const std::string& peer_id,
                                         const std::shared_ptr<SwarmSocket>& socket) {
  auto it = connections_.find(peer_id);
  if(it == connections_.end() || it->second.socket != socket) return;
  auto entry = std::move(it->second);
  connections_.erase(it);
  if(entry.heartbeat_timer) entry.heartbeat_timer->cancel();
  if(entry.socket && entry.socket->is_open()) entry.socket->close();

  log_info(logger_.get(), "Peer {} disconnected ({} left)", peer_id, connections_.size());
  emit_peers_updated();
  if(peer_events_.on_disconnected) peer_events_.on_disconnected(peer_id);
}

void SwarmMembershipManager::schedule_heartbeat(const std::string& peer_id) {
  auto it = connections_.find(peer_id);
  if(it == connections_.end()) return;
  auto socket = it->second.socket;
  std::weak_ptr<SwarmSocket> weak = socket;
  it->second.heartbeat_timer->expires_after(config_.heartbeat_interval);
  it->second.heartbeat_timer->async_wait([this, peer_id, weak](const std::error_code& ec){
    if(ec) return;
    auto s = weak.lock();
    if(!s) return;
    auto it = connections_.find(peer_id);
    if(it == connections_.end() || it->second.socket != s) return;
    if(!s->write(encode_frame_line(make_heartbeat(local_peer_id())))) {
      remove_peer(peer_id, s);
      return;
    }
    schedule_heartbeat(peer_id);
  });
}

void SwarmMembershipManager::close_all_peers() {
  auto closing = std::move(connections_);
  connections_.clear();
  for(auto& kv : closing) {
    if(kv.second.heartbeat_timer) kv.second.heartbeat_timer->cancel();
    if(kv.second.socket) kv.second.socket->close();
    if(peer_events_.on_disconnected) peer_events_.on_disconnected(kv.first);
  }
}

void SwarmMembershipManager::schedule_health_check() {
  health_timer_.expires_after(config_.health_check_interval);
  health_timer_.async_wait([this](const std::error_code& ec){
    if(ec) return;
    run_health_check();
    if(current_room_) schedule_health_check();
  });
}

void SwarmMembershipManager::run_health_check() {
  if(!current_room_ || state_ != RoomState::Joined) return;
  log_debug(logger_.get(), "Health check: {} peer(s) in room {}", connections_.size(), current_room_->code);
  if(connections_.empty()) {
    log_warn(logger_.get(), "No peers left in room {}; starting recovery", current_room_->code);
    begin_recovery();
  }
}

void SwarmMembershipManager::begin_recovery() {
  set_state(RoomState::Recovering);
  schedule_recovery_attempt();
}

void SwarmMembershipManager::schedule_recovery_attempt() {
  const int next = reconnect_attempts_ + 1;
  auto delay = reconnect_delay(config_.reconnect_base_delay, next, config_.max_reconnect_attempts);
  if(!delay) {
    give_up_recovery();
    return;
  }
  reconnect_attempts_ = next;
  log_info(logger_.get(), "Reconnect attempt {}/{} in {} ms", next, config_.max_reconnect_attempts,
           delay->count());
  recovery_timer_.expires_after(*delay);
  recovery_timer_.async_wait([this](const std::error_code& ec){
    if(ec) return;
    attempt_rejoin();
  });
}

void SwarmMembershipManager::attempt_rejoin() {
  if(state_ != RoomState::Recovering || !current_room_ || !swarm_) return;
  const auto topic = current_room_->topic;
  const auto generation = ++join_generation_;
  swarm_->leave(topic);
  swarm_->join(topic, [this, generation](){
    if(generation != join_generation_ || state_ != RoomState::Recovering) return;
    if(!connections_.empty()) {
      reconnect_attempts_ = 0;
      set_state(RoomState::Joined);
      log_info(logger_.get(), "Room {} recovered with {} peer(s)", current_room_->code, connections_.size());
      return;
    }
    schedule_recovery_attempt();
  });
}

void SwarmMembershipManager::give_up_recovery() {
  log_error(logger_.get(), "[{}] Giving up on room {} after {} attempts; join again to retry",
            error_kind_name(ErrorKind::ExhaustedRetries),
            current_room_ ? current_room_->code : std::string(),
            reconnect_attempts_);
  ++join_generation_;
  health_timer_.cancel();
  if(swarm_) {
    for(const auto& topic : joined_topics_) swarm_->leave(topic);
  }
  joined_topics_.clear();
  close_all_peers();
  current_room_.reset();
  set_state(RoomState::Disconnected);
  if(room_events_.on_left) room_events_.on_left();
}

void SwarmMembershipManager::set_state(RoomState state) {
  if(state_ == state) return;
  state_ = state;
  if(room_events_.on_state_changed) room_events_.on_state_changed(state);
}

void SwarmMembershipManager::emit_peers_updated() {
  if(room_events_.on_peers_updated) room_events_.on_peers_updated(connections_.size());
}

void SwarmMembershipManager::finish_pending_join(bool joined) {
  auto handler = std::move(pending_join_);
  pending_join_ = nullptr;
  if(handler) handler(joined);
}

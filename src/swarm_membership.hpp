#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "protocol.hpp"
#include "swarm.hpp"
#include "topic.hpp"

class Logger;

struct SwarmConfig {
  std::chrono::milliseconds heartbeat_interval{30000};
  std::chrono::milliseconds health_check_interval{60000};
  std::chrono::milliseconds reconnect_base_delay{5000};
  int max_reconnect_attempts = 5;
  std::chrono::seconds keep_alive{15};
  std::chrono::seconds socket_timeout{0};
};

enum class RoomState { Disconnected, Joining, Joined, Leaving, Recovering };

const char* room_state_name(RoomState state);

struct RoomInfo {
  Topic topic;
  std::string code;
  RoomClassification classification = RoomClassification::Private;
};

struct PeerConnection {
  std::string peer_id;
  std::shared_ptr<SwarmSocket> socket;
  std::chrono::steady_clock::time_point connected_at;
  std::chrono::steady_clock::time_point last_heartbeat_at;
  std::unique_ptr<asio::steady_timer> heartbeat_timer;
};

struct RoomEvents {
  std::function<void(const RoomInfo&)> on_joined;
  std::function<void()> on_left;
  std::function<void(std::size_t)> on_peers_updated;
  std::function<void(RoomState)> on_state_changed;
};

struct PeerEvents {
  std::function<void(const std::string& peer_id)> on_connected;
  std::function<void(const std::string& peer_id)> on_disconnected;
  std::function<void(const std::string& peer_id, const Frame& frame)> on_message;
};

// Backoff for recovery attempt `attempt` (1-based): base * attempt, or
// nothing once attempt exceeds max_attempts.
std::optional<std::chrono::milliseconds> reconnect_delay(std::chrono::milliseconds base,
                                                         int attempt,
                                                         int max_attempts);

// Owns the swarm handle and the peer connection set of the current room.
// All methods must be called on the io_context thread.
class SwarmMembershipManager {
public:
  using JoinHandler = std::function<void(bool joined)>;

  SwarmMembershipManager(asio::io_context& io,
                         SwarmFactory factory,
                         SwarmConfig config,
                         std::shared_ptr<Logger> logger = nullptr);
  ~SwarmMembershipManager();

  SwarmMembershipManager(const SwarmMembershipManager&) = delete;
  SwarmMembershipManager& operator=(const SwarmMembershipManager&) = delete;

  void set_room_events(RoomEvents events) { room_events_ = std::move(events); }
  void set_peer_events(PeerEvents events) { peer_events_ = std::move(events); }

  // Idempotent. Throws InitError when the overlay cannot start.
  void initialize();
  bool initialized() const { return swarm_ != nullptr; }

  // Joins as client and server; on_done runs after the first discovery
  // flush (true) or when the join is abandoned by leave/destroy (false).
  // Joining while another room is current does not leave it.
  bool join_room(const Topic& topic,
                 JoinHandler on_done = nullptr,
                 std::string code = {},
                 std::optional<RoomClassification> classification = std::nullopt);
  void leave_room();
  // Returns true when at least one peer accepted the frame.
  bool send_message(const Frame& frame, const std::optional<std::string>& peer_id = std::nullopt);
  void destroy();

  std::shared_ptr<SwarmSocket> get_peer(const std::string& peer_id) const;
  std::size_t peers_count() const { return connections_.size(); }
  std::vector<std::string> peer_ids() const;
  std::optional<std::chrono::steady_clock::time_point> last_heartbeat(const std::string& peer_id) const;

  RoomState state() const { return state_; }
  const std::optional<RoomInfo>& current_room() const { return current_room_; }
  int reconnect_attempts() const { return reconnect_attempts_; }
  std::string local_peer_id() const;
  const SwarmConfig& config() const { return config_; }

  // One pass of the periodic health check.
  void run_health_check();

private:
  void handle_connection(std::shared_ptr<SwarmSocket> socket);
  void handle_line(const std::string& peer_id,
                   const std::shared_ptr<SwarmSocket>& socket,
                   const std::string& line);
  void remove_peer(const std::string& peer_id, const std::shared_ptr<SwarmSocket>& socket);
  void schedule_heartbeat(const std::string& peer_id);
  void close_all_peers();

  void schedule_health_check();
  void begin_recovery();
  void schedule_recovery_attempt();
  void attempt_rejoin();
  void give_up_recovery();

  void set_state(RoomState state);
  void emit_peers_updated();
  void finish_pending_join(bool joined);

  asio::io_context& io_;
  SwarmFactory factory_;
  SwarmConfig config_;
  std::shared_ptr<Logger> logger_;
  RoomEvents room_events_;
  PeerEvents peer_events_;

  std::shared_ptr<Swarm> swarm_;
  std::map<std::string, PeerConnection> connections_;
  std::optional<RoomInfo> current_room_;
  std::set<Topic> joined_topics_;
  RoomState state_ = RoomState::Disconnected;
  int reconnect_attempts_ = 0;
  uint64_t join_generation_ = 0;
  JoinHandler pending_join_;
  asio::steady_timer health_timer_;
  asio::steady_timer recovery_timer_;
};

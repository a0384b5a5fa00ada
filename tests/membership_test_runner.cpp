#include "errors.hpp"
#include "protocol.hpp"
#include "swarm_membership.hpp"
#include "test_runner_utils.hpp"
#include "topic.hpp"
#include "log.hpp"

#include <asio.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace adaptermesh::test;
using namespace std::chrono_literals;

namespace {

SwarmConfig fast_config() {
  SwarmConfig config;
  config.heartbeat_interval = 20ms;
  config.health_check_interval = 5000ms;
  config.reconnect_base_delay = 10ms;
  config.max_reconnect_attempts = 2;
  return config;
}

// Health checks fire quickly so an empty room starts recovering.
SwarmConfig recovery_config() {
  auto config = fast_config();
  config.health_check_interval = 30ms;
  return config;
}

struct Node {
  Node(TestContext& ctx, MemoryNetwork& network, char key, SwarmConfig config = fast_config())
    : logger(std::make_shared<Logger>(std::string("node-") + key)),
      peer_id(peer_id_from_key(test_key(key))),
      manager(std::make_unique<SwarmMembershipManager>(network.io(),
                                                       memory_swarm_factory(network, test_key(key), &swarm),
                                                       config, logger)) {
    ctx.logs.attach(logger);
    RoomEvents room;
    room.on_joined = [this](const RoomInfo& info) { ++joined; last_room = info; };
    room.on_left = [this]() { ++left; };
    room.on_peers_updated = [this](std::size_t count) { peer_updates.push_back(count); };
    room.on_state_changed = [this](RoomState state) { states.push_back(state); };
    manager->set_room_events(std::move(room));

    PeerEvents peers;
    peers.on_connected = [this](const std::string& id) { connected.push_back(id); };
    peers.on_disconnected = [this](const std::string& id) { disconnected.push_back(id); };
    peers.on_message = [this](const std::string& id, const Frame& frame) {
      messages.emplace_back(id, frame);
    };
    manager->set_peer_events(std::move(peers));
  }

  std::shared_ptr<Logger> logger;
  std::string peer_id;
  std::shared_ptr<MemorySwarm> swarm;
  std::unique_ptr<SwarmMembershipManager> manager;

  int joined = 0;
  int left = 0;
  std::optional<RoomInfo> last_room;
  std::vector<std::size_t> peer_updates;
  std::vector<RoomState> states;
  std::vector<std::string> connected;
  std::vector<std::string> disconnected;
  std::vector<std::pair<std::string, Frame>> messages;
};

bool join(asio::io_context& io, Node& node, const Topic& topic, std::string code = {}) {
  bool done = false;
  bool result = false;
  node.manager->join_room(topic, [&](bool ok) { result = ok; done = true; }, std::move(code));
  return run_until(io, [&]{ return done; }, 2s) && result;
}

bool test_join_connects_peers(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  Node a(ctx, network, 'a');
  Node b(ctx, network, 'b');
  a.manager->initialize();
  b.manager->initialize();
  ADAPTERMESH_EXPECT(a.manager->local_peer_id() == "aaaaaaaaaaaa");

  auto topic = topic_for_room_code("PIZZA-042");
  ADAPTERMESH_EXPECT(join(io, a, topic, "PIZZA-042"));
  ADAPTERMESH_EXPECT(a.manager->state() == RoomState::Joined);
  ADAPTERMESH_EXPECT(a.last_room && a.last_room->code == "PIZZA-042");
  ADAPTERMESH_EXPECT(a.last_room->classification == RoomClassification::Private);

  ADAPTERMESH_EXPECT(join(io, b, topic));
  ADAPTERMESH_EXPECT(run_until(io, [&]{
    return a.manager->peers_count() == 1 && b.manager->peers_count() == 1;
  }));
  ADAPTERMESH_EXPECT(a.connected == std::vector<std::string>{b.peer_id});
  ADAPTERMESH_EXPECT(b.connected == std::vector<std::string>{a.peer_id});
  ADAPTERMESH_EXPECT(b.last_room && b.last_room->code == topic.room_code());
  ADAPTERMESH_EXPECT(a.joined == 1 && b.joined == 1);
  ADAPTERMESH_EXPECT(!a.peer_updates.empty() && a.peer_updates.back() == 1);
  ADAPTERMESH_EXPECT(a.manager->get_peer(b.peer_id) != nullptr);
  ADAPTERMESH_EXPECT(a.manager->peer_ids() == std::vector<std::string>{b.peer_id});

  auto a_socket = std::static_pointer_cast<MemorySocket>(a.manager->get_peer(b.peer_id));
  ADAPTERMESH_EXPECT(a_socket->keep_alive() == std::chrono::seconds(15));
  return true;
}

bool test_leave_disconnects_peers(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  Node a(ctx, network, 'a');
  Node b(ctx, network, 'b');
  a.manager->initialize();
  b.manager->initialize();
  auto topic = Topic::random();
  ADAPTERMESH_EXPECT(join(io, a, topic));
  ADAPTERMESH_EXPECT(join(io, b, topic));
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return a.manager->peers_count() == 1; }));

  b.manager->leave_room();
  ADAPTERMESH_EXPECT(b.left == 1);
  ADAPTERMESH_EXPECT(b.manager->state() == RoomState::Disconnected);
  ADAPTERMESH_EXPECT(!b.manager->current_room());
  ADAPTERMESH_EXPECT(b.manager->peers_count() == 0);
  ADAPTERMESH_EXPECT(b.disconnected == std::vector<std::string>{a.peer_id});
  ADAPTERMESH_EXPECT(b.swarm->leaves() == 1);

  ADAPTERMESH_EXPECT(run_until(io, [&]{ return a.manager->peers_count() == 0; }));
  ADAPTERMESH_EXPECT(a.disconnected == std::vector<std::string>{b.peer_id});
  ADAPTERMESH_EXPECT(a.left == 0);
  ADAPTERMESH_EXPECT(a.manager->state() == RoomState::Joined);

  // Leaving with no room is a no-op.
  b.manager->leave_room();
  ADAPTERMESH_EXPECT(b.left == 1);
  return true;
}

bool test_rejoin_same_topic_is_noop(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  Node a(ctx, network, 'a');
  a.manager->initialize();
  auto topic = general_room_topic();
  ADAPTERMESH_EXPECT(join(io, a, topic, "general"));
  ADAPTERMESH_EXPECT(a.last_room->classification == RoomClassification::General);
  ADAPTERMESH_EXPECT(join(io, a, topic, "general"));
  ADAPTERMESH_EXPECT(a.swarm->joins() == 1);
  ADAPTERMESH_EXPECT(a.joined == 1);
  return true;
}

bool test_messages_and_heartbeats(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  Node a(ctx, network, 'a');
  Node b(ctx, network, 'b');
  a.manager->initialize();
  b.manager->initialize();
  auto topic = Topic::random();
  ADAPTERMESH_EXPECT(join(io, a, topic));
  ADAPTERMESH_EXPECT(join(io, b, topic));
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return a.manager->peers_count() == 1 && b.manager->peers_count() == 1; }));

  auto first_seen = a.manager->last_heartbeat(b.peer_id);
  ADAPTERMESH_EXPECT(first_seen.has_value());

  ADAPTERMESH_EXPECT(a.manager->send_message(make_adapter_request("wanted"), b.peer_id));
  ADAPTERMESH_EXPECT(a.manager->send_message(make_adapter_list({})));
  ADAPTERMESH_EXPECT(!a.manager->send_message(make_adapter_request("x"), std::string("nobody")));
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return b.messages.size() == 2; }));
  ADAPTERMESH_EXPECT(b.messages[0].first == a.peer_id);
  ADAPTERMESH_EXPECT(std::get<AdapterRequestFrame>(b.messages[0].second).topic == "wanted");
  ADAPTERMESH_EXPECT(std::holds_alternative<AdapterListFrame>(b.messages[1].second));

  // Heartbeats are answered by the manager and never surface as messages.
  ADAPTERMESH_EXPECT(run_until(io, [&]{
    auto seen = a.manager->last_heartbeat(b.peer_id);
    return seen && *seen > *first_seen;
  }));
  ADAPTERMESH_EXPECT(b.messages.size() == 2);
  ADAPTERMESH_EXPECT(a.messages.empty());

  a.manager->get_peer(b.peer_id)->write("this is not json\n");
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return ctx.logs.contains("Dropping frame"); }, 1s));
  ADAPTERMESH_EXPECT(b.manager->peers_count() == 1);
  return true;
}

bool test_recovery_gives_up_after_max_attempts(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  network.partitioned = true;
  Node a(ctx, network, 'a', recovery_config());
  a.manager->initialize();
  auto topic = Topic::random();
  ADAPTERMESH_EXPECT(join(io, a, topic));

  ADAPTERMESH_EXPECT(run_until(io, [&]{ return a.left == 1; }, 3s));
  ADAPTERMESH_EXPECT(a.manager->state() == RoomState::Disconnected);
  ADAPTERMESH_EXPECT(!a.manager->current_room());
  ADAPTERMESH_EXPECT(a.manager->reconnect_attempts() == 2);
  ADAPTERMESH_EXPECT(std::find(a.states.begin(), a.states.end(), RoomState::Recovering) != a.states.end());
  // initial join plus one rejoin per attempt
  ADAPTERMESH_EXPECT(a.swarm->joins() == 3);
  ADAPTERMESH_EXPECT(ctx.logs.contains("exhausted-retries"));
  ADAPTERMESH_EXPECT(ctx.logs.contains("Reconnect attempt 2/2"));

  // an explicit join after giving up starts over with a fresh retry budget
  ADAPTERMESH_EXPECT(join(io, a, topic));
  ADAPTERMESH_EXPECT(a.manager->reconnect_attempts() == 0);
  ADAPTERMESH_EXPECT(a.manager->state() == RoomState::Joined);
  ADAPTERMESH_EXPECT(a.manager->current_room());
  ADAPTERMESH_EXPECT(run_until(io, [&]{
    return a.manager->state() == RoomState::Recovering && a.manager->reconnect_attempts() == 1;
  }, 2s));
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return a.left == 2; }, 3s));
  ADAPTERMESH_EXPECT(a.manager->reconnect_attempts() == 2);
  ADAPTERMESH_EXPECT(a.swarm->joins() == 6);
  return true;
}

bool test_inbound_peer_ends_recovery(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  network.partitioned = true;
  auto slow = recovery_config();
  slow.reconnect_base_delay = 2000ms;
  Node a(ctx, network, 'a', slow);
  Node b(ctx, network, 'b');
  a.manager->initialize();
  b.manager->initialize();
  auto topic = Topic::random();
  ADAPTERMESH_EXPECT(join(io, a, topic));
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return a.manager->state() == RoomState::Recovering; }, 2s));
  ADAPTERMESH_EXPECT(a.manager->reconnect_attempts() == 1);

  network.partitioned = false;
  ADAPTERMESH_EXPECT(join(io, b, topic));
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return a.manager->state() == RoomState::Joined; }, 2s));
  ADAPTERMESH_EXPECT(a.manager->reconnect_attempts() == 0);
  ADAPTERMESH_EXPECT(a.manager->peers_count() == 1);
  ADAPTERMESH_EXPECT(a.left == 0);
  return true;
}

bool test_peer_loss_triggers_recovery(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  auto config = recovery_config();
  config.max_reconnect_attempts = 5;
  config.reconnect_base_delay = 20ms;
  Node a(ctx, network, 'a', config);
  Node b(ctx, network, 'b');
  a.manager->initialize();
  b.manager->initialize();
  auto topic = Topic::random();
  ADAPTERMESH_EXPECT(join(io, a, topic));
  ADAPTERMESH_EXPECT(join(io, b, topic));
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return a.manager->peers_count() == 1; }));

  network.sever_all();
  ADAPTERMESH_EXPECT(run_until(io, [&]{
    return std::find(a.states.begin(), a.states.end(), RoomState::Recovering) != a.states.end();
  }, 2s));
  // The rejoin relinks the two nodes.
  ADAPTERMESH_EXPECT(run_until(io, [&]{
    return a.manager->state() == RoomState::Joined && a.manager->peers_count() == 1;
  }, 3s));
  ADAPTERMESH_EXPECT(a.connected.size() == 2);
  ADAPTERMESH_EXPECT(a.left == 0);
  return true;
}

bool test_initialize_failures(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  network.fail_start = true;
  Node a(ctx, network, 'a');

  bool threw = false;
  try {
    a.manager->initialize();
  } catch(const InitError&) {
    threw = true;
  }
  ADAPTERMESH_EXPECT(threw);
  ADAPTERMESH_EXPECT(!a.manager->initialized());

  bool result = true;
  ADAPTERMESH_EXPECT(!a.manager->join_room(Topic::random(), [&](bool ok) { result = ok; }));
  ADAPTERMESH_EXPECT(!result);

  SwarmMembershipManager empty(io, []() -> std::shared_ptr<Swarm> { return nullptr; }, fast_config());
  threw = false;
  try {
    empty.initialize();
  } catch(const InitError& ex) {
    threw = std::string(ex.what()).find("returned nothing") != std::string::npos;
  }
  ADAPTERMESH_EXPECT(threw);

  network.fail_start = false;
  a.manager->initialize();
  ADAPTERMESH_EXPECT(a.manager->initialized());
  a.manager->initialize();
  ADAPTERMESH_EXPECT(a.manager->initialized());
  return true;
}

bool test_destroy_releases_overlay(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  Node a(ctx, network, 'a');
  Node b(ctx, network, 'b');
  a.manager->initialize();
  b.manager->initialize();
  auto topic = Topic::random();
  ADAPTERMESH_EXPECT(join(io, a, topic));
  ADAPTERMESH_EXPECT(join(io, b, topic));
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return b.manager->peers_count() == 1; }));

  a.manager->destroy();
  ADAPTERMESH_EXPECT(a.swarm->destroyed());
  ADAPTERMESH_EXPECT(!a.manager->initialized());
  ADAPTERMESH_EXPECT(a.left == 1);
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return b.manager->peers_count() == 0; }));

  a.manager->destroy();
  ADAPTERMESH_EXPECT(a.left == 1);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"join_connects_peers", test_join_connects_peers},
    {"leave_disconnects_peers", test_leave_disconnects_peers},
    {"rejoin_same_topic_is_noop", test_rejoin_same_topic_is_noop},
    {"messages_and_heartbeats", test_messages_and_heartbeats},
    {"recovery_gives_up_after_max_attempts", test_recovery_gives_up_after_max_attempts},
    {"inbound_peer_ends_recovery", test_inbound_peer_ends_recovery},
    {"peer_loss_triggers_recovery", test_peer_loss_triggers_recovery},
    {"initialize_failures", test_initialize_failures},
    {"destroy_releases_overlay", test_destroy_releases_overlay}
  };
  return run_test_suite("membership", tests, argc, argv);
}

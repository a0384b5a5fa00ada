#include "chunked_transfer.hpp"
#include "coordinator.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"
#include "topic.hpp"
#include "utils.hpp"
#include "log.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace adaptermesh::test;
using namespace std::chrono_literals;

namespace {

struct CoordNode {
  CoordNode(TestContext& ctx, asio::io_context& io, MemoryNetwork& network, char key)
    : store(std::string("coord_") + key),
      logger(std::make_shared<Logger>(std::string("coord-") + key)),
      peer_id(peer_id_from_key(test_key(key))) {
    CoordinatorConfig config;
    config.storage_root = store.root();
    config.chunk_send_delay = 1ms;
    config.worker_threads = 1;
    coordinator = std::make_shared<Coordinator>(io, config, memory_swarm_factory(network, test_key(key), &swarm), logger);
    ctx.logs.attach(logger);

    RoomEvents room;
    room.on_joined = [this](const RoomInfo&) { ++joined; };
    room.on_left = [this]() { ++left; };
    coordinator->set_room_events(std::move(room));

    TransferEvents transfer;
    transfer.on_progress = [this](const TransferProgress& p) { progress.push_back(p); };
    transfer.on_complete = [this](const TransferComplete& c) { completed.push_back(c); };
    transfer.on_error = [this](const TransferError& e) { errors.push_back(e); };
    coordinator->set_transfer_events(std::move(transfer));

    InventoryEvents inventory;
    inventory.on_adapters_available = [this](const RemoteInventory& r) { offers.push_back(r); };
    inventory.on_inventory_changed = [this](const std::vector<AdapterDescriptor>& all) {
      inventory_sizes.push_back(all.size());
    };
    inventory.on_adapter_saved = [this](const SavedAdapter& s) { saved.push_back(s); };
    inventory.on_save_failed = [this](const TransferError& e) { save_failures.push_back(e); };
    coordinator->set_inventory_events(std::move(inventory));
  }

  std::size_t remote_count(const std::string& from) const {
    auto it = coordinator->remote_inventory().find(from);
    return it == coordinator->remote_inventory().end() ? 0 : it->second.size();
  }

  TempWorkspace store;
  std::shared_ptr<Logger> logger;
  std::string peer_id;
  std::shared_ptr<MemorySwarm> swarm;
  std::shared_ptr<Coordinator> coordinator;

  int joined = 0;
  int left = 0;
  std::vector<TransferProgress> progress;
  std::vector<TransferComplete> completed;
  std::vector<TransferError> errors;
  std::vector<RemoteInventory> offers;
  std::vector<std::size_t> inventory_sizes;
  std::vector<SavedAdapter> saved;
  std::vector<TransferError> save_failures;
};

std::optional<RoomResult> join_code(asio::io_context& io, CoordNode& node, const std::string& code) {
  std::optional<RoomResult> result;
  node.coordinator->join_room_by_code(code, [&](const RoomResult& r) { result = r; });
  if(!run_until(io, [&]{ return result.has_value(); }, 2s)) return std::nullopt;
  return result;
}

std::optional<ShareResult> share(asio::io_context& io, CoordNode& node, const std::string& name) {
  std::optional<ShareResult> result;
  node.coordinator->share_adapter(name, [&](const ShareResult& r) { result = r; });
  if(!run_until(io, [&]{ return result.has_value(); }, 3s)) return std::nullopt;
  return result;
}

bool connect_pair(asio::io_context& io, CoordNode& a, CoordNode& b, const std::string& code) {
  if(!a.coordinator->initialize().success) return false;
  if(!b.coordinator->initialize().success) return false;
  auto ra = join_code(io, a, code);
  auto rb = join_code(io, b, code);
  if(!ra || !ra->success || !rb || !rb->success) return false;
  return run_until(io, [&]{
    return a.coordinator->membership().peers_count() == 1 && b.coordinator->membership().peers_count() == 1;
  });
}

AdapterChunkFrame single_chunk(const std::string& name, const std::string& data) {
  AdapterDescriptor d;
  d.name = name;
  d.topic = Topic::random().hex();
  d.size = data.size();
  d.checksum = sha256_hex(data);
  d.timestamp = unix_time_ms();

  AdapterChunkFrame f;
  f.topic = d.topic;
  f.payload = data;
  f.index = 0;
  f.total = 1;
  f.checksum = sha256_hex(data);
  f.metadata = d;
  return f;
}

bool test_share_request_and_save(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  CoordNode a(ctx, io, network, 'a');
  CoordNode b(ctx, io, network, 'b');

  auto data = pattern_bytes(2 * kChunkSize + kChunkSize / 2, 31);
  make_adapter(a.store.root(), "sql-helper", data);
  write_registry_record(a.store.root(), "sql-helper", nlohmann::json{
    {"adapter_id","sql-helper"},{"base_model","llama-3-8b"},{"training_method","lora"},{"lora_rank",16}
  });

  ADAPTERMESH_EXPECT(a.coordinator->initialize().success);
  ADAPTERMESH_EXPECT(b.coordinator->initialize().success);
  auto room = join_code(io, a, " pizza-042 ");
  ADAPTERMESH_EXPECT(room && room->success);
  ADAPTERMESH_EXPECT(room->code == "PIZZA-042");
  ADAPTERMESH_EXPECT(room->topic == topic_for_room_code("PIZZA-042").hex());
  ADAPTERMESH_EXPECT(room->classification == RoomClassification::Private);
  ADAPTERMESH_EXPECT(join_code(io, b, "PIZZA-042")->success);
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return b.coordinator->membership().peers_count() == 1; }));

  auto shared = share(io, a, "sql-helper");
  ADAPTERMESH_EXPECT(shared && shared->success);
  ADAPTERMESH_EXPECT(shared->descriptor->size == data.size());
  ADAPTERMESH_EXPECT(shared->descriptor->checksum == sha256_hex(data));
  ADAPTERMESH_EXPECT(shared->descriptor->topic.size() == Topic::kHexSize);
  ADAPTERMESH_EXPECT(shared->descriptor->metadata->base_model == "llama-3-8b");
  ADAPTERMESH_EXPECT(a.coordinator->local_inventory().size() == 1);
  ADAPTERMESH_EXPECT(a.inventory_sizes == std::vector<std::size_t>{1});

  ADAPTERMESH_EXPECT(run_until(io, [&]{ return b.remote_count(a.peer_id) == 1; }));
  const auto offered = b.coordinator->remote_inventory().at(a.peer_id).front();
  ADAPTERMESH_EXPECT(offered.name == "sql-helper");
  ADAPTERMESH_EXPECT(offered.metadata && offered.metadata->extra["lora_rank"] == 16);

  ADAPTERMESH_EXPECT(b.coordinator->request_adapter(offered.topic, a.peer_id).success);
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return !b.saved.empty(); }, 5s));

  const auto& saved = b.saved.front();
  ADAPTERMESH_EXPECT(saved.name == "sql-helper");
  ADAPTERMESH_EXPECT(saved.from == a.peer_id);
  ADAPTERMESH_EXPECT(saved.path == b.store / "weights/sql-helper/adapter_model.safetensors");
  ADAPTERMESH_EXPECT(read_file(saved.path) == data);
  auto record = nlohmann::json::parse(read_file(saved.record));
  ADAPTERMESH_EXPECT(record["base_model"] == "llama-3-8b");
  ADAPTERMESH_EXPECT(record["source"] == "p2p");
  ADAPTERMESH_EXPECT(record["received_from"] == a.peer_id);

  ADAPTERMESH_EXPECT(b.progress.size() == 3);
  ADAPTERMESH_EXPECT(b.completed.size() == 1 && b.completed[0].direction == TransferDirection::Receive);
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return a.completed.size() == 1; }));
  ADAPTERMESH_EXPECT(a.completed[0].direction == TransferDirection::Send);
  ADAPTERMESH_EXPECT(a.errors.empty() && b.errors.empty());

  std::optional<bool> exists;
  b.coordinator->check_adapter_exists("sql_helper", [&](bool found) { exists = found; });
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return exists.has_value(); }));
  ADAPTERMESH_EXPECT(*exists);
  return true;
}

bool test_broadcast_request_reaches_owner(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  CoordNode a(ctx, io, network, 'a');
  CoordNode b(ctx, io, network, 'b');
  auto data = pattern_bytes(1000, 41);
  make_adapter(a.store.root(), "tiny", data, "adapter_model.bin");
  ADAPTERMESH_EXPECT(connect_pair(io, a, b, "TACO-001"));

  auto shared = share(io, a, "tiny");
  ADAPTERMESH_EXPECT(shared && shared->success);
  ADAPTERMESH_EXPECT(shared->descriptor->metadata->file_type == "pytorch");

  ADAPTERMESH_EXPECT(b.coordinator->request_adapter(shared->descriptor->topic).success);
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return !b.saved.empty(); }, 5s));
  ADAPTERMESH_EXPECT(b.saved[0].path.filename() == "adapter_model.bin");
  ADAPTERMESH_EXPECT(read_file(b.saved[0].path) == data);
  return true;
}

bool test_unshare_and_disconnect_update_inventory(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  CoordNode a(ctx, io, network, 'a');
  CoordNode b(ctx, io, network, 'b');
  make_adapter(a.store.root(), "first", pattern_bytes(100, 1));
  make_adapter(a.store.root(), "second", pattern_bytes(100, 2));
  ADAPTERMESH_EXPECT(connect_pair(io, a, b, "SOUP-777"));

  auto first = share(io, a, "first");
  auto second = share(io, a, "second");
  ADAPTERMESH_EXPECT(first && first->success && second && second->success);
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return b.remote_count(a.peer_id) == 2; }));

  ADAPTERMESH_EXPECT(a.coordinator->unshare_adapter(first->descriptor->topic).success);
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return b.remote_count(a.peer_id) == 1; }));
  ADAPTERMESH_EXPECT(b.coordinator->remote_inventory().at(a.peer_id)[0].name == "second");
  ADAPTERMESH_EXPECT(a.inventory_sizes == std::vector<std::size_t>({1, 2, 1}));

  auto unknown = a.coordinator->unshare_adapter(first->descriptor->topic);
  ADAPTERMESH_EXPECT(!unknown.success && unknown.kind == ErrorKind::NotFound);

  ADAPTERMESH_EXPECT(a.coordinator->leave_room().success);
  ADAPTERMESH_EXPECT(a.left == 1);
  ADAPTERMESH_EXPECT(a.coordinator->remote_inventory().empty());
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return b.coordinator->remote_inventory().empty(); }));
  ADAPTERMESH_EXPECT(!b.offers.empty() && b.offers.back().from == a.peer_id && b.offers.back().adapters.empty());
  // The advertised table outlives the room.
  ADAPTERMESH_EXPECT(a.coordinator->local_inventory().size() == 1);
  return true;
}

bool test_invalid_arguments(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  CoordNode a(ctx, io, network, 'a');

  std::optional<RoomResult> room;
  a.coordinator->join_room_by_code("PIZZA-042", [&](const RoomResult& r) { room = r; });
  ADAPTERMESH_EXPECT(room && !room->success && room->kind == ErrorKind::NotFound);
  auto request = a.coordinator->request_adapter(std::string(64, 'a'));
  ADAPTERMESH_EXPECT(!request.success && request.kind == ErrorKind::NotFound);
  std::optional<ShareResult> early;
  a.coordinator->share_adapter("x", [&](const ShareResult& r) { early = r; });
  ADAPTERMESH_EXPECT(early && early->kind == ErrorKind::NotFound);

  ADAPTERMESH_EXPECT(a.coordinator->initialize().success);
  ADAPTERMESH_EXPECT(a.coordinator->initialize().success);

  room.reset();
  a.coordinator->join_room(std::string("not-a-topic"), [&](const RoomResult& r) { room = r; });
  ADAPTERMESH_EXPECT(room && room->kind == ErrorKind::InvalidArgument);
  room.reset();
  a.coordinator->join_room_by_code("   ", [&](const RoomResult& r) { room = r; });
  ADAPTERMESH_EXPECT(room && room->kind == ErrorKind::InvalidArgument);

  auto empty_topic = a.coordinator->request_adapter("");
  ADAPTERMESH_EXPECT(!empty_topic.success && empty_topic.kind == ErrorKind::InvalidArgument);
  auto ghost = a.coordinator->request_adapter(std::string(64, 'a'), std::string("ghostpeer000"));
  ADAPTERMESH_EXPECT(!ghost.success && ghost.kind == ErrorKind::NotFound);
  auto nobody = a.coordinator->request_adapter(std::string(64, 'a'));
  ADAPTERMESH_EXPECT(!nobody.success && nobody.kind == ErrorKind::NotFound);

  auto missing = share(io, a, "does-not-exist");
  ADAPTERMESH_EXPECT(missing && !missing->success && missing->kind == ErrorKind::NotFound);
  make_adapter(a.store.root(), "hollow", "");
  auto hollow = share(io, a, "hollow");
  ADAPTERMESH_EXPECT(hollow && !hollow->success && hollow->kind == ErrorKind::NotFound);
  ADAPTERMESH_EXPECT(a.coordinator->local_inventory().empty());
  return true;
}

bool test_room_kinds(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  CoordNode a(ctx, io, network, 'a');
  ADAPTERMESH_EXPECT(a.coordinator->initialize().success);

  std::optional<RoomResult> room;
  a.coordinator->join_general_room([&](const RoomResult& r) { room = r; });
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return room.has_value(); }));
  ADAPTERMESH_EXPECT(room->success && room->code == "general");
  ADAPTERMESH_EXPECT(room->classification == RoomClassification::General);
  ADAPTERMESH_EXPECT(room->topic == general_room_topic().hex());
  a.coordinator->leave_room();

  room.reset();
  a.coordinator->join_local_room([&](const RoomResult& r) { room = r; });
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return room.has_value(); }));
  ADAPTERMESH_EXPECT(room->success && room->code == "local");
  ADAPTERMESH_EXPECT(room->classification == RoomClassification::LocalNetwork);
  a.coordinator->leave_room();

  room.reset();
  a.coordinator->create_room([&](const RoomResult& r) { room = r; });
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return room.has_value(); }));
  ADAPTERMESH_EXPECT(room->success && room->code == room->topic.substr(0, 8));
  ADAPTERMESH_EXPECT(room->classification == RoomClassification::Private);
  ADAPTERMESH_EXPECT(a.joined == 3 && a.left == 2);
  return true;
}

bool test_init_failure_is_reported(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  network.fail_start = true;
  CoordNode a(ctx, io, network, 'a');
  auto result = a.coordinator->initialize();
  ADAPTERMESH_EXPECT(!result.success);
  ADAPTERMESH_EXPECT(result.kind == ErrorKind::Init);
  ADAPTERMESH_EXPECT(!a.coordinator->initialized());
  return true;
}

bool test_received_artifacts_are_persisted(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  CoordNode a(ctx, io, network, 'a');
  ADAPTERMESH_EXPECT(a.coordinator->initialize().success);

  auto data = pattern_bytes(500, 51);
  a.coordinator->transfer().handle_received_chunk(single_chunk("direct", data), "bbbbbbbbbbbb");
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return !a.saved.empty(); }));
  ADAPTERMESH_EXPECT(read_file(a.store / "weights/direct/adapter_model.safetensors") == data);

  std::optional<bool> exists;
  a.coordinator->check_adapter_exists("direct", [&](bool found) { exists = found; });
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return exists.has_value(); }));
  ADAPTERMESH_EXPECT(*exists);

  a.coordinator->transfer().handle_received_chunk(single_chunk("..", data), "bbbbbbbbbbbb");
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return !a.save_failures.empty(); }));
  ADAPTERMESH_EXPECT(a.save_failures[0].peer_id == "bbbbbbbbbbbb");
  ADAPTERMESH_EXPECT(a.saved.size() == 1);

  auto corrupt = single_chunk("corrupt", data);
  corrupt.checksum = sha256_hex("nope");
  a.coordinator->transfer().handle_received_chunk(corrupt, "bbbbbbbbbbbb");
  ADAPTERMESH_EXPECT(a.errors.size() == 1 && a.errors[0].kind == ErrorKind::Integrity);
  return true;
}

bool test_unknown_request_is_ignored(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  CoordNode a(ctx, io, network, 'a');
  CoordNode b(ctx, io, network, 'b');
  ADAPTERMESH_EXPECT(connect_pair(io, a, b, "NOPE-404"));

  ADAPTERMESH_EXPECT(b.coordinator->request_adapter(std::string(64, 'f'), a.peer_id).success);
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return ctx.logs.contains("asked for unknown adapter"); }));
  ADAPTERMESH_EXPECT(a.completed.empty() && b.saved.empty());
  ADAPTERMESH_EXPECT(a.coordinator->membership().peers_count() == 1);
  return true;
}

bool test_destroy_resets_state(TestContext& ctx) {
  asio::io_context io;
  MemoryNetwork network(io);
  CoordNode a(ctx, io, network, 'a');
  CoordNode b(ctx, io, network, 'b');
  make_adapter(a.store.root(), "kept", pattern_bytes(10));
  ADAPTERMESH_EXPECT(connect_pair(io, a, b, "BYE-100"));
  ADAPTERMESH_EXPECT(share(io, a, "kept")->success);

  ADAPTERMESH_EXPECT(a.coordinator->destroy().success);
  ADAPTERMESH_EXPECT(!a.coordinator->initialized());
  ADAPTERMESH_EXPECT(a.coordinator->local_inventory().empty());
  ADAPTERMESH_EXPECT(a.swarm->destroyed());
  ADAPTERMESH_EXPECT(run_until(io, [&]{ return b.coordinator->membership().peers_count() == 0; }));

  auto after = a.coordinator->request_adapter(std::string(64, 'a'));
  ADAPTERMESH_EXPECT(after.kind == ErrorKind::NotFound);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"share_request_and_save", test_share_request_and_save},
    {"broadcast_request_reaches_owner", test_broadcast_request_reaches_owner},
    {"unshare_and_disconnect_update_inventory", test_unshare_and_disconnect_update_inventory},
    {"invalid_arguments", test_invalid_arguments},
    {"room_kinds", test_room_kinds},
    {"init_failure_is_reported", test_init_failure_is_reported},
    {"received_artifacts_are_persisted", test_received_artifacts_are_persisted},
    {"unknown_request_is_ignored", test_unknown_request_is_ignored},
    {"destroy_resets_state", test_destroy_resets_state}
  };
  return run_test_suite("coordinator", tests, argc, argv);
}

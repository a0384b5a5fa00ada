#pragma once
#include <asio.hpp>
#include <asio/thread_pool.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "adapter_descriptor.hpp"
#include "chunked_transfer.hpp"
#include "content_registry.hpp"
#include "errors.hpp"
#include "swarm_membership.hpp"

class Logger;

struct CoordinatorConfig {
  SwarmConfig swarm;
  std::filesystem::path storage_root;
  std::chrono::milliseconds chunk_send_delay{10};
  bool transfer_debug = false;
  uint64_t max_artifact_size = kDefaultMaxArtifactSize;
  std::size_t worker_threads = 2;
};

struct RoomResult : OperationResult {
  std::string topic;
  std::string code;
  RoomClassification classification = RoomClassification::Private;
};

struct ShareResult : OperationResult {
  std::optional<AdapterDescriptor> descriptor;
};

struct RemoteInventory {
  std::string from;
  std::vector<AdapterDescriptor> adapters;
};

struct SavedAdapter {
  std::string name;
  std::string topic;
  std::string from;
  std::filesystem::path path;
  std::filesystem::path record;
  uint64_t size = 0;
};

struct InventoryEvents {
  std::function<void(const RemoteInventory&)> on_adapters_available;
  std::function<void(const std::vector<AdapterDescriptor>&)> on_inventory_changed;
  std::function<void(const SavedAdapter&)> on_adapter_saved;
  std::function<void(const TransferError&)> on_save_failed;
};

// Facade over membership, transfer and registry. Host-facing operations
// report failures through result structs and never throw. Everything runs
// on the io_context thread.
class Coordinator : public std::enable_shared_from_this<Coordinator> {
public:
  using RoomHandler = std::function<void(const RoomResult&)>;
  using ShareHandler = std::function<void(const ShareResult&)>;
  using ExistsHandler = std::function<void(bool exists)>;

  Coordinator(asio::io_context& io,
              CoordinatorConfig config,
              SwarmFactory factory,
              std::shared_ptr<Logger> logger = nullptr);
  ~Coordinator();

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  void set_room_events(RoomEvents events) { room_events_ = std::move(events); }
  void set_transfer_events(TransferEvents events) { transfer_events_ = std::move(events); }
  void set_inventory_events(InventoryEvents events) { inventory_events_ = std::move(events); }

  OperationResult initialize();
  bool initialized() const { return initialized_; }

  void join_room(const Topic& topic, RoomHandler done = nullptr);
  void join_room(const std::string& topic_hex, RoomHandler done = nullptr);
  void join_room_by_code(const std::string& code, RoomHandler done = nullptr);
  void join_general_room(RoomHandler done = nullptr);
  void join_local_room(RoomHandler done = nullptr);
  // Fresh random topic.
  void create_room(RoomHandler done = nullptr);
  OperationResult leave_room();

  void share_adapter(const std::string& name, ShareHandler done = nullptr);
  OperationResult unshare_adapter(const std::string& topic);
  OperationResult request_adapter(const std::string& topic,
                                  const std::optional<std::string>& from_peer = std::nullopt);
  void check_adapter_exists(const std::string& name, ExistsHandler done);
  OperationResult refresh_registry();

  OperationResult destroy();

  const std::map<std::string, std::vector<AdapterDescriptor>>& remote_inventory() const { return remote_inventory_; }
  std::vector<AdapterDescriptor> local_inventory() const;
  SwarmMembershipManager& membership() { return *membership_; }
  const SwarmMembershipManager& membership() const { return *membership_; }
  ChunkedTransfer& transfer() { return *transfer_; }
  ContentRegistry& registry() { return *registry_; }

private:
  void join_with(const Topic& topic, std::string code,
                 std::optional<RoomClassification> classification, RoomHandler done);
  void wire_events();
  void handle_peer_message(const std::string& peer_id, const Frame& frame);
  void handle_adapter_list(const std::string& peer_id, const AdapterListFrame& frame);
  void handle_adapter_request(const std::string& peer_id, const AdapterRequestFrame& frame);
  void handle_transfer_complete(const TransferComplete& done);
  void broadcast_inventory();

  asio::io_context& io_;
  CoordinatorConfig config_;
  std::shared_ptr<Logger> logger_;
  asio::thread_pool pool_;
  std::unique_ptr<SwarmMembershipManager> membership_;
  std::shared_ptr<ChunkedTransfer> transfer_;
  std::shared_ptr<ContentRegistry> registry_;

  RoomEvents room_events_;
  TransferEvents transfer_events_;
  InventoryEvents inventory_events_;

  std::map<std::string, std::vector<AdapterDescriptor>> remote_inventory_;
  bool initialized_ = false;
};

// Writes a received artifact under `storage_root` and returns where it
// went. Blocking; throws std::runtime_error on failure.
SavedAdapter persist_received_adapter(const std::filesystem::path& storage_root,
                                      const AdapterDescriptor& descriptor,
                                      const std::string& buffer,
                                      const std::string& from_peer);

#include "adapter_engine.hpp"
#include "coordinator.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"
#include "log.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace adaptermesh::test;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<SettingsManager> node_settings(const std::string& key,
                                               const std::string& auto_join,
                                               const std::string& bootstrap = std::string()) {
  auto settings = std::make_shared<SettingsManager>();
  std::string error;
  settings->set_from_string("listen_port", "0", error);
  settings->set_from_string("listen_ip", "127.0.0.1", error);
  settings->set_from_string("public_key", key, error);
  settings->set_from_string("auto_join", auto_join, error);
  settings->set_from_string("chunk_send_delay_ms", "1", error);
  if(!bootstrap.empty()) settings->set_from_string("bootstrap_peers", bootstrap, error);
  return settings;
}

AdapterEngine::Options engine_options(const TempWorkspace& ws) {
  AdapterEngine::Options options;
  options.start_cli_thread = false;
  options.handle_signals = false;
  options.worker_threads = 1;
  options.workspace_root = ws.root();
  return options;
}

bool test_two_nodes_exchange_adapter(TestContext& ctx) {
  TempWorkspace ws_a("engine_a");
  TempWorkspace ws_b("engine_b");
  auto data = pattern_bytes(3 * 64 * 1024 + 123, 61);
  make_adapter(ws_a / "lora_adapters", "shared-one", data);

  AdapterEngine a(node_settings(test_key('a'), "PIZZA-042"), engine_options(ws_a));
  ctx.logs.attach(a.logger(), "a");
  a.start_background();
  ADAPTERMESH_EXPECT(a.listen_port() != 0);
  ADAPTERMESH_EXPECT(a.peer_id() == "aaaaaaaaaaaa");
  ADAPTERMESH_EXPECT(wait_for_condition([&]{ return a.stats().room_state == RoomState::Joined; }, 5s));
  ADAPTERMESH_EXPECT(a.stats().room_code == "PIZZA-042");

  AdapterEngine b(node_settings(test_key('b'), "pizza-042", "127.0.0.1:" + std::to_string(a.listen_port())),
                  engine_options(ws_b));
  ctx.logs.attach(b.logger(), "b");
  b.start_background();
  ADAPTERMESH_EXPECT(wait_for_condition([&]{
    return a.stats().connected_peers == 1 && b.stats().connected_peers == 1;
  }, 10s));

  a.execute_command("share shared-one");
  ADAPTERMESH_EXPECT(wait_for_condition([&]{ return a.stats().local_adapters == 1; }, 5s));
  ADAPTERMESH_EXPECT(wait_for_condition([&]{ return b.stats().remote_adapters == 1; }, 5s));

  b.execute_command("remote");
  b.execute_command("request #1");
  auto target = ws_b / "lora_adapters/weights/shared-one/adapter_model.safetensors";
  auto record = ws_b / "lora_adapters/registry/shared-one.json";
  ADAPTERMESH_EXPECT(wait_for_condition([&]{
    return std::filesystem::exists(record) && read_file(target) == data;
  }, 10s));
  ADAPTERMESH_EXPECT(ctx.logs.wait_for_substring("Saved shared-one", 5s));

  b.stop();
  ADAPTERMESH_EXPECT(wait_for_condition([&]{ return a.stats().connected_peers == 0; }, 5s));
  a.stop();
  return true;
}

bool test_identity_is_generated(TestContext& ctx) {
  TempWorkspace ws("engine_identity");
  auto settings = node_settings("", "none");
  AdapterEngine engine(settings, engine_options(ws));
  ctx.logs.attach(engine.logger());
  engine.start_background();

  ADAPTERMESH_EXPECT(engine.public_key().size() == 64);
  ADAPTERMESH_EXPECT(is_hex_string(engine.public_key(), 64));
  ADAPTERMESH_EXPECT(settings->get<std::string>("public_key") == engine.public_key());
  ADAPTERMESH_EXPECT(engine.peer_id() == engine.public_key().substr(0, 12));
  ADAPTERMESH_EXPECT(std::filesystem::is_directory(ws / "lora_adapters"));
  ADAPTERMESH_EXPECT(engine.stats().room_state == RoomState::Disconnected);

  engine.execute_command("create");
  ADAPTERMESH_EXPECT(wait_for_condition([&]{ return engine.stats().room_state == RoomState::Joined; }, 5s));
  ADAPTERMESH_EXPECT(engine.stats().room_code.size() == 8);
  engine.execute_command("leave");
  ADAPTERMESH_EXPECT(wait_for_condition([&]{ return engine.stats().room_state == RoomState::Disconnected; }, 5s));
  engine.stop();
  return true;
}

bool test_invalid_identity_is_rejected(TestContext&) {
  TempWorkspace ws("engine_bad_key");
  AdapterEngine engine(node_settings("not-hex-at-all", "none"), engine_options(ws));
  bool threw = false;
  try {
    engine.start();
  } catch(const std::runtime_error& ex) {
    threw = std::string(ex.what()).find("hex") != std::string::npos;
  }
  ADAPTERMESH_EXPECT(threw);
  ADAPTERMESH_EXPECT(!engine.coordinator());
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"two_nodes_exchange_adapter", test_two_nodes_exchange_adapter},
    {"identity_is_generated", test_identity_is_generated},
    {"invalid_identity_is_rejected", test_invalid_identity_is_rejected}
  };
  return run_test_suite("adaptermesh", tests, argc, argv);
}

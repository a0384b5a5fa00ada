#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <poll.h>
#include <unistd.h>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include <asio.hpp>

#include "coordinator.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

// Console front end. Input is read on its own thread and every command
// runs on the io_context thread, so handlers touch the Coordinator
// without locking.
class AdapterCLI {
public:
  using QuitHandler = std::function<void()>;

  AdapterCLI(asio::io_context& io,
             std::shared_ptr<Coordinator> coordinator,
             std::shared_ptr<SettingsManager> settings,
             std::shared_ptr<Logger> logger,
             QuitHandler on_quit = nullptr)
    : io_(io),
      coordinator_(std::move(coordinator)),
      settings_(std::move(settings)),
      logger_(std::move(logger)),
      console_(std::make_shared<Logger>()),
      on_quit_(std::move(on_quit)),
      alive_(std::make_shared<bool>(true)) {}

  ~AdapterCLI() {
    stop();
    if(coordinator_) {
      coordinator_->set_room_events(RoomEvents{});
      coordinator_->set_transfer_events(TransferEvents{});
      coordinator_->set_inventory_events(InventoryEvents{});
    }
  }

  AdapterCLI(const AdapterCLI&) = delete;
  AdapterCLI& operator=(const AdapterCLI&) = delete;

  // Output channel of the console; listeners see every printed line.
  std::shared_ptr<Logger> console() const { return console_; }

  void start() {
    if(cli_thread_.joinable()) return;
    running_ = true;
    cli_thread_ = std::thread([this](){ run_loop(); });
  }

  void stop() {
    running_ = false;
    if(cli_thread_.joinable() && cli_thread_.get_id() != std::this_thread::get_id()) {
      cli_thread_.join();
    }
  }

  void execute_command(const std::string& line) {
    std::weak_ptr<bool> alive = alive_;
    asio::post(io_, [this, alive, line]() {
      if(alive.expired()) return;
      dispatch(line);
    });
  }

  // Prints room, transfer and inventory notifications as they arrive.
  void attach_notifications() {
    if(!coordinator_) return;

    RoomEvents room;
    room.on_left = [this]() { say("Left room"); };
    room.on_peers_updated = [this](std::size_t count) { say("Peers in room: {}", count); };
    room.on_state_changed = [this](RoomState state) {
      if(state == RoomState::Recovering) {
        say("Connection to room lost, recovering");
      }
    };
    coordinator_->set_room_events(std::move(room));

    TransferEvents transfer;
    transfer.on_progress = [this](const TransferProgress& p) {
      auto decile = static_cast<int>(p.percent / 10.0);
      auto& last = progress_deciles_[p.topic];
      if(decile <= last && p.done != p.total) return;
      last = decile;
      say("{} {} {:.0f}% ({}/{} chunks)",
          p.direction == TransferDirection::Send ? "Sending" : "Receiving",
          short_topic(p.topic), p.percent, p.done, p.total);
    };
    transfer.on_complete = [this](const TransferComplete& done) {
      progress_deciles_.erase(done.topic);
      auto name = done.descriptor ? done.descriptor->name : short_topic(done.topic);
      if(done.direction == TransferDirection::Send) {
        say("Sent {} to {}", name, done.peer_id);
      } else {
        say("Received {} from {} ({})", name, done.peer_id, format_file_size(done.buffer.size()));
      }
    };
    transfer.on_error = [this](const TransferError& error) {
      progress_deciles_.erase(error.topic);
      say_err("Transfer {} with {} failed ({}): {}", short_topic(error.topic), error.peer_id,
              error_kind_name(error.kind), error.message);
    };
    coordinator_->set_transfer_events(std::move(transfer));

    InventoryEvents inventory;
    inventory.on_adapters_available = [this](const RemoteInventory& remote) {
      if(remote.adapters.empty()) return;
      say("Peer {} offers {} adapter(s); type 'remote' to list", remote.from, remote.adapters.size());
    };
    inventory.on_adapter_saved = [this](const SavedAdapter& saved) {
      say("Saved {} to {}", saved.name, saved.path.string());
    };
    inventory.on_save_failed = [this](const TransferError& error) {
      say_err("Could not save {}: {}", short_topic(error.topic), error.message);
    };
    coordinator_->set_inventory_events(std::move(inventory));
  }

private:
  template<typename... Args>
  void say(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    print_out(console_.get(), fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void say_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    print_err(console_.get(), fmt, std::forward<Args>(args)...);
  }

  static std::string short_topic(const std::string& topic) {
    return topic.substr(0, 8);
  }

  static std::string rest_of(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    return trim_copy(rest);
  }

  // ---- input thread -------------------------------------------------------

  bool wait_for_input() {
    pollfd fd{};
    fd.fd = STDIN_FILENO;
    fd.events = POLLIN;
    int rc = ::poll(&fd, 1, 200);
    return rc > 0 && (fd.revents & (POLLIN | POLLHUP));
  }

  void handle_input(const std::string& raw) {
    auto line = trim_copy(raw);
    if(line.empty()) return;
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd == "quit" || cmd == "exit" || cmd == "q") {
      running_ = false;
    }
    execute_command(line);
  }

#ifdef HAVE_READLINE
  static AdapterCLI*& active_instance() {
    static AdapterCLI* instance = nullptr;
    return instance;
  }

  static void on_readline(char* line) {
    auto* self = active_instance();
    if(!line) {
      if(self) self->input_closed_ = true;
      return;
    }
    std::string text(line);
    free(line);
    if(!text.empty()) add_history(text.c_str());
    if(self) self->handle_input(text);
  }

  void run_loop() {
    active_instance() = this;
    rl_callback_handler_install("> ", &AdapterCLI::on_readline);
    while(running_ && !input_closed_) {
      if(wait_for_input()) rl_callback_read_char();
    }
    rl_callback_handler_remove();
    active_instance() = nullptr;
  }
#else
  void run_loop() {
    bool prompt = true;
    while(running_) {
      if(prompt) {
        std::cout << "> " << std::flush;
        prompt = false;
      }
      if(!wait_for_input()) continue;
      std::string line;
      if(!std::getline(std::cin, line)) break;
      handle_input(line);
      prompt = true;
    }
  }
#endif

  // ---- commands (io_context thread) ---------------------------------------

  void dispatch(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return;
    log_debug(logger_.get(), "console: {}", line);

    if(cmd == "status") {
      print_status();
    } else if(cmd == "create") {
      create_command(rest_of(iss));
    } else if(cmd == "join") {
      join_command(rest_of(iss));
    } else if(cmd == "general") {
      coordinator_->join_general_room(room_reporter(false));
    } else if(cmd == "local") {
      coordinator_->join_local_room(room_reporter(false));
    } else if(cmd == "leave") {
      report(coordinator_->leave_room(), "Leaving room");
    } else if(cmd == "share") {
      share_command(rest_of(iss));
    } else if(cmd == "unshare") {
      unshare_command(rest_of(iss));
    } else if(cmd == "adapters" || cmd == "ls") {
      list_local();
    } else if(cmd == "remote") {
      list_remote();
    } else if(cmd == "request" || cmd == "get-adapter") {
      request_command(rest_of(iss));
    } else if(cmd == "exists") {
      exists_command(rest_of(iss));
    } else if(cmd == "peers") {
      list_peers();
    } else if(cmd == "refresh") {
      report(coordinator_->refresh_registry(), "Rescanning artifact store");
    } else if(cmd == "settings" || cmd == "s") {
      auto args = rest_of(iss);
      handle_settings_command(args.empty() ? "list" : args);
    } else if(cmd == "set") {
      auto args = rest_of(iss);
      handle_settings_command(args.empty() ? "list" : "set " + args);
    } else if(cmd == "get") {
      auto args = rest_of(iss);
      handle_settings_command(args.empty() ? "get" : "get " + args);
    } else if(cmd == "save") {
      handle_settings_command("save");
    } else if(cmd == "load") {
      handle_settings_command("load");
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit" || cmd == "q") {
      say("Quitting...");
      if(on_quit_) on_quit_();
    } else {
      print_help();
      say("Unknown command: {}", cmd);
    }
  }

  void report(const OperationResult& result, const std::string& what) {
    if(result.success) {
      say("{}", what);
    } else {
      say_err("{} failed ({}): {}", what, error_kind_name(result.kind), result.error);
    }
  }

  Coordinator::RoomHandler room_reporter(bool created) {
    std::weak_ptr<bool> alive = alive_;
    return [this, alive, created](const RoomResult& r) {
      if(alive.expired()) return;
      if(!r.success) {
        say_err("Join failed ({}): {}", error_kind_name(r.kind), r.error);
        return;
      }
      say("Joined room {} ({})", r.code, classification_name(r.classification));
      say("Topic: {}", r.topic);
      if(created) say("Give peers the topic (or code) above so they can join");
    };
  }

  void print_status() {
    const auto& m = coordinator_->membership();
    say("Peer id: {}", m.local_peer_id());
    say("State: {}", room_state_name(m.state()));
    if(const auto& room = m.current_room()) {
      say("Room: {} ({})", room->code, classification_name(room->classification));
      say("Topic: {}", room->topic.hex());
    }
    say("Peers: {}", m.peers_count());
    if(m.state() == RoomState::Recovering) {
      say("Reconnect attempt: {}/{}", m.reconnect_attempts(), m.config().max_reconnect_attempts);
    }
    std::size_t remote = 0;
    for(const auto& kv : coordinator_->remote_inventory()) remote += kv.second.size();
    say("Shared adapters: {}  Remote adapters: {}", coordinator_->local_inventory().size(), remote);
    say("Store: {}", coordinator_->registry().storage_root().string());
  }

  void create_command(const std::string& args) {
    if(args == "code") {
      auto code = generate_friendly_code();
      say("Room code: {}", code);
      coordinator_->join_room_by_code(code, room_reporter(true));
      return;
    }
    if(!args.empty()) {
      say("Usage: create [code]");
      return;
    }
    coordinator_->create_room(room_reporter(true));
  }

  void join_command(const std::string& target) {
    if(target.empty()) {
      say("Usage: join <topic|code>");
      return;
    }
    if(is_hex_string(target, Topic::kHexSize)) {
      coordinator_->join_room(target, room_reporter(false));
      return;
    }
    if(!looks_like_friendly_code(target)) {
      say("Treating '{}' as a private room code", target);
    }
    coordinator_->join_room_by_code(target, room_reporter(false));
  }

  void share_command(const std::string& name) {
    if(name.empty()) {
      say("Usage: share <adapter name>");
      return;
    }
    std::weak_ptr<bool> alive = alive_;
    coordinator_->share_adapter(name, [this, alive, name](const ShareResult& r) {
      if(alive.expired()) return;
      if(!r.success || !r.descriptor) {
        say_err("Share of {} failed ({}): {}", name, error_kind_name(r.kind), r.error);
        return;
      }
      say("Sharing {} ({}) as {}", r.descriptor->name, format_file_size(r.descriptor->size), r.descriptor->topic);
    });
  }

  // Full topic for a unique prefix among `candidates`.
  std::optional<std::string> resolve_topic(const std::string& prefix,
                                           const std::vector<std::string>& candidates) {
    std::vector<std::string> matches;
    for(const auto& topic : candidates) {
      if(topic.rfind(prefix, 0) == 0 &&
         std::find(matches.begin(), matches.end(), topic) == matches.end()) {
        matches.push_back(topic);
      }
    }
    if(matches.size() == 1) return matches.front();
    if(matches.empty()) {
      say("No adapter topic starts with '{}'", prefix);
    } else {
      say("'{}' is ambiguous ({} matches)", prefix, matches.size());
    }
    return std::nullopt;
  }

  void unshare_command(const std::string& prefix) {
    if(prefix.empty()) {
      say("Usage: unshare <topic>");
      return;
    }
    std::vector<std::string> topics;
    for(const auto& d : coordinator_->local_inventory()) topics.push_back(d.topic);
    auto topic = resolve_topic(prefix, topics);
    if(!topic) return;
    report(coordinator_->unshare_adapter(*topic), "Stopped sharing " + short_topic(*topic));
  }

  void list_local() {
    auto adapters = coordinator_->local_inventory();
    if(adapters.empty()) {
      say("Not sharing any adapters");
      return;
    }
    for(const auto& d : adapters) {
      say("  {}  {:<32} {:>12}  sha256 {}", short_topic(d.topic), d.name,
          format_file_size(d.size), d.checksum.substr(0, 12));
    }
  }

  void list_remote() {
    remote_index_.clear();
    for(const auto& kv : coordinator_->remote_inventory()) {
      for(const auto& d : kv.second) remote_index_.emplace_back(kv.first, d);
    }
    if(remote_index_.empty()) {
      say("No adapters offered by peers");
      return;
    }
    for(std::size_t i = 0; i < remote_index_.size(); ++i) {
      const auto& entry = remote_index_[i];
      std::string base = entry.second.metadata ? entry.second.metadata->base_model : std::string();
      say("  #{:<3} {}  {:<32} {:>12}  from {}{}", i + 1, short_topic(entry.second.topic),
          entry.second.name, format_file_size(entry.second.size), entry.first,
          base.empty() ? std::string() : "  base " + base);
    }
  }

  void request_command(const std::string& args) {
    std::istringstream iss(args);
    std::string target;
    std::string peer;
    iss >> target >> peer;
    if(target.empty()) {
      say("Usage: request <topic|#n> [peer]");
      return;
    }

    std::optional<std::string> topic;
    if(target[0] == '#') {
      std::size_t index = 0;
      try {
        index = static_cast<std::size_t>(std::stoul(target.substr(1)));
      } catch(const std::exception&) {
        index = 0;
      }
      if(index == 0 || index > remote_index_.size()) {
        say("No entry {}; run 'remote' first", target);
        return;
      }
      topic = remote_index_[index - 1].second.topic;
      if(peer.empty()) peer = remote_index_[index - 1].first;
    } else {
      std::vector<std::string> topics;
      for(const auto& kv : coordinator_->remote_inventory()) {
        for(const auto& d : kv.second) topics.push_back(d.topic);
      }
      topic = is_hex_string(target, Topic::kHexSize) ? std::optional<std::string>(target)
                                                     : resolve_topic(target, topics);
      if(!topic) return;
    }

    std::optional<std::string> from;
    if(!peer.empty()) from = peer;
    report(coordinator_->request_adapter(*topic, from),
           "Requested " + short_topic(*topic) + (from ? " from " + *from : std::string()));
  }

  void exists_command(const std::string& name) {
    if(name.empty()) {
      say("Usage: exists <adapter name>");
      return;
    }
    std::weak_ptr<bool> alive = alive_;
    coordinator_->check_adapter_exists(name, [this, alive, name](bool exists) {
      if(alive.expired()) return;
      say("{} {}", name, exists ? "exists locally" : "was not found");
    });
  }

  void list_peers() {
    const auto& m = coordinator_->membership();
    auto ids = m.peer_ids();
    if(ids.empty()) {
      say("No connected peers");
      return;
    }
    auto now = std::chrono::steady_clock::now();
    for(const auto& id : ids) {
      auto beat = m.last_heartbeat(id);
      auto offered = coordinator_->remote_inventory().count(id)
        ? coordinator_->remote_inventory().at(id).size() : 0;
      if(beat) {
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - *beat).count();
        say("  {}  last heartbeat {}s ago, {} adapter(s)", id, age, offered);
      } else {
        say("  {}  {} adapter(s)", id, offered);
      }
    }
  }

  // ---- settings -----------------------------------------------------------

  void apply_setting_side_effects(const std::string& key) {
    if(key == "transfer_debug") {
      coordinator_->transfer().set_debug(settings_->get<bool>("transfer_debug"));
    } else if(key == "verbose") {
      init(settings_->get<bool>("verbose"));
    } else if(key != "help" && key != "save") {
      say("{} takes effect after restart", key);
    }
  }

  void handle_settings_command(const std::string& args) {
    if(!settings_) {
      say("Settings manager unavailable.");
      return;
    }
    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action == "list") {
      list_settings();
      return;
    }

    if(action == "get") {
      std::string key;
      iss >> key;
      if(key.empty()) {
        say("Usage: settings get <key>");
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        say("Unknown setting '{}'.", key);
        return;
      }
      say("{} = {}", *resolved, settings_->value_as_string(*resolved));
      return;
    }

    if(action == "set") {
      std::string key;
      iss >> key;
      auto value = rest_of(iss);
      if(key.empty() || value.empty()) {
        say("Usage: settings set <key> <value>");
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        say("Unknown setting '{}'.", key);
        return;
      }
      std::string error;
      if(settings_->set_from_string(*resolved, value, error)) {
        say("{} = {}", *resolved, settings_->value_as_string(*resolved));
        apply_setting_side_effects(*resolved);
      } else {
        say_err("Failed to set {}: {}", *resolved, error);
      }
      return;
    }

    if(action == "save") {
      if(settings_->save()) {
        say("Saved settings to {}", settings_->settings_path().string());
      } else {
        say_err("Failed to save settings.");
      }
      return;
    }

    if(action == "load") {
      if(settings_->load()) {
        apply_setting_side_effects("transfer_debug");
        apply_setting_side_effects("verbose");
        say("Loaded settings from {}", settings_->settings_path().string());
      } else {
        say("Settings file {} not found.", settings_->settings_path().string());
      }
      return;
    }

    say("Unknown settings command.");
  }

  void list_settings() {
    auto keys = settings_->keys();
    std::sort(keys.begin(), keys.end());
    for(const auto& key : keys) {
      say("  {:<26} = {:<20} {}", key, settings_->value_as_string(key), settings_->description(key));
    }
  }

  void print_help() {
    say("Available commands:");
    say("  help|h|?                          Show this help message");
    say("  quit|exit|q                       Exit the application");
    say("  status                            Show room, peers and inventory summary");
    say("  create [code]                     Create a room (random topic, or a friendly code)");
    say("  join <topic|code>                 Join a room by 64-hex topic or private code");
    say("  general                           Join the public community room");
    say("  local                             Join the local network room");
    say("  leave                             Leave the current room");
    say("  share <name>                      Advertise an adapter from the store");
    say("  unshare <topic>                   Stop advertising an adapter");
    say("  adapters|ls                       List adapters this node advertises");
    say("  remote                            List adapters offered by peers");
    say("  request <topic|#n> [peer]         Download an adapter");
    say("  exists <name>                     Check whether an adapter is in the store");
    say("  peers                             List connected peers");
    say("  refresh                           Rescan the artifact store");
    say("  settings [list|get|set|save|load] Manage runtime settings");
    say("  set [key value]                   Shortcut for settings set (lists when empty)");
    say("  get <key>                         Shortcut for settings get");
    say("  save                              Shortcut for settings save");
    say("  load                              Shortcut for settings load");
  }

  asio::io_context& io_;
  std::shared_ptr<Coordinator> coordinator_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Logger> console_;
  QuitHandler on_quit_;
  std::shared_ptr<bool> alive_;
  std::atomic<bool> running_{false};
  std::atomic<bool> input_closed_{false};
  std::thread cli_thread_;
  std::map<std::string, int> progress_deciles_;
  std::vector<std::pair<std::string, AdapterDescriptor>> remote_index_;
};

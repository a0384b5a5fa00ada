#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every node setting: canonical key, short aliases for the command line and
// the console `set` command, type, default, bounds and whether `save` writes it.
inline const nlohmann::json SETTINGS_TABLE = nlohmann::json::array({
  {{"key","listen_port"},             {"aliases", {"lp","port"}},         {"type","int"},    {"default",9000},       {"min",0}, {"max",65535}, {"description","TCP port the overlay listens on (0 = any)"}},
  {{"key","listen_ip"},               {"aliases", {"li","ip"}},           {"type","string"}, {"default","127.0.0.1"},{"description","Interface/IP to bind"}},
  {{"key","bootstrap_peers"},         {"aliases", {"bootstrap","bp"}},    {"type","list"},   {"default",nlohmann::json::array()}, {"description","Comma separated host:port peers dialed on join"}},
  {{"key","public_key"},              {"aliases", {"key","pk"}},          {"type","string"}, {"default",""},         {"description","Hex identity of this node (generated when empty)"}},
  {{"key","storage_root"},            {"aliases", {"store","sr"}},        {"type","string"}, {"default",""},         {"description","Artifact store directory (default <workspace>/lora_adapters)"}},
  {{"key","heartbeat_interval_s"},    {"aliases", {"heartbeat","hb"}},    {"type","int"},    {"default",30},         {"min",1}, {"description","Seconds between heartbeats to each peer"}},
  {{"key","health_check_interval_s"}, {"aliases", {"health","hc"}},       {"type","int"},    {"default",60},         {"min",1}, {"description","Seconds between room health checks"}},
  {{"key","reconnect_base_delay_ms"}, {"aliases", {"backoff","rbd"}},     {"type","int"},    {"default",5000},       {"min",1}, {"description","Base delay of the linear reconnect backoff"}},
  {{"key","max_reconnect_attempts"},  {"aliases", {"retries","mra"}},     {"type","int"},    {"default",5},          {"min",0}, {"description","Recovery attempts before the room is abandoned"}},
  {{"key","chunk_send_delay_ms"},     {"aliases", {"chunk_delay","csd"}}, {"type","int"},    {"default",10},         {"min",0}, {"description","Pause between outgoing chunks"}},
  {{"key","max_artifact_size_mb"},    {"aliases", {"max_artifact","mas"}},{"type","int"},    {"default",8192},       {"min",1}, {"max",1048576}, {"description","Largest adapter accepted from a peer, in MiB"}},
  {{"key","keep_alive_s"},            {"aliases", {"keepalive","ka"}},    {"type","int"},    {"default",15},         {"min",0}, {"description","TCP keep-alive idle time for peer sockets (0 = off)"}},
  {{"key","socket_timeout_s"},        {"aliases", {"timeout","st"}},      {"type","int"},    {"default",0},          {"min",0}, {"description","Peer socket user timeout (0 = disabled)"}},
  {{"key","auto_join"},               {"aliases", {"join","aj"}},         {"type","string"}, {"default","none"},     {"description","Room joined at startup: none|general|local|<topic>|<code>"}},
  {{"key","verbose"},                 {"aliases", {"v"}},                 {"type","bool"},   {"default",false},      {"description","Enable verbose logging"}},
  {{"key","transfer_debug"},          {"aliases", {"transfer","td"}},     {"type","bool"},   {"default",false},      {"description","Log chunk send/receive activity"}},
  {{"key","help"},                    {"aliases", {"h","?"}},             {"type","bool"},   {"default",false},      {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                    {"aliases", {"persist"}},           {"type","bool"},   {"default",false},      {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType {
  Bool,
  Int,
  String,
  List
};

const char* to_string(SettingType type);

// "true|false|on|off|yes|no|1|0" in any case; nullopt for anything else.
std::optional<bool> parse_bool_literal(const std::string& text);

struct SettingDefinition {
  std::string key;
  std::vector<std::string> aliases;
  SettingType type = SettingType::String;
  nlohmann::json default_value;
  std::optional<int64_t> min;
  std::optional<int64_t> max;
  std::string description;
  bool persistent = true;

  static SettingDefinition from_json(const nlohmann::json& entry);
  bool matches(const std::string& token) const;
};

// Typed node configuration backed by a JSON document. Every write is
// validated against its definition, so a rejected value leaves the previous
// one in place.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& table);

  template<typename T>
  T get(const std::string& key) const {
    return value_of(key).get<T>();
  }
  std::vector<std::string> get_list(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  const std::vector<SettingDefinition>& definitions() const { return definitions_; }
  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string description(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  void set_workspace(const std::filesystem::path& path) { workspace_ = path; }
  std::filesystem::path workspace() const;
  // <workspace>/.config/settings.json
  std::filesystem::path settings_path() const;
  // storage_root, or <workspace>/lora_adapters when unset; relative values
  // are taken from the workspace.
  std::filesystem::path storage_root() const;

  nlohmann::json to_json(bool persistent_only = true) const;

private:
  const SettingDefinition* find(const std::string& token) const;
  const nlohmann::json& value_of(const std::string& key) const;
  std::optional<nlohmann::json> coerce(const SettingDefinition& def,
                                       const nlohmann::json& input,
                                       std::string& error) const;

  std::vector<SettingDefinition> definitions_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path workspace_;
};

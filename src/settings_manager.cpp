#include "settings_manager.hpp"

#include <algorithm>
#include <fstream>

#include "log.hpp"
#include "utils.hpp"

namespace {

SettingType parse_setting_type(const std::string& name) {
  if(name == "bool") return SettingType::Bool;
  if(name == "int") return SettingType::Int;
  if(name == "string") return SettingType::String;
  if(name == "list") return SettingType::List;
  throw std::runtime_error("Unknown setting type '" + name + "'");
}

std::string normalize_token(std::string token) {
  token = to_lower(trim_copy(std::move(token)));
  std::replace(token.begin(), token.end(), '-', '_');
  return token;
}

} // namespace

const char* to_string(SettingType type) {
  switch(type) {
    case SettingType::Bool: return "bool";
    case SettingType::Int: return "int";
    case SettingType::String: return "string";
    case SettingType::List: return "list";
  }
  return "string";
}

std::optional<bool> parse_bool_literal(const std::string& text) {
  auto v = to_lower(trim_copy(text));
  if(v == "true" || v == "on" || v == "yes" || v == "1") return true;
  if(v == "false" || v == "off" || v == "no" || v == "0") return false;
  return std::nullopt;
}

SettingDefinition SettingDefinition::from_json(const nlohmann::json& entry) {
  SettingDefinition def;
  def.key = entry.at("key").get<std::string>();
  for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
    def.aliases.push_back(normalize_token(alias));
  }
  def.type = parse_setting_type(entry.at("type").get<std::string>());
  def.default_value = entry.at("default");
  if(entry.contains("min")) def.min = entry.at("min").get<int64_t>();
  if(entry.contains("max")) def.max = entry.at("max").get<int64_t>();
  def.description = entry.value("description", "");
  def.persistent = entry.value("persistent", true);
  return def;
}

bool SettingDefinition::matches(const std::string& token) const {
  auto normalized = normalize_token(token);
  return normalized == key
    || std::find(aliases.begin(), aliases.end(), normalized) != aliases.end();
}

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_TABLE) {}

SettingsManager::SettingsManager(const nlohmann::json& table) {
  for(const auto& entry : table) {
    definitions_.push_back(SettingDefinition::from_json(entry));
    values_[definitions_.back().key] = definitions_.back().default_value;
  }
}

const SettingDefinition* SettingsManager::find(const std::string& token) const {
  auto it = std::find_if(definitions_.begin(), definitions_.end(),
                         [&](const SettingDefinition& def){ return def.matches(token); });
  return it == definitions_.end() ? nullptr : &*it;
}

const nlohmann::json& SettingsManager::value_of(const std::string& key) const {
  auto it = values_.find(key);
  if(it == values_.end()) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return *it;
}

std::vector<std::string> SettingsManager::get_list(const std::string& key) const {
  const auto& value = value_of(key);
  if(!value.is_array()) return {};
  return value.get<std::vector<std::string>>();
}

std::optional<nlohmann::json> SettingsManager::coerce(const SettingDefinition& def,
                                                      const nlohmann::json& input,
                                                      std::string& error) const {
  const bool text = input.is_string();
  const auto raw = text ? trim_copy(input.get<std::string>()) : std::string();

  switch(def.type) {
    case SettingType::Bool: {
      if(input.is_boolean()) return input;
      if(input.is_number_integer()) return input.get<int64_t>() != 0;
      if(text) {
        if(auto b = parse_bool_literal(raw)) return *b;
      }
      error = "expected boolean (true|false|on|off)";
      return std::nullopt;
    }
    case SettingType::Int: {
      int64_t v = 0;
      if(input.is_number_integer()) {
        v = input.get<int64_t>();
      } else if(text) {
        try {
          std::size_t used = 0;
          v = std::stoll(raw, &used);
          if(used != raw.size()) {
            error = "trailing characters after number";
            return std::nullopt;
          }
        } catch(const std::logic_error&) {
          error = "expected integer";
          return std::nullopt;
        }
      } else {
        error = "expected integer";
        return std::nullopt;
      }
      if((def.min && v < *def.min) || (def.max && v > *def.max)) {
        error = "out of range";
        if(def.min) error += " (min " + std::to_string(*def.min) + ")";
        if(def.max) error += " (max " + std::to_string(*def.max) + ")";
        return std::nullopt;
      }
      return static_cast<int>(v);
    }
    case SettingType::String:
      if(text) return raw;
      error = "expected string";
      return std::nullopt;
    case SettingType::List:
      if(text) return split_list(raw);
      if(input.is_array() && std::all_of(input.begin(), input.end(),
                                         [](const nlohmann::json& item){ return item.is_string(); })) {
        return input;
      }
      error = "expected list of strings";
      return std::nullopt;
  }
  error = "unsupported type";
  return std::nullopt;
}

bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  error.clear();
  const auto* def = find(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  auto coerced = coerce(*def, value, error);
  if(!coerced) return false;
  values_[def->key] = std::move(*coerced);
  return true;
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& value,
                                      std::string& error) {
  return set_from_json(key, nlohmann::json(value), error);
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(definitions_.size());
  for(const auto& def : definitions_) out.push_back(def.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  auto it = values_.find(key);
  if(it == values_.end()) return "<unknown>";
  if(it->is_string()) return it->get<std::string>();
  if(it->is_boolean()) return it->get<bool>() ? "true" : "false";
  if(it->is_array()) {
    std::string joined;
    for(const auto& item : *it) {
      if(!joined.empty()) joined += ",";
      joined += item.is_string() ? item.get<std::string>() : item.dump();
    }
    return joined;
  }
  return it->dump();
}

std::string SettingsManager::description(const std::string& key) const {
  const auto* def = find(key);
  return def ? def->description : std::string();
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  const auto* def = find(token);
  if(!def) return std::nullopt;
  return def->key;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* def = find(key);
  return def && def->type == SettingType::Bool;
}

std::filesystem::path SettingsManager::workspace() const {
  return workspace_.empty() ? std::filesystem::current_path() : workspace_;
}

std::filesystem::path SettingsManager::settings_path() const {
  return workspace() / ".config" / "settings.json";
}

std::filesystem::path SettingsManager::storage_root() const {
  std::filesystem::path configured(get<std::string>("storage_root"));
  if(configured.empty()) return workspace() / "lora_adapters";
  return configured.is_absolute() ? configured : workspace() / configured;
}

nlohmann::json SettingsManager::to_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& def : definitions_) {
    if(persistent_only && !def.persistent) continue;
    doc[def.key] = values_.at(def.key);
  }
  return doc;
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;

  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: expected a JSON object", path.string());
    return false;
  }

  for(const auto& item : doc.items()) {
    if(!find(item.key())) continue;
    std::string error;
    if(!set_from_json(item.key(), item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if(ec) {
      print_err(nullptr, "Unable to create {}: {}", path.parent_path().string(), ec.message());
      return false;
    }
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << to_json(true).dump(2) << '\n';
  return static_cast<bool>(out);
}

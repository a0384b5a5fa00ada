#include "adapter_descriptor.hpp"
#include <array>

using json = nlohmann::json;

namespace {

const std::array<const char*, 8> kMetadataFields = {
  "adapter_id", "base_model", "hf_model", "created_at",
  "training_method", "status", "file_type", "file_path"
};

std::string string_field(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

} // namespace

void to_json(json& j, const AdapterMetadata& m) {
  j = m.extra.is_object() ? m.extra : json::object();
  if(!m.adapter_id.empty()) j["adapter_id"] = m.adapter_id;
  if(!m.base_model.empty()) j["base_model"] = m.base_model;
  if(!m.hf_model.empty()) j["hf_model"] = m.hf_model;
  if(!m.created_at.empty()) j["created_at"] = m.created_at;
  if(!m.training_method.empty()) j["training_method"] = m.training_method;
  if(!m.status.empty()) j["status"] = m.status;
  j["file_type"] = m.file_type.empty() ? "safetensors" : m.file_type;
  if(!m.file_path.empty()) j["file_path"] = m.file_path;
}

void from_json(const json& j, AdapterMetadata& m) {
  m = AdapterMetadata{};
  if(!j.is_object()) return;
  m.adapter_id = string_field(j, "adapter_id");
  m.base_model = string_field(j, "base_model");
  m.hf_model = string_field(j, "hf_model");
  m.created_at = string_field(j, "created_at");
  m.training_method = string_field(j, "training_method");
  m.status = string_field(j, "status");
  auto file_type = string_field(j, "file_type");
  if(!file_type.empty()) m.file_type = file_type;
  m.file_path = string_field(j, "file_path");

  m.extra = j;
  for(const auto* key : kMetadataFields) {
    m.extra.erase(key);
  }
}

void to_json(json& j, const AdapterDescriptor& d) {
  j = json{
    {"name", d.name},
    {"topic", d.topic},
    {"size", d.size},
    {"checksum", d.checksum},
    {"timestamp", d.timestamp}
  };
  if(d.metadata) j["metadata"] = *d.metadata;
}

void from_json(const json& j, AdapterDescriptor& d) {
  d = AdapterDescriptor{};
  d.name = j.at("name").get<std::string>();
  d.topic = j.at("topic").get<std::string>();
  d.size = j.value("size", uint64_t{0});
  d.checksum = j.value("checksum", std::string());
  d.timestamp = j.value("timestamp", uint64_t{0});
  auto meta = j.find("metadata");
  if(meta != j.end() && meta->is_object()) {
    d.metadata = meta->get<AdapterMetadata>();
  }
}

std::string payload_file_name(const std::string& file_type) {
  if(file_type == "pytorch") return "adapter_model.bin";
  return "adapter_model.safetensors";
}

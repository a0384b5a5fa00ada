#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Companion record of an artifact (registry/<name>.json). Unknown fields
// are kept in `extra` and written back unchanged.
struct AdapterMetadata {
  std::string adapter_id;
  std::string base_model;
  std::string hf_model;
  std::string created_at;
  std::string training_method;
  std::string status;
  std::string file_type = "safetensors";   // "safetensors" | "pytorch"
  std::string file_path;
  nlohmann::json extra = nlohmann::json::object();
};

// Advertised metadata for one shareable artifact.
struct AdapterDescriptor {
  std::string name;
  std::string topic;      // per-advertisement id, 64 hex chars
  uint64_t size = 0;
  std::string checksum;   // sha256 hex of the full payload
  uint64_t timestamp = 0; // unix ms
  std::optional<AdapterMetadata> metadata;
};

void to_json(nlohmann::json& j, const AdapterMetadata& m);
void from_json(const nlohmann::json& j, AdapterMetadata& m);
void to_json(nlohmann::json& j, const AdapterDescriptor& d);
// Throws nlohmann::json::exception when name/topic are missing or mistyped.
void from_json(const nlohmann::json& j, AdapterDescriptor& d);

// Payload file name used for a given file_type when saving.
std::string payload_file_name(const std::string& file_type);

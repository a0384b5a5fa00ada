#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "adapter_descriptor.hpp"

using json = nlohmann::json;

// protocol.hpp
// Every frame travels as {"type": <tag>, "data": <payload>} on one line.
inline constexpr const char* kHeartbeatType = "heartbeat";
inline constexpr const char* kHeartbeatResponseType = "heartbeat-response";
inline constexpr const char* kAdapterListType = "adapter-list";
inline constexpr const char* kAdapterRequestType = "adapter-request";
inline constexpr const char* kAdapterChunkType = "adapter-chunk";

struct HeartbeatFrame {
  std::string from;
  uint64_t timestamp = 0;
};

struct HeartbeatResponseFrame {
  std::string from;
  uint64_t timestamp = 0;
};

struct AdapterListFrame {
  std::vector<AdapterDescriptor> adapters;
  std::size_t malformed = 0; // entries dropped while decoding
};

struct AdapterRequestFrame {
  std::string topic;
};

struct AdapterChunkFrame {
  std::string topic;
  std::string payload;   // raw bytes; base64 only on the wire
  uint32_t index = 0;
  uint32_t total = 0;
  std::string checksum;  // sha256 hex of payload
  std::optional<AdapterDescriptor> metadata; // index 0 only
};

using Frame = std::variant<HeartbeatFrame,
                           HeartbeatResponseFrame,
                           AdapterListFrame,
                           AdapterRequestFrame,
                           AdapterChunkFrame>;

const char* frame_type(const Frame& frame);

json encode_frame(const Frame& frame);
std::string encode_frame_line(const Frame& frame);

// Throws ProtocolError for malformed envelopes and unknown tags.
Frame decode_frame(const json& envelope);
Frame decode_frame_line(const std::string& line);

Frame make_heartbeat(const std::string& from);
Frame make_heartbeat_response(const std::string& from);
Frame make_adapter_list(const std::vector<AdapterDescriptor>& adapters);
Frame make_adapter_request(const std::string& topic);

#include "protocol.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include "base64.h"
#include <type_traits>

namespace {

template<typename T>
T required(const json& data, const char* key, const char* type) {
  auto it = data.find(key);
  if(it == data.end()) {
    throw ProtocolError(std::string(type) + " frame missing '" + key + "'");
  }
  try {
    return it->get<T>();
  } catch(const json::exception& ex) {
    throw ProtocolError(std::string(type) + " frame has invalid '" + key + "': " + ex.what());
  }
}

uint32_t required_count(const json& data, const char* key) {
  auto it = data.find(key);
  if(it == data.end() || !it->is_number_integer()) {
    throw ProtocolError(std::string("adapter-chunk frame missing integer '") + key + "'");
  }
  auto value = it->get<int64_t>();
  if(value < 0 || value > static_cast<int64_t>(UINT32_MAX)) {
    throw ProtocolError(std::string("adapter-chunk frame has out-of-range '") + key + "'");
  }
  return static_cast<uint32_t>(value);
}

HeartbeatFrame decode_heartbeat(const json& data) {
  HeartbeatFrame f;
  f.from = data.value("from", std::string());
  f.timestamp = data.value("timestamp", uint64_t{0});
  return f;
}

AdapterListFrame decode_adapter_list(const json& data) {
  if(!data.is_array()) {
    throw ProtocolError("adapter-list payload is not an array");
  }
  AdapterListFrame f;
  for(const auto& entry : data) {
    if(!entry.is_object()
       || !entry.contains("name") || !entry["name"].is_string()
       || !entry.contains("topic") || !entry["topic"].is_string()
       || entry["name"].get<std::string>().empty()
       || entry["topic"].get<std::string>().empty()) {
      f.malformed++;
      continue;
    }
    try {
      f.adapters.push_back(entry.get<AdapterDescriptor>());
    } catch(const json::exception&) {
      f.malformed++;
    }
  }
  return f;
}

AdapterChunkFrame decode_adapter_chunk(const json& data) {
  AdapterChunkFrame f;
  f.topic = required<std::string>(data, "topic", kAdapterChunkType);
  f.checksum = required<std::string>(data, "checksum", kAdapterChunkType);
  f.index = required_count(data, "index");
  f.total = required_count(data, "total");
  if(f.total == 0 || f.index >= f.total) {
    throw ProtocolError("adapter-chunk index " + std::to_string(f.index) +
                        " outside total " + std::to_string(f.total));
  }
  auto encoded = required<std::string>(data, "chunk", kAdapterChunkType);
  try {
    f.payload = base64_decode(encoded);
  } catch(const std::exception& ex) {
    throw ProtocolError(std::string("adapter-chunk payload is not base64: ") + ex.what());
  }
  auto meta = data.find("metadata");
  if(meta != data.end() && meta->is_object()) {
    try {
      f.metadata = meta->get<AdapterDescriptor>();
    } catch(const json::exception& ex) {
      throw ProtocolError(std::string("adapter-chunk metadata invalid: ") + ex.what());
    }
  }
  return f;
}

Frame decode_payload(const std::string& type, const json& data) {
  if(type == kHeartbeatType) {
    return decode_heartbeat(data.is_object() ? data : json::object());
  } else if(type == kHeartbeatResponseType) {
    auto hb = decode_heartbeat(data.is_object() ? data : json::object());
    return HeartbeatResponseFrame{hb.from, hb.timestamp};
  } else if(type == kAdapterListType) {
    return decode_adapter_list(data);
  } else if(type == kAdapterRequestType) {
    if(!data.is_object()) throw ProtocolError("adapter-request payload is not an object");
    return AdapterRequestFrame{required<std::string>(data, "topic", kAdapterRequestType)};
  } else if(type == kAdapterChunkType) {
    if(!data.is_object()) throw ProtocolError("adapter-chunk payload is not an object");
    return decode_adapter_chunk(data);
  }
  throw ProtocolError("unknown frame type '" + type + "'");
}

} // namespace

const char* frame_type(const Frame& frame) {
  return std::visit([](const auto& f) -> const char* {
    using T = std::decay_t<decltype(f)>;
    if constexpr (std::is_same_v<T, HeartbeatFrame>) return kHeartbeatType;
    else if constexpr (std::is_same_v<T, HeartbeatResponseFrame>) return kHeartbeatResponseType;
    else if constexpr (std::is_same_v<T, AdapterListFrame>) return kAdapterListType;
    else if constexpr (std::is_same_v<T, AdapterRequestFrame>) return kAdapterRequestType;
    else return kAdapterChunkType;
  }, frame);
}

json encode_frame(const Frame& frame) {
  json data = std::visit([](const auto& f) -> json {
    using T = std::decay_t<decltype(f)>;
    if constexpr (std::is_same_v<T, HeartbeatFrame> || std::is_same_v<T, HeartbeatResponseFrame>) {
      return json{{"from", f.from}, {"timestamp", f.timestamp}};
    } else if constexpr (std::is_same_v<T, AdapterListFrame>) {
      json arr = json::array();
      for(const auto& d : f.adapters) arr.push_back(d);
      return arr;
    } else if constexpr (std::is_same_v<T, AdapterRequestFrame>) {
      return json{{"topic", f.topic}};
    } else {
      json j;
      j["topic"] = f.topic;
      j["chunk"] = base64_encode(reinterpret_cast<const unsigned char*>(f.payload.data()),
                                 f.payload.size());
      j["index"] = f.index;
      j["total"] = f.total;
      j["checksum"] = f.checksum;
      if(f.index == 0 && f.metadata) j["metadata"] = *f.metadata;
      return j;
    }
  }, frame);

  json j;
  j["type"] = frame_type(frame);
  j["data"] = std::move(data);
  return j;
}

std::string encode_frame_line(const Frame& frame) {
  return encode_frame(frame).dump() + "\n";
}

Frame decode_frame(const json& envelope) {
  if(!envelope.is_object()) {
    throw ProtocolError("frame is not a JSON object");
  }
  auto type_it = envelope.find("type");
  if(type_it == envelope.end() || !type_it->is_string()) {
    throw ProtocolError("frame has no type tag");
  }
  const auto type = type_it->get<std::string>();
  const json data = envelope.value("data", json());

  try {
    return decode_payload(type, data);
  } catch(const json::exception& ex) {
    throw ProtocolError(type + " frame is malformed: " + ex.what());
  }
}

Frame decode_frame_line(const std::string& line) {
  json j;
  try {
    j = json::parse(line);
  } catch(const json::parse_error& ex) {
    throw ProtocolError(std::string("frame is not valid JSON: ") + ex.what());
  }
  return decode_frame(j);
}

Frame make_heartbeat(const std::string& from) {
  return HeartbeatFrame{from, unix_time_ms()};
}

Frame make_heartbeat_response(const std::string& from) {
  return HeartbeatResponseFrame{from, unix_time_ms()};
}

Frame make_adapter_list(const std::vector<AdapterDescriptor>& adapters) {
  AdapterListFrame f;
  f.adapters = adapters;
  return f;
}

Frame make_adapter_request(const std::string& topic) {
  return AdapterRequestFrame{topic};
}

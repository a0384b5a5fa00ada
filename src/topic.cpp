#include "topic.hpp"
#include "utils.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <random>
#include <stdexcept>

namespace {

constexpr const char* kGeneralRoomSeed = "orch-os-general-public-community-room-v1";
constexpr const char* kLocalNetworkSeed = "orch-os-local-local-network";
constexpr const char* kRoomCodePrefix = "orch-os-room-";

const std::array<const char*, 8> kCodeWords = {
  "MUSIC", "PIZZA", "COFFEE", "BOOKS", "GAMES", "ART", "SPACE", "OCEAN"
};

} // namespace

Topic::Topic() : hex_(kHexSize, '0') {}

Topic::Topic(const std::array<unsigned char, kSize>& bytes)
  : bytes_(bytes),
    hex_(hex_from_bytes(std::vector<unsigned char>(bytes.begin(), bytes.end()))) {}

std::optional<Topic> Topic::from_hex(const std::string& hex) {
  if(hex.size() != kHexSize) return std::nullopt;
  auto raw = bytes_from_hex(hex);
  if(!raw || raw->size() != kSize) return std::nullopt;
  std::array<unsigned char, kSize> bytes{};
  std::copy(raw->begin(), raw->end(), bytes.begin());
  return Topic(bytes);
}

Topic Topic::random() {
  std::array<unsigned char, kSize> bytes{};
  if(RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed while generating topic");
  }
  return Topic(bytes);
}

Topic Topic::from_seed(const std::string& seed) {
  auto digest = sha256_bytes(seed);
  std::array<unsigned char, kSize> bytes{};
  std::copy(digest.begin(), digest.end(), bytes.begin());
  return Topic(bytes);
}

const char* classification_name(RoomClassification classification) {
  switch(classification) {
    case RoomClassification::General: return "general";
    case RoomClassification::LocalNetwork: return "local";
    case RoomClassification::Private: return "private";
  }
  return "private";
}

Topic general_room_topic() {
  static const Topic topic = Topic::from_seed(kGeneralRoomSeed);
  return topic;
}

Topic local_network_topic() {
  static const Topic topic = Topic::from_seed(kLocalNetworkSeed);
  return topic;
}

Topic topic_for_room_code(const std::string& code) {
  std::string normalized = trim_copy(code);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  return Topic::from_seed(kRoomCodePrefix + normalized);
}

std::string generate_friendly_code() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> word_dist(0, kCodeWords.size() - 1);
  std::uniform_int_distribution<int> number_dist(0, 998);
  char number[4];
  std::snprintf(number, sizeof(number), "%03d", number_dist(rng));
  return std::string(kCodeWords[word_dist(rng)]) + "-" + number;
}

bool looks_like_friendly_code(const std::string& value) {
  auto dash = value.find('-');
  if(dash == std::string::npos || dash == 0 || dash + 1 >= value.size()) return false;
  if(value.size() > 32) return false;
  for(std::size_t i = 0; i < value.size(); ++i) {
    unsigned char ch = static_cast<unsigned char>(value[i]);
    if(i == dash) continue;
    if(!std::isalnum(ch)) return false;
  }
  return true;
}

bool is_general_room(const Topic& topic) {
  return topic == general_room_topic();
}

bool is_local_network_room(const Topic&) {
  return false;
}

RoomClassification classify_topic(const Topic& topic) {
  if(is_general_room(topic)) return RoomClassification::General;
  if(is_local_network_room(topic)) return RoomClassification::LocalNetwork;
  return RoomClassification::Private;
}

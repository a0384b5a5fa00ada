#pragma once
#include <array>
#include <optional>
#include <string>

// 32-byte discovery key. Travels as 64 lowercase hex characters.
class Topic {
public:
  static constexpr std::size_t kSize = 32;
  static constexpr std::size_t kHexSize = kSize * 2;
  static constexpr std::size_t kRoomCodeSize = 8;

  Topic();

  static std::optional<Topic> from_hex(const std::string& hex);
  static Topic random();
  // SHA-256 of an arbitrary seed string.
  static Topic from_seed(const std::string& seed);

  const std::string& hex() const { return hex_; }
  std::string room_code() const { return hex_.substr(0, kRoomCodeSize); }
  const std::array<unsigned char, kSize>& bytes() const { return bytes_; }

  bool operator==(const Topic& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Topic& other) const { return !(*this == other); }
  bool operator<(const Topic& other) const { return bytes_ < other.bytes_; }

private:
  explicit Topic(const std::array<unsigned char, kSize>& bytes);

  std::array<unsigned char, kSize> bytes_{};
  std::string hex_;
};

enum class RoomClassification { General, LocalNetwork, Private };

const char* classification_name(RoomClassification classification);

Topic general_room_topic();
Topic local_network_topic();
// Private rooms are addressed by a human code ("PIZZA-042"); the code is
// trimmed and upper-cased before hashing.
Topic topic_for_room_code(const std::string& code);
std::string generate_friendly_code();
bool looks_like_friendly_code(const std::string& value);

bool is_general_room(const Topic& topic);
// Local-network detection is not implemented: always false.
bool is_local_network_room(const Topic& topic);
RoomClassification classify_topic(const Topic& topic);

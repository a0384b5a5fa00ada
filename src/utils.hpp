#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct evp_md_ctx_st;

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::optional<std::vector<unsigned char>> bytes_from_hex(const std::string& hex);
bool is_hex_string(const std::string& value, std::size_t expected_length = 0);

std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);
std::string sha256_hex(const char* data, std::size_t size);

// Incremental SHA-256 for data that is not held in memory at once.
class Sha256Stream {
public:
  Sha256Stream();
  ~Sha256Stream();
  Sha256Stream(const Sha256Stream&) = delete;
  Sha256Stream& operator=(const Sha256Stream&) = delete;

  void update(const char* data, std::size_t size);
  std::string final_hex();

private:
  evp_md_ctx_st* ctx_ = nullptr;
};

// Cryptographically random bytes, hex-encoded (2 * count characters).
std::string random_hex(std::size_t count);

uint64_t unix_time_ms();
std::string format_file_size(uint64_t bytes);
std::string trim_copy(std::string value);
std::string to_lower(std::string value);
std::vector<std::string> split_list(const std::string& value, char separator = ',');

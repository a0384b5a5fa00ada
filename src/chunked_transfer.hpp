#pragma once
#include <asio.hpp>
#include <asio/thread_pool.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "adapter_descriptor.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "swarm.hpp"

class Logger;

inline constexpr std::size_t kChunkSize = 64 * 1024;
// Largest artifact a receive session will accept unless reconfigured.
inline constexpr uint64_t kDefaultMaxArtifactSize = 8ULL * 1024 * 1024 * 1024;

// ceil(size / kChunkSize)
uint32_t chunk_count(uint64_t size);

struct FileInfo {
  uint64_t size = 0;
  std::string checksum;
};

enum class TransferDirection { Send, Receive };

struct TransferProgress {
  std::string topic;
  std::string peer_id;
  TransferDirection direction = TransferDirection::Receive;
  double percent = 0.0;
  uint32_t done = 0;
  uint32_t total = 0;
};

struct TransferComplete {
  std::string topic;
  std::string peer_id;
  TransferDirection direction = TransferDirection::Receive;
  std::string buffer;                        // receive only
  std::optional<AdapterDescriptor> descriptor;
};

struct TransferError {
  std::string topic;
  std::string peer_id;
  std::string message;
  ErrorKind kind = ErrorKind::Integrity;
};

struct TransferEvents {
  std::function<void(const TransferProgress&)> on_progress;
  std::function<void(const TransferComplete&)> on_complete;
  std::function<void(const TransferError&)> on_error;
};

// Splits artifacts into checksummed chunks for sending and reassembles
// received chunks into verified buffers. io_context thread only; file
// hashing runs on the pool and reports back through the io_context.
class ChunkedTransfer : public std::enable_shared_from_this<ChunkedTransfer> {
public:
  struct SessionSnapshot {
    std::string topic;
    std::string peer_id;
    uint32_t total = 0;
    uint32_t received = 0;
    bool has_descriptor = false;
  };

  using FileInfoHandler = std::function<void(std::optional<FileInfo> info, const std::string& error)>;

  ChunkedTransfer(asio::io_context& io,
                  asio::thread_pool& pool,
                  std::shared_ptr<Logger> logger = nullptr,
                  std::chrono::milliseconds chunk_delay = std::chrono::milliseconds(10));
  ~ChunkedTransfer();

  void set_events(TransferEvents events) { events_ = std::move(events); }
  void set_debug(bool enabled) { debug_ = enabled; }
  void set_max_artifact_size(uint64_t bytes) { max_artifact_size_ = bytes; }
  uint64_t max_artifact_size() const { return max_artifact_size_; }

  // Streams `path` to `peer` one chunk at a time; the descriptor rides on
  // chunk 0. Nothing waits for acknowledgement.
  void send_file(std::shared_ptr<SwarmSocket> peer,
                 const std::string& peer_id,
                 const std::filesystem::path& path,
                 const AdapterDescriptor& descriptor);

  // Throws ProtocolError when the chunk contradicts the open session, its
  // own descriptor, or the size limits.
  void handle_received_chunk(const AdapterChunkFrame& frame, const std::string& from_peer);

  void calculate_file_info(const std::filesystem::path& path, FileInfoHandler handler);
  // Blocking; single pass over the file.
  static FileInfo compute_file_info(const std::filesystem::path& path);

  // Drops receive sessions fed by `peer_id` and stops sends to it.
  void abandon_peer(const std::string& peer_id);
  void cancel_all();

  std::size_t active_sessions() const { return sessions_.size(); }
  std::size_t active_sends() const { return sends_.size(); }
  std::optional<SessionSnapshot> session(const std::string& topic) const;

private:
  struct SendJob {
    explicit SendJob(asio::io_context& io) : timer(io) {}
    uint64_t id = 0;
    std::shared_ptr<SwarmSocket> peer;
    std::string peer_id;
    AdapterDescriptor descriptor;
    std::filesystem::path path;
    std::ifstream stream;
    uint64_t size = 0;
    uint32_t index = 0;
    uint32_t total = 0;
    asio::steady_timer timer;
  };

  struct ReceiveSession {
    std::string topic;
    std::string peer_id;
    uint32_t total = 0;
    uint32_t received = 0;
    std::map<uint32_t, std::string> chunks;
    std::optional<AdapterDescriptor> descriptor;
  };

  void send_next_chunk(uint64_t job_id);
  void fail_send(uint64_t job_id, const std::string& message, ErrorKind kind);
  void complete_download(const std::string& topic);
  void emit_error(const std::string& topic, const std::string& peer_id,
                  const std::string& message, ErrorKind kind);

  asio::io_context& io_;
  asio::thread_pool& pool_;
  std::shared_ptr<Logger> logger_;
  std::chrono::milliseconds chunk_delay_;
  TransferEvents events_;
  bool debug_ = false;
  uint64_t max_artifact_size_ = kDefaultMaxArtifactSize;
  uint64_t next_send_id_ = 1;
  std::map<uint64_t, std::unique_ptr<SendJob>> sends_;
  std::map<std::string, ReceiveSession> sessions_;
};

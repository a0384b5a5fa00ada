#include "chunked_transfer.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <algorithm>
#include <stdexcept>

uint32_t chunk_count(uint64_t size) {
  return static_cast<uint32_t>((size + kChunkSize - 1) / kChunkSize);
}

ChunkedTransfer::ChunkedTransfer(asio::io_context& io,
                                 asio::thread_pool& pool,
                                 std::shared_ptr<Logger> logger,
                                 std::chrono::milliseconds chunk_delay)
  : io_(io),
    pool_(pool),
    logger_(std::move(logger)),
    chunk_delay_(chunk_delay) {
}

ChunkedTransfer::~ChunkedTransfer() {
  events_ = TransferEvents{};
  cancel_all();
}

void ChunkedTransfer::send_file(std::shared_ptr<SwarmSocket> peer,
                                const std::string& peer_id,
                                const std::filesystem::path& path,
                                const AdapterDescriptor& descriptor) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if(ec) {
    emit_error(descriptor.topic, peer_id, "cannot stat " + path.string() + ": " + ec.message(), ErrorKind::NotFound);
    return;
  }
  if(size == 0) {
    emit_error(descriptor.topic, peer_id, "refusing to send empty file " + path.string(), ErrorKind::NotFound);
    return;
  }

  auto job = std::make_unique<SendJob>(io_);
  job->id = next_send_id_++;
  job->peer = std::move(peer);
  job->peer_id = peer_id;
  job->descriptor = descriptor;
  job->path = path;
  job->size = size;
  job->total = chunk_count(size);
  job->stream.open(path, std::ios::binary);
  if(!job->stream) {
    emit_error(descriptor.topic, peer_id, "cannot open " + path.string(), ErrorKind::NotFound);
    return;
  }

  log_info(logger_.get(), "Sending {} to {}: {} chunks ({})",
           descriptor.name, peer_id, job->total, format_file_size(size));
  auto id = job->id;
  sends_.emplace(id, std::move(job));
  send_next_chunk(id);
}

void ChunkedTransfer::send_next_chunk(uint64_t job_id) {
  auto it = sends_.find(job_id);
  if(it == sends_.end()) return;
  auto& job = *it->second;

  if(!job.peer || !job.peer->is_open()) {
    fail_send(job_id, "peer connection closed", ErrorKind::Connection);
    return;
  }

  const uint64_t offset = static_cast<uint64_t>(job.index) * kChunkSize;
  const std::size_t expected = static_cast<std::size_t>(std::min<uint64_t>(kChunkSize, job.size - offset));
  std::string buffer(expected, '\0');
  job.stream.read(&buffer[0], static_cast<std::streamsize>(expected));
  if(static_cast<std::size_t>(job.stream.gcount()) != expected) {
    fail_send(job_id, "short read from " + job.path.string(), ErrorKind::NotFound);
    return;
  }

  AdapterChunkFrame frame;
  frame.topic = job.descriptor.topic;
  frame.checksum = sha256_hex(buffer);
  frame.payload = std::move(buffer);
  frame.index = job.index;
  frame.total = job.total;
  if(job.index == 0) frame.metadata = job.descriptor;

  if(!job.peer->write(encode_frame_line(frame))) {
    fail_send(job_id, "write to peer failed", ErrorKind::Connection);
    return;
  }

  job.index++;
  if(debug_) {
    log_debug(logger_.get(), "Sent chunk {}/{} of {} to {}", job.index, job.total, job.descriptor.name, job.peer_id);
  }

  if(events_.on_progress) {
    TransferProgress p;
    p.topic = job.descriptor.topic;
    p.peer_id = job.peer_id;
    p.direction = TransferDirection::Send;
    p.done = job.index;
    p.total = job.total;
    p.percent = 100.0 * job.index / job.total;
    events_.on_progress(p);
  }

  // the progress callback may have cancelled us
  it = sends_.find(job_id);
  if(it == sends_.end()) return;
  auto& current = *it->second;

  if(current.index >= current.total) {
    log_info(logger_.get(), "Completed sending {} to {}", current.descriptor.name, current.peer_id);
    TransferComplete done;
    done.topic = current.descriptor.topic;
    done.peer_id = current.peer_id;
    done.direction = TransferDirection::Send;
    done.descriptor = current.descriptor;
    sends_.erase(it);
    if(events_.on_complete) events_.on_complete(done);
    return;
  }

  std::weak_ptr<ChunkedTransfer> weak = weak_from_this();
  current.timer.expires_after(chunk_delay_);
  current.timer.async_wait([weak, job_id](const std::error_code& ec){
    if(ec) return;
    if(auto self = weak.lock()) self->send_next_chunk(job_id);
  });
}

void ChunkedTransfer::fail_send(uint64_t job_id, const std::string& message, ErrorKind kind) {
  auto it = sends_.find(job_id);
  if(it == sends_.end()) return;
  auto topic = it->second->descriptor.topic;
  auto peer_id = it->second->peer_id;
  it->second->timer.cancel();
  sends_.erase(it);
  emit_error(topic, peer_id, message, kind);
}

void ChunkedTransfer::handle_received_chunk(const AdapterChunkFrame& frame, const std::string& from_peer) {
  if(frame.total == 0 || frame.index >= frame.total) {
    throw ProtocolError("chunk index " + std::to_string(frame.index) +
                        " outside total " + std::to_string(frame.total));
  }
  if(frame.payload.size() > kChunkSize) {
    throw ProtocolError("chunk payload of " + std::to_string(frame.payload.size()) +
                        " bytes exceeds " + std::to_string(kChunkSize));
  }
  if(frame.total > chunk_count(max_artifact_size_)) {
    throw ProtocolError("chunk total " + std::to_string(frame.total) +
                        " exceeds the " + format_file_size(max_artifact_size_) + " artifact limit");
  }
  if(frame.metadata && frame.total != chunk_count(frame.metadata->size)) {
    throw ProtocolError("chunk total " + std::to_string(frame.total) + " does not match descriptor size " +
                        std::to_string(frame.metadata->size));
  }

  if(sha256_hex(frame.payload) != frame.checksum) {
    log_error(logger_.get(), "Chunk checksum mismatch for {}:{}", frame.topic, frame.index);
    emit_error(frame.topic, from_peer, "Chunk checksum verification failed", ErrorKind::Integrity);
    return;
  }

  auto it = sessions_.find(frame.topic);
  if(it == sessions_.end()) {
    ReceiveSession session;
    session.topic = frame.topic;
    session.peer_id = from_peer;
    session.total = frame.total;
    it = sessions_.emplace(frame.topic, std::move(session)).first;
  } else if(it->second.total != frame.total) {
    throw ProtocolError("chunk total " + std::to_string(frame.total) +
                        " disagrees with session total " + std::to_string(it->second.total));
  }

  auto& session = it->second;
  if(frame.index == 0 && frame.metadata && !session.descriptor) {
    session.descriptor = frame.metadata;
    log_info(logger_.get(), "Starting download: {} ({} chunks) from {}",
             frame.metadata->name, frame.total, from_peer);
  }

  if(!session.chunks.emplace(frame.index, frame.payload).second) {
    log_debug(logger_.get(), "Duplicate chunk {} for {}", frame.index, frame.topic);
    return;
  }
  session.received++;

  if(debug_) {
    log_debug(logger_.get(), "Received chunk {}/{} for {}", frame.index + 1, frame.total, frame.topic);
  }

  if(events_.on_progress) {
    TransferProgress p;
    p.topic = frame.topic;
    p.peer_id = from_peer;
    p.direction = TransferDirection::Receive;
    p.done = session.received;
    p.total = session.total;
    p.percent = 100.0 * session.received / session.total;
    events_.on_progress(p);
  }

  it = sessions_.find(frame.topic);
  if(it != sessions_.end() && it->second.received == it->second.total) {
    complete_download(frame.topic);
  }
}

void ChunkedTransfer::complete_download(const std::string& topic) {
  auto it = sessions_.find(topic);
  if(it == sessions_.end()) return;
  auto session = std::move(it->second);
  sessions_.erase(it);

  if(!session.descriptor) {
    emit_error(topic, session.peer_id, "first chunk carried no descriptor", ErrorKind::Protocol);
    return;
  }

  std::size_t total_bytes = 0;
  for(const auto& kv : session.chunks) total_bytes += kv.second.size();
  std::string buffer;
  buffer.reserve(total_bytes);
  for(auto& kv : session.chunks) {
    buffer += kv.second;
    std::string().swap(kv.second);
  }

  if(sha256_hex(buffer) != session.descriptor->checksum) {
    log_error(logger_.get(), "File checksum mismatch for {}", session.descriptor->name);
    emit_error(topic, session.peer_id, "File checksum verification failed", ErrorKind::Integrity);
    return;
  }

  log_info(logger_.get(), "Download completed: {} ({})", session.descriptor->name, format_file_size(buffer.size()));
  if(events_.on_complete) {
    TransferComplete done;
    done.topic = topic;
    done.peer_id = session.peer_id;
    done.direction = TransferDirection::Receive;
    done.buffer = std::move(buffer);
    done.descriptor = std::move(session.descriptor);
    events_.on_complete(done);
  }
}

FileInfo ChunkedTransfer::compute_file_info(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw std::runtime_error("cannot open " + path.string());
  }
  Sha256Stream hash;
  FileInfo info;
  std::vector<char> block(kChunkSize);
  while(in) {
    in.read(block.data(), static_cast<std::streamsize>(block.size()));
    auto got = in.gcount();
    if(got <= 0) break;
    hash.update(block.data(), static_cast<std::size_t>(got));
    info.size += static_cast<uint64_t>(got);
  }
  if(in.bad()) {
    throw std::runtime_error("read error on " + path.string());
  }
  info.checksum = hash.final_hex();
  return info;
}

void ChunkedTransfer::calculate_file_info(const std::filesystem::path& path, FileInfoHandler handler) {
  std::weak_ptr<ChunkedTransfer> weak = weak_from_this();
  asio::post(pool_, [this_io = &io_, weak, path, handler = std::move(handler)]() mutable {
    std::optional<FileInfo> info;
    std::string error;
    try {
      info = compute_file_info(path);
    } catch(const std::exception& ex) {
      error = ex.what();
    }
    asio::post(*this_io, [weak, path, info = std::move(info), error = std::move(error),
                          handler = std::move(handler)]() {
      auto self = weak.lock();
      if(!self) return;
      if(info) {
        log_info(self->logger_.get(), "Calculated info for {}: size={}, checksum={}...",
                 path.string(), info->size, info->checksum.substr(0, 16));
      } else {
        log_warn(self->logger_.get(), "Cannot hash {}: {}", path.string(), error);
      }
      if(handler) handler(info, error);
    });
  });
}

void ChunkedTransfer::abandon_peer(const std::string& peer_id) {
  for(auto it = sessions_.begin(); it != sessions_.end();) {
    if(it->second.peer_id == peer_id) {
      log_debug(logger_.get(), "Abandoning download {} ({}/{} chunks) from {}",
                it->first, it->second.received, it->second.total, peer_id);
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }

  std::vector<uint64_t> stopped;
  for(const auto& kv : sends_) {
    if(kv.second->peer_id == peer_id) stopped.push_back(kv.first);
  }
  for(auto id : stopped) {
    fail_send(id, "peer " + peer_id + " disconnected", ErrorKind::Connection);
  }
}

void ChunkedTransfer::cancel_all() {
  for(auto& kv : sends_) kv.second->timer.cancel();
  sends_.clear();
  sessions_.clear();
}

std::optional<ChunkedTransfer::SessionSnapshot> ChunkedTransfer::session(const std::string& topic) const {
  auto it = sessions_.find(topic);
  if(it == sessions_.end()) return std::nullopt;
  SessionSnapshot s;
  s.topic = it->second.topic;
  s.peer_id = it->second.peer_id;
  s.total = it->second.total;
  s.received = it->second.received;
  s.has_descriptor = it->second.descriptor.has_value();
  return s;
}

void ChunkedTransfer::emit_error(const std::string& topic, const std::string& peer_id,
                                 const std::string& message, ErrorKind kind) {
  log_warn(logger_.get(), "Transfer {} failed: {}", topic, message);
  if(events_.on_error) {
    events_.on_error(TransferError{topic, peer_id, message, kind});
  }
}

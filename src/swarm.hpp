#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include "topic.hpp"

// One authenticated stream to a remote swarm member. Frames are text lines.
class SwarmSocket {
public:
  using LineHandler = std::function<void(const std::string& line)>;
  using CloseHandler = std::function<void(const std::error_code& ec)>;

  virtual ~SwarmSocket() = default;

  virtual const std::string& remote_public_key() const = 0;
  // True when this side dialed the connection.
  virtual bool initiator() const = 0;

  // Lines received before start() are held and delivered on start().
  // on_close fires exactly once, for errors, remote end and local close().
  virtual void start(LineHandler on_line, CloseHandler on_close) = 0;
  // Returns false when the socket is no longer writable.
  virtual bool write(const std::string& line) = 0;
  virtual void close() = 0;
  virtual void configure(std::chrono::seconds keep_alive,
                         std::chrono::seconds timeout) = 0;
  virtual bool is_open() const = 0;
};

// Topic-based discovery overlay. Every member joins as client and server.
class Swarm {
public:
  using ConnectionHandler = std::function<void(std::shared_ptr<SwarmSocket>)>;

  virtual ~Swarm() = default;

  // Throws InitError when the overlay cannot come up.
  virtual void start(ConnectionHandler on_connection) = 0;
  // on_flushed runs once initial discovery for the topic has settled.
  virtual void join(const Topic& topic, std::function<void()> on_flushed) = 0;
  virtual void leave(const Topic& topic) = 0;
  virtual void destroy() = 0;
  virtual const std::string& public_key() const = 0;
};

using SwarmFactory = std::function<std::shared_ptr<Swarm>()>;

// Display id for a remote identity.
inline std::string peer_id_from_key(const std::string& public_key) {
  return public_key.substr(0, 12);
}

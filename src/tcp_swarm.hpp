#pragma once
#include <asio.hpp>
#include <cstdint>
#include <functional>
#include <chrono>
#include <map>
#include <optional>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "swarm.hpp"

class Connection;
class Logger;

// Swarm over plain TCP. Members announce themselves with a
// {"type":"swarm-hello","public_key":..,"topic":..} line; inbound
// connections are accepted only for topics joined locally. Discovery is
// the configured bootstrap list, dialed on every join.
class TcpSwarm : public Swarm, public std::enable_shared_from_this<TcpSwarm> {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 0;
    std::vector<std::string> bootstrap_peers;  // "host:port"
    std::string public_key;                    // 64 hex chars
    std::chrono::seconds handshake_timeout{10};
  };

  static std::shared_ptr<TcpSwarm> create(asio::io_context& io,
                                          Options options,
                                          std::shared_ptr<Logger> logger);
  ~TcpSwarm() override;

  void start(ConnectionHandler on_connection) override;
  void join(const Topic& topic, std::function<void()> on_flushed) override;
  void leave(const Topic& topic) override;
  void destroy() override;
  const std::string& public_key() const override { return options_.public_key; }

  uint16_t listen_port() const { return bound_port_; }
  std::size_t live_connections() const;

private:
  TcpSwarm(asio::io_context& io, Options options, std::shared_ptr<Logger> logger);

  struct Handshake;

  void do_accept();
  void dial(const std::string& host_port, const Topic& topic, std::function<void()> done);
  void begin_handshake(std::shared_ptr<Connection> conn,
                       std::optional<Topic> expected_topic,
                       std::function<void()> done);
  void complete_handshake(const std::shared_ptr<Handshake>& hs,
                          const std::string& remote_key,
                          const Topic& topic);
  void fail_handshake(const std::shared_ptr<Handshake>& hs, const std::string& reason);
  bool keep_new_connection(const std::shared_ptr<Connection>& existing,
                           const std::shared_ptr<Connection>& incoming) const;
  std::string hello_line(const Topic& topic) const;

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  uint16_t bound_port_ = 0;
  ConnectionHandler on_connection_;
  std::set<Topic> topics_;
  // remote public key -> live connection and the topic it was opened for
  std::map<std::string, std::pair<std::weak_ptr<Connection>, Topic>> live_;
  bool started_ = false;
  bool destroyed_ = false;
};

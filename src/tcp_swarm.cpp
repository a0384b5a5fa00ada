#include "tcp_swarm.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using tcp = asio::ip::tcp;

namespace {
constexpr const char* kHelloType = "swarm-hello";
}

struct TcpSwarm::Handshake {
  explicit Handshake(asio::io_context& io) : timer(io) {}

  std::shared_ptr<Connection> conn;
  std::optional<Topic> expected_topic; // set when we dialed
  std::function<void()> done;
  asio::steady_timer timer;
  bool finished = false;
};

std::shared_ptr<TcpSwarm> TcpSwarm::create(asio::io_context& io,
                                           Options options,
                                           std::shared_ptr<Logger> logger) {
  return std::shared_ptr<TcpSwarm>(new TcpSwarm(io, std::move(options), std::move(logger)));
}

TcpSwarm::TcpSwarm(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    logger_(std::move(logger)) {
}

TcpSwarm::~TcpSwarm() {
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
}

void TcpSwarm::start(ConnectionHandler on_connection) {
  if(started_) return;
  if(options_.public_key.empty()) {
    throw InitError("swarm needs a public key");
  }

  std::error_code ec;
  auto address = asio::ip::make_address(options_.listen_ip, ec);
  if(ec) {
    throw InitError("invalid listen_ip '" + options_.listen_ip + "': " + ec.message());
  }

  auto acceptor = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(address, options_.listen_port);
  acceptor->open(endpoint.protocol(), ec);
  if(!ec) acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor->bind(endpoint, ec);
  if(!ec) acceptor->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    throw InitError("cannot listen on " + options_.listen_ip + ":" +
                    std::to_string(options_.listen_port) + ": " + ec.message());
  }

  bound_port_ = acceptor->local_endpoint(ec).port();
  if(ec) {
    throw InitError("cannot read bound port: " + ec.message());
  }

  acceptor_ = std::move(acceptor);
  on_connection_ = std::move(on_connection);
  started_ = true;
  destroyed_ = false;
  log_info(logger_.get(), "Swarm listening on {}:{} as {}", options_.listen_ip, bound_port_,
           peer_id_from_key(options_.public_key));
  do_accept();
}

void TcpSwarm::do_accept() {
  if(!acceptor_) return;
  auto self = shared_from_this();
  acceptor_->async_accept(
    [this, self](std::error_code ec, tcp::socket socket){
      if(destroyed_ || ec == asio::error::operation_aborted) return;
      if(ec) {
        log_error(logger_.get(), "Accept error: {}", ec.message());
      } else {
        auto conn = Connection::create(std::move(socket), false, logger_);
        log_debug(logger_.get(), "Accepted connection from {}", conn->remote_endpoint());
        begin_handshake(conn, std::nullopt, nullptr);
      }
      if(acceptor_ && acceptor_->is_open()) {
        do_accept();
      }
    });
}

void TcpSwarm::join(const Topic& topic, std::function<void()> on_flushed) {
  topics_.insert(topic);

  if(options_.bootstrap_peers.empty()) {
    if(on_flushed) asio::post(io_, std::move(on_flushed));
    return;
  }

  auto pending = std::make_shared<std::size_t>(options_.bootstrap_peers.size());
  auto done = [pending, on_flushed = std::move(on_flushed)](){
    if(*pending == 0) return;
    if(--*pending == 0 && on_flushed) on_flushed();
  };
  for(const auto& peer : options_.bootstrap_peers) {
    dial(peer, topic, done);
  }
}

void TcpSwarm::dial(const std::string& host_port, const Topic& topic, std::function<void()> done) {
  auto pos = host_port.rfind(':');
  if(pos == std::string::npos || pos == 0 || pos + 1 >= host_port.size()) {
    log_error(logger_.get(), "Bootstrap peer must be host:port (got '{}')", host_port);
    asio::post(io_, done);
    return;
  }
  auto host = host_port.substr(0, pos);
  auto port = host_port.substr(pos + 1);

  auto self = shared_from_this();
  auto resolver = std::make_shared<tcp::resolver>(io_);
  resolver->async_resolve(host, port,
    [this, self, resolver, host_port, topic, done](std::error_code ec, tcp::resolver::results_type results){
      if(ec || destroyed_) {
        if(ec) log_info(logger_.get(), "Resolve failed for {}: {}", host_port, ec.message());
        done();
        return;
      }
      auto sock = std::make_shared<tcp::socket>(io_);
      asio::async_connect(*sock, results,
        [this, self, sock, host_port, topic, done](std::error_code ec, const tcp::endpoint&){
          if(ec || destroyed_) {
            if(ec) log_info(logger_.get(), "Connect to {} failed: {}", host_port, ec.message());
            done();
            return;
          }
          auto conn = Connection::create(std::move(*sock), true, logger_);
          begin_handshake(conn, topic, done);
        });
    });
}

std::string TcpSwarm::hello_line(const Topic& topic) const {
  json hello;
  hello["type"] = kHelloType;
  hello["public_key"] = options_.public_key;
  hello["topic"] = topic.hex();
  return hello.dump() + "\n";
}

void TcpSwarm::begin_handshake(std::shared_ptr<Connection> conn,
                               std::optional<Topic> expected_topic,
                               std::function<void()> done) {
  auto hs = std::make_shared<Handshake>(io_);
  hs->conn = conn;
  hs->expected_topic = expected_topic;
  hs->done = std::move(done);

  auto self = shared_from_this();
  hs->timer.expires_after(options_.handshake_timeout);
  hs->timer.async_wait([this, self, hs](const std::error_code& ec){
    if(ec) return;
    fail_handshake(hs, "handshake timed out");
  });

  if(expected_topic) {
    conn->write(hello_line(*expected_topic));
  }

  conn->start(
    [this, self, hs](const std::string& line){
      if(hs->finished) return;
      json hello;
      try {
        hello = json::parse(line);
      } catch(const json::parse_error& ex) {
        fail_handshake(hs, std::string("hello is not JSON: ") + ex.what());
        return;
      }
      if(!hello.is_object() || hello.value("type", std::string()) != kHelloType) {
        fail_handshake(hs, "expected swarm-hello");
        return;
      }
      auto remote_key = hello.value("public_key", std::string());
      auto topic = Topic::from_hex(hello.value("topic", std::string()));
      if(remote_key.empty() || !topic) {
        fail_handshake(hs, "hello without key or topic");
        return;
      }
      if(remote_key == options_.public_key) {
        fail_handshake(hs, "connected to self");
        return;
      }
      if(hs->expected_topic) {
        if(*hs->expected_topic != *topic) {
          fail_handshake(hs, "peer answered for a different topic");
          return;
        }
      } else {
        if(!topics_.count(*topic)) {
          fail_handshake(hs, "topic " + topic->room_code() + " not joined");
          return;
        }
        hs->conn->write(hello_line(*topic));
      }
      complete_handshake(hs, remote_key, *topic);
    },
    [this, self, hs](const std::error_code& ec){
      fail_handshake(hs, "closed during handshake: " + ec.message());
    });
}

void TcpSwarm::complete_handshake(const std::shared_ptr<Handshake>& hs,
                                  const std::string& remote_key,
                                  const Topic& topic) {
  hs->finished = true;
  hs->timer.cancel();
  auto conn = hs->conn;
  conn->detach();
  conn->set_remote_public_key(remote_key);
  auto done = std::move(hs->done);

  if(destroyed_ || !on_connection_) {
    conn->close();
    if(done) done();
    return;
  }

  auto it = live_.find(remote_key);
  if(it != live_.end()) {
    auto existing = it->second.first.lock();
    if(existing && existing->is_open()) {
      if(!keep_new_connection(existing, conn)) {
        log_debug(logger_.get(), "Dropping duplicate connection to {}", peer_id_from_key(remote_key));
        conn->close();
        if(done) done();
        return;
      }
      log_debug(logger_.get(), "Replacing connection to {}", peer_id_from_key(remote_key));
      live_.erase(it);
      existing->close();
    }
  }

  live_[remote_key] = std::make_pair(std::weak_ptr<Connection>(conn), topic);
  log_info(logger_.get(), "Peer {} connected on room {} ({})",
           peer_id_from_key(remote_key), topic.room_code(), conn->initiator() ? "outbound" : "inbound");
  on_connection_(conn);
  if(done) done();
}

void TcpSwarm::fail_handshake(const std::shared_ptr<Handshake>& hs, const std::string& reason) {
  if(hs->finished) return;
  hs->finished = true;
  hs->timer.cancel();
  log_debug(logger_.get(), "Handshake with {} failed: {}", hs->conn->remote_endpoint(), reason);
  hs->conn->detach();
  hs->conn->close();
  auto done = std::move(hs->done);
  if(done) done();
}

bool TcpSwarm::keep_new_connection(const std::shared_ptr<Connection>& existing,
                                   const std::shared_ptr<Connection>& incoming) const {
  auto initiator_key = [this](const std::shared_ptr<Connection>& c) -> const std::string& {
    return c->initiator() ? options_.public_key : c->remote_public_key();
  };
  const auto& old_key = initiator_key(existing);
  const auto& new_key = initiator_key(incoming);
  if(old_key == new_key) return true;
  return new_key < old_key;
}

void TcpSwarm::leave(const Topic& topic) {
  topics_.erase(topic);
  std::vector<std::shared_ptr<Connection>> closing;
  for(auto it = live_.begin(); it != live_.end();) {
    if(it->second.second == topic) {
      if(auto conn = it->second.first.lock()) closing.push_back(conn);
      it = live_.erase(it);
    } else {
      ++it;
    }
  }
  for(auto& conn : closing) {
    conn->close();
  }
}

void TcpSwarm::destroy() {
  if(destroyed_) return;
  destroyed_ = true;
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  std::vector<std::shared_ptr<Connection>> closing;
  for(auto& entry : live_) {
    if(auto conn = entry.second.first.lock()) closing.push_back(conn);
  }
  live_.clear();
  topics_.clear();
  for(auto& conn : closing) {
    conn->close();
  }
  on_connection_ = nullptr;
  started_ = false;
}

std::size_t TcpSwarm::live_connections() const {
  std::size_t count = 0;
  for(const auto& entry : live_) {
    auto conn = entry.second.first.lock();
    if(conn && conn->is_open()) count++;
  }
  return count;
}

#pragma once
#include <asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include "swarm.hpp"

class Logger;

// Newline-delimited TCP stream. Used by TcpSwarm for both the hello
// exchange and the framed traffic that follows.
class Connection : public SwarmSocket, public std::enable_shared_from_this<Connection> {
public:
    static constexpr std::size_t kMaxLineBytes = 8 * 1024 * 1024;

    static std::shared_ptr<Connection> create(asio::ip::tcp::socket sock,
                                              bool initiator,
                                              std::shared_ptr<Logger> logger);

    ~Connection() override;

    const std::string& remote_public_key() const override { return remote_public_key_; }
    void set_remote_public_key(const std::string& key) { remote_public_key_ = key; }
    bool initiator() const override { return initiator_; }

    void start(LineHandler on_line, CloseHandler on_close) override;
    bool write(const std::string& line) override;
    void close() override;
    void configure(std::chrono::seconds keep_alive,
                   std::chrono::seconds timeout) override;
    bool is_open() const override { return !closed_; }

    // Drops the current handlers; lines arriving afterwards are held until
    // the next start().
    void detach();

    std::string remote_endpoint() const;

private:
    Connection(asio::ip::tcp::socket sock, bool initiator, std::shared_ptr<Logger> logger);
    void do_read();
    void deliver(std::string line);
    void do_write();
    void shutdown(const std::error_code& ec);

    asio::ip::tcp::socket socket_;
    bool initiator_ = false;
    std::shared_ptr<Logger> logger_;
    asio::streambuf read_buf_;
    std::deque<std::string> write_queue_;
    std::deque<std::string> held_lines_;
    std::string remote_public_key_;
    LineHandler on_line_;
    CloseHandler on_close_;
    bool reading_ = false;
    bool writing_ = false;
    bool closed_ = false;
};

#include "connection.hpp"
#include "log.hpp"
#include <istream>
#include <utility>

#if defined(__linux__)
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#endif

std::shared_ptr<Connection> Connection::create(asio::ip::tcp::socket sock,
                                               bool initiator,
                                               std::shared_ptr<Logger> logger)
{
    return std::shared_ptr<Connection>(new Connection(std::move(sock), initiator, std::move(logger)));
}

Connection::Connection(asio::ip::tcp::socket sock, bool initiator, std::shared_ptr<Logger> logger)
: socket_(std::move(sock)), initiator_(initiator), logger_(std::move(logger)), read_buf_(kMaxLineBytes)
{
}

Connection::~Connection(){
    std::error_code ignored;
    socket_.close(ignored);
}

void Connection::start(LineHandler on_line, CloseHandler on_close){
    on_line_ = std::move(on_line);
    on_close_ = std::move(on_close);

    while(on_line_ && !held_lines_.empty() && !closed_){
        auto line = std::move(held_lines_.front());
        held_lines_.pop_front();
        on_line_(line);
    }

    if(!reading_ && !closed_){
        reading_ = true;
        do_read();
    }
}

void Connection::detach(){
    on_line_ = nullptr;
    on_close_ = nullptr;
}

void Connection::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
        [this, self](std::error_code ec, std::size_t){
            if(closed_) return;
            if(ec){
                if(ec != asio::error::eof && ec != asio::error::operation_aborted){
                    log_debug(logger_.get(), "Connection read error from {}: {}", remote_endpoint(), ec.message());
                }
                shutdown(ec);
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(!line.empty() && line.back() == '\r') line.pop_back();
            if(!line.empty()){
                deliver(std::move(line));
            }
            if(!closed_) do_read();
        });
}

void Connection::deliver(std::string line){
    if(!on_line_){
        held_lines_.push_back(std::move(line));
        return;
    }
    // the handler may replace itself (detach/start) while running
    auto handler = on_line_;
    handler(line);
}

bool Connection::write(const std::string& line){
    if(closed_) return false;
    bool start_write = write_queue_.empty();
    if(!line.empty() && line.back() == '\n'){
        write_queue_.push_back(line);
    } else {
        write_queue_.push_back(line + "\n");
    }
    if(start_write){
        do_write();
    }
    return true;
}

void Connection::do_write(){
    if(write_queue_.empty() || closed_) return;
    writing_ = true;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, self](std::error_code ec, std::size_t){
            if(closed_) return;
            if(ec){
                log_debug(logger_.get(), "Connection write error to {}: {}", remote_endpoint(), ec.message());
                shutdown(ec);
                return;
            }
            write_queue_.pop_front();
            if(!write_queue_.empty()){
                do_write();
            } else {
                writing_ = false;
            }
        });
}

void Connection::close(){
    shutdown(asio::error::operation_aborted);
}

void Connection::shutdown(const std::error_code& ec){
    if(closed_) return;
    closed_ = true;
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    write_queue_.clear();
    held_lines_.clear();

    auto on_close = std::move(on_close_);
    on_close_ = nullptr;
    on_line_ = nullptr;
    if(on_close) on_close(ec);
}

void Connection::configure(std::chrono::seconds keep_alive, std::chrono::seconds timeout){
    if(closed_) return;
    std::error_code ec;
    if(keep_alive.count() > 0){
        socket_.set_option(asio::socket_base::keep_alive(true), ec);
        if(ec){
            log_debug(logger_.get(), "keep_alive option failed: {}", ec.message());
        }
#if defined(__linux__) && defined(TCP_KEEPIDLE)
        int idle = static_cast<int>(keep_alive.count());
        if(::setsockopt(socket_.native_handle(), IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle)) != 0){
            log_debug(logger_.get(), "TCP_KEEPIDLE option failed on {}", remote_endpoint());
        }
#endif
    }
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    if(ec){
        log_debug(logger_.get(), "no_delay option failed: {}", ec.message());
    }
#if defined(__linux__) && defined(TCP_USER_TIMEOUT)
    if(timeout.count() > 0){
        unsigned int ms = static_cast<unsigned int>(timeout.count() * 1000);
        if(::setsockopt(socket_.native_handle(), IPPROTO_TCP, TCP_USER_TIMEOUT, &ms, sizeof(ms)) != 0){
            log_debug(logger_.get(), "TCP_USER_TIMEOUT option failed on {}", remote_endpoint());
        }
    }
#else
    (void)timeout;
#endif
}

std::string Connection::remote_endpoint() const {
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if(ec) return "<unknown>";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

#include "connection.hpp"
#include "log.hpp"

std::shared_ptr<RelayConnection> RelayConnection::create_incoming(asio::ip::tcp::socket sock,
                                                                  std::shared_ptr<RelayHub> hub,
                                                                  std::size_t max_line_bytes)
{
    auto c = std::shared_ptr<RelayConnection>(new RelayConnection(std::move(sock), hub, max_line_bytes));
    c->start();
    return c;
}

RelayConnection::RelayConnection(asio::ip::tcp::socket sock,
                                 std::shared_ptr<RelayHub> hub,
                                 std::size_t max_line_bytes)
: socket_(std::move(sock)), hub_(std::move(hub)), read_buf_(max_line_bytes)
{
    peer_id_ = hub_->next_connection_id();
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

RelayConnection::~RelayConnection(){
    std::error_code ec;
    socket_.close(ec);
}

void RelayConnection::start(){
    hub_->attach(shared_from_this());
    log_debug(nullptr, "{} connected from {}", peer_id_, remote_);
    do_read();
}

void RelayConnection::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, '\n',
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                if(ec == asio::error::not_found){
                    log_warn(nullptr, "{} exceeded the {} byte message limit", peer_id_, read_buf_.max_size());
                } else if(ec != asio::error::eof && ec != asio::error::operation_aborted){
                    log_info(nullptr, "{} read error: {}", peer_id_, ec.message());
                }
                close();
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(!line.empty() && line.back() == '\r') line.pop_back();
            if(!line.empty()){
                hub_->handle_line(peer_id_, line);
            }
            if(!closed_) do_read();
        });
}

void RelayConnection::send_line(const std::string& line){
    if(closed_) return;
    bool start_write = write_queue_.empty();
    write_queue_.push_back(line + "\n");
    if(start_write){
        do_write();
    }
}

void RelayConnection::do_write(){
    if(write_queue_.empty()) return;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                if(ec != asio::error::operation_aborted){
                    log_info(nullptr, "{} write error: {}", peer_id_, ec.message());
                }
                close();
                return;
            }
            write_queue_.pop_front();
            if(!write_queue_.empty()){
                do_write();
            }
        });
}

void RelayConnection::close(){
    if(closed_) return;
    closed_ = true;
    std::error_code ec;
    socket_.close(ec);
    // write_queue_ stays: an in-flight write still points at its front.
    // The hub may hold the only other reference, so pin ourselves first.
    auto self = shared_from_this();
    hub_->detach(peer_id_);
}

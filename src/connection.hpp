#pragma once
#include <asio.hpp>
#include <memory>
#include <string>
#include <deque>
#include "relay_hub.hpp"

// Relay side of one client socket. Reads newline-framed lines into the hub
// and writes whatever the hub routes to it, in order.
class RelayConnection : public RelayPeer,
                        public std::enable_shared_from_this<RelayConnection> {
public:
    static std::shared_ptr<RelayConnection> create_incoming(asio::ip::tcp::socket sock,
                                                            std::shared_ptr<RelayHub> hub,
                                                            std::size_t max_line_bytes);

    ~RelayConnection() override;

    std::string peer_id() const override { return peer_id_; }
    void send_line(const std::string& line) override;

    void start(); // registers with the hub and starts the read loop
    void close();
    bool closed() const { return closed_; }
    std::string remote_address() const { return remote_; }

private:
    RelayConnection(asio::ip::tcp::socket sock,
                    std::shared_ptr<RelayHub> hub,
                    std::size_t max_line_bytes);
    void do_read();
    void do_write();

    asio::ip::tcp::socket socket_;
    std::shared_ptr<RelayHub> hub_;
    asio::streambuf read_buf_;
    std::deque<std::string> write_queue_;
    std::string peer_id_;
    std::string remote_;
    bool closed_ = false;
};

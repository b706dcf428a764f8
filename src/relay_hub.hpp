#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "log.hpp"

// One end of the relay: something that can receive a framed line.
class RelayPeer {
public:
    virtual ~RelayPeer() = default;
    virtual std::string peer_id() const = 0;
    // `line` carries no trailing newline; framing is the transport's job.
    virtual void send_line(const std::string& line) = 0;
};

// Room registry plus broadcaster. Lines are routed by their envelope only;
// transfer payloads are forwarded as the exact text the sender wrote.
class RelayHub {
public:
    struct Stats {
        std::size_t connections = 0;
        std::size_t rooms = 0;
        uint64_t forwarded = 0; // transfer lines routed, even to an empty room
        uint64_t dropped = 0;   // malformed or unroutable lines
    };

    explicit RelayHub(std::shared_ptr<Logger> logger = nullptr);

    std::string next_connection_id();

    void attach(std::shared_ptr<RelayPeer> peer);
    // Transport went away (clean or not): peer:left to every room it was in.
    void detach(const std::string& peer_id);

    // Entry point for every inbound line of a connection.
    void handle_line(const std::string& peer_id, const std::string& line);

    bool join(const std::string& peer_id, const std::string& room_id);
    bool leave(const std::string& peer_id, const std::string& room_id);
    // Returns the number of peers the line was handed to.
    std::size_t broadcast(const std::string& sender_id,
                          const std::string& room_id,
                          const std::string& line);

    std::vector<std::string> members(const std::string& room_id) const;
    std::vector<std::string> rooms_of(const std::string& peer_id) const;
    Stats stats() const;

private:
    std::vector<std::shared_ptr<RelayPeer>> room_targets_locked(const std::string& room_id,
                                                                const std::string& exclude_id) const;
    void remove_membership_locked(const std::string& peer_id, const std::string& room_id);
    void drop(const std::string& peer_id, const std::string& reason);

    std::shared_ptr<Logger> logger_;
    mutable std::mutex m_;
    std::unordered_map<std::string, std::shared_ptr<RelayPeer>> peers_;
    std::unordered_map<std::string, std::set<std::string>> rooms_;       // room -> peer ids
    std::unordered_map<std::string, std::set<std::string>> memberships_; // peer -> room ids
    std::atomic<uint64_t> connection_counter_{0};
    std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> dropped_{0};
};

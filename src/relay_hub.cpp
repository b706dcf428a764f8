#include "relay_hub.hpp"
#include "protocol.hpp"
#include "utils.hpp"

namespace {

std::string room_notice(const char* type, const std::string& room_id){
    json j;
    j["type"] = type;
    j["roomId"] = room_id;
    return j.dump();
}

} // namespace

RelayHub::RelayHub(std::shared_ptr<Logger> logger)
    : logger_(logger ? std::move(logger) : std::make_shared<Logger>("relay"))
{
}

std::string RelayHub::next_connection_id(){
    return "conn-" + std::to_string(++connection_counter_);
}

void RelayHub::attach(std::shared_ptr<RelayPeer> peer){
    if(!peer) return;
    auto id = peer->peer_id();
    {
        std::lock_guard lg(m_);
        peers_[id] = std::move(peer);
    }
    logger_->debug("attached {}", id);
}

void RelayHub::detach(const std::string& peer_id){
    std::vector<std::pair<std::string, std::vector<std::shared_ptr<RelayPeer>>>> notices;
    {
        std::lock_guard lg(m_);
        if(peers_.erase(peer_id) == 0) return;
        auto it = memberships_.find(peer_id);
        if(it != memberships_.end()){
            auto rooms = it->second;
            for(const auto& room_id : rooms){
                remove_membership_locked(peer_id, room_id);
                notices.emplace_back(room_id, room_targets_locked(room_id, peer_id));
            }
            memberships_.erase(peer_id);
        }
    }
    logger_->info("{} disconnected ({} room(s))", peer_id, notices.size());
    for(auto& [room_id, targets] : notices){
        auto line = room_notice(msg::kPeerLeft, room_id);
        for(auto& target : targets) target->send_line(line);
    }
}

void RelayHub::handle_line(const std::string& peer_id, const std::string& line){
    auto env = parse_envelope(line);
    if(!env){
        drop(peer_id, "unparseable line");
        return;
    }
    // Blank or non-string room ids are a silent drop, as are unknown types.
    if(!env->room_id || is_blank(*env->room_id)){
        drop(peer_id, env->type + " without a usable roomId");
        return;
    }
    const auto& room_id = *env->room_id;

    if(env->type == msg::kRoomJoin){
        join(peer_id, room_id);
    } else if(env->type == msg::kRoomLeave){
        leave(peer_id, room_id);
    } else if(is_forwarded_type(env->type)){
        broadcast(peer_id, room_id, line);
    } else {
        drop(peer_id, "unknown type " + env->type);
    }
}

bool RelayHub::join(const std::string& peer_id, const std::string& room_id){
    if(is_blank(room_id)) return false;

    std::shared_ptr<RelayPeer> joiner;
    std::vector<std::shared_ptr<RelayPeer>> others;
    bool fresh = false;
    {
        std::lock_guard lg(m_);
        auto it = peers_.find(peer_id);
        if(it == peers_.end()) return false;
        joiner = it->second;
        fresh = rooms_[room_id].insert(peer_id).second;
        memberships_[peer_id].insert(room_id);
        if(fresh) others = room_targets_locked(room_id, peer_id);
    }

    logger_->info("{} joined room {} ({} other member(s))", peer_id, room_id, others.size());
    joiner->send_line(room_notice(msg::kRoomJoined, room_id));
    if(fresh){
        auto notice = room_notice(msg::kPeerJoined, room_id);
        for(auto& peer : others) peer->send_line(notice);
    }
    return true;
}

bool RelayHub::leave(const std::string& peer_id, const std::string& room_id){
    std::vector<std::shared_ptr<RelayPeer>> others;
    {
        std::lock_guard lg(m_);
        auto room = rooms_.find(room_id);
        if(room == rooms_.end() || room->second.count(peer_id) == 0) return false;
        remove_membership_locked(peer_id, room_id);
        auto membership = memberships_.find(peer_id);
        if(membership != memberships_.end()){
            membership->second.erase(room_id);
            if(membership->second.empty()) memberships_.erase(membership);
        }
        others = room_targets_locked(room_id, peer_id);
    }

    logger_->info("{} left room {}", peer_id, room_id);
    auto notice = room_notice(msg::kPeerLeft, room_id);
    for(auto& peer : others) peer->send_line(notice);
    return true;
}

std::size_t RelayHub::broadcast(const std::string& sender_id,
                                const std::string& room_id,
                                const std::string& line){
    std::vector<std::shared_ptr<RelayPeer>> targets;
    {
        std::lock_guard lg(m_);
        targets = room_targets_locked(room_id, sender_id);
    }
    for(auto& peer : targets) peer->send_line(line);
    ++forwarded_;
    return targets.size();
}

std::vector<std::string> RelayHub::members(const std::string& room_id) const{
    std::lock_guard lg(m_);
    auto it = rooms_.find(room_id);
    if(it == rooms_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::vector<std::string> RelayHub::rooms_of(const std::string& peer_id) const{
    std::lock_guard lg(m_);
    auto it = memberships_.find(peer_id);
    if(it == memberships_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

RelayHub::Stats RelayHub::stats() const{
    Stats s;
    {
        std::lock_guard lg(m_);
        s.connections = peers_.size();
        s.rooms = rooms_.size();
    }
    s.forwarded = forwarded_.load();
    s.dropped = dropped_.load();
    return s;
}

std::vector<std::shared_ptr<RelayPeer>> RelayHub::room_targets_locked(const std::string& room_id,
                                                                      const std::string& exclude_id) const{
    std::vector<std::shared_ptr<RelayPeer>> out;
    auto room = rooms_.find(room_id);
    if(room == rooms_.end()) return out;
    for(const auto& member : room->second){
        if(member == exclude_id) continue;
        auto peer = peers_.find(member);
        if(peer != peers_.end() && peer->second) out.push_back(peer->second);
    }
    return out;
}

void RelayHub::remove_membership_locked(const std::string& peer_id, const std::string& room_id){
    auto room = rooms_.find(room_id);
    if(room == rooms_.end()) return;
    room->second.erase(peer_id);
    if(room->second.empty()) rooms_.erase(room);
}

void RelayHub::drop(const std::string& peer_id, const std::string& reason){
    ++dropped_;
    logger_->debug("dropped line from {}: {}", peer_id, reason);
}

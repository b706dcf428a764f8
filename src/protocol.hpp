#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using json = nlohmann::json;

// protocol.hpp
inline constexpr std::size_t kChunkSize = 512 * 1024;
inline constexpr std::size_t kMaxMessageBytes = std::size_t{2} * 1024 * 1024 * 1024;
inline constexpr std::size_t kParallelLimit = 3;
inline constexpr unsigned short kDefaultRelayPort = 3000;

namespace msg {
inline constexpr const char* kRoomJoin = "room:join";
inline constexpr const char* kRoomLeave = "room:leave";
inline constexpr const char* kRoomJoined = "room:joined";
inline constexpr const char* kPeerJoined = "peer:joined";
inline constexpr const char* kPeerLeft = "peer:left";
inline constexpr const char* kFileMeta = "file:meta";
inline constexpr const char* kFileChunk = "file:chunk";
inline constexpr const char* kFileComplete = "file:complete";
inline constexpr const char* kFileError = "file:error";
} // namespace msg

// Outgoing transfers use Sending, incoming ones Receiving. Complete and
// Error are terminal.
enum class TransferStatus { Pending, Sending, Receiving, Complete, Error };
const char* to_string(TransferStatus status);
inline bool is_terminal(TransferStatus status) {
  return status == TransferStatus::Complete || status == TransferStatus::Error;
}

struct TransferMeta {
  std::string transfer_id;
  std::string name;
  uint64_t size = 0;
  std::string mime_type;
  std::optional<std::string> relative_path; // only for files picked from a folder
  std::size_t total_chunks = 1;
};

struct RoomJoin { std::string room_id; };
struct RoomLeave { std::string room_id; };
struct RoomJoined { std::string room_id; };
struct PeerJoined { std::string room_id; };
struct PeerLeft { std::string room_id; };

struct FileMeta {
  std::string room_id;
  TransferMeta meta;
};

struct FileChunk {
  std::string room_id;
  std::string transfer_id;
  std::size_t chunk_index = 0;
  std::vector<char> bytes;
};

struct FileComplete {
  std::string room_id;
  std::string transfer_id;
};

struct FileError {
  std::string room_id;
  std::string transfer_id;
  std::optional<std::string> message;
};

using RelayMessage = std::variant<RoomJoin, RoomLeave, RoomJoined, PeerJoined, PeerLeft,
                                  FileMeta, FileChunk, FileComplete, FileError>;

// max(1, ceil(size / chunk_size))
std::size_t total_chunks_for(uint64_t size, std::size_t chunk_size = kChunkSize);

const char* message_type(const RelayMessage& message);
json encode_message(const RelayMessage& message);
std::string encode_line(const RelayMessage& message);
std::optional<RelayMessage> decode_message(const json& j, std::string& error);

// What the relay needs to route a line: the type and the room. The `chunk`
// field is dropped while parsing so payload bytes never land in a json value.
struct Envelope {
  std::string type;
  std::optional<std::string> room_id; // nullopt when missing or not a string
};

std::optional<Envelope> parse_envelope(const std::string& line);
bool is_forwarded_type(const std::string& type);

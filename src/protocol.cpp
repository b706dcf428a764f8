#include "protocol.hpp"
#include "utils.hpp"
#include <algorithm>
#include <type_traits>

namespace {

bool read_string(const json& j, const char* key, std::string& out, std::string& error){
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()){
    error = std::string("missing or non-string '") + key + "'";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool read_id(const json& j, const char* key, std::string& out, std::string& error){
  if(!read_string(j, key, out, error)) return false;
  if(is_blank(out)){
    error = std::string("blank '") + key + "'";
    return false;
  }
  return true;
}

// Absent and null leave `out` untouched; anything but a string is rejected.
bool read_optional_string(const json& j, const char* key, std::optional<std::string>& out, std::string& error){
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return true;
  if(!it->is_string()){
    error = std::string("non-string '") + key + "'";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

template<typename T>
bool read_unsigned(const json& j, const char* key, T& out, std::string& error){
  auto it = j.find(key);
  if(it == j.end() || !it->is_number_unsigned()){
    error = std::string("missing or invalid '") + key + "'";
    return false;
  }
  out = it->get<T>();
  return true;
}

json room_only(const char* type, const std::string& room_id){
  json j;
  j["type"] = type;
  j["roomId"] = room_id;
  return j;
}

} // namespace

const char* to_string(TransferStatus status){
  switch(status){
    case TransferStatus::Pending: return "pending";
    case TransferStatus::Sending: return "sending";
    case TransferStatus::Receiving: return "receiving";
    case TransferStatus::Complete: return "complete";
    case TransferStatus::Error: return "error";
  }
  return "unknown";
}

std::size_t total_chunks_for(uint64_t size, std::size_t chunk_size){
  if(chunk_size == 0 || size == 0) return 1;
  return static_cast<std::size_t>((size + chunk_size - 1) / chunk_size);
}

const char* message_type(const RelayMessage& message){
  return std::visit([](const auto& m) -> const char* {
    using T = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<T, RoomJoin>) return msg::kRoomJoin;
    else if constexpr (std::is_same_v<T, RoomLeave>) return msg::kRoomLeave;
    else if constexpr (std::is_same_v<T, RoomJoined>) return msg::kRoomJoined;
    else if constexpr (std::is_same_v<T, PeerJoined>) return msg::kPeerJoined;
    else if constexpr (std::is_same_v<T, PeerLeft>) return msg::kPeerLeft;
    else if constexpr (std::is_same_v<T, FileMeta>) return msg::kFileMeta;
    else if constexpr (std::is_same_v<T, FileChunk>) return msg::kFileChunk;
    else if constexpr (std::is_same_v<T, FileComplete>) return msg::kFileComplete;
    else return msg::kFileError;
  }, message);
}

json encode_message(const RelayMessage& message){
  const char* type = message_type(message);
  return std::visit([type](const auto& m) -> json {
    using T = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<T, FileMeta>) {
      json j = room_only(type, m.room_id);
      j["transferId"] = m.meta.transfer_id;
      j["name"] = m.meta.name;
      j["size"] = m.meta.size;
      // "type" is the message tag, so the mime type travels as "mimeType".
      j["mimeType"] = m.meta.mime_type;
      j["totalChunks"] = m.meta.total_chunks;
      if(m.meta.relative_path) j["relativePath"] = *m.meta.relative_path;
      return j;
    } else if constexpr (std::is_same_v<T, FileChunk>) {
      json j = room_only(type, m.room_id);
      j["transferId"] = m.transfer_id;
      j["chunkIndex"] = m.chunk_index;
      j["chunk"] = base64_encode(m.bytes.data(), m.bytes.size());
      return j;
    } else if constexpr (std::is_same_v<T, FileComplete>) {
      json j = room_only(type, m.room_id);
      j["transferId"] = m.transfer_id;
      return j;
    } else if constexpr (std::is_same_v<T, FileError>) {
      json j = room_only(type, m.room_id);
      j["transferId"] = m.transfer_id;
      if(m.message) j["message"] = *m.message;
      return j;
    } else {
      return room_only(type, m.room_id);
    }
  }, message);
}

std::string encode_line(const RelayMessage& message){
  return encode_message(message).dump() + "\n";
}

std::optional<RelayMessage> decode_message(const json& j, std::string& error){
  error.clear();
  if(!j.is_object()){
    error = "message is not an object";
    return std::nullopt;
  }
  std::string type;
  if(!read_string(j, "type", type, error)) return std::nullopt;

  std::string room_id;
  if(!read_id(j, "roomId", room_id, error)) return std::nullopt;

  if(type == msg::kRoomJoin) return RoomJoin{room_id};
  if(type == msg::kRoomLeave) return RoomLeave{room_id};
  if(type == msg::kRoomJoined) return RoomJoined{room_id};
  if(type == msg::kPeerJoined) return PeerJoined{room_id};
  if(type == msg::kPeerLeft) return PeerLeft{room_id};

  std::string transfer_id;
  if(!read_id(j, "transferId", transfer_id, error)) return std::nullopt;

  if(type == msg::kFileMeta){
    FileMeta m;
    m.room_id = room_id;
    m.meta.transfer_id = transfer_id;
    if(!read_string(j, "name", m.meta.name, error)) return std::nullopt;
    if(!read_unsigned(j, "size", m.meta.size, error)) return std::nullopt;
    if(!read_unsigned(j, "totalChunks", m.meta.total_chunks, error)) return std::nullopt;
    // Every chunk but an empty file's only chunk carries at least one byte.
    if(m.meta.total_chunks == 0 || m.meta.total_chunks > std::max<uint64_t>(1, m.meta.size)){
      error = "totalChunks out of range";
      return std::nullopt;
    }
    std::optional<std::string> mime;
    if(!read_optional_string(j, "mimeType", mime, error)) return std::nullopt;
    m.meta.mime_type = mime.value_or("");
    if(!read_optional_string(j, "relativePath", m.meta.relative_path, error)) return std::nullopt;
    if(m.meta.relative_path && m.meta.relative_path->empty()) m.meta.relative_path.reset();
    return m;
  }
  if(type == msg::kFileChunk){
    FileChunk c;
    c.room_id = room_id;
    c.transfer_id = transfer_id;
    if(!read_unsigned(j, "chunkIndex", c.chunk_index, error)) return std::nullopt;
    std::string encoded;
    if(!read_string(j, "chunk", encoded, error)) return std::nullopt;
    auto bytes = base64_decode(encoded);
    if(!bytes){
      error = "chunk is not valid base64";
      return std::nullopt;
    }
    c.bytes = std::move(*bytes);
    return c;
  }
  if(type == msg::kFileComplete){
    return FileComplete{room_id, transfer_id};
  }
  if(type == msg::kFileError){
    FileError e{room_id, transfer_id, std::nullopt};
    if(!read_optional_string(j, "message", e.message, error)) return std::nullopt;
    return e;
  }
  error = "unknown message type '" + type + "'";
  return std::nullopt;
}

std::optional<Envelope> parse_envelope(const std::string& line){
  json::parser_callback_t skip_payload = [](int /*depth*/, json::parse_event_t event, json& parsed){
    return !(event == json::parse_event_t::key && parsed == "chunk");
  };
  json j = json::parse(line, skip_payload, false);
  if(j.is_discarded() || !j.is_object()) return std::nullopt;

  auto type = j.find("type");
  if(type == j.end() || !type->is_string()) return std::nullopt;

  Envelope env;
  env.type = type->get<std::string>();
  auto room = j.find("roomId");
  if(room != j.end() && room->is_string()){
    env.room_id = room->get<std::string>();
  }
  return env;
}

bool is_forwarded_type(const std::string& type){
  return type == msg::kFileMeta || type == msg::kFileChunk ||
         type == msg::kFileComplete || type == msg::kFileError;
}

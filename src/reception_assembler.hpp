#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"

// What to do when `complete` arrives while some chunk slots are still empty.
enum class AssemblyPolicy {
  Strict,  // the transfer fails with "missing N of M chunks"
  Lenient  // empty slots are skipped and the payload comes out short
};

using Payload = std::shared_ptr<const std::vector<char>>;

struct IncomingTransfer {
  TransferMeta meta;
  uint64_t received_bytes = 0;
  std::size_t received_chunks = 0; // distinct slots filled, never above total_chunks
  TransferStatus status = TransferStatus::Pending;
  std::optional<std::string> error_message;
  Payload payload; // set once complete, until taken
};

using AssemblerListenerHandle = std::size_t;

// Rebuilds incoming files from meta/chunk/complete/error messages.
//
// Every completed payload stays in memory until take_payload() is called for
// it, and nothing bounds the number or size of transfers in flight.
class ReceptionAssembler {
public:
  using Listener = std::function<void(const IncomingTransfer&)>;

  explicit ReceptionAssembler(AssemblyPolicy policy = AssemblyPolicy::Strict,
                              std::shared_ptr<Logger> logger = nullptr);

  // Routes the file:* messages; room notices are ignored.
  void handle(RelayMessage message);

  void on_meta(const TransferMeta& meta);
  void on_chunk(const std::string& transfer_id, std::size_t chunk_index, std::vector<char> bytes);
  void on_complete(const std::string& transfer_id);
  void on_error(const std::string& transfer_id, const std::optional<std::string>& message);

  std::vector<IncomingTransfer> snapshot() const;
  std::optional<IncomingTransfer> find(const std::string& transfer_id) const;
  Payload payload(const std::string& transfer_id) const;
  // Hands the payload over and drops the assembler's reference to it.
  Payload take_payload(const std::string& transfer_id);
  // Bytes held in unfinished slot buffers plus payloads not yet taken.
  std::size_t buffered_bytes() const;

  AssemblerListenerHandle subscribe(Listener listener);
  void unsubscribe(AssemblerListenerHandle handle);

  AssemblyPolicy policy() const;
  void set_policy(AssemblyPolicy policy);
  void set_transfer_debug(bool enabled) { transfer_debug_ = enabled; }

private:
  struct Record {
    IncomingTransfer info;
    std::map<std::size_t, std::vector<char>> slots; // chunk index -> bytes
    bool buffer_live = false;
  };

  Record* find_locked(const std::string& transfer_id);
  void release_locked(Record& record);
  void notify(const IncomingTransfer& transfer);

  std::shared_ptr<Logger> logger_;
  std::atomic<bool> transfer_debug_{false};

  mutable std::mutex m_;
  AssemblyPolicy policy_;
  std::vector<Record> records_;
  std::unordered_map<std::string, std::size_t> index_;

  mutable std::mutex listener_mutex_;
  std::unordered_map<AssemblerListenerHandle, Listener> listeners_;
  std::atomic<AssemblerListenerHandle> next_listener_id_{1};
};

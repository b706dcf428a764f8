#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "file_source.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "relay_client.hpp"

struct OutgoingTransfer {
  TransferMeta meta;
  std::size_t sent_chunks = 0;
  TransferStatus status = TransferStatus::Pending;
  std::optional<std::string> error_message;
};

using SenderListenerHandle = std::size_t;

// Queues files and streams them into a room as meta, chunks, complete.
// Files go out in batches of at most `parallel_limit`, one worker thread per
// file; the next batch starts only once the whole current batch is terminal.
class TransferSender {
public:
  struct Options {
    std::size_t parallel_limit = kParallelLimit;
    std::size_t chunk_size = kChunkSize;
    bool transfer_debug = false;
  };

  using Listener = std::function<void(const OutgoingTransfer&)>;

  TransferSender(std::shared_ptr<TransferChannel> channel,
                 Options options,
                 std::shared_ptr<Logger> logger = nullptr);
  explicit TransferSender(std::shared_ptr<TransferChannel> channel);

  // Appends to the queue; nothing is sent until send_all.
  std::size_t enqueue(std::vector<std::shared_ptr<FileSource>> files);
  std::size_t queued() const;

  // Drains the queue into `room_id` and returns once every file is terminal.
  // Refuses when the channel is down, the room is blank or a drain is
  // already running.
  bool send_all(const std::string& room_id, std::string& error);

  // Complete only means every message was queued on the channel. When the
  // channel could not be flushed afterwards, turns each Complete transfer
  // into Error with `reason` and returns how many changed.
  std::size_t mark_undelivered(const std::string& reason);

  std::vector<OutgoingTransfer> snapshot() const;
  std::optional<OutgoingTransfer> find(const std::string& transfer_id) const;

  // Called from worker threads on every record change.
  SenderListenerHandle subscribe(Listener listener);
  void unsubscribe(SenderListenerHandle handle);

private:
  struct QueueEntry {
    uint64_t id = 0;
    std::shared_ptr<FileSource> source;
  };

  void send_one(const QueueEntry& entry, const std::string& room_id);
  bool stream_file(const FileSource& source, const std::string& room_id,
                   const std::string& transfer_id, std::size_t total_chunks,
                   std::string& error);
  void record(const OutgoingTransfer& transfer);
  void update(const std::string& transfer_id,
              const std::function<void(OutgoingTransfer&)>& change);
  void notify(const OutgoingTransfer& transfer);
  void dequeue(uint64_t entry_id);

  std::shared_ptr<TransferChannel> channel_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::deque<QueueEntry> queue_;
  uint64_t next_entry_id_ = 1;
  bool sending_ = false;
  std::vector<OutgoingTransfer> transfers_;
  std::unordered_map<std::string, std::size_t> index_; // transfer id -> transfers_ slot

  mutable std::mutex listener_mutex_;
  std::unordered_map<SenderListenerHandle, Listener> listeners_;
  std::atomic<SenderListenerHandle> next_listener_id_{1};
};

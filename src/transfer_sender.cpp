#include "transfer_sender.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

#include "utils.hpp"

TransferSender::TransferSender(std::shared_ptr<TransferChannel> channel,
                               Options options,
                               std::shared_ptr<Logger> logger)
  : channel_(std::move(channel)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sender")) {
  if(options_.parallel_limit == 0) options_.parallel_limit = kParallelLimit;
  if(options_.chunk_size == 0) options_.chunk_size = kChunkSize;
}

TransferSender::TransferSender(std::shared_ptr<TransferChannel> channel)
  : TransferSender(std::move(channel), Options{}) {}

std::size_t TransferSender::enqueue(std::vector<std::shared_ptr<FileSource>> files) {
  std::lock_guard lg(m_);
  std::size_t added = 0;
  for(auto& file : files) {
    if(!file) continue;
    queue_.push_back(QueueEntry{next_entry_id_++, std::move(file)});
    ++added;
  }
  return added;
}

std::size_t TransferSender::queued() const {
  std::lock_guard lg(m_);
  return queue_.size();
}

bool TransferSender::send_all(const std::string& room_id, std::string& error) {
  if(!channel_ || !channel_->connected()) {
    error = "connect to the relay before sending";
    logger_->warn("{}", error);
    return false;
  }
  if(is_blank(room_id)) {
    error = "room id is blank";
    logger_->warn("{}", error);
    return false;
  }
  {
    std::lock_guard lg(m_);
    if(sending_) {
      error = "a send is already in progress";
      return false;
    }
    sending_ = true;
  }
  struct SendingReset {
    TransferSender& sender;
    ~SendingReset() {
      std::lock_guard lg(sender.m_);
      sender.sending_ = false;
    }
  } reset{*this};

  std::size_t batch_number = 0;
  while(true) {
    std::vector<QueueEntry> batch;
    {
      std::lock_guard lg(m_);
      auto count = std::min(options_.parallel_limit, queue_.size());
      batch.assign(queue_.begin(), queue_.begin() + static_cast<std::ptrdiff_t>(count));
    }
    if(batch.empty()) break;

    ++batch_number;
    logger_->debug("batch {}: {} file(s)", batch_number, batch.size());
    std::vector<std::thread> workers;
    workers.reserve(batch.size());
    try {
      for(const auto& entry : batch) {
        workers.emplace_back([this, entry, room_id](){
          send_one(entry, room_id);
        });
      }
    } catch(const std::system_error& e) {
      // Files whose worker never started stay queued for the next send_all.
      for(auto& worker : workers) worker.join();
      error = std::string("could not start sender thread: ") + e.what();
      logger_->error("{}", error);
      return false;
    }
    for(auto& worker : workers) worker.join();
  }
  return true;
}

std::size_t TransferSender::mark_undelivered(const std::string& reason) {
  std::vector<OutgoingTransfer> changed;
  {
    std::lock_guard lg(m_);
    for(auto& transfer : transfers_) {
      if(transfer.status != TransferStatus::Complete) continue;
      transfer.status = TransferStatus::Error;
      transfer.error_message = reason;
      changed.push_back(transfer);
    }
  }
  for(const auto& transfer : changed) {
    logger_->error("{} not confirmed: {}", transfer.meta.name, reason);
    notify(transfer);
  }
  return changed.size();
}

void TransferSender::send_one(const QueueEntry& entry, const std::string& room_id) {
  const auto& source = *entry.source;
  OutgoingTransfer transfer;
  transfer.meta.transfer_id = generate_transfer_id();
  transfer.meta.name = source.name();
  transfer.meta.size = source.size();
  transfer.meta.mime_type = source.mime_type();
  transfer.meta.relative_path = source.relative_path();
  transfer.meta.total_chunks = total_chunks_for(source.size(), options_.chunk_size);
  const auto transfer_id = transfer.meta.transfer_id;
  record(transfer);

  std::string error;
  bool ok = false;
  try {
    if(!channel_->emit(FileMeta{room_id, transfer.meta}, error)) {
      error = "meta: " + error;
    } else {
      update(transfer_id, [](OutgoingTransfer& t){ t.status = TransferStatus::Sending; });
      ok = stream_file(source, room_id, transfer_id, transfer.meta.total_chunks, error);
    }
  } catch(const std::exception& e) {
    error = e.what();
    ok = false;
  }

  if(ok) {
    update(transfer_id, [](OutgoingTransfer& t){ t.status = TransferStatus::Complete; });
    logger_->info("sent {} ({} bytes, {} chunk(s))", source.name(), source.size(), transfer.meta.total_chunks);
  } else {
    update(transfer_id, [&](OutgoingTransfer& t){
      t.status = TransferStatus::Error;
      t.error_message = error;
    });
    logger_->error("failed to send {}: {}", source.name(), error);
    std::string emit_error;
    if(!channel_->emit(FileError{room_id, transfer_id, error}, emit_error)) {
      logger_->debug("could not report failure of {}: {}", transfer_id, emit_error);
    }
  }
  dequeue(entry.id);
}

bool TransferSender::stream_file(const FileSource& source, const std::string& room_id,
                                 const std::string& transfer_id, std::size_t total_chunks,
                                 std::string& error) {
  const uint64_t size = source.size();
  const uint64_t chunk_size = options_.chunk_size;
  std::vector<char> buffer;
  for(std::size_t index = 0; index < total_chunks; ++index) {
    uint64_t offset = static_cast<uint64_t>(index) * chunk_size;
    auto length = static_cast<std::size_t>(offset >= size ? 0 : std::min(chunk_size, size - offset));
    if(!source.read(offset, length, buffer, error)) {
      error = "read chunk " + std::to_string(index) + ": " + error;
      return false;
    }
    RelayMessage chunk = FileChunk{room_id, transfer_id, index, std::move(buffer)};
    buffer = std::vector<char>();
    if(!channel_->emit(chunk, error)) {
      error = "chunk " + std::to_string(index) + ": " + error;
      return false;
    }
    update(transfer_id, [](OutgoingTransfer& t){ ++t.sent_chunks; });
    if(options_.transfer_debug) {
      logger_->debug("{} chunk {}/{} ({} bytes)", source.name(), index + 1, total_chunks, length);
    }
  }
  if(!channel_->emit(FileComplete{room_id, transfer_id}, error)) {
    error = "complete: " + error;
    return false;
  }
  return true;
}

void TransferSender::record(const OutgoingTransfer& transfer) {
  {
    std::lock_guard lg(m_);
    index_[transfer.meta.transfer_id] = transfers_.size();
    transfers_.push_back(transfer);
  }
  notify(transfer);
}

void TransferSender::update(const std::string& transfer_id,
                            const std::function<void(OutgoingTransfer&)>& change) {
  OutgoingTransfer copy;
  {
    std::lock_guard lg(m_);
    auto it = index_.find(transfer_id);
    if(it == index_.end()) return;
    auto& transfer = transfers_[it->second];
    change(transfer);
    copy = transfer;
  }
  notify(copy);
}

void TransferSender::dequeue(uint64_t entry_id) {
  std::lock_guard lg(m_);
  queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                              [&](const QueueEntry& e){ return e.id == entry_id; }),
               queue_.end());
}

std::vector<OutgoingTransfer> TransferSender::snapshot() const {
  std::lock_guard lg(m_);
  return transfers_;
}

std::optional<OutgoingTransfer> TransferSender::find(const std::string& transfer_id) const {
  std::lock_guard lg(m_);
  auto it = index_.find(transfer_id);
  if(it == index_.end()) return std::nullopt;
  return transfers_[it->second];
}

SenderListenerHandle TransferSender::subscribe(Listener listener) {
  auto handle = next_listener_id_.fetch_add(1);
  std::lock_guard lg(listener_mutex_);
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void TransferSender::unsubscribe(SenderListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

void TransferSender::notify(const OutgoingTransfer& transfer) {
  std::vector<Listener> targets;
  {
    std::lock_guard lg(listener_mutex_);
    targets.reserve(listeners_.size());
    for(const auto& [handle, listener] : listeners_) targets.push_back(listener);
  }
  for(auto& listener : targets) {
    try {
      listener(transfer);
    } catch(const std::exception& e) {
      logger_->error("sender listener threw: {}", e.what());
    }
  }
}

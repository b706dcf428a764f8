#include "reception_assembler.hpp"

#include <type_traits>
#include <variant>

#include "utils.hpp"

namespace {

const char* const kDefaultErrorMessage = "transfer failed on the sending side";

}

ReceptionAssembler::ReceptionAssembler(AssemblyPolicy policy, std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("receiver")),
    policy_(policy) {}

void ReceptionAssembler::handle(RelayMessage message) {
  std::visit([this](auto& m){
    using T = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<T, FileMeta>) on_meta(m.meta);
    else if constexpr (std::is_same_v<T, FileChunk>) on_chunk(m.transfer_id, m.chunk_index, std::move(m.bytes));
    else if constexpr (std::is_same_v<T, FileComplete>) on_complete(m.transfer_id);
    else if constexpr (std::is_same_v<T, FileError>) on_error(m.transfer_id, m.message);
  }, message);
}

ReceptionAssembler::Record* ReceptionAssembler::find_locked(const std::string& transfer_id) {
  auto it = index_.find(transfer_id);
  if(it == index_.end()) return nullptr;
  return &records_[it->second];
}

void ReceptionAssembler::release_locked(Record& record) {
  record.slots.clear();
  record.buffer_live = false;
}

void ReceptionAssembler::on_meta(const TransferMeta& meta) {
  IncomingTransfer copy;
  {
    std::lock_guard lg(m_);
    Record fresh;
    fresh.info.meta = meta;
    fresh.buffer_live = true;
    auto it = index_.find(meta.transfer_id);
    if(it != index_.end()) {
      logger_->debug("meta for {} replaces the previous record", meta.transfer_id);
      records_[it->second] = std::move(fresh);
      copy = records_[it->second].info;
    } else {
      index_[meta.transfer_id] = records_.size();
      records_.push_back(std::move(fresh));
      copy = records_.back().info;
    }
  }
  logger_->info("incoming {} ({} bytes, {} chunk(s))", meta.name, meta.size, meta.total_chunks);
  notify(copy);
}

void ReceptionAssembler::on_chunk(const std::string& transfer_id,
                                  std::size_t chunk_index,
                                  std::vector<char> bytes) {
  IncomingTransfer copy;
  {
    std::lock_guard lg(m_);
    auto* record = find_locked(transfer_id);
    if(!record || !record->buffer_live) {
      logger_->debug("chunk for unknown or finished transfer {}", transfer_id);
      return;
    }
    auto& info = record->info;
    if(chunk_index >= info.meta.total_chunks) {
      logger_->debug("chunk {} out of range for {} ({} chunk(s))",
                     chunk_index, transfer_id, info.meta.total_chunks);
      return;
    }
    auto slot = record->slots.find(chunk_index);
    if(slot != record->slots.end()) {
      // Last write wins; the slot was already counted.
      info.received_bytes = info.received_bytes - slot->second.size() + bytes.size();
      slot->second = std::move(bytes);
    } else {
      info.received_bytes += bytes.size();
      ++info.received_chunks;
      record->slots.emplace(chunk_index, std::move(bytes));
    }
    info.status = TransferStatus::Receiving;
    if(transfer_debug_) {
      logger_->debug("{} chunk {} ({}/{})", info.meta.name, chunk_index,
                     info.received_chunks, info.meta.total_chunks);
    }
    copy = info;
  }
  notify(copy);
}

void ReceptionAssembler::on_complete(const std::string& transfer_id) {
  IncomingTransfer copy;
  {
    std::lock_guard lg(m_);
    auto* record = find_locked(transfer_id);
    if(!record || is_terminal(record->info.status)) return;
    auto& info = record->info;
    const std::size_t total = info.meta.total_chunks;
    const std::size_t missing = total - record->slots.size();

    if(missing > 0 && policy_ == AssemblyPolicy::Strict) {
      info.status = TransferStatus::Error;
      info.error_message = "missing " + std::to_string(missing) + " of " + std::to_string(total) + " chunks";
      release_locked(*record);
      logger_->error("{}: {}", info.meta.name, *info.error_message);
      copy = info;
    } else {
      auto assembled = std::make_shared<std::vector<char>>();
      assembled->reserve(static_cast<std::size_t>(info.received_bytes));
      for(const auto& [index, bytes] : record->slots) {
        assembled->insert(assembled->end(), bytes.begin(), bytes.end());
      }
      if(missing > 0) {
        logger_->warn("{}: assembled without {} of {} chunks", info.meta.name, missing, total);
      }
      info.received_chunks = record->slots.size();
      info.received_bytes = assembled->size();
      release_locked(*record);

      if(policy_ == AssemblyPolicy::Strict && assembled->size() != info.meta.size) {
        info.status = TransferStatus::Error;
        info.error_message = "size mismatch: received " + std::to_string(assembled->size()) +
                             " of " + std::to_string(info.meta.size) + " bytes";
        logger_->error("{}: {}", info.meta.name, *info.error_message);
      } else {
        info.status = TransferStatus::Complete;
        if(transfer_debug_) {
          logger_->debug("{} sha256 {}", info.meta.name, sha256_hex(*assembled));
        }
        info.payload = std::move(assembled);
        logger_->info("received {} ({} bytes)", info.meta.name, info.received_bytes);
      }
      copy = info;
    }
  }
  notify(copy);
}

void ReceptionAssembler::on_error(const std::string& transfer_id,
                                  const std::optional<std::string>& message) {
  IncomingTransfer copy;
  {
    std::lock_guard lg(m_);
    auto* record = find_locked(transfer_id);
    if(!record || is_terminal(record->info.status)) return;
    auto& info = record->info;
    info.status = TransferStatus::Error;
    info.error_message = (message && !message->empty()) ? *message : std::string(kDefaultErrorMessage);
    release_locked(*record);
    logger_->error("{} failed: {}", info.meta.name, *info.error_message);
    copy = info;
  }
  notify(copy);
}

std::vector<IncomingTransfer> ReceptionAssembler::snapshot() const {
  std::lock_guard lg(m_);
  std::vector<IncomingTransfer> out;
  out.reserve(records_.size());
  for(const auto& record : records_) out.push_back(record.info);
  return out;
}

std::optional<IncomingTransfer> ReceptionAssembler::find(const std::string& transfer_id) const {
  std::lock_guard lg(m_);
  auto it = index_.find(transfer_id);
  if(it == index_.end()) return std::nullopt;
  return records_[it->second].info;
}

Payload ReceptionAssembler::payload(const std::string& transfer_id) const {
  std::lock_guard lg(m_);
  auto it = index_.find(transfer_id);
  if(it == index_.end()) return nullptr;
  return records_[it->second].info.payload;
}

Payload ReceptionAssembler::take_payload(const std::string& transfer_id) {
  std::lock_guard lg(m_);
  auto* record = find_locked(transfer_id);
  if(!record) return nullptr;
  return std::move(record->info.payload);
}

std::size_t ReceptionAssembler::buffered_bytes() const {
  std::lock_guard lg(m_);
  std::size_t total = 0;
  for(const auto& record : records_) {
    for(const auto& [index, bytes] : record.slots) total += bytes.size();
    if(record.info.payload) total += record.info.payload->size();
  }
  return total;
}

AssemblyPolicy ReceptionAssembler::policy() const {
  std::lock_guard lg(m_);
  return policy_;
}

void ReceptionAssembler::set_policy(AssemblyPolicy policy) {
  std::lock_guard lg(m_);
  policy_ = policy;
}

AssemblerListenerHandle ReceptionAssembler::subscribe(Listener listener) {
  auto handle = next_listener_id_.fetch_add(1);
  std::lock_guard lg(listener_mutex_);
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void ReceptionAssembler::unsubscribe(AssemblerListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

void ReceptionAssembler::notify(const IncomingTransfer& transfer) {
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
      logger_->error("receiver listener threw: {}", e.what());
    }
  }
}

#include "folder_aggregator.hpp"

#include <algorithm>
#include <fstream>
#include <unordered_map>

#include "zip_writer.hpp"

const char* to_string(SaveOutcome outcome) {
  switch(outcome) {
    case SaveOutcome::Saved: return "saved";
    case SaveOutcome::Archived: return "archived";
    case SaveOutcome::Cancelled: return "cancelled";
    case SaveOutcome::NotReady: return "not ready";
    case SaveOutcome::NotFound: return "not found";
    case SaveOutcome::IoError: return "io error";
  }
  return "unknown";
}

std::string top_level_segment(const std::string& relative_path) {
  auto slash = relative_path.find('/');
  return slash == std::string::npos ? relative_path : relative_path.substr(0, slash);
}

bool is_safe_relative_path(const std::string& relative_path) {
  if(relative_path.empty() || relative_path.front() == '/') return false;
  if(relative_path.find('\0') != std::string::npos || relative_path.find('\\') != std::string::npos) return false;
  if(std::filesystem::path(relative_path).has_root_path()) return false;
  std::size_t start = 0;
  while(start <= relative_path.size()) {
    auto end = relative_path.find('/', start);
    if(end == std::string::npos) end = relative_path.size();
    auto segment = relative_path.substr(start, end - start);
    if(segment.empty() || segment == "." || segment == "..") return false;
    start = end + 1;
  }
  return true;
}

FolderAggregator::FolderAggregator(std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("folders")) {}

std::vector<FolderGroup> FolderAggregator::groups(const std::vector<IncomingTransfer>& transfers) const {
  std::vector<FolderGroup> out;
  std::unordered_map<std::string, std::size_t> slot;
  for(const auto& transfer : transfers) {
    if(!transfer.meta.relative_path) continue;
    auto name = top_level_segment(*transfer.meta.relative_path);
    if(name.empty()) continue;
    auto it = slot.find(name);
    if(it == slot.end()) {
      slot.emplace(name, out.size());
      out.push_back(FolderGroup{name, {transfer}});
    } else {
      out[it->second].members.push_back(transfer);
    }
  }
  return out;
}

bool FolderAggregator::is_ready(const FolderGroup& group) {
  if(group.members.empty()) return false;
  for(const auto& member : group.members) {
    if(member.status != TransferStatus::Complete || !member.payload) return false;
  }
  return true;
}

bool FolderAggregator::transfers_in_flight(const std::vector<IncomingTransfer>& transfers) {
  return std::any_of(transfers.begin(), transfers.end(), [](const IncomingTransfer& t){
    return t.status == TransferStatus::Pending || t.status == TransferStatus::Receiving;
  });
}

SaveResult FolderAggregator::save(const FolderGroup& group, const SaveTarget& target) const {
  SaveResult result;
  if(!is_ready(group)) {
    result.outcome = SaveOutcome::NotReady;
    result.message = "folder " + group.name + " still has unfinished or failed files";
    return result;
  }
  for(const auto& member : group.members) {
    if(!is_safe_relative_path(*member.meta.relative_path)) {
      result.outcome = SaveOutcome::IoError;
      result.message = "refusing unsafe path '" + *member.meta.relative_path + "'";
      logger_->error("{}", result.message);
      return result;
    }
  }

  if(target.choose_directory) {
    auto root = target.choose_directory(group.name);
    if(!root) {
      result.outcome = SaveOutcome::Cancelled;
      result.message = "save of " + group.name + " cancelled";
      return result;
    }
    return write_tree(group, *root);
  }
  return write_archive(group, target);
}

SaveResult FolderAggregator::save_by_name(const std::string& name,
                                          const std::vector<IncomingTransfer>& transfers,
                                          const SaveTarget& target) const {
  for(const auto& group : groups(transfers)) {
    if(group.name == name) return save(group, target);
  }
  SaveResult result;
  result.outcome = SaveOutcome::NotFound;
  result.message = "no folder named " + name;
  return result;
}

SaveResult FolderAggregator::write_tree(const FolderGroup& group, const std::filesystem::path& root) const {
  SaveResult result;
  for(const auto& member : group.members) {
    auto destination = root / std::filesystem::path(*member.meta.relative_path);
    std::error_code ec;
    std::filesystem::create_directories(destination.parent_path(), ec);
    if(ec) {
      result.outcome = SaveOutcome::IoError;
      result.message = destination.parent_path().string() + ": " + ec.message();
      logger_->error("{}", result.message);
      return result;
    }
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    out.write(member.payload->data(), static_cast<std::streamsize>(member.payload->size()));
    out.close();
    if(!out) {
      result.outcome = SaveOutcome::IoError;
      result.message = "failed to write " + destination.string();
      logger_->error("{}", result.message);
      return result;
    }
    ++result.files;
  }
  result.outcome = SaveOutcome::Saved;
  result.location = root / group.name;
  logger_->info("saved folder {} ({} file(s)) to {}", group.name, result.files, result.location.string());
  return result;
}

SaveResult FolderAggregator::write_archive(const FolderGroup& group, const SaveTarget& target) const {
  SaveResult result;
  if(!target.archive_sink) {
    result.outcome = SaveOutcome::IoError;
    result.message = "no directory chooser or archive sink for " + group.name;
    return result;
  }
  ZipWriter zip;
  std::string error;
  for(const auto& member : group.members) {
    if(!zip.add(*member.meta.relative_path, *member.payload, error)) {
      result.outcome = SaveOutcome::IoError;
      result.message = error;
      logger_->error("zip {}: {}", group.name, error);
      return result;
    }
  }
  std::vector<char> archive;
  if(!zip.finish(archive, error)) {
    result.outcome = SaveOutcome::IoError;
    result.message = error;
    logger_->error("zip {}: {}", group.name, error);
    return result;
  }
  auto file_name = group.name + ".zip";
  if(!target.archive_sink(file_name, archive, result.location, error)) {
    result.outcome = SaveOutcome::IoError;
    result.message = error;
    logger_->error("{}: {}", file_name, error);
    return result;
  }
  result.outcome = SaveOutcome::Archived;
  result.files = zip.entry_count();
  logger_->info("archived folder {} ({} file(s), {} bytes)", group.name, result.files, archive.size());
  return result;
}

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "reception_assembler.hpp"

// Incoming transfers that share the first segment of their relative path.
struct FolderGroup {
  std::string name;
  std::vector<IncomingTransfer> members;
};

enum class SaveOutcome { Saved, Archived, Cancelled, NotReady, NotFound, IoError };
const char* to_string(SaveOutcome outcome);

struct SaveResult {
  SaveOutcome outcome = SaveOutcome::NotReady;
  std::string message;
  std::filesystem::path location; // directory or archive written
  std::size_t files = 0;
};

// Where a folder goes. With choose_directory set the members are written as
// a tree under the returned directory; returning nullopt cancels. Without it
// the folder is zipped and handed to archive_sink.
struct SaveTarget {
  std::function<std::optional<std::filesystem::path>(const std::string& folder)> choose_directory;
  std::function<bool(const std::string& file_name,
                     const std::vector<char>& archive,
                     std::filesystem::path& written,
                     std::string& error)> archive_sink;
};

class FolderAggregator {
public:
  explicit FolderAggregator(std::shared_ptr<Logger> logger = nullptr);

  // First-seen order; transfers without a relative path belong to no group.
  std::vector<FolderGroup> groups(const std::vector<IncomingTransfer>& transfers) const;
  static bool is_ready(const FolderGroup& group);
  // True while any transfer is still pending or receiving. A folder is held
  // back until then, since later members may not have been announced yet.
  static bool transfers_in_flight(const std::vector<IncomingTransfer>& transfers);

  SaveResult save(const FolderGroup& group, const SaveTarget& target) const;
  SaveResult save_by_name(const std::string& name,
                          const std::vector<IncomingTransfer>& transfers,
                          const SaveTarget& target) const;

private:
  SaveResult write_tree(const FolderGroup& group, const std::filesystem::path& root) const;
  SaveResult write_archive(const FolderGroup& group, const SaveTarget& target) const;

  std::shared_ptr<Logger> logger_;
};

// "docs/sub/a.txt" -> "docs". Empty for paths with no usable first segment.
std::string top_level_segment(const std::string& relative_path);
// Relative, no "..", no empty name: safe to join under a target directory.
bool is_safe_relative_path(const std::string& relative_path);

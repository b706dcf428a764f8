#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Readable content for one outgoing file.
class FileSource {
public:
    FileSource(std::string name,
               uint64_t size,
               std::string mime_type,
               std::optional<std::string> relative_path);
    virtual ~FileSource() = default;

    const std::string& name() const { return name_; }
    uint64_t size() const { return size_; }
    const std::string& mime_type() const { return mime_type_; }
    const std::optional<std::string>& relative_path() const { return relative_path_; }

    // Fills `out` with exactly `length` bytes starting at `offset`.
    // Called concurrently for different files, never for the same one.
    virtual bool read(uint64_t offset, std::size_t length,
                      std::vector<char>& out, std::string& error) const = 0;

private:
    std::string name_;
    uint64_t size_ = 0;
    std::string mime_type_;
    std::optional<std::string> relative_path_;
};

class DiskFileSource : public FileSource {
public:
    static std::shared_ptr<DiskFileSource> open(const std::filesystem::path& path,
                                                std::optional<std::string> relative_path,
                                                std::string& error);

    const std::filesystem::path& path() const { return path_; }
    bool read(uint64_t offset, std::size_t length,
              std::vector<char>& out, std::string& error) const override;

private:
    DiskFileSource(std::filesystem::path path, uint64_t size,
                   std::optional<std::string> relative_path);
    std::filesystem::path path_;
};

class MemoryFileSource : public FileSource {
public:
    MemoryFileSource(std::string name,
                     std::vector<char> bytes,
                     std::optional<std::string> relative_path = std::nullopt,
                     std::string mime_type = std::string());

    bool read(uint64_t offset, std::size_t length,
              std::vector<char>& out, std::string& error) const override;

private:
    std::vector<char> bytes_;
};

struct CollectResult {
    std::vector<std::shared_ptr<FileSource>> files;
    std::size_t excluded = 0;        // skipped by the exclusion filter
    std::vector<std::string> errors; // unreadable or missing inputs
};

// A plain file becomes one source without a relative path. A directory is
// walked recursively and each file gets "<dirname>/<path inside>".
CollectResult collect_files(const std::vector<std::string>& paths);

// Build output, VCS metadata, logs and OS clutter.
bool is_excluded_path(const std::string& relative_path);

// By extension, falling back to application/octet-stream.
std::string guess_mime_type(const std::string& name);

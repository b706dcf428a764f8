#pragma once
#include <cstddef>
#include <string>
#include <vector>

struct zip;
struct zip_source;

// Builds a zip archive in memory with libzip. Entries are deflated, empty ones
// are stored. Entry bytes are referenced, not copied, until finish().
class ZipWriter {
public:
    ZipWriter() = default;
    ~ZipWriter();
    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    bool add(const std::string& path, const std::vector<char>& bytes, std::string& error);
    // Writes the archive out. The writer is spent afterwards, whatever the result.
    bool finish(std::vector<char>& out, std::string& error);

    std::size_t entry_count() const { return entries_; }

private:
    bool open(std::string& error);
    void release();

    zip_source* buffer_ = nullptr;
    zip* archive_ = nullptr;
    std::size_t entries_ = 0;
    bool finished_ = false;
};

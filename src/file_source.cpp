#include "file_source.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_map>

namespace {

const char* const kExcludedDirectories[] = {
    "node_modules/", ".git/", ".next/", "dist/", "build/",
    ".cache/", "coverage/", ".nyc_output/", "logs/",
};
const char* const kExcludedSuffixes[] = { ".log" };
const char* const kExcludedNames[] = { ".DS_Store", "Thumbs.db" };

bool ends_with(const std::string& s, const std::string& suffix){
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void collect_directory(const std::filesystem::path& root, CollectResult& result){
    namespace fs = std::filesystem;
    auto top = root.filename().string();
    if(top.empty() || top == "." || top == "..") {
        top = fs::absolute(root).lexically_normal().filename().string();
    }

    std::error_code ec;
    std::vector<fs::path> found;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
    if(ec){
        result.errors.push_back(root.string() + ": " + ec.message());
        return;
    }
    for(; it != end; it.increment(ec)){
        if(ec){
            result.errors.push_back(root.string() + ": " + ec.message());
            break;
        }
        if(it->is_regular_file(ec)) found.push_back(it->path());
    }
    // Stable order so receivers see the same sequence on every run.
    std::sort(found.begin(), found.end());

    for(const auto& file : found){
        auto relative = top + "/" + file.lexically_relative(root).generic_string();
        if(is_excluded_path(relative)){
            ++result.excluded;
            continue;
        }
        std::string error;
        auto source = DiskFileSource::open(file, relative, error);
        if(source) result.files.push_back(std::move(source));
        else result.errors.push_back(error);
    }
}

} // namespace

FileSource::FileSource(std::string name,
                       uint64_t size,
                       std::string mime_type,
                       std::optional<std::string> relative_path)
    : name_(std::move(name)), size_(size), mime_type_(std::move(mime_type)),
      relative_path_(std::move(relative_path))
{
}

DiskFileSource::DiskFileSource(std::filesystem::path path, uint64_t size,
                               std::optional<std::string> relative_path)
    : FileSource(path.filename().string(), size,
                 guess_mime_type(path.filename().string()), std::move(relative_path)),
      path_(std::move(path))
{
}

std::shared_ptr<DiskFileSource> DiskFileSource::open(const std::filesystem::path& path,
                                                     std::optional<std::string> relative_path,
                                                     std::string& error){
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if(ec){
        error = path.string() + ": " + ec.message();
        return nullptr;
    }
    return std::shared_ptr<DiskFileSource>(new DiskFileSource(path, size, std::move(relative_path)));
}

bool DiskFileSource::read(uint64_t offset, std::size_t length,
                          std::vector<char>& out, std::string& error) const{
    std::ifstream in(path_, std::ios::binary);
    if(!in){
        error = "cannot open " + path_.string();
        return false;
    }
    in.seekg(static_cast<std::streamoff>(offset));
    out.resize(length);
    in.read(out.data(), static_cast<std::streamsize>(length));
    if(static_cast<std::size_t>(in.gcount()) != length){
        error = "short read on " + path_.string() + " at offset " + std::to_string(offset);
        return false;
    }
    return true;
}

MemoryFileSource::MemoryFileSource(std::string name,
                                   std::vector<char> bytes,
                                   std::optional<std::string> relative_path,
                                   std::string mime_type)
    : FileSource(name, bytes.size(),
                 mime_type.empty() ? guess_mime_type(name) : std::move(mime_type),
                 std::move(relative_path)),
      bytes_(std::move(bytes))
{
}

bool MemoryFileSource::read(uint64_t offset, std::size_t length,
                            std::vector<char>& out, std::string& error) const{
    if(offset > bytes_.size() || length > bytes_.size() - offset){
        error = "read past end of " + name();
        return false;
    }
    out.assign(bytes_.begin() + static_cast<std::ptrdiff_t>(offset),
               bytes_.begin() + static_cast<std::ptrdiff_t>(offset + length));
    return true;
}

CollectResult collect_files(const std::vector<std::string>& paths){
    CollectResult result;
    for(const auto& raw : paths){
        std::filesystem::path path(raw);
        std::error_code ec;
        auto status = std::filesystem::status(path, ec);
        if(ec || !std::filesystem::exists(status)){
            result.errors.push_back(raw + ": no such file or directory");
            continue;
        }
        if(std::filesystem::is_directory(status)){
            collect_directory(path, result);
            continue;
        }
        if(is_excluded_path(path.filename().string())){
            ++result.excluded;
            continue;
        }
        std::string error;
        auto source = DiskFileSource::open(path, std::nullopt, error);
        if(source) result.files.push_back(std::move(source));
        else result.errors.push_back(error);
    }
    return result;
}

bool is_excluded_path(const std::string& relative_path){
    for(const char* dir : kExcludedDirectories){
        if(relative_path.find(dir) != std::string::npos) return true;
    }
    for(const char* suffix : kExcludedSuffixes){
        if(ends_with(relative_path, suffix)) return true;
    }
    for(const char* name : kExcludedNames){
        if(relative_path.find(name) != std::string::npos) return true;
    }
    return false;
}

std::string guess_mime_type(const std::string& name){
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".html", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".pdf", "application/pdf"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".mp4", "video/mp4"},
        {".zip", "application/zip"},
        {".tar", "application/x-tar"},
        {".gz", "application/gzip"},
    };
    auto dot = name.rfind('.');
    if(dot == std::string::npos) return "application/octet-stream";
    auto extension = name.substr(dot);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    auto it = mime_types.find(extension);
    return it != mime_types.end() ? it->second : "application/octet-stream";
}

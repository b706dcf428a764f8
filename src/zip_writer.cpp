#include "zip_writer.hpp"
#include <zip.h>

namespace {

std::string describe(zip_error_t* ze){
    return zip_error_strerror(ze);
}

} // namespace

ZipWriter::~ZipWriter(){
    release();
}

void ZipWriter::release(){
    if(archive_){
        zip_discard(archive_);
        archive_ = nullptr;
    }
    if(buffer_){
        zip_source_free(buffer_);
        buffer_ = nullptr;
    }
}

bool ZipWriter::open(std::string& error){
    if(archive_) return true;
    zip_error_t ze;
    zip_error_init(&ze);
    zip_source_t* src = zip_source_buffer_create(nullptr, 0, 0, &ze);
    if(!src){
        error = "zip buffer: " + describe(&ze);
        zip_error_fini(&ze);
        return false;
    }
    zip_t* za = zip_open_from_source(src, ZIP_TRUNCATE, &ze);
    if(!za){
        error = "zip open: " + describe(&ze);
        zip_source_free(src);
        zip_error_fini(&ze);
        return false;
    }
    zip_error_fini(&ze);
    // The archive owns one reference; ours keeps the bytes readable after close.
    zip_source_keep(src);
    buffer_ = src;
    archive_ = za;
    return true;
}

bool ZipWriter::add(const std::string& path, const std::vector<char>& bytes, std::string& error){
    if(finished_){
        error = "archive already finished";
        return false;
    }
    if(path.empty()){
        error = "empty entry name";
        return false;
    }
    if(!open(error)) return false;

    zip_source_t* entry = zip_source_buffer(archive_, bytes.empty() ? nullptr : bytes.data(), bytes.size(), 0);
    if(!entry){
        error = path + ": " + zip_strerror(archive_);
        return false;
    }
    zip_int64_t index = zip_file_add(archive_, path.c_str(), entry, ZIP_FL_ENC_UTF_8);
    if(index < 0){
        error = path + ": " + zip_strerror(archive_);
        zip_source_free(entry);
        return false;
    }
    const zip_int32_t method = bytes.empty() ? ZIP_CM_STORE : ZIP_CM_DEFLATE;
    if(zip_set_file_compression(archive_, static_cast<zip_uint64_t>(index), method, 0) < 0){
        error = path + ": " + zip_strerror(archive_);
        return false;
    }
    ++entries_;
    return true;
}

bool ZipWriter::finish(std::vector<char>& out, std::string& error){
    if(finished_){
        error = "archive already finished";
        return false;
    }
    finished_ = true;
    // libzip removes an archive that has no entries instead of writing one.
    if(entries_ == 0){
        error = "archive has no entries";
        release();
        return false;
    }
    if(zip_close(archive_) < 0){
        error = std::string("zip close: ") + zip_strerror(archive_);
        release();
        return false;
    }
    archive_ = nullptr;

    zip_stat_t st;
    zip_stat_init(&st);
    if(zip_source_is_deleted(buffer_) || zip_source_stat(buffer_, &st) < 0 || !(st.valid & ZIP_STAT_SIZE)){
        error = "zip buffer: " + describe(zip_source_error(buffer_));
        release();
        return false;
    }
    if(zip_source_open(buffer_) < 0){
        error = "zip buffer: " + describe(zip_source_error(buffer_));
        release();
        return false;
    }
    std::vector<char> bytes(static_cast<std::size_t>(st.size));
    zip_int64_t read = zip_source_read(buffer_, bytes.data(), st.size);
    zip_source_close(buffer_);
    if(read < 0 || static_cast<zip_uint64_t>(read) != st.size){
        error = "zip buffer: short read";
        release();
        return false;
    }
    release();
    out = std::move(bytes);
    return true;
}

#include "file_split.h"
#include "fs.h"
#include "logger.h"
#include <cstring>
#include <errno.h>

#define LOG_SPLIT_DEBUG(message) LOG_DEBUG("filesplit", message)
#define LOG_SPLIT_WARN(message)  LOG_WARN("filesplit", message)
#define LOG_SPLIT_ERROR(message) LOG_ERROR("filesplit", message)

namespace remotefm {

FileSplit::FileSplit(const std::string& path, FileAccess access, uint32_t chunk_size)
    : path_(path), access_(access),
      chunk_size_(chunk_size > 0 ? chunk_size : DEFAULT_CHUNK_SIZE),
      file_(nullptr), file_size_(0), position_(0), exhausted_(false) {
}

FileSplit::~FileSplit() {
    close();
}

bool FileSplit::open() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_) {
        return true;
    }

    if (path_.empty()) {
        LOG_SPLIT_ERROR("Cannot open file split with empty path");
        return false;
    }

    if (access_ == FileAccess::READ) {
        if (!is_file(path_)) {
            LOG_SPLIT_ERROR("Not a readable file: " << path_);
            return false;
        }

        int64_t size = remotefm::get_file_size(path_);
        if (size < 0) {
            LOG_SPLIT_ERROR("Failed to get size of " << path_);
            return false;
        }

        file_ = fopen(path_.c_str(), "rb");
        file_size_ = static_cast<uint64_t>(size);
    } else {
        file_ = fopen(path_.c_str(), "wb");
        file_size_ = 0;
    }

    if (!file_) {
        LOG_SPLIT_ERROR("Failed to open " << path_ << ": " << strerror(errno));
        return false;
    }

    position_ = 0;
    exhausted_ = false;
    LOG_SPLIT_DEBUG("Opened " << path_ << (access_ == FileAccess::READ ? " for reading (" : " for writing (")
                    << file_size_ << " bytes)");
    return true;
}

ChunkReadResult FileSplit::next_chunk(FileChunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (access_ != FileAccess::READ || !file_) {
        return ChunkReadResult::READ_ERROR;
    }

    if (exhausted_) {
        return ChunkReadResult::END_OF_FILE;
    }

    chunk.offset = position_;
    chunk.data.resize(chunk_size_);

    size_t bytes_read = fread(chunk.data.data(), 1, chunk_size_, file_);
    if (bytes_read == 0) {
        chunk.data.clear();
        if (ferror(file_)) {
            LOG_SPLIT_ERROR("Read failed on " << path_ << " at offset " << position_);
            return ChunkReadResult::READ_ERROR;
        }
        exhausted_ = true;
        // An empty file still travels as one empty chunk at offset 0
        return position_ == 0 ? ChunkReadResult::CHUNK : ChunkReadResult::END_OF_FILE;
    }

    chunk.data.resize(bytes_read);
    position_ += bytes_read;

    if (bytes_read < chunk_size_) {
        // Short read: either end of file or an error mid-chunk
        if (ferror(file_)) {
            LOG_SPLIT_ERROR("Read failed on " << path_ << " at offset " << position_);
            return ChunkReadResult::READ_ERROR;
        }
        exhausted_ = true;
    }

    return ChunkReadResult::CHUNK;
}

bool FileSplit::write_chunk(const FileChunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (access_ != FileAccess::WRITE || !file_) {
        return false;
    }

    if (chunk.offset != position_) {
        LOG_SPLIT_WARN("Chunk offset " << chunk.offset << " does not match write position "
                       << position_ << " for " << path_ << ", appending");
    }

    if (!chunk.data.empty()) {
        size_t written = fwrite(chunk.data.data(), 1, chunk.data.size(), file_);
        if (written != chunk.data.size()) {
            LOG_SPLIT_ERROR("Short write on " << path_ << ": " << strerror(errno));
            return false;
        }
    }

    if (fflush(file_) != 0) {
        LOG_SPLIT_ERROR("Flush failed on " << path_ << ": " << strerror(errno));
        return false;
    }

    position_ += chunk.data.size();
    file_size_ = position_;
    return true;
}

void FileSplit::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_) {
        if (fclose(file_) != 0) {
            LOG_SPLIT_WARN("Error closing " << path_ << ": " << strerror(errno));
        }
        file_ = nullptr;
        LOG_SPLIT_DEBUG("Closed " << path_);
    }
}

bool FileSplit::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_ != nullptr;
}

uint64_t FileSplit::get_file_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_size_;
}

} // namespace remotefm

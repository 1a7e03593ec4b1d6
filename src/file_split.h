#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <cstdio>

namespace remotefm {

/**
 * One slice of file bytes, the unit exchanged with the peer in both directions
 */
struct FileChunk {
    uint64_t offset;                // Offset of the first byte in the file
    std::vector<uint8_t> data;      // Chunk payload

    FileChunk() : offset(0) {}
};

enum class FileAccess {
    READ,       // Split an existing file into chunks
    WRITE       // Assemble a new file from chunks
};

enum class ChunkReadResult {
    CHUNK,          // A chunk was produced
    END_OF_FILE,    // Sequence exhausted
    READ_ERROR      // I/O failure or split already closed
};

/**
 * Lazily splits a file into fixed-size chunks (READ) or appends received
 * chunks to a file in arrival order (WRITE).
 *
 * The read sequence is finite and cannot be restarted. All operations are
 * serialized by an internal mutex, so close() may be called from another
 * thread while a reader is between chunks; later reads then report
 * READ_ERROR.
 */
class FileSplit {
public:
    static constexpr uint32_t DEFAULT_CHUNK_SIZE = 65535;

    FileSplit(const std::string& path, FileAccess access, uint32_t chunk_size = DEFAULT_CHUNK_SIZE);
    ~FileSplit();

    FileSplit(const FileSplit&) = delete;
    FileSplit& operator=(const FileSplit&) = delete;

    /**
     * Open the underlying file. READ requires an existing regular file,
     * WRITE creates or truncates the target.
     * @return true if the file is open
     */
    bool open();

    /**
     * Produce the next chunk of a READ split. An empty file yields a single
     * empty chunk at offset 0.
     * @param chunk Receives offset and data when CHUNK is returned
     */
    ChunkReadResult next_chunk(FileChunk& chunk);

    /**
     * Append a chunk to a WRITE split and flush it to disk
     * @return false on I/O failure, on a closed split or on a READ split
     */
    bool write_chunk(const FileChunk& chunk);

    /**
     * Close the file handle. Safe to call more than once.
     */
    void close();

    bool is_open() const;
    const std::string& get_path() const { return path_; }
    FileAccess get_access() const { return access_; }
    uint32_t get_chunk_size() const { return chunk_size_; }

    // Size of the file at open() time (READ) or bytes written so far (WRITE)
    uint64_t get_file_size() const;

private:
    std::string path_;
    FileAccess access_;
    uint32_t chunk_size_;

    mutable std::mutex mutex_;
    FILE* file_;
    uint64_t file_size_;
    uint64_t position_;
    bool exhausted_;
};

} // namespace remotefm

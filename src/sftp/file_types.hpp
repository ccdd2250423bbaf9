#pragma once

#include <string>
#include <cstdint>
#include <utility>

// Opaque identifier for one open remote file. Only meaningful to the
// channel that issued it; a handle from a replaced channel is rejected.
struct FileHandle {
    std::uint64_t id = 0;

    bool valid() const { return id != 0; }
    bool operator==(const FileHandle& other) const { return id == other.id; }
    bool operator!=(const FileHandle& other) const { return id != other.id; }
};

// Open mode set. Binary is accepted for symmetry and has no wire effect.
enum class OpenMode : unsigned {
    Read     = 1u << 0,
    Write    = 1u << 1,
    Create   = 1u << 2,
    Truncate = 1u << 3,
    Append   = 1u << 4,
    Binary   = 1u << 5,
};

inline OpenMode operator|(OpenMode a, OpenMode b) {
    return static_cast<OpenMode>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

inline bool has_mode(OpenMode set, OpenMode flag) {
    return (static_cast<unsigned>(set) & static_cast<unsigned>(flag)) != 0;
}

// "read|binary"
std::string describe_mode(OpenMode mode);

// Raw attributes as reported by the server. Fields are only meaningful
// when the matching has_* flag is set.
struct RawAttributes {
    bool has_size = false;
    bool has_permissions = false;
    bool has_times = false;
    std::uint64_t size = 0;
    std::uint32_t permissions = 0;  // POSIX mode bits
    std::uint64_t atime = 0;        // epoch seconds
    std::uint64_t mtime = 0;
};

enum class FileAccess { None, Read, Write, ReadWrite };

const char* access_name(FileAccess access);

// Immutable metadata snapshot returned by file-info
struct FileInfo {
    std::uint64_t size = 0;
    FileAccess access = FileAccess::None;
    std::uint64_t last_read = 0;    // atime, epoch seconds
    std::uint64_t last_write = 0;   // mtime, epoch seconds
};

// Project raw attributes to FileInfo. Access comes from the owner bits.
FileInfo to_file_info(const RawAttributes& attrs);

// One read-chunk outcome: data (more may follow) or end-of-stream
enum class ChunkStatus { Data, Eof };

struct Chunk {
    ChunkStatus status = ChunkStatus::Eof;
    std::string data;

    bool eof() const { return status == ChunkStatus::Eof; }

    static Chunk of(std::string bytes) { return Chunk{ChunkStatus::Data, std::move(bytes)}; }
    static Chunk end() { return Chunk{ChunkStatus::Eof, {}}; }
};

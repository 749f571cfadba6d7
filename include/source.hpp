#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <vector>

namespace credscan {

// Bytes handed to the engine, with where they came from.
struct Chunk {
    std::string data;
    std::string source_name;
    std::string file;
    int64_t line = 1;       // line number of the first byte
    bool verify = true;
};

enum class SourceError {
    NotFound,
    ReadFailed
};

struct SourceErrorInfo {
    SourceError error;
    std::string message;
};

using ChunkCallback = std::function<void(Chunk)>;

inline constexpr size_t kChunkSize = 10 * 1024;
inline constexpr size_t kPeekSize = 3 * 1024;

// Splits a stream into kChunkSize pieces, each extended by up to kPeekSize
// bytes of the next piece so that secrets straddling a boundary are seen
// whole. Returns the number of bytes read.
std::expected<size_t, SourceErrorInfo> read_chunks(std::istream& in, const Chunk& tmpl, const ChunkCallback& emit);

struct FilesystemOptions {
    size_t max_file_size = 0;                    // 0 means unlimited
    std::vector<std::string> skip_extensions;    // added to the defaults; lower-case, with dot
    bool verify = true;
};

struct SourceStats {
    size_t files_scanned = 0;
    size_t files_skipped = 0;
    size_t bytes_read = 0;
};

// Walks files and directories and emits their contents as chunks.
class FilesystemSource {
public:
    FilesystemSource(std::vector<std::filesystem::path> paths, FilesystemOptions options = {});

    // Unreadable files are logged and skipped; a missing root path is an error.
    std::expected<SourceStats, SourceErrorInfo> chunks(const ChunkCallback& emit) const;

    bool should_scan(const std::filesystem::path& file_path) const;

    static std::vector<std::string> default_skip_extensions();

private:
    std::expected<void, SourceErrorInfo> scan_file(const std::filesystem::path& file, const ChunkCallback& emit,
                                                   SourceStats& stats) const;

    std::vector<std::filesystem::path> paths_;
    FilesystemOptions options_;
};

} // namespace credscan

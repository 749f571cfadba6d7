#include "source.hpp"
#include "encoding.hpp"
#include "log.hpp"
#include <algorithm>
#include <format>
#include <fstream>

namespace credscan {

namespace fs = std::filesystem;

std::expected<size_t, SourceErrorInfo> read_chunks(std::istream& in, const Chunk& tmpl, const ChunkCallback& emit) {
    auto read_some = [&in](std::string& buf, size_t n) -> size_t {
        size_t old = buf.size();
        buf.resize(old + n);
        in.read(buf.data() + old, static_cast<std::streamsize>(n));
        auto got = static_cast<size_t>(in.gcount());
        buf.resize(old + got);
        return got;
    };
    auto read_error = [&tmpl] {
        return SourceErrorInfo{SourceError::ReadFailed,
                               std::format("read error in {}", tmpl.file.empty() ? tmpl.source_name : tmpl.file)};
    };

    size_t total = 0;
    int64_t line = tmpl.line;
    std::string pending;
    read_some(pending, kChunkSize + kPeekSize);
    if (in.bad()) return std::unexpected(read_error());

    while (!pending.empty()) {
        size_t body = std::min(pending.size(), kChunkSize);
        Chunk chunk = tmpl;
        chunk.data = pending;
        chunk.line = line;
        emit(std::move(chunk));

        total += body;
        line += std::count(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(body), '\n');
        pending.erase(0, body);

        // Whatever is still pending was part of the chunk just emitted.
        size_t got = in ? read_some(pending, kChunkSize + kPeekSize - pending.size()) : 0;
        if (in.bad()) return std::unexpected(read_error());
        if (got == 0) {
            total += pending.size();
            break;
        }
    }
    return total;
}

FilesystemSource::FilesystemSource(std::vector<fs::path> paths, FilesystemOptions options)
    : paths_(std::move(paths)), options_(std::move(options)) {
    auto skip = default_skip_extensions();
    for (auto& ext : options_.skip_extensions) {
        if (std::find(skip.begin(), skip.end(), ext) == skip.end()) skip.push_back(std::move(ext));
    }
    options_.skip_extensions = std::move(skip);
}

std::vector<std::string> FilesystemSource::default_skip_extensions() {
    return {".png", ".jpg", ".jpeg", ".gif", ".bmp", ".webp", ".ico", ".tif", ".tiff",
            ".mp3", ".mp4", ".wav", ".ogg", ".flac", ".avi", ".mov", ".mkv",
            ".zip", ".gz", ".tgz", ".bz2", ".xz", ".7z", ".rar", ".jar",
            ".bin", ".dat", ".db", ".so", ".o", ".a", ".dll", ".exe", ".dylib",
            ".pdf", ".woff", ".woff2", ".ttf", ".otf", ".eot",
            ".safetensors", ".pt", ".pth", ".onnx", ".pyc", ".class"};
}

bool FilesystemSource::should_scan(const fs::path& file_path) const {
    auto ext = to_lower_ascii(file_path.extension().string());
    const auto& skip = options_.skip_extensions;
    return std::find(skip.begin(), skip.end(), ext) == skip.end();
}

std::expected<void, SourceErrorInfo> FilesystemSource::scan_file(const fs::path& file, const ChunkCallback& emit,
                                                                 SourceStats& stats) const {
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    if (ec) {
        return std::unexpected(SourceErrorInfo{SourceError::ReadFailed, std::format("{}: {}", file.string(), ec.message())});
    }
    if (!should_scan(file) || (options_.max_file_size > 0 && size > options_.max_file_size)) {
        log::debug(2, "skipping {}", file.string());
        ++stats.files_skipped;
        return {};
    }
    if (size == 0) {
        ++stats.files_scanned;
        return {};
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(SourceErrorInfo{SourceError::ReadFailed, std::format("cannot open {}", file.string())});
    }

    Chunk tmpl;
    tmpl.source_name = "filesystem";
    tmpl.file = file.string();
    tmpl.verify = options_.verify;
    auto read = read_chunks(in, tmpl, emit);
    if (!read) return std::unexpected(read.error());
    ++stats.files_scanned;
    stats.bytes_read += *read;
    return {};
}

std::expected<SourceStats, SourceErrorInfo> FilesystemSource::chunks(const ChunkCallback& emit) const {
    SourceStats stats;
    for (const auto& root : paths_) {
        std::error_code ec;
        auto status = fs::status(root, ec);
        if (ec || !fs::exists(status)) {
            return std::unexpected(SourceErrorInfo{SourceError::NotFound, std::format("{}: no such file or directory", root.string())});
        }

        if (fs::is_regular_file(status)) {
            if (auto ok = scan_file(root, emit, stats); !ok) log::error("{}", ok.error().message);
            continue;
        }

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return std::unexpected(SourceErrorInfo{SourceError::ReadFailed, std::format("{}: {}", root.string(), ec.message())});
        }
        for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                log::warn("walking {}: {}", root.string(), ec.message());
                ec.clear();
                continue;
            }
            if (it->is_directory(ec) && it->path().filename() == ".git") {
                it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file(ec)) continue;
            if (auto ok = scan_file(it->path(), emit, stats); !ok) log::error("{}", ok.error().message);
        }
    }
    return stats;
}

} // namespace credscan

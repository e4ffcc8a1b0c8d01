#pragma once

#include "gitchunk/size_probe.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gitchunk {

constexpr std::uint64_t kDefaultMaxChunkSize = 25ull * 1024 * 1024;

struct FileEntry {
    std::string path; // relative to the repository root
    std::uint64_t size;
    bool measured;
};

struct Chunk {
    std::vector<FileEntry> files;
    std::uint64_t total_size{0};

    std::size_t size() const noexcept { return files.size(); }
    bool empty() const noexcept { return files.empty(); }
};

struct PackStats {
    std::size_t total_files{0};
    std::size_t processed_files{0};
    std::size_t successful_files{0};
    std::size_t failed_files{0};
    std::size_t large_files{0};
    std::size_t skipped_directories{0};
    std::size_t total_chunks{0};
    std::uint64_t total_size{0};
    std::uint64_t max_chunk_size{kDefaultMaxChunkSize};
    std::vector<std::string> failed_paths;
    std::vector<FileEntry> large_entries;
};

struct PackResult {
    std::vector<Chunk> chunks;
    PackStats stats;
};

/// Groups files into chunks whose summed size stays within a ceiling.
///
/// Packing is greedy first-fit in input order: a file joins the open chunk if
/// it fits, otherwise the open chunk is closed and the file starts the next
/// one. Files larger than the ceiling and files that cannot be measured are
/// recorded in the stats and left out of every chunk. Directory entries are
/// skipped. pack() does not throw for per-file problems.
class ChunkPacker {
  public:
    explicit ChunkPacker(std::uint64_t max_chunk_size = kDefaultMaxChunkSize);

    ChunkPacker(std::uint64_t max_chunk_size, SizeProbe probe);

    PackResult pack(const std::vector<std::string> &paths, const std::filesystem::path &root) const;

    std::uint64_t max_chunk_size() const noexcept;

  private:
    std::uint64_t max_chunk_size_;
    SizeProbe probe_;
};

} // namespace gitchunk

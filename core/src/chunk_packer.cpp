#include "gitchunk/chunk_packer.hpp"

#include <system_error>
#include <utility>

namespace gitchunk {

ChunkPacker::ChunkPacker(std::uint64_t max_chunk_size) : max_chunk_size_(max_chunk_size) {}

ChunkPacker::ChunkPacker(std::uint64_t max_chunk_size, SizeProbe probe)
    : max_chunk_size_(max_chunk_size), probe_(std::move(probe)) {}

PackResult ChunkPacker::pack(const std::vector<std::string> &paths,
                             const std::filesystem::path &root) const {
    PackResult result;
    auto &stats = result.stats;
    stats.total_files = paths.size();
    stats.max_chunk_size = max_chunk_size_;

    Chunk current;
    for (const auto &relative : paths) {
        const auto absolute = root / relative;

        std::error_code ec;
        if (std::filesystem::is_directory(absolute, ec)) {
            ++stats.skipped_directories;
            continue;
        }
        ++stats.processed_files;

        const auto measured = probe_.measure(absolute);
        if (!measured.ok) {
            ++stats.failed_files;
            stats.failed_paths.push_back(relative);
            continue;
        }
        ++stats.successful_files;
        stats.total_size += measured.size;

        FileEntry entry{relative, measured.size, true};
        if (entry.size > max_chunk_size_) {
            ++stats.large_files;
            stats.large_entries.push_back(std::move(entry));
            continue;
        }
        // current.total_size + entry.size > max_chunk_size_, without the overflow.
        if (entry.size > max_chunk_size_ - current.total_size) {
            result.chunks.push_back(std::move(current));
            ++stats.total_chunks;
            current = Chunk{};
        }
        current.total_size += entry.size;
        current.files.push_back(std::move(entry));
    }

    if (!current.empty()) {
        result.chunks.push_back(std::move(current));
        ++stats.total_chunks;
    }
    return result;
}

std::uint64_t ChunkPacker::max_chunk_size() const noexcept { return max_chunk_size_; }

} // namespace gitchunk

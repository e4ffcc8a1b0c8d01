#pragma once

#include "gitchunk/chunk_packer.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gitchunk {

// Bytes as binary megabytes with two decimals, e.g. "25.00".
std::string format_megabytes(std::uint64_t bytes);

class ReportBuilder {
  public:
    static std::string build(const PackResult &result, const std::filesystem::path &root,
                             std::chrono::system_clock::time_point generated_at);

    // Same as above, stamped with the current time.
    static std::string build(const PackResult &result, const std::filesystem::path &root);

    // Why a pack produced no chunks, one line per cause. Empty if no cause applies.
    static std::vector<std::string> empty_result_reasons(const PackStats &stats);
};

} // namespace gitchunk
